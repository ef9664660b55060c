#include "getchunk/io/ByteSource.hpp"
#include "getchunk/core/DebugTrace.hpp"
#include "getchunk/core/Errors.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace getchunk {

namespace {

class FileSource : public ByteSource {
public:
    FileSource(int fd, std::string origin) : fd_(fd), origin_(std::move(origin)) {
        struct stat st;
        if (fstat(fd_, &st) != 0) {
            int err = errno;
            ::close(fd_);
            throw ConfigurationError("Failed to stat " + origin_ + " (" + std::strerror(err) + ")");
        }
        if (!S_ISREG(st.st_mode)) {
            ::close(fd_);
            throw ConfigurationError("Not a regular file: " + origin_);
        }
        total_length_ = static_cast<uint64_t>(st.st_size);
    }

    ~FileSource() override {
        if (fd_ >= 0) ::close(fd_);
    }

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    uint64_t total_length() const override { return total_length_; }

    size_t read(uint8_t* buffer, size_t max_len) override {
        debug_trace::set_last_io("io.read");
        size_t done = 0;
        while (done < max_len) {
            ssize_t n = ::pread(fd_, buffer + done, max_len - done, static_cast<off_t>(offset_ + done));
            if (n < 0) {
                if (errno == EINTR) continue;
                throw IoError(errno, "Failed to read " + origin_);
            }
            if (n == 0) break;
            done += static_cast<size_t>(n);
        }
        offset_ += done;
        return done;
    }

    // Positional reads keep the offset here, never in the shared file description.
    void seek(uint64_t offset) override {
        debug_trace::set_last_io("io.seek");
        if (offset > total_length_) {
            throw IoError(EINVAL, "Seek past end of " + origin_);
        }
        offset_ = offset;
    }

    std::string describe() const override { return origin_; }

private:
    int fd_;
    std::string origin_;
    uint64_t total_length_ = 0;
    uint64_t offset_ = 0;
};

} // namespace

std::unique_ptr<ByteSource> open_file(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw ConfigurationError("Failed to open file: " + path + " (" + std::strerror(errno) + ")");
    }
    return std::make_unique<FileSource>(fd, "file:" + path);
}

std::unique_ptr<ByteSource> from_descriptor(int fd) {
    if (fd < 0) {
        throw ConfigurationError("Invalid file descriptor: " + std::to_string(fd));
    }
    int own = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (own < 0) {
        throw ConfigurationError("Failed to duplicate descriptor " + std::to_string(fd) +
                                 " (" + std::strerror(errno) + ")");
    }
    return std::make_unique<FileSource>(own, "fd:" + std::to_string(fd));
}

} // namespace getchunk
