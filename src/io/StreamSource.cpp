#include "getchunk/io/ByteSource.hpp"
#include "getchunk/core/DebugTrace.hpp"
#include "getchunk/core/Errors.hpp"

#include <cerrno>

namespace getchunk {

namespace {

class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::unique_ptr<std::istream> stream) : stream_(std::move(stream)) {
        stream_->seekg(0, std::ios::end);
        std::streampos end = stream_->tellg();
        if (!*stream_ || end < 0) {
            throw ConfigurationError("Stream does not support seeking");
        }
        total_length_ = static_cast<uint64_t>(end);
        stream_->seekg(0, std::ios::beg);
    }

    uint64_t total_length() const override { return total_length_; }

    size_t read(uint8_t* buffer, size_t max_len) override {
        debug_trace::set_last_io("io.read");
        stream_->read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_len));
        size_t n = static_cast<size_t>(stream_->gcount());
        if (stream_->bad()) {
            throw IoError(EIO, "Failed to read stream");
        }
        // A short read sets eof/fail; clear them so seek and later reads still work.
        if (stream_->fail()) stream_->clear();
        return n;
    }

    void seek(uint64_t offset) override {
        debug_trace::set_last_io("io.seek");
        stream_->clear();
        stream_->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!*stream_) {
            throw IoError(EIO, "Failed to seek stream to " + std::to_string(offset));
        }
    }

    std::string describe() const override { return "stream"; }

private:
    std::unique_ptr<std::istream> stream_;
    uint64_t total_length_ = 0;
};

} // namespace

std::unique_ptr<ByteSource> from_stream(std::unique_ptr<std::istream> stream) {
    if (!stream) {
        throw ConfigurationError("Stream source is null");
    }
    if (!*stream) {
        throw ConfigurationError("Stream is not readable");
    }
    return std::make_unique<StreamSource>(std::move(stream));
}

} // namespace getchunk
