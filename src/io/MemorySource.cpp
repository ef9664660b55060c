#include "getchunk/io/ByteSource.hpp"
#include "getchunk/core/DebugTrace.hpp"
#include "getchunk/core/Errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace getchunk {

namespace {

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    uint64_t total_length() const override { return bytes_.size(); }

    size_t read(uint8_t* buffer, size_t max_len) override {
        debug_trace::set_last_io("io.read");
        size_t n = std::min(max_len, bytes_.size() - offset_);
        if (n > 0) {
            std::memcpy(buffer, bytes_.data() + offset_, n);
            offset_ += n;
        }
        return n;
    }

    void seek(uint64_t offset) override {
        debug_trace::set_last_io("io.seek");
        if (offset > bytes_.size()) {
            throw IoError(EINVAL, "Seek past end of memory buffer");
        }
        offset_ = static_cast<size_t>(offset);
    }

    std::string describe() const override { return "memory"; }

private:
    std::vector<uint8_t> bytes_;
    size_t offset_ = 0;
};

} // namespace

std::unique_ptr<ByteSource> from_bytes(std::vector<uint8_t> bytes) {
    return std::make_unique<MemorySource>(std::move(bytes));
}

std::unique_ptr<ByteSource> from_string(std::string text) {
    return std::make_unique<MemorySource>(std::vector<uint8_t>(text.begin(), text.end()));
}

} // namespace getchunk
