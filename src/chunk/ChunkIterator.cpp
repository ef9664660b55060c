#include "getchunk/chunk/ChunkIterator.hpp"
#include "getchunk/core/Errors.hpp"

namespace getchunk {

ChunkIterator::ChunkIterator(std::unique_ptr<ChunkCursor> cursor) : cursor_(std::move(cursor)) {
    if (!cursor_) {
        throw ConfigurationError("ChunkIterator requires a cursor");
    }
}

ChunkIterator::ChunkIterator(const std::string& path) : ChunkIterator(ChunkCursor::open(path)) {}

ChunkIterator& ChunkIterator::set_mode(const SizingMode& mode) {
    cursor_->set_mode(mode);
    return *this;
}

ChunkIterator& ChunkIterator::set_start_position(uint64_t offset) {
    cursor_->set_start_position(offset);
    return *this;
}

ChunkIterator& ChunkIterator::set_start_position_percent(double percent) {
    cursor_->set_start_position_percent(percent);
    return *this;
}

ChunkIterator& ChunkIterator::include_available_swap(bool enabled) {
    cursor_->include_available_swap(enabled);
    return *this;
}

std::optional<std::vector<uint8_t>> ChunkIterator::next() {
    if (finished_) return std::nullopt;

    ChunkResult result = cursor_->step();
    switch (result.status) {
        case ChunkResult::Status::Chunk:
            return std::move(result.bytes);
        case ChunkResult::Status::EndOfSource:
            finished_ = true;
            return std::nullopt;
        case ChunkResult::Status::Failure:
            finished_ = true;
            result.rethrow();
            break;
    }
    return std::nullopt;
}

void ChunkIterator::iterator::advance() {
    if (!owner_) return;
    current_ = owner_->next();
    if (!current_) owner_ = nullptr;
}

} // namespace getchunk
