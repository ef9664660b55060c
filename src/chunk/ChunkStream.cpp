#include "getchunk/chunk/ChunkStream.hpp"
#include "getchunk/core/Errors.hpp"
#include "getchunk/core/ParallelUtils.hpp"

#include <stdexcept>

namespace getchunk {

namespace {

// Clears the in-flight flag when the step leaves the worker, also on throw.
struct InFlightGuard {
    std::atomic<bool>& flag;
    ~InFlightGuard() { flag.store(false); }
};

} // namespace

ChunkStream::ChunkStream(std::unique_ptr<ChunkCursor> cursor) : shared_(std::make_shared<Shared>()) {
    if (!cursor) {
        throw ConfigurationError("ChunkStream requires a cursor");
    }
    shared_->cursor = std::move(cursor);
}

ChunkStream::ChunkStream(const std::string& path) : ChunkStream(ChunkCursor::open(path)) {}

ChunkCursor& ChunkStream::idle_cursor(const char* operation) {
    if (shared_->in_flight.load()) {
        throw std::logic_error(std::string(operation) + " while a read is in flight");
    }
    return *shared_->cursor;
}

ChunkStream& ChunkStream::set_mode(const SizingMode& mode) {
    idle_cursor("set_mode").set_mode(mode);
    return *this;
}

ChunkStream& ChunkStream::set_start_position(uint64_t offset) {
    idle_cursor("set_start_position").set_start_position(offset);
    return *this;
}

ChunkStream& ChunkStream::set_start_position_percent(double percent) {
    idle_cursor("set_start_position_percent").set_start_position_percent(percent);
    return *this;
}

ChunkStream& ChunkStream::include_available_swap(bool enabled) {
    idle_cursor("include_available_swap").include_available_swap(enabled);
    return *this;
}

std::future<ChunkResult> ChunkStream::next() {
    if (shared_->in_flight.exchange(true)) {
        throw std::logic_error("ChunkStream::next called while a read is in flight");
    }

    std::shared_ptr<Shared> shared = shared_;
    try {
        return ThreadPool::instance().enqueue([shared]() {
            InFlightGuard guard{shared->in_flight};
            return shared->cursor->step();
        });
    } catch (...) {
        shared_->in_flight.store(false);
        throw;
    }
}

bool ChunkStream::in_flight() const {
    return shared_->in_flight.load();
}

bool ChunkStream::is_read_complete() const {
    return !in_flight() && shared_->cursor->is_read_complete();
}

uint64_t ChunkStream::total_length() const {
    return shared_->cursor->total_length();
}

} // namespace getchunk
