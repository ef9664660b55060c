#pragma once

#include "getchunk/chunk/ChunkCursor.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <string>

namespace getchunk {

/**
 * @brief Asynchronous pull over a ChunkCursor.
 * 
 * next() hands the step to a ThreadPool worker and returns immediately;
 * the future resolves to the same ChunkResult a synchronous step would
 * produce. At most one step is in flight per stream.
 * 
 * Destroying the stream while a read is pending abandons that read: the
 * worker keeps the cursor alive until the read returns and then releases
 * the source.
 */
class ChunkStream {
public:
    explicit ChunkStream(std::unique_ptr<ChunkCursor> cursor);
    explicit ChunkStream(const std::string& path);

    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;
    ChunkStream(ChunkStream&&) = default;
    ChunkStream& operator=(ChunkStream&&) = default;

    ChunkStream& set_mode(const SizingMode& mode);
    ChunkStream& set_start_position(uint64_t offset);
    ChunkStream& set_start_position_percent(double percent);
    ChunkStream& include_available_swap(bool enabled = true);

    /**
     * @brief Starts the next step.
     * 
     * The future holds std::logic_error if the cursor was already terminal.
     * @throws std::logic_error if the previous step has not completed yet.
     */
    std::future<ChunkResult> next();

    bool in_flight() const;
    bool is_read_complete() const;
    uint64_t total_length() const;

private:
    struct Shared {
        std::unique_ptr<ChunkCursor> cursor;
        std::atomic<bool> in_flight{false};
    };

    ChunkCursor& idle_cursor(const char* operation);

    std::shared_ptr<Shared> shared_;
};

} // namespace getchunk
