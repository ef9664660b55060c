#pragma once

#include "getchunk/chunk/SizingMode.hpp"
#include "getchunk/core/MemoryProbe.hpp"
#include "getchunk/io/ByteSource.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace getchunk {

enum class CursorState {
    Active,
    Ended,  // position reached total_length
    Failed  // a read raised IoError
};

/**
 * @brief Outcome of one ChunkCursor step.
 */
struct ChunkResult {
    enum class Status {
        Chunk,
        EndOfSource,
        Failure
    };

    Status status = Status::EndOfSource;
    std::vector<uint8_t> bytes;
    std::exception_ptr error; // set for Failure (holds an IoError)

    static ChunkResult chunk(std::vector<uint8_t> data) {
        ChunkResult r;
        r.status = Status::Chunk;
        r.bytes = std::move(data);
        return r;
    }

    static ChunkResult end_of_source() {
        return ChunkResult();
    }

    static ChunkResult failure(std::exception_ptr e) {
        ChunkResult r;
        r.status = Status::Failure;
        r.error = std::move(e);
        return r;
    }

    bool is_chunk() const { return status == Status::Chunk; }
    bool is_end() const { return status == Status::EndOfSource; }
    bool is_failure() const { return status == Status::Failure; }

    // Throws the stored error; no-op unless is_failure().
    void rethrow() const {
        if (error) std::rethrow_exception(error);
    }
};

/**
 * @brief Reads a byte source in successive, non-overlapping chunks.
 * 
 * Each step samples the memory budget, asks SizingEngine for a size,
 * reads that many bytes, times the read and records the observation for
 * the next decision. The cursor owns its source exclusively and is not
 * safe to step from two threads at once.
 * 
 * Configuration is only accepted before the first step.
 */
class ChunkCursor {
public:
    /**
     * @param source Source to read; ownership is transferred.
     * @param probe Memory probe; defaults to the system probe.
     */
    explicit ChunkCursor(
        std::unique_ptr<ByteSource> source,
        std::shared_ptr<const core::MemoryProbe> probe = nullptr
    );

    // Convenience: cursor over a file path
    static std::unique_ptr<ChunkCursor> open(const std::string& path);

    ChunkCursor(const ChunkCursor&) = delete;
    ChunkCursor& operator=(const ChunkCursor&) = delete;

    void set_mode(const SizingMode& mode);

    /**
     * @brief Starts reading at an absolute byte offset.
     * @throws std::out_of_range if offset > total_length().
     */
    void set_start_position(uint64_t offset);

    /**
     * @brief Starts reading at a percentage of the total length (clamped to [0, 100]).
     * @throws ConfigurationError if percent is NaN.
     */
    void set_start_position_percent(double percent);

    /**
     * @brief Counts free swap as available memory when sizing chunks.
     */
    void include_available_swap(bool enabled = true);

    /**
     * @brief Reads the next chunk.
     * 
     * Returns EndOfSource once the whole source was consumed and Failure when
     * the read failed; both are terminal.
     * @throws std::logic_error when called on a terminal cursor.
     */
    ChunkResult step();

    uint64_t position() const { return position_; }
    uint64_t total_length() const { return total_length_; }
    uint64_t remaining() const { return total_length_ - position_; }
    const SizingMode& mode() const { return mode_; }
    const Observation& last_observation() const { return last_; }
    double previous_duration() const { return previous_duration_; }
    bool includes_swap() const { return include_swap_; }
    CursorState state() const { return state_; }
    bool started() const { return started_; }
    bool is_read_complete() const { return state_ == CursorState::Ended; }
    std::string describe() const { return source_->describe(); }

private:
    void ensure_configurable(const char* operation) const;
    uint64_t plan_chunk(const core::MemoryBudget& budget) const;
    ChunkResult fail(std::exception_ptr error, const std::string& reason);

    std::unique_ptr<ByteSource> source_;
    std::shared_ptr<const core::MemoryProbe> probe_;

    uint64_t position_ = 0;
    uint64_t total_length_ = 0;
    SizingMode mode_;
    Observation last_;
    double previous_duration_ = 0.0;
    bool include_swap_ = false;
    bool started_ = false;
    CursorState state_ = CursorState::Active;
};

} // namespace getchunk
