#include "getchunk/chunk/ChunkCursor.hpp"
#include "getchunk/chunk/SizingEngine.hpp"
#include "getchunk/core/Config.hpp"
#include "getchunk/core/Errors.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <iostream>
#include <new>
#include <stdexcept>

namespace getchunk {

ChunkCursor::ChunkCursor(
    std::unique_ptr<ByteSource> source,
    std::shared_ptr<const core::MemoryProbe> probe
)
    : source_(std::move(source)),
      probe_(std::move(probe)),
      include_swap_(get_include_swap_default()) {
    if (!source_) {
        throw ConfigurationError("ChunkCursor requires a byte source");
    }
    if (!probe_) {
        probe_ = core::SystemMemoryProbe::instance();
    }
    total_length_ = source_->total_length();
}

std::unique_ptr<ChunkCursor> ChunkCursor::open(const std::string& path) {
    return std::make_unique<ChunkCursor>(open_file(path));
}

void ChunkCursor::ensure_configurable(const char* operation) const {
    if (started_) {
        throw std::logic_error(std::string(operation) + " is only allowed before iteration starts");
    }
}

void ChunkCursor::set_mode(const SizingMode& mode) {
    ensure_configurable("set_mode");
    mode_ = mode;
}

void ChunkCursor::set_start_position(uint64_t offset) {
    ensure_configurable("set_start_position");
    if (offset > total_length_) {
        throw std::out_of_range("Start position " + std::to_string(offset) +
                                " is beyond source length " + std::to_string(total_length_));
    }
    source_->seek(offset);
    position_ = offset;
}

void ChunkCursor::set_start_position_percent(double percent) {
    if (std::isnan(percent)) {
        throw ConfigurationError("Start position percent must be a number");
    }
    double clamped = std::clamp(percent, 0.0, 100.0);
    auto offset = static_cast<uint64_t>(std::floor(static_cast<double>(total_length_) * clamped / 100.0));
    set_start_position(std::min(offset, total_length_));
}

void ChunkCursor::include_available_swap(bool enabled) {
    ensure_configurable("include_available_swap");
    include_swap_ = enabled;
}

uint64_t ChunkCursor::plan_chunk(const core::MemoryBudget& budget) const {
    const uint64_t left = remaining();
    double size = SizingEngine::next_size(
        mode_, last_, previous_duration_,
        static_cast<double>(total_length_), static_cast<double>(left), budget);

    // Whole bytes, never less than one while data remains. Auto adjustments
    // round up so a small chunk can still grow and a shrink stays within 45%.
    double whole = std::floor(size);
    if (mode_.kind == SizingKind::Auto && !last_.empty()) {
        double up = std::ceil(size);
        if (up <= budget.ceiling()) whole = up;
    }
    auto bytes = static_cast<uint64_t>(whole);
    return std::clamp<uint64_t>(bytes, 1, left);
}

ChunkResult ChunkCursor::fail(std::exception_ptr error, const std::string& reason) {
    state_ = CursorState::Failed;
    if (is_verbose()) {
        std::cerr << "[GetChunk] Read failed on " << source_->describe()
                  << " at offset " << position_ << ": " << reason << std::endl;
    }
    return ChunkResult::failure(std::move(error));
}

ChunkResult ChunkCursor::step() {
    if (state_ == CursorState::Ended) {
        throw std::logic_error("ChunkCursor stepped after end of source");
    }
    if (state_ == CursorState::Failed) {
        throw std::logic_error("ChunkCursor stepped after a failed read");
    }
    started_ = true;

    if (position_ >= total_length_) {
        state_ = CursorState::Ended;
        return ChunkResult::end_of_source();
    }

    const core::MemoryBudget budget = probe_->budget(include_swap_);
    const uint64_t size = plan_chunk(budget);

    if (is_verbose() && static_cast<double>(size) >= budget.ceiling()) {
        std::cerr << "[GetChunk] Chunk size limited by memory budget: " << size
                  << " bytes (available " << static_cast<uint64_t>(budget.available) << ")" << std::endl;
    }

    std::vector<uint8_t> buffer;
    size_t actual = 0;
    auto start = std::chrono::steady_clock::now();
    try {
        buffer.resize(static_cast<size_t>(size));
        actual = source_->read(buffer.data(), buffer.size());
    } catch (const IoError& e) {
        return fail(std::current_exception(), e.what());
    } catch (const std::bad_alloc&) {
        // Memory vanished between the budget sample and the allocation.
        return fail(std::make_exception_ptr(IoError(ENOMEM, "Out of memory allocating a chunk of " +
                                                               std::to_string(size) + " bytes")),
                    "out of memory");
    }
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    if (actual == 0) {
        // The source is shorter than when it was opened.
        return fail(std::make_exception_ptr(IoError(EIO, "Unexpected end of " + source_->describe() +
                                                             " at offset " + std::to_string(position_))),
                    "unexpected end of source");
    }

    buffer.resize(actual);
    position_ += actual;
    previous_duration_ = last_.prior_duration;
    last_.prior_size = static_cast<double>(actual);
    last_.prior_duration = elapsed.count();

    return ChunkResult::chunk(std::move(buffer));
}

} // namespace getchunk
