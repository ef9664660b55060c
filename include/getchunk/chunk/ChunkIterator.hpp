#pragma once

#include "getchunk/chunk/ChunkCursor.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace getchunk {

/**
 * @brief Blocking, single-threaded pull over a ChunkCursor.
 * 
 * next() returns the next chunk, std::nullopt once the source is consumed,
 * and throws IoError if the read failed. A failure also ends iteration.
 * 
 *     ChunkIterator chunks("data.bin");
 *     chunks.set_mode(SizingMode::fixed_bytes(1 << 20));
 *     for (const auto& chunk : chunks) { ... }
 */
class ChunkIterator {
public:
    explicit ChunkIterator(std::unique_ptr<ChunkCursor> cursor);
    explicit ChunkIterator(const std::string& path);

    ChunkIterator& set_mode(const SizingMode& mode);
    ChunkIterator& set_start_position(uint64_t offset);
    ChunkIterator& set_start_position_percent(double percent);
    ChunkIterator& include_available_swap(bool enabled = true);

    std::optional<std::vector<uint8_t>> next();

    bool is_read_complete() const { return cursor_->is_read_complete(); }
    bool finished() const { return finished_; }
    uint64_t total_length() const { return cursor_->total_length(); }
    const ChunkCursor& cursor() const { return *cursor_; }

    // Input iterator for range-for. Advancing may throw IoError.
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::vector<uint8_t>;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        iterator() : owner_(nullptr) {}
        explicit iterator(ChunkIterator* owner) : owner_(owner) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return owner_ == other.owner_; }
        bool operator!=(const iterator& other) const { return owner_ != other.owner_; }

    private:
        void advance();

        ChunkIterator* owner_;
        std::optional<value_type> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::unique_ptr<ChunkCursor> cursor_;
    bool finished_ = false;
};

} // namespace getchunk
