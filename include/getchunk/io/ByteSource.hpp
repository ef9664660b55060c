#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace getchunk {

/**
 * @brief Seekable, readable byte source with a length fixed at construction.
 * 
 * Every input representation (path, descriptor, stream, buffer, text)
 * funnels into this one capability; ChunkCursor never sees anything else.
 * Read and seek failures are reported as IoError.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Total length in bytes, captured when the source was opened.
     */
    virtual uint64_t total_length() const = 0;

    /**
     * @brief Reads until max_len bytes were copied or the source ended.
     * 
     * @return Number of bytes actually copied into buffer.
     */
    virtual size_t read(uint8_t* buffer, size_t max_len) = 0;

    /**
     * @brief Moves the read position to an absolute offset.
     */
    virtual void seek(uint64_t offset) = 0;

    /**
     * @brief Short human-readable origin ("file:/tmp/x", "memory", ...) for diagnostics.
     */
    virtual std::string describe() const = 0;
};

// --- Source constructors ---
// Each throws ConfigurationError when the input cannot back a source.

// Opens a regular file by path.
std::unique_ptr<ByteSource> open_file(const std::string& path);

// Wraps an open descriptor. The descriptor is duplicated; the caller keeps
// ownership of the original and its file offset. Reading starts at offset 0.
std::unique_ptr<ByteSource> from_descriptor(int fd);

// Wraps a buffered stream (std::ifstream, std::istringstream, ...).
// The stream must support seeking; reading starts at offset 0.
std::unique_ptr<ByteSource> from_stream(std::unique_ptr<std::istream> stream);

// In-memory buffers. Text is treated as raw bytes.
std::unique_ptr<ByteSource> from_bytes(std::vector<uint8_t> bytes);
std::unique_ptr<ByteSource> from_string(std::string text);

} // namespace getchunk
