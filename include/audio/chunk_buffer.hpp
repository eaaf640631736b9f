#ifndef CHUNK_BUFFER_HPP
#define CHUNK_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// Re-slices an arbitrary byte stream into fixed-size chunks.
class ChunkBuffer {
public:
    explicit ChunkBuffer(size_t chunkSize);

    void feed(const uint8_t* data, size_t bytes);

    // Next complete chunk, or nullptr. The pointer stays valid until the next feed() or clear().
    const uint8_t* next();

    size_t chunkSize() const { return chunkSize_; }
    size_t pending() const { return buffer_.size() - readPos_; }

    void clear();

private:
    size_t chunkSize_;
    std::vector<uint8_t> buffer_;
    size_t readPos_ = 0;
};

#endif
