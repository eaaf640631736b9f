#include "audio/chunk_buffer.hpp"

#include <stdexcept>

// Constructor
ChunkBuffer::ChunkBuffer(size_t chunkSize) : chunkSize_(chunkSize) {
    if (chunkSize_ == 0) throw std::invalid_argument("ChunkBuffer: chunk size must be positive");
    buffer_.reserve(chunkSize_ * 2);
}

void ChunkBuffer::feed(const uint8_t* data, size_t bytes) {
    // Drop what was already handed out before growing the buffer
    if (readPos_ > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + (std::ptrdiff_t)readPos_);
        readPos_ = 0;
    }
    buffer_.insert(buffer_.end(), data, data + bytes);
}

const uint8_t* ChunkBuffer::next() {
    if (pending() < chunkSize_) return nullptr;

    const uint8_t* chunk = buffer_.data() + readPos_;
    readPos_ += chunkSize_;
    return chunk;
}

void ChunkBuffer::clear() {
    buffer_.clear();
    readPos_ = 0;
}
