#include "ChunkedSource.hpp"
#include <algorithm>
#include <stdexcept>

ChunkedSource::ChunkedSource(RangeByteSource& inner, size_t chunkSize)
    : inner_(inner), chunkSize_(chunkSize), chunkPosition_(0) {
    if (chunkSize_ == 0) {
        throw std::invalid_argument("ChunkedSource chunk size must be positive");
    }
}

size_t ChunkedSource::read(uint8_t* buffer, size_t destOffset, size_t maxCount) {
    if (chunkPosition_ == chunkSize_) {
        chunkPosition_ = 0;  // drained, refill
    }
    size_t toRead = std::min(chunkSize_ - chunkPosition_, maxCount);
    size_t got = inner_.read(buffer, destOffset, toRead);
    chunkPosition_ += got;
    return got;
}

uint64_t ChunkedSource::position() const {
    return inner_.position();
}

void ChunkedSource::setPosition(uint64_t pos) {
    inner_.setPosition(pos);
    chunkPosition_ = 0;
}

bool ChunkedSource::isReadable() const {
    return inner_.isReadable();
}

uint64_t ChunkedSource::length() const {
    return inner_.length();
}

void ChunkedSource::close() {
    inner_.close();
}
