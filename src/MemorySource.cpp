#include "MemorySource.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

MemorySource::MemorySource(std::vector<uint8_t> data)
    : data_(std::move(data)), offset_(0), open_(true), readCalls_(0) {}

size_t MemorySource::read(uint8_t* buffer, size_t destOffset, size_t maxCount) {
    ++readCalls_;
    if (!open_) {
        throw std::runtime_error("Read from closed memory source");
    }
    if (offset_ >= data_.size() || maxCount == 0) {
        return 0;
    }
    size_t toCopy = static_cast<size_t>(std::min<uint64_t>(maxCount, data_.size() - offset_));
    std::memcpy(buffer + destOffset, data_.data() + offset_, toCopy);
    offset_ += toCopy;
    return toCopy;
}
