#include "LazyRangeBuffer.hpp"
#include <limits>
#include <stdexcept>
#include "RangeErrors.hpp"

LazyRangeBuffer::LazyRangeBuffer(RangeByteSource* source, uint64_t position, uint64_t size,
                                 ReadMode mode, FillPolicy policy)
    : source_(source),
      position_(position),
      size_(size),
      strategy_(makeReadStrategy(mode)),
      policy_(policy) {
    if (!source_) {
        throw std::invalid_argument("LazyRangeBuffer requires a source");
    }
}

std::vector<uint8_t> LazyRangeBuffer::data() const {
    if (size_ > std::numeric_limits<size_t>::max()) {
        throw std::length_error("Range too large to materialize: " + std::to_string(size_) + " bytes");
    }
    return readAt(position_, static_cast<size_t>(size_));
}

std::vector<uint8_t> LazyRangeBuffer::byteRange(uint64_t offset, size_t count) const {
    if (offset > size_ || count > size_ - offset) {
        throw std::out_of_range("Byte range [" + std::to_string(offset) + ", +" + std::to_string(count) +
                                ") exceeds buffer of " + std::to_string(size_) + " bytes");
    }
    return readAt(position_ + offset, count);
}

std::vector<uint8_t> LazyRangeBuffer::readAt(uint64_t absolute, size_t count) const {
    if (!source_->isReadable()) {
        throw SourceUnavailable("cannot read from source - maybe closed");
    }
    if (count == 0) {
        return {};
    }
    source_->setPosition(absolute);
    return strategy_->retrieve(*source_, count, policy_);
}
