#pragma once
#include <cstdint>
#include <memory>
#include <vector>
#include "RangeByteSource.hpp"
#include "RangeReadStrategy.hpp"

// Describes [position, position + size) of a source without reading it.
// The source is not owned and must stay open while data is requested.
// Nothing is cached: each access repositions the source and reads again.
class LazyRangeBuffer {
public:
    LazyRangeBuffer(RangeByteSource* source, uint64_t position, uint64_t size,
                    ReadMode mode = ReadMode::Accumulate,
                    FillPolicy policy = FillPolicy::Strict);

    uint64_t size() const { return size_; }
    uint64_t position() const { return position_; }
    ReadMode mode() const { return strategy_->mode(); }
    FillPolicy policy() const { return policy_; }

    // Throws SourceUnavailable if the source is closed, IncompleteRange in
    // strict mode if the source ends early.
    std::vector<uint8_t> data() const;

    // Sub-range [offset, offset + count) relative to position().
    std::vector<uint8_t> byteRange(uint64_t offset, size_t count) const;

private:
    std::vector<uint8_t> readAt(uint64_t absolute, size_t count) const;

    RangeByteSource* source_;
    uint64_t position_;
    uint64_t size_;
    std::shared_ptr<const RangeReadStrategy> strategy_;
    FillPolicy policy_;
};
