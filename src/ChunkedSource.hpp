#pragma once
#include <cstddef>
#include <cstdint>
#include "RangeByteSource.hpp"

// Wraps a source behind an internal buffer of chunkSize bytes. A read never
// crosses the end of the buffered chunk, so callers see short reads; once the
// chunk is drained the next read refills it from the inner source.
class ChunkedSource : public RangeByteSource {
public:
    ChunkedSource(RangeByteSource& inner, size_t chunkSize);

    size_t read(uint8_t* buffer, size_t destOffset, size_t maxCount) override;
    uint64_t position() const override;
    void setPosition(uint64_t pos) override;
    bool isReadable() const override;
    uint64_t length() const override;
    void close() override;

private:
    RangeByteSource& inner_;
    size_t chunkSize_;
    size_t chunkPosition_;
};
