#pragma once
#include <cstdint>
#include <vector>
#include "RangeByteSource.hpp"

// In-memory source; fills every read as far as its data allows.
class MemorySource : public RangeByteSource {
public:
    explicit MemorySource(std::vector<uint8_t> data);

    size_t read(uint8_t* buffer, size_t destOffset, size_t maxCount) override;
    uint64_t position() const override { return offset_; }
    void setPosition(uint64_t pos) override { offset_ = pos; }
    bool isReadable() const override { return open_; }
    uint64_t length() const override { return data_.size(); }
    void close() override { open_ = false; }

    // Number of read() calls issued so far.
    size_t readCalls() const { return readCalls_; }

private:
    std::vector<uint8_t> data_;
    uint64_t offset_;
    bool open_;
    size_t readCalls_;
};
