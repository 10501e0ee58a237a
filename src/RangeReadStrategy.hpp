#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "RangeByteSource.hpp"

enum class ReadMode {
    Single,
    Accumulate,
};

// What happens when the source is exhausted before the range is filled.
enum class FillPolicy {
    Strict,       // throw IncompleteRange
    ShortResult,  // return only the bytes actually obtained
};

ReadMode parseReadMode(const std::string& name);
FillPolicy parseFillPolicy(const std::string& name);
std::string toString(ReadMode mode);
std::string toString(FillPolicy policy);

// Retrieves `size` bytes starting at the source's current position.
class RangeReadStrategy {
public:
    virtual ~RangeReadStrategy() = default;

    std::vector<uint8_t> retrieve(RangeByteSource& source, size_t size, FillPolicy policy) const;
    virtual ReadMode mode() const = 0;

protected:
    // Reads up to size bytes into data, growing it as needed, returns bytes filled.
    virtual size_t fill(RangeByteSource& source, std::vector<uint8_t>& data, size_t size) const = 0;

    // Makes room for more bytes once data is full, never beyond size.
    static void grow(std::vector<uint8_t>& data, size_t size);
};

class SingleReadStrategy : public RangeReadStrategy {
public:
    ReadMode mode() const override { return ReadMode::Single; }

protected:
    size_t fill(RangeByteSource& source, std::vector<uint8_t>& data, size_t size) const override;
};

class AccumulatingStrategy : public RangeReadStrategy {
public:
    ReadMode mode() const override { return ReadMode::Accumulate; }

protected:
    size_t fill(RangeByteSource& source, std::vector<uint8_t>& data, size_t size) const override;
};

std::shared_ptr<const RangeReadStrategy> makeReadStrategy(ReadMode mode);
