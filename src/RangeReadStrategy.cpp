#include "RangeReadStrategy.hpp"
#include <algorithm>
#include <stdexcept>
#include "RangeErrors.hpp"

namespace {

const size_t kGrowStep = 64 * 1024;

// The source's length caps the first allocation, so a huge request over a
// small source does not allocate the whole request up front.
size_t initialCapacity(const RangeByteSource& source, size_t size) {
    uint64_t length = source.length();
    uint64_t position = source.position();
    uint64_t remaining = length > position ? length - position : 0;
    return remaining < size ? static_cast<size_t>(remaining) : size;
}

}  // namespace

ReadMode parseReadMode(const std::string& name) {
    if (name == "accumulate") return ReadMode::Accumulate;
    if (name == "single") return ReadMode::Single;
    throw std::invalid_argument("Unknown read mode: " + name);
}

FillPolicy parseFillPolicy(const std::string& name) {
    if (name == "strict") return FillPolicy::Strict;
    if (name == "short") return FillPolicy::ShortResult;
    throw std::invalid_argument("Unknown fill policy: " + name);
}

std::string toString(ReadMode mode) {
    return mode == ReadMode::Single ? "single" : "accumulate";
}

std::string toString(FillPolicy policy) {
    return policy == FillPolicy::Strict ? "strict" : "short";
}

std::vector<uint8_t> RangeReadStrategy::retrieve(RangeByteSource& source, size_t size, FillPolicy policy) const {
    std::vector<uint8_t> data;
    if (size == 0) {
        return data;
    }
    data.resize(initialCapacity(source, size));
    size_t total = fill(source, data, size);
    if (total < size && policy == FillPolicy::Strict) {
        throw IncompleteRange(total, size);
    }
    // Only bytes the source delivered are returned, never a zero-filled tail.
    data.resize(total);
    return data;
}

void RangeReadStrategy::grow(std::vector<uint8_t>& data, size_t size) {
    size_t current = data.size();
    size_t step = std::max(current, kGrowStep);
    data.resize(size - current > step ? current + step : size);
}

size_t SingleReadStrategy::fill(RangeByteSource& source, std::vector<uint8_t>& data, size_t size) const {
    if (data.empty()) {
        grow(data, size);
    }
    return source.read(data.data(), 0, data.size());
}

size_t AccumulatingStrategy::fill(RangeByteSource& source, std::vector<uint8_t>& data, size_t size) const {
    size_t total = 0;
    size_t read = 0;
    do {
        if (total == data.size()) {
            grow(data, size);
        }
        read = source.read(data.data(), total, data.size() - total);
        total += read;
    } while (read > 0 && total < size);
    return total;
}

std::shared_ptr<const RangeReadStrategy> makeReadStrategy(ReadMode mode) {
    static const auto single = std::make_shared<const SingleReadStrategy>();
    static const auto accumulate = std::make_shared<const AccumulatingStrategy>();
    return mode == ReadMode::Single
        ? std::static_pointer_cast<const RangeReadStrategy>(single)
        : std::static_pointer_cast<const RangeReadStrategy>(accumulate);
}
