#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

class SourceUnavailable : public std::runtime_error {
public:
    explicit SourceUnavailable(const std::string& what)
        : std::runtime_error(what) {}
};

// Thrown in strict mode when the source ran dry before the range was filled.
class IncompleteRange : public std::runtime_error {
public:
    IncompleteRange(uint64_t obtained, uint64_t expected)
        : std::runtime_error("Incomplete range: obtained " + std::to_string(obtained) +
                             " of " + std::to_string(expected) + " bytes"),
          obtained_(obtained),
          expected_(expected) {}

    uint64_t obtained() const { return obtained_; }
    uint64_t expected() const { return expected_; }

private:
    uint64_t obtained_;
    uint64_t expected_;
};
