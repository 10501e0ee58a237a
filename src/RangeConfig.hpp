#pragma once
#include <json/json.h>
#include <cstddef>
#include <string>
#include <vector>
#include "RangeReadStrategy.hpp"

// Settings from the "rangeop" section of config.json.
struct RangeConfig {
    std::vector<std::string> allowedPaths;
    ReadMode readMode = ReadMode::Accumulate;
    FillPolicy fillPolicy = FillPolicy::Strict;
    size_t maxTransfer = 0;  // bytes per source read, 0 = unlimited
    std::string logLevel = "info";
};

// Missing keys keep their defaults; invalid values throw std::invalid_argument.
RangeConfig parseRangeConfig(const Json::Value& root);

// A missing file yields the defaults; a malformed one throws std::runtime_error.
RangeConfig loadRangeConfig(const std::string& path);
