#include "RangeConfig.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

RangeConfig parseRangeConfig(const Json::Value& root) {
    RangeConfig config;
    if (!root.isObject() || !root.isMember("rangeop")) {
        spdlog::info("[config] no 'rangeop' section, using defaults");
        return config;
    }
    const Json::Value& section = root["rangeop"];
    if (!section.isObject()) {
        throw std::invalid_argument("rangeop: expected an object");
    }

    if (section.isMember("allowed_paths")) {
        if (!section["allowed_paths"].isArray()) {
            throw std::invalid_argument("rangeop.allowed_paths: expected an array");
        }
        for (const auto& path : section["allowed_paths"]) {
            if (!path.isString()) {
                throw std::invalid_argument("rangeop.allowed_paths: expected strings");
            }
            config.allowedPaths.push_back(path.asString());
        }
    }
    if (section.isMember("read_mode")) {
        config.readMode = parseReadMode(section["read_mode"].asString());
    }
    if (section.isMember("fill_policy")) {
        config.fillPolicy = parseFillPolicy(section["fill_policy"].asString());
    }
    if (section.isMember("max_transfer")) {
        const Json::Value& maxTransfer = section["max_transfer"];
        if (!maxTransfer.isUInt64()) {
            throw std::invalid_argument("rangeop.max_transfer: expected a non-negative integer");
        }
        config.maxTransfer = static_cast<size_t>(maxTransfer.asUInt64());
    }
    if (section.isMember("log_level")) {
        config.logLevel = section["log_level"].asString();
        if (spdlog::level::from_str(config.logLevel) == spdlog::level::off && config.logLevel != "off") {
            throw std::invalid_argument("rangeop.log_level: unknown level " + config.logLevel);
        }
    }
    return config;
}

RangeConfig loadRangeConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::info("[config] {} not found, using defaults", path);
        return RangeConfig();
    }
    std::ifstream configFile(path);
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &root, &errs)) {
        throw std::runtime_error("Failed to parse " + path + ": " + errs);
    }
    RangeConfig config = parseRangeConfig(root);
    spdlog::info("[config] {}: read_mode={} fill_policy={} max_transfer={} allowed_paths={}",
                 path, toString(config.readMode), toString(config.fillPolicy),
                 config.maxTransfer, config.allowedPaths.size());
    return config;
}
