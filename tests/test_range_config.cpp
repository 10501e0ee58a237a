#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <json/json.h>
#include "../src/RangeConfig.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream iss(text);
    if (!Json::parseFromStream(builder, iss, &root, &errs)) {
        throw std::runtime_error("bad test JSON: " + errs);
    }
    return root;
}

static bool rejects(const std::string& text) {
    try {
        parseRangeConfig(parse(text));
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

int main() {
    try {
        // Defaults
        RangeConfig defaults = parseRangeConfig(parse("{\"listeners\": []}"));
        ASSERT_TRUE(defaults.readMode == ReadMode::Accumulate);
        ASSERT_TRUE(defaults.fillPolicy == FillPolicy::Strict);
        ASSERT_TRUE(defaults.maxTransfer == 0);
        ASSERT_TRUE(defaults.allowedPaths.empty());
        ASSERT_TRUE(defaults.logLevel == "info");

        RangeConfig full = parseRangeConfig(parse(
            "{\"rangeop\": {\"allowed_paths\": [\"/data\", \"/scratch\"], \"read_mode\": \"single\","
            " \"fill_policy\": \"short\", \"max_transfer\": 4096, \"log_level\": \"debug\"}}"));
        ASSERT_TRUE(full.allowedPaths.size() == 2);
        ASSERT_TRUE(full.allowedPaths[1] == "/scratch");
        ASSERT_TRUE(full.readMode == ReadMode::Single);
        ASSERT_TRUE(full.fillPolicy == FillPolicy::ShortResult);
        ASSERT_TRUE(full.maxTransfer == 4096);
        ASSERT_TRUE(full.logLevel == "debug");

        ASSERT_TRUE(rejects("{\"rangeop\": []}"));
        ASSERT_TRUE(rejects("{\"rangeop\": {\"allowed_paths\": \"/data\"}}"));
        ASSERT_TRUE(rejects("{\"rangeop\": {\"allowed_paths\": [1]}}"));
        ASSERT_TRUE(rejects("{\"rangeop\": {\"read_mode\": \"greedy\"}}"));
        ASSERT_TRUE(rejects("{\"rangeop\": {\"fill_policy\": \"zero\"}}"));
        ASSERT_TRUE(rejects("{\"rangeop\": {\"max_transfer\": -1}}"));
        ASSERT_TRUE(rejects("{\"rangeop\": {\"log_level\": \"chatty\"}}"));

        // Files
        auto tmpDir = std::filesystem::temp_directory_path();
        auto missing = tmpDir / "rangeop_config_missing.json";
        std::filesystem::remove(missing);
        ASSERT_TRUE(loadRangeConfig(missing.string()).maxTransfer == 0);

        auto configFile = tmpDir / "rangeop_config_test.json";
        {
            std::ofstream ofs(configFile);
            ofs << "{\"rangeop\": {\"max_transfer\": 512}}";
        }
        ASSERT_TRUE(loadRangeConfig(configFile.string()).maxTransfer == 512);

        {
            std::ofstream ofs(configFile);
            ofs << "{\"rangeop\": ";
        }
        bool threw = false;
        try {
            loadRangeConfig(configFile.string());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
        std::filesystem::remove(configFile);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All config tests passed" << std::endl;
    return 0;
}
