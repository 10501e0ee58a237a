#pragma once
#include <json/json.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "ChunkedSource.hpp"
#include "LazyRangeBuffer.hpp"
#include "RangeConfig.hpp"
#include "SourceRegistry.hpp"

class RangeController {
public:
    explicit RangeController(RangeConfig config = RangeConfig());

    Json::Value createResponse(const Json::Value& id, const Json::Value& result) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message,
                            const Json::Value& data = Json::Value()) const;

    // Resources and tools
    Json::Value listTools() const;
    Json::Value listResources();
    Json::Value readResourceFromUri(const Json::Value& params);

    // Call tool by name. Optional progress callback invoked after every range of read_multiple.
    // Returns a Json::Value suitable as the 'result' field for a JSON-RPC response;
    // failures are reported through the '__error__' member.
    Json::Value callTool(const Json::Value& params, std::function<void(const Json::Value&)> progress = nullptr);

    void setAllowedPaths(const std::vector<std::string>& paths);

private:
    // A lazy range plus what keeps its source alive. When max_transfer is set
    // the buffer reads through a ChunkedSource owned here.
    struct DescribedRange {
        std::string handler;
        std::shared_ptr<MappedFileSource> source;
        std::unique_ptr<ChunkedSource> chunked;
        std::unique_ptr<LazyRangeBuffer> buffer;
    };

    DescribedRange makeRange(const std::string& handler, uint64_t offset, uint64_t size);
    std::vector<uint8_t> materialize(const DescribedRange& range) const;
    Json::Value contentItem(const std::vector<uint8_t>& bytes, uint64_t requested, const std::string& format) const;

    Json::Value openSource(const Json::Value& arguments);
    Json::Value describeRange(const Json::Value& arguments);
    Json::Value fetchRange(const Json::Value& arguments);
    Json::Value releaseRange(const Json::Value& arguments);
    Json::Value readMultiple(const Json::Value& arguments, const std::function<void(const Json::Value&)>& progress);
    Json::Value closeSource(const Json::Value& arguments);

    SourceRegistry registry_;
    RangeConfig config_;
    std::mutex rangesMutex_;
    std::unordered_map<std::string, std::shared_ptr<DescribedRange>> ranges_;
    uint64_t nextRangeId_;
};
