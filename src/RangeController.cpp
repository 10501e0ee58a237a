#include "RangeController.hpp"
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>
#include "RangeErrors.hpp"

namespace {

const char* const kFileUriPrefix = "file:///";

std::string toHex(const std::vector<uint8_t>& bytes) {
    std::stringstream ss;
    for (uint8_t b : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (unsigned int)b;
    }
    return ss.str();
}

bool isFormat(const std::string& format) {
    return format == "text" || format == "binary" || format == "hex";
}

void addFormatEnum(Json::Value& property) {
    property["type"] = "string";
    property["enum"].append("binary");
    property["enum"].append("hex");
    property["enum"].append("text");
}

}  // namespace

RangeController::RangeController(RangeConfig config)
    : config_(std::move(config)), nextRangeId_(1) {
    registry_.setAllowedPaths(config_.allowedPaths);
}

Json::Value RangeController::createResponse(const Json::Value& id, const Json::Value& result) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value RangeController::createError(const Json::Value& id, int code, const std::string& message,
                                         const Json::Value& data) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    if (!data.isNull()) {
        response["error"]["data"] = data;
    }
    return response;
}

Json::Value RangeController::listTools() const {
    Json::Value tools(Json::arrayValue);

    Json::Value rangeTool;
    rangeTool["name"] = "rangeop";
    rangeTool["description"] = "Lazy byte-range access to memory-mapped files: open, describe, fetch, release, read, read_multiple and close";
    rangeTool["inputSchema"]["type"] = "object";
    Json::Value& props = rangeTool["inputSchema"]["properties"];

    props["operation"]["type"] = "string";
    props["operation"]["description"] = "Operation to perform";
    for (const char* op : {"open", "describe", "fetch", "release", "read", "read_multiple", "close"}) {
        props["operation"]["enum"].append(op);
    }

    props["path"]["type"] = "string";
    props["path"]["description"] = "File path to open (required for 'open')";

    props["handler"]["type"] = "string";
    props["handler"]["description"] = "Handler returned by 'open' (required for 'describe', 'read', 'close')";

    props["offset"]["type"] = "number";
    props["offset"]["description"] = "Byte offset where the range starts (required for 'describe' and 'read')";

    props["size"]["type"] = "number";
    props["size"]["description"] = "Number of bytes in the range (required for 'describe' and 'read')";

    props["range_id"]["type"] = "string";
    props["range_id"]["description"] = "Range returned by 'describe' (required for 'fetch' and 'release')";

    addFormatEnum(props["format"]);
    props["format"]["description"] = "Output format (optional for 'fetch', 'read' and 'read_multiple', default: 'text')";
    props["format"]["default"] = "text";

    props["segments"]["type"] = "array";
    props["segments"]["description"] = "Segments to read. Each segment contains 'handler', optional 'format', and 'ranges' of offsets and sizes.";
    Json::Value& item = props["segments"]["items"];
    item["type"] = "object";
    item["properties"]["handler"]["type"] = "string";
    addFormatEnum(item["properties"]["format"]);
    item["properties"]["ranges"]["type"] = "array";
    item["properties"]["ranges"]["items"]["type"] = "object";
    item["properties"]["ranges"]["items"]["properties"]["offset"]["type"] = "number";
    item["properties"]["ranges"]["items"]["properties"]["size"]["type"] = "number";

    rangeTool["inputSchema"]["required"].append("operation");

    tools.append(rangeTool);
    Json::Value result;
    result["tools"] = tools;
    return result;
}

Json::Value RangeController::listResources() {
    Json::Value resources(Json::arrayValue);
    for (const auto& handler : registry_.listHandlers()) {
        auto source = registry_.getByHandler(handler);
        if (source) {
            Json::Value resource;
            resource["uri"] = kFileUriPrefix + handler;
            resource["name"] = std::filesystem::path(handler).filename().string();
            resource["description"] = "Memory-mapped file (" + std::to_string(source->length()) + " bytes)";
            resource["mimeType"] = "application/octet-stream";
            resources.append(resource);
        }
    }
    Json::Value result;
    result["resources"] = resources;
    return result;
}

Json::Value RangeController::readResourceFromUri(const Json::Value& params) {
    Json::Value result;
    std::string uri = params["uri"].asString();
    if (uri.rfind(kFileUriPrefix, 0) != 0) {
        result["__error__"] = "Unsupported resource URI: " + uri;
        return result;
    }
    std::string handler = uri.substr(std::string(kFileUriPrefix).size());
    try {
        auto source = registry_.getByHandler(handler);
        if (!source) {
            result["__error__"] = "Resource not found";
            return result;
        }
        auto range = makeRange(handler, 0, source->length());
        std::vector<uint8_t> bytes = materialize(range);
        result["contents"][0]["uri"] = uri;
        result["contents"][0]["mimeType"] = "application/octet-stream";
        result["contents"][0]["text"] = std::string(bytes.begin(), bytes.end());
    } catch (const std::exception& e) {
        result["__error__"] = std::string("Error: ") + e.what();
    }
    return result;
}

Json::Value RangeController::callTool(const Json::Value& params, std::function<void(const Json::Value&)> progress) {
    Json::Value result;
    std::string toolName = params["name"].asString();
    Json::Value arguments = params["arguments"];
    // Accept operation names as top-level tool names
    if (toolName == "open" || toolName == "describe" || toolName == "fetch" || toolName == "release" ||
        toolName == "read" || toolName == "read_multiple" || toolName == "close") {
        if (!arguments.isObject()) {
            arguments = Json::Value(Json::objectValue);
        }
        arguments["operation"] = toolName;
        toolName = "rangeop";
    }
    if (toolName != "rangeop") {
        result["__error__"] = std::string("Unknown tool: ") + toolName;
        return result;
    }

    std::string operation = arguments["operation"].asString();
    try {
        // A single-range read is a read_multiple with one segment
        if (operation == "read") {
            Json::Value seg;
            seg["handler"] = arguments["handler"];
            seg["format"] = arguments.get("format", "text");
            seg["ranges"][0]["offset"] = arguments["offset"];
            seg["ranges"][0]["size"] = arguments["size"];
            Json::Value normalized;
            normalized["segments"].append(seg);
            return readMultiple(normalized, progress);
        }
        if (operation == "open") return openSource(arguments);
        if (operation == "describe") return describeRange(arguments);
        if (operation == "fetch") return fetchRange(arguments);
        if (operation == "release") return releaseRange(arguments);
        if (operation == "read_multiple") return readMultiple(arguments, progress);
        if (operation == "close") return closeSource(arguments);
        result["__error__"] = std::string("Unknown operation: ") + operation;
    } catch (const IncompleteRange& e) {
        spdlog::warn("[{}] {}", operation, e.what());
        result["__error__"] = e.what();
        result["__error_data__"]["obtained"] = (Json::Value::UInt64)e.obtained();
        result["__error_data__"]["expected"] = (Json::Value::UInt64)e.expected();
    } catch (const std::exception& e) {
        spdlog::warn("[{}] {}", operation, e.what());
        result["__error__"] = std::string("Error: ") + e.what();
    }
    return result;
}

void RangeController::setAllowedPaths(const std::vector<std::string>& paths) {
    config_.allowedPaths = paths;
    registry_.setAllowedPaths(paths);
}

RangeController::DescribedRange RangeController::makeRange(const std::string& handler, uint64_t offset, uint64_t size) {
    DescribedRange range;
    range.handler = handler;
    range.source = registry_.getByHandler(handler);
    if (!range.source) {
        throw std::runtime_error("Invalid handler: " + handler);
    }
    RangeByteSource* reader = range.source.get();
    if (config_.maxTransfer > 0) {
        range.chunked = std::make_unique<ChunkedSource>(*range.source, config_.maxTransfer);
        reader = range.chunked.get();
    }
    range.buffer = std::make_unique<LazyRangeBuffer>(reader, offset, size, config_.readMode, config_.fillPolicy);
    return range;
}

std::vector<uint8_t> RangeController::materialize(const DescribedRange& range) const {
    std::lock_guard access(range.source->accessMutex());
    return range.buffer->data();
}

Json::Value RangeController::contentItem(const std::vector<uint8_t>& bytes, uint64_t requested,
                                         const std::string& format) const {
    Json::Value item;
    if (format == "hex") {
        item["type"] = "text";
        item["format"] = "hex";
        item["text"] = toHex(bytes);
    } else if (format == "binary") {
        item["type"] = "bytes";
        item["format"] = "binary";
        item["text"] = std::string(bytes.begin(), bytes.end());
    } else {
        item["type"] = "text";
        item["text"] = std::string(bytes.begin(), bytes.end());
    }
    // Only reachable with fill_policy "short"
    if (bytes.size() != requested) {
        item["truncated"] = true;
        item["bytes"] = (Json::Value::UInt64)bytes.size();
    }
    return item;
}

Json::Value RangeController::openSource(const Json::Value& arguments) {
    Json::Value result;
    std::string path = arguments["path"].asString();
    auto source = registry_.open(path);
    std::string handler = source->path();
    result["handler"] = handler;
    result["size"] = (Json::Value::UInt64)source->length();
    result["content"][0]["type"] = "text";
    result["content"][0]["text"] = "File opened successfully.\n\nHandler: " + handler + "\nSize: " +
                                   std::to_string(source->length()) + " bytes" + "\nResource URI: " +
                                   kFileUriPrefix + handler;
    result["resourceListChanged"] = true;
    return result;
}

Json::Value RangeController::describeRange(const Json::Value& arguments) {
    Json::Value result;
    std::string handler = arguments["handler"].asString();
    uint64_t offset = arguments["offset"].asUInt64();
    uint64_t size = arguments["size"].asUInt64();
    auto range = std::make_shared<DescribedRange>(makeRange(handler, offset, size));

    std::string rangeId;
    {
        std::lock_guard lock(rangesMutex_);
        rangeId = "range-" + std::to_string(nextRangeId_++);
        ranges_[rangeId] = range;
    }
    spdlog::debug("[describe] {} -> {} [{}, +{})", handler, rangeId, offset, size);
    result["range_id"] = rangeId;
    result["handler"] = handler;
    result["offset"] = (Json::Value::UInt64)offset;
    result["size"] = (Json::Value::UInt64)size;
    result["content"][0]["type"] = "text";
    result["content"][0]["text"] = "Range described: " + rangeId;
    return result;
}

Json::Value RangeController::fetchRange(const Json::Value& arguments) {
    Json::Value result;
    std::string rangeId = arguments["range_id"].asString();
    std::string format = arguments.get("format", "text").asString();
    if (!isFormat(format)) {
        result["__error__"] = "Invalid format: " + format;
        return result;
    }
    std::shared_ptr<DescribedRange> range;
    {
        std::lock_guard lock(rangesMutex_);
        auto it = ranges_.find(rangeId);
        if (it != ranges_.end()) {
            range = it->second;
        }
    }
    if (!range) {
        result["__error__"] = "Unknown range: " + rangeId;
        return result;
    }
    std::vector<uint8_t> bytes = materialize(*range);
    result["content"].append(contentItem(bytes, range->buffer->size(), format));
    return result;
}

Json::Value RangeController::releaseRange(const Json::Value& arguments) {
    Json::Value result;
    std::string rangeId = arguments["range_id"].asString();
    size_t erased = 0;
    {
        std::lock_guard lock(rangesMutex_);
        erased = ranges_.erase(rangeId);
    }
    if (erased == 0) {
        result["__error__"] = "Unknown range: " + rangeId;
        return result;
    }
    result["content"][0]["type"] = "text";
    result["content"][0]["text"] = "Range released: " + rangeId;
    return result;
}

Json::Value RangeController::readMultiple(const Json::Value& arguments,
                                          const std::function<void(const Json::Value&)>& progress) {
    Json::Value result;
    if (!arguments.isMember("segments") || !arguments["segments"].isArray()) {
        result["__error__"] = "segments must be an array";
        return result;
    }

    // Describe every range first so bad input fails before any I/O
    struct PendingRead {
        DescribedRange range;
        std::string format;
    };
    std::vector<PendingRead> pending;
    uint64_t totalBytes = 0;
    for (const auto& s : arguments["segments"]) {
        std::string handler = s["handler"].asString();
        std::string format = s.get("format", "text").asString();
        if (!isFormat(format)) {
            result["__error__"] = "Invalid format: " + format;
            return result;
        }
        for (const auto& r : s["ranges"]) {
            uint64_t size = r["size"].asUInt64();
            pending.push_back({makeRange(handler, r["offset"].asUInt64(), size), format});
            totalBytes += size;
        }
    }

    Json::Value contentArray(Json::arrayValue);
    uint64_t bytesSoFar = 0;
    for (const auto& read : pending) {
        std::vector<uint8_t> bytes = materialize(read.range);
        contentArray.append(contentItem(bytes, read.range.buffer->size(), read.format));

        bytesSoFar += bytes.size();
        // A short result will never deliver the rest of its range
        totalBytes -= read.range.buffer->size() - bytes.size();
        if (progress) {
            Json::Value p;
            p["bytes_read"] = (Json::Value::UInt64)bytesSoFar;
            p["total_bytes"] = (Json::Value::UInt64)totalBytes;
            p["progress"] = totalBytes > 0 ? (double)bytesSoFar / (double)totalBytes : 1.0;
            progress(p);
        }
    }

    result["content"] = contentArray;
    return result;
}

Json::Value RangeController::closeSource(const Json::Value& arguments) {
    Json::Value result;
    std::string handler = arguments["handler"].asString();
    bool closed = registry_.close(handler);
    if (closed) {
        // Ranges over the unmapped source can never be fetched again
        std::lock_guard lock(rangesMutex_);
        size_t dropped = 0;
        for (auto it = ranges_.begin(); it != ranges_.end();) {
            if (it->second->handler == handler) {
                it = ranges_.erase(it);
                ++dropped;
            } else {
                ++it;
            }
        }
        spdlog::debug("[close] {} dropped {} described ranges", handler, dropped);
    }
    result["closed"] = closed;
    result["content"][0]["type"] = "text";
    result["content"][0]["text"] = std::string("Handler closed successfully: ") + handler;
    result["resourceListChanged"] = closed;
    return result;
}
