#include <iostream>
#include <memory>
#include <utility>
#include <string>
#include <sstream>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "RangeConfig.hpp"
#include "RangeController.hpp"

// stdout carries the protocol, one compact JSON message per line
void writeMessage(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    std::cout << Json::writeString(writer, message) << std::endl;
}

void handleInitialize(RangeController& controller, const Json::Value& id) {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["capabilities"]["resources"]["subscribe"] = false;
    result["capabilities"]["resources"]["listChanged"] = true;
    result["serverInfo"]["name"] = "mcp-rangeop";
    result["serverInfo"]["version"] = "1.0.0";
    writeMessage(controller.createResponse(id, result));
}

void sendResourceListChanged() {
    Json::Value notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = "notifications/resources/list_changed";
    writeMessage(notification);
}

void handleReadResource(RangeController& controller, const Json::Value& id, const Json::Value& params) {
    Json::Value result = controller.readResourceFromUri(params);
    if (result.isMember("__error__")) {
        writeMessage(controller.createError(id, -32000, result["__error__"].asString()));
        return;
    }
    writeMessage(controller.createResponse(id, result));
}

void handleCallTool(RangeController& controller, const Json::Value& id, const Json::Value& params) {
    // stdio doesn't emit progress updates
    Json::Value result = controller.callTool(params);
    if (result.isMember("__error__")) {
        writeMessage(controller.createError(id, -32000, result["__error__"].asString(),
                                            result.get("__error_data__", Json::Value())));
        return;
    }
    writeMessage(controller.createResponse(id, result));
    if (result.get("resourceListChanged", false).asBool()) {
        sendResourceListChanged();
    }
}

void processRequest(RangeController& controller, const std::string& line) {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;

    std::istringstream iss(line);
    if (!Json::parseFromStream(builder, iss, &request, &errs)) {
        spdlog::warn("JSON parse error: {}", errs);
        writeMessage(controller.createError(Json::Value::null, -32700, "Parse error"));
        return;
    }

    std::string method = request["method"].asString();
    Json::Value id = request["id"];
    Json::Value params = request["params"];
    spdlog::debug("[request] {}", method);

    if (method == "initialize") {
        handleInitialize(controller, id);
    } else if (method == "tools/list") {
        writeMessage(controller.createResponse(id, controller.listTools()));
    } else if (method == "tools/call") {
        handleCallTool(controller, id, params);
    } else if (method == "resources/list") {
        writeMessage(controller.createResponse(id, controller.listResources()));
    } else if (method == "resources/read") {
        handleReadResource(controller, id, params);
    } else if (method == "notifications/initialized") {
        // No response needed for notifications
    } else {
        writeMessage(controller.createError(id, -32601, "Method not found: " + method));
    }
}

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("rangeop"));

    std::string configPath = argc > 1 ? argv[1] : "config.json";
    std::unique_ptr<RangeController> controller;
    try {
        RangeConfig config = loadRangeConfig(configPath);
        spdlog::set_level(spdlog::level::from_str(config.logLevel));
        controller = std::make_unique<RangeController>(std::move(config));
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }

    spdlog::info("MCP stdio server started");
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty()) {
            processRequest(*controller, line);
        }
    }
    return 0;
}
