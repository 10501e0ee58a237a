#include <drogon/drogon.h>
#include <json/json.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>
#include "RangeConfig.hpp"
#include "RangeController.hpp"
#include "SSEBroadcaster.hpp"

const uint16_t kDefaultPort = 8080;

std::unique_ptr<RangeController> controller;
SSEBroadcaster broadcaster;

bool hasListeners(const std::string& configPath) {
    std::ifstream configFile(configPath);
    if (!configFile) {
        return false;
    }
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &root, &errs)) {
        return false;
    }
    return root["listeners"].isArray() && !root["listeners"].empty();
}

void sendNotification(const std::string& method, const Json::Value& params = Json::Value()) {
    Json::Value notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    if (!params.isNull()) {
        notification["params"] = params;
    }
    broadcaster.broadcast(method, Json::writeString(Json::StreamWriterBuilder(), notification));
}

void handleInitialize(const Json::Value& id, const std::function<void(const Json::Value&)>& sendResponse) {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["capabilities"]["resources"]["subscribe"] = true;
    result["capabilities"]["resources"]["listChanged"] = true;
    result["capabilities"]["streaming"] = true;
    result["serverInfo"]["name"] = "mcp-rangeop-stream";
    result["serverInfo"]["version"] = "1.0.0";
    sendResponse(controller->createResponse(id, result));
}

void handleReadResource(const Json::Value& id, const Json::Value& params,
                        const std::function<void(const Json::Value&)>& sendResponse) {
    Json::Value result = controller->readResourceFromUri(params);
    if (result.isMember("__error__")) {
        sendResponse(controller->createError(id, -32000, result["__error__"].asString()));
        return;
    }
    sendResponse(controller->createResponse(id, result));
}

// Progress of read_multiple goes out on the SSE channel, tagged with the request id
void handleCallTool(const Json::Value& id, const Json::Value& params,
                    const std::function<void(const Json::Value&)>& sendResponse) {
    auto progressCb = [id](const Json::Value& p) {
        Json::Value progress = p;
        progress["request_id"] = id;
        sendNotification("notifications/progress", progress);
    };
    Json::Value result = controller->callTool(params, progressCb);
    if (result.isMember("__error__")) {
        sendResponse(controller->createError(id, -32000, result["__error__"].asString(),
                                             result.get("__error_data__", Json::Value())));
        return;
    }
    sendResponse(controller->createResponse(id, result));
    if (result.get("resourceListChanged", false).asBool()) {
        sendNotification("notifications/resources/list_changed");
    }
}

void handleMcpRequest(const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    auto json = req->getJsonObject();
    if (!json) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(
            controller->createError(Json::Value::null, -32700, "Parse error"));
        resp->setStatusCode(drogon::HttpStatusCode::k400BadRequest);
        callback(resp);
        return;
    }

    std::string method = (*json)["method"].asString();
    Json::Value id = (*json)["id"];
    Json::Value params = (*json)["params"];
    spdlog::debug("[request] {}", method);

    auto sendResponse = [callback](const Json::Value& response) {
        callback(drogon::HttpResponse::newHttpJsonResponse(response));
    };

    if (method == "initialize") {
        handleInitialize(id, sendResponse);
    } else if (method == "tools/list") {
        sendResponse(controller->createResponse(id, controller->listTools()));
    } else if (method == "tools/call") {
        handleCallTool(id, params, sendResponse);
    } else if (method == "resources/list") {
        sendResponse(controller->createResponse(id, controller->listResources()));
    } else if (method == "resources/read") {
        handleReadResource(id, params, sendResponse);
    } else if (method == "notifications/initialized") {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::HttpStatusCode::k204NoContent);
        callback(resp);
    } else {
        sendResponse(controller->createError(id, -32601, "Method not found: " + method));
    }
}

// SSE endpoint; the connection stays subscribed until a send fails
void handleSSE(const drogon::HttpRequestPtr&,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    auto resp = drogon::HttpResponse::newAsyncStreamResponse(
        [](drogon::ResponseStreamPtr stream) {
            std::shared_ptr<drogon::ResponseStream> shared(std::move(stream));
            if (!shared->send("data: {\"type\":\"connected\"}\n\n")) {
                return;
            }
            size_t subscription = broadcaster.subscribe([shared](const std::string& event) {
                return shared->send(event);
            });
            spdlog::info("[sse] client subscribed ({})", subscription);
        },
        true);
    resp->setContentTypeString("text/event-stream");
    resp->addHeader("Cache-Control", "no-cache");
    resp->addHeader("Connection", "keep-alive");
    resp->addHeader("X-Accel-Buffering", "no");
    callback(resp);
}

int main(int argc, char* argv[]) {
    using namespace drogon;

    std::string configPath = argc > 1 ? argv[1] : "config.json";
    try {
        RangeConfig config = loadRangeConfig(configPath);
        spdlog::set_level(spdlog::level::from_str(config.logLevel));
        controller = std::make_unique<RangeController>(std::move(config));
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }

    // drogon reads its own sections (listeners, threads) from the same file
    if (std::filesystem::exists(configPath)) {
        app().loadConfigFile(configPath);
    }
    if (!hasListeners(configPath)) {
        app().addListener("0.0.0.0", kDefaultPort);
        spdlog::info("No listeners configured, using port {}", kDefaultPort);
    }

    app().registerHandler("/mcp",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleMcpRequest(req, std::move(callback));
        },
        {Post});

    app().registerHandler("/mcp/events",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleSSE(req, std::move(callback));
        },
        {Get});

    // CORS support
    app().registerSyncAdvice([](const HttpRequestPtr& req) -> HttpResponsePtr {
        if (req->method() == Options) {
            auto resp = HttpResponse::newHttpResponse();
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
            return resp;
        }
        return nullptr;
    });

    app().registerPostHandlingAdvice([](const HttpRequestPtr&, const HttpResponsePtr& resp) {
        resp->addHeader("Access-Control-Allow-Origin", "*");
    });

    spdlog::info("MCP Stream Server starting");
    spdlog::info("  HTTP endpoint: /mcp");
    spdlog::info("  SSE endpoint: /mcp/events");
    app().run();
    return 0;
}
