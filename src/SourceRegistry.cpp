#include "SourceRegistry.hpp"
#include <filesystem>
#include <stdexcept>
#include <mutex>
#include <spdlog/spdlog.h>

void SourceRegistry::setAllowedPaths(const std::vector<std::string>& paths) {
    std::unique_lock lock(mutex);
    allowedPaths.clear();
    for (const auto& path : paths) {
        try {
            allowedPaths.push_back(std::filesystem::canonical(path).string());
        } catch (const std::filesystem::filesystem_error& e) {
            spdlog::warn("[registry] skipping allowed path {}: {}", path, e.what());
        }
    }
}

bool SourceRegistry::isPathAllowed(const std::string& path) const {
    if (allowedPaths.empty()) {
        return true;
    }

    std::string canonical;
    try {
        canonical = std::filesystem::canonical(path).string();
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }

    for (const auto& allowed : allowedPaths) {
        if (canonical == allowed ||
            canonical.compare(0, allowed.length() + 1, allowed + "/") == 0) {
            return true;
        }
    }
    return false;
}

std::shared_ptr<MappedFileSource> SourceRegistry::open(const std::string& path) {
    std::unique_lock lock(mutex);

    if (!isPathAllowed(path)) {
        spdlog::warn("[open] denied: {}", path);
        throw std::runtime_error("Access denied: path not in allowed list");
    }

    auto canonical = std::filesystem::canonical(path).string();
    auto it = handlerMap.find(canonical);
    if (it != handlerMap.end()) {
        it->second->incRef();
        spdlog::info("[open] {} already open, refcount {}", canonical, it->second->refCount());
        return it->second;
    }
    auto source = std::make_shared<MappedFileSource>(canonical);
    handlerMap[canonical] = source;
    spdlog::info("[open] {} ({} bytes)", canonical, source->length());
    return source;
}

std::shared_ptr<MappedFileSource> SourceRegistry::getByHandler(const std::string& handler) {
    std::shared_lock lock(mutex);
    auto it = handlerMap.find(handler);
    if (it != handlerMap.end()) {
        return it->second;
    }
    return nullptr;
}

bool SourceRegistry::close(const std::string& handler) {
    std::unique_lock lock(mutex);
    auto it = handlerMap.find(handler);
    if (it == handlerMap.end()) {
        spdlog::info("[close] unknown handler: {}", handler);
        return false;
    }
    auto source = it->second;
    source->decRef();
    if (source->refCount() > 0) {
        spdlog::info("[close] {} still referenced, refcount {}", handler, source->refCount());
        return false;
    }
    handlerMap.erase(it);
    {
        // wait for an in-flight access before unmapping
        std::lock_guard access(source->accessMutex());
        source->close();
    }
    spdlog::info("[close] {} closed", handler);
    return true;
}

std::vector<std::string> SourceRegistry::listHandlers() const {
    std::shared_lock lock(mutex);
    std::vector<std::string> handlers;
    handlers.reserve(handlerMap.size());
    for (const auto& [handler, source] : handlerMap) {
        if (source->isReadable()) {
            handlers.push_back(handler);
        }
    }
    return handlers;
}
