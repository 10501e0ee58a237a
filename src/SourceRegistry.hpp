#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <shared_mutex>
#include "MappedFileSource.hpp"

// Open file sources keyed by handler (the canonical path).
class SourceRegistry {
public:
    std::shared_ptr<MappedFileSource> open(const std::string& path);
    std::shared_ptr<MappedFileSource> getByHandler(const std::string& handler);
    // Returns true when the last reference went away and the source was closed.
    bool close(const std::string& handler);
    std::vector<std::string> listHandlers() const;
    void setAllowedPaths(const std::vector<std::string>& paths);
    bool isPathAllowed(const std::string& path) const;

private:
    std::unordered_map<std::string, std::shared_ptr<MappedFileSource>> handlerMap;
    std::vector<std::string> allowedPaths;
    mutable std::shared_mutex mutex;
};
