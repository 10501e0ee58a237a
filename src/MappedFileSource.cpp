#include "MappedFileSource.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <spdlog/spdlog.h>

MappedFileSource::MappedFileSource(const std::string& path)
    : filePath(path),
      refcount(1),
      open(true),
      sourceSize(0),
      cursor(0) {
    // mapped_region refuses zero-length files, so an empty file stays unmapped
    if (std::filesystem::file_size(path) > 0) {
        boost::interprocess::file_mapping mapping(path.c_str(), boost::interprocess::read_only);
        boost::interprocess::mapped_region mapped(mapping, boost::interprocess::read_only);
        fileMapping.swap(mapping);
        region.swap(mapped);
        sourceSize = region.get_size();
    }
    spdlog::debug("[source] mapped {} ({} bytes)", filePath, sourceSize);
}

MappedFileSource::~MappedFileSource() {
    close();
}

size_t MappedFileSource::read(uint8_t* buffer, size_t destOffset, size_t maxCount) {
    if (!open) {
        throw std::runtime_error("Read from closed source: " + filePath);
    }
    if (cursor >= sourceSize || maxCount == 0) {
        return 0;
    }
    size_t count = static_cast<size_t>(std::min<uint64_t>(maxCount, sourceSize - cursor));
    const char* base = static_cast<const char*>(region.get_address());
    std::memcpy(buffer + destOffset, base + cursor, count);
    cursor += count;
    return count;
}

uint64_t MappedFileSource::position() const {
    return cursor;
}

void MappedFileSource::setPosition(uint64_t pos) {
    cursor = pos;
}

bool MappedFileSource::isReadable() const {
    return open.load();
}

uint64_t MappedFileSource::length() const {
    return sourceSize;
}

void MappedFileSource::close() {
    if (open.exchange(false)) {
        boost::interprocess::mapped_region().swap(region);
        boost::interprocess::file_mapping().swap(fileMapping);
        spdlog::debug("[source] unmapped {}", filePath);
    }
}

const std::string& MappedFileSource::path() const {
    return filePath;
}

std::mutex& MappedFileSource::accessMutex() {
    return mutex;
}

void MappedFileSource::incRef() {
    refcount++;
}

void MappedFileSource::decRef() {
    refcount--;
}

int MappedFileSource::refCount() const {
    return refcount.load();
}
