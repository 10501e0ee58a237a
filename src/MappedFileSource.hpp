#pragma once
#include <string>
#include <atomic>
#include <mutex>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>
#include "RangeByteSource.hpp"

// Read-only memory-mapped file exposed as a RangeByteSource.
class MappedFileSource : public RangeByteSource {
public:
    MappedFileSource(const std::string& path);
    ~MappedFileSource();

    size_t read(uint8_t* buffer, size_t destOffset, size_t maxCount) override;
    uint64_t position() const override;
    void setPosition(uint64_t pos) override;
    bool isReadable() const override;
    uint64_t length() const override;
    void close() override;

    const std::string& path() const;

    // Holders of this lock own the cursor for the duration of an access.
    std::mutex& accessMutex();

    void incRef();
    void decRef();
    int refCount() const;

private:
    std::string filePath;
    boost::interprocess::file_mapping fileMapping;
    boost::interprocess::mapped_region region;
    std::atomic<int> refcount;
    std::atomic<bool> open;
    uint64_t sourceSize;
    uint64_t cursor;
    std::mutex mutex;
};
