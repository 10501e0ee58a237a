#pragma once
#include <cstddef>
#include <cstdint>

// Seekable, read-only byte stream. A read may return fewer bytes than
// requested while more data is still available; 0 means exhausted.
// I/O failures are reported by throwing std::runtime_error.
class RangeByteSource {
public:
    virtual ~RangeByteSource() = default;

    // Copies up to maxCount bytes into buffer + destOffset, returns bytes copied.
    virtual size_t read(uint8_t* buffer, size_t destOffset, size_t maxCount) = 0;

    virtual uint64_t position() const = 0;
    // Positions past the end are allowed; subsequent reads return 0.
    virtual void setPosition(uint64_t pos) = 0;

    virtual bool isReadable() const = 0;
    virtual uint64_t length() const = 0;
    virtual void close() = 0;
};
