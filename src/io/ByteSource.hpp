#pragma once
#include <cstddef>
#include <sys/types.h>

// read-only, byte-addressable view of a file; positioned reads only, never mutated
class ByteSource {
    public:
    virtual ~ByteSource() {}

    virtual size_t size() const = 0;

    // returns number of bytes read, 0 at or past EOF. either succeeds or throws
    virtual size_t read_at(off_t offset, void* buf, size_t count) = 0;
};
