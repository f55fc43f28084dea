#pragma once
#include <algorithm>
#include <cstring>
#include <string>

#include "core/errors.hpp"
#include "io/ByteSource.hpp"

// ByteSource over an in-memory string, for self-tests and unit tests
class MemorySource : public ByteSource {
    public:
    explicit MemorySource(std::string data) : m_data(std::move(data)) {}

    size_t size() const override { return m_data.size(); }

    size_t read_at(off_t offset, void* buf, size_t count) override {
        if( offset < 0 ){
            throw ListFile::InvalidArgument("offset < 0");
        }
        if( (size_t)offset >= m_data.size() ){
            return 0;
        }
        count = std::min(count, m_data.size() - (size_t)offset);
        memcpy(buf, m_data.data() + offset, count);
        m_reads++;
        return count;
    }

    size_t reads() const { return m_reads; }

    private:
    std::string m_data;
    size_t m_reads = 0;
};
