#pragma once
#include <cstdint>
#include <fcntl.h>
#include <filesystem>
#include <string>

#include "core/errors.hpp"
#include "io/ByteSource.hpp"

// read-only file reader over a regular file
//  - the file is opened in the constructor and closed in the destructor
//  - open failures are reported as ListFile::NotFound / AccessDenied / Unexpected
//  - read_at() uses pread(), so concurrent reads on one instance are fine
class Reader : public ByteSource {
    public:
    explicit Reader(const std::filesystem::path& fname);
    ~Reader() override;

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    class ReadError : public ListFile::Unexpected {
        public:
        explicit ReadError(const std::string& msg) : ListFile::Unexpected(msg) {}
    };

    size_t read_at(off_t offset, void* buf, size_t count) override;

    size_t size() const override { return m_size; }

    const std::filesystem::path& fname() const { return m_fname; }

    private:
        std::filesystem::path m_fname;
        int m_fd = -1;
        size_t m_size = 0;
};
