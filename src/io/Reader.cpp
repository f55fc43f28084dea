/**
 * @file Reader.cpp
 * @brief Implementation of the read-only file reader.
 *
 * Opens a regular file once, determines its size from the open descriptor and
 * serves positioned reads. errno values from open()/fstat()/pread() are mapped
 * onto the lister error taxonomy so that a missing file can be told apart from
 * a permission problem or a device error.
 */

#include "Reader.hpp"
#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

#ifdef O_BINARY
#define OPEN_MODE O_RDONLY|O_BINARY
#else
#define OPEN_MODE O_RDONLY
#endif

/**
 * @brief Opens the file for reading and determines its size.
 *
 * @param fname Path to the file.
 * @throws ListFile::NotFound If the file does not exist or is a directory.
 * @throws ListFile::AccessDenied If the file cannot be opened due to permissions.
 * @throws ListFile::Unexpected On any other failure.
 */
Reader::Reader(const std::filesystem::path& fname) : m_fname(fname) {
    m_fd = open(fname.string().c_str(), OPEN_MODE);
    if( m_fd == -1 ) {
        ListFile::throw_errno(errno, fmt::format("open(\"{}\", {:#x})", fname.string(), OPEN_MODE));
    }

    struct stat st;
    if( fstat(m_fd, &st) == -1 ) {
        int err = errno;
        close(m_fd);
        m_fd = -1;
        ListFile::throw_errno(err, fmt::format("fstat(\"{}\")", fname.string()));
    }
    if( S_ISDIR(st.st_mode) ) {
        close(m_fd);
        m_fd = -1;
        throw ListFile::NotFound(fmt::format("\"{}\" is a directory", fname.string()));
    }
    m_size = st.st_size;
}

/**
 * @brief Destructor closes the file descriptor if open.
 */
Reader::~Reader() {
    if( m_fd != -1 ) {
        close(m_fd);
    }
}

/**
 * @brief Reads data from a specific file position.
 *
 * Loops over short reads and EINTR until either count bytes are read or EOF is hit.
 *
 * @param offset File position to read from.
 * @param buf Buffer to read into.
 * @param count Number of bytes to read.
 * @return Number of bytes actually read (may be less than count at EOF).
 * @throws ListFile::InvalidArgument If offset is negative.
 * @throws ReadError On read error.
 */
size_t Reader::read_at(off_t offset, void* buf, size_t count) {
    if( offset < 0 ){
        throw ListFile::InvalidArgument(fmt::format("offset < 0: {:#x}", offset));
    }
    if( (size_t)offset >= m_size ) {
        return 0;
    }

    char* out = static_cast<char*>(buf);
    size_t total_read = 0;
    while( total_read < count ) {
        ssize_t nread = ::pread(m_fd, out + total_read, count - total_read, offset + total_read);
        if( nread == -1 ) {
            if( errno == EINTR ) continue;
            throw ReadError(fmt::format("read(\"{}\", offset {:#x}, count {:#x}): {}", m_fname.string(), offset + total_read, count - total_read, strerror(errno)));
        }
        if( nread == 0 ) {
            break; // EOF
        }
        total_read += static_cast<size_t>(nread);
    }
    return total_read;
}
