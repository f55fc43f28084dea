/**
 * @file LastLines.cpp
 * @brief Reverse-chunked extraction of the last lines of a file.
 *
 * Small files are read whole and split forward. Larger files are read from the
 * end towards the start in fixed-size windows; each window is scanned back to
 * front and bytes are accumulated (reversed) into a pending line until a line
 * terminator is crossed. Scanner state survives window boundaries, so lines and
 * CR-LF pairs split between two reads are reassembled correctly.
 */

#include "LastLines.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <iterator>

#include <spdlog/fmt/fmt.h>

namespace ListFile {

namespace {

inline bool is_eol(uint8_t c) {
    return c == '\n' || c == '\r';
}

// collects lines while being fed bytes from the end of the file towards its start
class ReverseLineCollector {
    public:
    explicit ReverseLineCollector(size_t wanted) : m_wanted(wanted) {}

    /**
     * @brief Scans a window from its last byte to its first one.
     * @return false once enough lines were collected, remaining bytes are not looked at.
     */
    bool feed(const uint8_t* data, size_t size) {
        for( size_t i = size; i-- > 0; ){
            const uint8_t c = data[i];
            if( c == '\r' && m_after_lf ){
                // CR of a CR-LF pair, the LF already closed the line
                m_after_lf = false;
                continue;
            }
            if( is_eol(c) ){
                m_after_lf = (c == '\n');
                // an empty tail after the last terminator of the file is not a line
                if( m_seen_eol || !m_pending.empty() ){
                    emit();
                    if( done() ){
                        return false;
                    }
                }
                m_seen_eol = true;
            } else {
                m_after_lf = false;
                m_pending.push_back(static_cast<char>(c));
            }
        }
        return true;
    }

    // start of file reached, whatever is pending is the first line
    void finish() {
        if( !done() && (m_seen_eol || !m_pending.empty()) ){
            emit();
        }
    }

    bool done() const { return m_lines.size() >= m_wanted; }

    std::vector<std::string> take() {
        return std::vector<std::string>(std::make_move_iterator(m_lines.begin()), std::make_move_iterator(m_lines.end()));
    }

    private:
    void emit() {
        std::reverse(m_pending.begin(), m_pending.end());
        m_lines.push_front(std::move(m_pending));
        m_pending.clear();
    }

    const size_t m_wanted;
    std::string m_pending;            // current line, bytes in reverse order
    std::deque<std::string> m_lines;  // completed lines, file order
    bool m_seen_eol = false;
    bool m_after_lf = false;          // byte right of the cursor was a consumed '\n'
};

std::vector<std::string> read_direct(ByteSource& source, size_t line_count, const CancelToken& cancel) {
    const size_t fsize = source.size();
    std::string content(fsize, '\0');
    size_t nread = source.read_at(0, content.data(), fsize);
    if( nread != fsize ){
        throw Unexpected(fmt::format("short read: got {:#x} of {:#x} bytes", nread, fsize));
    }
    cancel.throw_if_cancelled();

    std::vector<std::string> lines = split_lines(content);
    if( lines.size() > line_count ){
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(line_count));
    }
    return lines;
}

std::vector<std::string> read_reverse(ByteSource& source, size_t line_count, size_t chunk_size, const CancelToken& cancel) {
    std::vector<uint8_t> chunk(chunk_size);
    ReverseLineCollector collector(line_count);

    off_t position = source.size();
    while( position > 0 && !collector.done() ){
        cancel.throw_if_cancelled();

        const size_t read_size = std::min<size_t>(chunk_size, position);
        position -= static_cast<off_t>(read_size);

        size_t nread = source.read_at(position, chunk.data(), read_size);
        if( nread != read_size ){
            throw Unexpected(fmt::format("short read at {:#x}: got {:#x} of {:#x} bytes", position, nread, read_size));
        }
        if( !collector.feed(chunk.data(), read_size) ){
            break;
        }
    }

    if( position == 0 ){
        collector.finish();
    }
    return collector.take();
}

} // namespace

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    for( size_t i = 0; i < text.size(); ++i ){
        const char c = text[i];
        if( c != '\n' && c != '\r' ){
            continue;
        }
        lines.emplace_back(text.substr(start, i - start));
        if( c == '\r' && i + 1 < text.size() && text[i + 1] == '\n' ){
            ++i;
        }
        start = i + 1;
    }
    if( start < text.size() ){
        lines.emplace_back(text.substr(start));
    }
    return lines;
}

std::vector<std::string> get_last_lines(ByteSource& source, int line_count, size_t chunk_size, const CancelToken& cancel) {
    if( line_count <= 0 ){
        throw InvalidArgument(fmt::format("Line count must be greater than zero, got {}", line_count));
    }
    if( chunk_size == 0 ){
        throw InvalidArgument("Chunk size must be greater than zero");
    }
    cancel.throw_if_cancelled();

    if( source.size() <= chunk_size ){
        return read_direct(source, line_count, cancel);
    }
    return read_reverse(source, line_count, chunk_size, cancel);
}

} // namespace ListFile
