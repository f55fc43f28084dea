/**
 * @file FileLister.cpp
 * @brief Request-level wrapper around the last-lines extractor.
 */

#include "FileLister.hpp"
#include "core/LastLines.hpp"
#include "io/Reader.hpp"
#include "utils/common.hpp"

#include <spdlog/stopwatch.h>

namespace ListFile {

static bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n\v\f") == std::string::npos;
}

/**
 * @brief Constructs the lister.
 * @throws InvalidArgument If the options are inconsistent.
 */
FileLister::FileLister(const ListerOptions& options, AdmissionGate& gate) : m_options(options), m_gate(gate) {
    m_options.validate();
}

void FileLister::validate(const std::filesystem::path& fname, int line_count) const {
    if( is_blank(fname.string()) ){
        throw InvalidArgument("File path cannot be null or empty.");
    }
    if( line_count <= 0 ){
        throw InvalidArgument(fmt::format("Line count must be greater than zero, got {}.", line_count));
    }
    if( line_count > m_options.max_line_count ){
        throw InvalidArgument(fmt::format("Line count cannot exceed {}, got {}.", m_options.max_line_count, line_count));
    }
}

/**
 * @brief Reads up to line_count last lines of a file.
 *
 * The file is opened after an admission slot is taken and closed before the slot
 * is given back, on every exit path.
 *
 * @throws InvalidArgument For a blank path or a line count outside 1..MaxLineCount.
 * @throws NotFound If the file does not exist.
 * @throws AccessDenied If the file cannot be opened due to permissions.
 * @throws Cancelled If cancel fires while waiting for a slot or while scanning.
 * @throws Unexpected On any other I/O failure.
 */
std::vector<std::string> FileLister::get_last_lines(const std::filesystem::path& fname, int line_count, const CancelToken& cancel) const {
    validate(fname, line_count);

    AdmissionGate::Slot slot = m_gate.acquire(cancel);
    spdlog::stopwatch sw;

    Reader reader(fname);
    logger->debug("{}: size {}, requesting {} lines, chunk {}", reader.fname(), bytes2human(reader.size(), " bytes"), line_count, bytes2human(m_options.buffer_size));

    std::vector<std::string> lines = ListFile::get_last_lines(reader, line_count, m_options.buffer_size, cancel);

    logger->debug("{}: got {} lines in {:.3f}s", fname, lines.size(), sw.elapsed().count());
    return lines;
}

std::future<std::vector<std::string>> FileLister::get_last_lines_async(const std::filesystem::path& fname, int line_count, const CancelToken& cancel) const {
    return std::async(std::launch::async, [options = m_options, gate = &m_gate, fname, line_count, cancel] {
        return FileLister(options, *gate).get_last_lines(fname, line_count, cancel);
    });
}

} // namespace ListFile
