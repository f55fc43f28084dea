/**
 * @file Logger.cpp
 * @brief Implementation of the Logger wrapper around spdlog.
 *
 * Console plus optional file sink, verbosity mapping for -v/-q, session banner
 * and warn/error deduplication.
 */

#include "Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/fmt/ranges.h> // for fmt::join()
#include <algorithm>
#include <iterator>
#include <fstream>

/**
 * @brief Sets the logging verbosity level.
 *
 * -4 or less: off, -3: critical, -2: error, -1: warn, 0: info, 1: debug, 2+: trace
 *
 * @param verbosity Integer verbosity level.
 */
void Logger::set_verbosity(int verbosity){
    static const spdlog::level::level_enum levels[] = {
        spdlog::level::off,
        spdlog::level::critical,
        spdlog::level::err,
        spdlog::level::warn,
        spdlog::level::info, // default level
        spdlog::level::debug,
        spdlog::level::trace,
    };
    int idx = std::clamp(verbosity + 4, 0, (int)std::size(levels) - 1);
    m_logger->set_level(levels[idx]);
}

void Logger::set_arguments(int argc, char* argv[]){
    m_arguments.assign(argv, argv + argc);
}

void Logger::set_arguments(const std::vector<std::string>& args){
    m_arguments = args;
}

// not a comprehensive shell-escape, just enough to make the log readable
static std::string quote_if_needed(const std::string& arg) {
    if( arg.empty() || arg.find_first_of(" \t\"") != std::string::npos ){
        return "\"" + arg + "\"";
    }
    return arg;
}

/**
 * @brief Adds a file sink to the logger.
 *
 * The file is opened in append mode and receives DEBUG or higher, unless the
 * console is already more verbose. Only one file sink is supported.
 *
 * @param fname Path to the log file.
 * @return True if file sink was added, false if already logging to a file or on error.
 */
bool Logger::add_file(const std::filesystem::path& fname) {
    if( !m_fname.empty() ){
        return false;
    }

    std::ofstream file(fname, std::ios::app);
    if( !file.is_open() ){
        m_logger->error("Failed to open log file {}, no log will be saved!", fname);
        return false;
    }
    if( file.tellp() != 0 ){
        file.write("\n\n", 2); // visual sessions separator
    }
    file.close();

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fname.string());

    const auto cur_level = m_logger->level();
    if( cur_level > spdlog::level::debug ){
        // keep the console at the requested level, let the file see debug messages
        file_sink->set_level(spdlog::level::debug);
        set_console_level(cur_level);
        m_logger->set_level(spdlog::level::debug);
    }

    m_logger->sinks().push_back(file_sink);
    m_fname = fname;
    return true;
}

/**
 * @brief Checks the per-format-string counter against the dedup limit.
 * @param format Format string of the message (arguments are not counted).
 * @return True if the message must be dropped.
 */
bool Logger::is_over_limit(fmt::string_view format) {
    if( m_dedup_limit <= 0 ){
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mtx);
    int n = m_logged_messages[format]++;
    if( n < m_dedup_limit ){
        return false;
    }
    if( n == m_dedup_limit ){
        m_logger->warn("\"{}\" repeated {} times, suppressing", format, m_dedup_limit);
    }
    return true;
}

/**
 * @brief Logs session start information including banner and arguments.
 */
void Logger::start(){
    std::vector<std::string> quoted(m_arguments.size());
    std::transform(m_arguments.begin(), m_arguments.end(), quoted.begin(), quote_if_needed);

    if( !m_banner.empty() ){
        m_logger->info("{}", m_banner);
    }
    m_logger->info("started as {}", fmt::join(quoted, " "));
    m_logger->info("logging to {}", m_fname.empty() ? "console only" : m_fname.string());
}

// XXX assuming that first sink is console
void Logger::set_console_level(spdlog::level::level_enum level) {
    m_logger->sinks().front()->set_level(level);
}

spdlog::level::level_enum Logger::console_level() const {
    return m_logger->sinks().front()->level();
}
