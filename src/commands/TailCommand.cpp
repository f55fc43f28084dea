/**
 * @file TailCommand.cpp
 * @brief Implementation of the TailCommand printing the last lines of a file.
 *
 * Resolves the lister options, runs a FileLister over the requested file with
 * SIGINT wired to cancellation, and prints the lines to stdout. Errors are
 * logged and mapped to the process exit code.
 */

#include "TailCommand.hpp"
#include "core/FileLister.hpp"

#include <iostream>

REGISTER_COMMAND(TailCommand);

/**
 * @brief Constructs a TailCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
TailCommand::TailCommand(bool reg) : Command(reg, TAIL_CMD_NAME, "print the last lines of a file") {
    m_parser.add_argument("filename").help("file to read");
    m_parser.add_argument("line_count")
        .nargs(argparse::nargs_pattern::optional)
        .scan<'i', int>()
        .help("number of lines to print [default: 10]");
    m_parser.add_argument("-n", "--lines")
        .scan<'i', int>()
        .help("number of lines to print, same as line_count");
    m_parser.add_argument("--line-numbers")
        .default_value(false)
        .implicit_value(true)
        .help("prefix each printed line with its number");
    m_parser.add_argument("--chunk-size")
        .help("read buffer size, accepts units: 8k, 1Mb, 0x2000 [default: 8Kb]");
    m_parser.add_argument("--max-lines")
        .scan<'i', int>()
        .help("max number of lines a single request may ask for [default: 1000]");
    m_parser.add_argument("-c", "--config")
        .help("JSON settings file [default: ./" LISTFILE_CONFIG_FNAME " if present]");
}

ListFile::ListerOptions TailCommand::load_options() {
    ListFile::ListerOptions options;

    if( auto config = m_parser.present("--config") ){
        options.load_json_file(*config, true);
    } else {
        options.load_json_file(LISTFILE_CONFIG_FNAME, false);
    }
    options.load_env();

    if( auto max_lines = m_parser.present<int>("--max-lines") ){
        options.max_line_count = *max_lines;
        if( options.default_line_count > options.max_line_count ){
            options.default_line_count = options.max_line_count;
        }
    }
    if( auto chunk_size = m_parser.present("--chunk-size") ){
        try {
            options.buffer_size = human2bytes(*chunk_size);
        } catch( const std::exception& e ){
            throw ListFile::InvalidArgument(fmt::format("--chunk-size: {}", e.what()));
        }
    }
    if( m_parser.get<bool>("--line-numbers") ){
        options.show_line_numbers = true;
    }

    options.validate();
    logger->debug("options: {}", options.to_string());
    return options;
}

// a missing file is still taken as a file name, so it gets a "File not found" error instead of the usage
bool TailCommand::implies_tail(const std::string& arg) {
    if( arg.empty() ){
        return false;
    }
    return arg[0] != '-' || std::filesystem::exists(arg);
}

int TailCommand::line_count(const ListFile::ListerOptions& options) const {
    if( auto n = m_parser.present<int>("--lines") ){
        return *n;
    }
    if( auto n = m_parser.present<int>("line_count") ){
        return *n;
    }
    return options.default_line_count;
}

void TailCommand::print_lines(const std::vector<std::string>& lines, bool show_line_numbers) const {
    for( size_t i = 0; i < lines.size(); i++ ){
        if( show_line_numbers ){
            fmt::print("{:6}\t{}\n", i + 1, lines[i]);
        } else {
            fmt::print("{}\n", lines[i]);
        }
    }
    fflush(stdout);
}

/**
 * @brief Prints the last lines of the file.
 *
 * @return 0 on success, 1 on any error, EXIT_INTERRUPTED if cancelled by SIGINT.
 */
int TailCommand::run() {
    const std::string fname = m_parser.get("filename");

    try {
        ListFile::ListerOptions options = load_options();
        ListFile::AdmissionGate gate;
        ListFile::FileLister lister(options, gate);

        std::vector<std::string> lines = lister.get_last_lines(fname, line_count(options), g_interrupt.token());
        print_lines(lines, options.show_line_numbers);
        return 0;
    } catch( const ListFile::InvalidArgument& e ){
        logger->error("Error: {}", e.what());
        std::cerr << m_parser;
    } catch( const ListFile::NotFound& e ){
        logger->error("Error: File not found - {}", e.what());
    } catch( const ListFile::AccessDenied& e ){
        logger->error("Error: Access denied - {}", e.what());
    } catch( const ListFile::Cancelled& ){
        logger->warn("{}: interrupted", fname);
        return EXIT_INTERRUPTED;
    } catch( const ListFile::Error& e ){
        logger->error("{}: {}: {}", fname, ListFile::to_string(e.kind()), e.what());
    }
    return 1;
}
