/**
 * @file common.cpp
 * @brief Implementation of common utilities and global variables.
 *
 * Global logger, verbosity and interrupt state, command-line options shared by
 * all commands, crash handling with stack traces and the SIGINT handler that
 * cancels a running extraction.
 */

#include "common.hpp"
#include "dist/version.h"

int verbosity = 0;
bool verbosity_changed = false;

std::shared_ptr<Logger> logger = std::make_shared<Logger>(spdlog::default_logger());
argparse::ArgumentParser program(APP_NAME, APP_VERSION, argparse::default_arguments::help);
ListFile::CancelSource g_interrupt;

// begin stack trace generation on error
#include <backtrace.h>

/**
 * @brief Backtrace error callback for logging libbacktrace errors.
 * @param msg Error message.
 * @param errnum Error number.
 */
void backtrace_error_cb(void *, const char *msg, int errnum) {
    logger->critical("Error: {} (Error number: {})", msg, errnum);
}

int backtrace_full_cb(void *, uintptr_t pc, const char *filename, int lineno, const char *function) {
    logger->critical("     {} {}:{} ({})", (void *)pc, filename ? filename : "?", lineno, function ? function : "?");
    return 0;  // Continue processing the backtrace
}

void signal_handler(int sig) {
    logger->critical("Signal {} received, printing backtrace...", sig);

    backtrace_state *state = backtrace_create_state(NULL, 0, backtrace_error_cb, NULL);
    backtrace_full(state, 0, backtrace_full_cb, backtrace_error_cb, NULL);

    exit(1);
}
// end stack trace generation on error

// SIGINT: ask the running extraction to stop, the command reports it
void interrupt_handler(int) {
    g_interrupt.cancel();
}

void init_log(std::string log_fname){
    static bool inited = false;
    if( inited ){
        return;
    }

    inited = true;
    // explicit log pathname, can't continue without log
    if( !logger->add_file(log_fname) ){
        logger->critical("explicit log pathname is set, refusing to continue without log");
        exit(1);
    }
    logger->start();
}

bool parse_bool(const std::string value){
    if( value == "1" || value == "true" || value == "yes" ){
        return true;
    }
    if( value == "0" || value == "false" || value == "no" ){
        return false;
    }
    throw std::runtime_error("Invalid boolean value: " + value);
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; verbosity_changed = true; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; verbosity_changed = true; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-L", "--log")
        .help("log pathname [default: console only]");
    parser.add_argument("--log-dedup-limit")
        .default_value(100)
        .scan<'i', int>()
        .help("limit duplicate log messages, 0 = no limit");
}

void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}
