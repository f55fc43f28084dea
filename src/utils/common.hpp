#pragma once
#include "io/Logger.hpp"
#include "units.hpp"
#include "core/cancel.hpp"

#include <string>
#include <filesystem>
#include <vector>
#include <signal.h>

namespace fs = std::filesystem;

#include <argparse/argparse.hpp>

#define APP_NAME "listfile"

#define EXIT_INTERRUPTED 130

extern std::shared_ptr<Logger> logger;
extern ListFile::CancelSource g_interrupt;

void init_log(std::string log_fname);
bool parse_bool(const std::string value);
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);
void signal_handler(int sig);
void interrupt_handler(int sig);
