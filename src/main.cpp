/**
 * @file main.cpp
 * @brief Main entry point for listfile.
 *
 * Parses the command line, dispatches to a registered command and sets up
 * logging. "tail" is implied when the first argument is an existing file, so
 * `listfile app.log 20` works as well as `listfile tail app.log 20`.
 */

#include <argparse/argparse.hpp>
#include <algorithm>
#include <iostream>

#include "utils/common.hpp"
#include "dist/version.h"

#include "commands/TailCommand.hpp"
#include "commands/TestCommand.hpp"

extern argparse::ArgumentParser program;
extern int verbosity;

int main(int argc, char*argv[]) {
    signal(SIGSEGV, signal_handler);
    signal(SIGABRT, signal_handler);
    signal(SIGINT, interrupt_handler);

    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        std::vector<std::string> unknown_args = program.parse_known_args(argc, argv); // doesnt raise error on unknown args
        const bool no_subcommand_used = std::all_of(Command::registry().begin(), Command::registry().end(), [&](const auto& cmd) { return !program.is_subcommand_used(cmd.first); } );
        if( unknown_args.size() > 0 ){
            if( no_subcommand_used && TailCommand::implies_tail(unknown_args[0]) ){
                // no subcommand used => implicit "tail" command
                unknown_args.insert(unknown_args.begin(), TAIL_CMD_NAME);
                unknown_args.insert(unknown_args.begin(), argv[0]);
                program.parse_args(unknown_args); // raises error on unknown args
            } else {
                std::cerr << "[?] Unknown arguments: ";
                for (const auto& arg : unknown_args) {
                    std::cerr << "\"" << arg << "\" ";
                }
                std::cerr << std::endl;
                std::cerr << program;
                return 1;
            }
        }
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before logger->add_file() call
    logger->set_dedup_limit(program.get<int>("--log-dedup-limit"));
    if( program.is_used("--log") ){
        init_log(program.get<std::string>("--log"));
    }

    auto& selfTestCmd = Command::registry()[TEST_CMD_NAME];
    for (const auto& [name, cmd] : Command::registry()) {
        if (program.is_subcommand_used(name)) {
            if( name == TEST_CMD_NAME ){
                // explicit self-test, make it visible
                logger->set_verbosity(9);
            } else if( selfTestCmd->run() != 0 ){
                // implicit self-test is silent unless it fails
                logger->critical("self-test failed, exiting");
                return 1;
            }

            if( cmd->parser().is_used("--log") ){
                init_log(cmd->parser().get<std::string>("--log"));
            }

            return cmd->run();
        }
    }

    std::cout << program;
    return 0;
}
