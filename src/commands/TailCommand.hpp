#pragma once
#include "Command.hpp"
#include "config/Options.hpp"

#define TAIL_CMD_NAME "tail"

class TailCommand : public Command {
public:
    int run() override;

    // defaults <- settings file <- environment <- command line
    ListFile::ListerOptions load_options();

    // true if a leading argument that is not a command should be read as "tail <arg>"
    static bool implies_tail(const std::string& arg);

private:
    static TailCommand instance; // Static instance to trigger registration
    TailCommand(bool reg = false);

    int line_count(const ListFile::ListerOptions& options) const;
    void print_lines(const std::vector<std::string>& lines, bool show_line_numbers) const;

    friend class TailCommandTest;
    friend class CmdTestBase<TailCommand>;
};
