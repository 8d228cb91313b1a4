#pragma once

#include <string>
#include <vector>

#include "generator.hpp"

namespace tsid {

class Logger;

struct CommandResult {
    int status = 0; // 0 ok, 1 command failed, 2 usage error
    std::vector<std::string> lines;
};

// Token commands shared by the one-shot tool and the interactive shell.
// Every command returns the lines to print instead of writing them.
class TokenCommands {
public:
    TokenCommands(Generator& gen, Strategy default_strategy, Logger& logger);

    // args[0] is the command name.
    CommandResult run(const std::vector<std::string>& args);

    CommandResult cmd_gen(const std::vector<std::string>& args);
    CommandResult cmd_decode(const std::string& token);
    CommandResult cmd_valid(const std::string& token);
    CommandResult cmd_age(const std::string& token);
    CommandResult cmd_inspect(const std::string& token);
    CommandResult cmd_info();

    static std::vector<std::string> help();

private:
    Generator& gen_;
    Strategy default_strategy_;
    Logger& logger_;
};

} // namespace tsid
