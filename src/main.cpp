#include <boost/asio.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "console.hpp"
#include "generator.hpp"
#include "logger.hpp"
#include "time_source.hpp"

using namespace tsid;

namespace {

void usage(const char* argv0) {
    std::cout << "Usage:\n";
    std::cout << "  " << argv0 << " [-c <config_path>]                 interactive shell\n";
    std::cout << "  " << argv0 << " [-c <config_path>] <command> [args] run one command\n";
    std::cout << "\n";
    for (const auto& line : TokenCommands::help()) std::cout << line << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string cfg_path;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (args.empty() && (a == "-c" || a == "--config")) {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            cfg_path = argv[++i];
            continue;
        }
        if (args.empty() && (a == "-h" || a == "--help")) {
            usage(argv[0]);
            return 0;
        }
        args.push_back(a);
    }

    Config cfg;
    std::string err;
    if (!cfg_path.empty() && !load_config(cfg_path, cfg, err)) {
        std::cerr << err << "\n";
        return 2;
    }

    LogLevel level = LogLevel::INFO;
    if (!parse_level(cfg.log_level, level)) {
        std::cerr << "invalid log_level: " << cfg.log_level << "\n";
        return 2;
    }
    Logger logger;
    logger.set_level(level);
    if (!cfg.log_file.empty() && !logger.open(cfg.log_file)) {
        std::cerr << "failed to open log file: " << cfg.log_file << "\n";
        return 2;
    }

    Console console;
    Generator gen(system_time_source(), &logger);
    TokenCommands commands(gen, cfg.fast ? Strategy::fast : Strategy::standard, logger);

    if (!args.empty()) {
        CommandResult r = commands.run(args);
        if (r.status == 0) {
            console.println(r.lines);
        } else {
            for (const auto& line : r.lines) std::cerr << line << "\n";
        }
        return r.status;
    }

    if (!cfg.cli_enabled) {
        std::cerr << "no command given and cli_enabled=false\n";
        return 2;
    }

    logger.info("interactive shell started");
    boost::asio::io_context io;

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        logger.info("signal " + std::to_string(sig) + ", shutting down");
        io.stop();
    });

    auto cli = std::make_unique<Cli>(io, commands, console);
    cli->start();

    io.run();
    cli->join();
    logger.info("interactive shell stopped, last instant " +
                std::to_string(gen.clock().last_issued()));

    return 0;
}
