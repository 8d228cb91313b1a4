#pragma once

#include <boost/asio.hpp>

#include <atomic>
#include <string>
#include <thread>

#include <unistd.h>

#include "commands.hpp"
#include "console.hpp"

namespace tsid {

// Interactive shell. Reads lines on its own thread and runs each command on
// the io_context, which owns the generator.
class Cli {
public:
    Cli(boost::asio::io_context& io, TokenCommands& commands, Console& console,
        int in_fd = STDIN_FILENO);
    ~Cli();

    void start();
    // Asks the reader to stop and waits for it. The terminal mode is restored
    // before the reader exits.
    void join();

private:
    void run();
    bool read_line(std::string& out);
    // Next byte from in_fd_; 0 on EOF/error, -1 once stop_ is set.
    int read_byte(char& ch);

    boost::asio::io_context& io_;
    TokenCommands& commands_;
    Console& console_;
    int in_fd_;

    std::atomic<bool> stop_{false};
    std::thread th_;
};

} // namespace tsid
