#pragma once

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace tsid {

// Thread-safe output for user interaction.
// NOTE: This is NOT used for internal logs.
class Console {
public:
    explicit Console(std::ostream& out = std::cout) : out_(out) {}

    void println(const std::string& s);
    void println(const std::vector<std::string>& lines);
    void print(const std::string& s);

private:
    std::mutex mu_;
    std::ostream& out_;
};

} // namespace tsid
