#include "console.hpp"

namespace tsid {

void Console::println(const std::string& s) {
    std::lock_guard<std::mutex> lk(mu_);
    out_ << s << std::endl;
}

void Console::println(const std::vector<std::string>& lines) {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& line : lines) out_ << line << '\n';
    out_.flush();
}

void Console::print(const std::string& s) {
    std::lock_guard<std::mutex> lk(mu_);
    out_ << s;
    out_.flush();
}

} // namespace tsid
