#include "cli.hpp"
#include "util.hpp"

#include <cctype>
#include <cerrno>
#include <poll.h>
#include <sstream>
#include <termios.h>
#include <vector>

namespace tsid {

namespace {

// Poll interval for noticing stop_ while waiting on input.
constexpr int kPollMs = 100;

// Puts a terminal into no-echo, non-canonical mode and puts it back when
// destroyed. Does nothing for pipes and files.
class RawMode {
public:
    explicit RawMode(int fd) : fd_(fd) {
        if (!::isatty(fd_) || ::tcgetattr(fd_, &orig_) != 0) return;
        termios raw = orig_;
        raw.c_lflag &= static_cast<unsigned int>(~(ICANON | ECHO));
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        active_ = ::tcsetattr(fd_, TCSANOW, &raw) == 0;
    }
    ~RawMode() {
        if (active_) ::tcsetattr(fd_, TCSANOW, &orig_);
    }

    RawMode(const RawMode&) = delete;
    RawMode& operator=(const RawMode&) = delete;

    bool active() const { return active_; }

private:
    int fd_;
    termios orig_{};
    bool active_ = false;
};

static std::vector<std::string> split_words(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

} // namespace

Cli::Cli(boost::asio::io_context& io, TokenCommands& commands, Console& console, int in_fd)
    : io_(io), commands_(commands), console_(console), in_fd_(in_fd) {}

Cli::~Cli() {
    join();
}

void Cli::start() {
    th_ = std::thread([this]{ run(); });
}

void Cli::join() {
    stop_.store(true);
    if (th_.joinable()) th_.join();
}

int Cli::read_byte(char& ch) {
    while (!stop_.load()) {
        pollfd pfd{};
        pfd.fd = in_fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, kPollMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return 0;
        }
        if (rc == 0) continue;
        ssize_t n = ::read(in_fd_, &ch, 1);
        if (n < 0 && errno == EINTR) continue;
        return n == 1 ? 1 : 0;
    }
    return -1;
}

bool Cli::read_line(std::string& out) {
    out.clear();
    RawMode mode(in_fd_);
    const bool echo = mode.active();

    char ch = 0;
    while (true) {
        int got = read_byte(ch);
        if (got < 0) return false;
        // Unterminated last line of piped input still counts.
        if (got == 0) return !out.empty();
        if (ch == '\r' || ch == '\n') {
            if (echo) console_.print("\n");
            return true;
        }
        if (ch == 0x7f || ch == '\b') {
            if (!out.empty()) {
                out.pop_back();
                if (echo) console_.print("\b \b");
            }
            continue;
        }
        if (ch == 0x04 && out.empty()) {
            if (echo) console_.print("\n");
            return false;
        }
        if (std::isprint(static_cast<unsigned char>(ch))) {
            out.push_back(ch);
            if (echo) console_.print(std::string(1, ch));
        }
    }
}

void Cli::run() {
    console_.println(TokenCommands::help());

    std::string line;
    while (!stop_.load()) {
        console_.print("tsid> ");
        if (!read_line(line)) break;
        line = trim(line);
        if (line.empty()) continue;

        auto args = split_words(line);
        const std::string& cmd = args[0];
        if (cmd == "quit" || cmd == "exit" || cmd == "q") break;

        boost::asio::post(io_, [this, args]{
            console_.println(commands_.run(args).lines);
        });
    }
    stop_.store(true);
    boost::asio::post(io_, [this]{ io_.stop(); });
}

} // namespace tsid
