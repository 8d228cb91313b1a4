#include "commands.hpp"

#include "base64.hpp"
#include "codec.hpp"
#include "logger.hpp"
#include "util.hpp"

#include <sstream>
#include <stdexcept>

namespace tsid {

namespace {

CommandResult usage(const std::string& line) {
    CommandResult r;
    r.status = 2;
    r.lines.push_back("usage: " + line);
    return r;
}

CommandResult failure(const Error& e) {
    CommandResult r;
    r.status = 1;
    r.lines.push_back("error: " + e.to_string());
    return r;
}

} // namespace

TokenCommands::TokenCommands(Generator& gen, Strategy default_strategy, Logger& logger)
    : gen_(gen), default_strategy_(default_strategy), logger_(logger) {}

std::vector<std::string> TokenCommands::help() {
    return {
        "commands:",
        "  help                  show this help",
        "  gen [count] [fast|standard]  generate count tokens (default 1)",
        "  decode <token>        print the instant a token encodes",
        "  valid <token>         check token format without decoding",
        "  age <token>           milliseconds since the token's instant",
        "  inspect <token>       show raw payload bytes and Base64 form",
        "  info                  show format details",
        "  quit                  exit (interactive shell only)",
    };
}

CommandResult TokenCommands::run(const std::vector<std::string>& args) {
    if (args.empty()) return usage("<command> [args]");
    const std::string& cmd = args[0];

    if (cmd == "help" || cmd == "h" || cmd == "?") {
        CommandResult r;
        r.lines = help();
        return r;
    }
    if (cmd == "gen" || cmd == "generate") return cmd_gen(args);
    if (cmd == "info") return cmd_info();

    if (cmd == "decode" || cmd == "valid" || cmd == "age" || cmd == "inspect") {
        if (args.size() != 2) return usage(cmd + " <token>");
        if (cmd == "decode") return cmd_decode(args[1]);
        if (cmd == "valid") return cmd_valid(args[1]);
        if (cmd == "age") return cmd_age(args[1]);
        return cmd_inspect(args[1]);
    }

    CommandResult r;
    r.status = 2;
    r.lines.push_back("unknown command: " + cmd);
    return r;
}

CommandResult TokenCommands::cmd_gen(const std::vector<std::string>& args) {
    int64_t count = 1;
    Strategy strategy = default_strategy_;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "fast") { strategy = Strategy::fast; continue; }
        if (a == "standard") { strategy = Strategy::standard; continue; }
        try {
            size_t used = 0;
            count = std::stoll(a, &used);
            if (used != a.size()) return usage("gen [count] [fast|standard]");
        } catch (const std::exception&) {
            return usage("gen [count] [fast|standard]");
        }
    }

    BatchOptions opts;
    opts.fast = strategy == Strategy::fast;
    auto batch = gen_.generate_batch(count, opts);
    if (!batch) {
        logger_.warn("gen failed: " + batch.error().to_string());
        return failure(batch.error());
    }
    CommandResult r;
    r.lines = std::move(batch.value());
    return r;
}

CommandResult TokenCommands::cmd_decode(const std::string& token) {
    auto instant = decode(token);
    if (!instant) {
        logger_.info("decode rejected '" + token + "': " + instant.error().to_string());
        return failure(instant.error());
    }
    CommandResult r;
    const int64_t ms = static_cast<int64_t>(instant.value());
    r.lines.push_back(std::to_string(ms) + " " + format_utc(ms));
    return r;
}

CommandResult TokenCommands::cmd_valid(const std::string& token) {
    CommandResult r;
    if (is_valid_token(token)) {
        r.lines.push_back("valid");
    } else {
        r.status = 1;
        r.lines.push_back("invalid");
    }
    return r;
}

CommandResult TokenCommands::cmd_age(const std::string& token) {
    auto age = gen_.token_age(token);
    if (!age) return failure(age.error());
    CommandResult r;
    r.lines.push_back(std::to_string(age.value()) + "ms");
    return r;
}

CommandResult TokenCommands::cmd_inspect(const std::string& token) {
    auto instant = decode(token);
    if (!instant) return failure(instant.error());

    std::vector<uint8_t> bytes = instant_bytes(instant.value());
    std::string std_b64;
    bool matches = false;
    try {
        std_b64 = b64::encode(bytes);
        matches = b64::decode(b64::from_url_safe(token)) == bytes;
    } catch (const std::exception& e) {
        logger_.error(std::string("inspect: ") + e.what());
        CommandResult r;
        r.status = 1;
        r.lines.push_back(std::string("error: ") + e.what());
        return r;
    }

    CommandResult r;
    r.lines.push_back("token    " + token);
    r.lines.push_back("instant  " + std::to_string(instant.value()));
    r.lines.push_back("utc      " + format_utc(static_cast<int64_t>(instant.value())));
    r.lines.push_back("bytes    " + to_hex(bytes));
    r.lines.push_back("base64   " + std_b64);
    r.lines.push_back("url      " + b64::to_url_safe(std_b64));
    // OpenSSL's decoder must read the token as the same 6 bytes.
    r.lines.push_back(std::string("openssl  ") + (matches ? "match" : "MISMATCH"));
    if (!matches) {
        logger_.error("inspect: OpenSSL disagrees on " + token);
        r.status = 1;
    }
    return r;
}

CommandResult TokenCommands::cmd_info() {
    const ModuleInfo& info = module_info();
    std::ostringstream features;
    for (size_t i = 0; i < info.features.size(); ++i) {
        if (i > 0) features << ' ';
        features << info.features[i];
    }

    CommandResult r;
    r.lines.push_back(std::string(info.name) + " " + info.version);
    r.lines.push_back(std::string("format     ") + info.format + " (" + kAlphabet + ")");
    r.lines.push_back(std::string("precision  ") + info.precision);
    r.lines.push_back("bits       " + std::to_string(info.bit_length));
    r.lines.push_back("length     " + std::to_string(info.output_length));
    r.lines.push_back("max        " + encode(kMaxInstant) + " " +
                      format_utc(static_cast<int64_t>(kMaxInstant)));
    r.lines.push_back("features   " + features.str());
    return r;
}

} // namespace tsid
