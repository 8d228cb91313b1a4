#include "codec.hpp"

#include "util.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <string>

namespace tsid {

namespace {

constexpr int8_t kInvalid = -1;

using DecodeTable = std::array<int8_t, 256>;

constexpr DecodeTable make_decode_table() {
    DecodeTable t{};
    for (size_t i = 0; i < t.size(); ++i) t[i] = kInvalid;
    for (size_t i = 0; i < 64; ++i) {
        t[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return t;
}

constexpr DecodeTable kDecode = make_decode_table();

inline int symbol_value(char c) {
    return kDecode[static_cast<unsigned char>(c)];
}

// Steps shared by decode() and is_valid_token(). Returns Errc::ok and leaves
// err untouched for well-formed input.
Errc check_token(std::string_view token, Error* err) {
    if (token.size() != kTokenLength) {
        if (err) {
            *err = make_error(Errc::invalid_length,
                              "invalid token length: " + std::to_string(token.size()) +
                                  ", expected " + std::to_string(kTokenLength),
                              token.size());
        }
        return Errc::invalid_length;
    }
    for (size_t i = 0; i < token.size(); ++i) {
        if (symbol_value(token[i]) == kInvalid) {
            if (err) {
                const unsigned char c = static_cast<unsigned char>(token[i]);
                std::string sym = std::isprint(c)
                                      ? std::string(1, token[i])
                                      : "\\x" + to_hex({c});
                *err = make_error(Errc::invalid_format,
                                  "invalid Base64URL symbol '" + sym + "' at offset " +
                                      std::to_string(i));
            }
            return Errc::invalid_format;
        }
    }
    return Errc::ok;
}

} // namespace

std::vector<uint8_t> instant_bytes(Instant instant) {
    std::vector<uint8_t> out(kInstantBytes);
    for (size_t i = 0; i < kInstantBytes; ++i) {
        out[i] = static_cast<uint8_t>((instant >> (8 * (kInstantBytes - 1 - i))) & 0xFF);
    }
    return out;
}

std::string encode(Instant instant) {
    const std::vector<uint8_t> bytes = instant_bytes(instant & kMaxInstant);

    std::string out;
    out.reserve(kTokenLength);
    for (size_t g = 0; g < kInstantBytes; g += 3) {
        uint32_t group = (static_cast<uint32_t>(bytes[g]) << 16) |
                         (static_cast<uint32_t>(bytes[g+1]) << 8) |
                         static_cast<uint32_t>(bytes[g+2]);
        out.push_back(kAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kAlphabet[(group >> 12) & 0x3F]);
        out.push_back(kAlphabet[(group >> 6) & 0x3F]);
        out.push_back(kAlphabet[group & 0x3F]);
    }
    return out;
}

std::string encode_fast(Instant instant) {
    char buf[kTokenLength];
    buf[0] = kAlphabet[(instant >> 42) & 0x3F];
    buf[1] = kAlphabet[(instant >> 36) & 0x3F];
    buf[2] = kAlphabet[(instant >> 30) & 0x3F];
    buf[3] = kAlphabet[(instant >> 24) & 0x3F];
    buf[4] = kAlphabet[(instant >> 18) & 0x3F];
    buf[5] = kAlphabet[(instant >> 12) & 0x3F];
    buf[6] = kAlphabet[(instant >> 6) & 0x3F];
    buf[7] = kAlphabet[instant & 0x3F];
    return std::string(buf, kTokenLength);
}

Result<Instant> decode(std::string_view token) {
    Error err;
    if (check_token(token, &err) != Errc::ok) return err;

    uint8_t bytes[kInstantBytes];
    for (size_t g = 0; g < 2; ++g) {
        const char* s = token.data() + 4 * g;
        uint32_t group = (static_cast<uint32_t>(symbol_value(s[0])) << 18) |
                         (static_cast<uint32_t>(symbol_value(s[1])) << 12) |
                         (static_cast<uint32_t>(symbol_value(s[2])) << 6) |
                         static_cast<uint32_t>(symbol_value(s[3]));
        bytes[3*g] = static_cast<uint8_t>((group >> 16) & 0xFF);
        bytes[3*g+1] = static_cast<uint8_t>((group >> 8) & 0xFF);
        bytes[3*g+2] = static_cast<uint8_t>(group & 0xFF);
    }

    Instant v = 0;
    for (size_t i = 0; i < kInstantBytes; ++i) v = (v << 8) | bytes[i];
    return v;
}

Result<Instant> decode(const char* token) {
    if (token == nullptr) {
        return make_error(Errc::type_mismatch, "encoded token must be a string, got null");
    }
    return decode(std::string_view(token));
}

bool is_valid_token(std::string_view text) {
    return check_token(text, nullptr) == Errc::ok;
}

bool is_valid_token(const char* text) {
    return text != nullptr && is_valid_token(std::string_view(text));
}

int compare_tokens(std::string_view a, std::string_view b) {
    const size_t n = a.size() < b.size() ? a.size() : b.size();
    for (size_t i = 0; i < n; ++i) {
        // Symbols outside the alphabet sort after every valid one.
        int va = symbol_value(a[i]);
        int vb = symbol_value(b[i]);
        if (va == kInvalid) va = 64 + static_cast<unsigned char>(a[i]);
        if (vb == kInvalid) vb = 64 + static_cast<unsigned char>(b[i]);
        if (va != vb) return va < vb ? -1 : 1;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

} // namespace tsid
