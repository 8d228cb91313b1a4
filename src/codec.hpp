#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "clock.hpp"
#include "error.hpp"

namespace tsid {

// Token codec: a 48-bit instant as 6 big-endian bytes, written with the
// RFC 4648 URL-safe alphabet without padding (6 bytes -> 8 symbols).
static constexpr size_t kTokenLength = 8;
static constexpr size_t kInstantBytes = 6;

// Index order is part of the format.
static constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

// Big-endian payload, byte 0 = bits 47..40.
std::vector<uint8_t> instant_bytes(Instant instant);

// Bits above 47 are ignored.
std::string encode(Instant instant);

// Same output as encode(); slices the 48-bit word directly instead of going
// through the byte groups.
std::string encode_fast(Instant instant);

// Validates (text, length, alphabet) before decoding; never returns a
// partial value.
Result<Instant> decode(std::string_view token);
Result<Instant> decode(const char* token);

bool is_valid_token(std::string_view text);
bool is_valid_token(const char* text);

// Orders valid tokens by alphabet index, which is chronological order.
// Byte-wise string comparison is not: '0' < 'A' < '_' < 'a' in ASCII.
int compare_tokens(std::string_view a, std::string_view b);

struct TokenLess {
    bool operator()(std::string_view a, std::string_view b) const {
        return compare_tokens(a, b) < 0;
    }
};

} // namespace tsid
