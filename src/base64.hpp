#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tsid {
namespace b64 {

// RFC 4648 Base64 helpers (OpenSSL). Standard alphabet with '=' padding.
// The token codec does not go through these; they back the `inspect`
// command's cross-check and serve as the reference in tests.
std::string encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> decode(const std::string& s);

// '+' -> '-', '/' -> '_', padding dropped.
std::string to_url_safe(std::string s);
// '-' -> '+', '_' -> '/', padding restored to a multiple of 4.
std::string from_url_safe(std::string s);

} // namespace b64
} // namespace tsid
