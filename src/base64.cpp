#include "base64.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

namespace tsid {
namespace b64 {

std::string encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    // Base64 length is 4*ceil(n/3)
    std::string out;
    out.resize(4 * ((data.size() + 2) / 3));
    int n = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(&out[0]),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size()));
    if (n < 0) throw std::runtime_error("EVP_EncodeBlock failed");
    out.resize(static_cast<size_t>(n));
    return out;
}

std::vector<uint8_t> decode(const std::string& s) {
    if (s.empty()) return {};
    if (s.size() % 4 != 0) throw std::runtime_error("base64 input length not a multiple of 4");
    std::vector<uint8_t> out;
    out.resize(3 * (s.size() / 4));

    int n = EVP_DecodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(s.data()),
        static_cast<int>(s.size()));
    if (n < 0) throw std::runtime_error("EVP_DecodeBlock failed");

    // EVP_DecodeBlock counts '=' padding as zero bytes.
    size_t pad = 0;
    if (s.back() == '=') pad++;
    if (s.size() >= 2 && s[s.size()-2] == '=') pad++;

    size_t real = static_cast<size_t>(n);
    if (real >= pad) real -= pad;
    out.resize(real);
    return out;
}

std::string to_url_safe(std::string s) {
    std::replace(s.begin(), s.end(), '+', '-');
    std::replace(s.begin(), s.end(), '/', '_');
    while (!s.empty() && s.back() == '=') s.pop_back();
    return s;
}

std::string from_url_safe(std::string s) {
    std::replace(s.begin(), s.end(), '-', '+');
    std::replace(s.begin(), s.end(), '_', '/');
    while (s.size() % 4 != 0) s.push_back('=');
    return s;
}

} // namespace b64
} // namespace tsid
