#include "base64.hpp"
#include "codec.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace tsid;

TEST(Base64Test, StandardEncodeDecode) {
    std::vector<uint8_t> data = {'h', 'e', 'l', 'l', 'o'};
    EXPECT_EQ(b64::encode(data), "aGVsbG8=");
    EXPECT_EQ(b64::decode("aGVsbG8="), data);
    EXPECT_EQ(b64::encode({}), "");
    EXPECT_TRUE(b64::decode("").empty());
}

TEST(Base64Test, DecodeRejectsRaggedInput) {
    EXPECT_THROW(b64::decode("abc"), std::runtime_error);
}

TEST(Base64Test, UrlSafeTranslation) {
    EXPECT_EQ(b64::to_url_safe("ab+/cd=="), "ab-_cd");
    EXPECT_EQ(b64::from_url_safe("ab-_cd"), "ab+/cd==");
    EXPECT_EQ(b64::from_url_safe("AAAAAAAA"), "AAAAAAAA");
}

// The token codec must agree with OpenSSL's RFC 4648 encoder once the
// URL-safe substitutions are applied.
TEST(Base64Test, TokenCodecMatchesOpenSsl) {
    uint64_t x = 0xDEADBEEFull;
    for (int i = 0; i < 1000; ++i) {
        x = x * 6364136223846793005ull + 1442695040888963407ull;
        Instant v = x >> 16;
        std::string ref = b64::to_url_safe(b64::encode(instant_bytes(v)));
        ASSERT_EQ(ref.size(), kTokenLength);
        EXPECT_EQ(encode(v), ref);
        EXPECT_EQ(b64::decode(b64::from_url_safe(encode(v))), instant_bytes(v));
    }
    EXPECT_EQ(b64::encode(instant_bytes(kMaxInstant)), "////////");
}
