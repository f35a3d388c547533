#include <gtest/gtest.h>

#include "token/json_codec.hpp"

#include <string>
#include <vector>

using namespace keyring::token;
using namespace keyring::token::detail;

// =============================================================================
// Encoding
// =============================================================================

TEST(JsonCodecTest, QuoteEscapes) {
    EXPECT_EQ(jsonQuote("plain"), "\"plain\"");
    EXPECT_EQ(jsonQuote("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(jsonQuote("line\nbreak\ttab"), "\"line\\nbreak\\ttab\"");
    EXPECT_EQ(jsonQuote(std::string(1, '\x01')), "\"\\u0001\"");
}

TEST(JsonCodecTest, EncodeValues) {
    EXPECT_EQ(encodeClaimValue(nullptr), "null");
    EXPECT_EQ(encodeClaimValue(true), "true");
    EXPECT_EQ(encodeClaimValue(int64_t{-42}), "-42");
    EXPECT_EQ(encodeClaimValue(1.5), "1.5");
    EXPECT_EQ(encodeClaimValue(std::string("x")), "\"x\"");
    EXPECT_EQ(encodeClaimValue(std::vector<std::string>{"a", "b"}), "[\"a\",\"b\"]");
    EXPECT_EQ(encodeClaimValue(std::vector<std::string>{}), "[]");
}

TEST(JsonCodecTest, EncodeClaimsInKeyOrder) {
    Claims claims;
    claims["sub"] = std::string("user-1");
    claims["exp"] = int64_t{100};
    claims["admin"] = false;
    EXPECT_EQ(encodeClaims(claims), R"({"admin":false,"exp":100,"sub":"user-1"})");
    EXPECT_EQ(encodeClaims(Claims{}), "{}");
}

// =============================================================================
// Decoding
// =============================================================================

TEST(JsonCodecTest, DecodeFlatObject) {
    auto claims = decodeClaims(
        R"( { "sub" : "u", "n": 7, "f": 2.25, "ok": true, "no": null, "aud": ["a","b"] } )");
    ASSERT_TRUE(claims.has_value());
    EXPECT_EQ(claimString(*claims, "sub"), "u");
    EXPECT_EQ(claimInt(*claims, "n"), 7);
    EXPECT_DOUBLE_EQ(std::get<double>(claims->at("f")), 2.25);
    EXPECT_TRUE(std::get<bool>(claims->at("ok")));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(claims->at("no")));
    EXPECT_EQ(std::get<std::vector<std::string>>(claims->at("aud")),
              (std::vector<std::string>{"a", "b"}));
}

TEST(JsonCodecTest, DecodeEscapes) {
    auto claims = decodeClaims(R"({"s":"a\"b\\c\/d\n\u00e9\ud83d\ude00"})");
    ASSERT_TRUE(claims.has_value());
    EXPECT_EQ(claimString(*claims, "s"), "a\"b\\c/d\n\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(JsonCodecTest, EncodedClaimsDecode) {
    Claims claims;
    claims["sub"] = std::string("quote\" and \\ slash");
    claims["iat"] = int64_t{1'700'000'000};
    claims["roles"] = std::vector<std::string>{"admin"};
    auto decoded = decodeClaims(encodeClaims(claims));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, claims);
}

TEST(JsonCodecTest, RejectsInvalidInput) {
    EXPECT_FALSE(decodeClaims("").has_value());
    EXPECT_FALSE(decodeClaims("[]").has_value());
    EXPECT_FALSE(decodeClaims("{").has_value());
    EXPECT_FALSE(decodeClaims(R"({"a":1,})").has_value());
    EXPECT_FALSE(decodeClaims(R"({"a":1} trailing)").has_value());
    EXPECT_FALSE(decodeClaims(R"({"a":tru})").has_value());
    EXPECT_FALSE(decodeClaims(R"({a:1})").has_value());
    EXPECT_FALSE(decodeClaims(R"({"a":"\q"})").has_value());
    EXPECT_FALSE(decodeClaims(R"({"a":"\udc00"})").has_value());
    EXPECT_FALSE(decodeClaims("{\"a\":\"raw\ncontrol\"}").has_value());
}

TEST(JsonCodecTest, RejectsDuplicateMembers) {
    EXPECT_FALSE(decodeClaims(R"({"alg":"RS256","alg":"none"})").has_value());
}

TEST(JsonCodecTest, RejectsNestedStructures) {
    EXPECT_FALSE(decodeClaims(R"({"a":{"b":1}})").has_value());
    EXPECT_FALSE(decodeClaims(R"({"a":[1,2]})").has_value());
    EXPECT_FALSE(decodeClaims(R"({"a":[["x"]]})").has_value());
}

TEST(JsonCodecTest, LargeIntegersBecomeDoubles) {
    auto claims = decodeClaims(R"({"big":123456789012345678901234567890})");
    ASSERT_TRUE(claims.has_value());
    EXPECT_TRUE(std::holds_alternative<double>(claims->at("big")));
    EXPECT_FALSE(claimInt(*claims, "big").has_value());
}
