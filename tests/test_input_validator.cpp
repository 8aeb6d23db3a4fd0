#include <gtest/gtest.h>
#include "input_validator.hpp"
#include <vector>
#include <string>

using namespace powgate;

TEST(InputValidatorTest, ValidHex) {
    EXPECT_TRUE(InputValidator::is_valid_hex("abcdef0123456789"));
    EXPECT_TRUE(InputValidator::is_valid_hex("ABCDEF"));
    EXPECT_FALSE(InputValidator::is_valid_hex("ghijk"));
    EXPECT_FALSE(InputValidator::is_valid_hex(""));
}

TEST(InputValidatorTest, ValidHexWithLength) {
    EXPECT_TRUE(InputValidator::is_valid_hex("abcd", 4));
    EXPECT_FALSE(InputValidator::is_valid_hex("abcd", 5));
    EXPECT_FALSE(InputValidator::is_valid_hex("abcde", 4));
}

TEST(InputValidatorTest, ValidHash) {
    std::string valid_hash(64, 'a');
    std::string invalid_hash(63, 'a');
    EXPECT_TRUE(InputValidator::is_valid_hash(valid_hash));
    EXPECT_FALSE(InputValidator::is_valid_hash(invalid_hash));
    EXPECT_FALSE(InputValidator::is_valid_hash(valid_hash + "g"));
}

TEST(InputValidatorTest, ValidChallenge) {
    EXPECT_TRUE(InputValidator::is_valid_challenge("abc123"));
    EXPECT_TRUE(InputValidator::is_valid_challenge(std::string(256, 'f')));
    EXPECT_FALSE(InputValidator::is_valid_challenge(std::string(257, 'f')));
    EXPECT_FALSE(InputValidator::is_valid_challenge(""));
    EXPECT_TRUE(InputValidator::is_valid_challenge("abc|123"));
    EXPECT_TRUE(InputValidator::is_valid_challenge("abc:123"));
    EXPECT_TRUE(InputValidator::is_valid_challenge("abc 123"));
    EXPECT_TRUE(InputValidator::is_valid_challenge("abc\n"));
}

TEST(InputValidatorTest, ParseDecimal) {
    EXPECT_EQ(InputValidator::parse_decimal_u64("0"), 0u);
    EXPECT_EQ(InputValidator::parse_decimal_u64("193903"), 193903u);
    EXPECT_EQ(InputValidator::parse_decimal_u64("18446744073709551615"), UINT64_MAX);

    EXPECT_FALSE(InputValidator::parse_decimal_u64("18446744073709551616").has_value());
    EXPECT_FALSE(InputValidator::parse_decimal_u64("").has_value());
    EXPECT_FALSE(InputValidator::parse_decimal_u64("007").has_value());
    EXPECT_FALSE(InputValidator::parse_decimal_u64("-1").has_value());
    EXPECT_FALSE(InputValidator::parse_decimal_u64("+1").has_value());
    EXPECT_FALSE(InputValidator::parse_decimal_u64(" 1").has_value());
    EXPECT_FALSE(InputValidator::parse_decimal_u64("1e3").has_value());
    EXPECT_FALSE(InputValidator::parse_decimal_u64("1,000").has_value());
}

TEST(InputValidatorTest, WithinSizeLimit) {
    EXPECT_TRUE(InputValidator::is_within_size_limit(100, 200));
    EXPECT_TRUE(InputValidator::is_within_size_limit(200, 200));
    EXPECT_FALSE(InputValidator::is_within_size_limit(201, 200));
}

TEST(InputValidatorTest, SafeParseJson) {
    std::string json_str = "{\"challenge\": \"abc123\", \"nonce\": 193903}";
    auto val = InputValidator::safe_parse_json(json_str);
    EXPECT_TRUE(val.is_object());
    EXPECT_EQ(val.as_object()["challenge"].as_string(), "abc123");
    EXPECT_EQ(val.as_object()["nonce"].as_int64(), 193903);
}

TEST(InputValidatorTest, SafeParseJsonInvalid) {
    EXPECT_THROW(InputValidator::safe_parse_json("{invalid}"), boost::system::system_error);
}

TEST(InputValidatorTest, SafeParseJsonDepthLimit) {
    std::string deep = std::string(64, '[') + std::string(64, ']');
    EXPECT_THROW(InputValidator::safe_parse_json(deep), boost::system::system_error);
}
