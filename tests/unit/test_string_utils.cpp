#include <gtest/gtest.h>

#include "utils/string_utils.h"

using namespace nvmestas::engine::utils;

TEST(StringUtils, TrimCopy) {
    EXPECT_EQ(trim_copy("  tcp \t\r\n"), "tcp");
    EXPECT_EQ(trim_copy(" \t "), "");
    EXPECT_EQ(trim_copy("a b"), "a b");
}

TEST(StringUtils, Lowercase) {
    EXPECT_EQ(lowercase_copy("TCP"), "tcp");
    std::string text = "RdMa";
    lowercase_in_place(text);
    EXPECT_EQ(text, "rdma");
}

TEST(StringUtils, SplitTrimmedDropsEmptyTokens) {
    auto parts = split_trimmed(" transport=tcp ; traddr=10.0.0.1;; ", ';');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "transport=tcp");
    EXPECT_EQ(parts[1], "traddr=10.0.0.1");
}

TEST(StringUtils, ParseLong) {
    EXPECT_EQ(parse_long(" 42 "), 42);
    EXPECT_EQ(parse_long("-1"), -1);
    EXPECT_FALSE(parse_long("4x"));
    EXPECT_FALSE(parse_long(""));
}

TEST(StringUtils, ParseBoolAcceptsConfigSpellings) {
    EXPECT_EQ(parse_bool("true"), true);
    EXPECT_EQ(parse_bool("Enabled"), true);
    EXPECT_EQ(parse_bool("on"), true);
    EXPECT_EQ(parse_bool("no"), false);
    EXPECT_EQ(parse_bool("disabled"), false);
    EXPECT_FALSE(parse_bool("maybe"));
}

TEST(StringUtils, ParseHex) {
    EXPECT_EQ(parse_hex("0x70f002"), 0x70f002ul);
    EXPECT_EQ(parse_hex("70F002"), 0x70f002ul);
    EXPECT_FALSE(parse_hex("0x"));
    EXPECT_FALSE(parse_hex("zz"));
}

TEST(StringUtils, StartsWith) {
    EXPECT_TRUE(starts_with("file:///etc/nvme/hostnqn", "file://"));
    EXPECT_FALSE(starts_with("fi", "file://"));
}
