#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/types.hpp>

TEST(Utils, ShellQuotePlain) {
    EXPECT_EQ(shell_quote("/home/ec2-user/tmp.abc/run.sh"), "'/home/ec2-user/tmp.abc/run.sh'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(Utils, ShellQuoteEmbeddedQuote) {
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote("''"), "''\\'''\\'''");
}

TEST(Utils, ShellQuoteLeavesMetacharactersInert) {
    EXPECT_EQ(shell_quote("$HOME; rm -rf /"), "'$HOME; rm -rf /'");
}

TEST(Utils, Base64KnownVectors) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");

    std::string out;
    ASSERT_TRUE(base64_decode("Zm9vYg==", out));
    EXPECT_EQ(out, "foob");
}

TEST(Utils, Base64DecodeBinary) {
    std::string bin("\x00\xff\x10\x00", 4);
    std::string out;
    ASSERT_TRUE(base64_decode(base64_encode(bin), out));
    EXPECT_EQ(out, bin);
}

TEST(Utils, Base64DecodeRejectsMalformed) {
    std::string out;
    EXPECT_FALSE(base64_decode("", out));
    EXPECT_FALSE(base64_decode("Zm9", out));       // not a multiple of 4
    EXPECT_FALSE(base64_decode("Zm9*", out));      // outside alphabet
    EXPECT_FALSE(base64_decode("Z=9v", out));      // padding in the middle
}

TEST(Utils, Trim) {
    std::string s = " \t value\r\n";
    trim(s);
    EXPECT_EQ(s, "value");
    EXPECT_EQ(trimmed("   "), "");
    EXPECT_EQ(trimmed("no-op"), "no-op");
}

TEST(Utils, EndsWith) {
    EXPECT_TRUE(ends_with("model.scad", ".scad"));
    EXPECT_FALSE(ends_with("model.scad.bak", ".scad"));
    EXPECT_FALSE(ends_with("scad", ".scad"));
}

TEST(Utils, SplitWhitespace) {
    auto parts = split_whitespace("  ssh-ed25519\tAAAA  comment ");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "ssh-ed25519");
    EXPECT_EQ(parts[1], "AAAA");
    EXPECT_EQ(parts[2], "comment");
}

TEST(Utils, ErrorKindNames) {
    EXPECT_STREQ(error_kind_name(ErrorKind::InstanceNotUsable), "InstanceNotUsable");
    EXPECT_STREQ(error_kind_name(ErrorKind::ResourceNotFound), "ResourceNotFound");
}
