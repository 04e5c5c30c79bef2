#include <gtest/gtest.h>
#include <urival/uri/normalizers.h>

using namespace urival::uri;

TEST(NormalizeScheme, Lowercases) {
    EXPECT_EQ(normalize_scheme("HTTP"), "http");
    EXPECT_EQ(normalize_scheme("Svn+SSH"), "svn+ssh");
    EXPECT_EQ(normalize_scheme(""), "");
}

TEST(NormalizeHost, LowercasesRegName) {
    EXPECT_EQ(normalize_host("GitHub.COM"), "github.com");
    EXPECT_EQ(normalize_host("127.0.0.1"), "127.0.0.1");
}

TEST(NormalizeHost, LowercasesIPv6Literal) {
    EXPECT_EQ(normalize_host("[FE80::ABCD]"), "[fe80::abcd]");
}

TEST(NormalizeHost, ZoneIdKeepsCase) {
    EXPECT_EQ(normalize_host("[FE80::1%25Eth0]"), "[fe80::1%25Eth0]");
}

TEST(NormalizeHost, BarePercentZoneDelimiterIsEncoded) {
    EXPECT_EQ(normalize_host("[FE80::1%Eth0]"), "[fe80::1%25Eth0]");
}

TEST(NormalizeHost, EmptyZoneIsNotDoubleEncoded) {
    EXPECT_EQ(normalize_host("[FE80::1%25]"), "[fe80::1%25]");
}

TEST(ToLowerAscii, LeavesNonAsciiBytesAlone) {
    EXPECT_EQ(to_lower_ascii("ABC-xyz"), "abc-xyz");
    EXPECT_EQ(to_lower_ascii("\xC3\x89"), "\xC3\x89");
}

TEST(NormalizePort, ParsesDecimalPorts) {
    EXPECT_EQ(normalize_port("0"), 0);
    EXPECT_EQ(normalize_port("80"), 80);
    EXPECT_EQ(normalize_port("00443"), 443);
    EXPECT_EQ(normalize_port("65535"), 65535);
}

TEST(NormalizePort, RejectsOutOfRangeAndGarbage) {
    EXPECT_EQ(normalize_port("65536"), std::nullopt);
    EXPECT_EQ(normalize_port("99999"), std::nullopt);
    EXPECT_EQ(normalize_port("123456"), std::nullopt);
    EXPECT_EQ(normalize_port(""), std::nullopt);
    EXPECT_EQ(normalize_port("-1"), std::nullopt);
    EXPECT_EQ(normalize_port("8o"), std::nullopt);
}
