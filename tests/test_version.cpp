#include <gtest/gtest.h>
#include "core/version.hpp"

TEST(VersionTest, EqualVersions) {
    EXPECT_EQ(compare_versions("1.2.3", "1.2.3"), 0);
    EXPECT_EQ(compare_versions("v1.2.3", "1.2.3"), 0);
    EXPECT_EQ(compare_versions("V2.0", "v2.0"), 0);
}

TEST(VersionTest, MissingSegmentsAreZero) {
    EXPECT_EQ(compare_versions("1.2", "1.2.0"), 0);
    EXPECT_EQ(compare_versions("1.2.0.0", "1.2"), 0);
    EXPECT_EQ(compare_versions("1.2.1", "1.2"), 1);
}

TEST(VersionTest, NumericNotLexicographic) {
    EXPECT_EQ(compare_versions("1.10.0", "1.9.0"), 1);
    EXPECT_EQ(compare_versions("1.9.0", "1.10.0"), -1);
    EXPECT_EQ(compare_versions("2.3.0", "2.2.9"), 1);
}

TEST(VersionTest, LeadingZerosIgnored) {
    EXPECT_EQ(compare_versions("1.02", "1.2"), 0);
    EXPECT_EQ(compare_versions("1.010", "1.9"), 1);
}

TEST(VersionTest, HugeSegmentsDoNotOverflow) {
    EXPECT_EQ(compare_versions("1.99999999999999999999", "1.99999999999999999998"), 1);
}

TEST(VersionTest, NonNumericSegmentsCountAsZero) {
    EXPECT_EQ(compare_versions("1.x.3", "1.0.3"), 0);
    EXPECT_EQ(compare_versions("garbage", "0"), 0);
    EXPECT_EQ(compare_versions("", "0.0"), 0);
}

TEST(VersionTest, WhitespaceTrimmed) {
    EXPECT_EQ(compare_versions("  v1.4.0\n", "1.4.0"), 0);
}

TEST(VersionTest, IsNewerVersion) {
    EXPECT_TRUE(is_newer_version("2.2.9", "2.3.0"));
    EXPECT_TRUE(is_newer_version("v1.0.0", "v1.0.1"));
    EXPECT_FALSE(is_newer_version("2.3.0", "2.3.0"));
    EXPECT_FALSE(is_newer_version("2.3.0", "2.2.9"));
}

TEST(VersionTest, StripVersionPrefix) {
    EXPECT_EQ(strip_version_prefix("v2.3.0"), "2.3.0");
    EXPECT_EQ(strip_version_prefix("V1"), "1");
    EXPECT_EQ(strip_version_prefix("2.3.0"), "2.3.0");
    EXPECT_EQ(strip_version_prefix(""), "");
}
