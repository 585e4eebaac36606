#include <gtest/gtest.h>
#include "core/Version.hpp"

using namespace fmodpp;

TEST(VersionTest, DecodesHexDigitsAsDecimal) {
    Version version = Version::from_raw(0x00020222);
    EXPECT_EQ(version.product, 2);
    EXPECT_EQ(version.major, 2);
    EXPECT_EQ(version.minor, 22);
    EXPECT_EQ(version.to_string(), "2.02.22");
}

TEST(VersionTest, EncodesBackToThePackedForm) {
    Version version{2, 3, 9};
    EXPECT_EQ(version.into_raw(), 0x00020309u);
}

TEST(VersionTest, CompatibilityIgnoresMinor) {
    Version a = Version::from_raw(0x00020222);
    Version b = Version::from_raw(0x00020210);
    Version c = Version::from_raw(0x00020301);
    EXPECT_TRUE(a.is_compatible_with(b));
    EXPECT_FALSE(a.is_compatible_with(c));
    EXPECT_LT(b, a);
    EXPECT_LT(a, c);
}

TEST(VersionTest, HeaderVersionMatchesTheHeaders) {
    static_assert(HEADER_VERSION.into_raw() == FMOD_VERSION);
    EXPECT_TRUE(HEADER_VERSION.is_compatible_with(Version::from_raw(FMOD_VERSION)));
}
