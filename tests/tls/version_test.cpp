#include <gtest/gtest.h>
#include <tlsh/tls/version.hpp>

using namespace tlsh::tls;

TEST(ProtocolVersionTest, DefaultConstructor) {
    ProtocolVersion version;
    ASSERT_EQ(version.majorVersion(), 0);
    ASSERT_EQ(version.minorVersion(), 0);
    ASSERT_EQ(version.code(), 0);
}

TEST(ProtocolVersionTest, ConstructorFromCode) {
    ProtocolVersion version(0x0301);
    ASSERT_EQ(version.majorVersion(), 3);
    ASSERT_EQ(version.minorVersion(), 1);
    ASSERT_EQ(version, ProtocolVersion::TLSv1_0);
}

TEST(ProtocolVersionTest, ConstructorFromMajorMinor) {
    ProtocolVersion version(3, 3);
    ASSERT_EQ(version.code(), 0x0303);
    ASSERT_EQ(version, ProtocolVersion::TLSv1_2);
}

TEST(ProtocolVersionTest, ToString) {
    ASSERT_EQ(ProtocolVersion(ProtocolVersion::SSLv3_0).toString(), "SSLv3.0");
    ASSERT_EQ(ProtocolVersion(ProtocolVersion::TLSv1_2).toString(), "TLSv1.2");
    ASSERT_EQ(ProtocolVersion(2, 0).toString(), "Unknown version 2.0");
}

TEST(ProtocolVersionTest, Comparison) {
    ProtocolVersion version1(3, 3);
    ProtocolVersion version2(3, 1);
    ASSERT_TRUE(version1 != version2);
    ASSERT_TRUE(version2 < version1);
    ASSERT_FALSE(version1 < version2);
}
