#include <functional>
#include <gtest/gtest.h>

#include <tlsh/tls/extensions.hpp>
#include <tlsh/tls/exception.hpp>

using namespace tlsh::tls;
using namespace tlsh::crypto;

namespace
{

Error CatchError(const std::function<void()>& func)
{
    try
    {
        func();
    }
    catch (const Exception& e)
    {
        return e.error();
    }
    return Error::None;
}

} // namespace

TEST(ServerNameIndicatorTest, ClientSerialization)
{
    std::vector<uint8_t> buffer(64);
    ServerNameIndicator sni("example.com");

    size_t written = sni.serialize(Side::Client, buffer);
    ASSERT_EQ(written, 2 + 1 + 2 + 11);
    buffer.resize(written);

    std::vector<uint8_t> expected = {0x00, 0x0E, 0x00, 0x00, 0x0B, 'e', 'x', 'a', 'm', 'p', 'l', 'e', '.', 'c', 'o', 'm'};
    ASSERT_EQ(buffer, expected);

    ServerNameIndicator parsed(Side::Client, buffer);
    ASSERT_EQ(parsed.getHostname(), "example.com");
}

TEST(ServerNameIndicatorTest, ServerSendsEmptyBody)
{
    std::vector<uint8_t> buffer(64);
    ServerNameIndicator sni("example.com");
    ASSERT_EQ(sni.serialize(Side::Server, buffer), 0U);
    ASSERT_NO_THROW(ServerNameIndicator(Side::Server, {}));

    std::vector<uint8_t> garbage = {0x00};
    ASSERT_EQ(CatchError([&] { ServerNameIndicator(Side::Server, garbage); }), Error::MalformedMessage);
}

TEST(ExtendedMasterSecretTest, EmptyBody)
{
    std::vector<uint8_t> buffer(10);
    ExtendedMasterSecret ems;
    ASSERT_EQ(ems.serialize(Side::Client, buffer), 0U);
    ASSERT_NO_THROW(ExtendedMasterSecret(Side::Server, {}));
}

TEST(ExtendedMasterSecretTest, NonEmptyBody)
{
    std::vector<uint8_t> body = {0x00};
    ASSERT_EQ(CatchError([&] { ExtendedMasterSecret(Side::Server, body); }), Error::MalformedMessage);
}

TEST(RenegotiationExtensionTest, InitialHandshake)
{
    std::vector<uint8_t> buffer(10);
    RenegotiationExtension reneg;
    size_t written = reneg.serialize(Side::Client, buffer);
    ASSERT_EQ(written, 1U);
    ASSERT_EQ(buffer[0], 0x00);

    buffer.resize(written);
    RenegotiationExtension parsed(Side::Server, buffer);
    ASSERT_TRUE(parsed.getRenegInfo().empty());
}

TEST(RenegotiationExtensionTest, BadLength)
{
    std::vector<uint8_t> body = {0x02, 0x01};
    ASSERT_EQ(CatchError([&] { RenegotiationExtension(Side::Server, body); }), Error::MalformedMessage);
}

TEST(SupportedPointFormatsTest, OffersUncompressed)
{
    std::vector<uint8_t> buffer(10);
    SupportedPointFormats formats;
    size_t written = formats.serialize(Side::Client, buffer);
    buffer.resize(written);
    ASSERT_EQ(buffer, std::vector<uint8_t>({0x01, 0x00}));
}

TEST(SupportedPointFormatsTest, ServerWithoutUncompressed)
{
    std::vector<uint8_t> body = {0x01, 0x01};
    ASSERT_EQ(CatchError([&] { SupportedPointFormats(Side::Server, body); }), Error::MalformedMessage);

    std::vector<uint8_t> valid = {0x02, 0x01, 0x00};
    ASSERT_NO_THROW(SupportedPointFormats(Side::Server, valid));
}

TEST(SupportedGroupsTest, Serialization)
{
    std::vector<uint8_t> buffer(16);
    SupportedGroups groups({GroupParams::X25519, GroupParams::SECP256R1});
    size_t written = groups.serialize(Side::Client, buffer);
    buffer.resize(written);
    ASSERT_EQ(buffer, std::vector<uint8_t>({0x00, 0x04, 0x00, 0x1D, 0x00, 0x17}));

    SupportedGroups parsed(Side::Client, buffer);
    ASSERT_EQ(parsed.getGroups().size(), 2U);
    ASSERT_TRUE(parsed.getGroups()[0] == GroupParams(GroupParams::X25519));
}

TEST(ExtensionsTest, RoundTrip)
{
    Extensions extensions;
    extensions.add(std::make_unique<ServerNameIndicator>("localhost"));
    extensions.add(std::make_unique<ExtendedMasterSecret>());
    extensions.add(std::make_unique<RenegotiationExtension>());

    std::vector<uint8_t> buffer(256);
    size_t written = extensions.serialize(Side::Client, buffer);
    buffer.resize(written);

    Extensions parsed(Side::Client, buffer);
    ASSERT_EQ(parsed.size(), 3U);
    ASSERT_TRUE(parsed.has<ExtendedMasterSecret>());
    ASSERT_TRUE(parsed.has<RenegotiationExtension>());
    ASSERT_EQ(parsed.get<ServerNameIndicator>()->getHostname(), "localhost");
    ASSERT_EQ(parsed.all()[0]->type(), ExtensionCode::ServerNameIndication);
}

TEST(ExtensionsTest, DuplicateExtension)
{
    Extensions extensions;
    extensions.add(std::make_unique<ExtendedMasterSecret>());
    ASSERT_EQ(CatchError([&] { extensions.add(std::make_unique<ExtendedMasterSecret>()); }),
              Error::MalformedMessage);

    std::vector<uint8_t> block = {0x00, 0x08, 0x00, 0x17, 0x00, 0x00, 0x00, 0x17, 0x00, 0x00};
    ASSERT_EQ(CatchError([&] { Extensions(Side::Server, block); }), Error::MalformedMessage);
}

TEST(ExtensionsTest, BadBlockLength)
{
    std::vector<uint8_t> block = {0x00, 0x05, 0x00, 0x17, 0x00, 0x00};
    ASSERT_EQ(CatchError([&] { Extensions(Side::Server, block); }), Error::MalformedMessage);
}

TEST(ExtensionsTest, UnknownExtensionIsKept)
{
    std::vector<uint8_t> block = {0x00, 0x06, 0x00, 0x10, 0x00, 0x02, 0xAB, 0xCD};
    Extensions extensions(Side::Server, block);
    ASSERT_EQ(extensions.size(), 1U);

    auto unknown = dynamic_cast<UnknownExtension*>(extensions.get(static_cast<ExtensionCode>(0x0010)));
    ASSERT_NE(unknown, nullptr);
    ASSERT_EQ(unknown->value(), std::vector<uint8_t>({0xAB, 0xCD}));

    ASSERT_TRUE(extensions.containsOtherThan({ExtensionCode::ExtendedMasterSecret}));
}

TEST(ExtensionsTest, ContainsOtherThan)
{
    Extensions extensions;
    extensions.add(std::make_unique<ExtendedMasterSecret>());
    extensions.add(std::make_unique<RenegotiationExtension>());

    ASSERT_FALSE(extensions.containsOtherThan(
        {ExtensionCode::ExtendedMasterSecret, ExtensionCode::SafeRenegotiation, ExtensionCode::ECPointFormats}));
    ASSERT_TRUE(extensions.containsOtherThan({ExtensionCode::SafeRenegotiation}));
}
