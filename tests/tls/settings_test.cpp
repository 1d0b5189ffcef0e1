#include <gtest/gtest.h>
#include <casket/utils/exception.hpp>
#include <tlsh/tls/settings.hpp>

using namespace tlsh::tls;
using namespace tlsh::crypto;

TEST(ClientSettingsTest, Defaults)
{
    ClientSettings settings;
    ASSERT_FALSE(settings.getCipherSuites().empty());
    ASSERT_FALSE(settings.getGroups().empty());
    ASSERT_FALSE(settings.getSignatureSchemes().empty());
    ASSERT_TRUE(settings.getServerName().empty());
    ASSERT_EQ(settings.getMaxHandshakeMessageSize(), static_cast<size_t>(MAX_HANDSHAKE_MESSAGE_SIZE));
    ASSERT_EQ(settings.getCertVerifier(), nullptr);
}

TEST(ClientSettingsTest, SetCipherList)
{
    ClientSettings settings;
    settings.setCipherList("TLS_RSA_WITH_AES_128_CBC_SHA:TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256:"
                           "TLS_RSA_WITH_AES_128_CBC_SHA");

    const auto& suites = settings.getCipherSuites();
    ASSERT_EQ(suites.size(), 2U);
    ASSERT_EQ(suites[0]->id, 0x002F);
    ASSERT_EQ(suites[1]->id, 0xC02F);
}

TEST(ClientSettingsTest, UnknownCipherName)
{
    ClientSettings settings;
    ASSERT_THROW(settings.setCipherList("TLS_RSA_WITH_AES_128_CBC_SHA:TLS_NULL_WITH_NULL_NULL"),
                 casket::RuntimeError);
    ASSERT_THROW(settings.setCipherSuites({}), casket::RuntimeError);
}

TEST(ClientSettingsTest, InvalidParameters)
{
    ClientSettings settings;
    ASSERT_THROW(settings.setGroups({GroupParams(static_cast<uint16_t>(0x0100))}), casket::RuntimeError);
    ASSERT_THROW(settings.setSignatureSchemes({}), casket::RuntimeError);
    ASSERT_THROW(settings.setReadTimeout(std::chrono::milliseconds(0)), casket::RuntimeError);
    ASSERT_THROW(settings.setMaxReadSize(0), casket::RuntimeError);
    ASSERT_THROW(settings.setMaxHandshakeMessageSize(2), casket::RuntimeError);
}

TEST(ClientSettingsTest, Chaining)
{
    ClientSettings settings;
    settings.setServerName("example.com").setReadTimeout(std::chrono::seconds(3)).setExtendedMasterSecret(false);

    ASSERT_EQ(settings.getServerName(), "example.com");
    ASSERT_EQ(settings.getReadTimeout(), std::chrono::milliseconds(3000));
}
