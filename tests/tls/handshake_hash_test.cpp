#include <gtest/gtest.h>
#include <openssl/evp.h>
#include <tlsh/tls/handshake_hash.hpp>
#include <tlsh/crypto/hash_traits.hpp>
#include <tlsh/crypto/crypto_manager.hpp>

using namespace tlsh::tls;
using namespace tlsh::crypto;

class HandshakeHashTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        hashCtx = HashTraits::createContext();
    }

    HandshakeHash hash;
    HashCtxPtr hashCtx;
};

TEST_F(HandshakeHashTest, DefaultConstructor)
{
    ASSERT_TRUE(hash.getContents().empty());
}

TEST_F(HandshakeHashTest, UpdateKeepsOrder)
{
    std::vector<uint8_t> first = {0x01, 0x02, 0x03};
    std::vector<uint8_t> second = {0x04, 0x05};
    hash.update(first);
    hash.update(second);
    ASSERT_EQ(hash.getContents(), std::vector<uint8_t>({0x01, 0x02, 0x03, 0x04, 0x05}));
}

TEST_F(HandshakeHashTest, FinalMatchesDigest)
{
    std::vector<uint8_t> data = {'a', 'b', 'c'};
    hash.update(data);

    auto sha256 = CryptoManager::getInstance().fetchDigest(SN_sha256);
    std::array<uint8_t, EVP_MAX_MD_SIZE> buffer;
    auto result = hash.final(hashCtx, sha256, buffer);
    ASSERT_EQ(result.size(), 32U);

    std::array<uint8_t, EVP_MAX_MD_SIZE> expected;
    unsigned int length{0};
    ASSERT_TRUE(EVP_Digest(data.data(), data.size(), expected.data(), &length, EVP_sha256(), nullptr));
    ASSERT_TRUE(std::equal(result.begin(), result.end(), expected.begin()));
}

TEST_F(HandshakeHashTest, FinalDoesNotConsumeTranscript)
{
    std::vector<uint8_t> data = {0x10, 0x20};
    hash.update(data);

    auto sha384 = CryptoManager::getInstance().fetchDigest(SN_sha384);
    std::array<uint8_t, EVP_MAX_MD_SIZE> buffer1;
    std::array<uint8_t, EVP_MAX_MD_SIZE> buffer2;
    auto first = hash.final(hashCtx, sha384, buffer1);
    auto second = hash.final(hashCtx, sha384, buffer2);

    ASSERT_EQ(first.size(), 48U);
    ASSERT_TRUE(std::equal(first.begin(), first.end(), second.begin()));
    ASSERT_EQ(hash.getContents(), data);
}

TEST_F(HandshakeHashTest, Reset)
{
    std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    hash.update(data);
    hash.reset();
    ASSERT_TRUE(hash.getContents().empty());
}
