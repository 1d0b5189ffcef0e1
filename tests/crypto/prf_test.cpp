#include <algorithm>
#include <stdexcept>
#include <string>
#include <gtest/gtest.h>
#include <openssl/evp.h>
#include <tlsh/crypto/prf.hpp>

using namespace tlsh::crypto;

namespace
{

std::vector<uint8_t> Hmac(const char* digest, const std::vector<uint8_t>& key, const std::vector<uint8_t>& data)
{
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    size_t length{0};
    if (!EVP_Q_mac(nullptr, "HMAC", nullptr, digest, nullptr, key.data(), key.size(), data.data(), data.size(),
                   out.data(), out.size(), &length))
    {
        throw std::runtime_error("HMAC failed");
    }
    out.resize(length);
    return out;
}

/// P_hash written out as in RFC 5246 section 5.
std::vector<uint8_t> ReferencePrf(const char* digest, const std::vector<uint8_t>& secret, const std::string& label,
                                  const std::vector<uint8_t>& seed, size_t length)
{
    std::vector<uint8_t> labelSeed(label.begin(), label.end());
    labelSeed.insert(labelSeed.end(), seed.begin(), seed.end());

    std::vector<uint8_t> result;
    std::vector<uint8_t> a = labelSeed;
    while (result.size() < length)
    {
        a = Hmac(digest, secret, a);
        std::vector<uint8_t> input = a;
        input.insert(input.end(), labelSeed.begin(), labelSeed.end());
        auto chunk = Hmac(digest, secret, input);
        result.insert(result.end(), chunk.begin(), chunk.end());
    }
    result.resize(length);
    return result;
}

} // namespace

class PrfTest : public ::testing::Test
{
protected:
    const std::vector<uint8_t> secret_ = {0x9b, 0xbe, 0x43, 0x6b, 0xa9, 0x40, 0xf0, 0x17,
                                          0xb1, 0x76, 0x52, 0x84, 0x9a, 0x71, 0xdb, 0x35};
    const std::vector<uint8_t> seed_ = {0xa0, 0xba, 0x9f, 0x93, 0x6c, 0xda, 0x31, 0x18,
                                        0x27, 0xa6, 0xf7, 0x96, 0xff, 0xd5, 0x19, 0x8c};
};

TEST_F(PrfTest, Sha256KnownAnswer)
{
    std::vector<uint8_t> out(100);
    ASSERT_NO_THROW(tls1Prf("SHA256", secret_, "test label", seed_, {}, out));

    const std::vector<uint8_t> prefix = {0xe3, 0xf2, 0x29, 0xba};
    ASSERT_TRUE(std::equal(prefix.begin(), prefix.end(), out.begin()));
    ASSERT_EQ(out, ReferencePrf("SHA256", secret_, "test label", seed_, out.size()));
}

TEST_F(PrfTest, Sha384MatchesReference)
{
    std::vector<uint8_t> out(148);
    ASSERT_NO_THROW(tls1Prf("SHA384", secret_, "test label", seed_, {}, out));
    ASSERT_EQ(out, ReferencePrf("SHA384", secret_, "test label", seed_, out.size()));
}

TEST_F(PrfTest, SplitSeed)
{
    std::vector<uint8_t> seedA(seed_.begin(), seed_.begin() + 5);
    std::vector<uint8_t> seedB(seed_.begin() + 5, seed_.end());

    std::vector<uint8_t> whole(48);
    std::vector<uint8_t> split(48);
    tls1Prf("SHA256", secret_, "master secret", seed_, {}, whole);
    tls1Prf("SHA256", secret_, "master secret", seedA, seedB, split);
    ASSERT_EQ(whole, split);
}

TEST_F(PrfTest, LabelChangesOutput)
{
    std::vector<uint8_t> client(12);
    std::vector<uint8_t> server(12);
    tls1Prf("SHA256", secret_, "client finished", seed_, {}, client);
    tls1Prf("SHA256", secret_, "server finished", seed_, {}, server);
    ASSERT_NE(client, server);
}
