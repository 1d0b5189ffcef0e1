#include <string>
#include <gtest/gtest.h>
#include <tlsh/crypto/prf.hpp>
#include <tlsh/tls/cipher_suite_manager.hpp>
#include <tlsh/tls/key_schedule.hpp>

using namespace tlsh::tls;
using namespace tlsh::crypto;

namespace
{

template <typename T>
std::vector<uint8_t> ToVector(const T& data)
{
    return std::vector<uint8_t>(data.begin(), data.end());
}

} // namespace

class KeyScheduleTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        premaster_.assign(TLS_PREMASTER_SECRET_SIZE, 0x5A);
        premaster_[0] = 0x03;
        premaster_[1] = 0x03;
        clientRandom_.fill(0xC1);
        serverRandom_.fill(0x5E);
        masterSecret_.assign(TLS_MASTER_SECRET_SIZE, 0x00);
    }

    std::vector<uint8_t> premaster_;
    std::array<uint8_t, TLS_RANDOM_SIZE> clientRandom_;
    std::array<uint8_t, TLS_RANDOM_SIZE> serverRandom_;
    std::vector<uint8_t> masterSecret_;
};

TEST_F(KeyScheduleTest, MasterSecret)
{
    ASSERT_NO_THROW(deriveMasterSecret("SHA256", premaster_, clientRandom_, serverRandom_, masterSecret_));

    std::vector<uint8_t> expected(TLS_MASTER_SECRET_SIZE);
    tls1Prf("SHA256", premaster_, "master secret", clientRandom_, serverRandom_, expected);
    ASSERT_EQ(masterSecret_, expected);

    std::vector<uint8_t> shortBuffer(32);
    ASSERT_ANY_THROW(deriveMasterSecret("SHA256", premaster_, clientRandom_, serverRandom_, shortBuffer));
}

TEST_F(KeyScheduleTest, ExtendedMasterSecret)
{
    std::vector<uint8_t> sessionHash(32, 0xAB);
    std::vector<uint8_t> classic(TLS_MASTER_SECRET_SIZE);

    deriveExtendedMasterSecret("SHA256", premaster_, sessionHash, masterSecret_);
    deriveMasterSecret("SHA256", premaster_, clientRandom_, serverRandom_, classic);
    ASSERT_NE(masterSecret_, classic);

    std::vector<uint8_t> expected(TLS_MASTER_SECRET_SIZE);
    tls1Prf("SHA256", premaster_, "extended master secret", sessionHash, {}, expected);
    ASSERT_EQ(masterSecret_, expected);
}

class KeyBlockTest : public KeyScheduleTest, public ::testing::WithParamInterface<const CipherSuite*>
{
};

TEST_P(KeyBlockTest, SliceOrderAndLengths)
{
    const auto& suite = *GetParam();
    const size_t macLength = suite.macLength;
    const size_t keyLength = suite.keyLength;
    const size_t ivLength = suite.fixedIvLength;

    ASSERT_EQ(suite.keyBlockLength(), 2 * (macLength + keyLength + ivLength));

    deriveMasterSecret(suite.prfDigest, premaster_, clientRandom_, serverRandom_, masterSecret_);

    std::vector<uint8_t> keyBlock(suite.keyBlockLength());
    tls1Prf(suite.prfDigest, masterSecret_, "key expansion", serverRandom_, clientRandom_, keyBlock);

    auto keys = deriveTrafficKeys(suite, masterSecret_, clientRandom_, serverRandom_);

    auto it = keyBlock.begin();
    ASSERT_EQ(ToVector(keys.clientMacKey), std::vector<uint8_t>(it, it + macLength));
    it += macLength;
    ASSERT_EQ(ToVector(keys.serverMacKey), std::vector<uint8_t>(it, it + macLength));
    it += macLength;
    ASSERT_EQ(ToVector(keys.clientEncKey), std::vector<uint8_t>(it, it + keyLength));
    it += keyLength;
    ASSERT_EQ(ToVector(keys.serverEncKey), std::vector<uint8_t>(it, it + keyLength));
    it += keyLength;
    ASSERT_EQ(ToVector(keys.clientIV), std::vector<uint8_t>(it, it + ivLength));
    it += ivLength;
    ASSERT_EQ(ToVector(keys.serverIV), std::vector<uint8_t>(it, it + ivLength));
    it += ivLength;
    ASSERT_TRUE(it == keyBlock.end());

    if (suite.mode == CipherMode::AEAD)
    {
        ASSERT_TRUE(keys.clientMacKey.empty());
    }
    ASSERT_NE(ToVector(keys.clientEncKey), ToVector(keys.serverEncKey));
}

INSTANTIATE_TEST_SUITE_P(AllSuites, KeyBlockTest, ::testing::ValuesIn(CipherSuiteManager::getInstance().getCipherSuites()),
                         [](const ::testing::TestParamInfo<const CipherSuite*>& info)
                         {
                             std::string name(info.param->name);
                             return name.substr(4);
                         });

TEST_F(KeyScheduleTest, FinishedVerifyData)
{
    std::vector<uint8_t> transcriptHash(32, 0x77);
    std::array<uint8_t, TLS_FINISHED_SIZE> client;
    std::array<uint8_t, TLS_FINISHED_SIZE> server;
    std::array<uint8_t, TLS_FINISHED_SIZE> again;

    computeFinishedVerifyData("SHA256", masterSecret_, transcriptHash, Side::Client, client);
    computeFinishedVerifyData("SHA256", masterSecret_, transcriptHash, Side::Server, server);
    computeFinishedVerifyData("SHA256", masterSecret_, transcriptHash, Side::Client, again);

    ASSERT_NE(client, server);
    ASSERT_EQ(client, again);

    transcriptHash[0] ^= 0x01;
    computeFinishedVerifyData("SHA256", masterSecret_, transcriptHash, Side::Client, again);
    ASSERT_NE(client, again);

    std::array<uint8_t, 16> wrongSize;
    ASSERT_ANY_THROW(computeFinishedVerifyData("SHA256", masterSecret_, transcriptHash, Side::Client, wrongSize));
}
