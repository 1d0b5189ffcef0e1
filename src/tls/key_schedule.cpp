#include <tlsh/tls/key_schedule.hpp>
#include <tlsh/crypto/prf.hpp>
#include <tlsh/utils/data_reader.hpp>

#include <casket/utils/exception.hpp>

namespace tlsh::tls
{

void deriveMasterSecret(std::string_view prfDigest, nonstd::span<const uint8_t> premasterSecret,
                        nonstd::span<const uint8_t> clientRandom, nonstd::span<const uint8_t> serverRandom,
                        nonstd::span<uint8_t> masterSecret)
{
    casket::ThrowIfTrue(masterSecret.size() != TLS_MASTER_SECRET_SIZE, "invalid master secret buffer size");
    crypto::tls1Prf(prfDigest, premasterSecret, "master secret", clientRandom, serverRandom, masterSecret);
}

void deriveExtendedMasterSecret(std::string_view prfDigest, nonstd::span<const uint8_t> premasterSecret,
                                nonstd::span<const uint8_t> sessionHash, nonstd::span<uint8_t> masterSecret)
{
    casket::ThrowIfTrue(masterSecret.size() != TLS_MASTER_SECRET_SIZE, "invalid master secret buffer size");
    crypto::tls1Prf(prfDigest, premasterSecret, "extended master secret", sessionHash, {}, masterSecret);
}

TrafficKeys deriveTrafficKeys(const CipherSuite& suite, nonstd::span<const uint8_t> masterSecret,
                              nonstd::span<const uint8_t> clientRandom, nonstd::span<const uint8_t> serverRandom)
{
    crypto::SecureArray<uint8_t, (TLS_MAX_MAC_LENGTH + TLS_MAX_KEY_LENGTH + TLS_MAX_IV_LENGTH) * 2> keyBlock;
    keyBlock.resize(suite.keyBlockLength());

    crypto::tls1Prf(suite.prfDigest, masterSecret, "key expansion", serverRandom, clientRandom, keyBlock);

    utils::DataReader reader("Key block", keyBlock);
    TrafficKeys keys;

    keys.clientMacKey.assign(reader.get_span_fixed(suite.macLength));
    keys.serverMacKey.assign(reader.get_span_fixed(suite.macLength));
    keys.clientEncKey.assign(reader.get_span_fixed(suite.keyLength));
    keys.serverEncKey.assign(reader.get_span_fixed(suite.keyLength));
    keys.clientIV.assign(reader.get_span_fixed(suite.fixedIvLength));
    keys.serverIV.assign(reader.get_span_fixed(suite.fixedIvLength));

    reader.assert_done();
    return keys;
}

void computeFinishedVerifyData(std::string_view prfDigest, nonstd::span<const uint8_t> masterSecret,
                               nonstd::span<const uint8_t> transcriptHash, Side side,
                               nonstd::span<uint8_t> verifyData)
{
    casket::ThrowIfTrue(verifyData.size() != TLS_FINISHED_SIZE, "invalid verify data buffer size");
    crypto::tls1Prf(prfDigest, masterSecret, side == Side::Client ? "client finished" : "server finished",
                    transcriptHash, {}, verifyData);
}

} // namespace tlsh::tls
