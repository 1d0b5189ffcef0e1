#include <casket/utils/exception.hpp>
#include <casket/utils/hexlify.hpp>

#include <tlsh/crypto/crypto_manager.hpp>
#include <tlsh/crypto/hash_traits.hpp>
#include <tlsh/tls/session_context.hpp>

namespace tlsh::tls
{

SessionContext::SessionContext()
    : cipherSuite(nullptr)
    , clientRandom()
    , serverRandom()
    , extendedMasterSecret(false)
    , hashCtx_(crypto::HashTraits::createContext())
{
}

SessionContext::~SessionContext() noexcept
{
    reset();
}

void SessionContext::reset() noexcept
{
    version = ProtocolVersion();
    cipherSuite = nullptr;
    clientRandom.fill(0);
    serverRandom.fill(0);
    transcript.reset();
    clientExtensions = Extensions();
    serverExtensions = Extensions();
    extendedMasterSecret = false;
    serverCert.reset();
    serverIntermediates.reset();
    serverKey.reset();
    group = crypto::GroupParams();
    serverEphemeralKey.reset();
    premasterSecret.clear();
    masterSecret.clear();
}

nonstd::span<uint8_t> SessionContext::transcriptHash(nonstd::span<uint8_t> buffer)
{
    casket::ThrowIfFalse(cipherSuite, "Cipher suite is not negotiated");

    auto digest = crypto::CryptoManager::getInstance().fetchDigest(cipherSuite->prfDigest);
    return transcript.final(hashCtx_, digest, buffer);
}

void SessionContext::generateMasterSecret()
{
    casket::ThrowIfFalse(cipherSuite, "Cipher suite is not negotiated");
    casket::ThrowIfTrue(premasterSecret.empty(), "Premaster secret is not set");

    masterSecret.resize(TLS_MASTER_SECRET_SIZE);

    if (extendedMasterSecret)
    {
        std::array<uint8_t, EVP_MAX_MD_SIZE> buffer;
        auto sessionHash = transcriptHash(buffer);
        deriveExtendedMasterSecret(cipherSuite->prfDigest, premasterSecret, sessionHash, masterSecret);
    }
    else
    {
        deriveMasterSecret(cipherSuite->prfDigest, premasterSecret, clientRandom, serverRandom, masterSecret);
    }

    premasterSecret.clear();
}

TrafficKeys SessionContext::generateTrafficKeys() const
{
    casket::ThrowIfFalse(cipherSuite, "Cipher suite is not negotiated");
    casket::ThrowIfTrue(masterSecret.empty(), "Master secret is not derived");

    return deriveTrafficKeys(*cipherSuite, masterSecret, clientRandom, serverRandom);
}

std::string SessionContext::keyLogLine() const
{
    return "CLIENT_RANDOM " + casket::hexlify(clientRandom) + " " + casket::hexlify(masterSecret);
}

} // namespace tlsh::tls
