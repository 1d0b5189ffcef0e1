#include <algorithm>
#include <casket/utils/exception.hpp>
#include <casket/utils/format.hpp>
#include <casket/utils/string.hpp>

#include <tlsh/tls/settings.hpp>
#include <tlsh/tls/cipher_suite_manager.hpp>
#include <tlsh/tls/types.hpp>

namespace tlsh::tls
{

namespace
{

// clang-format off
const std::vector<crypto::SignatureScheme> gDefaultSchemes = {
    crypto::SignatureScheme::ECDSA_SHA256,
    crypto::SignatureScheme::ECDSA_SHA384,
    crypto::SignatureScheme::ECDSA_SHA512,
    crypto::SignatureScheme::RSA_PSS_RSAE_SHA256,
    crypto::SignatureScheme::RSA_PSS_RSAE_SHA384,
    crypto::SignatureScheme::RSA_PSS_RSAE_SHA512,
    crypto::SignatureScheme::RSA_PKCS1_SHA256,
    crypto::SignatureScheme::RSA_PKCS1_SHA384,
    crypto::SignatureScheme::RSA_PKCS1_SHA512,
    crypto::SignatureScheme::ECDSA_SHA1,
    crypto::SignatureScheme::RSA_PKCS1_SHA1,
};

const std::vector<crypto::GroupParams> gDefaultGroups = {
    crypto::GroupParams::X25519,
    crypto::GroupParams::SECP256R1,
    crypto::GroupParams::SECP384R1,
};
// clang-format on

} // namespace

ClientSettings::ClientSettings()
    : suites_(CipherSuiteManager::getInstance().getCipherSuites())
    , groups_(gDefaultGroups)
    , schemes_(gDefaultSchemes)
    , readTimeout_(std::chrono::seconds(30))
    , maxReadSize_(TLS_HEADER_SIZE + MAX_CIPHERTEXT_SIZE_TLS12)
    , maxHandshakeMessageSize_(MAX_HANDSHAKE_MESSAGE_SIZE)
    , extendedMasterSecret_(true)
    , verifier_(nullptr)
{
}

ClientSettings::~ClientSettings() noexcept = default;

ClientSettings& ClientSettings::setCipherList(std::string_view cipherList)
{
    std::vector<const CipherSuite*> suites;

    for (const auto& name : casket::split(cipherList, ":"))
    {
        auto suite = CipherSuiteManager::getInstance().getCipherSuiteByName(name);
        casket::ThrowIfFalse(suite, casket::format("Unknown cipher suite '{}'", name));

        if (std::find(suites.begin(), suites.end(), suite) == suites.end())
        {
            suites.push_back(suite);
        }
    }

    return setCipherSuites(std::move(suites));
}

ClientSettings& ClientSettings::setCipherSuites(std::vector<const CipherSuite*> suites)
{
    casket::ThrowIfTrue(suites.empty(), "At least one cipher suite must be offered");
    suites_ = std::move(suites);
    return *this;
}

ClientSettings& ClientSettings::setGroups(std::vector<crypto::GroupParams> groups)
{
    for (const auto& group : groups)
    {
        casket::ThrowIfFalse(group.isSupported(), "Unsupported group");
    }
    groups_ = std::move(groups);
    return *this;
}

ClientSettings& ClientSettings::setSignatureSchemes(std::vector<crypto::SignatureScheme> schemes)
{
    casket::ThrowIfTrue(schemes.empty(), "At least one signature scheme must be offered");
    for (const auto& scheme : schemes)
    {
        casket::ThrowIfFalse(scheme.isSupported(), "Unsupported signature scheme");
    }
    schemes_ = std::move(schemes);
    return *this;
}

ClientSettings& ClientSettings::setServerName(std::string_view serverName)
{
    serverName_ = serverName;
    return *this;
}

ClientSettings& ClientSettings::setReadTimeout(std::chrono::milliseconds timeout)
{
    casket::ThrowIfTrue(timeout.count() <= 0, "Read timeout must be positive");
    readTimeout_ = timeout;
    return *this;
}

ClientSettings& ClientSettings::setMaxReadSize(size_t maxReadSize)
{
    casket::ThrowIfTrue(maxReadSize == 0, "Read size must be positive");
    maxReadSize_ = maxReadSize;
    return *this;
}

ClientSettings& ClientSettings::setMaxHandshakeMessageSize(size_t maxMessageSize)
{
    casket::ThrowIfTrue(maxMessageSize < TLS_HANDSHAKE_HEADER_SIZE, "Handshake message limit is too small");
    maxHandshakeMessageSize_ = maxMessageSize;
    return *this;
}

ClientSettings& ClientSettings::setExtendedMasterSecret(bool enable)
{
    extendedMasterSecret_ = enable;
    return *this;
}

ClientSettings& ClientSettings::setKeyLogCallback(KeyLogCallback callback)
{
    keyLogCallback_ = std::move(callback);
    return *this;
}

ClientSettings& ClientSettings::setCertVerifier(crypto::ICertVerifier* verifier)
{
    verifier_ = verifier;
    return *this;
}

bool ClientSettings::offersEphemeral() const noexcept
{
    return std::any_of(suites_.begin(), suites_.end(), [](const auto* suite) { return suite->isEphemeral(); });
}

} // namespace tlsh::tls
