/// @file
/// @brief Declaration of the TLS client settings.

#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <casket/utils/noncopyable.hpp>
#include <tlsh/crypto/group_params.hpp>
#include <tlsh/crypto/i_cert_verifier.hpp>
#include <tlsh/crypto/signature_scheme.hpp>
#include <tlsh/tls/cipher_suite.hpp>

namespace tlsh::tls
{

/// @brief Receives NSS key log lines.
using KeyLogCallback = std::function<void(std::string_view line)>;

/// @brief Class for managing TLS client settings.
class ClientSettings final : public casket::NonCopyable
{
public:
    /// @brief Default constructor. Offers every supported cipher suite, group and signature scheme.
    ClientSettings();

    ~ClientSettings() noexcept;

    /// @brief Sets the offered cipher suites in preference order.
    ///
    /// @param[in] cipherList Colon separated IANA names, e.g. "TLS_RSA_WITH_AES_128_CBC_SHA".
    ClientSettings& setCipherList(std::string_view cipherList);

    ClientSettings& setCipherSuites(std::vector<const CipherSuite*> suites);

    ClientSettings& setGroups(std::vector<crypto::GroupParams> groups);

    ClientSettings& setSignatureSchemes(std::vector<crypto::SignatureScheme> schemes);

    /// @brief Sets the name used for SNI and hostname verification.
    ClientSettings& setServerName(std::string_view serverName);

    ClientSettings& setReadTimeout(std::chrono::milliseconds timeout);

    /// @brief Sets the upper bound of a single transport read.
    ClientSettings& setMaxReadSize(size_t maxReadSize);

    ClientSettings& setMaxHandshakeMessageSize(size_t maxMessageSize);

    ClientSettings& setExtendedMasterSecret(bool enable);

    ClientSettings& setKeyLogCallback(KeyLogCallback callback);

    /// @brief Sets the certificate verifier. The verifier must outlive connections using these settings.
    ClientSettings& setCertVerifier(crypto::ICertVerifier* verifier);

    const std::vector<const CipherSuite*>& getCipherSuites() const noexcept
    {
        return suites_;
    }

    const std::vector<crypto::GroupParams>& getGroups() const noexcept
    {
        return groups_;
    }

    const std::vector<crypto::SignatureScheme>& getSignatureSchemes() const noexcept
    {
        return schemes_;
    }

    const std::string& getServerName() const noexcept
    {
        return serverName_;
    }

    std::chrono::milliseconds getReadTimeout() const noexcept
    {
        return readTimeout_;
    }

    size_t getMaxReadSize() const noexcept
    {
        return maxReadSize_;
    }

    size_t getMaxHandshakeMessageSize() const noexcept
    {
        return maxHandshakeMessageSize_;
    }

    bool useExtendedMasterSecret() const noexcept
    {
        return extendedMasterSecret_;
    }

    const KeyLogCallback& getKeyLogCallback() const noexcept
    {
        return keyLogCallback_;
    }

    crypto::ICertVerifier* getCertVerifier() const noexcept
    {
        return verifier_;
    }

    bool offersEphemeral() const noexcept;

private:
    std::vector<const CipherSuite*> suites_;
    std::vector<crypto::GroupParams> groups_;
    std::vector<crypto::SignatureScheme> schemes_;
    std::string serverName_;
    std::chrono::milliseconds readTimeout_;
    size_t maxReadSize_;
    size_t maxHandshakeMessageSize_;
    bool extendedMasterSecret_;
    KeyLogCallback keyLogCallback_;
    crypto::ICertVerifier* verifier_;
};

} // namespace tlsh::tls
