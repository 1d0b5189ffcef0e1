/// @file
/// @brief Parameters negotiated by one handshake attempt.

#pragma once
#include <array>
#include <casket/utils/noncopyable.hpp>
#include <tlsh/crypto/group_params.hpp>
#include <tlsh/crypto/pointers.hpp>
#include <tlsh/crypto/secure_array.hpp>
#include <tlsh/tls/cipher_suite.hpp>
#include <tlsh/tls/extensions.hpp>
#include <tlsh/tls/handshake_hash.hpp>
#include <tlsh/tls/key_schedule.hpp>
#include <tlsh/tls/types.hpp>
#include <tlsh/tls/version.hpp>

namespace tlsh::tls
{

/// @brief Session state shared by the handshake steps.
///
/// Owned by a single connection. Secrets are wiped by @ref reset and on destruction.
class SessionContext final : public casket::NonCopyable
{
public:
    SessionContext();

    ~SessionContext() noexcept;

    /// @brief Wipes the key material and forgets negotiated parameters.
    void reset() noexcept;

    /// @brief Computes the transcript hash with the PRF digest of the negotiated suite.
    ///
    /// @param[out] buffer Output buffer of at least EVP_MAX_MD_SIZE bytes.
    ///
    /// @return Span over the digest inside @p buffer.
    nonstd::span<uint8_t> transcriptHash(nonstd::span<uint8_t> buffer);

    /// @brief Derives the master secret from the stored premaster secret and wipes the latter.
    void generateMasterSecret();

    /// @brief Builds the key block of the negotiated suite.
    TrafficKeys generateTrafficKeys() const;

    std::string keyLogLine() const;

public:
    ProtocolVersion version;
    const CipherSuite* cipherSuite;
    std::array<uint8_t, TLS_RANDOM_SIZE> clientRandom;
    std::array<uint8_t, TLS_RANDOM_SIZE> serverRandom;
    HandshakeHash transcript;
    Extensions clientExtensions;
    Extensions serverExtensions;
    bool extendedMasterSecret;

    crypto::X509CertPtr serverCert;
    crypto::CertStack1Ptr serverIntermediates;
    crypto::KeyPtr serverKey;

    crypto::GroupParams group;
    crypto::KeyPtr serverEphemeralKey;

    crypto::SecureArray<uint8_t, TLS_PREMASTER_SECRET_SIZE + 128> premasterSecret;
    crypto::SecureArray<uint8_t, TLS_MASTER_SECRET_SIZE> masterSecret;

private:
    crypto::HashCtxPtr hashCtx_;
};

} // namespace tlsh::tls
