/// @file
/// @brief TLS 1.2 key schedule (RFC 5246 section 8, RFC 7627).

#pragma once
#include <string_view>
#include <casket/nonstd/span.hpp>
#include <tlsh/crypto/secure_array.hpp>
#include <tlsh/tls/cipher_suite.hpp>
#include <tlsh/tls/types.hpp>

namespace tlsh::tls
{

/// @brief Key material sliced from the key block.
struct TrafficKeys
{
    crypto::SecureArray<uint8_t, TLS_MAX_MAC_LENGTH> clientMacKey;
    crypto::SecureArray<uint8_t, TLS_MAX_MAC_LENGTH> serverMacKey;
    crypto::SecureArray<uint8_t, TLS_MAX_KEY_LENGTH> clientEncKey;
    crypto::SecureArray<uint8_t, TLS_MAX_KEY_LENGTH> serverEncKey;
    crypto::SecureArray<uint8_t, TLS_MAX_IV_LENGTH> clientIV;
    crypto::SecureArray<uint8_t, TLS_MAX_IV_LENGTH> serverIV;
};

/// @brief Derives the master secret from the premaster secret and both randoms.
///
/// @param[in] prfDigest Digest of the negotiated PRF.
/// @param[in] premasterSecret Premaster secret.
/// @param[in] clientRandom Client random.
/// @param[in] serverRandom Server random.
/// @param[out] masterSecret Output buffer of TLS_MASTER_SECRET_SIZE bytes.
void deriveMasterSecret(std::string_view prfDigest, nonstd::span<const uint8_t> premasterSecret,
                        nonstd::span<const uint8_t> clientRandom, nonstd::span<const uint8_t> serverRandom,
                        nonstd::span<uint8_t> masterSecret);

/// @brief Derives the master secret bound to the handshake transcript (RFC 7627).
///
/// @param[in] sessionHash Transcript hash through ClientKeyExchange.
void deriveExtendedMasterSecret(std::string_view prfDigest, nonstd::span<const uint8_t> premasterSecret,
                                nonstd::span<const uint8_t> sessionHash, nonstd::span<uint8_t> masterSecret);

/// @brief Expands the key block and slices it as MAC keys, write keys, then IVs, client before server.
TrafficKeys deriveTrafficKeys(const CipherSuite& suite, nonstd::span<const uint8_t> masterSecret,
                              nonstd::span<const uint8_t> clientRandom, nonstd::span<const uint8_t> serverRandom);

/// @brief Computes verify_data of the Finished message sent by @p side.
void computeFinishedVerifyData(std::string_view prfDigest, nonstd::span<const uint8_t> masterSecret,
                               nonstd::span<const uint8_t> transcriptHash, Side side,
                               nonstd::span<uint8_t> verifyData);

} // namespace tlsh::tls
