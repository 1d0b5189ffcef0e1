#pragma once
#include <casket/nonstd/span.hpp>
#include <tlsh/crypto/pointers.hpp>
#include <tlsh/crypto/secure_array.hpp>
#include <tlsh/tls/cipher_suite.hpp>
#include <tlsh/tls/types.hpp>
#include <tlsh/tls/version.hpp>

namespace tlsh::tls
{

/// @brief Keys and OpenSSL contexts protecting one direction of a connection.
struct CipherState
{
    const CipherSuite* suite{nullptr};
    ProtocolVersion version;
    crypto::CipherPtr cipher;
    crypto::CipherCtxPtr cipherCtx;
    crypto::HashPtr macHash;
    crypto::MacCtxPtr macCtx;
    crypto::SecureArray<uint8_t, TLS_MAX_KEY_LENGTH> key;
    crypto::SecureArray<uint8_t, TLS_MAX_MAC_LENGTH> macKey;
    crypto::SecureArray<uint8_t, TLS_MAX_IV_LENGTH> iv;

    static CipherState create(const CipherSuite& suite, ProtocolVersion version, nonstd::span<const uint8_t> key,
                              nonstd::span<const uint8_t> iv, nonstd::span<const uint8_t> macKey);
};

} // namespace tlsh::tls
