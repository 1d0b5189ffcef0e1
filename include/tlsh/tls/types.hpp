#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

#include <openssl/evp.h>

namespace tlsh::tls
{

/// @brief Enum representing the side (client or server).
enum class Side : uint8_t
{
    Client = 0,
    Server
};

/// @brief Enum representing the record type.
enum class RecordType : uint8_t
{
    Invalid = 0,
    ChangeCipherSpec = 20,
    Alert = 21,
    Handshake = 22,
    ApplicationData = 23,
};

/// @brief Enum representing size limits for TLS.
enum SizeLimits : size_t
{
    TLS_HEADER_SIZE = 5,
    TLS_HANDSHAKE_HEADER_SIZE = 4,
    TLS_RANDOM_SIZE = 32,
    TLS_MASTER_SECRET_SIZE = 48,
    TLS_PREMASTER_SECRET_SIZE = 48,
    TLS_FINISHED_SIZE = 12,
    TLS_SEQ_NUMBER_SIZE = 8,
    TLS_MAX_SESSION_ID_SIZE = 32,
    TLS_MAX_MAC_LENGTH = EVP_MAX_MD_SIZE,
    TLS_MAX_KEY_LENGTH = EVP_MAX_KEY_LENGTH,
    TLS_MAX_IV_LENGTH = EVP_MAX_IV_LENGTH,
    TLS12_AEAD_AAD_SIZE = 13,
    TLS12_AEAD_NONCE_SIZE = 12,
    TLS12_AEAD_FIXED_IV_SIZE = 4,
    MAX_PLAINTEXT_SIZE = 16 * 1024,
    MAX_COMPRESSED_SIZE = MAX_PLAINTEXT_SIZE + 1024,
    MAX_CIPHERTEXT_SIZE_TLS12 = MAX_COMPRESSED_SIZE + 1024,
    MAX_HANDSHAKE_MESSAGE_SIZE = 64 * 1024,
};

/// @brief Enum representing the handshake type.
enum class HandshakeType : uint8_t
{
    HelloRequestCode = 0,
    ClientHelloCode = 1,
    ServerHelloCode = 2,
    CertificateCode = 11,
    ServerKeyExchangeCode = 12,
    CertificateRequestCode = 13,
    ServerHelloDoneCode = 14,
    CertificateVerifyCode = 15,
    ClientKeyExchangeCode = 16,
    FinishedCode = 20,
    NoneCode = 255 ///< Null value
};

/// @brief Converts a RecordType to a string representation.
/// @param type The RecordType to convert.
/// @return The string representation of the RecordType.
std::string toString(const RecordType type);

/// @brief Converts a HandshakeType to a string representation.
/// @param type The HandshakeType to convert.
/// @return The string representation of the HandshakeType.
std::string toString(const HandshakeType type);

} // namespace tlsh::tls
