/// @file
/// @brief Declaration of TLS session error codes.

#pragma once
#include <system_error>

namespace tlsh::tls
{

/// @brief Reasons a TLS session fails.
enum class Error
{
    None = 0,
    IoError,                     ///< Transport failure.
    MalformedMessage,            ///< Wire data does not match the expected layout.
    UnexpectedMessage,           ///< Message is not allowed in the current handshake state.
    UnsupportedCipherSuite,      ///< Server selected a cipher suite that was not offered.
    UntrustedCertificate,        ///< Certificate chain verification failed.
    HandshakeVerificationFailed, ///< Finished or ServerKeyExchange signature check failed.
    BadRecordMac,                ///< Record protection check failed.
    RecordTooLarge,              ///< Record or handshake message exceeds the allowed size.
    TruncatedRecord,             ///< Stream ended in the middle of a record.
    Timeout,                     ///< Peer did not answer in time.
    AlertReceived,               ///< Peer sent a fatal alert.
    ConnectionClosed,            ///< Peer closed the connection.
    Cancelled,                   ///< Caller cancelled the session.
    ProtocolVersionMismatch,     ///< Peer uses a protocol version other than TLSv1.2.
    IllegalParameter,            ///< Field value is out of the allowed range.
    InternalError,               ///< Local failure outside the protocol, e.g. a crypto primitive.
};

/// @brief Creates an error code from a TLS error value.
/// @param e The error value.
/// @return Error code with the TLS error category.
std::error_code MakeErrorCode(Error e);

} // namespace tlsh::tls

namespace std
{

template <>
struct is_error_code_enum<tlsh::tls::Error> : true_type
{
};

} // namespace std

namespace tlsh::tls
{

inline std::error_code make_error_code(Error e)
{
    return MakeErrorCode(e);
}

} // namespace tlsh::tls
