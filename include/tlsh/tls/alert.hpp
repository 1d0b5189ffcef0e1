/// @file
/// @brief Declaration of the Alert protocol message class.

#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/error_code.hpp>

namespace tlsh::tls
{

/// @brief Alert protocol message class.
class Alert final
{
public:
    /// @brief Alert message description.
    enum Description
    {
        CloseNotify = 0,
        UnexpectedMessage = 10,
        BadRecordMac = 20,
        DecryptionFailed = 21,
        RecordOverflow = 22,
        DecompressionFailure = 30,
        HandshakeFailure = 40,
        NoCertificate = 41,
        BadCertificate = 42,
        UnsupportedCertificate = 43,
        CertificateRevoked = 44,
        CertificateExpired = 45,
        CertificateUnknown = 46,
        IllegalParameter = 47,
        UnknownCA = 48,
        AccessDenied = 49,
        DecodeError = 50,
        DecryptError = 51,
        ProtocolVersion = 70,
        InsufficientSecurity = 71,
        InternalError = 80,
        InappropriateFallback = 86,
        UserCanceled = 90,
        NoRenegotiation = 100,
        UnsupportedExtension = 110,
        UnrecognizedName = 112,
        None = 256, // Pseudo-value for tracking correctness.
    };

    /// @brief Default constructor.
    Alert();

    /// @brief Constructor that forms an alert message from a specific description and fatal flag.
    /// @param description Alert message description.
    /// @param fatal Alert message fatal flag.
    Alert(Description description, bool fatal = false);

    /// @brief Constructor that deserializes a byte array into an alert message.
    /// @param buf Byte array.
    /// @throws tls::Exception with Error::MalformedMessage on a bad length or level.
    explicit Alert(nonstd::span<const uint8_t> buf);

    /// @brief Builds the fatal alert a client sends when a session fails with @p error.
    /// @return Alert with description None when no alert must be sent for @p error.
    static Alert fromError(Error error);

    bool isFatal() const noexcept;

    bool isValid() const noexcept;

    Description description() const noexcept;

    std::string toString() const;

    /// @brief Method to serialize the alert message into a byte array.
    /// @return Two bytes: level and description.
    std::array<uint8_t, 2> serialize() const;

private:
    bool fatal_;
    Description description_;
};

} // namespace tlsh::tls
