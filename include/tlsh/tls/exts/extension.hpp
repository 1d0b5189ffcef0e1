#pragma once
#include <cstdint>
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/types.hpp>

namespace tlsh::tls
{

/// @brief Enumeration of the TLS extension codes.
enum class ExtensionCode : uint16_t
{
    ServerNameIndication = 0,  ///< Server Name Indication (RFC 6066).
    SupportedGroups = 10,      ///< Supported Groups (RFC 8422).
    ECPointFormats = 11,       ///< Supported EC Point Formats (RFC 8422).
    SignatureAlgorithms = 13,  ///< Signature Algorithms (RFC 5246).
    ExtendedMasterSecret = 23, ///< Extended Master Secret (RFC 7627).
    SafeRenegotiation = 65281, ///< Renegotiation Indication (RFC 5746).
};

const char* ExtensionCodeToString(const ExtensionCode code);

/// @brief Base class for TLS extensions.
class Extension
{
public:
    /// @brief Virtual destructor.
    virtual ~Extension() = default;

    /// @brief Gets the type of the extension.
    ///
    /// @return The extension code.
    virtual ExtensionCode type() const = 0;

    /// @brief Serialize extension body to bytes.
    ///
    /// @param[in] side Side (Client or Server).
    /// @param[in] output Buffer for encoding.
    ///
    /// @return Serialized bytes count.
    virtual size_t serialize(Side side, nonstd::span<uint8_t> output) const = 0;
};

} // namespace tlsh::tls
