/// @file
/// @brief Declaration of the ProtocolVersion class.

#pragma once
#include <cstdint>
#include <string>

namespace tlsh::tls
{

/// @brief Class representing a protocol version.
class ProtocolVersion final
{
public:
    /// @brief Enum representing the version code.
    enum VersionCode : uint16_t
    {
        SSLv3_0 = 0x0300,
        TLSv1_0 = 0x0301,
        TLSv1_1 = 0x0302,
        TLSv1_2 = 0x0303,
    };

    constexpr ProtocolVersion()
        : version_(0)
    {
    }

    /// @brief Constructor with version code.
    /// @param code The version code.
    explicit constexpr ProtocolVersion(uint16_t code)
        : version_(code)
    {
    }

    /// @brief Constructor with named version.
    /// @param version A specific named version of the protocol.
    constexpr ProtocolVersion(VersionCode version)
        : ProtocolVersion(static_cast<uint16_t>(version))
    {
    }

    /// @brief Constructor with major and minor version.
    /// @param major The major version.
    /// @param minor The minor version.
    constexpr ProtocolVersion(uint8_t major, uint8_t minor)
        : ProtocolVersion(static_cast<uint16_t>((static_cast<uint16_t>(major) << 8) | minor))
    {
    }

    inline uint8_t majorVersion() const noexcept
    {
        return static_cast<uint8_t>(version_ >> 8);
    }

    inline uint8_t minorVersion() const noexcept
    {
        return static_cast<uint8_t>(version_ & 0xFF);
    }

    inline uint16_t code() const noexcept
    {
        return version_;
    }

    inline bool operator==(const ProtocolVersion& other) const noexcept
    {
        return (version_ == other.version_);
    }

    inline bool operator!=(const ProtocolVersion& other) const noexcept
    {
        return (version_ != other.version_);
    }

    inline bool operator<(const ProtocolVersion& other) const noexcept
    {
        return version_ < other.version_;
    }

    /// @brief Generates a human-readable version string.
    /// @return A human-readable description of this version.
    std::string toString() const;

private:
    uint16_t version_;
};

} // namespace tlsh::tls
