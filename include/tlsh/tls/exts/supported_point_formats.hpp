#pragma once
#include <tlsh/tls/exts/extension.hpp>

namespace tlsh::tls
{

/// @brief Supported Point Formats extension (RFC 8422).
class SupportedPointFormats final : public Extension
{
public:
    enum Format : uint8_t
    {
        Uncompressed = 0,
        ANSIX962_CompressedPrime = 1,
        ANSIX962_CompressedChar2 = 2,
    };

    static ExtensionCode staticType()
    {
        return ExtensionCode::ECPointFormats;
    }

    ExtensionCode type() const override
    {
        return staticType();
    }

    size_t serialize(Side side, nonstd::span<uint8_t> output) const override;

    SupportedPointFormats() = default;

    /// @brief Parses the extension body.
    ///
    /// @throws tls::Exception (MalformedMessage) if the uncompressed format is not listed.
    SupportedPointFormats(Side side, nonstd::span<const uint8_t> input);
};

} // namespace tlsh::tls
