#pragma once
#include <vector>
#include <tlsh/tls/exts/extension.hpp>

namespace tlsh::tls
{

/// @brief Renegotiation Indication extension (RFC 5746).
class RenegotiationExtension final : public Extension
{
public:
    static ExtensionCode staticType()
    {
        return ExtensionCode::SafeRenegotiation;
    }

    ExtensionCode type() const override
    {
        return staticType();
    }

    size_t serialize(Side side, nonstd::span<uint8_t> output) const override;

    RenegotiationExtension() = default;

    RenegotiationExtension(Side side, nonstd::span<const uint8_t> input);

    /// @brief Gets the renegotiated_connection field, empty on an initial handshake.
    const std::vector<uint8_t>& getRenegInfo() const;

private:
    std::vector<uint8_t> renegData_;
};

} // namespace tlsh::tls
