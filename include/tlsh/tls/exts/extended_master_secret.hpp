#pragma once
#include <tlsh/tls/exts/extension.hpp>

namespace tlsh::tls
{

/// @brief Extended Master Secret extension (RFC 7627).
class ExtendedMasterSecret final : public Extension
{
public:
    static ExtensionCode staticType()
    {
        return ExtensionCode::ExtendedMasterSecret;
    }

    ExtensionCode type() const override
    {
        return staticType();
    }

    size_t serialize(Side side, nonstd::span<uint8_t> output) const override;

    ExtendedMasterSecret() = default;

    ExtendedMasterSecret(Side side, nonstd::span<const uint8_t> input);
};

} // namespace tlsh::tls
