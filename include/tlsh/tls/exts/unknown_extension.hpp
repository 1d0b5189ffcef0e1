#pragma once
#include <vector>
#include <tlsh/tls/exts/extension.hpp>

namespace tlsh::tls
{

/// @brief Extension that is carried opaquely.
class UnknownExtension final : public Extension
{
public:
    UnknownExtension(ExtensionCode type, nonstd::span<const uint8_t> input);

    ExtensionCode type() const override
    {
        return type_;
    }

    size_t serialize(Side side, nonstd::span<uint8_t> output) const override;

    const std::vector<uint8_t>& value() const
    {
        return value_;
    }

private:
    ExtensionCode type_;
    std::vector<uint8_t> value_;
};

} // namespace tlsh::tls
