#pragma once
#include <vector>
#include <tlsh/tls/exts/extension.hpp>
#include <tlsh/crypto/group_params.hpp>

namespace tlsh::tls
{

/// @brief Supported Groups extension, called Elliptic Curves before RFC 8422.
class SupportedGroups final : public Extension
{
public:
    static ExtensionCode staticType()
    {
        return ExtensionCode::SupportedGroups;
    }

    ExtensionCode type() const override
    {
        return staticType();
    }

    size_t serialize(Side side, nonstd::span<uint8_t> output) const override;

    explicit SupportedGroups(std::vector<crypto::GroupParams> groups);

    SupportedGroups(Side side, nonstd::span<const uint8_t> input);

    const std::vector<crypto::GroupParams>& getGroups() const;

private:
    std::vector<crypto::GroupParams> groups_;
};

} // namespace tlsh::tls
