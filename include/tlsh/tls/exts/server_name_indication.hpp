#pragma once
#include <string>
#include <string_view>
#include <tlsh/tls/exts/extension.hpp>

namespace tlsh::tls
{

/// @brief Server Name Indication extension.
class ServerNameIndicator final : public Extension
{
public:
    static ExtensionCode staticType();

    ExtensionCode type() const override;

    /// @brief Serializes a host_name entry on the client side, nothing on the server side.
    size_t serialize(Side side, nonstd::span<uint8_t> output) const override;

    explicit ServerNameIndicator(std::string_view hostname);

    /// @brief Constructor with input byte buffer.
    ///
    /// @param[in] side Side that produced the extension.
    /// @param[in] input Input byte buffer, empty when sent by a server.
    ServerNameIndicator(Side side, nonstd::span<const uint8_t> input);

    const std::string& getHostname() const;

private:
    std::string hostname_;
};

} // namespace tlsh::tls
