#pragma once
#include <vector>
#include <casket/nonstd/span.hpp>
#include <tlsh/crypto/group_params.hpp>
#include <tlsh/crypto/signature_scheme.hpp>
#include <tlsh/tls/types.hpp>

namespace tlsh::tls
{

/// @brief ServerKeyExchange for ECDHE key exchange (RFC 8422 5.4).
struct ServerKeyExchange final
{
    static constexpr uint8_t NamedCurve = 3;

    crypto::GroupParams group;
    std::vector<uint8_t> publicPoint;
    crypto::SignatureScheme scheme;
    std::vector<uint8_t> signature;

    static HandshakeType staticType()
    {
        return HandshakeType::ServerKeyExchangeCode;
    }

    /// @brief Gets the ServerECDHParams bytes covered by the signature.
    std::vector<uint8_t> getParams() const;

    /// @brief Builds the signed content: client_random, server_random and the params.
    std::vector<uint8_t> getSignedContent(nonstd::span<const uint8_t> clientRandom,
                                          nonstd::span<const uint8_t> serverRandom) const;

    static ServerKeyExchange deserialize(nonstd::span<const uint8_t> input);

    size_t serialize(nonstd::span<uint8_t> output) const;
};

} // namespace tlsh::tls
