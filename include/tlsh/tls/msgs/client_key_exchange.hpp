#pragma once
#include <vector>
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/cipher_suite.hpp>
#include <tlsh/tls/types.hpp>

namespace tlsh::tls
{

/// @brief ClientKeyExchange carrying either the RSA encrypted premaster secret or the client ECDH point.
struct ClientKeyExchange final
{
    KeyExchange kx{KeyExchange::RSA};
    std::vector<uint8_t> exchangeKeys;

    static HandshakeType staticType()
    {
        return HandshakeType::ClientKeyExchangeCode;
    }

    static ClientKeyExchange deserialize(nonstd::span<const uint8_t> input, KeyExchange kx);

    size_t serialize(nonstd::span<uint8_t> output) const;
};

} // namespace tlsh::tls
