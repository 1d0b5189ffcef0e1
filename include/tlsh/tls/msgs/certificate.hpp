#pragma once
#include <vector>
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/types.hpp>

namespace tlsh::tls
{

/// @brief Certificate message with the DER encoded chain, leaf first.
struct Certificate final
{
    std::vector<std::vector<uint8_t>> certs;

    static HandshakeType staticType()
    {
        return HandshakeType::CertificateCode;
    }

    /// @brief Parses the message body.
    ///
    /// @throws tls::Exception (MalformedMessage) if the chain is empty or lengths are inconsistent.
    static Certificate deserialize(nonstd::span<const uint8_t> input);

    size_t serialize(nonstd::span<uint8_t> output) const;
};

} // namespace tlsh::tls
