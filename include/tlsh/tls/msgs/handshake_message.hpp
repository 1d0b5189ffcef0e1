/// @file
/// @brief Handshake message codec.

#pragma once
#include <variant>
#include <vector>

#include <tlsh/tls/msgs/hello_request.hpp>
#include <tlsh/tls/msgs/client_hello.hpp>
#include <tlsh/tls/msgs/server_hello.hpp>
#include <tlsh/tls/msgs/certificate.hpp>
#include <tlsh/tls/msgs/server_key_exchange.hpp>
#include <tlsh/tls/msgs/server_hello_done.hpp>
#include <tlsh/tls/msgs/client_key_exchange.hpp>
#include <tlsh/tls/msgs/change_cipher_spec.hpp>
#include <tlsh/tls/msgs/finished.hpp>

namespace tlsh::tls
{

/// @brief Context needed to decode messages whose layout depends on negotiated parameters.
struct MetaInfo
{
    KeyExchange keyExchange{KeyExchange::RSA};
};

struct HandshakeMessage final
{
    using MessageType = std::variant<HelloRequest, ClientHello, ServerHello, Certificate, ServerKeyExchange,
                                     ServerHelloDone, ClientKeyExchange, ChangeCipherSpec, Finished>;

    /// @brief Decodes a complete handshake message: 4-byte header followed by the body.
    ///
    /// @param[in] input Message bytes, exactly one message.
    /// @param[in] metaInfo Negotiated parameters.
    ///
    /// @throws tls::Exception (MalformedMessage) on length mismatch, truncated body or unknown type.
    /// @throws tls::Exception (UnexpectedMessage) for known messages this client never accepts.
    static HandshakeMessage deserialize(nonstd::span<const uint8_t> input, const MetaInfo& metaInfo = MetaInfo());

    /// @brief Encodes a message with its handshake header. ChangeCipherSpec is encoded without header.
    static std::vector<uint8_t> serialize(const MessageType& message);

    /// @brief Gets the handshake type of the message.
    static HandshakeType getType(const MessageType& message);

    HandshakeType type;
    MessageType message;

private:
    HandshakeMessage(HandshakeType msgType, MessageType&& msg)
        : type(msgType)
        , message(std::move(msg))
    {
    }
};

} // namespace tlsh::tls
