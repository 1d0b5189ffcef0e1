#include <tlsh/tls/msgs/handshake_message.hpp>
#include <tlsh/tls/exception.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

#include <casket/utils/format.hpp>

namespace tlsh::tls
{

HandshakeMessage HandshakeMessage::deserialize(nonstd::span<const uint8_t> input, const MetaInfo& metaInfo)
{
    utils::DataReader reader("Handshake Message", input);

    const auto messageType = static_cast<HandshakeType>(reader.get_byte());
    const auto messageLength = reader.get_uint24_t();
    ThrowIfTrue(reader.remaining_bytes() != messageLength, Error::MalformedMessage,
                "incorrect length of handshake message");

    auto payload = reader.get_span_remaining();

    switch (messageType)
    {
    case HandshakeType::HelloRequestCode:
        return HandshakeMessage(messageType, HelloRequest::deserialize(payload));
    case HandshakeType::ClientHelloCode:
        return HandshakeMessage(messageType, ClientHello::deserialize(payload));
    case HandshakeType::ServerHelloCode:
        return HandshakeMessage(messageType, ServerHello::deserialize(payload));
    case HandshakeType::CertificateCode:
        return HandshakeMessage(messageType, Certificate::deserialize(payload));
    case HandshakeType::ServerKeyExchangeCode:
        return HandshakeMessage(messageType, ServerKeyExchange::deserialize(payload));
    case HandshakeType::ServerHelloDoneCode:
        return HandshakeMessage(messageType, ServerHelloDone::deserialize(payload));
    case HandshakeType::ClientKeyExchangeCode:
        return HandshakeMessage(messageType, ClientKeyExchange::deserialize(payload, metaInfo.keyExchange));
    case HandshakeType::FinishedCode:
        return HandshakeMessage(messageType, Finished::deserialize(payload));
    case HandshakeType::CertificateRequestCode:
    case HandshakeType::CertificateVerifyCode:
        throw Exception(MakeErrorCode(Error::UnexpectedMessage),
                        casket::format("unsupported handshake message '{}'", toString(messageType)));
    default:
        break;
    }

    throw Exception(MakeErrorCode(Error::MalformedMessage),
                    casket::format("unknown handshake message type {}", static_cast<int>(messageType)));
}

std::vector<uint8_t> HandshakeMessage::serialize(const MessageType& message)
{
    std::vector<uint8_t> output(TLS_HANDSHAKE_HEADER_SIZE + MAX_HANDSHAKE_MESSAGE_SIZE);

    if (std::holds_alternative<ChangeCipherSpec>(message))
    {
        const size_t length = std::get<ChangeCipherSpec>(message).serialize(output);
        output.resize(length);
        return output;
    }

    const size_t payloadSize = std::visit(
        [&output](auto&& msg) -> size_t
        {
            auto payload = nonstd::span<uint8_t>(output).subspan(TLS_HANDSHAKE_HEADER_SIZE);
            return msg.serialize(payload);
        },
        message);

    utils::DataWriter writer(output);
    writer.put_byte(static_cast<uint8_t>(getType(message)));
    writer.put_uint24_t(static_cast<uint32_t>(payloadSize));

    output.resize(TLS_HANDSHAKE_HEADER_SIZE + payloadSize);
    return output;
}

HandshakeType HandshakeMessage::getType(const MessageType& message)
{
    return std::visit([](auto&& msg) -> HandshakeType { return msg.staticType(); }, message);
}

} // namespace tlsh::tls
