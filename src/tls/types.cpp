#include <tlsh/tls/types.hpp>

namespace tlsh::tls
{

std::string toString(const RecordType type)
{
    switch (type)
    {
    case RecordType::ChangeCipherSpec:
        return "ChangeCipherSpec";
    case RecordType::Alert:
        return "Alert";
    case RecordType::Handshake:
        return "Handshake";
    case RecordType::ApplicationData:
        return "ApplicationData";
    default:
        break;
    }
    return "Unknown(" + std::to_string(static_cast<int>(type)) + ")";
}

std::string toString(const HandshakeType type)
{
    switch (type)
    {
    case HandshakeType::HelloRequestCode:
        return "HelloRequest";
    case HandshakeType::ClientHelloCode:
        return "ClientHello";
    case HandshakeType::ServerHelloCode:
        return "ServerHello";
    case HandshakeType::CertificateCode:
        return "Certificate";
    case HandshakeType::ServerKeyExchangeCode:
        return "ServerKeyExchange";
    case HandshakeType::CertificateRequestCode:
        return "CertificateRequest";
    case HandshakeType::ServerHelloDoneCode:
        return "ServerHelloDone";
    case HandshakeType::CertificateVerifyCode:
        return "CertificateVerify";
    case HandshakeType::ClientKeyExchangeCode:
        return "ClientKeyExchange";
    case HandshakeType::FinishedCode:
        return "Finished";
    default:
        break;
    }
    return "Unknown(" + std::to_string(static_cast<int>(type)) + ")";
}

} // namespace tlsh::tls
