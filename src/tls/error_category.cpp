#include <tlsh/tls/error_category.hpp>
#include <tlsh/tls/error_code.hpp>

namespace tlsh::tls
{

const char* ErrorCategory::name() const noexcept
{
    return "TLS";
}

std::string ErrorCategory::message(int value) const
{
    switch (static_cast<Error>(value))
    {
    case Error::None:
        return "Success";
    case Error::IoError:
        return "Transport I/O error";
    case Error::MalformedMessage:
        return "Malformed message";
    case Error::UnexpectedMessage:
        return "Unexpected message";
    case Error::UnsupportedCipherSuite:
        return "Unsupported cipher suite";
    case Error::UntrustedCertificate:
        return "Untrusted certificate";
    case Error::HandshakeVerificationFailed:
        return "Handshake verification failed";
    case Error::BadRecordMac:
        return "Bad record MAC";
    case Error::RecordTooLarge:
        return "Record too large";
    case Error::TruncatedRecord:
        return "Truncated record";
    case Error::Timeout:
        return "Operation timed out";
    case Error::AlertReceived:
        return "Fatal alert received";
    case Error::ConnectionClosed:
        return "Connection closed by peer";
    case Error::Cancelled:
        return "Operation cancelled";
    case Error::ProtocolVersionMismatch:
        return "Protocol version mismatch";
    case Error::IllegalParameter:
        return "Illegal parameter";
    case Error::InternalError:
        return "Internal error";
    }
    return "Unknown TLS error";
}

} // namespace tlsh::tls
