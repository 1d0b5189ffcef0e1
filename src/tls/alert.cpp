#include <tlsh/tls/alert.hpp>
#include <tlsh/tls/exception.hpp>

#include <casket/utils/exception.hpp>

namespace tlsh::tls
{

namespace
{

const char* DescriptionToString(const Alert::Description description)
{
    switch (description)
    {
    case Alert::Description::CloseNotify:
        return "close_notify";
    case Alert::Description::UnexpectedMessage:
        return "unexpected_message";
    case Alert::Description::BadRecordMac:
        return "bad_record_mac";
    case Alert::Description::DecryptionFailed:
        return "decryption_failed";
    case Alert::Description::RecordOverflow:
        return "record_overflow";
    case Alert::Description::DecompressionFailure:
        return "decompression_failure";
    case Alert::Description::HandshakeFailure:
        return "handshake_failure";
    case Alert::Description::NoCertificate:
        return "no_certificate";
    case Alert::Description::BadCertificate:
        return "bad_certificate";
    case Alert::Description::UnsupportedCertificate:
        return "unsupported_certificate";
    case Alert::Description::CertificateRevoked:
        return "certificate_revoked";
    case Alert::Description::CertificateExpired:
        return "certificate_expired";
    case Alert::Description::CertificateUnknown:
        return "certificate_unknown";
    case Alert::Description::IllegalParameter:
        return "illegal_parameter";
    case Alert::Description::UnknownCA:
        return "unknown_ca";
    case Alert::Description::AccessDenied:
        return "access_denied";
    case Alert::Description::DecodeError:
        return "decode_error";
    case Alert::Description::DecryptError:
        return "decrypt_error";
    case Alert::Description::ProtocolVersion:
        return "protocol_version";
    case Alert::Description::InsufficientSecurity:
        return "insufficient_security";
    case Alert::Description::InternalError:
        return "internal_error";
    case Alert::Description::InappropriateFallback:
        return "inappropriate_fallback";
    case Alert::Description::UserCanceled:
        return "user_canceled";
    case Alert::Description::NoRenegotiation:
        return "no_renegotiation";
    case Alert::Description::UnsupportedExtension:
        return "unsupported_extension";
    case Alert::Description::UnrecognizedName:
        return "unrecognized_name";
    case Alert::Description::None:
        return "none";
    }

    return nullptr;
}

} // namespace

Alert::Alert()
    : fatal_(false)
    , description_(Description::None)
{
}

Alert::Alert(Description description, bool fatal)
    : fatal_(fatal)
    , description_(description)
{
}

Alert::Alert(nonstd::span<const uint8_t> buf)
{
    ThrowIfTrue(buf.size() != 2, Error::MalformedMessage,
                "Bad size (" + std::to_string(buf.size()) + ") for TLS alert message");
    ThrowIfFalse(buf[0] == 1 || buf[0] == 2, Error::MalformedMessage, "Bad code for TLS alert level");

    fatal_ = (buf[0] == 2);
    description_ = static_cast<Description>(buf[1]);
}

Alert Alert::fromError(Error error)
{
    switch (error)
    {
    case Error::MalformedMessage:
        return Alert(DecodeError, true);
    case Error::UnexpectedMessage:
        return Alert(UnexpectedMessage, true);
    case Error::UnsupportedCipherSuite:
    case Error::IllegalParameter:
        return Alert(IllegalParameter, true);
    case Error::UntrustedCertificate:
        return Alert(BadCertificate, true);
    case Error::HandshakeVerificationFailed:
        return Alert(DecryptError, true);
    case Error::BadRecordMac:
        return Alert(BadRecordMac, true);
    case Error::RecordTooLarge:
        return Alert(RecordOverflow, true);
    case Error::ProtocolVersionMismatch:
        return Alert(ProtocolVersion, true);

    case Error::None:
    case Error::IoError:
    case Error::Timeout:
    case Error::ConnectionClosed:
    case Error::AlertReceived:
    case Error::Cancelled:
        return Alert();

    default:
        break;
    }
    return Alert(InternalError, true);
}

bool Alert::isFatal() const noexcept
{
    return fatal_;
}

bool Alert::isValid() const noexcept
{
    return (description_ != Alert::Description::None);
}

Alert::Description Alert::description() const noexcept
{
    return description_;
}

std::string Alert::toString() const
{
    const char* knownAlert = DescriptionToString(description());
    if (knownAlert)
    {
        return std::string(knownAlert);
    }

    return "unknown_alert_" + std::to_string(static_cast<size_t>(description()));
}

std::array<uint8_t, 2> Alert::serialize() const
{
    casket::ThrowIfFalse(isValid(), "Alert description is not set");
    return {static_cast<uint8_t>(isFatal() ? 2 : 1), static_cast<uint8_t>(description())};
}

} // namespace tlsh::tls
