#include <tlsh/tls/exts/extension.hpp>

namespace tlsh::tls
{

const char* ExtensionCodeToString(const ExtensionCode code)
{
    switch (code)
    {
    case ExtensionCode::ServerNameIndication:
        return "server_name";
    case ExtensionCode::SupportedGroups:
        return "supported_groups";
    case ExtensionCode::ECPointFormats:
        return "ec_point_formats";
    case ExtensionCode::SignatureAlgorithms:
        return "signature_algorithms";
    case ExtensionCode::ExtendedMasterSecret:
        return "extended_master_secret";
    case ExtensionCode::SafeRenegotiation:
        return "renegotiation_info";
    }
    return "unknown";
}

} // namespace tlsh::tls
