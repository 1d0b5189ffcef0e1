#include <tlsh/tls/version.hpp>

namespace tlsh::tls
{

std::string ProtocolVersion::toString() const
{
    const uint8_t maj = majorVersion();
    const uint8_t min = minorVersion();

    if (maj == 3 && min == 0)
    {
        return "SSLv3.0";
    }

    if (maj == 3 && min >= 1)
    {
        return "TLSv1." + std::to_string(min - 1);
    }

    return "Unknown version " + std::to_string(maj) + "." + std::to_string(min);
}

} // namespace tlsh::tls
