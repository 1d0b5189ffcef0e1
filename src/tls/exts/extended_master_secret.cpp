#include <tlsh/tls/exts/extended_master_secret.hpp>
#include <tlsh/tls/exception.hpp>

namespace tlsh::tls
{

size_t ExtendedMasterSecret::serialize(Side side, nonstd::span<uint8_t> output) const
{
    (void)side;
    (void)output;
    return 0;
}

ExtendedMasterSecret::ExtendedMasterSecret(Side side, nonstd::span<const uint8_t> input)
{
    (void)side;
    ThrowIfTrue(!input.empty(), Error::MalformedMessage, "invalid extended_master_secret extension");
}

} // namespace tlsh::tls
