#include <tlsh/tls/exts/unknown_extension.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

UnknownExtension::UnknownExtension(ExtensionCode type, nonstd::span<const uint8_t> input)
    : type_(type)
    , value_(input.begin(), input.end())
{
}

size_t UnknownExtension::serialize(Side side, nonstd::span<uint8_t> output) const
{
    (void)side;

    utils::DataWriter writer(output);
    writer.put_span(value_);
    return writer.written();
}

} // namespace tlsh::tls
