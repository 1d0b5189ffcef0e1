#include <algorithm>
#include <tlsh/tls/exts/supported_point_formats.hpp>
#include <tlsh/tls/exception.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

size_t SupportedPointFormats::serialize(Side side, nonstd::span<uint8_t> output) const
{
    (void)side;

    // Only uncompressed points are offered.
    utils::DataWriter writer(output);
    writer.put_byte(1);
    writer.put_byte(Uncompressed);
    return writer.written();
}

SupportedPointFormats::SupportedPointFormats(Side side, nonstd::span<const uint8_t> input)
{
    (void)side;

    utils::DataReader reader("ec_point_formats extension", input);
    auto formats = reader.get_span(1, 1, 1, 255);
    reader.assert_done();

    ThrowIfTrue(std::find(formats.begin(), formats.end(), Uncompressed) == formats.end(),
                Error::MalformedMessage, "ec_point_formats without uncompressed format");
}

} // namespace tlsh::tls
