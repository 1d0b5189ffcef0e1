#include <tlsh/tls/exts/reneg_extension.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

RenegotiationExtension::RenegotiationExtension(Side side, nonstd::span<const uint8_t> input)
{
    (void)side;

    utils::DataReader reader("renegotiation_info extension", input);
    auto renegData = reader.get_span_length_and_value(1);
    reader.assert_done();

    renegData_.assign(renegData.begin(), renegData.end());
}

size_t RenegotiationExtension::serialize(Side side, nonstd::span<uint8_t> output) const
{
    (void)side;

    utils::DataWriter writer(output);
    writer.put_length_and_value(renegData_.data(), renegData_.size(), 1);
    return writer.written();
}

const std::vector<uint8_t>& RenegotiationExtension::getRenegInfo() const
{
    return renegData_;
}

} // namespace tlsh::tls
