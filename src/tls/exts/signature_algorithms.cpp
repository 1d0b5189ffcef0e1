#include <tlsh/tls/exts/signature_algorithms.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

SignatureAlgorithms::SignatureAlgorithms(std::vector<crypto::SignatureScheme> schemes)
    : schemes_(std::move(schemes))
{
}

SignatureAlgorithms::SignatureAlgorithms(Side side, nonstd::span<const uint8_t> input)
{
    (void)side;

    utils::DataReader reader("signature_algorithms extension", input);
    auto codes = reader.get_uint16_list(2, 1, 32767);
    reader.assert_done();

    schemes_.reserve(codes.size());
    for (const auto code : codes)
    {
        schemes_.emplace_back(crypto::SignatureScheme(code));
    }
}

size_t SignatureAlgorithms::serialize(Side side, nonstd::span<uint8_t> output) const
{
    (void)side;

    utils::DataWriter writer(output);
    auto listLength = writer.begin_length(2);
    for (const auto& scheme : schemes_)
    {
        writer.put_uint16_t(scheme.wireCode());
    }
    writer.finish_length(listLength, 2);
    return writer.written();
}

const std::vector<crypto::SignatureScheme>& SignatureAlgorithms::supportedSchemes() const
{
    return schemes_;
}

} // namespace tlsh::tls
