#include <tlsh/tls/msgs/certificate.hpp>
#include <tlsh/tls/exception.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

Certificate Certificate::deserialize(nonstd::span<const uint8_t> input)
{
    utils::DataReader reader("Certificate", input);
    Certificate certificate;

    auto certList = reader.get_span_length_and_value(3);
    reader.assert_done();

    utils::DataReader listReader("Certificate list", certList);
    while (listReader.has_remaining())
    {
        auto cert = listReader.get_span_length_and_value(3);
        ThrowIfTrue(cert.empty(), Error::MalformedMessage, "empty certificate in chain");
        certificate.certs.emplace_back(cert.begin(), cert.end());
    }

    ThrowIfTrue(certificate.certs.empty(), Error::MalformedMessage, "no certificates sent by server");
    return certificate;
}

size_t Certificate::serialize(nonstd::span<uint8_t> output) const
{
    utils::DataWriter writer(output);

    auto listLength = writer.begin_length(3);
    for (const auto& cert : certs)
    {
        writer.put_length_and_value(cert.data(), cert.size(), 3);
    }
    writer.finish_length(listLength, 3);

    return writer.written();
}

} // namespace tlsh::tls
