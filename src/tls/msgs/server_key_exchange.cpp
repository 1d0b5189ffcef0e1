#include <tlsh/tls/msgs/server_key_exchange.hpp>
#include <tlsh/tls/exception.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

std::vector<uint8_t> ServerKeyExchange::getParams() const
{
    std::vector<uint8_t> params(4 + publicPoint.size());

    utils::DataWriter writer(params);
    writer.put_byte(NamedCurve);
    writer.put_uint16_t(group.wireCode());
    writer.put_length_and_value(publicPoint.data(), publicPoint.size(), 1);

    return params;
}

std::vector<uint8_t> ServerKeyExchange::getSignedContent(nonstd::span<const uint8_t> clientRandom,
                                                         nonstd::span<const uint8_t> serverRandom) const
{
    std::vector<uint8_t> content;
    auto params = getParams();

    content.reserve(clientRandom.size() + serverRandom.size() + params.size());
    content.insert(content.end(), clientRandom.begin(), clientRandom.end());
    content.insert(content.end(), serverRandom.begin(), serverRandom.end());
    content.insert(content.end(), params.begin(), params.end());

    return content;
}

ServerKeyExchange ServerKeyExchange::deserialize(nonstd::span<const uint8_t> input)
{
    utils::DataReader reader("Server Key Exchange", input);
    ServerKeyExchange keyExchange;

    ThrowIfTrue(reader.get_byte() != NamedCurve, Error::IllegalParameter, "only named curves are supported");
    keyExchange.group = crypto::GroupParams(reader.get_uint16_t());

    auto publicPoint = reader.get_span(1, 1, 1, 255);
    keyExchange.publicPoint.assign(publicPoint.begin(), publicPoint.end());

    keyExchange.scheme = crypto::SignatureScheme(reader.get_uint16_t());

    auto signature = reader.get_span(2, 1, 1, 65535);
    keyExchange.signature.assign(signature.begin(), signature.end());

    reader.assert_done();
    return keyExchange;
}

size_t ServerKeyExchange::serialize(nonstd::span<uint8_t> output) const
{
    utils::DataWriter writer(output);

    writer.put_byte(NamedCurve);
    writer.put_uint16_t(group.wireCode());
    writer.put_length_and_value(publicPoint.data(), publicPoint.size(), 1);
    writer.put_uint16_t(scheme.wireCode());
    writer.put_length_and_value(signature.data(), signature.size(), 2);

    return writer.written();
}

} // namespace tlsh::tls
