#include <tlsh/tls/msgs/client_key_exchange.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

namespace
{

inline size_t lengthFieldSize(KeyExchange kx)
{
    return kx == KeyExchange::RSA ? 2 : 1;
}

} // namespace

ClientKeyExchange ClientKeyExchange::deserialize(nonstd::span<const uint8_t> input, KeyExchange kx)
{
    utils::DataReader reader("Client Key Exchange", input);
    ClientKeyExchange keyExchange;

    keyExchange.kx = kx;
    auto exchangeKeys = reader.get_span(lengthFieldSize(kx), 1, 1, kx == KeyExchange::RSA ? 65535 : 255);
    keyExchange.exchangeKeys.assign(exchangeKeys.begin(), exchangeKeys.end());

    reader.assert_done();
    return keyExchange;
}

size_t ClientKeyExchange::serialize(nonstd::span<uint8_t> output) const
{
    utils::DataWriter writer(output);
    writer.put_length_and_value(exchangeKeys.data(), exchangeKeys.size(), lengthFieldSize(kx));
    return writer.written();
}

} // namespace tlsh::tls
