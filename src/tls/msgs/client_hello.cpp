#include <algorithm>
#include <tlsh/tls/msgs/client_hello.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

bool ClientHello::offeredSuite(uint16_t suite) const
{
    return std::find(suites.begin(), suites.end(), suite) != suites.end();
}

ClientHello ClientHello::deserialize(nonstd::span<const uint8_t> input)
{
    utils::DataReader reader("Client Hello", input);
    ClientHello clientHello;

    clientHello.version = ProtocolVersion(reader.get_uint16_t());

    auto random = reader.get_span_fixed(TLS_RANDOM_SIZE);
    std::copy(random.begin(), random.end(), clientHello.random.begin());

    auto sessionID = reader.get_span(1, 1, 0, TLS_MAX_SESSION_ID_SIZE);
    clientHello.sessionID.assign(sessionID.begin(), sessionID.end());

    clientHello.suites = reader.get_uint16_list(2, 1, 32767);

    auto compMethods = reader.get_span(1, 1, 1, 255);
    clientHello.compMethods.assign(compMethods.begin(), compMethods.end());

    if (reader.has_remaining())
    {
        clientHello.extensions.deserialize(Side::Client, reader.get_span_remaining());
        clientHello.extensionsPresent = true;
    }
    reader.assert_done();

    return clientHello;
}

size_t ClientHello::serialize(nonstd::span<uint8_t> output) const
{
    utils::DataWriter writer(output);

    writer.put_byte(version.majorVersion());
    writer.put_byte(version.minorVersion());
    writer.put_span(random);
    writer.put_length_and_value(sessionID.data(), sessionID.size(), 1);

    auto suitesLength = writer.begin_length(2);
    for (const auto suite : suites)
    {
        writer.put_uint16_t(suite);
    }
    writer.finish_length(suitesLength, 2);

    writer.put_length_and_value(compMethods.data(), compMethods.size(), 1);

    size_t length = writer.written();
    if (extensionsPresent || !extensions.empty())
    {
        length += extensions.serialize(Side::Client, output.subspan(length));
    }
    return length;
}

} // namespace tlsh::tls
