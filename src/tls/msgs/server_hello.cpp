#include <tlsh/tls/msgs/server_hello.hpp>
#include <tlsh/tls/exception.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

ServerHello ServerHello::deserialize(nonstd::span<const uint8_t> input)
{
    utils::DataReader reader("Server Hello", input);
    ServerHello serverHello;

    serverHello.version = ProtocolVersion(reader.get_uint16_t());

    auto random = reader.get_span_fixed(TLS_RANDOM_SIZE);
    std::copy(random.begin(), random.end(), serverHello.random.begin());

    auto sessionID = reader.get_span(1, 1, 0, TLS_MAX_SESSION_ID_SIZE);
    serverHello.sessionID.assign(sessionID.begin(), sessionID.end());

    serverHello.cipherSuite = reader.get_uint16_t();
    serverHello.compMethod = reader.get_byte();
    ThrowIfTrue(serverHello.compMethod != 0, Error::IllegalParameter, "server selected compression");

    if (reader.has_remaining())
    {
        serverHello.extensions.deserialize(Side::Server, reader.get_span_remaining());
        serverHello.extensionsPresent = true;
    }
    reader.assert_done();

    return serverHello;
}

size_t ServerHello::serialize(nonstd::span<uint8_t> output) const
{
    utils::DataWriter writer(output);

    writer.put_byte(version.majorVersion());
    writer.put_byte(version.minorVersion());
    writer.put_span(random);
    writer.put_length_and_value(sessionID.data(), sessionID.size(), 1);
    writer.put_uint16_t(cipherSuite);
    writer.put_byte(compMethod);

    size_t length = writer.written();
    if (extensionsPresent || !extensions.empty())
    {
        length += extensions.serialize(Side::Server, output.subspan(length));
    }
    return length;
}

} // namespace tlsh::tls
