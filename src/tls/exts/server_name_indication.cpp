#include <tlsh/tls/exts/server_name_indication.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

ExtensionCode ServerNameIndicator::staticType()
{
    return ExtensionCode::ServerNameIndication;
}

ExtensionCode ServerNameIndicator::type() const
{
    return staticType();
}

size_t ServerNameIndicator::serialize(Side side, nonstd::span<uint8_t> output) const
{
    // RFC 6066: the "extension_data" field of the server's extension SHALL be empty.
    if (side == Side::Server)
    {
        return 0;
    }

    utils::DataWriter writer(output);
    auto listLength = writer.begin_length(2);
    writer.put_byte(0); // host_name
    writer.put_length_and_value(reinterpret_cast<const uint8_t*>(hostname_.data()), hostname_.size(), 2);
    writer.finish_length(listLength, 2);
    return writer.written();
}

ServerNameIndicator::ServerNameIndicator(std::string_view hostname)
    : hostname_(hostname)
{
}

ServerNameIndicator::ServerNameIndicator(Side side, nonstd::span<const uint8_t> input)
{
    if (side == Side::Server)
    {
        utils::DataReader reader("server_name extension", input);
        reader.assert_done();
        return;
    }

    utils::DataReader reader("server_name extension", input);
    auto names = reader.get_span_length_and_value(2);
    reader.assert_done();

    utils::DataReader list("server_name list", names);
    while (list.has_remaining())
    {
        uint8_t nameType = list.get_byte();
        auto name = list.get_span_length_and_value(2);
        if (nameType == 0)
        {
            hostname_.assign(name.begin(), name.end());
        }
    }
}

const std::string& ServerNameIndicator::getHostname() const
{
    return hostname_;
}

} // namespace tlsh::tls
