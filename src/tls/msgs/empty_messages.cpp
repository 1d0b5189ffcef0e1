#include <tlsh/tls/msgs/hello_request.hpp>
#include <tlsh/tls/msgs/server_hello_done.hpp>
#include <tlsh/utils/data_reader.hpp>

namespace tlsh::tls
{

HelloRequest HelloRequest::deserialize(nonstd::span<const uint8_t> input)
{
    utils::DataReader reader("Hello Request", input);
    reader.assert_done();
    return HelloRequest();
}

size_t HelloRequest::serialize(nonstd::span<uint8_t> output) const
{
    (void)output;
    return 0;
}

ServerHelloDone ServerHelloDone::deserialize(nonstd::span<const uint8_t> input)
{
    utils::DataReader reader("Server Hello Done", input);
    reader.assert_done();
    return ServerHelloDone();
}

size_t ServerHelloDone::serialize(nonstd::span<uint8_t> output) const
{
    (void)output;
    return 0;
}

} // namespace tlsh::tls
