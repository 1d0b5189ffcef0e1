#include <tlsh/tls/msgs/change_cipher_spec.hpp>
#include <tlsh/tls/exception.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

ChangeCipherSpec ChangeCipherSpec::deserialize(nonstd::span<const uint8_t> input)
{
    utils::DataReader reader("Change Cipher Spec", input);
    ThrowIfTrue(reader.get_byte() != Value, Error::MalformedMessage, "invalid change cipher spec value");
    reader.assert_done();
    return ChangeCipherSpec();
}

size_t ChangeCipherSpec::serialize(nonstd::span<uint8_t> output) const
{
    utils::DataWriter writer(output);
    writer.put_byte(Value);
    return writer.written();
}

} // namespace tlsh::tls
