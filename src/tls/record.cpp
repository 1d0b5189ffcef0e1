#include <tlsh/tls/record.hpp>
#include <tlsh/tls/exception.hpp>

#include <casket/utils/exception.hpp>
#include <casket/utils/load_store.hpp>

namespace tlsh::tls
{

RecordHeader RecordHeader::deserialize(nonstd::span<const uint8_t> data)
{
    casket::ThrowIfTrue(data.size() < TLS_HEADER_SIZE, "Input buffer is too small");

    RecordHeader header;

    ThrowIfTrue(data[0] < 20 || data[0] > 23, Error::UnexpectedMessage,
                "TLS record type had unexpected value " + std::to_string(data[0]));
    header.type = static_cast<RecordType>(data[0]);

    ThrowIfTrue(data[1] != 3 || data[2] > 3, Error::ProtocolVersionMismatch,
                "TLS record version had unexpected value");
    header.version = ProtocolVersion(data[1], data[2]);

    header.length = casket::make_uint16(data[3], data[4]);
    ThrowIfTrue(header.length > MAX_CIPHERTEXT_SIZE_TLS12, Error::RecordTooLarge,
                "Received a record that exceeds maximum size");

    return header;
}

size_t RecordHeader::serialize(nonstd::span<uint8_t> output) const
{
    casket::ThrowIfTrue(output.size() < TLS_HEADER_SIZE, "Output buffer is too small");

    output[0] = static_cast<uint8_t>(type);
    output[1] = version.majorVersion();
    output[2] = version.minorVersion();
    output[3] = casket::get_byte<0>(length);
    output[4] = casket::get_byte<1>(length);

    return TLS_HEADER_SIZE;
}

} // namespace tlsh::tls
