/// @file
/// @brief Declaration of the TLS record class.

#pragma once
#include <vector>
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/types.hpp>
#include <tlsh/tls/version.hpp>

namespace tlsh::tls
{

/// @brief Decoded 5-byte record header.
struct RecordHeader
{
    RecordType type{RecordType::Invalid};
    ProtocolVersion version;
    uint16_t length{0};

    /// @brief Parses a record header.
    ///
    /// @throws tls::Exception UnexpectedMessage for an unknown content type,
    ///         ProtocolVersionMismatch for a non-TLS version and RecordTooLarge
    ///         when the length exceeds the TLSv1.2 ciphertext limit.
    static RecordHeader deserialize(nonstd::span<const uint8_t> data);

    size_t serialize(nonstd::span<uint8_t> output) const;
};

/// @brief A TLS record with its (decrypted) fragment.
class Record final
{
public:
    Record() = default;

    Record(RecordType type, ProtocolVersion version, std::vector<uint8_t> payload)
        : type_(type)
        , version_(version)
        , payload_(std::move(payload))
    {
    }

    inline RecordType getType() const noexcept
    {
        return type_;
    }

    inline ProtocolVersion getVersion() const noexcept
    {
        return version_;
    }

    inline nonstd::span<const uint8_t> getPayload() const noexcept
    {
        return payload_;
    }

    inline size_t getLength() const noexcept
    {
        return payload_.size();
    }

private:
    RecordType type_{RecordType::Invalid};
    ProtocolVersion version_;
    std::vector<uint8_t> payload_;
};

} // namespace tlsh::tls
