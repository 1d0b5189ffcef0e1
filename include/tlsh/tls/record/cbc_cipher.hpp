#pragma once
#include <cstdint>
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/record/cipher_state.hpp>

namespace tlsh::tls
{

/// @brief MAC-then-encrypt block cipher protection (RFC 5246, 6.2.3.2).
class CbcCipher final
{
public:
    /// @brief Protects @p in, writing IV || E(content || MAC || padding) into @p out.
    /// @return Length of the protected fragment.
    static size_t seal(CipherState& state, RecordType type, uint64_t seq, nonstd::span<const uint8_t> in,
                       nonstd::span<uint8_t> out);

    /// @brief Removes protection from @p in, writing the content to the start of @p out.
    /// @return Length of the content.
    /// @throws tls::Exception BadRecordMac on any length, padding or MAC failure.
    static size_t open(CipherState& state, RecordType type, uint64_t seq, nonstd::span<const uint8_t> in,
                       nonstd::span<uint8_t> out);

    /// @brief Largest possible expansion of a record.
    static size_t overhead(const CipherState& state);
};

} // namespace tlsh::tls
