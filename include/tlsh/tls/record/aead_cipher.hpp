#pragma once
#include <cstdint>
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/record/cipher_state.hpp>

namespace tlsh::tls
{

/// @brief AES-GCM record protection (RFC 5288).
///
/// Fragment layout: explicit nonce (8 bytes) || ciphertext || tag (16 bytes).
/// The explicit nonce is the write sequence number.
class AeadCipher final
{
public:
    static size_t seal(CipherState& state, RecordType type, uint64_t seq, nonstd::span<const uint8_t> in,
                       nonstd::span<uint8_t> out);

    /// @throws tls::Exception BadRecordMac when authentication fails.
    static size_t open(CipherState& state, RecordType type, uint64_t seq, nonstd::span<const uint8_t> in,
                       nonstd::span<uint8_t> out);

    static size_t overhead(const CipherState& state);
};

} // namespace tlsh::tls
