#pragma once
#include <cstdint>
#include <casket/nonstd/span.hpp>
#include <tlsh/crypto/typedefs.hpp>
#include <tlsh/tls/types.hpp>
#include <tlsh/tls/version.hpp>

namespace tlsh::tls
{

/// @brief Computes HMAC(macKey, seq_num || type || version || length || content).
///
/// @return Part of @p buffer holding the MAC.
nonstd::span<uint8_t> computeTls1Mac(crypto::MacCtx* ctx, const crypto::Hash* hash,
                                     nonstd::span<const uint8_t> macKey, uint64_t seq, RecordType recordType,
                                     ProtocolVersion version, nonstd::span<const uint8_t> content,
                                     nonstd::span<uint8_t> buffer);

} // namespace tlsh::tls
