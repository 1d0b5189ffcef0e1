/// @file
/// @brief Declaration of the TLS pseudo-random function.

#pragma once
#include <string_view>
#include <cstdint>
#include <casket/nonstd/span.hpp>

namespace tlsh::crypto
{

/// @brief TLS 1.2 Pseudo-Random Function P_<hash> (RFC 5246, section 5).
///
/// Computes PRF(secret, label, seedA || seedB) and fills @p out entirely.
///
/// @param[in] algorithm Digest name used by P_hash (e.g. "SHA256").
/// @param[in] secret The secret key.
/// @param[in] label ASCII label.
/// @param[in] seedA First part of the seed (may be empty).
/// @param[in] seedB Second part of the seed (may be empty).
/// @param[out] out The output buffer for the generated pseudo-random data.
///
void tls1Prf(std::string_view algorithm, nonstd::span<const uint8_t> secret, std::string_view label,
             nonstd::span<const uint8_t> seedA, nonstd::span<const uint8_t> seedB, nonstd::span<uint8_t> out);

} // namespace tlsh::crypto
