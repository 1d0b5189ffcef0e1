#pragma once
#include <cstdint>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <tlsh/crypto/typedefs.hpp>
#include <tlsh/crypto/signature_scheme.hpp>

namespace tlsh::crypto
{

class Signature final
{
public:
    /// @brief Signs @p tbs with @p privateKey as prescribed by @p scheme.
    ///
    /// @param[in] scheme Signature scheme.
    /// @param[in] privateKey Signing key.
    /// @param[in] tbs Data to be signed.
    ///
    /// @return Signature bytes.
    static std::vector<uint8_t> sign(SignatureScheme scheme, Key* privateKey, nonstd::span<const uint8_t> tbs);

    /// @brief Verifies @p signature over @p tbs.
    ///
    /// @param[in] scheme Signature scheme.
    /// @param[in] publicKey Verification key.
    /// @param[in] tbs Signed data.
    /// @param[in] signature Signature bytes.
    ///
    /// @return true if the signature is valid, false otherwise.
    static bool verify(SignatureScheme scheme, Key* publicKey, nonstd::span<const uint8_t> tbs,
                       nonstd::span<const uint8_t> signature);
};

} // namespace tlsh::crypto
