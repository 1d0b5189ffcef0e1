#pragma once
#include <vector>
#include <casket/nonstd/span.hpp>
#include <tlsh/crypto/typedefs.hpp>

namespace tlsh::tls
{

/// @brief Transcript of handshake messages in the order they were sent or received.
///
/// Messages are kept as raw bytes because the hash algorithm is known only
/// after the cipher suite has been negotiated.
class HandshakeHash final
{
public:
    HandshakeHash();

    ~HandshakeHash() noexcept;

    void update(nonstd::span<const uint8_t> in);

    /// @brief Hashes the transcript collected so far.
    ///
    /// @param[in] hashCtx Context used for the computation.
    /// @param[in] hashAlg Hash algorithm of the negotiated PRF.
    /// @param[out] buffer Output buffer.
    ///
    /// @return Part of @p buffer holding the digest.
    nonstd::span<uint8_t> final(crypto::HashCtx* hashCtx, const crypto::Hash* hashAlg,
                                nonstd::span<uint8_t> buffer) const;

    const std::vector<uint8_t>& getContents() const;

    void reset();

private:
    std::vector<uint8_t> messages_;
};

} // namespace tlsh::tls
