#include <openssl/crypto.h>

#include <tlsh/crypto/hash_traits.hpp>

#include <tlsh/tls/handshake_hash.hpp>

using namespace tlsh::crypto;

namespace tlsh::tls
{

HandshakeHash::HandshakeHash() = default;

HandshakeHash::~HandshakeHash() noexcept
{
    reset();
}

void HandshakeHash::update(nonstd::span<const uint8_t> in)
{
    messages_.insert(messages_.end(), in.begin(), in.end());
}

nonstd::span<uint8_t> HandshakeHash::final(HashCtx* hashCtx, const Hash* hashAlg, nonstd::span<uint8_t> buffer) const
{
    HashTraits::initHash(hashCtx, hashAlg);
    HashTraits::updateHash(hashCtx, messages_);
    return HashTraits::finalHash(hashCtx, buffer);
}

const std::vector<uint8_t>& HandshakeHash::getContents() const
{
    return messages_;
}

void HandshakeHash::reset()
{
    if (!messages_.empty())
    {
        OPENSSL_cleanse(messages_.data(), messages_.size());
    }
    messages_.clear();
}

} // namespace tlsh::tls
