#pragma once
#include <cstdint>
#include <string_view>
#include <openssl/evp.h>
#include <casket/nonstd/span.hpp>
#include <tlsh/crypto/pointers.hpp>
#include <tlsh/crypto/exception.hpp>

namespace tlsh::crypto
{

class HashTraits
{
public:
    static inline bool isAlgorithm(const Hash* hash, std::string_view alg)
    {
        return EVP_MD_is_a(hash, std::string(alg).c_str());
    }

    static inline size_t getSize(const Hash* hash) noexcept
    {
        return EVP_MD_get_size(hash);
    }

    static inline const char* getName(const Hash* hash) noexcept
    {
        return EVP_MD_get0_name(hash);
    }

    static inline HashCtxPtr createContext()
    {
        auto ctx = HashCtxPtr{EVP_MD_CTX_new()};
        ThrowIfTrue(ctx == nullptr, "bad alloc");
        return ctx;
    }

    static inline void initHash(HashCtx* ctx, const Hash* algorithm)
    {
        ThrowIfFalse(0 < EVP_DigestInit_ex(ctx, algorithm, nullptr));
    }

    static inline void updateHash(HashCtx* ctx, nonstd::span<const uint8_t> message)
    {
        ThrowIfFalse(0 < EVP_DigestUpdate(ctx, message.data(), message.size()));
    }

    static inline void copyState(HashCtx* dst, const HashCtx* src)
    {
        ThrowIfFalse(0 < EVP_MD_CTX_copy_ex(dst, src));
    }

    static inline nonstd::span<uint8_t> finalHash(HashCtx* ctx, nonstd::span<uint8_t> buffer)
    {
        ThrowIfTrue(buffer.size() < static_cast<size_t>(EVP_MD_CTX_get_size(ctx)), "buffer too small");
        unsigned int digestSize = static_cast<unsigned int>(buffer.size());
        ThrowIfFalse(0 < EVP_DigestFinal_ex(ctx, buffer.data(), &digestSize));
        return {buffer.data(), digestSize};
    }
};

} // namespace tlsh::crypto
