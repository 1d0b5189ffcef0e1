#pragma once
#include <openssl/evp.h>
#include <tlsh/crypto/pointers.hpp>
#include <tlsh/crypto/exception.hpp>

namespace tlsh::crypto
{

class CipherTraits final
{
public:
    static inline CipherCtxPtr createContext()
    {
        CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        ThrowIfFalse(ctx != nullptr, "failed to create cipher context");
        return ctx;
    }

    static inline void resetContext(CipherCtx* ctx) noexcept
    {
        EVP_CIPHER_CTX_reset(ctx);
    }

    static inline bool isAEAD(const Cipher* cipher)
    {
        return EVP_CIPHER_get_flags(cipher) & EVP_CIPH_FLAG_AEAD_CIPHER;
    }

    static inline size_t getKeyLength(const Cipher* cipher)
    {
        return EVP_CIPHER_get_key_length(cipher);
    }

    static inline size_t getBlockLength(const Cipher* cipher)
    {
        return EVP_CIPHER_get_block_size(cipher);
    }

    static inline size_t getIVLength(const Cipher* cipher)
    {
        return EVP_CIPHER_get_iv_length(cipher);
    }
};

} // namespace tlsh::crypto
