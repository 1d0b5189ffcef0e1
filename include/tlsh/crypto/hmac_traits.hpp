#pragma once
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/core_names.h>

#include <casket/nonstd/span.hpp>
#include <tlsh/crypto/crypto_manager.hpp>
#include <tlsh/crypto/hash_traits.hpp>
#include <tlsh/crypto/pointers.hpp>
#include <tlsh/crypto/exception.hpp>

namespace tlsh::crypto
{

class HmacTraits
{
public:
    static inline MacCtxPtr createContext()
    {
        auto mac = CryptoManager::getInstance().fetchMac("HMAC");
        auto ctx = MacCtxPtr{EVP_MAC_CTX_new(mac)};
        ThrowIfTrue(ctx == nullptr, "failed to create HMAC context");
        return ctx;
    }

    static inline void initHmac(MacCtx* ctx, const Hash* algorithm, nonstd::span<const uint8_t> key)
    {
        char* digest = const_cast<char*>(HashTraits::getName(algorithm));

        OSSL_PARAM params[2];
        params[0] = OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0);
        params[1] = OSSL_PARAM_construct_end();

        ThrowIfFalse(0 < EVP_MAC_init(ctx, key.data(), key.size(), params));
    }

    static inline void updateHmac(MacCtx* ctx, nonstd::span<const uint8_t> message)
    {
        ThrowIfFalse(0 < EVP_MAC_update(ctx, message.data(), message.size()));
    }

    static inline nonstd::span<uint8_t> finalHmac(MacCtx* ctx, nonstd::span<uint8_t> buffer)
    {
        size_t hmacSize = 0;
        ThrowIfFalse(0 < EVP_MAC_final(ctx, buffer.data(), &hmacSize, buffer.size()));
        return {buffer.data(), hmacSize};
    }
};

} // namespace tlsh::crypto
