#include <string>
#include <openssl/kdf.h>
#include <openssl/core_names.h>

#include <tlsh/crypto/exception.hpp>
#include <tlsh/crypto/pointers.hpp>
#include <tlsh/crypto/crypto_manager.hpp>
#include <tlsh/crypto/prf.hpp>

namespace tlsh::crypto
{

void tls1Prf(std::string_view algorithm, nonstd::span<const uint8_t> secret, std::string_view label,
             nonstd::span<const uint8_t> seedA, nonstd::span<const uint8_t> seedB, nonstd::span<uint8_t> out)
{
    auto kdf = CryptoManager::getInstance().fetchKdf(OSSL_KDF_NAME_TLS1_PRF);

    KdfCtxPtr kctx(EVP_KDF_CTX_new(kdf));
    ThrowIfTrue(kctx == nullptr);

    std::string digest(algorithm);

    OSSL_PARAM params[6], *p = params;
    *p++ = OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest.data(), 0);
    *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SECRET, const_cast<uint8_t*>(secret.data()),
                                             secret.size());
    *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SEED, const_cast<char*>(label.data()), label.size());
    if (!seedA.empty())
        *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SEED, const_cast<uint8_t*>(seedA.data()),
                                                 seedA.size());
    if (!seedB.empty())
        *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SEED, const_cast<uint8_t*>(seedB.data()),
                                                 seedB.size());
    *p = OSSL_PARAM_construct_end();

    ThrowIfFalse(0 < EVP_KDF_derive(kctx, out.data(), out.size(), params));
}

} // namespace tlsh::crypto
