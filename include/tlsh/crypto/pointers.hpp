#pragma once

#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/kdf.h>
#include <openssl/safestack.h>

#include <tlsh/crypto/typedefs.hpp>
#include <tlsh/utils/custom_unique_ptr.hpp>

namespace tlsh::crypto
{

struct CertStack0Deleter
{
    void operator()(CertStack* stack) const noexcept
    {
        sk_X509_free(stack);
    }
};

struct CertStack1Deleter
{
    void operator()(CertStack* stack) const noexcept
    {
        sk_X509_pop_free(stack, X509_free);
    }
};

TLSH_DEFINE_CUSTOM_UNIQUE_PTR(BioPtr, Bio, BIO_free_all);

TLSH_DEFINE_CUSTOM_UNIQUE_PTR(X509CertPtr, X509Cert, X509_free);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR(X509NamePtr, X509Name, X509_NAME_free);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR(X509StorePtr, X509Store, X509_STORE_free);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR(X509StoreCtxPtr, X509StoreCtx, X509_STORE_CTX_free);

TLSH_DEFINE_CUSTOM_UNIQUE_PTR(KeyPtr, Key, EVP_PKEY_free);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR(KeyCtxPtr, KeyCtx, EVP_PKEY_CTX_free);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR(HashPtr, Hash, EVP_MD_free);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR(HashCtxPtr, HashCtx, EVP_MD_CTX_free);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR(CipherPtr, Cipher, EVP_CIPHER_free);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR(CipherCtxPtr, CipherCtx, EVP_CIPHER_CTX_free);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR(KdfPtr, Kdf, EVP_KDF_free);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR(KdfCtxPtr, KdfCtx, EVP_KDF_CTX_free);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR(MacPtr, Mac, EVP_MAC_free);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR(MacCtxPtr, MacCtx, EVP_MAC_CTX_free);

TLSH_DEFINE_CUSTOM_UNIQUE_PTR_WITH_DELETER(CertStack0Ptr, CertStack, CertStack0Deleter);
TLSH_DEFINE_CUSTOM_UNIQUE_PTR_WITH_DELETER(CertStack1Ptr, CertStack, CertStack1Deleter);

} // namespace tlsh::crypto
