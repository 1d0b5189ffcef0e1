#pragma once
#include <openssl/x509_vfy.h>

namespace tlsh::crypto
{

enum class Encoding
{
    PEM,
    DER,
};

enum class VerifyFlag
{
    CrlCheck = X509_V_FLAG_CRL_CHECK,
    CrlCheckAll = X509_V_FLAG_CRL_CHECK_ALL,
    StrictCheck = X509_V_FLAG_X509_STRICT,
    CheckSelfSigned = X509_V_FLAG_CHECK_SS_SIGNATURE,
    SearchTrustedFirst = X509_V_FLAG_TRUSTED_FIRST,
    PartialChain = X509_V_FLAG_PARTIAL_CHAIN,
};

using Bio = struct bio_st;
using X509Cert = struct x509_st;
using X509Name = struct X509_name_st;
using X509Store = struct x509_store_st;
using X509StoreCtx = struct x509_store_ctx_st;
using Hash = struct evp_md_st;
using HashCtx = struct evp_md_ctx_st;
using Key = struct evp_pkey_st;
using KeyCtx = struct evp_pkey_ctx_st;
using Cipher = struct evp_cipher_st;
using CipherCtx = struct evp_cipher_ctx_st;
using Kdf = struct evp_kdf_st;
using KdfCtx = struct evp_kdf_ctx_st;
using Mac = struct evp_mac_st;
using MacCtx = struct evp_mac_ctx_st;
using LibContext = struct ossl_lib_ctx_st;

using CertStack = STACK_OF(X509);

} // namespace tlsh::crypto
