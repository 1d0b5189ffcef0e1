#include <string>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/err.h>

#include <casket/utils/exception.hpp>

#include <tlsh/crypto/signature.hpp>
#include <tlsh/crypto/hash_traits.hpp>
#include <tlsh/crypto/asymm_key.hpp>
#include <tlsh/crypto/crypto_manager.hpp>
#include <tlsh/crypto/exception.hpp>

namespace tlsh::crypto
{

namespace
{

void SetupKeyContext(KeyCtx* keyCtx, SignatureScheme scheme)
{
    if (scheme.isPSS())
    {
        ThrowIfFalse(0 < EVP_PKEY_CTX_set_rsa_padding(keyCtx, RSA_PKCS1_PSS_PADDING));
        ThrowIfFalse(0 < EVP_PKEY_CTX_set_rsa_pss_saltlen(keyCtx, RSA_PSS_SALTLEN_DIGEST));
    }
    else if (scheme.getKeyAlgorithm() == "RSA")
    {
        ThrowIfFalse(0 < EVP_PKEY_CTX_set_rsa_padding(keyCtx, RSA_PKCS1_PADDING));
    }
}

} // namespace

std::vector<uint8_t> Signature::sign(SignatureScheme scheme, Key* privateKey, nonstd::span<const uint8_t> tbs)
{
    casket::ThrowIfFalse(scheme.isSupported(), "Unsupported signature scheme");

    auto hash = CryptoManager::getInstance().fetchDigest(scheme.getHashAlgorithm());
    auto ctx = HashTraits::createContext();

    KeyCtx* keyCtx{nullptr};
    ThrowIfFalse(0 < EVP_DigestSignInit(ctx, &keyCtx, hash, nullptr, privateKey));
    SetupKeyContext(keyCtx, scheme);

    size_t signatureSize{0};
    ThrowIfFalse(0 < EVP_DigestSign(ctx, nullptr, &signatureSize, tbs.data(), tbs.size()));

    std::vector<uint8_t> signature(signatureSize);
    ThrowIfFalse(0 < EVP_DigestSign(ctx, signature.data(), &signatureSize, tbs.data(), tbs.size()));
    signature.resize(signatureSize);

    return signature;
}

bool Signature::verify(SignatureScheme scheme, Key* publicKey, nonstd::span<const uint8_t> tbs,
                       nonstd::span<const uint8_t> signature)
{
    if (!scheme.isSupported() || !AsymmKey::isAlgorithm(publicKey, scheme.getKeyAlgorithm()))
    {
        return false;
    }

    auto hash = CryptoManager::getInstance().fetchDigest(scheme.getHashAlgorithm());
    auto ctx = HashTraits::createContext();

    KeyCtx* keyCtx{nullptr};
    ThrowIfFalse(0 < EVP_DigestVerifyInit(ctx, &keyCtx, hash, nullptr, publicKey));
    SetupKeyContext(keyCtx, scheme);

    int ret = EVP_DigestVerify(ctx, signature.data(), signature.size(), tbs.data(), tbs.size());
    if (ret != 1)
    {
        ERR_clear_error();
        return false;
    }
    return true;
}

} // namespace tlsh::crypto
