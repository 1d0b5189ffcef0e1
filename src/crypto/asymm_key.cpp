#include <string>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/pem.h>
#include <openssl/core_names.h>

#include <tlsh/crypto/asymm_key.hpp>
#include <tlsh/crypto/crypto_manager.hpp>
#include <tlsh/crypto/exception.hpp>

namespace tlsh::crypto
{

KeyPtr AsymmKey::shallowCopy(Key* key)
{
    if (key)
    {
        ThrowIfFalse(0 < EVP_PKEY_up_ref(key));
        return KeyPtr{key};
    }
    return nullptr;
}

bool AsymmKey::isAlgorithm(const Key* key, std::string_view alg)
{
    return EVP_PKEY_is_a(key, std::string(alg).c_str());
}

size_t AsymmKey::sizeInBytes(const Key* key)
{
    int size = EVP_PKEY_get_size(key);
    ThrowIfFalse(0 < size, "unable to get key size");
    return static_cast<size_t>(size);
}

KeyPtr AsymmKey::privateKeyFromFile(const std::filesystem::path& path)
{
    BioPtr bio(BIO_new_file(path.c_str(), "rb"));
    ThrowIfTrue(bio == nullptr, "Failed to open '" + path.string() + "'");

    KeyPtr key{PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr)};
    ThrowIfTrue(key == nullptr, "Failed to parse private key");
    return key;
}

std::vector<uint8_t> AsymmKey::getEncodedPublicKey(const Key* key)
{
    size_t size{0};

    ThrowIfFalse(0 < EVP_PKEY_get_octet_string_param(key, OSSL_PKEY_PARAM_ENCODED_PUBLIC_KEY, nullptr, 0, &size));
    ThrowIfTrue(size == 0, "unable to get public key value");

    std::vector<uint8_t> publicKey(size);
    ThrowIfFalse(0 < EVP_PKEY_get_octet_string_param(key, OSSL_PKEY_PARAM_ENCODED_PUBLIC_KEY, publicKey.data(),
                                                     publicKey.size(), &size));
    publicKey.resize(size);
    return publicKey;
}

size_t AsymmKey::encrypt(Key* publicKey, nonstd::span<const uint8_t> input, nonstd::span<uint8_t> output)
{
    auto ctx = CryptoManager::getInstance().createKeyContext(publicKey);
    ThrowIfFalse(0 < EVP_PKEY_encrypt_init(ctx));
    ThrowIfFalse(0 < EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_PADDING));

    size_t outputLength{0};
    ThrowIfFalse(0 < EVP_PKEY_encrypt(ctx, nullptr, &outputLength, input.data(), input.size()));
    ThrowIfTrue(outputLength > output.size(), "output buffer too small");
    ThrowIfFalse(0 < EVP_PKEY_encrypt(ctx, output.data(), &outputLength, input.data(), input.size()));
    return outputLength;
}

size_t AsymmKey::decrypt(Key* privateKey, nonstd::span<const uint8_t> input, nonstd::span<uint8_t> output)
{
    auto ctx = CryptoManager::getInstance().createKeyContext(privateKey);
    ThrowIfFalse(0 < EVP_PKEY_decrypt_init(ctx));
    ThrowIfFalse(0 < EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_PADDING));

    size_t outputLength{0};
    ThrowIfFalse(0 < EVP_PKEY_decrypt(ctx, nullptr, &outputLength, input.data(), input.size()));
    ThrowIfTrue(outputLength > output.size(), "output buffer too small");
    ThrowIfFalse(0 < EVP_PKEY_decrypt(ctx, output.data(), &outputLength, input.data(), input.size()));
    return outputLength;
}

KeyPtr RsaAsymmKey::generate(unsigned int bits)
{
    auto ctx = CryptoManager::getInstance().createKeyContext("RSA");
    ThrowIfFalse(0 < EVP_PKEY_keygen_init(ctx));
    ThrowIfFalse(0 < EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, static_cast<int>(bits)));

    Key* pkey{nullptr};
    ThrowIfFalse(0 < EVP_PKEY_keygen(ctx, &pkey));
    return KeyPtr{pkey};
}

} // namespace tlsh::crypto
