#include <string>
#include <tlsh/crypto/crypto_manager.hpp>
#include <tlsh/crypto/exception.hpp>

namespace tlsh::crypto
{

CryptoManager::CryptoManager()
    : libctx_(nullptr)
{
}

CryptoManager& CryptoManager::getInstance()
{
    static CryptoManager instance;
    return instance;
}

CryptoManager::~CryptoManager() noexcept
{
}

MacPtr CryptoManager::fetchMac(std::string_view algorithm)
{
    auto mac = MacPtr(EVP_MAC_fetch(libctx_, std::string(algorithm).c_str(), nullptr));
    ThrowIfTrue(mac == nullptr, "failed to fetch MAC");
    return mac;
}

KdfPtr CryptoManager::fetchKdf(std::string_view algorithm)
{
    auto kdf = KdfPtr(EVP_KDF_fetch(libctx_, std::string(algorithm).c_str(), nullptr));
    ThrowIfTrue(kdf == nullptr, "failed to fetch KDF");
    return kdf;
}

HashPtr CryptoManager::fetchDigest(std::string_view algorithm)
{
    auto digest = HashPtr(EVP_MD_fetch(libctx_, std::string(algorithm).c_str(), nullptr));
    ThrowIfTrue(digest == nullptr, "failed to fetch digest");
    return digest;
}

CipherPtr CryptoManager::fetchCipher(std::string_view algorithm)
{
    auto cipher = CipherPtr(EVP_CIPHER_fetch(libctx_, std::string(algorithm).c_str(), nullptr));
    ThrowIfTrue(cipher == nullptr, "failed to fetch cipher");
    return cipher;
}

KeyCtxPtr CryptoManager::createKeyContext(std::string_view algorithm)
{
    auto ctx = KeyCtxPtr(EVP_PKEY_CTX_new_from_name(libctx_, std::string(algorithm).c_str(), nullptr));
    ThrowIfTrue(ctx == nullptr);
    return ctx;
}

KeyCtxPtr CryptoManager::createKeyContext(Key* key)
{
    auto ctx = KeyCtxPtr(EVP_PKEY_CTX_new_from_pkey(libctx_, key, nullptr));
    ThrowIfTrue(ctx == nullptr);
    return ctx;
}

} // namespace tlsh::crypto
