#pragma once
#include <string_view>
#include <tlsh/crypto/pointers.hpp>

namespace tlsh::crypto
{

/// @brief Fetches OpenSSL algorithm implementations from the library context.
class CryptoManager final
{
private:
    CryptoManager();

public:
    static CryptoManager& getInstance();

    ~CryptoManager() noexcept;

    CryptoManager(const CryptoManager&) = delete;
    CryptoManager& operator=(const CryptoManager&) = delete;

    KdfPtr fetchKdf(std::string_view algorithm);

    MacPtr fetchMac(std::string_view algorithm);

    HashPtr fetchDigest(std::string_view algorithm);

    CipherPtr fetchCipher(std::string_view algorithm);

    KeyCtxPtr createKeyContext(std::string_view algorithm);

    KeyCtxPtr createKeyContext(Key* key);

    LibContext* libraryContext() const noexcept
    {
        return libctx_;
    }

private:
    LibContext* libctx_;
};

} // namespace tlsh::crypto
