#pragma once
#include <vector>
#include <string_view>
#include <filesystem>
#include <casket/nonstd/span.hpp>
#include <tlsh/crypto/pointers.hpp>

namespace tlsh::crypto
{

class AsymmKey final
{
public:
    static KeyPtr shallowCopy(Key* key);

    static bool isAlgorithm(const Key* key, std::string_view alg);

    static size_t sizeInBytes(const Key* key);

    static KeyPtr privateKeyFromFile(const std::filesystem::path& path);

    static std::vector<uint8_t> getEncodedPublicKey(const Key* key);

    /// @brief RSAES-PKCS1-v1_5 encryption.
    static size_t encrypt(Key* publicKey, nonstd::span<const uint8_t> input, nonstd::span<uint8_t> output);

    /// @brief RSAES-PKCS1-v1_5 decryption.
    static size_t decrypt(Key* privateKey, nonstd::span<const uint8_t> input, nonstd::span<uint8_t> output);
};

class RsaAsymmKey final
{
public:
    static KeyPtr generate(unsigned int bits);
};

} // namespace tlsh::crypto
