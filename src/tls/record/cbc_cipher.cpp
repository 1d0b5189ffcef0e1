#include <array>
#include <cstring>

#include <openssl/crypto.h>
#include <openssl/err.h>

#include <casket/utils/exception.hpp>

#include <tlsh/crypto/cipher_traits.hpp>
#include <tlsh/crypto/exception.hpp>
#include <tlsh/crypto/rand.hpp>

#include <tlsh/tls/record/cbc_cipher.hpp>
#include <tlsh/tls/record/tls1_mac.hpp>
#include <tlsh/tls/exception.hpp>

namespace tlsh::tls
{

namespace
{

[[noreturn]] void ThrowBadRecordMac()
{
    ERR_clear_error();
    throw Exception(MakeErrorCode(Error::BadRecordMac), "Bad record MAC");
}

} // namespace

size_t CbcCipher::overhead(const CipherState& state)
{
    const size_t blockSize = crypto::CipherTraits::getBlockLength(state.cipher);
    return state.suite->recordIvLength + state.suite->macLength + blockSize;
}

size_t CbcCipher::seal(CipherState& state, RecordType type, uint64_t seq, nonstd::span<const uint8_t> in,
                       nonstd::span<uint8_t> out)
{
    const size_t blockSize = crypto::CipherTraits::getBlockLength(state.cipher);
    const size_t ivSize = state.suite->recordIvLength;
    const size_t macSize = state.suite->macLength;

    const size_t unpadded = in.size() + macSize + 1;
    const size_t paddedSize = ((unpadded + blockSize - 1) / blockSize) * blockSize;
    const size_t paddingLength = paddedSize - unpadded;

    casket::ThrowIfTrue(out.size() < ivSize + paddedSize, "Output buffer is too small");

    auto iv = out.first(ivSize);
    crypto::Rand::generate(iv);

    auto body = out.subspan(ivSize, paddedSize);
    std::memcpy(body.data(), in.data(), in.size());

    auto mac = computeTls1Mac(state.macCtx, state.macHash, state.macKey, seq, type, state.version, in,
                              body.subspan(in.size(), macSize));
    casket::ThrowIfFalse(mac.size() == macSize, "Unexpected MAC size");

    std::memset(body.data() + in.size() + macSize, static_cast<int>(paddingLength), paddingLength + 1);

    crypto::CipherTraits::resetContext(state.cipherCtx);
    crypto::ThrowIfFalse(0 < EVP_EncryptInit_ex(state.cipherCtx, state.cipher, nullptr, state.key.data(), iv.data()));
    crypto::ThrowIfFalse(0 < EVP_CIPHER_CTX_set_padding(state.cipherCtx, 0));

    int length{0};
    crypto::ThrowIfFalse(0 < EVP_EncryptUpdate(state.cipherCtx, body.data(), &length, body.data(),
                                               static_cast<int>(body.size())));
    int finalLength{0};
    crypto::ThrowIfFalse(0 < EVP_EncryptFinal_ex(state.cipherCtx, body.data() + length, &finalLength));
    casket::ThrowIfFalse(static_cast<size_t>(length + finalLength) == paddedSize, "Invalid processed length");

    return ivSize + paddedSize;
}

size_t CbcCipher::open(CipherState& state, RecordType type, uint64_t seq, nonstd::span<const uint8_t> in,
                       nonstd::span<uint8_t> out)
{
    const size_t blockSize = crypto::CipherTraits::getBlockLength(state.cipher);
    const size_t ivSize = state.suite->recordIvLength;
    const size_t macSize = state.suite->macLength;

    if (in.size() < ivSize + blockSize || (in.size() - ivSize) % blockSize != 0 ||
        in.size() - ivSize < macSize + 1)
    {
        ThrowBadRecordMac();
    }

    auto iv = in.first(ivSize);
    auto cipherText = in.subspan(ivSize);
    casket::ThrowIfTrue(out.size() < cipherText.size(), "Output buffer is too small");

    crypto::CipherTraits::resetContext(state.cipherCtx);
    crypto::ThrowIfFalse(0 < EVP_DecryptInit_ex(state.cipherCtx, state.cipher, nullptr, state.key.data(), iv.data()));
    crypto::ThrowIfFalse(0 < EVP_CIPHER_CTX_set_padding(state.cipherCtx, 0));

    int length{0};
    if (0 >= EVP_DecryptUpdate(state.cipherCtx, out.data(), &length, cipherText.data(),
                               static_cast<int>(cipherText.size())))
    {
        ThrowBadRecordMac();
    }
    int finalLength{0};
    if (0 >= EVP_DecryptFinal_ex(state.cipherCtx, out.data() + length, &finalLength))
    {
        ThrowBadRecordMac();
    }

    const size_t plainSize = static_cast<size_t>(length + finalLength);
    const uint8_t paddingLength = out[plainSize - 1];

    // Padding and MAC are both checked before reporting, the failure cause is not revealed.
    bool good = static_cast<size_t>(paddingLength) + 1 + macSize <= plainSize;
    const size_t stripped = good ? static_cast<size_t>(paddingLength) + 1 : 1;

    uint8_t diff{0};
    for (size_t i = 0; i < stripped; ++i)
    {
        diff |= static_cast<uint8_t>(out[plainSize - 1 - i] ^ paddingLength);
    }
    good = good && diff == 0;

    const size_t contentSize = plainSize - stripped - macSize;
    auto content = out.first(contentSize);
    auto receivedMac = out.subspan(contentSize, macSize);

    std::array<uint8_t, TLS_MAX_MAC_LENGTH> buffer;
    auto expectedMac = computeTls1Mac(state.macCtx, state.macHash, state.macKey, seq, type, state.version, content,
                                      buffer);

    good = good && expectedMac.size() == receivedMac.size() &&
           CRYPTO_memcmp(expectedMac.data(), receivedMac.data(), receivedMac.size()) == 0;

    if (!good)
    {
        ThrowBadRecordMac();
    }

    return contentSize;
}

} // namespace tlsh::tls
