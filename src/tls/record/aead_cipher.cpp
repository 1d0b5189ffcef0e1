#include <array>
#include <cstring>

#include <openssl/err.h>

#include <casket/utils/exception.hpp>
#include <casket/utils/load_store.hpp>

#include <tlsh/crypto/cipher_traits.hpp>
#include <tlsh/crypto/exception.hpp>

#include <tlsh/tls/record/aead_cipher.hpp>
#include <tlsh/tls/exception.hpp>

namespace tlsh::tls
{

namespace
{

using Nonce = std::array<uint8_t, TLS12_AEAD_NONCE_SIZE>;
using AAD = std::array<uint8_t, TLS12_AEAD_AAD_SIZE>;

AAD MakeAAD(uint64_t seq, RecordType type, ProtocolVersion version, size_t plaintextLength)
{
    AAD aad;
    casket::store_be(seq, aad.data());
    aad[8] = static_cast<uint8_t>(type);
    aad[9] = version.majorVersion();
    aad[10] = version.minorVersion();
    uint16_t size = static_cast<uint16_t>(plaintextLength);
    aad[11] = casket::get_byte<0>(size);
    aad[12] = casket::get_byte<1>(size);
    return aad;
}

Nonce MakeNonce(const CipherState& state, nonstd::span<const uint8_t> explicitNonce)
{
    Nonce nonce;
    std::copy_n(state.iv.begin(), state.iv.size(), nonce.begin());
    std::copy_n(explicitNonce.begin(), explicitNonce.size(), nonce.begin() + state.iv.size());
    return nonce;
}

void InitContext(CipherState& state, const Nonce& nonce, int enc)
{
    crypto::CipherTraits::resetContext(state.cipherCtx);
    crypto::ThrowIfFalse(0 < EVP_CipherInit_ex(state.cipherCtx, state.cipher, nullptr, nullptr, nullptr, enc));
    crypto::ThrowIfFalse(0 < EVP_CIPHER_CTX_ctrl(state.cipherCtx, EVP_CTRL_AEAD_SET_IVLEN,
                                                 static_cast<int>(nonce.size()), nullptr));
    crypto::ThrowIfFalse(0 < EVP_CipherInit_ex(state.cipherCtx, nullptr, nullptr, state.key.data(), nonce.data(), enc));
}

} // namespace

size_t AeadCipher::overhead(const CipherState& state)
{
    return state.suite->recordIvLength + state.suite->tagLength;
}

size_t AeadCipher::seal(CipherState& state, RecordType type, uint64_t seq, nonstd::span<const uint8_t> in,
                        nonstd::span<uint8_t> out)
{
    const size_t explicitSize = state.suite->recordIvLength;
    const size_t tagSize = state.suite->tagLength;

    casket::ThrowIfTrue(out.size() < explicitSize + in.size() + tagSize, "Output buffer is too small");
    casket::ThrowIfFalse(state.iv.size() + explicitSize == TLS12_AEAD_NONCE_SIZE, "Invalid nonce size");

    auto explicitNonce = out.first(explicitSize);
    casket::store_be(seq, explicitNonce.data());

    auto nonce = MakeNonce(state, explicitNonce);
    auto aad = MakeAAD(seq, type, state.version, in.size());

    InitContext(state, nonce, 1);

    int length{0};
    crypto::ThrowIfFalse(0 < EVP_EncryptUpdate(state.cipherCtx, nullptr, &length, aad.data(),
                                               static_cast<int>(aad.size())));

    auto cipherText = out.subspan(explicitSize, in.size());
    crypto::ThrowIfFalse(0 < EVP_EncryptUpdate(state.cipherCtx, cipherText.data(), &length, in.data(),
                                               static_cast<int>(in.size())));

    int finalLength{0};
    crypto::ThrowIfFalse(0 < EVP_EncryptFinal_ex(state.cipherCtx, cipherText.data() + length, &finalLength));

    auto tag = out.subspan(explicitSize + in.size(), tagSize);
    crypto::ThrowIfFalse(
        0 < EVP_CIPHER_CTX_ctrl(state.cipherCtx, EVP_CTRL_AEAD_GET_TAG, static_cast<int>(tag.size()), tag.data()));

    return explicitSize + in.size() + tagSize;
}

size_t AeadCipher::open(CipherState& state, RecordType type, uint64_t seq, nonstd::span<const uint8_t> in,
                        nonstd::span<uint8_t> out)
{
    const size_t explicitSize = state.suite->recordIvLength;
    const size_t tagSize = state.suite->tagLength;

    ThrowIfTrue(in.size() < explicitSize + tagSize, Error::BadRecordMac, "Bad record MAC");

    const size_t contentSize = in.size() - explicitSize - tagSize;
    casket::ThrowIfTrue(out.size() < contentSize, "Output buffer is too small");

    auto nonce = MakeNonce(state, in.first(explicitSize));
    auto aad = MakeAAD(seq, type, state.version, contentSize);
    auto cipherText = in.subspan(explicitSize, contentSize);
    auto tag = in.subspan(explicitSize + contentSize);

    InitContext(state, nonce, 0);

    int length{0};
    crypto::ThrowIfFalse(0 < EVP_DecryptUpdate(state.cipherCtx, nullptr, &length, aad.data(),
                                               static_cast<int>(aad.size())));
    crypto::ThrowIfFalse(0 < EVP_DecryptUpdate(state.cipherCtx, out.data(), &length, cipherText.data(),
                                               static_cast<int>(cipherText.size())));
    crypto::ThrowIfFalse(0 < EVP_CIPHER_CTX_ctrl(state.cipherCtx, EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tag.size()),
                                                 const_cast<uint8_t*>(tag.data())));

    int finalLength{0};
    if (0 >= EVP_DecryptFinal_ex(state.cipherCtx, out.data() + length, &finalLength))
    {
        ERR_clear_error();
        throw Exception(MakeErrorCode(Error::BadRecordMac), "Bad record MAC");
    }

    return contentSize;
}

} // namespace tlsh::tls
