#include <casket/utils/exception.hpp>

#include <tlsh/crypto/crypto_manager.hpp>
#include <tlsh/crypto/cipher_traits.hpp>
#include <tlsh/crypto/hmac_traits.hpp>
#include <tlsh/tls/record/cipher_state.hpp>

namespace tlsh::tls
{

CipherState CipherState::create(const CipherSuite& suite, ProtocolVersion version, nonstd::span<const uint8_t> key,
                                 nonstd::span<const uint8_t> iv, nonstd::span<const uint8_t> macKey)
{
    casket::ThrowIfFalse(key.size() == suite.keyLength, "Invalid write key length");
    casket::ThrowIfFalse(iv.size() == suite.fixedIvLength, "Invalid write IV length");
    casket::ThrowIfFalse(macKey.size() == suite.macLength, "Invalid MAC key length");

    auto& manager = crypto::CryptoManager::getInstance();

    CipherState state;
    state.suite = &suite;
    state.version = version;
    state.cipher = manager.fetchCipher(suite.cipher);
    state.cipherCtx = crypto::CipherTraits::createContext();
    state.key.assign(key);
    state.iv.assign(iv);

    if (!suite.isAEAD())
    {
        state.macHash = manager.fetchDigest(suite.macDigest);
        state.macCtx = crypto::HmacTraits::createContext();
        state.macKey.assign(macKey);
    }

    return state;
}

} // namespace tlsh::tls
