#include <array>
#include <openssl/obj_mac.h>
#include <tlsh/tls/cipher_suite_manager.hpp>

namespace tlsh::tls
{

namespace
{

using KX = KeyExchange;
using AU = Authentication;
using CM = CipherMode;

// clang-format off
constexpr std::array<CipherSuite, 16> gCipherSuites{{
    // id      name                                       kx         auth       mode      cipher               key fiv riv mac         mlen tag  prf
    {0xC02B, "TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256", KX::ECDHE, AU::ECDSA, CM::AEAD, SN_aes_128_gcm,      16, 4,  8,  "",         0,   16, SN_sha256},
    {0xC02F, "TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256",   KX::ECDHE, AU::RSA,   CM::AEAD, SN_aes_128_gcm,      16, 4,  8,  "",         0,   16, SN_sha256},
    {0xC02C, "TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384", KX::ECDHE, AU::ECDSA, CM::AEAD, SN_aes_256_gcm,      32, 4,  8,  "",         0,   16, SN_sha384},
    {0xC030, "TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384",   KX::ECDHE, AU::RSA,   CM::AEAD, SN_aes_256_gcm,      32, 4,  8,  "",         0,   16, SN_sha384},
    {0xC023, "TLS_ECDHE_ECDSA_WITH_AES_128_CBC_SHA256", KX::ECDHE, AU::ECDSA, CM::CBC,  SN_aes_128_cbc,      16, 16, 16, SN_sha256,  32,  0,  SN_sha256},
    {0xC027, "TLS_ECDHE_RSA_WITH_AES_128_CBC_SHA256",   KX::ECDHE, AU::RSA,   CM::CBC,  SN_aes_128_cbc,      16, 16, 16, SN_sha256,  32,  0,  SN_sha256},
    {0xC009, "TLS_ECDHE_ECDSA_WITH_AES_128_CBC_SHA",    KX::ECDHE, AU::ECDSA, CM::CBC,  SN_aes_128_cbc,      16, 16, 16, SN_sha1,    20,  0,  SN_sha256},
    {0xC013, "TLS_ECDHE_RSA_WITH_AES_128_CBC_SHA",      KX::ECDHE, AU::RSA,   CM::CBC,  SN_aes_128_cbc,      16, 16, 16, SN_sha1,    20,  0,  SN_sha256},
    {0xC00A, "TLS_ECDHE_ECDSA_WITH_AES_256_CBC_SHA",    KX::ECDHE, AU::ECDSA, CM::CBC,  SN_aes_256_cbc,      32, 16, 16, SN_sha1,    20,  0,  SN_sha256},
    {0xC014, "TLS_ECDHE_RSA_WITH_AES_256_CBC_SHA",      KX::ECDHE, AU::RSA,   CM::CBC,  SN_aes_256_cbc,      32, 16, 16, SN_sha1,    20,  0,  SN_sha256},
    {0x009C, "TLS_RSA_WITH_AES_128_GCM_SHA256",         KX::RSA,   AU::RSA,   CM::AEAD, SN_aes_128_gcm,      16, 4,  8,  "",         0,   16, SN_sha256},
    {0x009D, "TLS_RSA_WITH_AES_256_GCM_SHA384",         KX::RSA,   AU::RSA,   CM::AEAD, SN_aes_256_gcm,      32, 4,  8,  "",         0,   16, SN_sha384},
    {0x003C, "TLS_RSA_WITH_AES_128_CBC_SHA256",         KX::RSA,   AU::RSA,   CM::CBC,  SN_aes_128_cbc,      16, 16, 16, SN_sha256,  32,  0,  SN_sha256},
    {0x003D, "TLS_RSA_WITH_AES_256_CBC_SHA256",         KX::RSA,   AU::RSA,   CM::CBC,  SN_aes_256_cbc,      32, 16, 16, SN_sha256,  32,  0,  SN_sha256},
    {0x002F, "TLS_RSA_WITH_AES_128_CBC_SHA",            KX::RSA,   AU::RSA,   CM::CBC,  SN_aes_128_cbc,      16, 16, 16, SN_sha1,    20,  0,  SN_sha256},
    {0x0035, "TLS_RSA_WITH_AES_256_CBC_SHA",            KX::RSA,   AU::RSA,   CM::CBC,  SN_aes_256_cbc,      32, 16, 16, SN_sha1,    20,  0,  SN_sha256},
}};
// clang-format on

} // namespace

CipherSuiteManager& CipherSuiteManager::getInstance()
{
    static CipherSuiteManager gInstance;
    return gInstance;
}

const CipherSuite* CipherSuiteManager::getCipherSuiteById(uint16_t id) const noexcept
{
    for (const auto& suite : gCipherSuites)
    {
        if (suite.id == id)
        {
            return &suite;
        }
    }
    return nullptr;
}

const CipherSuite* CipherSuiteManager::getCipherSuiteByName(std::string_view name) const noexcept
{
    for (const auto& suite : gCipherSuites)
    {
        if (suite.name == name)
        {
            return &suite;
        }
    }
    return nullptr;
}

std::vector<const CipherSuite*> CipherSuiteManager::getCipherSuites() const
{
    std::vector<const CipherSuite*> suites;
    suites.reserve(gCipherSuites.size());
    for (const auto& suite : gCipherSuites)
    {
        suites.push_back(&suite);
    }
    return suites;
}

} // namespace tlsh::tls
