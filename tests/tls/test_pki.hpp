#pragma once
#include <string>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/bn.h>

#include <tlsh/crypto/pointers.hpp>
#include <tlsh/crypto/exception.hpp>

namespace tlsh::test
{

/// @brief Throwaway certificate authority for handshake tests.
class TestAuthority final
{
public:
    explicit TestAuthority(crypto::KeyPtr key, const std::string& commonName = "Test Root CA")
        : key_(std::move(key))
        , cert_(generateCert(key_.get(), key_.get(), nullptr, commonName, std::string()))
    {
    }

    crypto::Key* getKey() const
    {
        return key_.get();
    }

    crypto::X509Cert* getCert() const
    {
        return cert_.get();
    }

    /// @brief Issues an end-entity certificate with a DNS subjectAltName.
    crypto::X509CertPtr sign(const std::string& commonName, const std::string& dnsName, crypto::Key* publicKey)
    {
        return generateCert(publicKey, key_.get(), cert_.get(), commonName, dnsName);
    }

private:
    static void addExtension(crypto::X509Cert* cert, X509V3_CTX* ctx, int nid, const std::string& value)
    {
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, ctx, nid, value.c_str());
        crypto::ThrowIfTrue(ext == nullptr);
        int ret = X509_add_ext(cert, ext, -1);
        X509_EXTENSION_free(ext);
        crypto::ThrowIfFalse(0 < ret);
    }

    static crypto::X509CertPtr generateCert(crypto::Key* subjectKey, crypto::Key* issuerKey,
                                            crypto::X509Cert* issuerCert, const std::string& commonName,
                                            const std::string& dnsName)
    {
        crypto::X509CertPtr cert(X509_new());
        crypto::ThrowIfTrue(cert == nullptr);

        crypto::ThrowIfFalse(X509_set_version(cert, X509_VERSION_3));

        BIGNUM* serial = BN_new();
        crypto::ThrowIfTrue(serial == nullptr);
        BN_rand(serial, 64, 0, 0);
        BN_to_ASN1_INTEGER(serial, X509_get_serialNumber(cert));
        BN_free(serial);

        crypto::ThrowIfFalse(X509_time_adj(X509_getm_notBefore(cert), -3600, nullptr));
        crypto::ThrowIfFalse(X509_time_adj(X509_getm_notAfter(cert), 24 * 3600, nullptr));

        crypto::X509NamePtr name(X509_NAME_new());
        crypto::ThrowIfTrue(name == nullptr);
        crypto::ThrowIfFalse(X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
                                                        reinterpret_cast<const unsigned char*>(commonName.c_str()),
                                                        -1, -1, 0));
        crypto::ThrowIfFalse(X509_set_subject_name(cert, name));
        crypto::ThrowIfFalse(X509_set_issuer_name(cert, issuerCert ? X509_get_subject_name(issuerCert) : name.get()));
        crypto::ThrowIfFalse(X509_set_pubkey(cert, subjectKey));

        X509V3_CTX ctx;
        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, issuerCert ? issuerCert : cert.get(), cert, nullptr, nullptr, 0);

        addExtension(cert, &ctx, NID_subject_key_identifier, "hash");
        if (issuerCert == nullptr)
        {
            addExtension(cert, &ctx, NID_basic_constraints, "critical,CA:TRUE");
            addExtension(cert, &ctx, NID_key_usage, "critical,cRLSign,keyCertSign");
        }
        else
        {
            addExtension(cert, &ctx, NID_authority_key_identifier, "keyid");
            addExtension(cert, &ctx, NID_basic_constraints, "critical,CA:FALSE");
            if (!dnsName.empty())
            {
                addExtension(cert, &ctx, NID_subject_alt_name, "DNS:" + dnsName);
            }
        }

        crypto::ThrowIfFalse(0 < X509_sign(cert, issuerKey, EVP_sha256()));
        return cert;
    }

private:
    crypto::KeyPtr key_;
    crypto::X509CertPtr cert_;
};

} // namespace tlsh::test
