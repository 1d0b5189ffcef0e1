#include <vector>
#include <openssl/x509.h>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/err.h>

#include <tlsh/crypto/cert.hpp>
#include <tlsh/crypto/exception.hpp>
#include <tlsh/crypto/error_code.hpp>

namespace
{

std::string NameToString(const X509_NAME* name)
{
    using namespace tlsh::crypto;

    BioPtr bio(BIO_new(BIO_s_mem()));
    ThrowIfTrue(bio == nullptr);
    ThrowIfFalse(0 <= X509_NAME_print_ex(bio, name, 0, XN_FLAG_RFC2253));

    char* data{nullptr};
    long length = BIO_get_mem_data(bio, &data);
    return std::string(data, static_cast<size_t>(length));
}

} // namespace

namespace tlsh::crypto
{

X509CertPtr Cert::shallowCopy(X509Cert* cert)
{
    if (cert)
    {
        ThrowIfFalse(0 < X509_up_ref(cert));
        return X509CertPtr{cert};
    }
    return nullptr;
}

bool Cert::isEqual(const X509Cert* a, const X509Cert* b)
{
    return X509_cmp(a, b) == 0;
}

KeyPtr Cert::publicKey(X509Cert* cert)
{
    auto result = X509_get_pubkey(cert);
    ThrowIfTrue(result == nullptr);

    return KeyPtr{result};
}

std::string Cert::subjectName(X509Cert* cert)
{
    auto name = X509_get_subject_name(cert);
    ThrowIfTrue(name == nullptr);
    return NameToString(name);
}

std::string Cert::issuerName(X509Cert* cert)
{
    auto name = X509_get_issuer_name(cert);
    ThrowIfTrue(name == nullptr);
    return NameToString(name);
}

X509CertPtr Cert::fromFile(const std::filesystem::path& path)
{
    BioPtr bio(BIO_new_file(path.c_str(), "rb"));
    ThrowIfTrue(bio == nullptr, "Failed to open '" + path.string() + "'");
    return fromBio(bio, Encoding::PEM);
}

X509CertPtr Cert::fromBio(Bio* bio, Encoding encoding)
{
    X509CertPtr result;

    switch (encoding)
    {
    case Encoding::DER:
    {
        result.reset(d2i_X509_bio(bio, nullptr));
        break;
    }

    case Encoding::PEM:
    {
        result.reset(PEM_read_bio_X509(bio, nullptr, nullptr, nullptr));
        break;
    }

    default:
    {
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "Unsupported encoding");
    }
    }

    if (!result)
    {
        throw CryptoException(GetLastError(), "Failed to parse certificate");
    }

    return result;
}

X509CertPtr Cert::fromBuffer(nonstd::span<const uint8_t> input)
{
    const unsigned char* ptr = input.data();
    X509CertPtr result{d2i_X509(nullptr, &ptr, static_cast<long>(input.size_bytes()))};
    ThrowIfTrue(result == nullptr, "Failed to parse certificate");
    ThrowIfTrue(ptr != input.data() + input.size(), "Trailing data after certificate");
    return result;
}

std::vector<uint8_t> Cert::toBuffer(X509Cert* cert)
{
    int length = i2d_X509(cert, nullptr);
    ThrowIfFalse(0 < length);

    std::vector<uint8_t> result(static_cast<size_t>(length));
    unsigned char* ptr = result.data();
    ThrowIfFalse(0 < i2d_X509(cert, &ptr));
    return result;
}

} // namespace tlsh::crypto
