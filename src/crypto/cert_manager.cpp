#include <openssl/x509_vfy.h>
#include <tlsh/crypto/cert_manager.hpp>
#include <tlsh/crypto/exception.hpp>

#include <casket/utils/exception.hpp>

namespace fs = std::filesystem;

namespace tlsh::crypto
{

CertManager::CertManager()
    : store_(X509_STORE_new())
{
    casket::ThrowIfTrue(store_ == nullptr, "memory allocation error");
}

CertManager::~CertManager() noexcept
{
}

CertManager& CertManager::useDefaultPaths()
{
    crypto::ThrowIfFalse(0 < X509_STORE_set_default_paths(store_));
    return *this;
}

CertManager& CertManager::addCA(X509Cert* cert)
{
    casket::ThrowIfTrue(cert == nullptr, "invalid argument");
    crypto::ThrowIfFalse(0 < X509_STORE_add_cert(store_, cert));
    return *this;
}

CertManager& CertManager::loadFile(const std::filesystem::path& path)
{
    casket::ThrowIfFalse(fs::is_regular_file(path), "'" + path.string() + "' is not a file!");
    crypto::ThrowIfFalse(0 < X509_STORE_load_file(store_, path.c_str()));
    return *this;
}

CertManager& CertManager::loadDirectory(const std::filesystem::path& path)
{
    casket::ThrowIfFalse(fs::is_directory(path), "'" + path.string() + "' is not a directory!");
    crypto::ThrowIfFalse(0 < X509_STORE_load_path(store_, path.c_str()));
    return *this;
}

X509Store* CertManager::certStore()
{
    return store_.get();
}

} // namespace tlsh::crypto
