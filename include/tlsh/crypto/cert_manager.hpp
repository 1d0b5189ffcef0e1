#pragma once
#include <filesystem>
#include <casket/utils/noncopyable.hpp>
#include <tlsh/crypto/pointers.hpp>

namespace tlsh::crypto
{

/// @brief Owns the trust anchors used for certificate path validation.
class CertManager final : public casket::NonCopyable
{
public:
    CertManager();

    ~CertManager() noexcept;

    CertManager& useDefaultPaths();

    CertManager& addCA(X509Cert* cert);

    CertManager& loadFile(const std::filesystem::path& path);

    CertManager& loadDirectory(const std::filesystem::path& path);

    X509Store* certStore();

private:
    X509StorePtr store_;
};

} // namespace tlsh::crypto
