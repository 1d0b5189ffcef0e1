#pragma once
#include <string>
#include <filesystem>
#include <casket/nonstd/span.hpp>
#include <tlsh/crypto/pointers.hpp>

namespace tlsh::crypto
{

class Cert final
{
public:
    static X509CertPtr shallowCopy(X509Cert* cert);

    static bool isEqual(const X509Cert* a, const X509Cert* b);

    static KeyPtr publicKey(X509Cert* cert);

    /// @brief One-line RFC 2253 rendering of the subject name.
    static std::string subjectName(X509Cert* cert);

    static std::string issuerName(X509Cert* cert);

    static X509CertPtr fromFile(const std::filesystem::path& path);

    static X509CertPtr fromBio(Bio* bio, Encoding encoding);

    /// @brief Parses a DER certificate; the whole buffer must be consumed.
    static X509CertPtr fromBuffer(nonstd::span<const uint8_t> input);

    static std::vector<uint8_t> toBuffer(X509Cert* cert);
};

} // namespace tlsh::crypto
