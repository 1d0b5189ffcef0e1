/// @file
/// @brief Declaration of the cipher suite manager class.

#pragma once
#include <cstdint>
#include <vector>
#include <string_view>
#include <tlsh/tls/cipher_suite.hpp>

namespace tlsh::tls
{

/// @brief Static table of the cipher suites the client implements.
class CipherSuiteManager final
{
private:
    CipherSuiteManager() = default;

public:
    /// @brief Gets the singleton instance of the CipherSuiteManager.
    /// @return Reference to the CipherSuiteManager instance.
    static CipherSuiteManager& getInstance();

    CipherSuiteManager(const CipherSuiteManager& other) = delete;
    CipherSuiteManager& operator=(const CipherSuiteManager& other) = delete;

    /// @brief Gets a cipher suite by its IANA identifier.
    /// @param id The ID of the cipher suite.
    /// @return Pointer to the table entry, nullptr if the suite is not implemented.
    const CipherSuite* getCipherSuiteById(uint16_t id) const noexcept;

    /// @brief Gets a cipher suite by its IANA name (e.g. TLS_RSA_WITH_AES_128_CBC_SHA).
    /// @param name The name of the cipher suite.
    /// @return Pointer to the table entry, nullptr if the suite is not implemented.
    const CipherSuite* getCipherSuiteByName(std::string_view name) const noexcept;

    /// @brief Gets all suites in default preference order: ECDHE before RSA, AEAD before CBC.
    std::vector<const CipherSuite*> getCipherSuites() const;
};

} // namespace tlsh::tls
