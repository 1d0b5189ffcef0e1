/// @file
/// @brief Declaration of error handling functions for cryptography.

#pragma once
#include <system_error>
#include <openssl/x509_vfy.h>

namespace tlsh::crypto
{

/// @brief Translates an error code from an unsigned long to a std::error_code.
/// @param error The error code to translate.
/// @return The corresponding std::error_code.
std::error_code TranslateError(unsigned long error);

/// @brief Retrieves the last error that occurred.
/// @return The last error as a std::error_code.
std::error_code GetLastError();

} // namespace tlsh::crypto

namespace tlsh::crypto::verify
{

/// @brief Certificate path validation results (subset of X509_V_ERR_*).
enum class Error
{
    No = X509_V_OK,
    Unspecified = X509_V_ERR_UNSPECIFIED,
    UnableToGetIssuerCert = X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT,
    UnableToDecryptCertSignature = X509_V_ERR_UNABLE_TO_DECRYPT_CERT_SIGNATURE,
    UnableToDecodeIssuerPublicKey = X509_V_ERR_UNABLE_TO_DECODE_ISSUER_PUBLIC_KEY,
    CertSignatureFailure = X509_V_ERR_CERT_SIGNATURE_FAILURE,
    CertNotYetValid = X509_V_ERR_CERT_NOT_YET_VALID,
    CertHasExpired = X509_V_ERR_CERT_HAS_EXPIRED,
    InvalidNotBeforeField = X509_V_ERR_ERROR_IN_CERT_NOT_BEFORE_FIELD,
    InvalidNotAfterField = X509_V_ERR_ERROR_IN_CERT_NOT_AFTER_FIELD,
    OutOfMemory = X509_V_ERR_OUT_OF_MEM,
    SelfSignedCert = X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT,
    SelfSignedCertInChain = X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN,
    UnableToGetIssuerCertLocally = X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY,
    UnableToVerifyLeafSignature = X509_V_ERR_UNABLE_TO_VERIFY_LEAF_SIGNATURE,
    CertChainTooLong = X509_V_ERR_CERT_CHAIN_TOO_LONG,
    CertRevoked = X509_V_ERR_CERT_REVOKED,
    InvalidCA = X509_V_ERR_INVALID_CA,
    PathLengthExceed = X509_V_ERR_PATH_LENGTH_EXCEEDED,
    InvalidPurpose = X509_V_ERR_INVALID_PURPOSE,
    CertUntrusted = X509_V_ERR_CERT_UNTRUSTED,
    CertRejected = X509_V_ERR_CERT_REJECTED,
    KeyUsageNoCertSign = X509_V_ERR_KEYUSAGE_NO_CERTSIGN,
    UnhandledCriticalExtension = X509_V_ERR_UNHANDLED_CRITICAL_EXTENSION,
    HostnameMismatch = X509_V_ERR_HOSTNAME_MISMATCH,
    IPAddressMismatch = X509_V_ERR_IP_ADDRESS_MISMATCH,
    EEKeyTooSmall = X509_V_ERR_EE_KEY_TOO_SMALL,
    CAKeyTooSmall = X509_V_ERR_CA_KEY_TOO_SMALL,
    CAMsgDigestTooWeak = X509_V_ERR_CA_MD_TOO_WEAK,
    InvalidCall = X509_V_ERR_INVALID_CALL,
};

std::error_code MakeErrorCode(Error e);

} // namespace tlsh::crypto::verify
