/**
 * @file cert_ops.h
 * @brief Pure X.509 certificate operations - no I/O, no repository access
 *
 * All functions in this module are idempotent and side-effect free.
 * They operate only on OpenSSL X509/X509_CRL structures passed as arguments.
 *
 * RFC 5280 Section 6.1 (Basic Path Validation) utilities.
 */

#pragma once

#include <ctime>
#include <string>
#include <vector>
#include <cstdint>
#include <openssl/x509.h>
#include <openssl/asn1.h>

namespace xkms::validation {

/// @name Signature Verification
/// @{

/**
 * @brief Verify certificate signature using issuer's public key
 *
 * @param cert Certificate to verify (non-owning)
 * @param issuerCert Issuer certificate containing public key (non-owning)
 * @return true if signature is cryptographically valid
 */
bool verifyCertificateSignature(X509* cert, X509* issuerCert);

/**
 * @brief Verify CRL signature using issuer's public key
 *
 * @param crl CRL to verify (non-owning)
 * @param issuerCert Certificate of the CRL issuer (non-owning)
 * @return true if signature is cryptographically valid
 */
bool verifyCrlSignature(X509_CRL* crl, X509* issuerCert);

/// @}

/// @name Certificate Status Checks
/// @{

/**
 * @brief Check if certificate has expired (notAfter < at)
 * @param cert Certificate to check (non-owning)
 * @param at Point in time to evaluate
 * @return true if expired (or cert is null)
 */
bool isCertificateExpired(X509* cert, time_t at);

/**
 * @brief Check if certificate is not yet valid (notBefore > at)
 * @param cert Certificate to check (non-owning)
 * @param at Point in time to evaluate
 * @return true if not yet valid (or cert is null)
 */
bool isCertificateNotYetValid(X509* cert, time_t at);

/**
 * @brief Check if certificate is self-signed
 *
 * Subject and issuer names match (OpenSSL canonical comparison, RFC 5280
 * Section 7.1) and the signature verifies under the certificate's own key.
 * A self-issued certificate signed by a different key is not self-signed.
 *
 * @param cert Certificate to check (non-owning)
 * @return true if self-signed
 */
bool isSelfSigned(X509* cert);

/// @brief Canonical X.509 name equality
bool namesMatch(const X509_NAME* a, const X509_NAME* b);

/// @}

/// @name Identity
/// @{

/**
 * @brief Calculate SHA-256 fingerprint over the DER encoding
 * @param cert Certificate (non-owning)
 * @return 64-char lowercase hex string, or empty on error
 */
std::string getCertificateFingerprint(X509* cert);

/// @brief DER encoding of the certificate, empty on error
std::vector<uint8_t> toDer(X509* cert);

/// @brief Same encoded certificate
bool sameCertificate(X509* a, X509* b);

/// @}

/// @name DN / field extraction
/// @{

/**
 * @brief Extract Subject DN from certificate
 * @param cert Certificate (non-owning)
 * @return Subject DN in OpenSSL oneline format (e.g., "/C=US/O=Example/CN=Root")
 */
std::string getSubjectDn(X509* cert);

/**
 * @brief Extract Issuer DN from certificate
 * @param cert Certificate (non-owning)
 * @return Issuer DN in OpenSSL oneline format
 */
std::string getIssuerDn(X509* cert);

/// @brief CRL issuer DN in OpenSSL oneline format
std::string getCrlIssuerDn(X509_CRL* crl);

/// @brief Serial number as uppercase hex, empty on error
std::string getSerialNumberHex(X509* cert);

/// @}

/// @name Time Utilities
/// @{

/**
 * @brief Convert ASN1_TIME to ISO 8601 string
 * @param t ASN.1 time structure (non-owning)
 * @return ISO 8601 formatted string (e.g., "2026-02-16T12:00:00Z"), or empty on error
 */
std::string asn1TimeToIso8601(const ASN1_TIME* t);

/// @}

} // namespace xkms::validation
