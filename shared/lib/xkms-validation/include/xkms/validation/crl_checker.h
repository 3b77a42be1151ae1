/**
 * @file crl_checker.h
 * @brief CRL revocation checker (RFC 5280 Section 6.3)
 *
 * Checks a certificate's serial number against the CRLs issued by the
 * certificate's issuer, and extracts the revocation reason.
 */

#pragma once

#include <ctime>
#include <vector>
#include <openssl/x509.h>
#include "types.h"

namespace xkms::validation {

/**
 * @brief CRL-based certificate revocation checker
 *
 * A CRL applies to a certificate when its issuer name equals the issuer
 * certificate's subject and its signature verifies with the issuer's key.
 * Applicable CRLs outside their thisUpdate/nextUpdate window are ignored.
 *
 * Usage:
 * @code
 *   CrlChecker checker(crls);
 *   CrlCheckResult result = checker.check(cert, issuerCert, time(nullptr));
 * @endcode
 */
class CrlChecker {
public:
    /**
     * @brief Constructor
     * @param crls CRL pool (non-owning, must outlive the checker)
     * @throws xkms::common::ConfigurationException if any entry is nullptr
     */
    explicit CrlChecker(const std::vector<X509_CRL*>& crls);

    /**
     * @brief Check certificate revocation status via its issuer's CRLs
     *
     * Algorithm:
     * 1. Select CRLs whose issuer name matches the issuer's subject
     * 2. Discard CRLs whose signature does not verify (CRL_INVALID)
     * 3. Discard CRLs outside their validity window at @p at (CRL_EXPIRED)
     * 4. Look up the serial number in each remaining CRL
     * 5. Extract revocation reason code and date (RFC 5280 Section 5.3.1)
     *
     * @param cert Certificate to check (non-owning)
     * @param issuerCert Certificate that issued @p cert (non-owning)
     * @param at Verification time
     * @return CrlCheckResult with revocation details
     */
    CrlCheckResult check(X509* cert, X509* issuerCert, time_t at) const;

    bool empty() const { return crls_.empty(); }
    size_t size() const { return crls_.size(); }

private:
    std::vector<X509_CRL*> crls_;
};

/// @brief RFC 5280 CRLReason code to its ASN.1 name
std::string crlReasonToString(long reasonCode);

} // namespace xkms::validation
