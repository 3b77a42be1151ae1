/**
 * @file chain_validator.h
 * @brief PKIX-style certificate path builder and validator
 *
 * Builds a path from a target certificate to a trust anchor by depth-first
 * search over candidate issuers, backtracking whenever a branch cannot be
 * completed. Every edge must pass signature, validity-period and (when CRLs
 * are supplied) revocation checks before it is taken.
 */

#pragma once

#include <memory>
#include <vector>
#include <openssl/x509.h>
#include <spdlog/logger.h>
#include "types.h"
#include "certificate_pool.h"
#include "trust_anchor.h"

namespace xkms::validation {

/**
 * @brief Backtracking certificate path validator
 *
 * Stateless across calls; one instance may serve concurrent validations
 * as long as each call receives its own inputs.
 *
 * Usage:
 * @code
 *   ChainPathValidator validator;
 *   TrustAnchorSet anchors = buildAnchors(trustedRoots);
 *   bool ok = validator.isChainValid(target, CertificatePool(caCerts),
 *                                    CertificatePool(requestCerts), anchors, crls);
 * @endcode
 */
class ChainPathValidator {
public:
    /**
     * @brief Constructor
     * @param logger Diagnostic sink; spdlog's default logger when nullptr
     */
    explicit ChainPathValidator(std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Build and verify a path from target to a trust anchor
     *
     * Algorithm:
     * 1. Target outside its validity period fails immediately, even if it
     *    is itself an anchor
     * 2. Target that is itself an anchor is accepted as a one-element path
     * 3. Candidate issuers are collected by subject == current issuer name
     *    from the anchors, the intermediate pool and the request pool
     * 4. A candidate is taken only if it verifies the current signature,
     *    is within its validity period and (revocation enabled) the current
     *    certificate is not revoked by a current CRL from that candidate
     * 5. Reaching an anchor ends the search; exhausting a candidate list
     *    backtracks to the previous certificate. A self-issued certificate
     *    signed by another key (key rollover link) is searched through like
     *    an intermediate; a genuinely self-signed non-anchor ends the branch
     *
     * Revocation checking is enabled iff @p crls is non-empty.
     *
     * A path that cannot be built is a normal negative result (valid=false
     * with a PathFailure diagnostic), never an exception.
     *
     * @param target Target certificate (non-owning)
     * @param intermediates Intermediate CA pool
     * @param requestCerts Certificates supplied with the request
     * @param anchors Trust anchors
     * @param crls CRL pool (non-owning)
     * @param params Verification time and search bounds
     * @return PathValidationResult
     * @throws xkms::common::ConfigurationException if the target is null,
     *         the anchor set is empty, a CRL entry is null or bounds are invalid
     */
    PathValidationResult validate(
        X509* target,
        const CertificatePool& intermediates,
        const CertificatePool& requestCerts,
        const TrustAnchorSet& anchors,
        const std::vector<X509_CRL*>& crls,
        const ValidationParameters& params = ValidationParameters()) const;

    /**
     * @brief Boolean form of validate()
     */
    bool isChainValid(
        X509* target,
        const CertificatePool& intermediates,
        const CertificatePool& requestCerts,
        const TrustAnchorSet& anchors,
        const std::vector<X509_CRL*>& crls,
        const ValidationParameters& params = ValidationParameters()) const;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace xkms::validation
