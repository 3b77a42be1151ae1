/**
 * @file trusted_authority_validator.h
 * @brief Key binding validation against the repository's trusted authorities
 *
 * Folds the chain validator's result into a key binding status:
 *   - empty request            -> INDETERMINATE / request-unsupported
 *   - trusted path found       -> VALID / issuer-trust-established
 *   - no trusted path          -> INVALID / issuer-trust-failed
 *
 * Repository and configuration failures propagate as exceptions derived from
 * xkms::common::ConfigurationException; they are never folded into INVALID.
 */

#pragma once

#include <memory>
#include <vector>
#include <openssl/x509.h>
#include <spdlog/logger.h>
#include "types.h"
#include "providers.h"
#include "chain_validator.h"

namespace xkms::validation {

/**
 * @brief Validates request certificate chains against trusted CAs
 *
 * Usage:
 * @code
 *   FileCertificateRepository repo("/etc/xkms/repo");
 *   TrustedAuthorityValidator validator(&repo);
 *   ValidationOutcome outcome = validator.validate(requestCerts);
 * @endcode
 */
class TrustedAuthorityValidator {
public:
    /**
     * @brief Constructor
     * @param certRepo Certificate repository (non-owning)
     * @param params Path building parameters applied to every call
     * @param logger Diagnostic sink; spdlog's default logger when nullptr
     * @throws std::invalid_argument if certRepo is nullptr
     */
    explicit TrustedAuthorityValidator(
        ICertificateRepository* certRepo,
        ValidationParameters params = ValidationParameters(),
        std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Validate a request's certificate chain
     *
     * An empty list or a list holding a null entry is a malformed request
     * and yields INDETERMINATE without consulting the repository.
     *
     * @param certificates Parsed request certificates, target first (non-owning)
     * @return ValidationOutcome
     * @throws xkms::common::ConfigurationException on repository or
     *         configuration failure
     */
    ValidationOutcome validate(const std::vector<X509*>& certificates) const;

    /**
     * @brief Check whether the first certificate chains to a trusted authority
     *
     * Loads CA certificates, trusted roots and CRLs from the repository,
     * builds the anchor set and runs the path validator with the request
     * certificates as an additional lookup pool.
     *
     * @param certificates Non-empty list without null entries, target first (non-owning)
     * @return PathValidationResult
     * @throws xkms::common::ConfigurationException
     */
    PathValidationResult checkCertificateChain(const std::vector<X509*>& certificates) const;

    /// @brief Boolean form of checkCertificateChain()
    bool isCertificateChainValid(const std::vector<X509*>& certificates) const;

private:
    ICertificateRepository* certRepo_;
    ValidationParameters params_;
    std::shared_ptr<spdlog::logger> logger_;
    ChainPathValidator chainValidator_;
};

} // namespace xkms::validation
