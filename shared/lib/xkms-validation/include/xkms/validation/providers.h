/**
 * @file providers.h
 * @brief Provider interfaces for infrastructure abstraction
 *
 * These interfaces decouple the validation library from certificate storage.
 * The validator service implements concrete adapters:
 *   - FileCertificateRepository (directory tree of PEM/DER files)
 *   - InMemoryCertificateRepository (registered certificates and CRLs)
 */

#pragma once

#include <vector>
#include <openssl/x509.h>
#include "x509_ptr.h"

namespace xkms::validation {

/**
 * @brief Certificate / CRL repository consulted once per validation call
 *
 * Implementations return fresh owned copies on every call; the validator
 * keeps them only for the duration of the call.
 *
 * A repository that cannot supply data must throw
 * xkms::common::RepositoryException. Returning an empty list means "no data",
 * which for CRLs disables revocation checking.
 *
 * Implementations must be safe for concurrent reads if the validator is
 * shared across threads.
 */
class ICertificateRepository {
public:
    virtual ~ICertificateRepository() = default;

    /**
     * @brief Intermediate CA certificates available for path building
     */
    virtual std::vector<UniqueCert> getCaCerts() = 0;

    /**
     * @brief Certificates that become trust anchors
     */
    virtual std::vector<UniqueCert> getTrustedCaCerts() = 0;

    /**
     * @brief Certificate revocation lists
     */
    virtual std::vector<UniqueCrl> getCrls() = 0;
};

} // namespace xkms::validation
