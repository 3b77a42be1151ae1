/**
 * @file in_memory_certificate_repository.h
 * @brief Certificate repository holding registered certificates and CRLs
 */

#pragma once

#include <mutex>
#include <vector>
#include <xkms/validation/providers.h>

namespace repositories {

/**
 * @brief In-memory certificate repository
 *
 * Stores private copies of registered objects and hands out fresh
 * duplicates on every read, so callers never share OpenSSL objects with the
 * store. Registration and reads may interleave across threads.
 */
class InMemoryCertificateRepository : public xkms::validation::ICertificateRepository {
public:
    InMemoryCertificateRepository() = default;

    // Prevent copying
    InMemoryCertificateRepository(const InMemoryCertificateRepository&) = delete;
    InMemoryCertificateRepository& operator=(const InMemoryCertificateRepository&) = delete;

    /// @throws std::invalid_argument if cert is nullptr
    void addCaCert(X509* cert);
    /// @throws std::invalid_argument if cert is nullptr
    void addTrustedCaCert(X509* cert);
    /// @throws std::invalid_argument if crl is nullptr
    void addCrl(X509_CRL* crl);

    void clear();

    std::vector<xkms::validation::UniqueCert> getCaCerts() override;
    std::vector<xkms::validation::UniqueCert> getTrustedCaCerts() override;
    std::vector<xkms::validation::UniqueCrl> getCrls() override;

private:
    mutable std::mutex mutex_;
    std::vector<xkms::validation::UniqueCert> caCerts_;
    std::vector<xkms::validation::UniqueCert> trustedCerts_;
    std::vector<xkms::validation::UniqueCrl> crls_;
};

} // namespace repositories
