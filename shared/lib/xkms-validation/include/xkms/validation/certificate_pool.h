/**
 * @file certificate_pool.h
 * @brief Unordered certificate lookup source for path construction
 */

#pragma once

#include <vector>
#include <openssl/x509.h>

namespace xkms::validation {

/**
 * @brief Non-owning collection of certificates queried by subject name
 *
 * Duplicates are allowed. Several certificates may share a subject
 * (cross-signed or rotated CAs); every one of them is returned as a
 * candidate and the path builder selects by signature.
 *
 * The pool does not own its certificates; they must outlive it.
 */
class CertificatePool {
public:
    CertificatePool() = default;

    /**
     * @brief Construct from a certificate list
     * @throws xkms::common::ConfigurationException if any entry is nullptr
     */
    explicit CertificatePool(const std::vector<X509*>& certs);

    /// @throws xkms::common::ConfigurationException if cert is nullptr
    void add(X509* cert);

    /**
     * @brief Find all certificates whose subject equals the given name
     * @param name Issuer name of the certificate being extended
     * @return Matching certificates in insertion order
     */
    std::vector<X509*> findAllBySubject(const X509_NAME* name) const;

    size_t size() const { return certs_.size(); }
    bool empty() const { return certs_.empty(); }
    const std::vector<X509*>& certificates() const { return certs_; }

private:
    std::vector<X509*> certs_;
};

} // namespace xkms::validation
