/**
 * @file trust_anchor.h
 * @brief Trust anchor set built from the repository's trusted roots
 *
 * An anchor is a certificate treated as axiomatically trusted. Anchors
 * carry no name constraints; only the certificate itself is kept.
 */

#pragma once

#include <set>
#include <string>
#include <vector>
#include <openssl/x509.h>

namespace xkms::validation {

/// @brief A trusted certificate (non-owning) and its identity
struct TrustAnchor {
    X509* cert = nullptr;
    std::string fingerprint;  ///< SHA-256 over DER, identity key
};

/**
 * @brief Deduplicated set of trust anchors
 *
 * Anchors are compared by encoded certificate identity: the same root
 * supplied twice yields one anchor, two distinct roots sharing a subject
 * yield two.
 */
class TrustAnchorSet {
public:
    /**
     * @brief Add an anchor
     * @return false if an identical certificate is already present
     * @throws xkms::common::ConfigurationException if cert is nullptr or
     *         cannot be digested
     */
    bool add(X509* cert);

    bool contains(X509* cert) const;

    /// @brief Anchors whose subject equals the given name
    std::vector<X509*> findAllBySubject(const X509_NAME* name) const;

    size_t size() const { return anchors_.size(); }
    bool empty() const { return anchors_.empty(); }
    const std::vector<TrustAnchor>& anchors() const { return anchors_; }

private:
    std::vector<TrustAnchor> anchors_;
    std::set<std::string> fingerprints_;
};

/**
 * @brief Convert trusted root certificates into trust anchors
 *
 * Pure transformation. Empty input yields an empty set.
 *
 * @param trustedRoots Certificates designated as trusted (non-owning)
 * @return One anchor per distinct certificate
 * @throws xkms::common::ConfigurationException on a null entry
 */
TrustAnchorSet buildAnchors(const std::vector<X509*>& trustedRoots);

} // namespace xkms::validation
