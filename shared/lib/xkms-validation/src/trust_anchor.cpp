/**
 * @file trust_anchor.cpp
 * @brief Trust anchor set implementation
 */

#include "xkms/validation/trust_anchor.h"
#include "xkms/validation/cert_ops.h"
#include "exception/exceptions.h"

namespace xkms::validation {

bool TrustAnchorSet::add(X509* cert) {
    if (!cert) {
        throw common::ConfigurationException("TrustAnchorSet: null trusted certificate");
    }

    std::string fingerprint = getCertificateFingerprint(cert);
    if (fingerprint.empty()) {
        throw common::ConfigurationException(
            "TrustAnchorSet: cannot compute SHA-256 identity for " + getSubjectDn(cert));
    }

    if (!fingerprints_.insert(fingerprint).second) {
        return false;
    }
    anchors_.push_back({cert, fingerprint});
    return true;
}

bool TrustAnchorSet::contains(X509* cert) const {
    if (!cert) return false;
    for (const auto& anchor : anchors_) {
        if (anchor.cert == cert) return true;
    }
    std::string fingerprint = getCertificateFingerprint(cert);
    return !fingerprint.empty() && fingerprints_.count(fingerprint) > 0;
}

std::vector<X509*> TrustAnchorSet::findAllBySubject(const X509_NAME* name) const {
    std::vector<X509*> result;
    if (!name) return result;

    for (const auto& anchor : anchors_) {
        if (namesMatch(X509_get_subject_name(anchor.cert), name)) {
            result.push_back(anchor.cert);
        }
    }
    return result;
}

TrustAnchorSet buildAnchors(const std::vector<X509*>& trustedRoots) {
    TrustAnchorSet anchors;
    for (X509* root : trustedRoots) {
        anchors.add(root);
    }
    return anchors;
}

} // namespace xkms::validation
