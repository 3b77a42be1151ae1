/**
 * @file certificate_pool.cpp
 * @brief Certificate pool implementation
 */

#include "xkms/validation/certificate_pool.h"
#include "xkms/validation/cert_ops.h"
#include "exception/exceptions.h"

namespace xkms::validation {

CertificatePool::CertificatePool(const std::vector<X509*>& certs) {
    certs_.reserve(certs.size());
    for (X509* cert : certs) {
        add(cert);
    }
}

void CertificatePool::add(X509* cert) {
    if (!cert) {
        throw common::ConfigurationException("CertificatePool: null certificate entry");
    }
    certs_.push_back(cert);
}

std::vector<X509*> CertificatePool::findAllBySubject(const X509_NAME* name) const {
    std::vector<X509*> result;
    if (!name) return result;

    for (X509* cert : certs_) {
        if (namesMatch(X509_get_subject_name(cert), name)) {
            result.push_back(cert);
        }
    }
    return result;
}

} // namespace xkms::validation
