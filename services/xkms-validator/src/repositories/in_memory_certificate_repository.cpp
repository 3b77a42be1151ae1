/**
 * @file in_memory_certificate_repository.cpp
 * @brief In-memory certificate repository implementation
 */

#include "in_memory_certificate_repository.h"
#include "exception/exceptions.h"

#include <stdexcept>

using xkms::common::RepositoryException;
using xkms::validation::UniqueCert;
using xkms::validation::UniqueCrl;

namespace repositories {

namespace {

UniqueCert dupCert(X509* cert) {
    X509* copy = X509_dup(cert);
    if (!copy) {
        throw RepositoryException("X509_dup failed");
    }
    return UniqueCert(copy);
}

UniqueCrl dupCrl(X509_CRL* crl) {
    X509_CRL* copy = X509_CRL_dup(crl);
    if (!copy) {
        throw RepositoryException("X509_CRL_dup failed");
    }
    return UniqueCrl(copy);
}

std::vector<UniqueCert> dupAll(const std::vector<UniqueCert>& certs) {
    std::vector<UniqueCert> out;
    out.reserve(certs.size());
    for (const auto& cert : certs) {
        out.push_back(dupCert(cert.get()));
    }
    return out;
}

} // namespace

void InMemoryCertificateRepository::addCaCert(X509* cert) {
    if (!cert) throw std::invalid_argument("addCaCert: cert cannot be nullptr");
    UniqueCert copy = dupCert(cert);
    std::lock_guard<std::mutex> lock(mutex_);
    caCerts_.push_back(std::move(copy));
}

void InMemoryCertificateRepository::addTrustedCaCert(X509* cert) {
    if (!cert) throw std::invalid_argument("addTrustedCaCert: cert cannot be nullptr");
    UniqueCert copy = dupCert(cert);
    std::lock_guard<std::mutex> lock(mutex_);
    trustedCerts_.push_back(std::move(copy));
}

void InMemoryCertificateRepository::addCrl(X509_CRL* crl) {
    if (!crl) throw std::invalid_argument("addCrl: crl cannot be nullptr");
    UniqueCrl copy = dupCrl(crl);
    std::lock_guard<std::mutex> lock(mutex_);
    crls_.push_back(std::move(copy));
}

void InMemoryCertificateRepository::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    caCerts_.clear();
    trustedCerts_.clear();
    crls_.clear();
}

std::vector<UniqueCert> InMemoryCertificateRepository::getCaCerts() {
    std::lock_guard<std::mutex> lock(mutex_);
    return dupAll(caCerts_);
}

std::vector<UniqueCert> InMemoryCertificateRepository::getTrustedCaCerts() {
    std::lock_guard<std::mutex> lock(mutex_);
    return dupAll(trustedCerts_);
}

std::vector<UniqueCrl> InMemoryCertificateRepository::getCrls() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UniqueCrl> out;
    out.reserve(crls_.size());
    for (const auto& crl : crls_) {
        out.push_back(dupCrl(crl.get()));
    }
    return out;
}

} // namespace repositories
