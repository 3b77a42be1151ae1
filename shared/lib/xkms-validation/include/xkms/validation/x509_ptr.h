/**
 * @file x509_ptr.h
 * @brief RAII handles for OpenSSL objects
 */

#pragma once

#include <memory>
#include <vector>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace xkms::validation {

struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using UniqueCert = std::unique_ptr<X509, X509Deleter>;

struct CrlDeleter { void operator()(X509_CRL* p) const { X509_CRL_free(p); } };
using UniqueCrl = std::unique_ptr<X509_CRL, CrlDeleter>;

struct PKeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
using UniqueKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

/// @brief Borrow raw pointers from a list of owned certificates
inline std::vector<X509*> borrow(const std::vector<UniqueCert>& certs) {
    std::vector<X509*> out;
    out.reserve(certs.size());
    for (const auto& c : certs) out.push_back(c.get());
    return out;
}

inline std::vector<X509_CRL*> borrow(const std::vector<UniqueCrl>& crls) {
    std::vector<X509_CRL*> out;
    out.reserve(crls.size());
    for (const auto& c : crls) out.push_back(c.get());
    return out;
}

} // namespace xkms::validation
