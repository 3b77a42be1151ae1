/**
 * @file cert_ops.cpp
 * @brief Pure X.509 certificate operations implementation
 *
 * All functions are idempotent - no I/O, no logging side effects.
 */

#include "xkms/validation/cert_ops.h"

#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/err.h>

namespace xkms::validation {

// --- Signature Verification ---

bool verifyCertificateSignature(X509* cert, X509* issuerCert) {
    if (!cert || !issuerCert) return false;

    EVP_PKEY* issuerPubKey = X509_get_pubkey(issuerCert);
    if (!issuerPubKey) return false;

    int result = X509_verify(cert, issuerPubKey);
    EVP_PKEY_free(issuerPubKey);

    // Clear OpenSSL error queue to prevent stale errors from leaking
    if (result != 1) {
        ERR_clear_error();
    }

    return (result == 1);
}

bool verifyCrlSignature(X509_CRL* crl, X509* issuerCert) {
    if (!crl || !issuerCert) return false;

    EVP_PKEY* issuerPubKey = X509_get_pubkey(issuerCert);
    if (!issuerPubKey) return false;

    int result = X509_CRL_verify(crl, issuerPubKey);
    EVP_PKEY_free(issuerPubKey);

    if (result != 1) {
        ERR_clear_error();
    }

    return (result == 1);
}

// --- Certificate Status Checks ---

bool isCertificateExpired(X509* cert, time_t at) {
    if (!cert) return true;
    return (X509_cmp_time(X509_get0_notAfter(cert), &at) < 0);
}

bool isCertificateNotYetValid(X509* cert, time_t at) {
    if (!cert) return true;
    return (X509_cmp_time(X509_get0_notBefore(cert), &at) > 0);
}

bool isSelfSigned(X509* cert) {
    if (!cert) return false;
    if (!namesMatch(X509_get_subject_name(cert), X509_get_issuer_name(cert))) {
        return false;
    }
    // Self-issued but signed by another key (e.g. a key rollover link) is not a root
    return verifyCertificateSignature(cert, cert);
}

bool namesMatch(const X509_NAME* a, const X509_NAME* b) {
    if (!a || !b) return false;
    return X509_NAME_cmp(a, b) == 0;
}

// --- Identity ---

std::string getCertificateFingerprint(X509* cert) {
    if (!cert) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;

    if (X509_digest(cert, EVP_sha256(), md, &mdLen) != 1) {
        ERR_clear_error();
        return "";
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < mdLen; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
    }
    return oss.str();
}

std::vector<uint8_t> toDer(X509* cert) {
    std::vector<uint8_t> derData;
    if (!cert) return derData;

    int derLength = i2d_X509(cert, nullptr);
    if (derLength <= 0) return derData;

    derData.resize(derLength);
    unsigned char* dataPtr = derData.data();
    if (i2d_X509(cert, &dataPtr) <= 0) {
        derData.clear();
    }
    return derData;
}

bool sameCertificate(X509* a, X509* b) {
    if (!a || !b) return false;
    if (a == b) return true;
    return toDer(a) == toDer(b);
}

// --- DN Extraction ---

std::string getSubjectDn(X509* cert) {
    if (!cert) return "";

    char* dn = X509_NAME_oneline(X509_get_subject_name(cert), nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

std::string getIssuerDn(X509* cert) {
    if (!cert) return "";

    char* dn = X509_NAME_oneline(X509_get_issuer_name(cert), nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

std::string getCrlIssuerDn(X509_CRL* crl) {
    if (!crl) return "";

    char* dn = X509_NAME_oneline(X509_CRL_get_issuer(crl), nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

std::string getSerialNumberHex(X509* cert) {
    if (!cert) return "";

    BIGNUM* bn = ASN1_INTEGER_to_BN(X509_get0_serialNumber(cert), nullptr);
    if (!bn) return "";
    char* hex = BN_bn2hex(bn);
    BN_free(bn);
    if (!hex) return "";
    std::string result(hex);
    OPENSSL_free(hex);
    return result;
}

// --- Time Utilities ---

std::string asn1TimeToIso8601(const ASN1_TIME* t) {
    if (!t) return "";
    struct tm tm_val;
    if (ASN1_TIME_to_tm(t, &tm_val) == 1) {
        char buf[32];
        strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_val);
        return std::string(buf);
    }
    return "";
}

} // namespace xkms::validation
