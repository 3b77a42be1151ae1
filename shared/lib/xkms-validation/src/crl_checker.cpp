/**
 * @file crl_checker.cpp
 * @brief CRL revocation checker implementation
 */

#include "xkms/validation/crl_checker.h"
#include "xkms/validation/cert_ops.h"
#include "exception/exceptions.h"

#include <ctime>
#include <openssl/x509v3.h>

namespace xkms::validation {

namespace {

bool isCrlCurrent(X509_CRL* crl, time_t at) {
    const ASN1_TIME* thisUpdate = X509_CRL_get0_lastUpdate(crl);
    if (!thisUpdate || X509_cmp_time(thisUpdate, &at) > 0) {
        return false;
    }
    // nextUpdate is optional; absent means no scheduled expiry
    const ASN1_TIME* nextUpdate = X509_CRL_get0_nextUpdate(crl);
    if (nextUpdate && X509_cmp_time(nextUpdate, &at) < 0) {
        return false;
    }
    return true;
}

} // namespace

CrlChecker::CrlChecker(const std::vector<X509_CRL*>& crls)
    : crls_(crls)
{
    for (X509_CRL* crl : crls_) {
        if (!crl) {
            throw common::ConfigurationException("CrlChecker: null CRL entry");
        }
    }
}

CrlCheckResult CrlChecker::check(X509* cert, X509* issuerCert, time_t at) const {
    CrlCheckResult result;

    if (!cert || !issuerCert) {
        result.status = CrlCheckStatus::NOT_CHECKED;
        result.message = "Certificate or issuer is null";
        return result;
    }

    const X509_NAME* issuerName = X509_get_subject_name(issuerCert);
    const ASN1_INTEGER* certSerial = X509_get0_serialNumber(cert);

    bool sawIssuerCrl = false;
    bool sawExpired = false;
    bool sawCurrent = false;

    for (X509_CRL* crl : crls_) {
        if (!namesMatch(X509_CRL_get_issuer(crl), issuerName)) {
            continue;
        }
        sawIssuerCrl = true;

        // Step 2: CRL must be signed by this issuer's key
        if (!verifyCrlSignature(crl, issuerCert)) {
            continue;
        }

        result.thisUpdate = asn1TimeToIso8601(X509_CRL_get0_lastUpdate(crl));
        result.nextUpdate = asn1TimeToIso8601(X509_CRL_get0_nextUpdate(crl));

        // Step 3: validity window
        if (!isCrlCurrent(crl, at)) {
            sawExpired = true;
            continue;
        }
        sawCurrent = true;

        // Step 4: serial lookup
        X509_REVOKED* revokedEntry = nullptr;
        int ret = X509_CRL_get0_by_serial(crl, &revokedEntry, const_cast<ASN1_INTEGER*>(certSerial));
        if (ret == 1 && revokedEntry) {
            result.status = CrlCheckStatus::REVOKED;
            result.message = "Certificate " + getSerialNumberHex(cert) +
                             " is revoked by " + getCrlIssuerDn(crl);
            result.revocationDate = asn1TimeToIso8601(X509_REVOKED_get0_revocationDate(revokedEntry));

            // Step 5: reason code (optional extension)
            ASN1_ENUMERATED* reasonEnum = static_cast<ASN1_ENUMERATED*>(
                X509_REVOKED_get_ext_d2i(revokedEntry, NID_crl_reason, nullptr, nullptr));
            if (reasonEnum) {
                result.revocationReason = crlReasonToString(ASN1_ENUMERATED_get(reasonEnum));
                ASN1_ENUMERATED_free(reasonEnum);
            } else {
                result.revocationReason = "unspecified";
            }
            return result;
        }
    }

    if (sawCurrent) {
        result.status = CrlCheckStatus::VALID;
        result.message = "Certificate not revoked";
    } else if (sawExpired) {
        result.status = CrlCheckStatus::CRL_EXPIRED;
        result.message = "No current CRL for issuer " + getSubjectDn(issuerCert);
    } else if (sawIssuerCrl) {
        result.status = CrlCheckStatus::CRL_INVALID;
        result.message = "CRL signature verification failed for issuer " + getSubjectDn(issuerCert);
    } else {
        result.status = CrlCheckStatus::CRL_UNAVAILABLE;
        result.message = "No CRL found for issuer " + getSubjectDn(issuerCert);
    }
    return result;
}

std::string crlReasonToString(long reasonCode) {
    switch (reasonCode) {
        case 0:  return "unspecified";
        case 1:  return "keyCompromise";
        case 2:  return "cACompromise";
        case 3:  return "affiliationChanged";
        case 4:  return "superseded";
        case 5:  return "cessationOfOperation";
        case 6:  return "certificateHold";
        case 8:  return "removeFromCRL";
        case 9:  return "privilegeWithdrawn";
        case 10: return "aACompromise";
        default: return "unknown(" + std::to_string(reasonCode) + ")";
    }
}

} // namespace xkms::validation
