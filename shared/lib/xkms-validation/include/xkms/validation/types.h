/**
 * @file types.h
 * @brief Common types for the XKMS trust validation library
 *
 * Shared enums and result structs used across all validation modules.
 * RFC 5280 Section 6 (path validation) / W3C XKMS 2.0 key binding status.
 */

#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <openssl/x509.h>

namespace xkms::validation {

/// @brief Key binding status reported to the caller (XKMS 2.0 Section 5.1)
enum class KeyBindingStatus {
    VALID,          ///< Issuer trust established
    INVALID,        ///< No trusted path could be built
    INDETERMINATE   ///< Request could not be evaluated
};

/// @brief Machine-readable reason attached to a key binding status
enum class ReasonCode {
    ISSUER_TRUST_ESTABLISHED,
    ISSUER_TRUST_FAILED,
    REQUEST_UNSUPPORTED
};

/// @brief Diagnostic detail for a negative path-building result
enum class PathFailure {
    NONE,
    NO_ISSUER_FOUND,            ///< No candidate issuer matched by name
    UNTRUSTED_ROOT,             ///< Path ended at a self-signed cert that is not an anchor
    SIGNATURE_FAILURE,          ///< Issuer name matched but signature did not verify
    CERTIFICATE_EXPIRED,        ///< notAfter < verification time
    CERTIFICATE_NOT_YET_VALID,  ///< notBefore > verification time
    CERTIFICATE_REVOKED,
    CRL_UNAVAILABLE,            ///< Revocation enabled, no CRL from the issuer
    CRL_EXPIRED,                ///< Issuer CRL outside its update window
    CRL_INVALID,                ///< Issuer-named CRL with a bad signature
    CHAIN_LOOP,
    PATH_LENGTH_EXCEEDED,
    ITERATION_LIMIT
};

/// @brief CRL check status (RFC 5280 Section 5.3.1)
enum class CrlCheckStatus {
    VALID,            ///< Certificate not revoked, CRL valid
    REVOKED,          ///< Certificate is revoked
    CRL_UNAVAILABLE,  ///< No CRL issued by the certificate's issuer
    CRL_EXPIRED,      ///< CRL outside thisUpdate/nextUpdate window
    CRL_INVALID,      ///< CRL signature invalid
    NOT_CHECKED       ///< CRL check was not performed
};

/// @brief Path building knobs
struct ValidationParameters {
    std::optional<time_t> verificationTime;  ///< Defaults to time(nullptr)
    int maxPathLength = 10;                  ///< Certificates in a path, target included
    int maxIterations = 10000;               ///< DFS node budget, 0 = unlimited

    time_t effectiveTime() const {
        return verificationTime ? *verificationTime : time(nullptr);
    }
};

/// @brief CRL revocation check result
struct CrlCheckResult {
    CrlCheckStatus status = CrlCheckStatus::NOT_CHECKED;
    std::string thisUpdate;         ///< CRL issued date (ISO 8601)
    std::string nextUpdate;         ///< CRL next update date (ISO 8601)
    std::string revocationReason;   ///< RFC 5280 CRLReason (e.g., "keyCompromise")
    std::string revocationDate;     ///< ISO 8601
    std::string message;
};

/// @brief Path discovery + verification result
struct PathValidationResult {
    bool valid = false;
    PathFailure failure = PathFailure::NONE;
    std::string message;
    std::vector<X509*> path;        ///< Target first, anchor last (non-owning)
    int depth = 0;
    bool revocationChecked = false;
    std::string anchorSubjectDn;
    std::string anchorFingerprint;
};

/// @brief Outcome of one validate() call
struct ValidationOutcome {
    KeyBindingStatus status = KeyBindingStatus::INDETERMINATE;
    std::vector<ReasonCode> reasons;
    PathFailure failure = PathFailure::NONE;
    std::string message;

    bool hasReason(ReasonCode code) const {
        for (ReasonCode r : reasons) {
            if (r == code) return true;
        }
        return false;
    }
};

inline std::string keyBindingStatusToString(KeyBindingStatus s) {
    switch (s) {
        case KeyBindingStatus::VALID:         return "VALID";
        case KeyBindingStatus::INVALID:       return "INVALID";
        case KeyBindingStatus::INDETERMINATE: return "INDETERMINATE";
    }
    return "UNKNOWN";
}

inline std::string reasonCodeToString(ReasonCode r) {
    switch (r) {
        case ReasonCode::ISSUER_TRUST_ESTABLISHED: return "issuer-trust-established";
        case ReasonCode::ISSUER_TRUST_FAILED:      return "issuer-trust-failed";
        case ReasonCode::REQUEST_UNSUPPORTED:      return "request-unsupported";
    }
    return "unknown";
}

inline std::string pathFailureToString(PathFailure f) {
    switch (f) {
        case PathFailure::NONE:                      return "none";
        case PathFailure::NO_ISSUER_FOUND:           return "no-issuer-found";
        case PathFailure::UNTRUSTED_ROOT:            return "untrusted-root";
        case PathFailure::SIGNATURE_FAILURE:         return "signature-failure";
        case PathFailure::CERTIFICATE_EXPIRED:       return "certificate-expired";
        case PathFailure::CERTIFICATE_NOT_YET_VALID: return "certificate-not-yet-valid";
        case PathFailure::CERTIFICATE_REVOKED:       return "certificate-revoked";
        case PathFailure::CRL_UNAVAILABLE:           return "crl-unavailable";
        case PathFailure::CRL_EXPIRED:               return "crl-expired";
        case PathFailure::CRL_INVALID:               return "crl-invalid";
        case PathFailure::CHAIN_LOOP:                return "chain-loop";
        case PathFailure::PATH_LENGTH_EXCEEDED:      return "path-length-exceeded";
        case PathFailure::ITERATION_LIMIT:           return "iteration-limit";
    }
    return "unknown";
}

/// @brief Convert CrlCheckStatus to string
inline std::string crlCheckStatusToString(CrlCheckStatus s) {
    switch (s) {
        case CrlCheckStatus::VALID:           return "VALID";
        case CrlCheckStatus::REVOKED:         return "REVOKED";
        case CrlCheckStatus::CRL_UNAVAILABLE: return "CRL_UNAVAILABLE";
        case CrlCheckStatus::CRL_EXPIRED:     return "CRL_EXPIRED";
        case CrlCheckStatus::CRL_INVALID:     return "CRL_INVALID";
        case CrlCheckStatus::NOT_CHECKED:     return "NOT_CHECKED";
    }
    return "UNKNOWN";
}

} // namespace xkms::validation
