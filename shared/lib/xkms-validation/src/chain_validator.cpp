/**
 * @file chain_validator.cpp
 * @brief Backtracking path builder implementation
 *
 * Depth-first search over issuer candidates. The current path and the set of
 * fingerprints on it are pushed/popped together so that a certificate never
 * appears twice in one path (cross-signed loops terminate).
 */

#include "xkms/validation/chain_validator.h"
#include "xkms/validation/cert_ops.h"
#include "xkms/validation/crl_checker.h"
#include "exception/exceptions.h"

#include <optional>
#include <set>
#include <string>
#include <spdlog/spdlog.h>

namespace xkms::validation {

namespace {

struct Candidate {
    X509* cert;
    bool anchor;
};

/**
 * @brief Per-call search state
 */
class PathSearch {
public:
    PathSearch(const CertificatePool& intermediates,
               const CertificatePool& requestCerts,
               const TrustAnchorSet& anchors,
               const std::optional<CrlChecker>& crlChecker,
               const ValidationParameters& params,
               time_t at,
               spdlog::logger& logger)
        : intermediates_(intermediates)
        , requestCerts_(requestCerts)
        , anchors_(anchors)
        , crlChecker_(crlChecker)
        , params_(params)
        , at_(at)
        , logger_(logger) {}

    /// @brief Search from target; on success path() holds target..anchor
    bool run(X509* target) {
        path_.push_back(target);
        seen_.insert(getCertificateFingerprint(target));
        return extend(target);
    }

    const std::vector<X509*>& path() const { return path_; }
    PathFailure failure() const { return failure_; }
    const std::string& message() const { return message_; }

private:
    bool extend(X509* current) {
        if (params_.maxIterations > 0 && ++iterations_ > params_.maxIterations) {
            record(PathFailure::ITERATION_LIMIT,
                   "Iteration limit reached (" + std::to_string(params_.maxIterations) + ")");
            aborted_ = true;
            return false;
        }

        // A self-signed certificate that is not an anchor ends this branch
        if (isSelfSigned(current)) {
            record(PathFailure::UNTRUSTED_ROOT,
                   "Self-signed certificate is not a trust anchor: " + getSubjectDn(current));
            return false;
        }

        std::vector<Candidate> candidates = collectCandidates(current);
        if (candidates.empty()) {
            record(PathFailure::NO_ISSUER_FOUND,
                   "No issuer found for: " + getIssuerDn(current));
            return false;
        }

        for (const Candidate& candidate : candidates) {
            if (aborted_) return false;

            std::string fingerprint = getCertificateFingerprint(candidate.cert);
            if (seen_.count(fingerprint) > 0) {
                record(PathFailure::CHAIN_LOOP,
                       "Certificate already on path: " + getSubjectDn(candidate.cert));
                continue;
            }

            if (!acceptEdge(current, candidate.cert)) {
                continue;
            }

            if (candidate.anchor) {
                path_.push_back(candidate.cert);
                return true;
            }

            // The intermediate plus at least one anchor must still fit
            if (static_cast<int>(path_.size()) + 2 > params_.maxPathLength) {
                record(PathFailure::PATH_LENGTH_EXCEEDED,
                       "Maximum path length exceeded (" + std::to_string(params_.maxPathLength) + ")");
                continue;
            }

            path_.push_back(candidate.cert);
            seen_.insert(fingerprint);

            if (extend(candidate.cert)) {
                return true;
            }

            logger_.debug("Backtracking from {} (depth {})",
                          getSubjectDn(candidate.cert), path_.size() - 1);
            seen_.erase(fingerprint);
            path_.pop_back();
        }
        return false;
    }

    /// Anchors first, then intermediates, then request certificates; each
    /// distinct certificate once.
    std::vector<Candidate> collectCandidates(X509* current) const {
        const X509_NAME* issuerName = X509_get_issuer_name(current);
        std::vector<Candidate> candidates;
        std::set<std::string> added;

        auto addAll = [&](const std::vector<X509*>& certs, bool anchor) {
            for (X509* cert : certs) {
                if (added.insert(getCertificateFingerprint(cert)).second) {
                    candidates.push_back({cert, anchor});
                }
            }
        };
        addAll(anchors_.findAllBySubject(issuerName), true);
        addAll(intermediates_.findAllBySubject(issuerName), false);
        addAll(requestCerts_.findAllBySubject(issuerName), false);
        return candidates;
    }

    bool acceptEdge(X509* cert, X509* issuer) {
        if (!verifyCertificateSignature(cert, issuer)) {
            record(PathFailure::SIGNATURE_FAILURE,
                   "Signature verification failed: " + getSubjectDn(cert) +
                   " not signed by " + getSubjectDn(issuer));
            return false;
        }

        if (isCertificateNotYetValid(issuer, at_)) {
            record(PathFailure::CERTIFICATE_NOT_YET_VALID,
                   "Certificate not yet valid: " + getSubjectDn(issuer) +
                   " (notBefore " + asn1TimeToIso8601(X509_get0_notBefore(issuer)) + ")");
            return false;
        }
        if (isCertificateExpired(issuer, at_)) {
            record(PathFailure::CERTIFICATE_EXPIRED,
                   "Certificate expired: " + getSubjectDn(issuer) +
                   " (notAfter " + asn1TimeToIso8601(X509_get0_notAfter(issuer)) + ")");
            return false;
        }

        if (crlChecker_) {
            CrlCheckResult crl = crlChecker_->check(cert, issuer, at_);
            switch (crl.status) {
                case CrlCheckStatus::VALID:
                    break;
                case CrlCheckStatus::REVOKED:
                    record(PathFailure::CERTIFICATE_REVOKED,
                           crl.message + " (reason: " + crl.revocationReason +
                           ", date: " + crl.revocationDate + ")");
                    return false;
                case CrlCheckStatus::CRL_EXPIRED:
                    record(PathFailure::CRL_EXPIRED, crl.message);
                    return false;
                case CrlCheckStatus::CRL_INVALID:
                    record(PathFailure::CRL_INVALID, crl.message);
                    return false;
                case CrlCheckStatus::CRL_UNAVAILABLE:
                case CrlCheckStatus::NOT_CHECKED:
                    record(PathFailure::CRL_UNAVAILABLE, crl.message);
                    return false;
            }
        }
        return true;
    }

    // The first recorded failure is the one reported
    void record(PathFailure failure, const std::string& message) {
        logger_.debug("Path candidate rejected [{}]: {}", pathFailureToString(failure), message);
        if (failure_ == PathFailure::NONE) {
            failure_ = failure;
            message_ = message;
        }
    }

    const CertificatePool& intermediates_;
    const CertificatePool& requestCerts_;
    const TrustAnchorSet& anchors_;
    const std::optional<CrlChecker>& crlChecker_;
    const ValidationParameters& params_;
    time_t at_;
    spdlog::logger& logger_;

    std::vector<X509*> path_;
    std::set<std::string> seen_;
    int iterations_ = 0;
    bool aborted_ = false;
    PathFailure failure_ = PathFailure::NONE;
    std::string message_;
};

} // namespace

ChainPathValidator::ChainPathValidator(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger())
{
}

PathValidationResult ChainPathValidator::validate(
    X509* target,
    const CertificatePool& intermediates,
    const CertificatePool& requestCerts,
    const TrustAnchorSet& anchors,
    const std::vector<X509_CRL*>& crls,
    const ValidationParameters& params) const
{
    if (!target) {
        logger_->error("Path validation aborted: target certificate is null");
        throw common::ConfigurationException("target certificate is null");
    }
    if (anchors.empty()) {
        logger_->error("Path validation aborted: trust anchor set is empty");
        throw common::ConfigurationException("trust anchor set must be non-empty");
    }
    if (params.maxPathLength < 1 || params.maxIterations < 0) {
        logger_->error("Path validation aborted: invalid bounds (maxPathLength={}, maxIterations={})",
                       params.maxPathLength, params.maxIterations);
        throw common::ConfigurationException("invalid path length or iteration bounds");
    }
    if (getCertificateFingerprint(target).empty()) {
        logger_->error("Path validation aborted: SHA-256 digest unavailable");
        throw common::ConfigurationException("cannot compute certificate identity (SHA-256 unavailable)");
    }

    PathValidationResult result;
    const time_t at = params.effectiveTime();
    const std::string targetDn = getSubjectDn(target);

    // Empty CRL pool disables revocation checking for this call
    std::optional<CrlChecker> crlChecker;
    if (!crls.empty()) {
        crlChecker.emplace(crls);
    }
    result.revocationChecked = crlChecker.has_value();

    // Step 1: target validity period, anchors included
    if (isCertificateNotYetValid(target, at)) {
        result.failure = PathFailure::CERTIFICATE_NOT_YET_VALID;
        result.message = "Target certificate not yet valid: " + targetDn;
    } else if (isCertificateExpired(target, at)) {
        result.failure = PathFailure::CERTIFICATE_EXPIRED;
        result.message = "Target certificate expired: " + targetDn;
    }
    if (result.failure != PathFailure::NONE) {
        logger_->info("No trusted path for {}: {} ({})",
                      targetDn, pathFailureToString(result.failure), result.message);
        return result;
    }

    // Step 2: the target is itself trusted
    if (anchors.contains(target)) {
        result.valid = true;
        result.path.push_back(target);
        result.depth = 1;
        result.anchorSubjectDn = targetDn;
        result.anchorFingerprint = getCertificateFingerprint(target);
        logger_->debug("Target is a trust anchor: {}", targetDn);
        return result;
    }

    // Steps 3-5: depth-first search with backtracking
    PathSearch search(intermediates, requestCerts, anchors, crlChecker, params, at, *logger_);
    if (search.run(target)) {
        result.valid = true;
        result.path = search.path();
        result.depth = static_cast<int>(result.path.size());
        result.anchorSubjectDn = getSubjectDn(result.path.back());
        result.anchorFingerprint = getCertificateFingerprint(result.path.back());
        logger_->debug("Trusted path found for {} (depth {}, anchor {}, revocation {})",
                       targetDn, result.depth, result.anchorSubjectDn,
                       result.revocationChecked ? "checked" : "disabled");
        return result;
    }

    result.failure = search.failure();
    result.message = search.message();
    if (result.failure == PathFailure::NONE) {
        result.failure = PathFailure::NO_ISSUER_FOUND;
        result.message = "No path to a trusted anchor";
    }
    logger_->info("No trusted path for {}: {} ({})",
                  targetDn, pathFailureToString(result.failure), result.message);
    return result;
}

bool ChainPathValidator::isChainValid(
    X509* target,
    const CertificatePool& intermediates,
    const CertificatePool& requestCerts,
    const TrustAnchorSet& anchors,
    const std::vector<X509_CRL*>& crls,
    const ValidationParameters& params) const
{
    return validate(target, intermediates, requestCerts, anchors, crls, params).valid;
}

} // namespace xkms::validation
