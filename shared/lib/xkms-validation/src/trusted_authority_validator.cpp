/**
 * @file trusted_authority_validator.cpp
 * @brief Key binding validation implementation
 */

#include "xkms/validation/trusted_authority_validator.h"
#include "xkms/validation/cert_ops.h"
#include "xkms/validation/certificate_pool.h"
#include "xkms/validation/trust_anchor.h"
#include "exception/exceptions.h"

#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace xkms::validation {

namespace {

bool hasNullEntry(const std::vector<X509*>& certificates) {
    return std::find(certificates.begin(), certificates.end(), nullptr) != certificates.end();
}

struct RepositorySnapshot {
    std::vector<UniqueCert> caCerts;
    std::vector<UniqueCert> trustedCerts;
    std::vector<UniqueCrl> crls;
};

RepositorySnapshot loadRepository(ICertificateRepository* repo) {
    RepositorySnapshot snapshot;
    try {
        snapshot.caCerts = repo->getCaCerts();
        snapshot.trustedCerts = repo->getTrustedCaCerts();
        snapshot.crls = repo->getCrls();
    } catch (const common::XkmsException&) {
        throw;
    } catch (const std::exception& e) {
        throw common::RepositoryException(e.what());
    }
    return snapshot;
}

} // namespace

TrustedAuthorityValidator::TrustedAuthorityValidator(
    ICertificateRepository* certRepo,
    ValidationParameters params,
    std::shared_ptr<spdlog::logger> logger)
    : certRepo_(certRepo)
    , params_(std::move(params))
    , logger_(logger ? std::move(logger) : spdlog::default_logger())
    , chainValidator_(logger_)
{
    if (!certRepo_) {
        throw std::invalid_argument("TrustedAuthorityValidator: certRepo cannot be nullptr");
    }
}

PathValidationResult TrustedAuthorityValidator::checkCertificateChain(
    const std::vector<X509*>& certificates) const
{
    if (certificates.empty() || !certificates.front()) {
        throw common::ConfigurationException("certificate chain must start with a target certificate");
    }
    if (hasNullEntry(certificates)) {
        throw common::ConfigurationException("certificate chain contains a null entry");
    }
    X509* target = certificates.front();

    RepositorySnapshot repo;
    try {
        repo = loadRepository(certRepo_);
    } catch (const common::XkmsException& e) {
        logger_->error("Certificate repository unavailable: {}", e.what());
        throw;
    }

    logger_->debug("Repository snapshot: {} CA, {} trusted, {} CRL",
                   repo.caCerts.size(), repo.trustedCerts.size(), repo.crls.size());

    TrustAnchorSet anchors = buildAnchors(borrow(repo.trustedCerts));
    CertificatePool intermediates(borrow(repo.caCerts));
    CertificatePool requestPool(certificates);

    return chainValidator_.validate(target, intermediates, requestPool, anchors,
                                    borrow(repo.crls), params_);
}

bool TrustedAuthorityValidator::isCertificateChainValid(const std::vector<X509*>& certificates) const {
    return checkCertificateChain(certificates).valid;
}

ValidationOutcome TrustedAuthorityValidator::validate(const std::vector<X509*>& certificates) const {
    ValidationOutcome outcome;

    if (certificates.empty() || !certificates.front()) {
        outcome.status = KeyBindingStatus::INDETERMINATE;
        outcome.reasons.push_back(ReasonCode::REQUEST_UNSUPPORTED);
        outcome.message = "Request contains no certificate";
        logger_->info("Validation request not supported: no certificate");
        return outcome;
    }
    if (hasNullEntry(certificates)) {
        outcome.status = KeyBindingStatus::INDETERMINATE;
        outcome.reasons.push_back(ReasonCode::REQUEST_UNSUPPORTED);
        outcome.message = "Request contains an undecodable certificate";
        logger_->info("Validation request not supported: null certificate in chain");
        return outcome;
    }

    PathValidationResult path = checkCertificateChain(certificates);
    if (path.valid) {
        outcome.status = KeyBindingStatus::VALID;
        outcome.reasons.push_back(ReasonCode::ISSUER_TRUST_ESTABLISHED);
        logger_->info("Issuer trust established for {} (anchor {})",
                      getSubjectDn(certificates.front()), path.anchorSubjectDn);
    } else {
        outcome.status = KeyBindingStatus::INVALID;
        outcome.reasons.push_back(ReasonCode::ISSUER_TRUST_FAILED);
        outcome.failure = path.failure;
        outcome.message = path.message;
    }
    return outcome;
}

} // namespace xkms::validation
