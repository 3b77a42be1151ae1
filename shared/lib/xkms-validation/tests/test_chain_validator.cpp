/**
 * @file test_chain_validator.cpp
 * @brief Unit tests for ChainPathValidator - path discovery with backtracking
 *
 * Topology used by most tests:
 *
 *   R1 (anchor) -> I1 (serial 10) -> E (serial 100)
 */

#include <gtest/gtest.h>
#include <xkms/validation/chain_validator.h>
#include <xkms/validation/cert_ops.h>
#include "exception/exceptions.h"
#include "test_helpers.h"

#include <sstream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

using namespace xkms::validation;
using namespace test_helpers;
using xkms::common::ConfigurationException;

// ============================================================================
// Test Fixture
// ============================================================================

class ChainValidatorTest : public ::testing::Test {
protected:
    UniqueKey rootKey_;
    UniqueKey interKey_;
    UniqueKey leafKey_;
    UniqueCert root_;
    UniqueCert inter_;
    UniqueCert leaf_;

    ChainPathValidator validator_;

    void SetUp() override {
        rootKey_ = generateRsaKey(2048);
        interKey_ = generateEcKey();
        leafKey_ = generateEcKey();
        root_ = createRootCa(rootKey_.get(), "Root One");
        inter_ = createIntermediateCa(interKey_.get(), rootKey_.get(), root_.get(), "Issuing One", 10);
        leaf_ = createEndEntity(leafKey_.get(), interKey_.get(), inter_.get(), "Leaf One", 100);
    }

    PathValidationResult validateLeaf(
        const std::vector<X509_CRL*>& crls = {},
        const ValidationParameters& params = ValidationParameters())
    {
        TrustAnchorSet anchors = buildAnchors({root_.get()});
        CertificatePool intermediates({inter_.get()});
        CertificatePool request({leaf_.get()});
        return validator_.validate(leaf_.get(), intermediates, request, anchors, crls, params);
    }
};

// ============================================================================
// Successful Paths
// ============================================================================

TEST_F(ChainValidatorTest, ValidPath_NoCrls) {
    auto result = validateLeaf();

    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::NONE);
    EXPECT_EQ(result.depth, 3);
    ASSERT_EQ(result.path.size(), 3u);
    EXPECT_EQ(result.path[0], leaf_.get());
    EXPECT_EQ(result.path[1], inter_.get());
    EXPECT_EQ(result.path[2], root_.get());
    EXPECT_FALSE(result.revocationChecked);
    EXPECT_EQ(result.anchorFingerprint, getCertificateFingerprint(root_.get()));
    EXPECT_NE(result.anchorSubjectDn.find("Root One"), std::string::npos);
}

TEST_F(ChainValidatorTest, ValidPath_IntermediateFromRequest) {
    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool noIntermediates;
    CertificatePool request({leaf_.get(), inter_.get()});

    auto result = validator_.validate(leaf_.get(), noIntermediates, request, anchors, {});
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.depth, 3);
}

TEST_F(ChainValidatorTest, ValidPath_DirectlyUnderAnchor) {
    auto key = generateEcKey();
    auto direct = createEndEntity(key.get(), rootKey_.get(), root_.get(), "Direct Leaf", 101);

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    auto result = validator_.validate(direct.get(), CertificatePool(), CertificatePool(), anchors, {});
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.depth, 2);
}

TEST_F(ChainValidatorTest, TargetIsAnchor) {
    TrustAnchorSet anchors = buildAnchors({root_.get()});
    UniqueCert copy(X509_dup(root_.get()));

    auto result = validator_.validate(copy.get(), CertificatePool(), CertificatePool(), anchors, {});
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.depth, 1);
    ASSERT_EQ(result.path.size(), 1u);
    EXPECT_EQ(result.path[0], copy.get());
}

TEST_F(ChainValidatorTest, ExpiredTargetThatIsAnchor) {
    auto oldKey = generateEcKey();
    auto oldRoot = createRootCa(oldKey.get(), "Retired Root", 1, Validity{-3650, -1});

    TrustAnchorSet anchors = buildAnchors({root_.get(), oldRoot.get()});
    auto result = validator_.validate(oldRoot.get(), CertificatePool(), CertificatePool(), anchors, {});

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::CERTIFICATE_EXPIRED);
    EXPECT_TRUE(result.path.empty());
}

TEST_F(ChainValidatorTest, ValidPath_RevocationEnabledAllClean) {
    auto interCrl = createCrl(interKey_.get(), inter_.get());
    auto rootCrl = createCrl(rootKey_.get(), root_.get());

    auto result = validateLeaf({interCrl.get(), rootCrl.get()});
    ASSERT_TRUE(result.valid);
    EXPECT_TRUE(result.revocationChecked);
}

TEST_F(ChainValidatorTest, IsChainValid) {
    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({inter_.get()});
    EXPECT_TRUE(validator_.isChainValid(leaf_.get(), intermediates, CertificatePool(), anchors, {}));
    EXPECT_FALSE(validator_.isChainValid(leaf_.get(), CertificatePool(), CertificatePool(), anchors, {}));
}

// ============================================================================
// Missing Or Untrusted Issuers
// ============================================================================

TEST_F(ChainValidatorTest, NoIssuerFound) {
    TrustAnchorSet anchors = buildAnchors({root_.get()});
    auto result = validator_.validate(leaf_.get(), CertificatePool(), CertificatePool(), anchors, {});

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::NO_ISSUER_FOUND);
    EXPECT_TRUE(result.path.empty());
}

TEST_F(ChainValidatorTest, UntrustedRoot) {
    auto otherRootKey = generateEcKey();
    auto otherInterKey = generateEcKey();
    auto otherLeafKey = generateEcKey();
    auto otherRoot = createRootCa(otherRootKey.get(), "Root Two");
    auto otherInter = createIntermediateCa(otherInterKey.get(), otherRootKey.get(), otherRoot.get(), "Issuing Two");
    auto otherLeaf = createEndEntity(otherLeafKey.get(), otherInterKey.get(), otherInter.get(), "Leaf Two");

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({inter_.get(), otherInter.get(), otherRoot.get()});

    auto result = validator_.validate(otherLeaf.get(), intermediates, CertificatePool(), anchors, {});
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::UNTRUSTED_ROOT);
}

TEST_F(ChainValidatorTest, SelfSignedTargetNotAnchor) {
    auto key = generateEcKey();
    auto selfSigned = createRootCa(key.get(), "Lonely Root");

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    auto result = validator_.validate(selfSigned.get(), CertificatePool(), CertificatePool(), anchors, {});
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::UNTRUSTED_ROOT);
}

// ============================================================================
// Signature And Validity Failures
// ============================================================================

TEST_F(ChainValidatorTest, TamperedTargetSignature) {
    auto tampered = tamperSignature(leaf_.get());

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({inter_.get()});
    auto result = validator_.validate(tampered.get(), intermediates, CertificatePool(), anchors, {});

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::SIGNATURE_FAILURE);
}

TEST_F(ChainValidatorTest, ExpiredTarget) {
    auto expired = createEndEntity(leafKey_.get(), interKey_.get(), inter_.get(),
                                   "Expired Leaf", 102, Validity{-730, -1});

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({inter_.get()});
    auto result = validator_.validate(expired.get(), intermediates, CertificatePool(), anchors, {});

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::CERTIFICATE_EXPIRED);
}

TEST_F(ChainValidatorTest, NotYetValidTarget) {
    auto future = createEndEntity(leafKey_.get(), interKey_.get(), inter_.get(),
                                  "Future Leaf", 103, Validity{30, 365});

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({inter_.get()});
    auto result = validator_.validate(future.get(), intermediates, CertificatePool(), anchors, {});

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::CERTIFICATE_NOT_YET_VALID);
}

TEST_F(ChainValidatorTest, ExpiredIntermediate) {
    auto oldInter = createIntermediateCa(interKey_.get(), rootKey_.get(), root_.get(),
                                         "Issuing One", 11, Validity{-730, -1});

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({oldInter.get()});
    auto result = validator_.validate(leaf_.get(), intermediates, CertificatePool(), anchors, {});

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::CERTIFICATE_EXPIRED);
}

TEST_F(ChainValidatorTest, ExpiredAnchor) {
    auto oldRootKey = generateEcKey();
    auto oldRoot = createRootCa(oldRootKey.get(), "Old Root", 1, Validity{-3650, -1});
    auto key = generateEcKey();
    auto leaf = createEndEntity(key.get(), oldRootKey.get(), oldRoot.get(), "Orphan Leaf");

    TrustAnchorSet anchors = buildAnchors({oldRoot.get()});
    auto result = validator_.validate(leaf.get(), CertificatePool(), CertificatePool(), anchors, {});

    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::CERTIFICATE_EXPIRED);
}

TEST_F(ChainValidatorTest, VerificationTimeBeforeIssuance) {
    ValidationParameters params;
    params.verificationTime = time(nullptr) - 10 * DAY;

    auto result = validateLeaf({}, params);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::CERTIFICATE_NOT_YET_VALID);
}

TEST_F(ChainValidatorTest, VerificationTimeWithinValidity) {
    ValidationParameters params;
    params.verificationTime = time(nullptr) + 100 * DAY;

    EXPECT_TRUE(validateLeaf({}, params).valid);
}

// ============================================================================
// Revocation
// ============================================================================

TEST_F(ChainValidatorTest, RevokedTarget) {
    auto interCrl = createCrl(interKey_.get(), inter_.get(), {{100, 1}});
    auto rootCrl = createCrl(rootKey_.get(), root_.get());

    auto result = validateLeaf({interCrl.get(), rootCrl.get()});
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::CERTIFICATE_REVOKED);
    EXPECT_NE(result.message.find("keyCompromise"), std::string::npos);
    EXPECT_TRUE(result.revocationChecked);
}

TEST_F(ChainValidatorTest, RevokedTarget_IgnoredWithoutCrls) {
    // Same chain, empty CRL pool: revocation checking is disabled
    auto result = validateLeaf({});
    EXPECT_TRUE(result.valid);
    EXPECT_FALSE(result.revocationChecked);
}

TEST_F(ChainValidatorTest, RevokedIntermediate) {
    auto interCrl = createCrl(interKey_.get(), inter_.get());
    auto rootCrl = createCrl(rootKey_.get(), root_.get(), {{10}});

    auto result = validateLeaf({interCrl.get(), rootCrl.get()});
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::CERTIFICATE_REVOKED);
}

TEST_F(ChainValidatorTest, CrlUnavailableForIssuer) {
    // Revocation enabled by the root's CRL, nothing from the intermediate
    auto rootCrl = createCrl(rootKey_.get(), root_.get());

    auto result = validateLeaf({rootCrl.get()});
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::CRL_UNAVAILABLE);
}

TEST_F(ChainValidatorTest, CrlExpired) {
    auto interCrl = createCrl(interKey_.get(), inter_.get(), {}, 30, true);
    auto rootCrl = createCrl(rootKey_.get(), root_.get());

    auto result = validateLeaf({interCrl.get(), rootCrl.get()});
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::CRL_EXPIRED);
}

TEST_F(ChainValidatorTest, CrlInvalidSignature) {
    auto forgerKey = generateEcKey();
    auto forged = createCrl(forgerKey.get(), inter_.get());
    auto rootCrl = createCrl(rootKey_.get(), root_.get());

    auto result = validateLeaf({forged.get(), rootCrl.get()});
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::CRL_INVALID);
}

// ============================================================================
// Backtracking
// ============================================================================

TEST_F(ChainValidatorTest, Backtracking_SameSubjectDifferentParents) {
    // I1a and I1b share subject and key; only I1b chains to the anchor
    auto untrustedKey = generateEcKey();
    auto untrustedRoot = createRootCa(untrustedKey.get(), "Root Two");
    auto interA = createIntermediateCa(interKey_.get(), untrustedKey.get(), untrustedRoot.get(), "Issuing One", 20);
    auto interB = createIntermediateCa(interKey_.get(), rootKey_.get(), root_.get(), "Issuing One", 21);

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({interA.get(), untrustedRoot.get(), interB.get()});

    auto result = validator_.validate(leaf_.get(), intermediates, CertificatePool(), anchors, {});
    ASSERT_TRUE(result.valid);
    ASSERT_EQ(result.path.size(), 3u);
    EXPECT_EQ(result.path[1], interB.get());
    EXPECT_EQ(result.path[2], root_.get());
}

TEST_F(ChainValidatorTest, Backtracking_SignatureMismatchSkipsCandidate) {
    // Same subject as the real intermediate but a different key
    auto wrongKey = generateEcKey();
    auto decoy = createIntermediateCa(wrongKey.get(), rootKey_.get(), root_.get(), "Issuing One", 30);

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({decoy.get(), inter_.get()});

    auto result = validator_.validate(leaf_.get(), intermediates, CertificatePool(), anchors, {});
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.path[1], inter_.get());
}

TEST_F(ChainValidatorTest, Backtracking_RevokedBranchAlternative) {
    // Two valid intermediates; the first is revoked by the root
    auto interB = createIntermediateCa(interKey_.get(), rootKey_.get(), root_.get(), "Issuing One", 12);
    auto interCrl = createCrl(interKey_.get(), inter_.get());
    auto rootCrl = createCrl(rootKey_.get(), root_.get(), {{10}});

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({inter_.get(), interB.get()});

    auto result = validator_.validate(leaf_.get(), intermediates, CertificatePool(), anchors,
                                      {interCrl.get(), rootCrl.get()});
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.path[1], interB.get());
}

TEST_F(ChainValidatorTest, DuplicateCandidatesAcrossPools) {
    UniqueCert interCopy(X509_dup(inter_.get()));

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({inter_.get()});
    CertificatePool request({leaf_.get(), interCopy.get()});

    auto result = validator_.validate(leaf_.get(), intermediates, request, anchors, {});
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.path[1], inter_.get());
}

TEST_F(ChainValidatorTest, Backtracking_KeyRolloverLinkCertificate) {
    // Anchor is the old "Root One"; the rollover link carries the new key
    // under the same name and is signed by the old key
    auto newRootKey = generateEcKey();
    auto link = issueCert(newRootKey.get(), rootKey_.get(), X509_get_subject_name(root_.get()),
                          "Root One", 2, Validity(), true);
    auto key = generateEcKey();
    auto leaf = createEndEntity(key.get(), newRootKey.get(), link.get(), "Rolled Leaf", 104);

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({link.get()});

    auto result = validator_.validate(leaf.get(), intermediates, CertificatePool(), anchors, {});
    ASSERT_TRUE(result.valid) << result.message;
    ASSERT_EQ(result.path.size(), 3u);
    EXPECT_EQ(result.path[1], link.get());
    EXPECT_EQ(result.path[2], root_.get());
}

TEST_F(ChainValidatorTest, KeyRolloverLinkWithoutAnchorIsUntrusted) {
    auto oldKey = generateEcKey();
    auto oldRoot = createRootCa(oldKey.get(), "Root One", 5);
    auto newKey = generateEcKey();
    auto link = issueCert(newKey.get(), oldKey.get(), X509_get_subject_name(oldRoot.get()),
                          "Root One", 6, Validity(), true);
    auto key = generateEcKey();
    auto leaf = createEndEntity(key.get(), newKey.get(), link.get(), "Stray Leaf", 105);

    // Anchor shares the name but neither old nor new key
    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({link.get(), oldRoot.get()});

    auto result = validator_.validate(leaf.get(), intermediates, CertificatePool(), anchors, {});
    EXPECT_FALSE(result.valid);
}

// ============================================================================
// Loop Prevention And Bounds
// ============================================================================

TEST_F(ChainValidatorTest, CrossCertifiedLoopTerminates) {
    // X (subject A) issued by Y, Y (subject B) issued by X; no anchor reachable
    auto keyA = generateEcKey();
    auto keyB = generateEcKey();
    auto seedA = createRootCa(keyA.get(), "Cross A");
    auto seedB = createRootCa(keyB.get(), "Cross B");
    auto x = createIntermediateCa(keyA.get(), keyB.get(), seedB.get(), "Cross A", 40);
    auto y = createIntermediateCa(keyB.get(), keyA.get(), seedA.get(), "Cross B", 41);
    auto key = generateEcKey();
    auto leaf = createEndEntity(key.get(), keyA.get(), x.get(), "Loop Leaf");

    TrustAnchorSet anchors = buildAnchors({root_.get()});
    CertificatePool intermediates({x.get(), y.get()});

    auto result = validator_.validate(leaf.get(), intermediates, CertificatePool(), anchors, {});
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::CHAIN_LOOP);
}

TEST_F(ChainValidatorTest, PathLengthExceeded) {
    ValidationParameters params;
    params.maxPathLength = 2;

    auto result = validateLeaf({}, params);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::PATH_LENGTH_EXCEEDED);
}

TEST_F(ChainValidatorTest, PathLengthExactlyFits) {
    ValidationParameters params;
    params.maxPathLength = 3;

    EXPECT_TRUE(validateLeaf({}, params).valid);
}

TEST_F(ChainValidatorTest, IterationLimit) {
    ValidationParameters params;
    params.maxIterations = 1;

    auto result = validateLeaf({}, params);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.failure, PathFailure::ITERATION_LIMIT);
}

TEST_F(ChainValidatorTest, IterationLimitZeroIsUnlimited) {
    ValidationParameters params;
    params.maxIterations = 0;

    EXPECT_TRUE(validateLeaf({}, params).valid);
}

// ============================================================================
// Configuration Errors
// ============================================================================

TEST_F(ChainValidatorTest, NullTargetThrows) {
    TrustAnchorSet anchors = buildAnchors({root_.get()});
    EXPECT_THROW(validator_.validate(nullptr, CertificatePool(), CertificatePool(), anchors, {}),
                 ConfigurationException);
}

TEST_F(ChainValidatorTest, EmptyAnchorsThrows) {
    TrustAnchorSet anchors;
    CertificatePool intermediates({inter_.get()});
    EXPECT_THROW(validator_.validate(leaf_.get(), intermediates, CertificatePool(), anchors, {}),
                 ConfigurationException);
}

TEST_F(ChainValidatorTest, InvalidBoundsThrow) {
    ValidationParameters badLength;
    badLength.maxPathLength = 0;
    EXPECT_THROW(validateLeaf({}, badLength), ConfigurationException);

    ValidationParameters badIterations;
    badIterations.maxIterations = -1;
    EXPECT_THROW(validateLeaf({}, badIterations), ConfigurationException);
}

// ============================================================================
// Logging
// ============================================================================

TEST_F(ChainValidatorTest, InjectedLoggerReceivesDiagnostics) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("chain-test", sink);
    logger->set_level(spdlog::level::debug);

    ChainPathValidator validator(logger);
    TrustAnchorSet anchors = buildAnchors({root_.get()});
    auto result = validator.validate(leaf_.get(), CertificatePool(), CertificatePool(), anchors, {});
    logger->flush();

    EXPECT_FALSE(result.valid);
    EXPECT_NE(out.str().find("No trusted path"), std::string::npos);
    EXPECT_NE(out.str().find("no-issuer-found"), std::string::npos);
}

// ============================================================================
// Idempotency
// ============================================================================

TEST_F(ChainValidatorTest, Idempotency_RepeatedValidation) {
    auto interCrl = createCrl(interKey_.get(), inter_.get(), {{100}});
    auto rootCrl = createCrl(rootKey_.get(), root_.get());

    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(validateLeaf({}).valid) << "Iteration " << i;
        auto revoked = validateLeaf({interCrl.get(), rootCrl.get()});
        EXPECT_EQ(revoked.failure, PathFailure::CERTIFICATE_REVOKED) << "Iteration " << i;
    }
}
