/**
 * @file outcome_format.cpp
 * @brief Outcome rendering implementation
 */

#include "xkms/validation/outcome_format.h"

namespace xkms::validation {

namespace {
constexpr const char* XKMS_NS = "http://www.w3.org/2002/03/xkms#";
constexpr const char* CXF_XKMS_NS = "http://www.cxf.apache.org/2002/03/xkms#";
} // namespace

std::string keyBindingStatusUri(KeyBindingStatus status) {
    switch (status) {
        case KeyBindingStatus::VALID:         return std::string(XKMS_NS) + "Valid";
        case KeyBindingStatus::INVALID:       return std::string(XKMS_NS) + "Invalid";
        case KeyBindingStatus::INDETERMINATE: return std::string(XKMS_NS) + "Indeterminate";
    }
    return std::string(XKMS_NS) + "Indeterminate";
}

std::string reasonCodeUri(ReasonCode reason) {
    switch (reason) {
        case ReasonCode::ISSUER_TRUST_ESTABLISHED:
        case ReasonCode::ISSUER_TRUST_FAILED:
            return std::string(XKMS_NS) + "IssuerTrust";
        case ReasonCode::REQUEST_UNSUPPORTED:
            return std::string(CXF_XKMS_NS) + "RequestNotSupported";
    }
    return std::string(CXF_XKMS_NS) + "RequestNotSupported";
}

Json::Value outcomeToJson(const ValidationOutcome& outcome) {
    Json::Value json;

    json["status"] = keyBindingStatusToString(outcome.status);
    json["statusUri"] = keyBindingStatusUri(outcome.status);

    Json::Value reasons(Json::arrayValue);
    Json::Value reasonUris(Json::arrayValue);
    for (ReasonCode reason : outcome.reasons) {
        reasons.append(reasonCodeToString(reason));
        reasonUris.append(reasonCodeUri(reason));
    }
    json["reasons"] = reasons;
    json["reasonUris"] = reasonUris;

    if (outcome.failure != PathFailure::NONE) {
        json["failure"] = pathFailureToString(outcome.failure);
    }
    if (!outcome.message.empty()) {
        json["message"] = outcome.message;
    }

    return json;
}

} // namespace xkms::validation
