/**
 * @file outcome_format.h
 * @brief Wire identifiers and JSON rendering for validation outcomes
 *
 * W3C XKMS 2.0 status and reason URIs. Request-unsupported uses the Apache
 * CXF extension namespace, as XKMS defines no reason for it.
 */

#pragma once

#include <string>
#include <json/json.h>
#include "types.h"

namespace xkms::validation {

/// @brief e.g. "http://www.w3.org/2002/03/xkms#Valid"
std::string keyBindingStatusUri(KeyBindingStatus status);

/// @brief e.g. "http://www.w3.org/2002/03/xkms#IssuerTrust"
std::string reasonCodeUri(ReasonCode reason);

/**
 * @brief Render an outcome as JSON
 *
 * @code
 * {
 *   "status": "INVALID",
 *   "statusUri": "http://www.w3.org/2002/03/xkms#Invalid",
 *   "reasons": ["issuer-trust-failed"],
 *   "reasonUris": ["http://www.w3.org/2002/03/xkms#IssuerTrust"],
 *   "failure": "certificate-revoked",
 *   "message": "..."
 * }
 * @endcode
 *
 * "failure" and "message" are present only when set.
 */
Json::Value outcomeToJson(const ValidationOutcome& outcome);

} // namespace xkms::validation
