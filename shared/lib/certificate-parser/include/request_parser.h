/**
 * @file request_parser.h
 * @brief Validation request payload to certificate list
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <xkms/validation/x509_ptr.h>

namespace xkms {
namespace certificate_parser {

/**
 * @brief Converts a request payload into the certificate chain to validate
 *
 * Accepts a PEM bundle (target certificate first, supporting certificates
 * after it) or a single DER certificate. Unparsable input, a PEM bundle
 * with any undecodable block and payloads without certificates yield an
 * empty list; the caller reports those as an unsupported request.
 */
class RequestParser {
public:
    static std::vector<validation::UniqueCert> parse(const std::vector<uint8_t>& payload);
    static std::vector<validation::UniqueCert> parse(const std::string& payload);
};

} // namespace certificate_parser
} // namespace xkms
