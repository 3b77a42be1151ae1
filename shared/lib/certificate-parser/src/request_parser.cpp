/**
 * @file request_parser.cpp
 * @brief Request payload parsing
 */

#include "request_parser.h"
#include "pem_parser.h"
#include "der_parser.h"
#include <spdlog/spdlog.h>

namespace xkms {
namespace certificate_parser {

std::vector<validation::UniqueCert> RequestParser::parse(const std::vector<uint8_t>& payload) {
    std::vector<validation::UniqueCert> certs;
    if (payload.empty()) {
        return certs;
    }

    if (PemParser::isPemFormat(payload)) {
        PemParseResult pem = PemParser::parse(payload);
        // Any undecodable block makes the chain order (and the target) unreliable
        if (pem.parseErrors > 0) {
            spdlog::warn("Request rejected: {} undecodable PEM block(s)", pem.parseErrors);
            return certs;
        }
        return std::move(pem.certificates);
    }

    DerParseResult der = DerParser::parse(payload);
    if (der.success && der.certificate) {
        certs.push_back(std::move(der.certificate));
    } else {
        spdlog::debug("Request payload is neither PEM nor DER certificate: {}", der.errorMessage);
    }
    return certs;
}

std::vector<validation::UniqueCert> RequestParser::parse(const std::string& payload) {
    return parse(std::vector<uint8_t>(payload.begin(), payload.end()));
}

} // namespace certificate_parser
} // namespace xkms
