/**
 * @file der_parser.h
 * @brief DER (Distinguished Encoding Rules) parser for X.509 certificates and CRLs
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <openssl/x509.h>
#include <xkms/validation/x509_ptr.h>

namespace xkms {
namespace certificate_parser {

/**
 * @brief DER parsing result
 *
 * At most one of certificate / crl is set.
 */
struct DerParseResult {
    bool success = false;                   ///< Whether parsing succeeded
    std::string errorMessage;               ///< Error message if failed

    validation::UniqueCert certificate;
    validation::UniqueCrl crl;

    size_t fileSize = 0;                    ///< Original size in bytes
    bool isValidDer = false;                ///< Whether data has a valid outer TLV
};

/**
 * @brief DER (Distinguished Encoding Rules) Format Parser
 *
 * Parses DER-encoded objects according to ITU-T X.690.
 *
 * DER Format:
 * - Binary format (ASN.1 binary encoding)
 * - File extensions: .der, .cer, .crl
 * - No delimiters (entire file is one object)
 *
 * Both a certificate and a CRL start with a SEQUENCE; the parser tries the
 * certificate structure first and falls back to CertificateList.
 */
class DerParser {
public:
    /**
     * @brief Parse DER content as certificate or CRL
     *
     * @param data DER content (binary format)
     * @return DerParseResult with the decoded object
     */
    static DerParseResult parse(const std::vector<uint8_t>& data);

    /**
     * @brief Check if data looks like DER
     *
     * Checks for:
     * - SEQUENCE tag (0x30)
     * - Short or long form length encoding (0x81-0x84)
     * - Data at least as long as the encoded length
     */
    static bool isDerFormat(const std::vector<uint8_t>& data);

    /**
     * @brief Get total encoded size from the outer TLV header
     *
     * @param data DER content (at least 2 bytes)
     * @return Size in bytes including header, or 0 on error
     */
    static size_t getDerObjectSize(const std::vector<uint8_t>& data);
};

} // namespace certificate_parser
} // namespace xkms
