#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <openssl/x509.h>
#include <xkms/validation/x509_ptr.h>

namespace xkms {
namespace certificate_parser {

/**
 * @brief PEM parsing result
 *
 * Contains extracted certificates and CRLs from PEM content
 */
struct PemParseResult {
    bool success = false;                               ///< At least one object extracted
    std::string errorMessage;                           ///< Error message if failed

    std::vector<validation::UniqueCert> certificates;   ///< In file order
    std::vector<validation::UniqueCrl> crls;            ///< In file order

    int parseErrors = 0;                                ///< Blocks that failed to decode
};

/**
 * @brief PEM (Privacy Enhanced Mail) Format Parser
 *
 * Parses PEM-encoded content according to RFC 7468.
 *
 * PEM Format:
 * - Text-based format with Base64 encoding
 * - Enclosed in "-----BEGIN <LABEL>-----" and "-----END <LABEL>-----"
 * - Can contain multiple objects in a single file
 *
 * Supported labels:
 * - CERTIFICATE, TRUSTED CERTIFICATE, X509 CERTIFICATE
 * - X509 CRL
 *
 * Other blocks (private keys, CSRs) are skipped.
 *
 * Usage Example:
 * @code
 * PemParseResult result = PemParser::parse(pemString);
 * if (result.success) {
 *     for (const auto& cert : result.certificates) {
 *         // Process certificate
 *     }
 * }
 * @endcode
 */
class PemParser {
public:
    /**
     * @brief Parse PEM content
     *
     * @param pemString PEM content as string
     * @return PemParseResult with extracted certificates and CRLs
     *
     * The function:
     * 1. Identifies all PEM blocks (BEGIN/END markers)
     * 2. Decodes certificate and CRL blocks
     * 3. Counts blocks that fail to decode as parse errors
     */
    static PemParseResult parse(const std::string& pemString);

    /// @brief Parse PEM file content
    static PemParseResult parse(const std::vector<uint8_t>& data);

    /**
     * @brief Check if data is PEM format
     *
     * Looks for a "-----BEGIN " marker in the first 1000 bytes
     */
    static bool isPemFormat(const std::vector<uint8_t>& data);

    /**
     * @brief Extract all PEM blocks from content
     *
     * @param content PEM file content
     * @return Vector of PEM blocks (each block is a string with markers)
     */
    static std::vector<std::string> extractPemBlocks(const std::string& content);

private:
    static X509* parseCertificateBlock(const std::string& pemBlock);
    static X509_CRL* parseCrlBlock(const std::string& pemBlock);
    static bool isCertificateBlock(const std::string& block);
    static bool isCrlBlock(const std::string& block);
};

} // namespace certificate_parser
} // namespace xkms
