/**
 * @file pem_parser.cpp
 * @brief Implementation of PEM format parser
 */

#include "pem_parser.h"
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/err.h>
#include <algorithm>
#include <sstream>

namespace xkms {
namespace certificate_parser {

PemParseResult PemParser::parse(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        PemParseResult result;
        result.errorMessage = "Empty data";
        return result;
    }
    return parse(std::string(data.begin(), data.end()));
}

PemParseResult PemParser::parse(const std::string& pemString) {
    PemParseResult result;

    if (pemString.empty()) {
        result.errorMessage = "Empty string";
        return result;
    }

    std::vector<std::string> blocks = extractPemBlocks(pemString);
    if (blocks.empty()) {
        result.errorMessage = "No PEM blocks found";
        return result;
    }

    for (const auto& block : blocks) {
        if (isCrlBlock(block)) {
            X509_CRL* crl = parseCrlBlock(block);
            if (crl) {
                result.crls.emplace_back(crl);
            } else {
                result.parseErrors++;
            }
        } else if (isCertificateBlock(block)) {
            X509* cert = parseCertificateBlock(block);
            if (cert) {
                result.certificates.emplace_back(cert);
            } else {
                result.parseErrors++;
            }
        }
        // Keys, CSRs and other blocks are skipped
    }

    if (result.certificates.empty() && result.crls.empty()) {
        result.errorMessage = "No valid certificates or CRLs found";
        return result;
    }

    result.success = true;
    return result;
}

bool PemParser::isPemFormat(const std::vector<uint8_t>& data) {
    if (data.size() < 11) {  // "-----BEGIN "
        return false;
    }

    std::string content(data.begin(), data.begin() + std::min<size_t>(data.size(), 1000));
    return content.find("-----BEGIN ") != std::string::npos;
}

std::vector<std::string> PemParser::extractPemBlocks(const std::string& content) {
    std::vector<std::string> blocks;
    std::istringstream iss(content);
    std::string line;
    std::string currentBlock;
    bool inBlock = false;

    while (std::getline(iss, line)) {
        // Trim trailing whitespace
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n' || line.back() == ' ')) {
            line.pop_back();
        }

        if (line.find("-----BEGIN") != std::string::npos) {
            inBlock = true;
            currentBlock = line + "\n";
        } else if (line.find("-----END") != std::string::npos) {
            if (inBlock) {
                currentBlock += line + "\n";
                blocks.push_back(currentBlock);
                currentBlock.clear();
                inBlock = false;
            }
        } else if (inBlock) {
            currentBlock += line + "\n";
        }
    }

    return blocks;
}

X509* PemParser::parseCertificateBlock(const std::string& pemBlock) {
    BIO* bio = BIO_new_mem_buf(pemBlock.data(), static_cast<int>(pemBlock.size()));
    if (!bio) {
        return nullptr;
    }

    // PEM_read_bio_X509_AUX also accepts "TRUSTED CERTIFICATE" blocks
    X509* cert = PEM_read_bio_X509_AUX(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!cert) {
        ERR_clear_error();
    }
    return cert;
}

X509_CRL* PemParser::parseCrlBlock(const std::string& pemBlock) {
    BIO* bio = BIO_new_mem_buf(pemBlock.data(), static_cast<int>(pemBlock.size()));
    if (!bio) {
        return nullptr;
    }

    X509_CRL* crl = PEM_read_bio_X509_CRL(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!crl) {
        ERR_clear_error();
    }
    return crl;
}

bool PemParser::isCertificateBlock(const std::string& block) {
    return block.find("-----BEGIN CERTIFICATE-----") != std::string::npos ||
           block.find("-----BEGIN TRUSTED CERTIFICATE-----") != std::string::npos ||
           block.find("-----BEGIN X509 CERTIFICATE-----") != std::string::npos;
}

bool PemParser::isCrlBlock(const std::string& block) {
    return block.find("-----BEGIN X509 CRL-----") != std::string::npos;
}

} // namespace certificate_parser
} // namespace xkms
