/**
 * @file file_certificate_repository.cpp
 * @brief File system certificate repository implementation
 */

#include "file_certificate_repository.h"
#include "exception/exceptions.h"
#include "pem_parser.h"
#include "der_parser.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using xkms::common::RepositoryException;
using xkms::validation::UniqueCert;
using xkms::validation::UniqueCrl;
using xkms::certificate_parser::DerParser;
using xkms::certificate_parser::PemParser;

namespace repositories {

namespace {

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw RepositoryException("Failed to open file: " + path);
    }
    std::vector<uint8_t> data(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw RepositoryException("Failed to read file: " + path);
    }
    return data;
}

} // namespace

FileCertificateRepository::FileCertificateRepository(const std::string& rootDir)
    : rootDir_(rootDir)
{
    std::error_code ec;
    if (!fs::is_directory(rootDir_, ec)) {
        throw RepositoryException("Repository root is not a directory: " + rootDir_);
    }
    spdlog::debug("FileCertificateRepository initialized: {}", rootDir_);
}

std::vector<std::string> FileCertificateRepository::listFiles(const std::string& subDir) const {
    std::vector<std::string> files;
    fs::path dir = fs::path(rootDir_) / subDir;

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return files;
    }
    if (!fs::is_directory(dir, ec)) {
        throw RepositoryException("Not a directory: " + dir.string());
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw RepositoryException("Cannot list " + dir.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        if (!entry.is_regular_file(ec)) continue;
        files.push_back(entry.path().string());
    }

    // Deterministic load order
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<UniqueCert> FileCertificateRepository::loadCertificates(const std::string& subDir) const {
    std::vector<UniqueCert> certs;

    for (const auto& path : listFiles(subDir)) {
        std::vector<uint8_t> data = readFile(path);

        if (PemParser::isPemFormat(data)) {
            auto pem = PemParser::parse(data);
            if (pem.certificates.empty() || pem.parseErrors > 0) {
                throw RepositoryException("Invalid PEM certificate file: " + path);
            }
            for (auto& cert : pem.certificates) {
                certs.push_back(std::move(cert));
            }
            continue;
        }

        auto der = DerParser::parse(data);
        if (!der.success || !der.certificate) {
            throw RepositoryException("Invalid certificate file: " + path +
                                      (der.errorMessage.empty() ? "" : " (" + der.errorMessage + ")"));
        }
        certs.push_back(std::move(der.certificate));
    }

    spdlog::debug("Loaded {} certificate(s) from {}/{}", certs.size(), rootDir_, subDir);
    return certs;
}

std::vector<UniqueCert> FileCertificateRepository::getCaCerts() {
    return loadCertificates("ca");
}

std::vector<UniqueCert> FileCertificateRepository::getTrustedCaCerts() {
    return loadCertificates("trusted");
}

std::vector<UniqueCrl> FileCertificateRepository::getCrls() {
    std::vector<UniqueCrl> crls;

    for (const auto& path : listFiles("crls")) {
        std::vector<uint8_t> data = readFile(path);

        if (PemParser::isPemFormat(data)) {
            auto pem = PemParser::parse(data);
            if (pem.crls.empty() || pem.parseErrors > 0) {
                throw RepositoryException("Invalid PEM CRL file: " + path);
            }
            for (auto& crl : pem.crls) {
                crls.push_back(std::move(crl));
            }
            continue;
        }

        auto der = DerParser::parse(data);
        if (!der.success || !der.crl) {
            throw RepositoryException("Invalid CRL file: " + path);
        }
        crls.push_back(std::move(der.crl));
    }

    spdlog::debug("Loaded {} CRL(s) from {}/crls", crls.size(), rootDir_);
    return crls;
}

} // namespace repositories
