/**
 * @file file_certificate_repository.h
 * @brief Certificate repository backed by a directory tree
 *
 * Layout:
 *   <root>/trusted/   trust anchors
 *   <root>/ca/        intermediate CA certificates
 *   <root>/crls/      certificate revocation lists
 *
 * Files may be PEM (bundles allowed) or DER. Hidden files are ignored.
 * A missing sub-directory means no entries of that kind.
 */

#pragma once

#include <string>
#include <vector>
#include <xkms/validation/providers.h>

namespace repositories {

/**
 * @brief File system certificate repository
 *
 * Re-reads the tree on every call, so updates on disk are picked up by the
 * next validation. Holds no mutable state; concurrent reads are safe.
 */
class FileCertificateRepository : public xkms::validation::ICertificateRepository {
public:
    /**
     * @brief Constructor
     * @param rootDir Repository root directory
     * @throws xkms::common::RepositoryException if rootDir is not a directory
     */
    explicit FileCertificateRepository(const std::string& rootDir);

    // Prevent copying
    FileCertificateRepository(const FileCertificateRepository&) = delete;
    FileCertificateRepository& operator=(const FileCertificateRepository&) = delete;

    /// @throws xkms::common::RepositoryException on unreadable or unparsable files
    std::vector<xkms::validation::UniqueCert> getCaCerts() override;

    /// @throws xkms::common::RepositoryException on unreadable or unparsable files
    std::vector<xkms::validation::UniqueCert> getTrustedCaCerts() override;

    /// @throws xkms::common::RepositoryException on unreadable or unparsable files
    std::vector<xkms::validation::UniqueCrl> getCrls() override;

    const std::string& rootDir() const { return rootDir_; }

private:
    std::vector<xkms::validation::UniqueCert> loadCertificates(const std::string& subDir) const;
    std::vector<std::string> listFiles(const std::string& subDir) const;

    std::string rootDir_;
};

} // namespace repositories
