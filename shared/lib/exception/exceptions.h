/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Infrastructure and configuration failures. A certificate that simply
 * does not chain to a trust anchor is never reported through these types.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace xkms::common {

/**
 * @brief Base exception for all XKMS trust service exceptions
 */
class XkmsException : public std::runtime_error {
public:
    explicit XkmsException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Configuration error
 *
 * Cryptographic provider unavailable, malformed trust anchors or
 * structurally invalid validation parameters.
 */
class ConfigurationException : public XkmsException {
public:
    explicit ConfigurationException(const std::string& message)
        : XkmsException("Configuration error: " + message) {}

protected:
    ConfigurationException(const std::string& prefix, const std::string& message)
        : XkmsException(prefix + message) {}
};

/**
 * @brief Certificate repository failed to supply data
 */
class RepositoryException : public ConfigurationException {
public:
    explicit RepositoryException(const std::string& message)
        : ConfigurationException("Repository error: ", message) {}
};

/**
 * @brief Parsing error (certificate, CRL)
 */
class ParsingException : public XkmsException {
public:
    explicit ParsingException(const std::string& message)
        : XkmsException("Parsing error: " + message) {}
};

} // namespace xkms::common
