/**
 * @file main.cpp
 * @brief xkms-validate - XKMS key binding validation tool
 *
 * Validates the certificate chain in a request file against a
 * file system certificate repository and prints the outcome as JSON.
 *
 * Exit codes:
 *   0  VALID
 *   1  INVALID
 *   2  INDETERMINATE
 *   3  configuration or repository error
 *   64 usage error
 */

#include <spdlog/spdlog.h>
#include <json/json.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "infrastructure/app_config.h"
#include "infrastructure/command_line.h"
#include "repositories/file_certificate_repository.h"
#include "exception/exceptions.h"
#include "logging/logger.h"
#include "request_parser.h"

#include <xkms/validation/trusted_authority_validator.h>
#include <xkms/validation/outcome_format.h>

namespace {

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " --repo <dir> [--time <epoch-seconds>] [--log-level <lvl>] <request.pem>\n";
    std::cerr << "  --repo DIR          Repository root (trusted/, ca/, crls/); default $XKMS_REPO_DIR\n";
    std::cerr << "  --time SECONDS      Verification time as Unix epoch seconds (default: now)\n";
    std::cerr << "  --log-level LEVEL   trace, debug, info, warn, error, critical, off\n";
}

} // namespace

int main(int argc, char* argv[]) {
    AppConfig config = AppConfig::fromEnvironment();

    cli::CommandLine cmd = cli::parseCommandLine(argc, argv, config);
    if (cmd.action == cli::Action::HELP) {
        printUsage(argv[0]);
        return cli::EXIT_VALID;
    }
    if (cmd.action == cli::Action::USAGE_ERROR) {
        if (!cmd.error.empty()) {
            std::cerr << cmd.error << "\n";
        }
        printUsage(argv[0]);
        return cli::EXIT_USAGE;
    }

    xkms::common::Logger::initialize("xkms-validate", config.logLevel,
                                     !config.logFile.empty(), config.logFile);

    // Read request
    std::ifstream file(cmd.requestPath, std::ios::binary);
    if (!file.is_open()) {
        spdlog::error("Failed to open request file: {}", cmd.requestPath);
        return cli::EXIT_USAGE;
    }
    std::vector<uint8_t> payload(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>());

    auto requestCerts = xkms::certificate_parser::RequestParser::parse(payload);
    spdlog::info("Request {}: {} certificate(s)", cmd.requestPath, requestCerts.size());

    xkms::validation::ValidationParameters params = config.toValidationParameters();
    params.verificationTime = cmd.verificationTime;

    try {
        config.validateRequired();

        repositories::FileCertificateRepository repo(config.repoDir);
        xkms::validation::TrustedAuthorityValidator validator(&repo, params);

        auto outcome = validator.validate(xkms::validation::borrow(requestCerts));

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::cout << Json::writeString(builder, xkms::validation::outcomeToJson(outcome)) << std::endl;

        spdlog::info("Key binding status: {}", xkms::validation::keyBindingStatusToString(outcome.status));
        xkms::common::Logger::flush();
        return cli::exitCodeFor(outcome.status);

    } catch (const xkms::common::ConfigurationException& e) {
        spdlog::error("{}", e.what());
        xkms::common::Logger::flush();
        return cli::EXIT_CONFIG_ERROR;
    } catch (const std::exception& e) {
        spdlog::error("Validation aborted: {}", e.what());
        xkms::common::Logger::flush();
        return cli::EXIT_CONFIG_ERROR;
    }
}
