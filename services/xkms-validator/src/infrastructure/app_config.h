#pragma once

/**
 * @file app_config.h
 * @brief xkms-validate application configuration
 *
 * Loaded from environment variables at startup; command-line flags
 * override individual fields afterwards.
 */

#include <string>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "config/config_manager.h"
#include <xkms/validation/types.h>

struct AppConfig {
    std::string repoDir;
    int maxPathLength = 10;
    int maxIterations = 10000;

    std::string logLevel = "warn";
    std::string logFile;

    static AppConfig fromEnvironment() {
        auto& cfg = xkms::common::ConfigManager::getInstance();
        AppConfig config;

        config.repoDir = cfg.getString(xkms::common::ConfigManager::REPO_DIR, config.repoDir);
        config.maxPathLength = cfg.getInt(xkms::common::ConfigManager::MAX_PATH_LENGTH, config.maxPathLength);
        config.maxIterations = cfg.getInt(xkms::common::ConfigManager::MAX_ITERATIONS, config.maxIterations);

        config.logLevel = cfg.getString(xkms::common::ConfigManager::LOG_LEVEL, config.logLevel);
        config.logFile = cfg.getString(xkms::common::ConfigManager::LOG_FILE, config.logFile);

        return config;
    }

    xkms::validation::ValidationParameters toValidationParameters() const {
        xkms::validation::ValidationParameters params;
        params.maxPathLength = maxPathLength;
        params.maxIterations = maxIterations;
        return params;
    }

    void validateRequired() const {
        if (repoDir.empty()) {
            throw std::runtime_error("Repository directory not set (--repo or XKMS_REPO_DIR)");
        }
        spdlog::debug("Configuration: repo={}, maxPathLength={}, maxIterations={}",
                      repoDir, maxPathLength, maxIterations);
    }
};
