/**
 * @file command_line.h
 * @brief xkms-validate argument parsing and exit codes
 */

#pragma once

#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>

#include "infrastructure/app_config.h"
#include <xkms/validation/types.h>

namespace cli {

constexpr int EXIT_VALID = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_INDETERMINATE = 2;
constexpr int EXIT_CONFIG_ERROR = 3;
constexpr int EXIT_USAGE = 64;

enum class Action {
    RUN,
    HELP,
    USAGE_ERROR
};

struct CommandLine {
    Action action = Action::RUN;
    std::string requestPath;
    std::optional<time_t> verificationTime;
    std::string error;  ///< Set for USAGE_ERROR when there is something specific to report
};

/// @brief Parse decimal epoch seconds; trailing garbage is rejected
inline bool parseEpoch(const std::string& text, time_t& out) {
    try {
        size_t pos = 0;
        long long value = std::stoll(text, &pos);
        if (pos != text.size()) return false;
        out = static_cast<time_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

inline int exitCodeFor(xkms::validation::KeyBindingStatus status) {
    switch (status) {
        case xkms::validation::KeyBindingStatus::VALID:         return EXIT_VALID;
        case xkms::validation::KeyBindingStatus::INVALID:       return EXIT_INVALID;
        case xkms::validation::KeyBindingStatus::INDETERMINATE: return EXIT_INDETERMINATE;
    }
    return EXIT_INDETERMINATE;
}

/**
 * @brief Parse argv, applying --repo / --log-level over the environment config
 *
 * @param config Updated in place with command-line overrides
 */
inline CommandLine parseCommandLine(int argc, const char* const argv[], AppConfig& config) {
    CommandLine cmd;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--repo" && i + 1 < argc) {
            config.repoDir = argv[++i];
        } else if (arg == "--time" && i + 1 < argc) {
            time_t t = 0;
            if (!parseEpoch(argv[++i], t)) {
                cmd.action = Action::USAGE_ERROR;
                cmd.error = std::string("Invalid --time value: ") + argv[i];
                return cmd;
            }
            cmd.verificationTime = t;
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.logLevel = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            cmd.action = Action::HELP;
            return cmd;
        } else if (!arg.empty() && arg[0] == '-') {
            cmd.action = Action::USAGE_ERROR;
            cmd.error = "Unknown option: " + arg;
            return cmd;
        } else if (cmd.requestPath.empty()) {
            cmd.requestPath = arg;
        } else {
            cmd.action = Action::USAGE_ERROR;
            cmd.error = "Unexpected argument: " + arg;
            return cmd;
        }
    }

    if (cmd.requestPath.empty() || config.repoDir.empty()) {
        cmd.action = Action::USAGE_ERROR;
    }
    return cmd;
}

} // namespace cli
