/**
 * @file AppConfig.hpp
 * @brief Layered configuration: built-in defaults, key file, command line
 */

#pragma once

#include "services/SanitizationDispatcher.hpp"
#include "util/Error.hpp"
#include "util/Logger.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace config {

struct CertificateConfig {
    std::filesystem::path output_dir = "/var/lib/media-sanitizer/reports";
    std::filesystem::path identity_bundle = "/var/lib/media-sanitizer/identity.p12";
    std::string passphrase_env = "MEDIA_SANITIZER_P12_PASSWORD";  ///< Variable holding the bundle passphrase
    std::string tool_name = "media-sanitizer";
};

struct LoggingConfig {
    std::filesystem::path log_dir;  ///< Empty means $XDG_DATA_HOME/media-sanitizer/logs
    util::LogLevel level = util::LogLevel::INFO;
    bool console = false;
};

/**
 * @struct AppConfig
 * @brief Effective configuration of one run
 */
struct AppConfig {
    DispatcherSettings sanitization;
    bool dry_run = false;
    CertificateConfig certificates;
    LoggingConfig logging;
};

/**
 * @struct ConfigOverrides
 * @brief Values given on the command line; unset fields leave the lower layers alone
 */
struct ConfigOverrides {
    std::optional<int> overwrite_passes;
    std::optional<std::filesystem::path> output_dir;
    std::optional<bool> dry_run;
    std::optional<bool> verbose;
};

/**
 * @brief Built-in defaults
 */
[[nodiscard]] auto default_config() -> AppConfig;

/**
 * @brief Layer a key file over @p base
 *
 * Groups: [sanitization], [certificates], [logging]. Keys that are absent
 * keep the value from @p base; unknown keys are ignored with a warning.
 *
 * @return Merged configuration, or CONFIGURATION on unreadable files and
 *         invalid values
 */
[[nodiscard]] auto load_key_file(const std::filesystem::path& path, AppConfig base)
    -> std::expected<AppConfig, util::Error>;

/**
 * @brief Same as load_key_file(), from in-memory key file text
 */
[[nodiscard]] auto parse_key_file(std::string_view data, AppConfig base)
    -> std::expected<AppConfig, util::Error>;

/**
 * @brief Layer command-line overrides and validate the result
 */
[[nodiscard]] auto apply_overrides(AppConfig base, const ConfigOverrides& overrides)
    -> std::expected<AppConfig, util::Error>;

/**
 * @brief Check value ranges
 * @return CONFIGURATION describing the first invalid value
 */
[[nodiscard]] auto validate(const AppConfig& config) -> std::expected<void, util::Error>;

/**
 * @brief Identity passphrase from the environment variable named in the configuration
 * @return Passphrase, or CONFIGURATION if the variable is unset or empty
 */
[[nodiscard]] auto read_passphrase(const AppConfig& config) -> std::expected<std::string, util::Error>;

/**
 * @brief Log directory to use, resolving the XDG default
 */
[[nodiscard]] auto effective_log_dir(const AppConfig& config) -> std::filesystem::path;

} // namespace config
