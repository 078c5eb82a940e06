/**
 * @file CliApplication.hpp
 * @brief CLI application for media sanitization and certificate issuance
 */

#pragma once

#include "config/AppConfig.hpp"
#include "models/DeviceInfo.hpp"
#include "models/WipeTypes.hpp"
#include "services/SanitizationJob.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cli {

/**
 * @brief Process exit codes
 */
enum ExitCode : int {
    EXIT_OK = 0,                  ///< Job (and certificate, if any) succeeded
    EXIT_FAILED = 1,              ///< Usage or configuration error, or the job failed
    EXIT_CERTIFICATE_FAILED = 2   ///< Devices sanitized but no signed certificate produced
};

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool usage_error = false;
    std::vector<std::string> devices;
    std::optional<std::filesystem::path> metadata_file;
    std::optional<std::filesystem::path> config_file;
    std::optional<std::filesystem::path> report_out;
    std::optional<std::filesystem::path> verify_file;
    bool no_confirm = false;
    config::ConfigOverrides overrides;
    std::string error_message;
};

/**
 * @class CliApplication
 * @brief Command-line front end over the sanitization engine
 *
 * Provides command-line interface for:
 * - Sanitizing one or more devices in order
 * - Issuing the signed certificate for a successful job
 * - Verifying a previously issued certificate
 */
class CliApplication {
public:
    CliApplication() = default;

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @param argc Argument count
     * @param argv Argument values
     * @return Exit code, see ExitCode
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed options; usage_error is set on invalid input
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    /**
     * @brief Effective configuration: defaults, then the key file, then the command line
     */
    [[nodiscard]] static auto resolve_config(const CliOptions& options)
        -> std::expected<config::AppConfig, util::Error>;

    /**
     * @brief Operator-facing text for the error that stopped a job
     * @param secret Secure erase password, masked in the command line
     * @return Empty when the job has no error
     */
    [[nodiscard]] static auto job_failure_text(const JobResult& result, std::string_view secret)
        -> std::string;

    static void print_help();
    static void print_version();

private:
    auto cmd_sanitize(const CliOptions& options, const config::AppConfig& config) -> int;
    auto cmd_verify(const std::filesystem::path& signed_file, const config::AppConfig& config)
        -> int;

    /**
     * @brief Issue the certificate for a successful job
     */
    auto issue_certificate(const config::AppConfig& config, const WipeReport& report,
                           const std::optional<std::filesystem::path>& metadata_file,
                           const std::vector<DeviceInfo>& devices) -> int;

    /**
     * @brief Prompt user for confirmation
     * @param devices Devices about to be destroyed
     * @return true if user confirms
     */
    [[nodiscard]] static auto confirm_sanitize(const std::vector<DeviceInfo>& devices) -> bool;
};

}  // namespace cli
