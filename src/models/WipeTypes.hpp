/**
 * @file WipeTypes.hpp
 * @brief Data types for sanitization jobs and their reports
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <format>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

/**
 * @enum SanitizationMethod
 * @brief Destructive operations the dispatcher can run
 */
enum class SanitizationMethod {
    NVME_SANITIZE,     ///< nvme sanitize, crypto erase action
    NVME_FORMAT,       ///< nvme format, user data erase
    ATA_SECURE_ERASE,  ///< hdparm security erase
    OVERWRITE          ///< shred, random passes plus a final zero pass
};

/**
 * @brief Method description recorded in reports and certificates
 *
 * These strings end up in the certificate's "methodUsed" field and are read
 * by downstream audit systems; they must not change.
 *
 * @param method Method that ran
 * @param overwrite_passes Random-data pass count (only used for OVERWRITE)
 */
[[nodiscard]] inline auto describe_method(SanitizationMethod method, int overwrite_passes)
    -> std::string {
    switch (method) {
        case SanitizationMethod::NVME_SANITIZE:
            return "NVMe Sanitize (Cryptographic Erase)";
        case SanitizationMethod::NVME_FORMAT:
            return "NVMe Format (User Data Erase)";
        case SanitizationMethod::ATA_SECURE_ERASE:
            return "ATA Secure Erase";
        case SanitizationMethod::OVERWRITE:
            return std::format("{}-Pass Overwrite (shred)", overwrite_passes);
    }
    return "Unknown";
}

/**
 * @brief NIST SP 800-88 category of a method ("Purge" or "Clear")
 */
[[nodiscard]] constexpr auto nist_category(SanitizationMethod method) -> std::string_view {
    return method == SanitizationMethod::OVERWRITE ? "Clear" : "Purge";
}

/**
 * @enum AttemptOutcome
 * @brief Result of one method attempt
 */
enum class AttemptOutcome {
    SUCCESS,
    FAILED
};

/**
 * @struct MethodAttempt
 * @brief One entry in a device's append-only attempt log
 */
struct MethodAttempt {
    std::string device_path;
    SanitizationMethod method = SanitizationMethod::OVERWRITE;
    std::string method_name;
    AttemptOutcome outcome = AttemptOutcome::FAILED;
    std::string failure_reason;  ///< Empty on success

    auto operator==(const MethodAttempt&) const -> bool = default;
};

/**
 * @struct JobProgress
 * @brief Coarse job progress, emitted once per completed device
 */
struct JobProgress {
    size_t completed_devices = 0;
    size_t total_devices = 0;
    double percentage = 0.0;
    std::string current_device;
    std::string status;
    bool is_complete = false;
    bool has_error = false;
    std::string error_message;

    auto operator==(const JobProgress&) const -> bool = default;
};

/**
 * @brief Callback type for job progress
 */
using ProgressCallback = std::function<void(const JobProgress&)>;

/**
 * @brief Receives one line of live command output at a time
 */
using LineObserver = std::function<void(std::string_view line)>;

/**
 * @enum WipeStatus
 * @brief Overall job status
 */
enum class WipeStatus {
    SUCCESS,
    FAILED
};

[[nodiscard]] constexpr auto to_string(WipeStatus status) -> std::string_view {
    return status == WipeStatus::SUCCESS ? "Success" : "Failed";
}

/**
 * @struct JobOutcome
 * @brief Everything the worker accumulated, before report synthesis
 */
struct JobOutcome {
    std::vector<std::string> devices_targeted;
    std::vector<std::string> devices_wiped_successfully;
    std::map<std::string, std::string> methods_used;
    std::vector<SanitizationMethod> methods_applied;  ///< Parallel to devices_wiped_successfully
    std::vector<MethodAttempt> attempts;
    bool success = false;
    std::string message;
    bool dry_run = false;
};

/**
 * @struct WipeReport
 * @brief Immutable summary of a finished job
 */
struct WipeReport {
    std::vector<std::string> devices_targeted;
    std::vector<std::string> devices_wiped_successfully;
    WipeStatus status = WipeStatus::FAILED;
    std::string message;
    std::string start_time_utc;
    std::string end_time_utc;
    double duration_seconds = 0.0;
    std::map<std::string, std::string> methods_used;
    std::vector<SanitizationMethod> methods_applied;
    bool dry_run = false;

    auto operator==(const WipeReport&) const -> bool = default;
};
