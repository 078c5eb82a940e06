/**
 * @file ProgressDisplay.hpp
 * @brief Terminal progress display for CLI sanitization jobs
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cli {

/**
 * @class ProgressDisplay
 * @brief ANSI terminal display of job progress and live command output
 *
 * Tool output lines ending in a percentage (shred -v, nvme sanitize status)
 * are redrawn in place as a bar; other lines scroll. One result line is kept
 * per finished device and repeated in the summary. Fed from the job's worker
 * thread and the main thread.
 */
class ProgressDisplay {
public:
    ProgressDisplay(std::vector<std::string> devices, bool dry_run);

    /**
     * @brief Record a finished device (or the job-level error)
     */
    void update(const JobProgress& progress);

    /**
     * @brief Show one line of command output
     */
    void output_line(std::string_view line);

    /**
     * @brief Print the per-device summary and the final status
     */
    void complete(bool success, const std::string& message);

    /**
     * @brief Format bytes as a human-readable string (e.g., "931.5 GB")
     */
    [[nodiscard]] static auto format_bytes(uint64_t bytes) -> std::string;

    /**
     * @brief Format a duration (e.g., "12:34" or "1:02:03")
     */
    [[nodiscard]] static auto format_duration(int64_t seconds) -> std::string;

    /**
     * @brief Trailing percentage of a tool output line ("... 42%"), if any
     */
    [[nodiscard]] static auto parse_trailing_percentage(std::string_view line)
        -> std::optional<double>;

private:
    struct DeviceLine {
        std::string path;
        std::string outcome;  // empty until the device finishes
        bool failed = false;
    };

    [[nodiscard]] auto paint(std::string_view text, std::string_view color) const -> std::string;
    [[nodiscard]] auto bar(double percentage) const -> std::string;
    void ensure_banner();
    void end_live_line();

    std::vector<DeviceLine> devices_;
    bool dry_run_;
    bool tty_;
    bool banner_shown_ = false;
    bool live_line_ = false;
    std::chrono::steady_clock::time_point started_;
    std::mutex mutex_;
};

}  // namespace cli
