/**
 * @file ProgressDisplay.cpp
 * @brief Terminal progress display implementation
 */

#include "cli/ProgressDisplay.hpp"

#include <unistd.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <format>
#include <iostream>
#include <utility>

namespace cli {

namespace {

constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view BOLD = "\033[1m";
constexpr std::string_view GREEN = "\033[32m";
constexpr std::string_view RED = "\033[31m";
constexpr std::string_view YELLOW = "\033[33m";
constexpr std::string_view DIM = "\033[2m";

constexpr int BAR_CELLS = 30;
constexpr std::string_view FULL_CELL = "\u2588";
constexpr std::string_view EMPTY_CELL = "\u2591";

}  // namespace

ProgressDisplay::ProgressDisplay(std::vector<std::string> devices, bool dry_run)
    : dry_run_(dry_run), tty_(::isatty(STDOUT_FILENO) != 0),
      started_(std::chrono::steady_clock::now()) {
    devices_.reserve(devices.size());
    for (auto& path : devices) {
        devices_.push_back(DeviceLine{.path = std::move(path)});
    }
}

auto ProgressDisplay::paint(std::string_view text, std::string_view color) const -> std::string {
    if (!tty_) {
        return std::string{text};
    }
    return std::format("{}{}{}", color, text, RESET);
}

auto ProgressDisplay::bar(double percentage) const -> std::string {
    const int filled = std::clamp(static_cast<int>(std::lround(percentage / 100.0 * BAR_CELLS)), 0,
                                  BAR_CELLS);
    std::string full;
    std::string empty;
    for (int i = 0; i < BAR_CELLS; ++i) {
        (i < filled ? full : empty) += (i < filled ? FULL_CELL : EMPTY_CELL);
    }
    return std::format("[{}{}]", paint(full, GREEN), empty);
}

void ProgressDisplay::ensure_banner() {
    if (banner_shown_) {
        return;
    }
    banner_shown_ = true;
    std::cout << "\n"
              << paint(std::format("Sanitizing {} device{}", devices_.size(),
                                   devices_.size() == 1 ? "" : "s"),
                       BOLD)
              << "\n";
    if (dry_run_) {
        std::cout << paint("DRY RUN: commands are printed, not executed", YELLOW) << "\n";
    }
    std::cout << std::flush;
}

void ProgressDisplay::end_live_line() {
    if (live_line_) {
        std::cout << "\r\033[K";
        live_line_ = false;
    }
}

void ProgressDisplay::update(const JobProgress& progress) {
    std::lock_guard lock(mutex_);
    ensure_banner();
    end_live_line();

    if (progress.has_error) {
        // The failing device is the first one without a result
        auto it = std::ranges::find_if(devices_, [](const DeviceLine& d) { return d.outcome.empty(); });
        if (it != devices_.end()) {
            it->outcome = progress.error_message;
            it->failed = true;
        }
        return;  // the summary reports it
    }
    if (auto it = std::ranges::find(devices_, progress.current_device, &DeviceLine::path);
        it != devices_.end()) {
        it->outcome = progress.status;
    }

    std::cout << std::format("[{}/{}] {} {:5.1f}%  {}\n", progress.completed_devices,
                             progress.total_devices, bar(progress.percentage), progress.percentage,
                             progress.status)
              << std::flush;
}

void ProgressDisplay::output_line(std::string_view line) {
    std::lock_guard lock(mutex_);
    ensure_banner();

    if (const auto percentage = parse_trailing_percentage(line); percentage && tty_) {
        std::cout << "\r\033[K" << bar(*percentage) << " " << line << std::flush;
        live_line_ = true;
        return;
    }

    end_live_line();
    std::cout << "  " << paint(line, DIM) << "\n" << std::flush;
}

void ProgressDisplay::complete(bool success, const std::string& message) {
    std::lock_guard lock(mutex_);
    end_live_line();

    std::cout << "\n";
    for (const auto& device : devices_) {
        if (device.outcome.empty()) {
            std::cout << std::format("  {:<20} {}\n", device.path, paint("not processed", DIM));
        } else {
            std::cout << std::format("  {:<20} {}\n", device.path,
                                     paint(device.outcome, device.failed ? RED : GREEN));
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_);
    std::cout << "\n"
              << paint(std::format("{}{}", success ? "[OK] " : "[FAILED] ", message),
                       success ? GREEN : RED)
              << " (" << format_duration(elapsed.count()) << ")\n"
              << std::endl;
}

auto ProgressDisplay::format_bytes(uint64_t bytes) -> std::string {
    static constexpr std::array<std::string_view, 4> UNITS{"KB", "MB", "GB", "TB"};

    if (bytes < 1024) {
        return std::format("{} B", bytes);
    }
    auto value = static_cast<double>(bytes) / 1024.0;
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < UNITS.size()) {
        value /= 1024.0;
        ++unit;
    }
    return std::format("{:.1f} {}", value, UNITS[unit]);
}

auto ProgressDisplay::format_duration(int64_t seconds) -> std::string {
    if (seconds < 0) {
        return "--:--";
    }
    const auto hours = seconds / 3600;
    const auto minutes = (seconds / 60) % 60;
    const auto secs = seconds % 60;
    if (hours > 0) {
        return std::format("{}:{:02d}:{:02d}", hours, minutes, secs);
    }
    return std::format("{:02d}:{:02d}", minutes, secs);
}

auto ProgressDisplay::parse_trailing_percentage(std::string_view line) -> std::optional<double> {
    const auto end = line.find_last_not_of(' ');
    if (end == std::string_view::npos || line[end] != '%') {
        return std::nullopt;
    }
    line = line.substr(0, end);

    const auto start = line.find_last_not_of("0123456789.");
    const auto digits = line.substr(start == std::string_view::npos ? 0 : start + 1);
    if (digits.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return std::clamp(value, 0.0, 100.0);
}

}  // namespace cli
