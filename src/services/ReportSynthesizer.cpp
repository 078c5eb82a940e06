#include "services/ReportSynthesizer.hpp"

#include <format>
#include <utility>

namespace report {

auto format_utc_timestamp(Clock::time_point when) -> std::string {
    return std::format("{:%FT%T}Z", std::chrono::floor<std::chrono::microseconds>(when));
}

auto synthesize(const JobOutcome& outcome, Clock::time_point start, Clock::time_point end)
    -> WipeReport {
    const auto elapsed = std::chrono::duration<double>(end - start).count();

    std::string message = outcome.message;
    if (outcome.dry_run) {
        message += " (dry run: no data was destroyed)";
    }

    return WipeReport{
        .devices_targeted = outcome.devices_targeted,
        .devices_wiped_successfully = outcome.devices_wiped_successfully,
        .status = outcome.success ? WipeStatus::SUCCESS : WipeStatus::FAILED,
        .message = std::move(message),
        .start_time_utc = format_utc_timestamp(start),
        .end_time_utc = format_utc_timestamp(end),
        .duration_seconds = elapsed > 0.0 ? elapsed : 0.0,
        .methods_used = outcome.methods_used,
        .methods_applied = outcome.methods_applied,
        .dry_run = outcome.dry_run,
    };
}

auto to_json(const WipeReport& report) -> nlohmann::ordered_json {
    nlohmann::ordered_json methods = nlohmann::ordered_json::object();
    // Job order, not map order
    for (const auto& path : report.devices_wiped_successfully) {
        if (auto it = report.methods_used.find(path); it != report.methods_used.end()) {
            methods[path] = it->second;
        }
    }

    return nlohmann::ordered_json{
        {"devices_targeted", report.devices_targeted},
        {"devices_wiped_successfully", report.devices_wiped_successfully},
        {"status", std::string{to_string(report.status)}},
        {"message", report.message},
        {"start_time_utc", report.start_time_utc},
        {"end_time_utc", report.end_time_utc},
        {"duration_seconds", report.duration_seconds},
        {"methods_used", std::move(methods)},
        {"dry_run", report.dry_run},
    };
}

} // namespace report
