/**
 * @file ReportSynthesizer.hpp
 * @brief Turns a finished job's outcome into its immutable report
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace report {

using Clock = std::chrono::system_clock;

/**
 * @brief Format a time point as UTC ISO-8601 with microseconds ("2024-05-01T12:00:00.000000Z")
 */
[[nodiscard]] auto format_utc_timestamp(Clock::time_point when) -> std::string;

/**
 * @brief Build the report for a job
 *
 * Pure and one-shot: called once per job, whatever its outcome. Duration is
 * the wall-clock delta between @p start and @p end, clamped at zero.
 */
[[nodiscard]] auto synthesize(const JobOutcome& outcome, Clock::time_point start,
                              Clock::time_point end) -> WipeReport;

/**
 * @brief JSON form of a report, keys in declaration order
 */
[[nodiscard]] auto to_json(const WipeReport& report) -> nlohmann::ordered_json;

} // namespace report
