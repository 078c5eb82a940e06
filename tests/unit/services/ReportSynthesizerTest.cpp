/**
 * @file ReportSynthesizerTest.cpp
 * @brief Unit tests for report synthesis and its JSON form
 */

#include "services/ReportSynthesizer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <regex>

using namespace std::chrono_literals;
using testing::ElementsAre;

namespace {

// 2024-05-01T12:00:00Z
const report::Clock::time_point EPOCH_2024{std::chrono::sys_days{std::chrono::year{2024} /
                                                                 std::chrono::May / 1} +
                                           12h};

auto successful_outcome() -> JobOutcome {
    JobOutcome outcome;
    outcome.devices_targeted = {"/dev/sdb", "/dev/nvme0n1"};
    outcome.devices_wiped_successfully = {"/dev/sdb", "/dev/nvme0n1"};
    outcome.methods_used = {{"/dev/sdb", "3-Pass Overwrite (shred)"},
                            {"/dev/nvme0n1", "NVMe Sanitize (Cryptographic Erase)"}};
    outcome.methods_applied = {SanitizationMethod::OVERWRITE, SanitizationMethod::NVME_SANITIZE};
    outcome.success = true;
    outcome.message = "Wipe completed successfully.";
    return outcome;
}

}  // namespace

TEST(ReportSynthesizerTest, FormatUtcTimestamp_WholeSecond_SixFractionDigits) {
    EXPECT_EQ(report::format_utc_timestamp(EPOCH_2024), "2024-05-01T12:00:00.000000Z");
}

TEST(ReportSynthesizerTest, FormatUtcTimestamp_SubMicrosecond_Truncated) {
    const auto when = EPOCH_2024 + 1234567ns;
    EXPECT_EQ(report::format_utc_timestamp(
                  std::chrono::time_point_cast<report::Clock::duration>(when)),
              "2024-05-01T12:00:00.001234Z");
}

TEST(ReportSynthesizerTest, FormatUtcTimestamp_Now_MatchesIsoPattern) {
    const std::regex pattern{R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}Z)"};
    EXPECT_TRUE(std::regex_match(report::format_utc_timestamp(report::Clock::now()), pattern));
}

TEST(ReportSynthesizerTest, Synthesize_Success_CopiesOutcome) {
    auto report = report::synthesize(successful_outcome(), EPOCH_2024, EPOCH_2024 + 2500ms);

    EXPECT_EQ(report.status, WipeStatus::SUCCESS);
    EXPECT_EQ(report.message, "Wipe completed successfully.");
    EXPECT_EQ(report.start_time_utc, "2024-05-01T12:00:00.000000Z");
    EXPECT_EQ(report.end_time_utc, "2024-05-01T12:00:02.500000Z");
    EXPECT_DOUBLE_EQ(report.duration_seconds, 2.5);
    EXPECT_THAT(report.devices_wiped_successfully, ElementsAre("/dev/sdb", "/dev/nvme0n1"));
    EXPECT_FALSE(report.dry_run);
}

TEST(ReportSynthesizerTest, Synthesize_EndBeforeStart_DurationClampedToZero) {
    auto report = report::synthesize(successful_outcome(), EPOCH_2024, EPOCH_2024 - 1s);
    EXPECT_DOUBLE_EQ(report.duration_seconds, 0.0);
}

TEST(ReportSynthesizerTest, Synthesize_Failure_StatusFailed) {
    JobOutcome outcome;
    outcome.devices_targeted = {"/dev/sda"};
    outcome.success = false;
    outcome.message = "An error occurred: boom";

    auto report = report::synthesize(outcome, EPOCH_2024, EPOCH_2024);

    EXPECT_EQ(report.status, WipeStatus::FAILED);
    EXPECT_EQ(report.message, "An error occurred: boom");
    EXPECT_TRUE(report.devices_wiped_successfully.empty());
}

TEST(ReportSynthesizerTest, Synthesize_DryRun_MessageSaysSo) {
    auto outcome = successful_outcome();
    outcome.dry_run = true;

    auto report = report::synthesize(outcome, EPOCH_2024, EPOCH_2024);

    EXPECT_TRUE(report.dry_run);
    EXPECT_EQ(report.message, "Wipe completed successfully. (dry run: no data was destroyed)");
}

TEST(ReportSynthesizerTest, ToJson_KeysInDeclarationOrder) {
    auto report = report::synthesize(successful_outcome(), EPOCH_2024, EPOCH_2024 + 1s);
    auto json = report::to_json(report);

    std::vector<std::string> keys;
    for (const auto& [key, value] : json.items()) {
        keys.push_back(key);
    }
    EXPECT_THAT(keys, ElementsAre("devices_targeted", "devices_wiped_successfully", "status",
                                  "message", "start_time_utc", "end_time_utc",
                                  "duration_seconds", "methods_used", "dry_run"));
    EXPECT_EQ(json["status"], "Success");
}

TEST(ReportSynthesizerTest, ToJson_MethodsUsed_FollowJobOrder) {
    auto report = report::synthesize(successful_outcome(), EPOCH_2024, EPOCH_2024);
    auto json = report::to_json(report);

    std::vector<std::string> devices;
    for (const auto& [key, value] : json["methods_used"].items()) {
        devices.push_back(key);
    }
    // /dev/sdb sorts after /dev/nvme0n1 but was wiped first
    EXPECT_THAT(devices, ElementsAre("/dev/sdb", "/dev/nvme0n1"));
}
