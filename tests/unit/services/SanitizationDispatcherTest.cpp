/**
 * @file SanitizationDispatcherTest.cpp
 * @brief Unit tests for the per-device method cascade
 */

#include "services/SanitizationDispatcher.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::_;
using testing::ElementsAre;
using testing::Return;

namespace {

const std::vector<std::string> NVME_SANITIZE = {"nvme", "sanitize", "/dev/nvme0n1", "-a", "2"};
const std::vector<std::string> NVME_FORMAT = {"nvme", "format", "/dev/nvme0n1", "-s", "1"};

auto hdparm(const std::string& action, const std::string& device = "/dev/sda")
    -> std::vector<std::string> {
    return {"hdparm", "--user-master", "user", action, "MediaSanitizer", device};
}

auto shred(int passes, const std::string& device = "/dev/sda") -> std::vector<std::string> {
    return {"shred", "-n", std::to_string(passes), "-v", "-z", device};
}

}  // namespace

class SanitizationDispatcherTest : public SanitizationTestFixture {
protected:
    auto MakeDispatcher(DispatcherSettings settings = {}) -> SanitizationDispatcher {
        return SanitizationDispatcher{*mock_executor, *mock_classifier, std::move(settings)};
    }
};

// ========== plan_for Tests ==========

TEST(PlanForTest, Nvme_SanitizeThenFormat) {
    EXPECT_THAT(plan_for(DeviceCategory::NVME, RotationalState::SOLID_STATE),
                ElementsAre(SanitizationMethod::NVME_SANITIZE, SanitizationMethod::NVME_FORMAT));
}

TEST(PlanForTest, SataSolidState_SecureEraseThenOverwrite) {
    EXPECT_THAT(plan_for(DeviceCategory::SATA, RotationalState::SOLID_STATE),
                ElementsAre(SanitizationMethod::ATA_SECURE_ERASE, SanitizationMethod::OVERWRITE));
}

TEST(PlanForTest, SataRotational_OverwriteOnly) {
    EXPECT_THAT(plan_for(DeviceCategory::SATA, RotationalState::ROTATIONAL),
                ElementsAre(SanitizationMethod::OVERWRITE));
}

TEST(PlanForTest, SataUnknownMedia_TreatedAsRotational) {
    EXPECT_THAT(plan_for(DeviceCategory::SATA, RotationalState::UNKNOWN),
                ElementsAre(SanitizationMethod::OVERWRITE));
}

TEST(PlanForTest, Other_NoMethods) {
    EXPECT_TRUE(plan_for(DeviceCategory::OTHER, RotationalState::SOLID_STATE).empty());
    EXPECT_TRUE(plan_for(DeviceCategory::OTHER, RotationalState::ROTATIONAL).empty());
}

// ========== NVMe cascade ==========

TEST_F(SanitizationDispatcherTest, Dispatch_NvmeSanitizeSucceeds_RecordsSanitize) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/nvme0n1", DeviceCategory::NVME,
                                                         RotationalState::SOLID_STATE);

    auto result = dispatcher.dispatch(device, {});

    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(*result.outcome, SanitizationMethod::NVME_SANITIZE);
    EXPECT_EQ(result.method_name, "NVMe Sanitize (Cryptographic Erase)");
    EXPECT_THAT(executed, ElementsAre(NVME_SANITIZE));
    ASSERT_EQ(result.attempts.size(), 1u);
    EXPECT_EQ(result.attempts[0].outcome, AttemptOutcome::SUCCESS);
}

TEST_F(SanitizationDispatcherTest, Dispatch_NvmeSanitizeFails_FallsBackToFormat) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/nvme0n1", DeviceCategory::NVME,
                                                         RotationalState::SOLID_STATE);
    FailCommandsContaining("sanitize");

    auto result = dispatcher.dispatch(device, {});

    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(*result.outcome, SanitizationMethod::NVME_FORMAT);
    EXPECT_EQ(result.method_name, "NVMe Format (User Data Erase)");
    EXPECT_THAT(executed, ElementsAre(NVME_SANITIZE, NVME_FORMAT));
    ASSERT_EQ(result.attempts.size(), 2u);
    EXPECT_EQ(result.attempts[0].outcome, AttemptOutcome::FAILED);
    EXPECT_FALSE(result.attempts[0].failure_reason.empty());
    EXPECT_EQ(result.attempts[1].outcome, AttemptOutcome::SUCCESS);
}

TEST_F(SanitizationDispatcherTest, Dispatch_NvmeBothFail_FailsWithoutOverwrite) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/nvme0n1", DeviceCategory::NVME,
                                                         RotationalState::SOLID_STATE);
    respond = [](const std::vector<std::string>& argv) {
        return MockCommandExecutor::Failure(argv, argv[1] == "format" ? 7 : 1);
    };

    auto result = dispatcher.dispatch(device, {});

    ASSERT_FALSE(result.outcome.has_value());
    EXPECT_EQ(result.outcome.error().kind, util::ErrorKind::COMMAND_EXECUTION);
    // The device error is the last method's error
    EXPECT_EQ(result.outcome.error().code, 7);
    EXPECT_EQ(result.outcome.error().argv, NVME_FORMAT);
    EXPECT_THAT(executed, ElementsAre(NVME_SANITIZE, NVME_FORMAT));
    EXPECT_EQ(result.attempts.size(), 2u);
}

// ========== SATA cascade ==========

TEST_F(SanitizationDispatcherTest, Dispatch_SataSsdSecureEraseSucceeds_RecordsAtaSecureErase) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/sda", DeviceCategory::SATA,
                                                         RotationalState::SOLID_STATE);

    auto result = dispatcher.dispatch(device, {});

    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(result.method_name, "ATA Secure Erase");
    EXPECT_THAT(executed,
                ElementsAre(hdparm("--security-set-pass"), hdparm("--security-erase")));
}

TEST_F(SanitizationDispatcherTest, Dispatch_SetPassFails_DisablesThenOverwrites) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/sda", DeviceCategory::SATA,
                                                         RotationalState::SOLID_STATE);
    FailCommandsContaining("--security-set-pass");

    auto result = dispatcher.dispatch(device, {});

    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(*result.outcome, SanitizationMethod::OVERWRITE);
    EXPECT_EQ(result.method_name, "3-Pass Overwrite (shred)");
    EXPECT_THAT(executed, ElementsAre(hdparm("--security-set-pass"),
                                      hdparm("--security-disable"), shred(3)));
    ASSERT_EQ(result.attempts.size(), 2u);
    EXPECT_EQ(result.attempts[0].method, SanitizationMethod::ATA_SECURE_ERASE);
    EXPECT_EQ(result.attempts[0].outcome, AttemptOutcome::FAILED);
}

TEST_F(SanitizationDispatcherTest, Dispatch_EraseFails_DisablesThenOverwrites) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/sda", DeviceCategory::SATA,
                                                         RotationalState::SOLID_STATE);
    FailCommandsContaining("--security-erase");

    auto result = dispatcher.dispatch(device, {});

    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(*result.outcome, SanitizationMethod::OVERWRITE);
    EXPECT_THAT(executed,
                ElementsAre(hdparm("--security-set-pass"), hdparm("--security-erase"),
                            hdparm("--security-disable"), shred(3)));
}

TEST_F(SanitizationDispatcherTest, Dispatch_DisableAlsoFails_StillOverwrites) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/sda", DeviceCategory::SATA,
                                                         RotationalState::SOLID_STATE);
    respond = [](const std::vector<std::string>& argv) {
        if (argv[0] == "hdparm") {
            return MockCommandExecutor::Failure(argv);
        }
        return std::expected<void, util::Error>{};
    };

    auto result = dispatcher.dispatch(device, {});

    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(*result.outcome, SanitizationMethod::OVERWRITE);
}

TEST_F(SanitizationDispatcherTest, Dispatch_EraseTimesOut_AssumesSuccess) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/sda", DeviceCategory::SATA,
                                                         RotationalState::SOLID_STATE);
    respond = [](const std::vector<std::string>& argv) {
        if (argv[3] == "--security-erase") {
            return MockCommandExecutor::Timeout();
        }
        return std::expected<void, util::Error>{};
    };

    auto result = dispatcher.dispatch(device, {});

    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(result.method_name, "ATA Secure Erase");
    EXPECT_THAT(executed,
                ElementsAre(hdparm("--security-set-pass"), hdparm("--security-erase")));
}

TEST_F(SanitizationDispatcherTest, Dispatch_EraseStep_UsesConfiguredWaitLimit) {
    DispatcherSettings settings;
    settings.secure_erase_timeout = std::chrono::seconds{42};
    auto dispatcher = MakeDispatcher(settings);
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/sda", DeviceCategory::SATA,
                                                         RotationalState::SOLID_STATE);

    EXPECT_CALL(*mock_executor, execute(hdparm("--security-set-pass"), _, std::optional<std::chrono::milliseconds>{}))
        .WillOnce(Return(std::expected<void, util::Error>{}));
    EXPECT_CALL(*mock_executor,
                execute(hdparm("--security-erase"), _,
                        std::optional<std::chrono::milliseconds>{std::chrono::seconds{42}}))
        .WillOnce(Return(std::expected<void, util::Error>{}));

    auto result = dispatcher.dispatch(device, {});
    EXPECT_TRUE(result.outcome.has_value());
}

TEST_F(SanitizationDispatcherTest, Dispatch_SataHdd_OverwritesWithConfiguredPasses) {
    DispatcherSettings settings;
    settings.overwrite_passes = 7;
    auto dispatcher = MakeDispatcher(settings);
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/sdb", DeviceCategory::SATA,
                                                         RotationalState::ROTATIONAL);

    auto result = dispatcher.dispatch(device, {});

    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_EQ(result.method_name, "7-Pass Overwrite (shred)");
    EXPECT_THAT(executed, ElementsAre(shred(7, "/dev/sdb")));
}

TEST_F(SanitizationDispatcherTest, Dispatch_OverwriteFails_ReturnsCommandError) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice();
    FailCommandsContaining("shred", 2);

    auto result = dispatcher.dispatch(device, {});

    ASSERT_FALSE(result.outcome.has_value());
    EXPECT_EQ(result.outcome.error().kind, util::ErrorKind::COMMAND_EXECUTION);
    EXPECT_EQ(result.outcome.error().code, 2);
    EXPECT_EQ(result.outcome.error().captured_stderr, "simulated failure");
}

// ========== Safety checks ==========

TEST_F(SanitizationDispatcherTest, Dispatch_OtherCategory_UnsupportedWithoutCommands) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/vdx", DeviceCategory::OTHER,
                                                         RotationalState::UNKNOWN);

    auto result = dispatcher.dispatch(device, {});

    ASSERT_FALSE(result.outcome.has_value());
    EXPECT_EQ(result.outcome.error().kind, util::ErrorKind::UNSUPPORTED_DEVICE_TYPE);
    EXPECT_TRUE(executed.empty());
    EXPECT_TRUE(result.attempts.empty());
}

TEST_F(SanitizationDispatcherTest, Dispatch_NotABlockDevice_AbortsBeforeAnyCommand) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/sda");
    EXPECT_CALL(*mock_classifier, ensure_block_device("/dev/sda"))
        .WillOnce(Return(std::unexpected(
            util::Error{util::ErrorKind::NOT_A_BLOCK_DEVICE, "/dev/sda is not a block device"})));
    EXPECT_CALL(*mock_executor, execute(_, _, _)).Times(0);

    auto result = dispatcher.dispatch(device, {});

    ASSERT_FALSE(result.outcome.has_value());
    EXPECT_EQ(result.outcome.error().kind, util::ErrorKind::NOT_A_BLOCK_DEVICE);
}

TEST_F(SanitizationDispatcherTest, Dispatch_MountedDevice_RefusedAsBusy) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice("/dev/sda", DeviceCategory::SATA,
                                                         RotationalState::ROTATIONAL, true);
    EXPECT_CALL(*mock_executor, execute(_, _, _)).Times(0);

    auto result = dispatcher.dispatch(device, {});

    ASSERT_FALSE(result.outcome.has_value());
    EXPECT_EQ(result.outcome.error().kind, util::ErrorKind::DEVICE_BUSY);
    EXPECT_THAT(result.outcome.error().message, testing::HasSubstr("/mnt/test"));
}

TEST_F(SanitizationDispatcherTest, Dispatch_ForwardsObserverToExecutor) {
    auto dispatcher = MakeDispatcher();
    auto device = MockDeviceClassifier::CreateTestDevice();
    std::vector<std::string> lines;

    EXPECT_CALL(*mock_executor, execute(_, _, _))
        .WillOnce([](const std::vector<std::string>&, const LineObserver& observer,
                     std::optional<std::chrono::milliseconds>) {
            observer("shred: /dev/sda: pass 1/4 (random)...");
            return std::expected<void, util::Error>{};
        });

    auto result = dispatcher.dispatch(device, [&lines](std::string_view line) {
        lines.emplace_back(line);
    });

    ASSERT_TRUE(result.outcome.has_value());
    EXPECT_THAT(lines, ElementsAre("shred: /dev/sda: pass 1/4 (random)..."));
}

TEST_F(SanitizationDispatcherTest, CommandFor_AllMethods_StableArgv) {
    auto dispatcher = MakeDispatcher();

    EXPECT_EQ(dispatcher.command_for(SanitizationMethod::NVME_SANITIZE, "/dev/nvme0n1"),
              NVME_SANITIZE);
    EXPECT_EQ(dispatcher.command_for(SanitizationMethod::NVME_FORMAT, "/dev/nvme0n1"),
              NVME_FORMAT);
    EXPECT_EQ(dispatcher.command_for(SanitizationMethod::ATA_SECURE_ERASE, "/dev/sda"),
              hdparm("--security-erase"));
    EXPECT_EQ(dispatcher.command_for(SanitizationMethod::OVERWRITE, "/dev/sda"), shred(3));
}
