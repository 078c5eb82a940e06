/**
 * @file ErrorTest.cpp
 * @brief Unit tests for util::Error and the UUID helpers
 */

#include "util/Error.hpp"
#include "util/Uuid.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <set>

using testing::HasSubstr;

// ========== Error ==========

TEST(ErrorTest, Construct_MessageOnly_GenericKind) {
    util::Error err{"something broke"};
    EXPECT_EQ(err.kind, util::ErrorKind::GENERIC);
    EXPECT_EQ(err.what(), "something broke");
    EXPECT_EQ(err.code, 0);
}

TEST(ErrorTest, CommandFailed_CarriesInvocationContext) {
    auto err = util::Error::command_failed({"nvme", "format", "/dev/nvme0n1"}, 2,
                                           "NVMe status: INVALID_FORMAT\n");

    EXPECT_TRUE(err.is(util::ErrorKind::COMMAND_EXECUTION));
    EXPECT_EQ(err.code, 2);
    EXPECT_EQ(err.message, "'nvme' exited with status 2");
    ASSERT_EQ(err.argv.size(), 3u);
    EXPECT_EQ(err.argv[2], "/dev/nvme0n1");
    EXPECT_EQ(err.captured_stderr, "NVMe status: INVALID_FORMAT\n");
}

TEST(ErrorTest, Describe_IncludesKindAndTrimmedStderr) {
    auto err = util::Error::command_failed({"shred"}, 1, "shred: /dev/sda: Permission denied\n");
    EXPECT_EQ(err.describe(),
              "CommandExecutionError: 'shred' exited with status 1 "
              "(stderr: shred: /dev/sda: Permission denied)");
}

TEST(ErrorTest, Describe_NoStderr_KindAndMessageOnly) {
    util::Error err{util::ErrorKind::NOT_A_BLOCK_DEVICE, "/tmp/x is not a block device"};
    EXPECT_EQ(err.describe(), "NotABlockDeviceError: /tmp/x is not a block device");
}

TEST(ErrorTest, JoinRedacted_MasksOnlyExactSecret) {
    const std::vector<std::string> argv{"hdparm", "--security-erase", "pw", "/dev/pw"};

    EXPECT_EQ(util::join_redacted(argv, "pw"), "hdparm --security-erase ******** /dev/pw");
    EXPECT_EQ(util::join_redacted(argv, ""), "hdparm --security-erase pw /dev/pw");
}

TEST(ErrorTest, DescribeCommand_AppendsRedactedArgv) {
    auto err = util::Error::command_failed(
        {"hdparm", "--user-master", "user", "--security-erase", "pw", "/dev/sda"}, 5,
        "SG_IO: bad/missing sense data\n");

    const auto text = err.describe_command("pw");

    EXPECT_THAT(text, HasSubstr("CommandExecutionError"));
    EXPECT_THAT(text, HasSubstr("SG_IO: bad/missing sense data"));
    EXPECT_THAT(text, HasSubstr("[command: hdparm --user-master user --security-erase ******** /dev/sda]"));
    EXPECT_THAT(text, testing::Not(HasSubstr(" pw ")));
}

TEST(ErrorTest, DescribeCommand_NoArgv_SameAsDescribe) {
    util::Error err{util::ErrorKind::DEVICE_BUSY, "/dev/sda is mounted at /home"};
    EXPECT_EQ(err.describe_command("pw"), err.describe());
}

TEST(ErrorTest, ToString_EveryKindNamed) {
    for (auto kind : {util::ErrorKind::DEVICE_NOT_FOUND, util::ErrorKind::DEVICE_BUSY,
                      util::ErrorKind::UNSUPPORTED_DEVICE_TYPE, util::ErrorKind::COMMAND_TIMEOUT,
                      util::ErrorKind::CANCELLED, util::ErrorKind::CERTIFICATE_CREATION,
                      util::ErrorKind::SIGNING, util::ErrorKind::IDENTITY,
                      util::ErrorKind::CONFIGURATION, util::ErrorKind::IO}) {
        EXPECT_THAT(std::string{util::to_string(kind)}, HasSubstr("Error"));
    }
}

// ========== UUID ==========

TEST(UuidTest, Generate_CanonicalVersion4) {
    auto uuid = util::generate_uuid_v4();

    ASSERT_TRUE(uuid.has_value());
    EXPECT_TRUE(util::is_valid_uuid(*uuid));
    EXPECT_EQ((*uuid)[14], '4');
    EXPECT_THAT(std::string{"89ab"}, HasSubstr(std::string{(*uuid)[19]}));
}

TEST(UuidTest, Generate_Distinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto uuid = util::generate_uuid_v4();
        ASSERT_TRUE(uuid.has_value());
        seen.insert(*uuid);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(UuidTest, IsValid_RejectsMalformed) {
    EXPECT_TRUE(util::is_valid_uuid("123e4567-e89b-42d3-a456-426614174000"));
    EXPECT_FALSE(util::is_valid_uuid(""));
    EXPECT_FALSE(util::is_valid_uuid("123e4567e89b42d3a456426614174000"));
    EXPECT_FALSE(util::is_valid_uuid("123e4567-e89b-42d3-a456-42661417400g"));
    EXPECT_FALSE(util::is_valid_uuid("../../../etc/passwd-xxxxxxxxxxxxxxxxx"));
}
