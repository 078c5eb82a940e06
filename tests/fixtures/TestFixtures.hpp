/**
 * @file TestFixtures.hpp
 * @brief Common test fixtures for media-sanitizer tests
 */

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "mocks/MockCommandExecutor.hpp"
#include "mocks/MockDeviceClassifier.hpp"
#include "models/WipeTypes.hpp"

/**
 * @brief Fresh temporary directory per test, removed afterwards
 */
class TempDirFixture : public ::testing::Test {
protected:
    std::filesystem::path temp_dir;

    void SetUp() override {
        std::random_device rd;
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir = std::filesystem::temp_directory_path() /
                   std::format("media-sanitizer-{}-{}-{:08x}", info->test_suite_name(),
                               info->name(), rd());
        std::filesystem::create_directories(temp_dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir, ec);
    }

    void WriteFile(const std::filesystem::path& path, const std::string& content) const {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        out << content;
    }

    static auto ReadFile(const std::filesystem::path& path) -> std::string {
        std::ifstream in{path, std::ios::binary};
        return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    }
};

/**
 * @brief Fixture with pre-configured mocks for dispatcher and job tests
 *
 * Every path passes the block-device check and every command succeeds
 * unless a test says otherwise.
 */
class SanitizationTestFixture : public ::testing::Test {
protected:
    std::shared_ptr<MockDeviceClassifier> mock_classifier;
    std::shared_ptr<MockCommandExecutor> mock_executor;
    std::vector<std::vector<std::string>> executed;
    std::vector<JobProgress> captured_progress;

    // Decides the result of each command; success when empty
    std::function<std::expected<void, util::Error>(const std::vector<std::string>&)> respond;

    void SetUp() override {
        mock_classifier = MockDeviceClassifier::CreateNiceMock();
        mock_executor = MockCommandExecutor::CreateNiceMock();
        executed.clear();
        captured_progress.clear();
        respond = nullptr;

        // Record every argv; individual tests override the result
        ON_CALL(*mock_executor, execute(testing::_, testing::_, testing::_))
            .WillByDefault([this](const std::vector<std::string>& argv, const LineObserver&,
                                  std::optional<std::chrono::milliseconds>) {
                executed.push_back(argv);
                return respond ? respond(argv) : std::expected<void, util::Error>{};
            });
    }

    // Fail every command whose argv contains @p token
    void FailCommandsContaining(const std::string& token, int exit_code = 1) {
        respond = [token, exit_code](const std::vector<std::string>& argv) {
            if (std::ranges::find(argv, token) != argv.end()) {
                return MockCommandExecutor::Failure(argv, exit_code);
            }
            return std::expected<void, util::Error>{};
        };
    }

    void ExpectDevice(const DeviceInfo& device) {
        ON_CALL(*mock_classifier, classify(device.path))
            .WillByDefault(testing::Return(std::expected<DeviceInfo, util::Error>{device}));
    }

    ProgressCallback CreateCapturingCallback() {
        return [this](const JobProgress& progress) { captured_progress.push_back(progress); };
    }

    void TearDown() override {
        mock_classifier.reset();
        mock_executor.reset();
    }
};

/**
 * @brief Helper for testing threaded operations with timeouts
 */
class ThreadingTestHelper {
public:
    template<typename Predicate>
    static bool WaitUntil(Predicate&& predicate,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds{5000},
                          std::chrono::milliseconds poll_interval = std::chrono::milliseconds{10}) {
        auto start = std::chrono::steady_clock::now();
        while (std::chrono::steady_clock::now() - start < timeout) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(poll_interval);
        }
        return false;
    }
};
