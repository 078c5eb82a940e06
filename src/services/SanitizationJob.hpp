/**
 * @file SanitizationJob.hpp
 * @brief Sequential, fail-fast sanitization of a device list
 */

#pragma once

#include "models/WipeTypes.hpp"
#include "services/ICommandExecutor.hpp"
#include "services/IDeviceClassifier.hpp"
#include "services/SanitizationDispatcher.hpp"
#include "util/CancellationToken.hpp"
#include "util/Error.hpp"

#include <atomic>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/**
 * @struct JobResult
 * @brief Report plus the detail that does not belong in it
 */
struct JobResult {
    WipeReport report;
    std::vector<MethodAttempt> attempts;  ///< All attempts across all devices, in order
    std::optional<util::Error> error;     ///< Error that stopped the job, if any
};

using JobFinishedCallback = std::function<void(const JobResult&)>;

/**
 * @class SanitizationJob
 * @brief Drives the dispatcher over a device list
 *
 * Devices are processed strictly in order. The first device that cannot be
 * sanitized stops the job; devices after it are not touched. Cancellation is
 * honoured between devices only. A report is produced for every run,
 * including rejected and failed ones.
 *
 * One job at a time per instance. The destructor requests cancellation and
 * joins the worker, which returns once its current device is done.
 */
class SanitizationJob {
public:
    SanitizationJob(IDeviceClassifier& classifier, ICommandExecutor& executor,
                    DispatcherSettings settings = {});
    ~SanitizationJob();

    SanitizationJob(const SanitizationJob&) = delete;
    SanitizationJob& operator=(const SanitizationJob&) = delete;

    /**
     * @brief Run a job on the calling thread
     * @param devices Device paths, processed in the given order
     * @param token Checked before each device
     * @param on_progress Called once per completed device and once at the end (may be empty)
     * @param on_output Receives live command output (may be empty)
     */
    [[nodiscard]] auto run(const std::vector<std::string>& devices,
                           const util::CancellationToken& token,
                           const ProgressCallback& on_progress = {},
                           const LineObserver& on_output = {}) -> JobResult;

    /**
     * @brief Run a job on the dedicated worker thread
     * @return INVALID_ARGUMENT if a job is already running
     */
    auto start(std::vector<std::string> devices, ProgressCallback on_progress = {},
               LineObserver on_output = {}, JobFinishedCallback on_finished = {})
        -> std::expected<void, util::Error>;

    /**
     * @brief Ask the running job to stop before its next device
     */
    void cancel();

    /**
     * @brief Block until the worker finishes
     * @return Result of the last started job, or nullopt if none was started
     */
    auto wait() -> std::optional<JobResult>;

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto cancellation_token() const -> util::CancellationToken { return token_; }

private:
    struct ThreadState {
        std::atomic<bool> operation_in_progress{false};
    };

    [[nodiscard]] static auto find_duplicate(const std::vector<std::string>& devices)
        -> std::optional<std::string>;

    IDeviceClassifier& classifier_;
    ICommandExecutor& executor_;
    SanitizationDispatcher dispatcher_;

    util::CancellationToken token_;
    std::shared_ptr<ThreadState> state_;
    std::thread worker_;
    mutable std::mutex thread_mutex_;  // Protects worker_
    mutable std::mutex result_mutex_;  // Protects last_result_
    std::optional<JobResult> last_result_;
};
