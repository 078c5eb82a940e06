#include "services/SanitizationJob.hpp"

#include "services/ReportSynthesizer.hpp"
#include "util/Logger.hpp"

#include <format>
#include <unordered_set>
#include <utility>

namespace {

constexpr auto SUCCESS_MESSAGE = "Wipe completed successfully.";

auto percentage_of(size_t completed, size_t total) -> double {
    return total == 0 ? 0.0 : static_cast<double>(completed) * 100.0 / static_cast<double>(total);
}

} // anonymous namespace

SanitizationJob::SanitizationJob(IDeviceClassifier& classifier, ICommandExecutor& executor,
                                 DispatcherSettings settings)
    : classifier_(classifier),
      executor_(executor),
      dispatcher_(executor, classifier, std::move(settings)),
      state_(std::make_shared<ThreadState>()) {}

SanitizationJob::~SanitizationJob() {
    if (state_->operation_in_progress.load()) {
        LOG_WARNING("SanitizationJob",
                    "Job still running at shutdown; waiting for the current device to finish");
        token_.request_cancel();
    }

    std::lock_guard lock(thread_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto SanitizationJob::find_duplicate(const std::vector<std::string>& devices)
    -> std::optional<std::string> {
    std::unordered_set<std::string> seen;
    for (const auto& path : devices) {
        if (!seen.insert(path).second) {
            return path;
        }
    }
    return std::nullopt;
}

auto SanitizationJob::run(const std::vector<std::string>& devices,
                          const util::CancellationToken& token,
                          const ProgressCallback& on_progress, const LineObserver& on_output)
    -> JobResult {
    const auto start = report::Clock::now();

    JobOutcome outcome{};
    outcome.devices_targeted = devices;
    outcome.dry_run = executor_.is_dry_run();

    JobResult result{};
    const auto total = devices.size();

    auto fail = [&](util::Error error) {
        LOG_ERROR("SanitizationJob", std::format("Job aborted: {}", error.describe()));
        outcome.success = false;
        outcome.message = std::format("An error occurred: {}", error.message);
        if (on_progress) {
            const auto done = outcome.devices_wiped_successfully.size();
            on_progress(JobProgress{.completed_devices = done,
                                    .total_devices = total,
                                    .percentage = percentage_of(done, total),
                                    .current_device = {},
                                    .status = "Sanitization failed",
                                    .is_complete = true,
                                    .has_error = true,
                                    .error_message = error.message});
        }
        result.error = std::move(error);
    };

    LOG_INFO("SanitizationJob", std::format("Starting job over {} device(s){}", total,
                                            outcome.dry_run ? " (dry run)" : ""));

    if (devices.empty()) {
        fail(util::Error{util::ErrorKind::INVALID_ARGUMENT, "No devices selected"});
    } else if (auto duplicate = find_duplicate(devices)) {
        fail(util::Error{util::ErrorKind::INVALID_ARGUMENT,
                         std::format("Device {} is listed more than once", *duplicate)});
    } else {
        outcome.success = true;
        for (size_t i = 0; i < total; ++i) {
            const auto& path = devices[i];

            if (token.is_cancelled()) {
                fail(util::Error{util::ErrorKind::CANCELLED,
                                 "Wipe process was cancelled by user."});
                break;
            }

            auto device = classifier_.classify(path);
            if (!device) {
                fail(device.error());
                break;
            }

            auto dispatched = dispatcher_.dispatch(*device, on_output);
            result.attempts.insert(result.attempts.end(), dispatched.attempts.begin(),
                                   dispatched.attempts.end());
            if (!dispatched.outcome) {
                fail(dispatched.outcome.error());
                break;
            }

            outcome.devices_wiped_successfully.push_back(path);
            outcome.methods_used[path] = dispatched.method_name;
            outcome.methods_applied.push_back(*dispatched.outcome);

            LOG_INFO("SanitizationJob", std::format("Device {}/{} done: {} ({})", i + 1, total, path,
                                                    dispatched.method_name));
            if (on_progress) {
                on_progress(JobProgress{.completed_devices = i + 1,
                                        .total_devices = total,
                                        .percentage = percentage_of(i + 1, total),
                                        .current_device = path,
                                        .status = std::format("Sanitized {} using {}", path,
                                                              dispatched.method_name),
                                        .is_complete = i + 1 == total,
                                        .has_error = false,
                                        .error_message = {}});
            }
        }
        if (outcome.success) {
            outcome.message = SUCCESS_MESSAGE;
        }
    }

    outcome.attempts = result.attempts;
    result.report = report::synthesize(outcome, start, report::Clock::now());

    LOG_INFO("SanitizationJob",
             std::format("Job finished: status={} wiped={}/{} duration={:.3f}s",
                         to_string(result.report.status),
                         result.report.devices_wiped_successfully.size(), total,
                         result.report.duration_seconds));
    return result;
}

auto SanitizationJob::start(std::vector<std::string> devices, ProgressCallback on_progress,
                            LineObserver on_output, JobFinishedCallback on_finished)
    -> std::expected<void, util::Error> {
    std::lock_guard lock(thread_mutex_);
    if (state_->operation_in_progress.load()) {
        return std::unexpected(
            util::Error{util::ErrorKind::INVALID_ARGUMENT, "A sanitization job is already running"});
    }

    if (worker_.joinable()) {
        worker_.join();
    }

    token_.reset();
    state_->operation_in_progress.store(true);
    {
        std::lock_guard result_lock(result_mutex_);
        last_result_.reset();
    }

    worker_ = std::thread([this, devices = std::move(devices), on_progress = std::move(on_progress),
                           on_output = std::move(on_output),
                           on_finished = std::move(on_finished)]() {
        auto result = run(devices, token_, on_progress, on_output);
        {
            std::lock_guard result_lock(result_mutex_);
            last_result_ = result;
        }
        state_->operation_in_progress.store(false);
        if (on_finished) {
            on_finished(result);
        }
    });
    return {};
}

void SanitizationJob::cancel() {
    if (state_->operation_in_progress.load()) {
        LOG_INFO("SanitizationJob", "Cancellation requested; stopping before the next device");
    }
    token_.request_cancel();
}

auto SanitizationJob::wait() -> std::optional<JobResult> {
    {
        std::lock_guard lock(thread_mutex_);
        if (worker_.joinable()) {
            worker_.join();
        }
    }
    std::lock_guard result_lock(result_mutex_);
    return last_result_;
}

auto SanitizationJob::is_running() const -> bool {
    return state_->operation_in_progress.load();
}
