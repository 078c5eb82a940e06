#include "services/SanitizationDispatcher.hpp"

#include "services/DevicePolicy.hpp"
#include "util/Logger.hpp"

#include <format>
#include <utility>

auto plan_for(DeviceCategory category, RotationalState rotational)
    -> std::vector<SanitizationMethod> {
    switch (category) {
        case DeviceCategory::NVME:
            return {SanitizationMethod::NVME_SANITIZE, SanitizationMethod::NVME_FORMAT};
        case DeviceCategory::SATA:
            // Unknown media is treated as rotational: secure erase only on confirmed flash.
            if (rotational == RotationalState::SOLID_STATE) {
                return {SanitizationMethod::ATA_SECURE_ERASE, SanitizationMethod::OVERWRITE};
            }
            return {SanitizationMethod::OVERWRITE};
        case DeviceCategory::OTHER:
            return {};
    }
    return {};
}

SanitizationDispatcher::SanitizationDispatcher(ICommandExecutor& executor,
                                               IDeviceClassifier& classifier,
                                               DispatcherSettings settings)
    : executor_(executor), classifier_(classifier), settings_(std::move(settings)) {}

auto SanitizationDispatcher::dispatch(const DeviceInfo& device, const LineObserver& observer)
    -> DispatchResult {
    DispatchResult result{.outcome = std::unexpected(util::Error{}), .method_name = {}, .attempts = {}};

    if (auto allowed = device_policy::validate_sanitize_target(classifier_, device); !allowed) {
        LOG_ERROR("SanitizationDispatcher",
                  std::format("Safety check refused {}: {}", device.path, allowed.error().describe()));
        result.outcome = std::unexpected(allowed.error());
        return result;
    }

    const auto plan = plan_for(device.category, device.rotational);
    if (plan.empty()) {
        auto err = util::Error{util::ErrorKind::UNSUPPORTED_DEVICE_TYPE,
                               std::format("No sanitization method for {} device {}",
                                           to_string(device.category), device.path)};
        LOG_ERROR("SanitizationDispatcher", err.message);
        result.outcome = std::unexpected(std::move(err));
        return result;
    }

    LOG_INFO("SanitizationDispatcher",
             std::format("{}: {} {} device, {} method(s) planned", device.path,
                         to_string(device.category), to_string(device.rotational), plan.size()));

    util::Error last_error;
    for (size_t i = 0; i < plan.size(); ++i) {
        const auto method = plan[i];
        auto name = describe_method(method, settings_.overwrite_passes);
        LOG_INFO("SanitizationDispatcher", std::format("{}: attempting {}", device.path, name));

        auto ran = run_method(method, device, observer);
        if (ran) {
            result.attempts.push_back(MethodAttempt{.device_path = device.path,
                                                    .method = method,
                                                    .method_name = name,
                                                    .outcome = AttemptOutcome::SUCCESS,
                                                    .failure_reason = {}});
            LOG_INFO("SanitizationDispatcher", std::format("{}: {} succeeded", device.path, name));
            result.method_name = std::move(name);
            result.outcome = method;
            return result;
        }

        result.attempts.push_back(MethodAttempt{.device_path = device.path,
                                                .method = method,
                                                .method_name = name,
                                                .outcome = AttemptOutcome::FAILED,
                                                .failure_reason = ran.error().describe()});
        if (i + 1 < plan.size()) {
            LOG_WARNING("SanitizationDispatcher",
                        std::format("{}: {} failed ({}), falling back to {}", device.path, name,
                                    ran.error().describe(),
                                    describe_method(plan[i + 1], settings_.overwrite_passes)));
        } else {
            LOG_ERROR("SanitizationDispatcher",
                      std::format("{}: {} failed ({}), no methods left", device.path, name,
                                  ran.error().describe()));
        }
        last_error = std::move(ran.error());
    }

    result.outcome = std::unexpected(std::move(last_error));
    return result;
}

auto SanitizationDispatcher::command_for(SanitizationMethod method,
                                         const std::string& device_path) const
    -> std::vector<std::string> {
    switch (method) {
        case SanitizationMethod::NVME_SANITIZE:
            return {"nvme", "sanitize", device_path, "-a", "2"};
        case SanitizationMethod::NVME_FORMAT:
            return {"nvme", "format", device_path, "-s", "1"};
        case SanitizationMethod::ATA_SECURE_ERASE:
            return hdparm_security("--security-erase", device_path);
        case SanitizationMethod::OVERWRITE:
            return {"shred", "-n", std::to_string(settings_.overwrite_passes), "-v", "-z",
                    device_path};
    }
    return {};
}

auto SanitizationDispatcher::run_method(SanitizationMethod method, const DeviceInfo& device,
                                        const LineObserver& observer)
    -> std::expected<void, util::Error> {
    if (method == SanitizationMethod::ATA_SECURE_ERASE) {
        return run_secure_erase(device, observer);
    }
    return run(command_for(method, device.path), observer);
}

auto SanitizationDispatcher::run_secure_erase(const DeviceInfo& device,
                                              const LineObserver& observer)
    -> std::expected<void, util::Error> {
    if (auto set_pass = run(hdparm_security("--security-set-pass", device.path), observer);
        !set_pass) {
        LOG_WARNING("SanitizationDispatcher",
                    std::format("{}: could not set security password", device.path));
        disable_security(device, observer);
        return std::unexpected(set_pass.error());
    }

    auto erase = run(command_for(SanitizationMethod::ATA_SECURE_ERASE, device.path), observer,
                     settings_.secure_erase_timeout);
    if (erase) {
        return {};
    }
    if (erase.error().is(util::ErrorKind::COMMAND_TIMEOUT)) {
        // The drive keeps erasing on its own once the command is accepted.
        LOG_WARNING("SanitizationDispatcher",
                    std::format("{}: secure erase still running after {} s, assuming it completes",
                                device.path,
                                std::chrono::duration_cast<std::chrono::seconds>(
                                    settings_.secure_erase_timeout)
                                    .count()));
        return {};
    }

    disable_security(device, observer);
    return std::unexpected(erase.error());
}

void SanitizationDispatcher::disable_security(const DeviceInfo& device,
                                              const LineObserver& observer) {
    if (auto disabled = run(hdparm_security("--security-disable", device.path), observer);
        !disabled) {
        LOG_WARNING("SanitizationDispatcher",
                    std::format("{}: security-disable failed, drive may stay locked: {}",
                                device.path, disabled.error().describe()));
        return;
    }
    LOG_INFO("SanitizationDispatcher", std::format("{}: security password cleared", device.path));
}

auto SanitizationDispatcher::run(const std::vector<std::string>& argv,
                                 const LineObserver& observer,
                                 std::optional<std::chrono::milliseconds> wait_limit)
    -> std::expected<void, util::Error> {
    LOG_INFO("SanitizationDispatcher", std::format("Executing: {}", redacted(argv)));
    auto result = executor_.execute(argv, observer, wait_limit);
    if (!result) {
        LOG_DEBUG("SanitizationDispatcher",
                  std::format("'{}' failed with code {}", argv.front(), result.error().code));
    }
    return result;
}

auto SanitizationDispatcher::hdparm_security(std::string_view action,
                                             const std::string& device_path) const
    -> std::vector<std::string> {
    return {"hdparm", "--user-master", "user", std::string{action},
            settings_.secure_erase_password, device_path};
}

auto SanitizationDispatcher::redacted(const std::vector<std::string>& argv) const -> std::string {
    return util::join_redacted(argv, settings_.secure_erase_password);
}
