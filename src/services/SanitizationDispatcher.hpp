/**
 * @file SanitizationDispatcher.hpp
 * @brief Per-device method cascade with fallbacks and safety checks
 */

#pragma once

#include "models/DeviceInfo.hpp"
#include "models/WipeTypes.hpp"
#include "services/ICommandExecutor.hpp"
#include "services/IDeviceClassifier.hpp"
#include "util/Error.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <vector>

/**
 * @struct DispatcherSettings
 * @brief Tunables of the cascade
 */
struct DispatcherSettings {
    static constexpr int DEFAULT_OVERWRITE_PASSES = 3;
    static constexpr auto DEFAULT_SECURE_ERASE_PASSWORD = "MediaSanitizer";
    static constexpr auto DEFAULT_SECURE_ERASE_TIMEOUT = std::chrono::seconds{600};

    int overwrite_passes = DEFAULT_OVERWRITE_PASSES;
    std::string secure_erase_password = DEFAULT_SECURE_ERASE_PASSWORD;
    std::chrono::milliseconds secure_erase_timeout = DEFAULT_SECURE_ERASE_TIMEOUT;
};

/**
 * @struct DispatchResult
 * @brief Outcome of sanitizing one device
 */
struct DispatchResult {
    std::expected<SanitizationMethod, util::Error> outcome;
    std::string method_name;              ///< Description of the successful method, empty on failure
    std::vector<MethodAttempt> attempts;  ///< Every method tried, in order
};

/**
 * @brief Ordered list of methods to try for a device
 *
 * NVMe: sanitize then format. SATA solid-state: secure erase then
 * overwrite. SATA rotational or unknown: overwrite only. Other: nothing.
 */
[[nodiscard]] auto plan_for(DeviceCategory category, RotationalState rotational)
    -> std::vector<SanitizationMethod>;

/**
 * @class SanitizationDispatcher
 * @brief Runs the cascade for one device at a time
 *
 * The block-device and mount checks run before the first command of every
 * dispatch. A method failure moves on to the next method in the plan; when
 * the plan is exhausted the last method's error is returned.
 */
class SanitizationDispatcher {
public:
    SanitizationDispatcher(ICommandExecutor& executor, IDeviceClassifier& classifier,
                           DispatcherSettings settings = {});

    /**
     * @brief Sanitize one classified device
     * @param device Device as classified at job start
     * @param observer Receives live output of every command (may be empty)
     */
    [[nodiscard]] auto dispatch(const DeviceInfo& device, const LineObserver& observer)
        -> DispatchResult;

    [[nodiscard]] auto settings() const -> const DispatcherSettings& { return settings_; }

    /**
     * @brief Argument vector of the primary command for a method
     */
    [[nodiscard]] auto command_for(SanitizationMethod method, const std::string& device_path) const
        -> std::vector<std::string>;

private:
    auto run_method(SanitizationMethod method, const DeviceInfo& device,
                    const LineObserver& observer) -> std::expected<void, util::Error>;
    auto run_secure_erase(const DeviceInfo& device, const LineObserver& observer)
        -> std::expected<void, util::Error>;
    void disable_security(const DeviceInfo& device, const LineObserver& observer);
    auto run(const std::vector<std::string>& argv, const LineObserver& observer,
             std::optional<std::chrono::milliseconds> wait_limit = std::nullopt)
        -> std::expected<void, util::Error>;

    [[nodiscard]] auto hdparm_security(std::string_view action, const std::string& device_path) const
        -> std::vector<std::string>;
    [[nodiscard]] auto redacted(const std::vector<std::string>& argv) const -> std::string;

    ICommandExecutor& executor_;
    IDeviceClassifier& classifier_;
    DispatcherSettings settings_;
};
