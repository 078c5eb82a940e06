#pragma once

#include "services/ICommandExecutor.hpp"

#include <mutex>
#include <string>
#include <utility>

/**
 * @class DryRunCommandExecutor
 * @brief Executor that only reports what it would run
 *
 * Every command "succeeds" without spawning anything. The observer receives
 * a single "[dry-run] ..." line per command, with the secure erase password
 * masked.
 */
class DryRunCommandExecutor : public ICommandExecutor {
public:
    /**
     * @param secret Argument value never echoed in clear (the transient ATA password)
     */
    explicit DryRunCommandExecutor(std::string secret = {}) : secret_(std::move(secret)) {}

    auto execute(const std::vector<std::string>& argv, const LineObserver& observer,
                 std::optional<std::chrono::milliseconds> wait_limit)
        -> std::expected<void, util::Error> override;

    [[nodiscard]] auto is_dry_run() const -> bool override { return true; }

    /**
     * @brief Commands received so far, in order
     */
    [[nodiscard]] auto history() const -> std::vector<std::vector<std::string>>;

private:
    std::string secret_;
    mutable std::mutex mutex_;
    std::vector<std::vector<std::string>> history_;
};
