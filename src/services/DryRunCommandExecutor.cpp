#include "services/DryRunCommandExecutor.hpp"

#include "util/Logger.hpp"

#include <format>

auto DryRunCommandExecutor::execute(const std::vector<std::string>& argv,
                                    const LineObserver& observer,
                                    std::optional<std::chrono::milliseconds> /*wait_limit*/)
    -> std::expected<void, util::Error> {
    if (argv.empty()) {
        return std::unexpected(
            util::Error{util::ErrorKind::INVALID_ARGUMENT, "Empty command line"});
    }

    const auto line = "[dry-run] " + util::join_redacted(argv, secret_);

    LOG_INFO("DryRunCommandExecutor", std::format("Skipping execution of '{}'", argv.front()));
    if (observer) {
        observer(line);
    }

    std::lock_guard lock(mutex_);
    history_.push_back(argv);
    return {};
}

auto DryRunCommandExecutor::history() const -> std::vector<std::vector<std::string>> {
    std::lock_guard lock(mutex_);
    return history_;
}
