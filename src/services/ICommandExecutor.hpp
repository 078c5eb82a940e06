/**
 * @file ICommandExecutor.hpp
 * @brief Interface for running privileged external operations
 */

#pragma once

#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>

/**
 * @class ICommandExecutor
 * @brief Runs one external command at a time, synchronously
 *
 * Implementations never retry; retry and fallback policy belongs to the
 * caller.
 */
class ICommandExecutor {
public:
    virtual ~ICommandExecutor() = default;

    /**
     * @brief Execute a command and block until it exits
     *
     * @param argv Program and arguments; argv[0] is looked up in PATH
     * @param observer Receives each output line as soon as it is complete
     *                 (may be empty)
     * @param wait_limit Stop waiting after this long. The process is left
     *                   running and COMMAND_TIMEOUT is returned.
     * @return Empty on exit status 0; COMMAND_EXECUTION with argv, exit code
     *         and captured stderr otherwise
     */
    virtual auto execute(const std::vector<std::string>& argv, const LineObserver& observer,
                         std::optional<std::chrono::milliseconds> wait_limit)
        -> std::expected<void, util::Error> = 0;

    /**
     * @brief Whether this executor only simulates commands
     */
    [[nodiscard]] virtual auto is_dry_run() const -> bool { return false; }
};
