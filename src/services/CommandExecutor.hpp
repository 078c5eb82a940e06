#pragma once

#include "services/ICommandExecutor.hpp"
#include "util/FileDescriptor.hpp"

#include <glib.h>

#include <mutex>
#include <vector>

/**
 * @class CommandExecutor
 * @brief Spawns commands with GLib and streams their output
 *
 * stdout and stderr are drained concurrently with poll(2) so a chatty
 * stream can never stall the child. Complete lines from either stream go to
 * the observer (tools such as shred report progress on stderr); stderr is
 * also captured in full for error reporting.
 *
 * Children run in their own process group so a terminal interrupt aimed at
 * the CLI does not reach them. A process whose wait limit elapsed is never
 * signalled. It is kept in an
 * outstanding list, reaped opportunistically before the next command and
 * waited for in the destructor.
 */
class CommandExecutor : public ICommandExecutor {
public:
    CommandExecutor() = default;
    ~CommandExecutor() override;

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;
    CommandExecutor(CommandExecutor&&) = delete;
    CommandExecutor& operator=(CommandExecutor&&) = delete;

    auto execute(const std::vector<std::string>& argv, const LineObserver& observer,
                 std::optional<std::chrono::milliseconds> wait_limit)
        -> std::expected<void, util::Error> override;

    /**
     * @brief Number of timed-out processes not yet reaped
     */
    [[nodiscard]] auto outstanding_count() -> size_t;

private:
    struct OutstandingProcess {
        GPid pid = 0;
        util::FileDescriptor stdout_pipe;
        util::FileDescriptor stderr_pipe;
        std::string program;
    };

    void reap_finished();

    std::mutex outstanding_mutex_;
    std::vector<OutstandingProcess> outstanding_;
};
