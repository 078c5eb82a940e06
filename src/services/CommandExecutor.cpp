#include "services/CommandExecutor.hpp"

#include "util/Logger.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <string_view>
#include <thread>
#include <utility>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr size_t READ_CHUNK = 4096;
constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds{50};

/**
 * @brief Accumulates raw pipe data and hands out complete lines
 */
class LineSplitter {
public:
    explicit LineSplitter(const LineObserver& observer) : observer_(observer) {}

    void feed(std::string_view chunk) {
        buffer_.append(chunk);
        size_t start = 0;
        for (auto pos = buffer_.find('\n', start); pos != std::string::npos;
             pos = buffer_.find('\n', start)) {
            emit(std::string_view{buffer_}.substr(start, pos - start));
            start = pos + 1;
        }
        buffer_.erase(0, start);
    }

    void finish() {
        if (!buffer_.empty()) {
            emit(buffer_);
            buffer_.clear();
        }
    }

private:
    void emit(std::string_view line) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (observer_) {
            observer_(line);
        }
    }

    const LineObserver& observer_;
    std::string buffer_;
};

auto decode_wait_status(int wait_status) -> int {
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    if (WIFSIGNALED(wait_status)) {
        return 128 + WTERMSIG(wait_status);
    }
    return -1;
}

// Runs in the child between fork and exec. A terminal Ctrl-C is delivered to
// the whole foreground process group; the child must not receive it.
void isolate_process_group(gpointer /*user_data*/) {
    ::setpgid(0, 0);
}

auto remaining_ms(std::chrono::steady_clock::time_point deadline) -> int {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

}  // namespace

CommandExecutor::~CommandExecutor() {
    std::lock_guard lock(outstanding_mutex_);
    for (auto& process : outstanding_) {
        // Never kill: a half-finished erase must be allowed to complete.
        LOG_WARNING("CommandExecutor",
                    std::format("Waiting for outstanding '{}' (pid {}) to finish", process.program,
                                process.pid));
        int wait_status = 0;
        while (::waitpid(process.pid, &wait_status, 0) < 0 && errno == EINTR) {
        }
        g_spawn_close_pid(process.pid);
        LOG_INFO("CommandExecutor",
                 std::format("Outstanding '{}' (pid {}) exited with status {}", process.program,
                             process.pid, decode_wait_status(wait_status)));
    }
    outstanding_.clear();
}

auto CommandExecutor::outstanding_count() -> size_t {
    reap_finished();
    std::lock_guard lock(outstanding_mutex_);
    return outstanding_.size();
}

void CommandExecutor::reap_finished() {
    std::lock_guard lock(outstanding_mutex_);
    std::erase_if(outstanding_, [](OutstandingProcess& process) {
        int wait_status = 0;
        const pid_t result = ::waitpid(process.pid, &wait_status, WNOHANG);
        if (result != process.pid) {
            return false;
        }
        g_spawn_close_pid(process.pid);
        LOG_INFO("CommandExecutor",
                 std::format("Outstanding '{}' (pid {}) exited with status {}", process.program,
                             process.pid, decode_wait_status(wait_status)));
        return true;
    });
}

auto CommandExecutor::execute(const std::vector<std::string>& argv, const LineObserver& observer,
                              std::optional<std::chrono::milliseconds> wait_limit)
    -> std::expected<void, util::Error> {
    if (argv.empty()) {
        return std::unexpected(
            util::Error{util::ErrorKind::INVALID_ARGUMENT, "Empty command line"});
    }

    reap_finished();

    std::vector<gchar*> spawn_argv;
    spawn_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        spawn_argv.push_back(const_cast<gchar*>(arg.c_str()));
    }
    spawn_argv.push_back(nullptr);

    gint stdout_fd = -1;
    gint stderr_fd = -1;
    GPid child_pid = 0;
    GError* error = nullptr;

    gboolean spawned = g_spawn_async_with_pipes(
        nullptr,           // working directory
        spawn_argv.data(), // arguments
        nullptr,           // environment (inherit)
        static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH | G_SPAWN_DO_NOT_REAP_CHILD),
        isolate_process_group, // child setup
        nullptr,           // user data
        &child_pid,        // child PID
        nullptr,           // stdin
        &stdout_fd,        // stdout
        &stderr_fd,        // stderr
        &error
    );

    if (!spawned) {
        std::string message = error ? error->message : "Unknown spawn error";
        if (error) {
            g_error_free(error);
        }
        LOG_ERROR("CommandExecutor", std::format("Failed to spawn '{}': {}", argv.front(), message));
        return std::unexpected(util::Error::command_failed(argv, -1, std::move(message)));
    }

    LOG_DEBUG("CommandExecutor", std::format("Started '{}' as pid {}", argv.front(), child_pid));

    util::FileDescriptor stdout_pipe{stdout_fd};
    util::FileDescriptor stderr_pipe{stderr_fd};

    const auto deadline = wait_limit ? std::chrono::steady_clock::now() + *wait_limit
                                     : std::chrono::steady_clock::time_point::max();

    LineSplitter stdout_lines{observer};
    LineSplitter stderr_lines{observer};
    std::string captured_stderr;
    bool timed_out = false;

    std::array<char, READ_CHUNK> buffer{};
    while (stdout_pipe || stderr_pipe) {
        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (stdout_pipe) {
            fds[count++] = pollfd{.fd = stdout_pipe.get(), .events = POLLIN, .revents = 0};
        }
        if (stderr_pipe) {
            fds[count++] = pollfd{.fd = stderr_pipe.get(), .events = POLLIN, .revents = 0};
        }

        const int timeout = wait_limit ? remaining_ms(deadline) : -1;
        if (wait_limit && timeout == 0) {
            timed_out = true;
            break;
        }

        const int ready = ::poll(fds.data(), count, timeout);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARNING("CommandExecutor",
                        std::format("poll failed for pid {}: {}", child_pid, std::strerror(errno)));
            break;
        }
        if (ready == 0) {
            continue;  // deadline re-checked at the top of the loop
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const bool is_stdout = stdout_pipe && fds[i].fd == stdout_pipe.get();
            const ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                (is_stdout ? stdout_pipe : stderr_pipe).reset();
                continue;
            }
            const std::string_view chunk{buffer.data(), static_cast<size_t>(n)};
            if (is_stdout) {
                stdout_lines.feed(chunk);
            } else {
                captured_stderr.append(chunk);
                stderr_lines.feed(chunk);
            }
        }
    }

    stdout_lines.finish();
    stderr_lines.finish();

    int wait_status = 0;
    bool exited = false;
    while (!timed_out && !exited) {
        const pid_t result = ::waitpid(child_pid, &wait_status, wait_limit ? WNOHANG : 0);
        if (result == child_pid) {
            exited = true;
        } else if (result < 0 && errno != EINTR) {
            LOG_ERROR("CommandExecutor",
                      std::format("waitpid failed for pid {}: {}", child_pid, std::strerror(errno)));
            g_spawn_close_pid(child_pid);
            return std::unexpected(util::Error::command_failed(argv, -1, captured_stderr));
        } else if (result == 0) {
            if (remaining_ms(deadline) == 0) {
                timed_out = true;
            } else {
                std::this_thread::sleep_for(REAP_POLL_INTERVAL);
            }
        }
    }

    if (timed_out) {
        LOG_WARNING("CommandExecutor",
                    std::format("'{}' (pid {}) still running after {} ms; not waiting further",
                                argv.front(), child_pid, wait_limit->count()));
        {
            std::lock_guard lock(outstanding_mutex_);
            outstanding_.push_back(OutstandingProcess{.pid = child_pid,
                                                      .stdout_pipe = std::move(stdout_pipe),
                                                      .stderr_pipe = std::move(stderr_pipe),
                                                      .program = argv.front()});
        }
        util::Error err{util::ErrorKind::COMMAND_TIMEOUT,
                        std::format("'{}' did not finish within {} ms", argv.front(),
                                    wait_limit->count())};
        err.argv = argv;
        err.captured_stderr = std::move(captured_stderr);
        return std::unexpected(std::move(err));
    }

    g_spawn_close_pid(child_pid);

    const int exit_code = decode_wait_status(wait_status);
    LOG_DEBUG("CommandExecutor",
              std::format("'{}' (pid {}) exited with status {}", argv.front(), child_pid, exit_code));

    if (exit_code != 0) {
        return std::unexpected(util::Error::command_failed(argv, exit_code, std::move(captured_stderr)));
    }
    return {};
}
