/**
 * @file Error.hpp
 * @brief Error taxonomy shared by the sanitization engine and certificate pipeline
 *
 * Every fallible operation returns std::expected<T, util::Error>. The error
 * carries a kind so callers can tell a safety abort from a failed command,
 * plus enough context (argv, exit code, captured stderr) to reconstruct
 * what was attempted.
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace util {

/**
 * @enum ErrorKind
 * @brief Classification of failures
 */
enum class ErrorKind {
    GENERIC,                  ///< Uncategorised failure
    DEVICE_NOT_FOUND,         ///< Path does not resolve to an existing file
    NOT_A_BLOCK_DEVICE,       ///< Path exists but is not block-special (safety abort)
    DEVICE_BUSY,              ///< Device or one of its partitions is mounted
    UNSUPPORTED_DEVICE_TYPE,  ///< No sanitization cascade for this category
    COMMAND_EXECUTION,        ///< External command failed to spawn or exited non-zero
    COMMAND_TIMEOUT,          ///< Wait limit elapsed while the command kept running
    CANCELLED,                ///< Cooperative cancellation observed
    INVALID_ARGUMENT,         ///< Caller supplied unusable input
    CERTIFICATE_CREATION,     ///< Certificate record or its files could not be produced
    SIGNING,                  ///< Signed artifact could not be produced
    IDENTITY,                 ///< Signing identity could not be created or loaded
    CONFIGURATION,            ///< Invalid configuration value or file
    IO                        ///< Filesystem failure
};

/**
 * @brief Stable name for an error kind, used in logs and CLI output
 */
[[nodiscard]] constexpr auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::GENERIC:
            return "Error";
        case ErrorKind::DEVICE_NOT_FOUND:
            return "DeviceNotFoundError";
        case ErrorKind::NOT_A_BLOCK_DEVICE:
            return "NotABlockDeviceError";
        case ErrorKind::DEVICE_BUSY:
            return "DeviceBusyError";
        case ErrorKind::UNSUPPORTED_DEVICE_TYPE:
            return "UnsupportedDeviceTypeError";
        case ErrorKind::COMMAND_EXECUTION:
            return "CommandExecutionError";
        case ErrorKind::COMMAND_TIMEOUT:
            return "CommandTimeoutError";
        case ErrorKind::CANCELLED:
            return "CancelledError";
        case ErrorKind::INVALID_ARGUMENT:
            return "InvalidArgumentError";
        case ErrorKind::CERTIFICATE_CREATION:
            return "CertificateCreationError";
        case ErrorKind::SIGNING:
            return "SigningError";
        case ErrorKind::IDENTITY:
            return "IdentityError";
        case ErrorKind::CONFIGURATION:
            return "ConfigurationError";
        case ErrorKind::IO:
            return "IOError";
    }
    return "Error";
}

/**
 * @brief Space-joined argv with every argument equal to @p secret masked
 *
 * Used wherever a command line is shown to a person (log, console, dry-run
 * echo). An empty secret masks nothing.
 */
[[nodiscard]] inline auto join_redacted(const std::vector<std::string>& argv, std::string_view secret)
    -> std::string {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) {
            text += ' ';
        }
        text += (!secret.empty() && arg == secret) ? std::string_view{"********"} : std::string_view{arg};
    }
    return text;
}

/**
 * @struct Error
 * @brief Represents an error with a kind, message and optional code
 *
 * For COMMAND_EXECUTION and COMMAND_TIMEOUT errors, @c argv, @c code (the
 * exit status) and @c captured_stderr describe the failed invocation.
 */
struct Error {
    std::string message;
    int code = 0;
    ErrorKind kind = ErrorKind::GENERIC;
    std::vector<std::string> argv;
    std::string captured_stderr;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}
    Error(ErrorKind err_kind, std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code), kind(err_kind) {}

    /**
     * @brief Build a CommandExecutionError for a finished invocation
     * @param command Argument vector that was executed
     * @param exit_code Exit status (-1 when the process could not be spawned)
     * @param stderr_text Everything the process wrote to stderr
     */
    [[nodiscard]] static auto command_failed(std::vector<std::string> command, int exit_code,
                                             std::string stderr_text) -> Error {
        Error err{ErrorKind::COMMAND_EXECUTION,
                  "'" + (command.empty() ? std::string{} : command.front()) +
                      "' exited with status " + std::to_string(exit_code),
                  exit_code};
        err.argv = std::move(command);
        err.captured_stderr = std::move(stderr_text);
        return err;
    }

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }

    [[nodiscard]] auto is(ErrorKind other) const -> bool {
        return kind == other;
    }

    /**
     * @brief Human-readable one-line description including the kind and command context
     */
    [[nodiscard]] auto describe() const -> std::string {
        std::string text{to_string(kind)};
        text += ": ";
        text += message;
        if (!captured_stderr.empty()) {
            text += " (stderr: ";
            text += captured_stderr;
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
                text.pop_back();
            }
            text += ")";
        }
        return text;
    }

    /**
     * @brief describe() followed by the failed command line, @p secret masked
     */
    [[nodiscard]] auto describe_command(std::string_view secret) const -> std::string {
        if (argv.empty()) {
            return describe();
        }
        return describe() + " [command: " + join_redacted(argv, secret) + "]";
    }
};

}  // namespace util
