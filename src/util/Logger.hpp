/**
 * @file Logger.hpp
 * @brief Thread-safe audit logger with size-based rotation
 *
 * Every destructive command, every fallback decision and every issued
 * certificate is written here, one line per event:
 * `<ISO-8601 UTC> [LEVEL] [Component] message`.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Command output, per-line detail
    INFO,     ///< Job, device and certificate milestones
    WARNING,  ///< Fallbacks taken, assumed outcomes
    ERROR     ///< Failed devices, signing failures
};

/**
 * @brief Parse a level name as written in configuration ("debug", "info", "warning", "error")
 * @return Level, or nullopt for an unknown name
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/**
 * @brief Fixed-width level tag ("DEBUG", "INFO ", "WARN ", "ERROR")
 */
[[nodiscard]] auto level_tag(LogLevel level) -> std::string_view;

/**
 * @struct LogSettings
 * @brief Where the audit log goes and when it rotates
 */
struct LogSettings {
    std::filesystem::path directory;            ///< Created if missing
    std::string app_name = "media-sanitizer";   ///< Active file is {app_name}.log
    LogLevel min_level = LogLevel::INFO;
    size_t rotate_at_bytes = 10 * 1024 * 1024;  ///< Rotate once the active file reaches this size
    int keep_rotated = 7;                       ///< {app_name}.1.log ... {app_name}.N.log
};

/**
 * @class Logger
 * @brief Process-wide logger shared by the worker thread and the CLI
 *
 * Usage:
 * @code
 * util::Logger::instance().open(util::LogSettings{.directory = log_dir});
 * LOG_INFO("SanitizationJob", std::format("Starting job for {} device(s)", count));
 * @endcode
 *
 * Lines logged while no file is open go only to stderr, and only when
 * mirroring is on.
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Open (or reopen) the active log file
     * @return true if the file is open
     */
    auto open(const LogSettings& settings) -> bool;

    /**
     * @brief Write a closing line and release the file
     */
    void close();

    [[nodiscard]] auto is_open() const -> bool;

    /**
     * @brief Path of the active log file, empty while closed
     */
    [[nodiscard]] auto active_path() const -> std::filesystem::path;

    void write(LogLevel level, std::string_view component, std::string_view message);

    void set_min_level(LogLevel level);

    /**
     * @brief Mirror every accepted line to stderr
     */
    void mirror_to_stderr(bool enable);

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] auto rotated_path(int index) const -> std::filesystem::path;
    auto append(std::string_view line) -> void;
    auto reopen_active() -> bool;
    void rotate();

    mutable std::mutex mutex_;
    std::ofstream out_;
    LogSettings settings_;
    size_t bytes_written_ = 0;
    bool open_ = false;
    bool mirror_ = false;
};

}  // namespace util

#define LOG_DEBUG(component, msg) ::util::Logger::instance().write(::util::LogLevel::DEBUG, component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().write(::util::LogLevel::INFO, component, msg)
#define LOG_WARNING(component, msg) \
    ::util::Logger::instance().write(::util::LogLevel::WARNING, component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().write(::util::LogLevel::ERROR, component, msg)
