/**
 * @file Logger.cpp
 * @brief Audit logger implementation
 */

#include "util/Logger.hpp"

#include <array>
#include <chrono>
#include <format>
#include <iostream>
#include <utility>

namespace util {

namespace {

constexpr std::array<std::pair<std::string_view, LogLevel>, 5> LEVEL_NAMES{{
    {"debug", LogLevel::DEBUG},
    {"info", LogLevel::INFO},
    {"warning", LogLevel::WARNING},
    {"warn", LogLevel::WARNING},
    {"error", LogLevel::ERROR},
}};

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        const auto lower = [](char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c; };
        if (lower(a[i]) != lower(b[i])) {
            return false;
        }
    }
    return true;
}

// "2026-01-22T14:32:45.123Z"
auto utc_now() -> std::string {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%T}Z", now);
}

auto format_line(LogLevel level, std::string_view component, std::string_view message)
    -> std::string {
    return std::format("{} [{}] [{}] {}\n", utc_now(), level_tag(level), component, message);
}

}  // namespace

auto parse_log_level(std::string_view name) -> std::optional<LogLevel> {
    for (const auto& [text, level] : LEVEL_NAMES) {
        if (equals_ignore_case(name, text)) {
            return level;
        }
    }
    return std::nullopt;
}

auto level_tag(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    close();
}

auto Logger::open(const LogSettings& settings) -> bool {
    std::lock_guard lock(mutex_);

    out_.close();
    open_ = false;
    settings_ = settings;

    std::error_code ec;
    std::filesystem::create_directories(settings_.directory, ec);
    if (ec) {
        std::cerr << std::format("Logger: cannot create {}: {}\n", settings_.directory.string(),
                                 ec.message());
        return false;
    }
    if (!reopen_active()) {
        return false;
    }

    open_ = true;
    append(format_line(LogLevel::INFO, "Logger",
                       std::format("Audit log opened (level={}, rotate_at={}, keep={})",
                                   level_tag(settings_.min_level), settings_.rotate_at_bytes,
                                   settings_.keep_rotated)));
    return true;
}

void Logger::close() {
    std::lock_guard lock(mutex_);
    if (open_) {
        append(format_line(LogLevel::INFO, "Logger", "Audit log closed"));
        out_.close();
    }
    open_ = false;
}

auto Logger::is_open() const -> bool {
    std::lock_guard lock(mutex_);
    return open_;
}

auto Logger::active_path() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    return open_ ? rotated_path(0) : std::filesystem::path{};
}

void Logger::write(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);
    if (level < settings_.min_level) {
        return;
    }

    const auto line = format_line(level, component, message);
    if (open_) {
        if (bytes_written_ >= settings_.rotate_at_bytes) {
            rotate();
        }
        if (open_) {
            append(line);
        }
    }
    if (mirror_) {
        std::cerr << line;
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    settings_.min_level = level;
}

void Logger::mirror_to_stderr(bool enable) {
    std::lock_guard lock(mutex_);
    mirror_ = enable;
}

// Index 0 is the active file
auto Logger::rotated_path(int index) const -> std::filesystem::path {
    if (index == 0) {
        return settings_.directory / (settings_.app_name + ".log");
    }
    return settings_.directory / std::format("{}.{}.log", settings_.app_name, index);
}

auto Logger::append(std::string_view line) -> void {
    out_ << line;
    out_.flush();
    bytes_written_ += line.size();
}

auto Logger::reopen_active() -> bool {
    const auto path = rotated_path(0);
    out_.open(path, std::ios::app);
    if (!out_.is_open()) {
        std::cerr << std::format("Logger: cannot open {}\n", path.string());
        return false;
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    bytes_written_ = ec ? 0 : static_cast<size_t>(size);
    return true;
}

void Logger::rotate() {
    out_.close();

    // Shift N-1 -> N, ..., active -> 1; the oldest falls off the end
    std::error_code ec;
    std::filesystem::remove(rotated_path(settings_.keep_rotated), ec);
    for (int index = settings_.keep_rotated - 1; index >= 0; --index) {
        const auto from = rotated_path(index);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, rotated_path(index + 1), ec);
        }
    }

    if (!reopen_active()) {
        open_ = false;
        return;
    }
    append(format_line(LogLevel::INFO, "Logger", "Rotated"));
}

}  // namespace util
