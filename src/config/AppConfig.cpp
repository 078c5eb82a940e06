#include "config/AppConfig.hpp"

#include <glib.h>

#include <chrono>
#include <format>
#include <memory>
#include <set>
#include <utility>

namespace config {

namespace {

constexpr auto GROUP_SANITIZATION = "sanitization";
constexpr auto GROUP_CERTIFICATES = "certificates";
constexpr auto GROUP_LOGGING = "logging";

struct KeyFileDeleter {
    void operator()(GKeyFile* key_file) const { g_key_file_free(key_file); }
};
using KeyFilePtr = std::unique_ptr<GKeyFile, KeyFileDeleter>;

auto config_error(std::string message) -> util::Error {
    return util::Error{util::ErrorKind::CONFIGURATION, std::move(message)};
}

auto take_message(GError* error) -> std::string {
    std::string message = error ? error->message : "unknown error";
    if (error) {
        g_error_free(error);
    }
    return message;
}

/**
 * @brief Typed, optional access to one key file
 */
class KeyReader {
public:
    explicit KeyReader(GKeyFile* key_file) : key_file_(key_file) {}

    [[nodiscard]] auto has(const char* group, const char* key) const -> bool {
        return g_key_file_has_key(key_file_, group, key, nullptr);
    }

    auto read_string(const char* group, const char* key, std::string& out) const
        -> std::expected<void, util::Error> {
        if (!has(group, key)) {
            return {};
        }
        GError* error = nullptr;
        gchar* value = g_key_file_get_string(key_file_, group, key, &error);
        if (value == nullptr) {
            return std::unexpected(
                config_error(std::format("[{}] {}: {}", group, key, take_message(error))));
        }
        out = value;
        g_free(value);
        return {};
    }

    auto read_path(const char* group, const char* key, std::filesystem::path& out) const
        -> std::expected<void, util::Error> {
        std::string text = out.string();
        if (auto read = read_string(group, key, text); !read) {
            return read;
        }
        out = text;
        return {};
    }

    auto read_int(const char* group, const char* key, int& out) const
        -> std::expected<void, util::Error> {
        if (!has(group, key)) {
            return {};
        }
        GError* error = nullptr;
        const gint value = g_key_file_get_integer(key_file_, group, key, &error);
        if (error != nullptr) {
            return std::unexpected(
                config_error(std::format("[{}] {}: {}", group, key, take_message(error))));
        }
        out = value;
        return {};
    }

    auto read_bool(const char* group, const char* key, bool& out) const
        -> std::expected<void, util::Error> {
        if (!has(group, key)) {
            return {};
        }
        GError* error = nullptr;
        const gboolean value = g_key_file_get_boolean(key_file_, group, key, &error);
        if (error != nullptr) {
            return std::unexpected(
                config_error(std::format("[{}] {}: {}", group, key, take_message(error))));
        }
        out = value != FALSE;
        return {};
    }

    void warn_unknown_keys(const char* group, const std::set<std::string_view>& known) const {
        gsize count = 0;
        gchar** keys = g_key_file_get_keys(key_file_, group, &count, nullptr);
        if (keys == nullptr) {
            return;
        }
        for (gsize i = 0; i < count; ++i) {
            if (!known.contains(keys[i])) {
                LOG_WARNING("AppConfig", std::format("Ignoring unknown key [{}] {}", group, keys[i]));
            }
        }
        g_strfreev(keys);
    }

private:
    GKeyFile* key_file_;
};

auto merge(GKeyFile* key_file, AppConfig config) -> std::expected<AppConfig, util::Error> {
    const KeyReader reader{key_file};

    auto& sanitization = config.sanitization;
    int timeout_seconds = static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(sanitization.secure_erase_timeout).count());
    std::string level_name;  // stays empty unless the key file sets it

    const std::expected<void, util::Error> steps[] = {
        reader.read_int(GROUP_SANITIZATION, "overwrite_passes", sanitization.overwrite_passes),
        reader.read_string(GROUP_SANITIZATION, "secure_erase_password",
                           sanitization.secure_erase_password),
        reader.read_int(GROUP_SANITIZATION, "secure_erase_timeout_seconds", timeout_seconds),
        reader.read_bool(GROUP_SANITIZATION, "dry_run", config.dry_run),
        reader.read_path(GROUP_CERTIFICATES, "output_dir", config.certificates.output_dir),
        reader.read_path(GROUP_CERTIFICATES, "identity_bundle", config.certificates.identity_bundle),
        reader.read_string(GROUP_CERTIFICATES, "passphrase_env", config.certificates.passphrase_env),
        reader.read_string(GROUP_CERTIFICATES, "tool_name", config.certificates.tool_name),
        reader.read_path(GROUP_LOGGING, "log_dir", config.logging.log_dir),
        reader.read_string(GROUP_LOGGING, "level", level_name),
        reader.read_bool(GROUP_LOGGING, "console", config.logging.console),
    };
    for (const auto& step : steps) {
        if (!step) {
            return std::unexpected(step.error());
        }
    }

    if (timeout_seconds < 1) {
        return std::unexpected(config_error(std::format(
            "[sanitization] secure_erase_timeout_seconds must be at least 1, got {}",
            timeout_seconds)));
    }
    sanitization.secure_erase_timeout = std::chrono::seconds{timeout_seconds};

    if (reader.has(GROUP_LOGGING, "level")) {
        const auto level = util::parse_log_level(level_name);
        if (!level) {
            return std::unexpected(
                config_error(std::format("[logging] level: unknown level '{}'", level_name)));
        }
        config.logging.level = *level;
    }

    reader.warn_unknown_keys(GROUP_SANITIZATION, {"overwrite_passes", "secure_erase_password",
                                                  "secure_erase_timeout_seconds", "dry_run"});
    reader.warn_unknown_keys(GROUP_CERTIFICATES,
                             {"output_dir", "identity_bundle", "passphrase_env", "tool_name"});
    reader.warn_unknown_keys(GROUP_LOGGING, {"log_dir", "level", "console"});

    if (auto valid = validate(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

} // anonymous namespace

auto default_config() -> AppConfig {
    return AppConfig{};
}

auto load_key_file(const std::filesystem::path& path, AppConfig base)
    -> std::expected<AppConfig, util::Error> {
    KeyFilePtr key_file{g_key_file_new()};
    GError* error = nullptr;
    if (!g_key_file_load_from_file(key_file.get(), path.c_str(), G_KEY_FILE_NONE, &error)) {
        return std::unexpected(
            config_error(std::format("Cannot load {}: {}", path.string(), take_message(error))));
    }
    LOG_INFO("AppConfig", std::format("Loaded configuration from {}", path.string()));
    return merge(key_file.get(), std::move(base));
}

auto parse_key_file(std::string_view data, AppConfig base)
    -> std::expected<AppConfig, util::Error> {
    KeyFilePtr key_file{g_key_file_new()};
    GError* error = nullptr;
    if (!g_key_file_load_from_data(key_file.get(), data.data(), data.size(), G_KEY_FILE_NONE,
                                   &error)) {
        return std::unexpected(
            config_error(std::format("Cannot parse configuration: {}", take_message(error))));
    }
    return merge(key_file.get(), std::move(base));
}

auto apply_overrides(AppConfig base, const ConfigOverrides& overrides)
    -> std::expected<AppConfig, util::Error> {
    if (overrides.overwrite_passes) {
        base.sanitization.overwrite_passes = *overrides.overwrite_passes;
    }
    if (overrides.output_dir) {
        base.certificates.output_dir = *overrides.output_dir;
    }
    if (overrides.dry_run) {
        base.dry_run = *overrides.dry_run;
    }
    if (overrides.verbose.value_or(false)) {
        base.logging.level = util::LogLevel::DEBUG;
        base.logging.console = true;
    }

    if (auto valid = validate(base); !valid) {
        return std::unexpected(valid.error());
    }
    return base;
}

auto validate(const AppConfig& config) -> std::expected<void, util::Error> {
    if (config.sanitization.overwrite_passes < 1) {
        return std::unexpected(config_error(std::format(
            "Overwrite pass count must be at least 1, got {}", config.sanitization.overwrite_passes)));
    }
    if (config.sanitization.secure_erase_password.empty()) {
        return std::unexpected(config_error("Secure erase password must not be empty"));
    }
    if (config.certificates.output_dir.empty()) {
        return std::unexpected(config_error("Certificate output directory must not be empty"));
    }
    if (config.certificates.identity_bundle.empty()) {
        return std::unexpected(config_error("Identity bundle path must not be empty"));
    }
    if (config.certificates.passphrase_env.empty()) {
        return std::unexpected(config_error("passphrase_env must name an environment variable"));
    }
    return {};
}

auto read_passphrase(const AppConfig& config) -> std::expected<std::string, util::Error> {
    const gchar* value = g_getenv(config.certificates.passphrase_env.c_str());
    if (value == nullptr || *value == '\0') {
        return std::unexpected(config_error(std::format(
            "Environment variable {} is not set; it must hold the identity bundle passphrase",
            config.certificates.passphrase_env)));
    }
    return std::string{value};
}

auto effective_log_dir(const AppConfig& config) -> std::filesystem::path {
    if (!config.logging.log_dir.empty()) {
        return config.logging.log_dir;
    }
    return std::filesystem::path(g_get_user_data_dir()) / "media-sanitizer" / "logs";
}

} // namespace config
