#include "config.hpp"
#include "log.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

// Read a scalar into `out` if the key is present. Wrong types raise
// YAML::BadConversion, reported by the caller as InvalidConfig.
template <typename T>
static void read_key(const YAML::Node& root, const char* key, T& out) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) return;
    out = node.as<T>();
}

static Result<Settings> settings_from_node(const YAML::Node& root) {
    Settings s;
    if (!root || root.IsNull()) {
        return Result<Settings>::Ok(s);
    }
    if (!root.IsMap()) {
        return Result<Settings>::Err("settings root must be a mapping", ErrorCode::InvalidConfig);
    }

    try {
        read_key(root, "organization", s.organization);
        read_key(root, "refresh_interval", s.refresh_interval);
        read_key(root, "auto_refresh", s.auto_refresh);
        read_key(root, "max_runs_per_pipeline", s.max_runs_per_pipeline);
        read_key(root, "cache_timeout", s.cache_timeout);
        read_key(root, "cache_max_size", s.cache_max_size);
        read_key(root, "max_active_subscriptions", s.max_active_subscriptions);
        read_key(root, "enable_incremental_fetch", s.enable_incremental_fetch);
        read_key(root, "log_level", s.log_level);
    } catch (const YAML::Exception& e) {
        return Result<Settings>::Err(fmt::format("invalid settings value: {}", e.what()),
                                     ErrorCode::InvalidConfig);
    }

    return Result<Settings>::Ok(s);
}

Result<Settings> parse_settings(const std::string& yaml_text) {
    try {
        return settings_from_node(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<Settings>::Err(fmt::format("malformed settings: {}", e.what()),
                                     ErrorCode::InvalidConfig);
    }
}

Result<Settings> load_settings(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Settings>::Err("settings file not found: " + path.string(),
                                     ErrorCode::IoError);
    }
    try {
        auto r = settings_from_node(YAML::LoadFile(path.string()));
        if (r.is_ok()) log_debug("settings: loaded " + path.string());
        return r;
    } catch (const YAML::Exception& e) {
        return Result<Settings>::Err(
            fmt::format("malformed settings in {}: {}", path.string(), e.what()),
            ErrorCode::InvalidConfig);
    }
}

// ── Validation ──────────────────────────────────────────────

static void check_range(ValidationReport& report, const char* field, int value, int min, int max) {
    if (value < min) {
        report.errors.push_back({field, fmt::format("{} must be at least {}", field, min)});
    } else if (value > max) {
        report.errors.push_back({field, fmt::format("{} must be at most {}", field, max)});
    }
}

ValidationReport validate_settings(const Settings& s) {
    ValidationReport report;

    check_range(report, "refresh_interval", s.refresh_interval,
                REFRESH_INTERVAL_MIN_SECS, REFRESH_INTERVAL_MAX_SECS);
    check_range(report, "max_runs_per_pipeline", s.max_runs_per_pipeline,
                MAX_RUNS_PER_PIPELINE_MIN, MAX_RUNS_PER_PIPELINE_MAX);
    check_range(report, "cache_timeout", s.cache_timeout,
                CACHE_TIMEOUT_MIN_SECS, CACHE_TIMEOUT_MAX_SECS);
    check_range(report, "cache_max_size", s.cache_max_size,
                CACHE_MAX_SIZE_MIN, CACHE_MAX_SIZE_MAX);
    check_range(report, "max_active_subscriptions", s.max_active_subscriptions,
                MAX_SUBSCRIPTIONS_MIN, MAX_SUBSCRIPTIONS_MAX);

    LogLevel level;
    if (!parse_log_level(s.log_level, level)) {
        report.errors.push_back({"log_level",
            fmt::format("log_level must be one of error, warn, info, debug (got '{}')", s.log_level)});
    }

    if (s.organization.empty()) {
        report.warnings.push_back({"organization", "organization is not set"});
    } else if (s.organization.find_first_of(" /\\") != std::string::npos) {
        report.errors.push_back({"organization",
            "organization must not contain spaces or slashes"});
    }

    if (s.auto_refresh && s.refresh_interval < 15) {
        report.warnings.push_back({"refresh_interval",
            "refresh intervals under 15 seconds may hit service rate limits"});
    }

    report.valid = report.errors.empty();
    return report;
}

// ── Paths ───────────────────────────────────────────────────

fs::path get_settings_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return fs::temp_directory_path() / ".pipewatch";
    return fs::path(home) / ".pipewatch";
}

fs::path get_settings_path() {
    return get_settings_dir() / "config.yaml";
}

bool settings_exist() {
    return fs::exists(get_settings_path());
}

Result<void> create_default_settings_file(const fs::path& path) {
    // Don't overwrite existing settings
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_settings = R"(# pipewatch settings

# Organization on the CI service
organization: ""

# Background refresh of watched runs (seconds, 10-300)
refresh_interval: 30
auto_refresh: true

# Runs listed per pipeline (1-50)
max_runs_per_pipeline: 10

# Cached list lifetime (seconds, 60-3600) and entry limit
cache_timeout: 300
cache_max_size: 1000

# Runs that can be watched at once
max_active_subscriptions: 50
enable_incremental_fetch: true

# error | warn | info | debug
log_level: "info"
)";

    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create settings file at " + path.string(),
                                     ErrorCode::IoError);
        }
        out << default_settings;
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write settings file: " + std::string(e.what()),
                                 ErrorCode::IoError);
    }
}
