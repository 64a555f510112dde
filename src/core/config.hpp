#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// User settings, read from ~/.pipewatch/config.yaml.
struct Settings {
    std::string organization;
    int refresh_interval = DEFAULT_REFRESH_INTERVAL_SECS;          // seconds
    bool auto_refresh = true;
    int max_runs_per_pipeline = DEFAULT_MAX_RUNS_PER_PIPELINE;
    int cache_timeout = DEFAULT_CACHE_TIMEOUT_SECS;                // seconds
    int cache_max_size = static_cast<int>(DEFAULT_CACHE_MAX_SIZE);
    int max_active_subscriptions = DEFAULT_MAX_SUBSCRIPTIONS;
    bool enable_incremental_fetch = true;
    std::string log_level = "info";
};

struct ValidationIssue {
    std::string field;
    std::string message;
};

struct ValidationReport {
    bool valid = true;
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;
};

// Load settings from a YAML file. Missing keys keep their defaults.
Result<Settings> load_settings(const fs::path& path);

// Same as load_settings, from YAML text.
Result<Settings> parse_settings(const std::string& yaml_text);

// Range and value checks. Never fails outright; see report.valid.
ValidationReport validate_settings(const Settings& settings);

// Get paths
fs::path get_settings_dir();
fs::path get_settings_path();
bool settings_exist();

// Write a commented default file. Leaves an existing file untouched.
Result<void> create_default_settings_file(const fs::path& path = get_settings_path());
