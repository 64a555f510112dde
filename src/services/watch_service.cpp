#include "watch_service.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

static void apply_log_level(const std::string& name) {
    LogLevel level;
    if (parse_log_level(name, level)) {
        set_log_level(level);
    }
}

UpdateEngineConfig WatchService::engine_config_from(const Settings& s) {
    UpdateEngineConfig c;
    c.polling_interval = std::chrono::seconds(s.refresh_interval);
    c.max_active_subscriptions = static_cast<std::size_t>(s.max_active_subscriptions);
    c.enable_incremental_fetch = s.enable_incremental_fetch;
    c.background_refresh_enabled = s.auto_refresh;
    return c;
}

CacheConfig WatchService::cache_config_from(const Settings& s) {
    CacheConfig c;
    c.default_ttl = std::chrono::seconds(s.cache_timeout);
    c.max_size = static_cast<std::size_t>(s.cache_max_size);
    return c;
}

WatchService::WatchService(RemoteDataGateway& remote, const Settings& settings)
    : settings_(settings),
      cache_(cache_config_from(settings)),
      data_(remote, cache_),
      engine_(UpdateEngine::create(data_, engine_config_from(settings))) {
    apply_log_level(settings.log_level);
    log_info(fmt::format("service: session for '{}' (refresh {}s, cache {}s/{})",
                         settings.organization, settings.refresh_interval,
                         settings.cache_timeout, settings.cache_max_size));
}

WatchService::~WatchService() {
    engine_->dispose();
}

Settings WatchService::settings() const {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return settings_;
}

Result<void> WatchService::apply_settings(const Settings& settings) {
    auto report = validate_settings(settings);
    if (!report.valid) {
        std::string msg;
        for (const auto& e : report.errors) {
            if (!msg.empty()) msg += ", ";
            msg += e.message;
        }
        return Result<void>::Err("Invalid settings: " + msg, ErrorCode::InvalidConfig);
    }

    Settings previous;
    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        previous = settings_;
        settings_ = settings;
    }

    apply_log_level(settings.log_level);

    UpdateEngineConfigPatch patch;
    if (settings.refresh_interval != previous.refresh_interval) {
        patch.polling_interval = std::chrono::seconds(settings.refresh_interval);
    }
    if (settings.auto_refresh != previous.auto_refresh) {
        patch.background_refresh_enabled = settings.auto_refresh;
    }
    patch.max_active_subscriptions = static_cast<std::size_t>(settings.max_active_subscriptions);
    patch.enable_incremental_fetch = settings.enable_incremental_fetch;

    if (settings.cache_timeout != previous.cache_timeout ||
        settings.cache_max_size != previous.cache_max_size) {
        log_info("service: cache settings change takes effect next session");
    }

    return engine_->update_configuration(patch);
}
