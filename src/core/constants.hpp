#pragma once

#include <cstddef>

// ── Real-time updates ───────────────────────────────────────
constexpr int DEFAULT_POLL_INTERVAL_MS       = 30000;  // Background refresh period
constexpr int DEFAULT_MAX_SUBSCRIPTIONS      = 50;     // Run subscription slots per engine
constexpr std::size_t MAX_FETCH_CONCURRENCY  = 16;     // Fetch threads per refresh pass

// ── Cache ───────────────────────────────────────────────────
constexpr int DEFAULT_CACHE_TTL_MS           = 5 * 60 * 1000;
constexpr std::size_t DEFAULT_CACHE_MAX_SIZE = 1000;
constexpr int DEFAULT_RUNS_TOP               = 50;     // Runs returned per pipeline query

// ── Cache key prefixes ──────────────────────────────────────
// Keys are "projects", "pipelines:{project}", "runs:{project}:{pipeline}",
// "timestamp:{project}:{pipeline}".
constexpr const char* CACHE_KEY_PROJECTS     = "projects";
constexpr const char* CACHE_KEY_PIPELINES    = "pipelines:{}";
constexpr const char* CACHE_KEY_RUNS         = "runs:{}:{}";
constexpr const char* CACHE_KEY_TIMESTAMP    = "timestamp:{}:{}";

// ── Settings ranges ─────────────────────────────────────────
constexpr int REFRESH_INTERVAL_MIN_SECS      = 10;
constexpr int REFRESH_INTERVAL_MAX_SECS      = 300;
constexpr int DEFAULT_REFRESH_INTERVAL_SECS  = 30;
constexpr int CACHE_TIMEOUT_MIN_SECS         = 60;
constexpr int CACHE_TIMEOUT_MAX_SECS         = 3600;
constexpr int DEFAULT_CACHE_TIMEOUT_SECS     = 300;
constexpr int MAX_RUNS_PER_PIPELINE_MIN      = 1;
constexpr int MAX_RUNS_PER_PIPELINE_MAX      = 50;
constexpr int DEFAULT_MAX_RUNS_PER_PIPELINE  = 10;
constexpr int CACHE_MAX_SIZE_MIN             = 1;
constexpr int CACHE_MAX_SIZE_MAX             = 100000;
constexpr int MAX_SUBSCRIPTIONS_MIN          = 1;
constexpr int MAX_SUBSCRIPTIONS_MAX          = 500;
