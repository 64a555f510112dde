#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <gateway/remote_gateway.hpp>
#include "subscription_registry.hpp"
#include "subscription_handle.hpp"

struct UpdateEngineConfig {
    std::chrono::milliseconds polling_interval{DEFAULT_POLL_INTERVAL_MS};
    std::size_t max_active_subscriptions = DEFAULT_MAX_SUBSCRIPTIONS;
    bool enable_incremental_fetch = true;
    bool background_refresh_enabled = true;
};

// Fields left empty keep their current value.
struct UpdateEngineConfigPatch {
    std::optional<std::chrono::milliseconds> polling_interval;
    std::optional<std::size_t> max_active_subscriptions;
    std::optional<bool> enable_incremental_fetch;
    std::optional<bool> background_refresh_enabled;
};

struct RunStatusChangeEvent {
    int run_id = 0;
    int pipeline_id = 0;
    std::string project_id;
    std::optional<RunState> previous_state;    // empty on first observation
    RunState current_state = RunState::Unknown;
    std::optional<RunResult> previous_result;
    RunResult current_result = RunResult::None;
    WallTime timestamp{};
};

struct UpdateEngineStats {
    std::size_t active_subscriptions = 0;
    std::uint64_t total_updates_received = 0;
    std::optional<WallTime> last_update_time;
    bool background_refresh_active = false;
    std::chrono::milliseconds polling_interval{0};
    double average_response_time_ms = 0.0;
    std::uint64_t error_count = 0;
};

using StatusListener = std::function<void(const RunStatusChangeEvent&)>;

// Polls the remote service for every subscribed run and pipeline on one
// shared timer, reports state transitions and retires runs that finished.
//
// Threading: one timer thread; each refresh pass fetches concurrently (at
// most MAX_FETCH_CONCURRENCY at a time) and then delivers on the pass's own
// thread with no engine lock held, so callbacks may subscribe, unsubscribe or
// dispose. Passes never overlap. Every fetch is stamped when issued; a result
// older than one already delivered for the same key is dropped.
class UpdateEngine : public std::enable_shared_from_this<UpdateEngine> {
public:
    static std::shared_ptr<UpdateEngine> create(RemoteDataGateway& gateway,
                                                UpdateEngineConfig config = UpdateEngineConfig{});
    ~UpdateEngine();

    UpdateEngine(const UpdateEngine&) = delete;
    UpdateEngine& operator=(const UpdateEngine&) = delete;

    // ── Subscriptions ─────────────────────────────────────────

    // Errors: Disposed, CapacityExceeded (new key while run slots are full).
    // Re-subscribing an existing key replaces its callback. Fetches once
    // before returning; a failed first fetch is logged and counted only.
    Result<SubscriptionHandle> subscribe_to_run_updates(int run_id, int pipeline_id,
                                                        const std::string& project_id,
                                                        RunCallback callback);

    Result<SubscriptionHandle> subscribe_to_pipeline_updates(int pipeline_id,
                                                             const std::string& project_id,
                                                             PipelineCallback callback);

    // Change notifications (state or result differs from the last poll).
    Result<SubscriptionHandle> add_status_listener(StatusListener listener);

    // ── Background refresh ────────────────────────────────────

    Result<void> start_background_refresh();
    void stop_background_refresh();
    bool is_background_refresh_active() const;

    // Fetches every active run and every pipeline now, waits for all of them.
    // Individual fetch failures are counted, not returned.
    Result<void> refresh_all_subscriptions();

    // ── Introspection ─────────────────────────────────────────

    // Run slots in any state plus pipeline keys.
    std::size_t active_subscription_count() const;
    // Run slots still being polled plus pipeline keys.
    std::size_t polled_subscription_count() const;
    std::optional<SubscriptionState> run_subscription_state(int run_id, int pipeline_id,
                                                            const std::string& project_id) const;

    UpdateEngineConfig configuration() const;
    Result<void> update_configuration(const UpdateEngineConfigPatch& patch);

    UpdateEngineStats stats() const;

    // Stops the timer, drops every subscription and listener and zeroes the
    // counters. Later subscribe/start/refresh/configure calls return Disposed.
    void dispose();
    bool is_disposed() const { return disposed_.load(); }

private:
    UpdateEngine(RemoteDataGateway& gateway, UpdateEngineConfig config);

    // Fetching (no locks held)
    Result<PipelineRun> fetch_run(const RunKey& key);
    Result<std::vector<PipelineRun>> fetch_pipeline(const PipelineKey& key);

    // Delivery (no locks held on entry)
    void deliver_run(const RunFetch& fetch, const PipelineRun& run);
    void deliver_pipeline(const PipelineFetch& fetch, const std::vector<PipelineRun>& runs);
    void publish(const RunStatusChangeEvent& event);

    // One concurrent fetch + deliver sweep. Returns the number of failures.
    std::size_t refresh_pass();
    void perform_background_refresh();
    void count_errors(std::size_t n);

    // Timer. The loop holds the engine only for the length of one tick.
    struct TimerState {
        std::mutex mutex;
        std::condition_variable cv;
        bool running = false;
        bool reschedule = false;
        std::uint64_t generation = 0;
        std::chrono::milliseconds interval{DEFAULT_POLL_INTERVAL_MS};
    };

    void start_timer(std::chrono::milliseconds interval);
    void shutdown_timer();
    static void timer_loop(std::shared_ptr<TimerState> timer, std::weak_ptr<UpdateEngine> engine,
                           std::uint64_t generation);

    // Handle actions
    void unsubscribe_run(const RunKey& key, std::uint64_t owner);
    void unsubscribe_pipeline(const PipelineKey& key, std::uint64_t callback_id);
    void remove_listener(std::uint64_t id);
    SubscriptionHandle make_handle(std::function<void(UpdateEngine&)> action);

    RemoteDataGateway& gateway_;
    std::atomic<bool> disposed_{false};

    // Subscriptions, listeners, config and counters.
    mutable std::mutex state_mutex_;
    UpdateEngineConfig config_;
    SubscriptionRegistry registry_;
    std::map<std::uint64_t, StatusListener> listeners_;
    std::uint64_t next_listener_id_ = 1;
    std::uint64_t total_updates_ = 0;
    std::uint64_t error_count_ = 0;
    double average_response_ms_ = 0.0;
    std::optional<WallTime> last_update_time_;

    // Serializes refresh passes.
    std::mutex refresh_mutex_;

    std::shared_ptr<TimerState> timer_;
    std::thread timer_thread_;   // guarded by timer_->mutex
};
