#include "update_engine.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <exception>
#include <future>
#include <system_error>

// ── Construction / Destruction ──────────────────────────────

std::shared_ptr<UpdateEngine> UpdateEngine::create(RemoteDataGateway& gateway,
                                                   UpdateEngineConfig config) {
    return std::shared_ptr<UpdateEngine>(new UpdateEngine(gateway, config));
}

UpdateEngine::UpdateEngine(RemoteDataGateway& gateway, UpdateEngineConfig config)
    : gateway_(gateway),
      config_(config),
      registry_(config.max_active_subscriptions),
      timer_(std::make_shared<TimerState>()) {
    timer_->interval = config.polling_interval;
}

UpdateEngine::~UpdateEngine() {
    dispose();

    std::thread old;
    {
        std::lock_guard<std::mutex> lock(timer_->mutex);
        timer_->running = false;
        timer_->cv.notify_all();
        old = std::move(timer_thread_);
    }
    if (!old.joinable()) return;
    if (old.get_id() == std::this_thread::get_id()) {
        // Last reference dropped inside a tick. The loop touches only the
        // shared TimerState from here on and exits once it relocks it.
        old.detach();
    } else {
        old.join();
    }
}

void UpdateEngine::dispose() {
    if (disposed_.exchange(true)) return;

    shutdown_timer();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        registry_.clear();
        listeners_.clear();
        total_updates_ = 0;
        error_count_ = 0;
        average_response_ms_ = 0.0;
        last_update_time_.reset();
    }
    log_info("engine: disposed");
}

// ── Subscriptions ───────────────────────────────────────────

Result<SubscriptionHandle> UpdateEngine::subscribe_to_run_updates(int run_id, int pipeline_id,
                                                                  const std::string& project_id,
                                                                  RunCallback callback) {
    if (disposed_) {
        return Result<SubscriptionHandle>::Err("Service has been disposed", ErrorCode::Disposed);
    }

    RunKey key{run_id, pipeline_id, project_id};
    std::uint64_t owner = 0;
    RunFetch fetch;
    bool auto_start = false;
    std::chrono::milliseconds interval{};
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto added = registry_.add_run(key, std::move(callback), WallClock::now());
        if (added.is_err()) {
            log_warn(fmt::format("engine: subscribe {} rejected ({}): {}", key.to_string(),
                                 error_code_name(added.code), added.error));
            return Result<SubscriptionHandle>::Err(added.error, added.code);
        }
        owner = added.value;
        fetch = registry_.stamp_run(key).value_or(RunFetch{key, owner, 0});
        auto_start = config_.background_refresh_enabled;
        interval = config_.polling_interval;
    }
    log_info(fmt::format("engine: subscribed to run {}", key.to_string()));

    if (auto_start) {
        start_timer(interval);
    }

    auto first = fetch_run(key);
    if (first.is_ok()) {
        deliver_run(fetch, first.value);
    } else {
        log_warn(fmt::format("engine: initial fetch for run {} failed: {}",
                             key.to_string(), first.error));
        count_errors(1);
    }

    return Result<SubscriptionHandle>::Ok(make_handle([key, owner](UpdateEngine& e) {
        e.unsubscribe_run(key, owner);
    }));
}

Result<SubscriptionHandle> UpdateEngine::subscribe_to_pipeline_updates(
        int pipeline_id, const std::string& project_id, PipelineCallback callback) {
    if (disposed_) {
        return Result<SubscriptionHandle>::Err("Service has been disposed", ErrorCode::Disposed);
    }

    PipelineKey key{pipeline_id, project_id};
    std::uint64_t id = 0;
    PipelineFetch fetch;
    bool auto_start = false;
    std::chrono::milliseconds interval{};
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        id = registry_.add_pipeline(key, std::move(callback));
        fetch = registry_.stamp_pipeline(key);
        auto_start = config_.background_refresh_enabled;
        interval = config_.polling_interval;
    }
    log_info(fmt::format("engine: subscribed to pipeline {}", key.to_string()));

    if (auto_start) {
        start_timer(interval);
    }

    auto first = fetch_pipeline(key);
    if (first.is_ok()) {
        deliver_pipeline(fetch, first.value);
    } else {
        log_warn(fmt::format("engine: initial fetch for pipeline {} failed: {}",
                             key.to_string(), first.error));
        count_errors(1);
    }

    return Result<SubscriptionHandle>::Ok(make_handle([key, id](UpdateEngine& e) {
        e.unsubscribe_pipeline(key, id);
    }));
}

Result<SubscriptionHandle> UpdateEngine::add_status_listener(StatusListener listener) {
    if (disposed_) {
        return Result<SubscriptionHandle>::Err("Service has been disposed", ErrorCode::Disposed);
    }

    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        id = next_listener_id_++;
        listeners_.emplace(id, std::move(listener));
    }
    return Result<SubscriptionHandle>::Ok(make_handle([id](UpdateEngine& e) {
        e.remove_listener(id);
    }));
}

SubscriptionHandle UpdateEngine::make_handle(std::function<void(UpdateEngine&)> action) {
    std::weak_ptr<UpdateEngine> weak = weak_from_this();
    return SubscriptionHandle([weak, action = std::move(action)]() {
        if (auto self = weak.lock()) {
            action(*self);
        }
    });
}

void UpdateEngine::unsubscribe_run(const RunKey& key, std::uint64_t owner) {
    bool removed = false;
    bool idle = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        removed = registry_.remove_run(key, owner);
        idle = registry_.empty();
    }
    if (!removed) return;

    log_info(fmt::format("engine: unsubscribed from run {}", key.to_string()));
    if (idle) stop_background_refresh();
}

void UpdateEngine::unsubscribe_pipeline(const PipelineKey& key, std::uint64_t callback_id) {
    bool removed = false;
    bool idle = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        removed = registry_.remove_pipeline(key, callback_id);
        idle = registry_.empty();
    }
    if (!removed) return;

    log_info(fmt::format("engine: unsubscribed from pipeline {}", key.to_string()));
    if (idle) stop_background_refresh();
}

void UpdateEngine::remove_listener(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    listeners_.erase(id);
}

// ── Fetch + deliver ─────────────────────────────────────────

Result<PipelineRun> UpdateEngine::fetch_run(const RunKey& key) {
    try {
        return gateway_.fetch_run_details(key.run_id, key.pipeline_id, key.project_id);
    } catch (const std::exception& e) {
        return Result<PipelineRun>::Err(e.what(), ErrorCode::FetchFailure);
    }
}

Result<std::vector<PipelineRun>> UpdateEngine::fetch_pipeline(const PipelineKey& key) {
    try {
        return gateway_.fetch_pipeline_runs(key.pipeline_id, key.project_id);
    } catch (const std::exception& e) {
        return Result<std::vector<PipelineRun>>::Err(e.what(), ErrorCode::FetchFailure);
    }
}

void UpdateEngine::deliver_run(const RunFetch& fetch, const PipelineRun& run) {
    if (disposed_) return;

    const RunKey& key = fetch.key;
    RunObservation obs;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        obs = registry_.observe(fetch, run, WallClock::now());
        if (obs.found && !obs.stale && obs.changed) ++total_updates_;
    }
    // Unsubscribed, or handed to a new owner, while the fetch was in flight.
    if (!obs.found) return;
    if (obs.stale) {
        log_debug(fmt::format("engine: dropped out-of-date {} for run {}",
                              to_string(run.state), key.to_string()));
        return;
    }

    if (obs.changed) {
        RunStatusChangeEvent ev;
        ev.run_id = key.run_id;
        ev.pipeline_id = key.pipeline_id;
        ev.project_id = key.project_id;
        if (obs.previous) {
            ev.previous_state = obs.previous->state;
            ev.previous_result = obs.previous->result;
        }
        ev.current_state = obs.current.state;
        ev.current_result = obs.current.result;
        ev.timestamp = WallClock::now();
        publish(ev);
    }

    if (obs.callback) {
        try {
            obs.callback(run);
        } catch (const std::exception& e) {
            log_error(fmt::format("engine: run callback for {} threw: {}", key.to_string(), e.what()));
        }
    }

    if (obs.retired) {
        log_info(fmt::format("engine: run {} reached {}, retiring subscription",
                             key.to_string(), to_string(run.state)));
    }
}

void UpdateEngine::deliver_pipeline(const PipelineFetch& fetch,
                                    const std::vector<PipelineRun>& runs) {
    if (disposed_) return;

    std::vector<PipelineCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        callbacks = registry_.accept_pipeline_runs(fetch);
        if (callbacks.empty()) return;
        ++total_updates_;
    }

    for (const auto& cb : callbacks) {
        if (!cb) continue;
        try {
            cb(runs);
        } catch (const std::exception& e) {
            log_error(fmt::format("engine: pipeline callback for {} threw: {}",
                                  fetch.key.to_string(), e.what()));
        }
    }
}

void UpdateEngine::publish(const RunStatusChangeEvent& event) {
    std::vector<StatusListener> listeners;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& [id, l] : listeners_) listeners.push_back(l);
    }
    for (const auto& l : listeners) {
        try {
            l(event);
        } catch (const std::exception& e) {
            log_error(fmt::format("engine: status listener threw: {}", e.what()));
        }
    }
}

void UpdateEngine::count_errors(std::size_t n) {
    if (n == 0) return;
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (disposed_) return;
    error_count_ += n;
}

// ── Refresh passes ──────────────────────────────────────────

std::size_t UpdateEngine::refresh_pass() {
    std::vector<RunFetch> run_fetches;
    std::vector<PipelineFetch> pipeline_fetches;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        run_fetches = registry_.stamp_active_runs();
        pipeline_fetches = registry_.stamp_pipelines();
    }

    const std::size_t total = run_fetches.size() + pipeline_fetches.size();
    std::vector<Result<PipelineRun>> run_results(run_fetches.size());
    std::vector<Result<std::vector<PipelineRun>>> pipeline_results(pipeline_fetches.size());

    // Workers pull the next unclaimed fetch until none are left.
    std::atomic<std::size_t> next{0};
    auto work = [&] {
        for (std::size_t i = next++; i < total; i = next++) {
            if (i < run_fetches.size()) {
                run_results[i] = fetch_run(run_fetches[i].key);
            } else {
                std::size_t j = i - run_fetches.size();
                pipeline_results[j] = fetch_pipeline(pipeline_fetches[j].key);
            }
        }
    };

    // This thread is one of the workers.
    std::size_t helpers = std::min(total, MAX_FETCH_CONCURRENCY);
    if (helpers > 0) --helpers;
    std::vector<std::future<void>> workers;
    workers.reserve(helpers);
    for (std::size_t w = 0; w < helpers; ++w) {
        try {
            workers.push_back(std::async(std::launch::async, work));
        } catch (const std::system_error& e) {
            log_warn(fmt::format("engine: could not start fetch worker ({}), continuing with {}",
                                 e.what(), workers.size() + 1));
            break;
        }
    }
    work();
    for (auto& w : workers) w.get();

    std::size_t errors = 0;

    for (std::size_t i = 0; i < run_fetches.size(); ++i) {
        const auto& r = run_results[i];
        if (r.is_err()) {
            ++errors;
            log_warn(fmt::format("engine: refresh failed for run {}: {}",
                                 run_fetches[i].key.to_string(), r.error));
            continue;
        }
        deliver_run(run_fetches[i], r.value);
    }

    for (std::size_t i = 0; i < pipeline_fetches.size(); ++i) {
        const auto& r = pipeline_results[i];
        if (r.is_err()) {
            ++errors;
            log_warn(fmt::format("engine: refresh failed for pipeline {}: {}",
                                 pipeline_fetches[i].key.to_string(), r.error));
            continue;
        }
        deliver_pipeline(pipeline_fetches[i], r.value);
    }

    return errors;
}

Result<void> UpdateEngine::refresh_all_subscriptions() {
    if (disposed_) {
        return Result<void>::Err("Service has been disposed", ErrorCode::Disposed);
    }

    std::lock_guard<std::mutex> pass(refresh_mutex_);
    count_errors(refresh_pass());
    return Result<void>::Ok();
}

void UpdateEngine::perform_background_refresh() {
    if (disposed_) return;

    // A manual refresh is already covering this interval.
    std::unique_lock<std::mutex> pass(refresh_mutex_, std::try_to_lock);
    if (!pass.owns_lock()) {
        log_debug("engine: tick skipped, refresh already in progress");
        return;
    }

    auto start = std::chrono::steady_clock::now();
    std::size_t errors = refresh_pass();
    double elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    std::lock_guard<std::mutex> lock(state_mutex_);
    // Disposed from a callback during this pass: the counters stay zeroed.
    if (disposed_) return;
    average_response_ms_ = average_response_ms_ == 0.0
        ? elapsed_ms
        : (average_response_ms_ + elapsed_ms) / 2.0;
    error_count_ += errors;
    last_update_time_ = WallClock::now();
}

// ── Timer ───────────────────────────────────────────────────

Result<void> UpdateEngine::start_background_refresh() {
    if (disposed_) {
        return Result<void>::Err("Service has been disposed", ErrorCode::Disposed);
    }

    std::chrono::milliseconds interval;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        interval = config_.polling_interval;
    }
    start_timer(interval);
    return Result<void>::Ok();
}

void UpdateEngine::start_timer(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(timer_->mutex);
    if (timer_->running || disposed_) return;

    if (timer_thread_.joinable()) {
        if (timer_thread_.get_id() == std::this_thread::get_id()) {
            // Stopped and restarted from a callback on the timer thread: the
            // loop is still ours and resumes after the current tick.
            timer_->running = true;
            timer_->interval = interval;
            return;
        }
        std::thread old = std::move(timer_thread_);
        lock.unlock();
        old.join();
        lock.lock();
        if (timer_->running || disposed_) return;
    }

    timer_->running = true;
    timer_->reschedule = false;
    timer_->interval = interval;
    std::uint64_t generation = ++timer_->generation;
    timer_thread_ = std::thread(&UpdateEngine::timer_loop, timer_, weak_from_this(), generation);
    log_info(fmt::format("engine: background refresh started ({}ms)", interval.count()));
}

void UpdateEngine::stop_background_refresh() {
    std::thread old;
    {
        std::lock_guard<std::mutex> lock(timer_->mutex);
        if (!timer_->running) return;
        timer_->running = false;
        timer_->cv.notify_all();
        // From the timer thread itself the join is left to the next
        // start, dispose or the destructor.
        if (timer_thread_.joinable() && timer_thread_.get_id() != std::this_thread::get_id()) {
            old = std::move(timer_thread_);
        }
    }
    if (old.joinable()) old.join();
    log_info("engine: background refresh stopped");
}

void UpdateEngine::shutdown_timer() {
    stop_background_refresh();

    std::thread old;
    {
        std::lock_guard<std::mutex> lock(timer_->mutex);
        if (timer_thread_.joinable() && timer_thread_.get_id() != std::this_thread::get_id()) {
            old = std::move(timer_thread_);
        }
    }
    if (old.joinable()) old.join();
}

bool UpdateEngine::is_background_refresh_active() const {
    std::lock_guard<std::mutex> lock(timer_->mutex);
    return timer_->running;
}

void UpdateEngine::timer_loop(std::shared_ptr<TimerState> timer,
                              std::weak_ptr<UpdateEngine> engine,
                              std::uint64_t generation) {
    std::unique_lock<std::mutex> lock(timer->mutex);
    while (timer->running && timer->generation == generation) {
        timer->reschedule = false;
        auto deadline = std::chrono::steady_clock::now() + timer->interval;
        bool woken = timer->cv.wait_until(lock, deadline, [&timer, generation] {
            return !timer->running || timer->reschedule || timer->generation != generation;
        });
        if (!timer->running || timer->generation != generation) break;
        if (woken) continue;  // interval changed, wait again from now

        lock.unlock();
        {
            auto self = engine.lock();
            if (!self) return;
            self->perform_background_refresh();
        }
        lock.lock();
    }
}

// ── Configuration / stats ───────────────────────────────────

UpdateEngineConfig UpdateEngine::configuration() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return config_;
}

Result<void> UpdateEngine::update_configuration(const UpdateEngineConfigPatch& patch) {
    if (disposed_) {
        return Result<void>::Err("Service has been disposed", ErrorCode::Disposed);
    }
    if (patch.polling_interval && patch.polling_interval->count() <= 0) {
        return Result<void>::Err("polling_interval must be positive", ErrorCode::InvalidConfig);
    }
    if (patch.max_active_subscriptions && *patch.max_active_subscriptions == 0) {
        return Result<void>::Err("max_active_subscriptions must be positive",
                                 ErrorCode::InvalidConfig);
    }

    bool interval_changed = false;
    bool has_subscriptions = false;
    std::chrono::milliseconds interval;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (patch.polling_interval && *patch.polling_interval != config_.polling_interval) {
            config_.polling_interval = *patch.polling_interval;
            interval_changed = true;
        }
        if (patch.max_active_subscriptions) {
            config_.max_active_subscriptions = *patch.max_active_subscriptions;
            registry_.set_max_run_subscriptions(config_.max_active_subscriptions);
        }
        if (patch.enable_incremental_fetch) {
            config_.enable_incremental_fetch = *patch.enable_incremental_fetch;
        }
        if (patch.background_refresh_enabled) {
            config_.background_refresh_enabled = *patch.background_refresh_enabled;
        }
        interval = config_.polling_interval;
        has_subscriptions = !registry_.empty();
    }

    if (interval_changed) {
        std::lock_guard<std::mutex> lock(timer_->mutex);
        timer_->interval = interval;
        if (timer_->running) {
            timer_->reschedule = true;
            timer_->cv.notify_all();
            log_info(fmt::format("engine: polling interval now {}ms", interval.count()));
        }
    }

    if (patch.background_refresh_enabled) {
        if (*patch.background_refresh_enabled && has_subscriptions) {
            start_timer(interval);
        } else if (!*patch.background_refresh_enabled) {
            stop_background_refresh();
        }
    }

    return Result<void>::Ok();
}

std::size_t UpdateEngine::active_subscription_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return registry_.run_count() + registry_.pipeline_count();
}

std::size_t UpdateEngine::polled_subscription_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return registry_.active_run_count() + registry_.pipeline_count();
}

std::optional<SubscriptionState> UpdateEngine::run_subscription_state(
        int run_id, int pipeline_id, const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const RunSubscription* sub = registry_.find_run(RunKey{run_id, pipeline_id, project_id});
    if (!sub) return std::nullopt;
    return sub->state;
}

UpdateEngineStats UpdateEngine::stats() const {
    UpdateEngineStats s;
    s.background_refresh_active = is_background_refresh_active();

    std::lock_guard<std::mutex> lock(state_mutex_);
    s.active_subscriptions = registry_.run_count() + registry_.pipeline_count();
    s.total_updates_received = total_updates_;
    s.last_update_time = last_update_time_;
    s.polling_interval = config_.polling_interval;
    s.average_response_time_ms = average_response_ms_;
    s.error_count = error_count_;
    return s;
}
