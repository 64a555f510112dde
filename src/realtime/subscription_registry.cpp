#include "subscription_registry.hpp"
#include <fmt/format.h>

std::string RunKey::to_string() const {
    return fmt::format("{}:{}:{}", project_id, pipeline_id, run_id);
}

std::string PipelineKey::to_string() const {
    return fmt::format("{}:{}", project_id, pipeline_id);
}

const char* to_string(SubscriptionState state) {
    return state == SubscriptionState::Active ? "active" : "retired";
}

SubscriptionRegistry::SubscriptionRegistry(std::size_t max_run_subscriptions)
    : max_runs_(max_run_subscriptions) {}

// ── Run subscriptions ───────────────────────────────────────

Result<std::uint64_t> SubscriptionRegistry::add_run(const RunKey& key, RunCallback callback,
                                                    WallTime now) {
    auto it = runs_.find(key);
    if (it != runs_.end()) {
        it->second.callback = std::move(callback);
        it->second.last_updated = now;
        it->second.owner = next_token_++;
        return Result<std::uint64_t>::Ok(it->second.owner);
    }

    if (runs_.size() >= max_runs_) {
        return Result<std::uint64_t>::Err(
            fmt::format("Maximum number of subscriptions ({}) reached", max_runs_),
            ErrorCode::CapacityExceeded);
    }

    RunSubscription sub;
    sub.key = key;
    sub.callback = std::move(callback);
    sub.last_updated = now;
    sub.owner = next_token_++;
    std::uint64_t owner = sub.owner;
    runs_.emplace(key, std::move(sub));
    return Result<std::uint64_t>::Ok(owner);
}

bool SubscriptionRegistry::remove_run(const RunKey& key, std::uint64_t owner) {
    auto it = runs_.find(key);
    if (it == runs_.end() || it->second.owner != owner) return false;
    runs_.erase(it);
    return true;
}

const RunSubscription* SubscriptionRegistry::find_run(const RunKey& key) const {
    auto it = runs_.find(key);
    return it == runs_.end() ? nullptr : &it->second;
}

std::optional<RunFetch> SubscriptionRegistry::stamp_run(const RunKey& key) {
    auto it = runs_.find(key);
    if (it == runs_.end()) return std::nullopt;
    return RunFetch{key, it->second.owner, next_seq_++};
}

std::vector<RunFetch> SubscriptionRegistry::stamp_active_runs() {
    std::vector<RunFetch> out;
    for (const auto& [key, sub] : runs_) {
        if (sub.is_active()) out.push_back(RunFetch{key, sub.owner, next_seq_++});
    }
    return out;
}

RunObservation SubscriptionRegistry::observe(const RunFetch& fetch, const PipelineRun& run,
                                             WallTime now) {
    RunObservation obs;
    auto it = runs_.find(fetch.key);
    if (it == runs_.end() || it->second.owner != fetch.owner) return obs;

    RunSubscription& sub = it->second;
    obs.found = true;
    // A newer fetch already landed, or the run finished and this answer is
    // from before that.
    if (fetch.seq <= sub.applied_seq || (!sub.is_active() && !is_terminal(run.state))) {
        obs.stale = true;
        return obs;
    }

    sub.applied_seq = fetch.seq;
    obs.current = RunSnapshot{run.state, run.result};
    obs.previous = sub.last_seen;
    obs.changed = !sub.last_seen || *sub.last_seen != obs.current;
    obs.callback = sub.callback;

    sub.last_seen = obs.current;
    sub.last_updated = now;

    if (sub.is_active() && is_terminal(run.state)) {
        sub.state = SubscriptionState::Retired;
        obs.retired = true;
    }
    return obs;
}

std::size_t SubscriptionRegistry::active_run_count() const {
    std::size_t n = 0;
    for (const auto& [key, sub] : runs_) {
        if (sub.is_active()) ++n;
    }
    return n;
}

// ── Pipeline subscriptions ──────────────────────────────────

std::uint64_t SubscriptionRegistry::add_pipeline(const PipelineKey& key,
                                                 PipelineCallback callback) {
    std::uint64_t id = next_token_++;
    pipelines_[key].callbacks.emplace(id, std::move(callback));
    return id;
}

bool SubscriptionRegistry::remove_pipeline(const PipelineKey& key, std::uint64_t callback_id) {
    auto it = pipelines_.find(key);
    if (it == pipelines_.end()) return false;
    bool removed = it->second.callbacks.erase(callback_id) > 0;
    if (it->second.callbacks.empty()) {
        pipelines_.erase(it);
    }
    return removed;
}

std::vector<PipelineCallback> SubscriptionRegistry::pipeline_callbacks(
        const PipelineKey& key) const {
    std::vector<PipelineCallback> out;
    auto it = pipelines_.find(key);
    if (it == pipelines_.end()) return out;
    for (const auto& [id, cb] : it->second.callbacks) {
        out.push_back(cb);
    }
    return out;
}

PipelineFetch SubscriptionRegistry::stamp_pipeline(const PipelineKey& key) {
    return PipelineFetch{key, next_seq_++};
}

std::vector<PipelineFetch> SubscriptionRegistry::stamp_pipelines() {
    std::vector<PipelineFetch> out;
    for (const auto& [key, sub] : pipelines_) {
        out.push_back(PipelineFetch{key, next_seq_++});
    }
    return out;
}

std::vector<PipelineCallback> SubscriptionRegistry::accept_pipeline_runs(
        const PipelineFetch& fetch) {
    auto it = pipelines_.find(fetch.key);
    if (it == pipelines_.end() || fetch.seq <= it->second.applied_seq) return {};
    it->second.applied_seq = fetch.seq;
    return pipeline_callbacks(fetch.key);
}

void SubscriptionRegistry::clear() {
    runs_.clear();
    pipelines_.clear();
}
