#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>
#include <core/types.hpp>

struct RunKey {
    int run_id = 0;
    int pipeline_id = 0;
    std::string project_id;

    bool operator<(const RunKey& o) const {
        return std::tie(project_id, pipeline_id, run_id) <
               std::tie(o.project_id, o.pipeline_id, o.run_id);
    }
    bool operator==(const RunKey& o) const {
        return run_id == o.run_id && pipeline_id == o.pipeline_id && project_id == o.project_id;
    }
    std::string to_string() const;   // "{project}:{pipeline}:{run}"
};

struct PipelineKey {
    int pipeline_id = 0;
    std::string project_id;

    bool operator<(const PipelineKey& o) const {
        return std::tie(project_id, pipeline_id) < std::tie(o.project_id, o.pipeline_id);
    }
    bool operator==(const PipelineKey& o) const {
        return pipeline_id == o.pipeline_id && project_id == o.project_id;
    }
    std::string to_string() const;  // "{project}:{pipeline}"
};

// Active: polled every tick. Retired: terminal state seen, kept but skipped.
// Removal happens only through disposal; there is no way back to Active.
enum class SubscriptionState {
    Active,
    Retired,
};

const char* to_string(SubscriptionState state);

struct RunSnapshot {
    RunState state = RunState::Unknown;
    RunResult result = RunResult::None;

    bool operator==(const RunSnapshot& o) const { return state == o.state && result == o.result; }
    bool operator!=(const RunSnapshot& o) const { return !(*this == o); }
};

using RunCallback = std::function<void(const PipelineRun&)>;
using PipelineCallback = std::function<void(const std::vector<PipelineRun>&)>;

struct RunSubscription {
    RunKey key;
    RunCallback callback;
    WallTime last_updated{};
    SubscriptionState state = SubscriptionState::Active;
    std::optional<RunSnapshot> last_seen;
    std::uint64_t owner = 0;        // token of the handle that registered the current callback
    std::uint64_t applied_seq = 0;  // newest fetch folded into last_seen

    bool is_active() const { return state == SubscriptionState::Active; }
};

// A fetch about to be issued, stamped under the engine lock so its result
// can be checked against the slot when it comes back.
struct RunFetch {
    RunKey key;
    std::uint64_t owner = 0;
    std::uint64_t seq = 0;
};

struct PipelineFetch {
    PipelineKey key;
    std::uint64_t seq = 0;
};

// Result of folding one fetched run into its subscription.
struct RunObservation {
    bool found = false;                      // slot still exists, same owner
    bool stale = false;                      // dropped: out of order, or retired and not terminal
    bool changed = false;                    // (state, result) differs, or first sighting
    std::optional<RunSnapshot> previous;
    RunSnapshot current;
    bool retired = false;                    // this observation retired the slot
    RunCallback callback;
};

// Run and pipeline subscription slots. Not synchronized: the owner
// (UpdateEngine) serializes every call.
class SubscriptionRegistry {
public:
    explicit SubscriptionRegistry(std::size_t max_run_subscriptions);

    // New key: fails with CapacityExceeded when run slots (in any state) are
    // at the limit. Existing key: the callback is replaced and the slot keeps
    // its state and last snapshot. Returns the owner token for the handle.
    Result<std::uint64_t> add_run(const RunKey& key, RunCallback callback, WallTime now);

    // Removes the slot only if `owner` still owns it. Returns true if removed.
    bool remove_run(const RunKey& key, std::uint64_t owner);

    const RunSubscription* find_run(const RunKey& key) const;

    // Empty if the slot is gone.
    std::optional<RunFetch> stamp_run(const RunKey& key);
    // One stamp per Active slot.
    std::vector<RunFetch> stamp_active_runs();

    // Compares against the last snapshot, stores the new one, retires on a
    // terminal state and hands back the callback to invoke. Results for a
    // replaced owner are not found; results older than the last applied
    // fetch, or non-terminal results for a Retired slot, come back stale.
    RunObservation observe(const RunFetch& fetch, const PipelineRun& run, WallTime now);

    std::uint64_t add_pipeline(const PipelineKey& key, PipelineCallback callback);
    // Drops the key once its last callback is gone. Returns true if removed.
    bool remove_pipeline(const PipelineKey& key, std::uint64_t callback_id);
    std::vector<PipelineCallback> pipeline_callbacks(const PipelineKey& key) const;

    PipelineFetch stamp_pipeline(const PipelineKey& key);
    std::vector<PipelineFetch> stamp_pipelines();

    // Callbacks to run for a fetched run list. Empty if the key is gone or a
    // newer list was already delivered.
    std::vector<PipelineCallback> accept_pipeline_runs(const PipelineFetch& fetch);

    std::size_t run_count() const { return runs_.size(); }
    std::size_t active_run_count() const;
    std::size_t pipeline_count() const { return pipelines_.size(); }
    bool empty() const { return runs_.empty() && pipelines_.empty(); }

    std::size_t max_run_subscriptions() const { return max_runs_; }
    void set_max_run_subscriptions(std::size_t max) { max_runs_ = max; }

    void clear();

private:
    struct PipelineSubscription {
        std::map<std::uint64_t, PipelineCallback> callbacks;
        std::uint64_t applied_seq = 0;
    };

    std::size_t max_runs_;
    std::uint64_t next_token_ = 1;
    std::uint64_t next_seq_ = 1;
    std::map<RunKey, RunSubscription> runs_;
    std::map<PipelineKey, PipelineSubscription> pipelines_;
};
