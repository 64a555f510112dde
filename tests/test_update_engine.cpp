#include <gtest/gtest.h>
#include <realtime/update_engine.hpp>
#include "fake_gateway.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

UpdateEngineConfig manual_config(std::size_t max_subs = 10) {
    UpdateEngineConfig c;
    c.background_refresh_enabled = false;
    c.max_active_subscriptions = max_subs;
    return c;
}

// Polls `pred` until it holds or the timeout runs out.
bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

// Thread-safe append-only log of what the engine delivered, in order.
struct Recorder {
    std::mutex mutex;
    std::vector<std::string> entries;
    std::vector<RunStatusChangeEvent> events;

    void note(const std::string& s) {
        std::lock_guard<std::mutex> lock(mutex);
        entries.push_back(s);
    }
    StatusListener listener() {
        return [this](const RunStatusChangeEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex);
            entries.push_back("event:" + to_string(ev.current_state));
            events.push_back(ev);
        };
    }
    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return entries;
    }
};

}  // namespace

class UpdateEngineTest : public ::testing::Test {
protected:
    FakeGateway gateway;
    std::shared_ptr<UpdateEngine> engine;

    void SetUp() override {
        gateway.set_run(1, 10, "web", RunState::InProgress);
        gateway.set_run(2, 10, "web", RunState::InProgress);
        gateway.set_run(3, 10, "web", RunState::Completed, RunResult::Succeeded);
        engine = UpdateEngine::create(gateway, manual_config());
    }

    void TearDown() override {
        engine->dispose();
    }
};

// ── Subscribing ─────────────────────────────────────────────

TEST_F(UpdateEngineTest, SubscribeFetchesImmediately) {
    int calls = 0;
    RunState seen = RunState::Unknown;
    auto h = engine->subscribe_to_run_updates(1, 10, "web", [&](const PipelineRun& run) {
        ++calls;
        seen = run.state;
    });
    ASSERT_TRUE(h.is_ok());
    EXPECT_TRUE(h.value.active());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen, RunState::InProgress);
    EXPECT_EQ(gateway.run_fetches(1), 1);
    EXPECT_EQ(engine->active_subscription_count(), 1u);
}

TEST_F(UpdateEngineTest, DuplicateSubscribeReplacesCallback) {
    int first = 0;
    int second = 0;
    auto a = engine->subscribe_to_run_updates(1, 10, "web", [&](const PipelineRun&) { ++first; });
    auto b = engine->subscribe_to_run_updates(1, 10, "web", [&](const PipelineRun&) { ++second; });
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(engine->active_subscription_count(), 1u);

    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 2);

    // The superseded handle does not take the new callback down with it
    a.value.dispose();
    EXPECT_EQ(engine->active_subscription_count(), 1u);
    b.value.dispose();
    EXPECT_EQ(engine->active_subscription_count(), 0u);
}

TEST(UpdateEngine, CapacityExceeded) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    gateway.set_run(2, 10, "web", RunState::InProgress);
    auto engine = UpdateEngine::create(gateway, manual_config(1));

    auto a = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(a.is_ok());

    auto b = engine->subscribe_to_run_updates(2, 10, "web", nullptr);
    ASSERT_TRUE(b.is_err());
    EXPECT_EQ(b.code, ErrorCode::CapacityExceeded);
    EXPECT_EQ(b.error, "Maximum number of subscriptions (1) reached");
    EXPECT_EQ(gateway.run_fetches(2), 0);

    // Re-subscribing the held key is still allowed
    auto again = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(again.is_ok());

    // Only the current owner frees the slot
    a.value.dispose();
    EXPECT_TRUE(engine->subscribe_to_run_updates(2, 10, "web", nullptr).is_err());
    again.value.dispose();

    auto c = engine->subscribe_to_run_updates(2, 10, "web", nullptr);
    EXPECT_TRUE(c.is_ok());
}

TEST_F(UpdateEngineTest, FinishedRunRetires) {
    int calls = 0;
    auto h = engine->subscribe_to_run_updates(3, 10, "web", [&](const PipelineRun&) { ++calls; });
    ASSERT_TRUE(h.is_ok());
    EXPECT_EQ(calls, 1);

    EXPECT_EQ(engine->run_subscription_state(3, 10, "web"), SubscriptionState::Retired);
    EXPECT_EQ(engine->active_subscription_count(), 1u);
    EXPECT_EQ(engine->polled_subscription_count(), 0u);

    // Retired slots are skipped by refresh passes
    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());
    EXPECT_EQ(gateway.run_fetches(3), 1);
    EXPECT_EQ(calls, 1);
}

TEST_F(UpdateEngineTest, RunRetiresWhenItCompletes) {
    auto h = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(h.is_ok());
    EXPECT_EQ(engine->run_subscription_state(1, 10, "web"), SubscriptionState::Active);

    gateway.set_run(1, 10, "web", RunState::Completed, RunResult::Failed);
    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());
    EXPECT_EQ(engine->run_subscription_state(1, 10, "web"), SubscriptionState::Retired);

    h.value.dispose();
    EXPECT_FALSE(engine->run_subscription_state(1, 10, "web").has_value());
}

// ── Change events ───────────────────────────────────────────

TEST_F(UpdateEngineTest, ChangeEventsCarryPreviousState) {
    Recorder rec;
    auto l = engine->add_status_listener(rec.listener());
    ASSERT_TRUE(l.is_ok());

    auto h = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(h.is_ok());
    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());  // unchanged

    gateway.set_run(1, 10, "web", RunState::Completed, RunResult::Succeeded);
    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());

    std::lock_guard<std::mutex> lock(rec.mutex);
    ASSERT_EQ(rec.events.size(), 2u);

    EXPECT_FALSE(rec.events[0].previous_state.has_value());
    EXPECT_EQ(rec.events[0].current_state, RunState::InProgress);

    ASSERT_TRUE(rec.events[1].previous_state.has_value());
    EXPECT_EQ(*rec.events[1].previous_state, RunState::InProgress);
    EXPECT_EQ(rec.events[1].current_state, RunState::Completed);
    EXPECT_EQ(*rec.events[1].previous_result, RunResult::None);
    EXPECT_EQ(rec.events[1].current_result, RunResult::Succeeded);
    EXPECT_EQ(rec.events[1].run_id, 1);
    EXPECT_EQ(rec.events[1].pipeline_id, 10);
    EXPECT_EQ(rec.events[1].project_id, "web");
}

TEST_F(UpdateEngineTest, EventPublishedBeforeCallback) {
    Recorder rec;
    auto l = engine->add_status_listener(rec.listener());
    auto h = engine->subscribe_to_run_updates(1, 10, "web", [&](const PipelineRun& run) {
        rec.note("callback:" + to_string(run.state));
    });
    ASSERT_TRUE(h.is_ok());

    gateway.set_run(1, 10, "web", RunState::Cancelling);
    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());

    std::vector<std::string> expected = {
        "event:" + to_string(RunState::InProgress),
        "callback:" + to_string(RunState::InProgress),
        "event:" + to_string(RunState::Cancelling),
        "callback:" + to_string(RunState::Cancelling),
    };
    EXPECT_EQ(rec.snapshot(), expected);
}

TEST_F(UpdateEngineTest, UnchangedRunStillGetsCallback) {
    int calls = 0;
    auto h = engine->subscribe_to_run_updates(1, 10, "web", [&](const PipelineRun&) { ++calls; });
    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());
    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(engine->stats().total_updates_received, 1u);
}

TEST_F(UpdateEngineTest, DisposedListenerStopsReceiving) {
    Recorder rec;
    auto l = engine->add_status_listener(rec.listener());
    ASSERT_TRUE(l.is_ok());
    l.value.dispose();

    auto h = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(h.is_ok());
    EXPECT_TRUE(rec.snapshot().empty());
}

// ── Failures ────────────────────────────────────────────────

TEST_F(UpdateEngineTest, FailedFetchesAreCounted) {
    gateway.fail_run(1);
    int calls = 0;
    auto h = engine->subscribe_to_run_updates(1, 10, "web", [&](const PipelineRun&) { ++calls; });
    ASSERT_TRUE(h.is_ok());
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(engine->stats().error_count, 1u);

    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());
    EXPECT_EQ(engine->stats().error_count, 2u);

    gateway.fail_run(1, false);
    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(engine->stats().error_count, 2u);
}

TEST_F(UpdateEngineTest, ThrowingGatewayCountsAsFailure) {
    gateway.throw_on_run(2);
    auto a = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    auto b = engine->subscribe_to_run_updates(2, 10, "web", nullptr);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());

    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());
    EXPECT_EQ(engine->stats().error_count, 2u);
    EXPECT_EQ(gateway.run_fetches(1), 2);
}

TEST_F(UpdateEngineTest, ThrowingCallbackDoesNotStopOthers) {
    int other = 0;
    auto a = engine->subscribe_to_run_updates(1, 10, "web", [](const PipelineRun&) {
        throw std::runtime_error("boom");
    });
    auto b = engine->subscribe_to_run_updates(2, 10, "web", [&](const PipelineRun&) { ++other; });
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());

    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());
    EXPECT_EQ(other, 2);
    EXPECT_EQ(engine->stats().error_count, 0u);
}

// ── Re-entrancy ─────────────────────────────────────────────

TEST_F(UpdateEngineTest, CallbackMaySubscribeAndUnsubscribe) {
    std::vector<SubscriptionHandle> nested;
    SubscriptionHandle self;
    int calls = 0;

    auto h = engine->subscribe_to_run_updates(1, 10, "web", [&](const PipelineRun&) {
        ++calls;
        if (calls == 2) {
            auto n = engine->subscribe_to_run_updates(2, 10, "web", nullptr);
            if (n.is_ok()) nested.push_back(std::move(n.value));
            self.dispose();
        }
    });
    ASSERT_TRUE(h.is_ok());
    self = std::move(h.value);

    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(nested.size(), 1u);
    EXPECT_FALSE(engine->run_subscription_state(1, 10, "web").has_value());
    EXPECT_EQ(engine->run_subscription_state(2, 10, "web"), SubscriptionState::Active);
}

// ── Pipelines ───────────────────────────────────────────────

TEST_F(UpdateEngineTest, PipelineSubscribersGetRunLists) {
    gateway.set_pipeline_runs(10, "web", {
        FakeGateway::make_run(2, 10, "web", RunState::InProgress),
        FakeGateway::make_run(1, 10, "web", RunState::Completed, RunResult::Succeeded),
    });

    std::size_t a_seen = 0;
    int b_calls = 0;
    auto a = engine->subscribe_to_pipeline_updates(10, "web",
        [&](const std::vector<PipelineRun>& runs) { a_seen = runs.size(); });
    auto b = engine->subscribe_to_pipeline_updates(10, "web",
        [&](const std::vector<PipelineRun>&) { ++b_calls; });
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());

    EXPECT_EQ(a_seen, 2u);
    EXPECT_EQ(engine->active_subscription_count(), 1u);

    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());
    // b saw its own initial fetch and the refresh
    EXPECT_EQ(b_calls, 2);

    a.value.dispose();
    EXPECT_EQ(engine->active_subscription_count(), 1u);
    b.value.dispose();
    EXPECT_EQ(engine->active_subscription_count(), 0u);
}

TEST_F(UpdateEngineTest, PipelineFetchFailureCounted) {
    gateway.fail_pipeline(10);
    auto a = engine->subscribe_to_pipeline_updates(10, "web", nullptr);
    ASSERT_TRUE(a.is_ok());
    EXPECT_EQ(engine->stats().error_count, 1u);
}

// ── Background refresh ──────────────────────────────────────

TEST_F(UpdateEngineTest, StartStopIsIdempotent) {
    EXPECT_FALSE(engine->is_background_refresh_active());
    ASSERT_TRUE(engine->start_background_refresh().is_ok());
    ASSERT_TRUE(engine->start_background_refresh().is_ok());
    EXPECT_TRUE(engine->is_background_refresh_active());

    engine->stop_background_refresh();
    engine->stop_background_refresh();
    EXPECT_FALSE(engine->is_background_refresh_active());
}

TEST(UpdateEngine, SubscribeStartsTimerAndLastUnsubscribeStopsIt) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    UpdateEngineConfig config;
    config.polling_interval = 60000ms;
    auto engine = UpdateEngine::create(gateway, config);

    EXPECT_FALSE(engine->is_background_refresh_active());
    auto h = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(h.is_ok());
    EXPECT_TRUE(engine->is_background_refresh_active());

    h.value.dispose();
    EXPECT_FALSE(engine->is_background_refresh_active());
}

TEST(UpdateEngine, TimerRefreshesPeriodically) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    UpdateEngineConfig config;
    config.polling_interval = 30ms;
    auto engine = UpdateEngine::create(gateway, config);

    auto h = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(h.is_ok());

    EXPECT_TRUE(wait_for([&] { return gateway.run_fetches(1) >= 3; }));
    EXPECT_TRUE(wait_for([&] { return engine->stats().last_update_time.has_value(); }));
    EXPECT_GE(engine->stats().average_response_time_ms, 0.0);
    engine->dispose();
}

TEST(UpdateEngine, TimerStopsAfterRunCompletes) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    UpdateEngineConfig config;
    config.polling_interval = 20ms;
    auto engine = UpdateEngine::create(gateway, config);

    std::atomic<int> calls{0};
    std::atomic<int> last_result{static_cast<int>(RunResult::None)};
    auto h = engine->subscribe_to_run_updates(1, 10, "web", [&](const PipelineRun& run) {
        ++calls;
        last_result = static_cast<int>(run.result);
    });
    ASSERT_TRUE(h.is_ok());
    gateway.set_run(1, 10, "web", RunState::Completed, RunResult::Canceled);

    ASSERT_TRUE(wait_for([&] {
        return engine->run_subscription_state(1, 10, "web") == SubscriptionState::Retired;
    }));
    int fetched = gateway.run_fetches(1);
    int delivered = calls.load();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(gateway.run_fetches(1), fetched);
    EXPECT_EQ(calls.load(), delivered);
    EXPECT_EQ(last_result.load(), static_cast<int>(RunResult::Canceled));
    EXPECT_EQ(engine->polled_subscription_count(), 0u);
    engine->dispose();
}

TEST(UpdateEngine, StopFromCallbackOnTimerThread) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    UpdateEngineConfig config;
    config.polling_interval = 20ms;
    auto engine = UpdateEngine::create(gateway, config);
    UpdateEngine* raw = engine.get();

    std::atomic<int> calls{0};
    auto h = engine->subscribe_to_run_updates(1, 10, "web", [&calls, raw](const PipelineRun&) {
        if (++calls == 2) raw->stop_background_refresh();
    });
    ASSERT_TRUE(h.is_ok());

    ASSERT_TRUE(wait_for([&] { return !engine->is_background_refresh_active(); }));
    int fetched = gateway.run_fetches(1);
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(gateway.run_fetches(1), fetched);

    // Restarting after a stop from the timer thread works
    ASSERT_TRUE(engine->start_background_refresh().is_ok());
    EXPECT_TRUE(wait_for([&] { return gateway.run_fetches(1) > fetched; }));
    engine->dispose();
}

// ── Configuration ───────────────────────────────────────────

TEST_F(UpdateEngineTest, RejectsInvalidConfiguration) {
    UpdateEngineConfigPatch zero_interval;
    zero_interval.polling_interval = 0ms;
    auto r = engine->update_configuration(zero_interval);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::InvalidConfig);

    UpdateEngineConfigPatch zero_max;
    zero_max.max_active_subscriptions = 0;
    EXPECT_EQ(engine->update_configuration(zero_max).code, ErrorCode::InvalidConfig);

    EXPECT_EQ(engine->configuration().polling_interval,
              std::chrono::milliseconds(DEFAULT_POLL_INTERVAL_MS));
}

TEST_F(UpdateEngineTest, PartialConfigurationUpdate) {
    UpdateEngineConfigPatch patch;
    patch.polling_interval = 45000ms;
    ASSERT_TRUE(engine->update_configuration(patch).is_ok());

    auto c = engine->configuration();
    EXPECT_EQ(c.polling_interval, 45000ms);
    EXPECT_EQ(c.max_active_subscriptions, 10u);
    EXPECT_FALSE(c.background_refresh_enabled);
    EXPECT_EQ(engine->stats().polling_interval, 45000ms);
}

TEST_F(UpdateEngineTest, EnablingWithoutSubscriptionsDoesNotStart) {
    UpdateEngineConfigPatch on;
    on.background_refresh_enabled = true;
    ASSERT_TRUE(engine->update_configuration(on).is_ok());
    EXPECT_FALSE(engine->is_background_refresh_active());

    auto h = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(h.is_ok());
    EXPECT_TRUE(engine->is_background_refresh_active());

    UpdateEngineConfigPatch off;
    off.background_refresh_enabled = false;
    ASSERT_TRUE(engine->update_configuration(off).is_ok());
    EXPECT_FALSE(engine->is_background_refresh_active());
}

TEST_F(UpdateEngineTest, EnablingWithSubscriptionsStarts) {
    auto h = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(h.is_ok());
    EXPECT_FALSE(engine->is_background_refresh_active());

    UpdateEngineConfigPatch on;
    on.background_refresh_enabled = true;
    ASSERT_TRUE(engine->update_configuration(on).is_ok());
    EXPECT_TRUE(engine->is_background_refresh_active());
}

TEST(UpdateEngine, ShorterIntervalTakesEffectImmediately) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    UpdateEngineConfig config;
    config.polling_interval = 60000ms;
    auto engine = UpdateEngine::create(gateway, config);

    auto h = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(h.is_ok());
    EXPECT_EQ(gateway.run_fetches(1), 1);

    UpdateEngineConfigPatch patch;
    patch.polling_interval = 20ms;
    ASSERT_TRUE(engine->update_configuration(patch).is_ok());

    EXPECT_TRUE(wait_for([&] { return gateway.run_fetches(1) >= 3; }));
    engine->dispose();
}

TEST_F(UpdateEngineTest, LoweringLimitKeepsExistingSlots) {
    auto a = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    auto b = engine->subscribe_to_run_updates(2, 10, "web", nullptr);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());

    UpdateEngineConfigPatch patch;
    patch.max_active_subscriptions = 1;
    ASSERT_TRUE(engine->update_configuration(patch).is_ok());

    EXPECT_EQ(engine->active_subscription_count(), 2u);
    auto c = engine->subscribe_to_run_updates(3, 10, "web", nullptr);
    EXPECT_EQ(c.code, ErrorCode::CapacityExceeded);
}

// ── Disposal ────────────────────────────────────────────────

TEST_F(UpdateEngineTest, DisposeClearsAndRejects) {
    auto h = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(h.is_ok());
    ASSERT_TRUE(engine->start_background_refresh().is_ok());

    engine->dispose();
    EXPECT_TRUE(engine->is_disposed());
    EXPECT_FALSE(engine->is_background_refresh_active());
    EXPECT_EQ(engine->active_subscription_count(), 0u);

    auto s = engine->stats();
    EXPECT_EQ(s.total_updates_received, 0u);
    EXPECT_EQ(s.error_count, 0u);
    EXPECT_FALSE(s.last_update_time.has_value());

    EXPECT_EQ(engine->subscribe_to_run_updates(2, 10, "web", nullptr).code, ErrorCode::Disposed);
    EXPECT_EQ(engine->subscribe_to_pipeline_updates(10, "web", nullptr).code, ErrorCode::Disposed);
    EXPECT_EQ(engine->add_status_listener(nullptr).code, ErrorCode::Disposed);
    EXPECT_EQ(engine->start_background_refresh().code, ErrorCode::Disposed);
    EXPECT_EQ(engine->refresh_all_subscriptions().code, ErrorCode::Disposed);
    EXPECT_EQ(engine->update_configuration(UpdateEngineConfigPatch{}).code, ErrorCode::Disposed);

    // Both are no-ops now
    engine->stop_background_refresh();
    h.value.dispose();
    engine->dispose();
}

TEST(UpdateEngine, HandleOutlivesEngine) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    auto engine = UpdateEngine::create(gateway, manual_config());

    auto h = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(h.is_ok());
    engine.reset();

    h.value.dispose();
    EXPECT_FALSE(h.value.active());
}

TEST(UpdateEngine, HandleDisposesOnDestruction) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    auto engine = UpdateEngine::create(gateway, manual_config());
    {
        auto h = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
        ASSERT_TRUE(h.is_ok());
        EXPECT_EQ(engine->active_subscription_count(), 1u);
    }
    EXPECT_EQ(engine->active_subscription_count(), 0u);
}

TEST_F(UpdateEngineTest, DisposeFromCallbackDuringRefresh) {
    gateway.fail_run(2);
    UpdateEngine* raw = engine.get();
    int calls = 0;
    auto a = engine->subscribe_to_run_updates(1, 10, "web", [&calls, raw](const PipelineRun&) {
        if (++calls == 2) raw->dispose();
    });
    auto b = engine->subscribe_to_run_updates(2, 10, "web", nullptr);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(engine->stats().error_count, 1u);

    // Run 2 fails in the same pass, after the engine was disposed
    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());
    EXPECT_TRUE(engine->is_disposed());
    auto s = engine->stats();
    EXPECT_EQ(s.error_count, 0u);
    EXPECT_EQ(s.total_updates_received, 0u);
    EXPECT_EQ(s.active_subscriptions, 0u);
}

TEST(UpdateEngine, DisposeFromTimerCallbackLeavesStatsZeroed) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    gateway.set_run(2, 10, "web", RunState::InProgress);
    gateway.fail_run(2);
    UpdateEngineConfig config = manual_config();
    config.polling_interval = 20ms;
    auto engine = UpdateEngine::create(gateway, config);
    UpdateEngine* raw = engine.get();

    std::atomic<int> calls{0};
    auto a = engine->subscribe_to_run_updates(1, 10, "web", [&calls, raw](const PipelineRun&) {
        if (++calls == 2) raw->dispose();
    });
    auto b = engine->subscribe_to_run_updates(2, 10, "web", nullptr);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(engine->stats().error_count, 1u);

    ASSERT_TRUE(engine->start_background_refresh().is_ok());
    ASSERT_TRUE(wait_for([&] { return engine->is_disposed(); }));
    // Let the rest of that tick run out
    std::this_thread::sleep_for(100ms);

    auto s = engine->stats();
    EXPECT_EQ(s.error_count, 0u);
    EXPECT_EQ(s.total_updates_received, 0u);
    EXPECT_EQ(s.average_response_time_ms, 0.0);
    EXPECT_FALSE(s.last_update_time.has_value());
    EXPECT_FALSE(s.background_refresh_active);
}

TEST(UpdateEngine, DisposeFromTimerCallbackThenRelease) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    UpdateEngineConfig config;
    config.polling_interval = 20ms;
    auto engine = UpdateEngine::create(gateway, config);
    UpdateEngine* raw = engine.get();
    std::weak_ptr<UpdateEngine> weak = engine;

    std::atomic<int> calls{0};
    std::atomic<bool> disposed_in_tick{false};
    auto h = engine->subscribe_to_run_updates(1, 10, "web",
        [&calls, &disposed_in_tick, raw](const PipelineRun&) {
            if (++calls != 2) return;
            raw->dispose();
            disposed_in_tick = true;
            // The owner lets go while this tick is still running
            std::this_thread::sleep_for(50ms);
        });
    ASSERT_TRUE(h.is_ok());

    ASSERT_TRUE(wait_for([&] { return disposed_in_tick.load(); }));
    engine.reset();
    EXPECT_TRUE(wait_for([&] { return weak.expired(); }));

    int fetched = gateway.run_fetches(1);
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(gateway.run_fetches(1), fetched);
    EXPECT_EQ(calls.load(), 2);

    h.value.dispose();
    EXPECT_FALSE(h.value.active());
}

// ── Interleavings ───────────────────────────────────────────

TEST(UpdateEngine, LateInitialFetchDoesNotUndoCompletion) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    Recorder rec;
    UpdateEngineConfig config;
    config.polling_interval = 30ms;
    auto engine = UpdateEngine::create(gateway, config);
    auto l = engine->add_status_listener(rec.listener());
    ASSERT_TRUE(l.is_ok());

    auto note_state = [&rec](const PipelineRun& run) { rec.note("callback:" + to_string(run.state)); };
    auto first = engine->subscribe_to_run_updates(1, 10, "web", note_state);
    ASSERT_TRUE(first.is_ok());

    // The re-subscribe's first fetch reads "in progress", then hangs while
    // the run finishes and a timer tick reports it.
    gateway.stall_next_fetch(std::this_thread::get_id(), 250ms);
    std::thread finisher([&gateway] {
        std::this_thread::sleep_for(50ms);
        gateway.set_run(1, 10, "web", RunState::Completed, RunResult::Succeeded);
    });
    auto second = engine->subscribe_to_run_updates(1, 10, "web", note_state);
    finisher.join();
    ASSERT_TRUE(second.is_ok());

    ASSERT_TRUE(wait_for([&] {
        return engine->run_subscription_state(1, 10, "web") == SubscriptionState::Retired;
    }));
    engine->dispose();

    std::lock_guard<std::mutex> lock(rec.mutex);
    for (const auto& ev : rec.events) {
        bool reopened = ev.previous_state == RunState::Completed &&
                        ev.current_state != RunState::Completed;
        EXPECT_FALSE(reopened) << "event back to " << to_string(ev.current_state);
    }
    ASSERT_FALSE(rec.events.empty());
    EXPECT_EQ(rec.events.back().current_state, RunState::Completed);
    ASSERT_FALSE(rec.entries.empty());
    EXPECT_EQ(rec.entries.back(), "callback:" + to_string(RunState::Completed));
}

TEST(UpdateEngine, ResubscribeWhileFetchInFlightIgnoresOldOwner) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    auto engine = UpdateEngine::create(gateway, manual_config());

    auto old_owner = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    ASSERT_TRUE(old_owner.is_ok());
    gateway.set_fetch_delay(100ms);

    std::thread pass([&engine] { EXPECT_TRUE(engine->refresh_all_subscriptions().is_ok()); });
    EXPECT_TRUE(wait_for([&] { return gateway.run_fetches(1) >= 2; }));

    // Hand the slot to a new owner while the pass's fetch is out
    old_owner.value.dispose();
    std::atomic<int> calls{0};
    auto new_owner = engine->subscribe_to_run_updates(1, 10, "web",
        [&calls](const PipelineRun&) { ++calls; });
    pass.join();
    ASSERT_TRUE(new_owner.is_ok());

    // First sighting for each owner, nothing from the old owner's fetch
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(engine->stats().total_updates_received, 2u);
    engine->dispose();
}

TEST(UpdateEngine, ResubscribeWhileTicking) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    gateway.set_fetch_delay(2ms);
    Recorder rec;
    UpdateEngineConfig config;
    config.polling_interval = 5ms;
    auto engine = UpdateEngine::create(gateway, config);
    auto l = engine->add_status_listener(rec.listener());
    ASSERT_TRUE(l.is_ok());

    std::thread finisher([&gateway] {
        std::this_thread::sleep_for(40ms);
        gateway.set_run(1, 10, "web", RunState::Completed, RunResult::Succeeded);
    });

    std::vector<SubscriptionHandle> handles;
    for (int i = 0; i < 30; ++i) {
        auto h = engine->subscribe_to_run_updates(1, 10, "web", [&rec](const PipelineRun& run) {
            rec.note("callback:" + to_string(run.state));
        });
        EXPECT_TRUE(h.is_ok());
        if (h.is_ok()) handles.push_back(std::move(h.value));
        std::this_thread::sleep_for(3ms);
    }
    finisher.join();

    ASSERT_TRUE(wait_for([&] {
        return engine->run_subscription_state(1, 10, "web") == SubscriptionState::Retired;
    }));
    EXPECT_EQ(engine->active_subscription_count(), 1u);
    engine->dispose();

    std::lock_guard<std::mutex> lock(rec.mutex);
    ASSERT_EQ(rec.events.size(), 2u);
    EXPECT_EQ(rec.events[0].current_state, RunState::InProgress);
    EXPECT_EQ(rec.events[1].current_state, RunState::Completed);
    EXPECT_EQ(rec.entries.back(), "callback:" + to_string(RunState::Completed));
}

TEST(UpdateEngine, StopAndStartFromOtherThreadDuringTicks) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    gateway.set_run(2, 10, "web", RunState::InProgress);
    UpdateEngineConfig config = manual_config();
    config.polling_interval = 10ms;
    auto engine = UpdateEngine::create(gateway, config);

    auto a = engine->subscribe_to_run_updates(1, 10, "web", nullptr);
    auto b = engine->subscribe_to_run_updates(2, 10, "web", nullptr);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    gateway.set_fetch_delay(5ms);
    ASSERT_TRUE(engine->start_background_refresh().is_ok());

    std::thread toggler([&engine] {
        for (int i = 0; i < 20; ++i) {
            engine->stop_background_refresh();
            std::this_thread::sleep_for(3ms);
            EXPECT_TRUE(engine->start_background_refresh().is_ok());
            std::this_thread::sleep_for(15ms);
        }
    });
    toggler.join();

    EXPECT_TRUE(engine->is_background_refresh_active());
    int fetched = gateway.run_fetches(1);
    EXPECT_TRUE(wait_for([&] { return gateway.run_fetches(1) > fetched; }));

    engine->stop_background_refresh();
    EXPECT_FALSE(engine->is_background_refresh_active());
    fetched = gateway.run_fetches(1);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(gateway.run_fetches(1), fetched);
    engine->dispose();
}

TEST(UpdateEngine, DisposeFromOtherThreadDuringTick) {
    FakeGateway gateway;
    gateway.set_run(1, 10, "web", RunState::InProgress);
    UpdateEngineConfig config;
    config.polling_interval = 10ms;
    auto engine = UpdateEngine::create(gateway, config);

    std::atomic<int> calls{0};
    auto h = engine->subscribe_to_run_updates(1, 10, "web",
        [&calls](const PipelineRun&) { ++calls; });
    ASSERT_TRUE(h.is_ok());

    gateway.set_fetch_delay(50ms);
    ASSERT_TRUE(wait_for([&] { return gateway.run_fetches(1) >= 2; }));

    std::thread disposer([&engine] { engine->dispose(); });
    disposer.join();
    EXPECT_TRUE(engine->is_disposed());
    EXPECT_FALSE(engine->is_background_refresh_active());

    int delivered = calls.load();
    int fetched = gateway.run_fetches(1);
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(calls.load(), delivered);
    EXPECT_EQ(gateway.run_fetches(1), fetched);

    auto s = engine->stats();
    EXPECT_EQ(s.total_updates_received, 0u);
    EXPECT_EQ(s.error_count, 0u);
    EXPECT_FALSE(s.last_update_time.has_value());
}

TEST(UpdateEngine, FetchFanOutIsBounded) {
    FakeGateway gateway;
    const int run_count = static_cast<int>(MAX_FETCH_CONCURRENCY) * 3;
    for (int id = 1; id <= run_count; ++id) {
        gateway.set_run(id, 10, "web", RunState::InProgress);
    }
    auto engine = UpdateEngine::create(gateway, manual_config(static_cast<std::size_t>(run_count)));

    std::atomic<int> delivered{0};
    std::vector<SubscriptionHandle> handles;
    for (int id = 1; id <= run_count; ++id) {
        auto h = engine->subscribe_to_run_updates(id, 10, "web",
            [&delivered](const PipelineRun&) { ++delivered; });
        ASSERT_TRUE(h.is_ok());
        handles.push_back(std::move(h.value));
    }

    gateway.set_fetch_delay(10ms);
    delivered = 0;
    ASSERT_TRUE(engine->refresh_all_subscriptions().is_ok());

    EXPECT_EQ(delivered.load(), run_count);
    EXPECT_GT(gateway.max_in_flight(), 1);
    EXPECT_LE(gateway.max_in_flight(), static_cast<int>(MAX_FETCH_CONCURRENCY));
    EXPECT_EQ(engine->stats().error_count, 0u);
    engine->dispose();
}
