#include <gtest/gtest.h>
#include "worker.h"
#include "fakes.h"
#include "worker_identity.h"
#include <algorithm>
#include <functional>
#include <memory>

namespace contestrun {
namespace {

using fakes::FakeContainerRuntime;
using fakes::FakeJobQueue;
using fakes::FakeRegistry;

bool eventually(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

class WorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        identity = WorkerIdentity::generate();
        ASSERT_NE(identity, nullptr);
        config.concurrency = 2;
        config.poll_interval_ms = 10;
        config.heartbeat_interval_ms = 20;
        config.max_execution_time_ms = 2000;
        config.grace_period_ms = 200;
        config.shutdown_timeout_ms = 2000;
    }

    std::unique_ptr<Worker> make_worker() {
        WorkerContext context{config, "runner-test", *identity, runtime, queue, registry, active};
        return std::make_unique<Worker>(context);
    }

    static SubmissionJob python_job(const std::string& id) {
        SubmissionJob job;
        job.submission_id = id;
        job.language_name = "python";
        job.language = Language::PYTHON;
        job.source = "print(1+1)";
        return job;
    }

    std::unique_ptr<WorkerIdentity> identity;
    WorkerConfig config;
    FakeContainerRuntime runtime;
    FakeJobQueue queue;
    FakeRegistry registry;
    ActiveSandboxes active;
};

TEST_F(WorkerTest, RegistrationCarriesKeyLanguagesAndCapacity) {
    auto worker = make_worker();

    worker->heartbeat_tick();

    ASSERT_TRUE(worker->registered());
    auto registrations = registry.registrations();
    ASSERT_EQ(registrations.size(), 1u);
    EXPECT_EQ(registrations[0].worker_id, "runner-test");
    EXPECT_EQ(registrations[0].public_key_pem, identity->public_key_pem());
    EXPECT_EQ(registrations[0].capabilities.size(), supported_languages().size());
    EXPECT_EQ(registrations[0].max_concurrency, 2);
}

TEST_F(WorkerTest, FailedRegistrationRetriedOnNextTick) {
    registry.set_register_failures(1);
    auto worker = make_worker();

    worker->heartbeat_tick();
    EXPECT_FALSE(worker->registered());
    EXPECT_TRUE(registry.heartbeats().empty()) << "No heartbeats before registration";

    worker->heartbeat_tick();
    EXPECT_TRUE(worker->registered());
    EXPECT_EQ(registry.register_calls(), 2);
    EXPECT_TRUE(registry.heartbeats().empty());

    worker->heartbeat_tick();
    ASSERT_EQ(registry.heartbeats().size(), 1u);
    EXPECT_FALSE(registry.heartbeats()[0].draining);
}

TEST_F(WorkerTest, HeartbeatFailureIsNotFatal) {
    registry.set_fail_heartbeat(true);
    auto worker = make_worker();
    worker->heartbeat_tick();

    EXPECT_NO_THROW(worker->heartbeat_tick());
    EXPECT_TRUE(worker->registered());
}

TEST_F(WorkerTest, RunsQueuedJobsToSignedResults) {
    runtime.script.stdout_data = "2\n";
    queue.push(python_job("s1"));
    queue.push(python_job("s2"));
    auto worker = make_worker();

    worker->start();
    ASSERT_TRUE(queue.wait_for_reports(2, std::chrono::seconds(5)));
    EXPECT_TRUE(worker->shutdown());

    for (const auto& result : queue.reported()) {
        EXPECT_EQ(result.result.verdict, Verdict::ACCEPTED);
        EXPECT_EQ(result.worker_id, "runner-test");
        EXPECT_TRUE(WorkerIdentity::verify(result.result.canonical_json(), result.signature,
                                           identity->public_key_base64()));
    }
    EXPECT_EQ(runtime.live_count(), 0u);
}

TEST_F(WorkerTest, ShutdownAnnouncesDraining) {
    auto worker = make_worker();
    worker->start();
    ASSERT_TRUE(eventually([&]() { return !registry.heartbeats().empty(); }));

    worker->shutdown();

    EXPECT_TRUE(worker->draining());
    auto heartbeats = registry.heartbeats();
    ASSERT_FALSE(heartbeats.empty());
    EXPECT_TRUE(heartbeats.back().draining);
}

TEST_F(WorkerTest, ShutdownRemovesOwnedContainersOnly) {
    std::string leaked = runtime.plant({{"contestrun.worker", "runner-test"}});
    std::string foreign = runtime.plant({{"contestrun.worker", "runner-other"}});
    std::string tracked = runtime.plant({});
    active.add(tracked, "sub-9");
    auto worker = make_worker();

    EXPECT_TRUE(worker->shutdown());

    EXPECT_EQ(runtime.live_count(), 1u) << "Only the other worker's container survives";
    auto owned = runtime.list_by_label("contestrun.worker=runner-test");
    EXPECT_EQ(std::count(owned.begin(), owned.end(), leaked), 0);
    EXPECT_EQ(runtime.list_by_label("contestrun.worker=runner-other"),
              std::vector<std::string>{foreign});
    EXPECT_EQ(active.size(), 0u);
}

TEST_F(WorkerTest, ShutdownIsIdempotent) {
    runtime.plant({{"contestrun.worker", "runner-test"}});
    auto worker = make_worker();

    EXPECT_TRUE(worker->shutdown());
    int kills = runtime.kill_calls();
    EXPECT_TRUE(worker->shutdown());

    EXPECT_EQ(runtime.kill_calls(), kills);
}

TEST_F(WorkerTest, ShutdownKillsRunningJobAndWaitsForIt) {
    runtime.script.hang = true;
    queue.push(python_job("s1"));
    auto worker = make_worker();
    worker->start();
    ASSERT_TRUE(eventually([&]() { return runtime.live_count() == 1; }));

    EXPECT_TRUE(worker->shutdown());

    EXPECT_EQ(runtime.live_count(), 0u);
    EXPECT_EQ(active.size(), 0u);
    auto reported = queue.reported();
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].result.verdict, Verdict::SYSTEM_ERROR)
        << "A sandbox the worker reclaimed is not a user-code failure";
    EXPECT_NE(reported[0].result.error.find("reclaimed"), std::string::npos);
    EXPECT_EQ(worker->active_jobs(), 0u);
}

TEST_F(WorkerTest, ShutdownTimesOutOnStuckJob) {
    config.max_execution_time_ms = 300;
    config.grace_period_ms = 100;
    config.shutdown_timeout_ms = 50;
    runtime.script.hang = true;
    runtime.script.ignore_kill = true;
    runtime.script.fail_on = "remove";
    queue.push(python_job("s1"));
    auto worker = make_worker();
    worker->start();
    ASSERT_TRUE(eventually([&]() { return runtime.live_count() == 1; }));

    EXPECT_FALSE(worker->shutdown());
    EXPECT_FALSE(worker->shutdown()) << "Repeated shutdown reports the same outcome";
}

} // namespace
} // namespace contestrun
