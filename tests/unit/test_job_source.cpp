#include <gtest/gtest.h>
#include "job_source.h"
#include "active_sandboxes.h"
#include "fakes.h"
#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>

namespace contestrun {
namespace {

using fakes::FakeJobQueue;

SubmissionJob make_job(const std::string& id) {
    SubmissionJob job;
    job.submission_id = id;
    job.language_name = "python";
    job.language = Language::PYTHON;
    job.source = "print(1)";
    return job;
}

SignedResult accepted(const SubmissionJob& job) {
    SignedResult result;
    result.result.submission_id = job.submission_id;
    result.result.verdict = Verdict::ACCEPTED;
    result.worker_id = "runner-test";
    result.signature = "c2ln";
    return result;
}

class JobSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.concurrency = 2;
        options.poll_interval = std::chrono::milliseconds(10);
        options.report_attempts = 3;
        options.report_backoff = std::chrono::milliseconds(1);
        gate_future = gate.get_future().share();
    }

    // Runner that blocks until the gate opens
    JobRunner gated_runner() {
        std::shared_future<void> released = gate_future;
        std::atomic<int>* counter = &runs;
        return [released, counter](const SubmissionJob& job) {
            counter->fetch_add(1);
            released.wait();
            return accepted(job);
        };
    }

    std::unique_ptr<JobSourceAdapter> make_adapter(JobRunner runner) {
        return std::make_unique<JobSourceAdapter>(queue, std::move(runner), active, options);
    }

    FakeJobQueue queue;
    ActiveSandboxes active;
    JobSourceAdapter::Options options;
    std::promise<void> gate;
    std::shared_future<void> gate_future;
    std::atomic<int> runs{0};
};

TEST_F(JobSourceTest, DispatchedJobIsRunAndReported) {
    queue.push(make_job("s1"));
    auto adapter = make_adapter([](const SubmissionJob& job) { return accepted(job); });

    EXPECT_TRUE(adapter->poll_once());

    ASSERT_TRUE(queue.wait_for_reports(1, std::chrono::seconds(5)));
    EXPECT_EQ(queue.reported()[0].result.submission_id, "s1");
    EXPECT_TRUE(adapter->wait_idle(std::chrono::seconds(5)));
    EXPECT_EQ(adapter->in_flight(), 0u);
}

TEST_F(JobSourceTest, EmptyQueueDispatchesNothing) {
    auto adapter = make_adapter([](const SubmissionJob& job) { return accepted(job); });

    EXPECT_FALSE(adapter->poll_once());
    EXPECT_EQ(queue.fetch_calls(), 1);
    EXPECT_EQ(adapter->backoff_ticks(), 0);
}

TEST_F(JobSourceTest, NeverDequeuesWithoutFreeSlot) {
    for (const char* id : {"s1", "s2", "s3"}) {
        queue.push(make_job(id));
    }
    auto adapter = make_adapter(gated_runner());

    EXPECT_TRUE(adapter->poll_once());
    EXPECT_TRUE(adapter->poll_once());
    EXPECT_FALSE(adapter->poll_once()) << "Both slots are busy";

    EXPECT_EQ(queue.fetch_calls(), 2);
    EXPECT_EQ(queue.pending(), 1u) << "Third job must stay on the queue";
    EXPECT_EQ(adapter->in_flight(), 2u);

    gate.set_value();
    EXPECT_TRUE(adapter->wait_idle(std::chrono::seconds(5)));
    EXPECT_TRUE(adapter->poll_once()) << "Slot freed, third job pulled";
    EXPECT_TRUE(adapter->wait_idle(std::chrono::seconds(5)));
}

TEST_F(JobSourceTest, ProvisionedSandboxesCountAgainstCapacity) {
    queue.push(make_job("s1"));
    active.add("c1", "other-1");
    active.add("c2", "other-2");
    auto adapter = make_adapter([](const SubmissionJob& job) { return accepted(job); });

    EXPECT_EQ(adapter->available_slots(), 0);
    EXPECT_FALSE(adapter->poll_once());
    EXPECT_EQ(queue.fetch_calls(), 0);

    active.remove("c1");
    EXPECT_TRUE(adapter->poll_once());
    EXPECT_TRUE(adapter->wait_idle(std::chrono::seconds(5)));
}

TEST_F(JobSourceTest, QueueFailureBacksOffExponentially) {
    queue.set_fail_fetch(true);
    auto adapter = make_adapter([](const SubmissionJob& job) { return accepted(job); });

    // Failure, then one skipped tick
    adapter->poll_once();
    EXPECT_EQ(adapter->backoff_ticks(), 1);
    adapter->poll_once();
    EXPECT_EQ(queue.fetch_calls(), 1);

    // Failure, then two skipped ticks
    adapter->poll_once();
    EXPECT_EQ(adapter->backoff_ticks(), 2);
    adapter->poll_once();
    adapter->poll_once();
    EXPECT_EQ(queue.fetch_calls(), 2);

    adapter->poll_once();
    EXPECT_EQ(adapter->backoff_ticks(), 4);
    EXPECT_EQ(queue.fetch_calls(), 3);

    // Recovery resets the backoff
    queue.set_fail_fetch(false);
    queue.push(make_job("s1"));
    for (int i = 0; i < 4; i++) {
        EXPECT_FALSE(adapter->poll_once());
    }
    EXPECT_TRUE(adapter->poll_once());
    EXPECT_EQ(adapter->backoff_ticks(), 0);
    EXPECT_TRUE(adapter->wait_idle(std::chrono::seconds(5)));
}

TEST_F(JobSourceTest, BackoffIsCapped) {
    queue.set_fail_fetch(true);
    auto adapter = make_adapter([](const SubmissionJob& job) { return accepted(job); });

    for (int i = 0; i < 200; i++) {
        adapter->poll_once();
    }

    EXPECT_EQ(adapter->backoff_ticks(), MAX_POLL_BACKOFF_TICKS);
}

TEST_F(JobSourceTest, ReportRetriedUntilAccepted) {
    queue.push(make_job("s1"));
    queue.set_report_failures(2);
    auto adapter = make_adapter([](const SubmissionJob& job) { return accepted(job); });

    adapter->poll_once();

    ASSERT_TRUE(adapter->wait_idle(std::chrono::seconds(5)));
    EXPECT_EQ(queue.report_calls(), 3);
    ASSERT_EQ(queue.reported().size(), 1u);
}

TEST_F(JobSourceTest, ReportGivesUpAfterConfiguredAttempts) {
    queue.push(make_job("s1"));
    queue.set_report_failures(10);
    auto adapter = make_adapter([](const SubmissionJob& job) { return accepted(job); });

    adapter->poll_once();

    ASSERT_TRUE(adapter->wait_idle(std::chrono::seconds(5)));
    EXPECT_EQ(queue.report_calls(), 3);
    EXPECT_TRUE(queue.reported().empty());
}

TEST_F(JobSourceTest, FailedRunnerReportsNothing) {
    queue.push(make_job("s1"));
    auto adapter = make_adapter([](const SubmissionJob&) -> SignedResult {
        throw std::runtime_error("signing key unavailable");
    });

    adapter->poll_once();

    ASSERT_TRUE(adapter->wait_idle(std::chrono::seconds(5)));
    EXPECT_EQ(queue.report_calls(), 0);
}

TEST_F(JobSourceTest, PollThreadDrainsQueueAndStopHaltsIt) {
    for (const char* id : {"s1", "s2", "s3", "s4"}) {
        queue.push(make_job(id));
    }
    auto adapter = make_adapter([](const SubmissionJob& job) { return accepted(job); });

    adapter->start();
    ASSERT_TRUE(queue.wait_for_reports(4, std::chrono::seconds(5)));
    adapter->stop();
    adapter->stop();

    int calls = queue.fetch_calls();
    queue.push(make_job("s5"));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(queue.fetch_calls(), calls) << "No polling after stop";
    EXPECT_EQ(queue.pending(), 1u);
}

TEST_F(JobSourceTest, StopLetsInFlightJobsFinish) {
    queue.push(make_job("s1"));
    auto adapter = make_adapter(gated_runner());
    adapter->poll_once();

    adapter->stop();
    EXPECT_FALSE(adapter->wait_idle(std::chrono::milliseconds(20)));

    gate.set_value();
    EXPECT_TRUE(adapter->wait_idle(std::chrono::seconds(5)));
    EXPECT_EQ(queue.reported().size(), 1u);
}

} // namespace
} // namespace contestrun
