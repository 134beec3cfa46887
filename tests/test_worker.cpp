#include <gtest/gtest.h>
#include "jobs/worker.h"
#include "utils/errors.h"
#include "fake_jobs.h"
#include <atomic>
#include <thread>
#include <unistd.h>

using namespace strata::jobs;
using nlohmann::json;
using strata::test::InMemoryBroker;
using strata::test::RecordingSessionFactory;

class WorkerTest : public ::testing::Test {
protected:
    strata::config::StrataConfig config = [] {
        strata::config::StrataConfig c;
        c.bench_id = "bench";
        c.workers["reports"].timeout = 900;
        return c;
    }();
    QueueRegistry queues{config};
    std::shared_ptr<InMemoryBroker> broker = std::make_shared<InMemoryBroker>();
    BrokerConnection connection{[this] { return broker; }, 1, std::chrono::milliseconds(1),
                                [](std::chrono::milliseconds) {}};
    MethodRegistry methods;
    RecordingSessionFactory sessions;
    std::unique_ptr<JobExecutor> executor;

    std::mutex terminate_mutex;
    std::vector<std::string> terminations;
    std::atomic<bool> terminated{false};

    void SetUp() override {
        methods.add("echo", [](const json& kwargs) { return kwargs; });
        methods.add("crash", [](const json&) -> json { throw std::runtime_error("out of paper"); });
        methods.add("wait_for_kill", [this](const json&) -> json {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (!terminated.load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return "survived";
        });

        RetryPolicy policy;
        policy.sleeper = [](std::chrono::seconds) {};
        executor = std::make_unique<JobExecutor>(methods, sessions, policy);
    }

    WorkerOptions options(bool burst = true) {
        WorkerOptions o;
        o.burst = burst;
        o.poll_interval = std::chrono::milliseconds(10);
        o.watchdog_interval = std::chrono::milliseconds(5);
        o.terminate = [this](const JobDescriptor& job, const std::string& reason) {
            std::lock_guard<std::mutex> lock(terminate_mutex);
            terminations.push_back(job.id + ": " + reason);
            terminated.store(true);
        };
        return o;
    }

    std::string push(const std::string& queue, const std::string& method, int timeout = 300) {
        JobDescriptor job;
        job.id = generateJobId();
        job.site = "site1";
        job.method = method;
        job.job_name = method;
        job.queue = queue;
        job.timeout = timeout;
        job.kwargs = {{"n", 1}};
        return broker->push(queues.qualifiedName(queue), job, false);
    }
};

TEST_F(WorkerTest, NameCarriesHostPidAndSingleQueue) {
    auto o = options();
    o.queues = std::vector<std::string>{"reports"};
    Worker single(queues, connection, *executor, o);

    const std::string suffix = "." + std::to_string(::getpid()) + ".reports";
    const auto& name = single.name();
    ASSERT_GT(name.size(), suffix.size() + 33);
    EXPECT_EQ(name.substr(name.size() - suffix.size()), suffix);
    EXPECT_EQ(name[32], '.');
    EXPECT_EQ(single.physicalQueues(), std::vector<std::string>{"bench:reports"});

    Worker all(queues, connection, *executor, options());
    const std::string pid_suffix = "." + std::to_string(::getpid());
    EXPECT_EQ(all.name().substr(all.name().size() - pid_suffix.size()), pid_suffix);
    EXPECT_EQ(all.physicalQueues(),
              (std::vector<std::string>{"bench:default", "bench:short", "bench:long", "bench:reports"}));
    EXPECT_NE(single.name(), all.name());
}

TEST_F(WorkerTest, EmptyQueueListMeansAllQueues) {
    auto o = options();
    o.queues = std::vector<std::string>{};
    Worker worker(queues, connection, *executor, o);
    EXPECT_EQ(worker.physicalQueues().size(), 4u);

    o.queues = std::vector<std::string>{"urgent"};
    EXPECT_THROW((void)Worker(queues, connection, *executor, o), strata::ValidationError);
}

TEST_F(WorkerTest, ProcessOneOnEmptyQueues) {
    Worker worker(queues, connection, *executor, options());
    EXPECT_FALSE(worker.processOne());
}

TEST_F(WorkerTest, BurstDrainsAndRecordsOutcomes) {
    auto ok = push("default", "echo");
    auto bad = push("short", "crash");
    Worker worker(queues, connection, *executor, options());

    EXPECT_EQ(worker.work(), 2u);

    auto finished = broker->record(ok);
    EXPECT_EQ(finished.status, JobStatus::Finished);
    EXPECT_EQ(finished.result["n"], 1);
    EXPECT_EQ(finished.worker, worker.name());

    auto failed = broker->record(bad);
    EXPECT_EQ(failed.status, JobStatus::Failed);
    EXPECT_EQ(failed.error, "out of paper");

    ASSERT_EQ(sessions.log.errors.size(), 1u);
    EXPECT_EQ(sessions.log.errors[0].first, "crash");
    EXPECT_GE(broker->purges, 1u);
    EXPECT_TRUE(terminations.empty());
}

TEST_F(WorkerTest, ListensOnlyToItsQueues) {
    push("long", "echo");
    auto o = options();
    o.queues = std::vector<std::string>{"default", "short"};
    Worker worker(queues, connection, *executor, o);
    EXPECT_EQ(worker.work(), 0u);
    EXPECT_EQ(broker->queuedJobs("bench:long").size(), 1u);
}

TEST_F(WorkerTest, StopRequestTerminatesRunningJob) {
    auto id = push("default", "wait_for_kill");
    broker->stop_everything = true;
    Worker worker(queues, connection, *executor, options());

    EXPECT_TRUE(worker.processOne());
    ASSERT_EQ(terminations.size(), 1u);
    EXPECT_EQ(terminations[0], id + ": stop requested");
}

TEST_F(WorkerTest, TimeoutTerminatesRunningJob) {
    auto id = push("default", "wait_for_kill", 1);
    Worker worker(queues, connection, *executor, options());

    EXPECT_TRUE(worker.processOne());
    ASSERT_EQ(terminations.size(), 1u);
    EXPECT_EQ(terminations[0], id + ": timeout of 1s exceeded");
}

TEST_F(WorkerTest, StopEndsTheLoop) {
    Worker worker(queues, connection, *executor, options(false));
    size_t processed = 99;
    std::thread runner([&] { processed = worker.work(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    worker.stop();
    runner.join();

    EXPECT_TRUE(worker.isStopping());
    EXPECT_EQ(processed, 0u);
    EXPECT_GE(broker->purges, 2u);
}
