#include <gtest/gtest.h>
#include "jobs/rocksdb_broker.h"
#include "utils/errors.h"
#include <filesystem>

using namespace strata::jobs;

class RocksDBBrokerTest : public ::testing::Test {
protected:
    const std::string db_path_ = "./data/test_broker";
    std::shared_ptr<RocksDBBroker> broker_;

    void SetUp() override {
        std::filesystem::remove_all(db_path_);
        broker_ = RocksDBBroker::connect(db_path_);
    }

    void TearDown() override {
        broker_.reset();
        std::filesystem::remove_all(db_path_);
    }

    static JobDescriptor job(const std::string& method) {
        JobDescriptor j;
        j.id = generateJobId();
        j.site = "site1";
        j.method = method;
        j.job_name = method;
        return j;
    }
};

TEST_F(RocksDBBrokerTest, PushPopInOrder) {
    auto a = broker_->push("b:default", job("a"), false);
    auto b = broker_->push("b:default", job("b"), false);

    auto queued = broker_->queuedJobs("b:default");
    ASSERT_EQ(queued.size(), 2u);
    EXPECT_EQ(queued[0].id, a);
    EXPECT_EQ(queued[1].id, b);
    EXPECT_EQ(broker_->status(a), JobStatus::Queued);

    auto first = broker_->pop({"b:default"}, "w1");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->id, a);
    EXPECT_EQ(broker_->status(a), JobStatus::Started);
    EXPECT_EQ(broker_->record(a)->at("worker"), "w1");
    EXPECT_EQ(broker_->queuedJobs("b:default").size(), 1u);
    EXPECT_EQ(broker_->runningJobs("b:default").size(), 1u);
}

TEST_F(RocksDBBrokerTest, AtFrontJumpsTheQueue) {
    broker_->push("b:default", job("back"), false);
    broker_->push("b:default", job("front1"), true);
    broker_->push("b:default", job("front2"), true);

    EXPECT_EQ(broker_->pop({"b:default"}, "w")->method, "front2");
    EXPECT_EQ(broker_->pop({"b:default"}, "w")->method, "front1");
    EXPECT_EQ(broker_->pop({"b:default"}, "w")->method, "back");
    EXPECT_FALSE(broker_->pop({"b:default"}, "w").has_value());
}

TEST_F(RocksDBBrokerTest, PopsQueuesInPriorityOrder) {
    broker_->push("b:long", job("slow"), false);
    broker_->push("b:short", job("quick"), false);
    EXPECT_EQ(broker_->pop({"b:short", "b:long"}, "w")->method, "quick");
    EXPECT_EQ(broker_->pop({"b:short", "b:long"}, "w")->method, "slow");
}

TEST_F(RocksDBBrokerTest, QueueNamesDoNotBleedIntoEachOther) {
    broker_->push("b:default", job("a"), false);
    broker_->push("b:default2", job("b"), false);
    EXPECT_EQ(broker_->queuedJobs("b:default").size(), 1u);
    EXPECT_EQ(broker_->queueNames(), (std::vector<std::string>{"b:default", "b:default2"}));
}

TEST_F(RocksDBBrokerTest, FinishFailAndPurge) {
    auto ok = broker_->push("b:default", job("ok"), false);
    auto bad = broker_->push("b:default", job("bad"), false);
    broker_->pop({"b:default"}, "w");
    broker_->pop({"b:default"}, "w");

    broker_->markFinished(ok, {{"rows", 3}});
    broker_->markFailed(bad, "boom");
    EXPECT_EQ(broker_->status(ok), JobStatus::Finished);
    EXPECT_EQ(broker_->record(ok)->at("result")["rows"], 3);
    EXPECT_EQ(broker_->record(bad)->at("error"), "boom");
    EXPECT_TRUE(broker_->runningJobs("b:default").empty());

    EXPECT_EQ(broker_->purgeExpired(std::chrono::hours(1), std::chrono::hours(1)), 0u);
    EXPECT_EQ(broker_->purgeExpired(std::chrono::seconds(0), std::chrono::hours(1)), 1u);
    EXPECT_FALSE(broker_->status(ok).has_value());
    EXPECT_TRUE(broker_->status(bad).has_value());

    EXPECT_THROW(broker_->markFinished("missing", nullptr), strata::JobNotFoundError);
}

TEST_F(RocksDBBrokerTest, StopRequests) {
    auto id = broker_->push("b:default", job("a"), false);
    EXPECT_FALSE(broker_->isStopRequested(id));
    broker_->requestStop(id);
    EXPECT_TRUE(broker_->isStopRequested(id));
    broker_->markFailed(id, "stopped");
    EXPECT_FALSE(broker_->isStopRequested(id));

    EXPECT_THROW(broker_->requestStop("missing"), strata::JobNotFoundError);
}

TEST_F(RocksDBBrokerTest, SurvivesReopen) {
    auto id = broker_->push("b:default", job("persisted"), false);
    broker_.reset();

    broker_ = RocksDBBroker::connect(db_path_);
    auto queued = broker_->queuedJobs("b:default");
    ASSERT_EQ(queued.size(), 1u);
    EXPECT_EQ(queued[0].id, id);

    auto next = broker_->push("b:default", job("after"), false);
    EXPECT_EQ(broker_->pop({"b:default"}, "w")->id, id);
    EXPECT_EQ(broker_->pop({"b:default"}, "w")->id, next);
}

TEST_F(RocksDBBrokerTest, ClosedBrokerIsUnavailable) {
    broker_->close();
    EXPECT_FALSE(broker_->isOpen());
    EXPECT_THROW(broker_->ping(), strata::BrokerUnavailableError);
    EXPECT_THROW(broker_->push("b:default", job("a"), false), strata::BrokerUnavailableError);
}
