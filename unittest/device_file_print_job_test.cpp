#include <gtest/gtest.h>
#include "test_support.hpp"
#include "jobcore/job/DeviceFilePrintJob.hpp"
#include "jobcore/types/Error.hpp"

#include <chrono>
#include <memory>
#include <thread>

using jobcore::job::DeviceFilePrintJob;
using jobcore::job::JobState;
using jobcore::protocol::JobVariant;

class DeviceFilePrintJobTest : public ::testing::Test {
protected:
    void SetUp() override {
        protocol_ = std::make_shared<testsupport::FakeProtocol>(
                std::set<JobVariant>{JobVariant::DeviceFile}, false, true);
        listener_ = std::make_shared<testsupport::RecordingListener>();
    }

    std::shared_ptr<DeviceFilePrintJob> makeJob(std::chrono::milliseconds interval = std::chrono::milliseconds(5000)) {
        auto job = std::make_shared<DeviceFilePrintJob>("job.gcode", interval);
        job->registerListener(listener_);
        return job;
    }

    std::shared_ptr<testsupport::FakeProtocol> protocol_;
    std::shared_ptr<testsupport::RecordingListener> listener_;
};

TEST_F(DeviceFilePrintJobTest, DefaultsToTwoSecondPolling) {
    DeviceFilePrintJob job("job.gcode");

    EXPECT_EQ(job.getStatusInterval(), std::chrono::milliseconds(2000));
    EXPECT_EQ(job.getName(), "job.gcode");
    EXPECT_FALSE(job.isActive());
    EXPECT_FALSE(job.getProgress().has_value());
}

TEST_F(DeviceFilePrintJobTest, RequiresFileAwareProtocol) {
    auto job = makeJob();
    auto declaredOnly = std::make_shared<testsupport::FakeProtocol>(std::set<JobVariant>{JobVariant::DeviceFile});
    auto awareButNotDeclared = std::make_shared<testsupport::FakeProtocol>(
            std::set<JobVariant>{JobVariant::LocalFile}, false, true);

    EXPECT_TRUE(job->canProcess(*protocol_));
    EXPECT_FALSE(job->canProcess(*declaredOnly));
    EXPECT_FALSE(job->canProcess(*awareButNotDeclared));
    EXPECT_THROW(job->process(declaredOnly), jobcore::types::UnsupportedJobException);
    EXPECT_EQ(job->getState(), JobState::Idle);
}

TEST_F(DeviceFilePrintJobTest, ProcessStartsDevicePrintAtPosition) {
    auto job = makeJob();

    job->process(protocol_, 120);

    EXPECT_EQ(job->getState(), JobState::Processing);
    EXPECT_TRUE(job->isActive());
    EXPECT_EQ(protocol_->startedName(), "job.gcode");
    EXPECT_EQ(protocol_->startedPosition(), 120u);
    EXPECT_EQ(protocol_->listenerCount(), 1u);
    EXPECT_EQ(job->getLastPosition(), std::optional<size_t>(120));
    EXPECT_EQ(listener_->events(), (std::vector<std::string>{"started"}));
    job->cancel();
}

TEST_F(DeviceFilePrintJobTest, ProgressFromStatusCallbacks) {
    auto job = makeJob();
    job->process(protocol_);

    protocol_->firePrintStarted("job.gcode", 1000);
    protocol_->fireStatus("job.gcode", 250, 1000);

    ASSERT_TRUE(job->getProgress().has_value());
    EXPECT_DOUBLE_EQ(*job->getProgress(), 0.25);
    job->cancel();
}

TEST_F(DeviceFilePrintJobTest, StatusForOtherFileIsIgnored) {
    auto job = makeJob();
    job->process(protocol_);
    protocol_->firePrintStarted("job.gcode", 1000);
    protocol_->fireStatus("job.gcode", 100, 1000);

    protocol_->firePrintStarted("other.gcode", 50);
    protocol_->fireStatus("other.gcode", 900, 50);

    EXPECT_EQ(job->getSize(), std::optional<size_t>(1000));
    EXPECT_EQ(job->getLastPosition(), std::optional<size_t>(100));
    job->cancel();
}

TEST_F(DeviceFilePrintJobTest, StatusFillsUnknownSize) {
    auto job = makeJob();
    job->process(protocol_);
    EXPECT_FALSE(job->getProgress().has_value());

    protocol_->fireStatus("job.gcode", 400, 800);

    EXPECT_EQ(job->getSize(), std::optional<size_t>(800));
    EXPECT_DOUBLE_EQ(*job->getProgress(), 0.5);
    job->cancel();
}

TEST_F(DeviceFilePrintJobTest, DoneCallbackCompletesAndDetaches) {
    auto job = makeJob();
    job->process(protocol_);

    protocol_->firePrintDone();
    protocol_->firePrintDone();

    EXPECT_EQ(job->getState(), JobState::Done);
    EXPECT_FALSE(job->isActive());
    EXPECT_EQ(protocol_->listenerCount(), 0u);
    EXPECT_EQ(listener_->count("done"), 1u);
}

TEST_F(DeviceFilePrintJobTest, FailedCallbackFailsJob) {
    auto job = makeJob();
    job->process(protocol_);

    protocol_->firePrintFailed("thermal runaway");

    EXPECT_EQ(job->getState(), JobState::Failed);
    EXPECT_FALSE(job->isActive());
    EXPECT_EQ(protocol_->listenerCount(), 0u);
    EXPECT_EQ(listener_->events(), (std::vector<std::string>{"started", "failed"}));
}

TEST_F(DeviceFilePrintJobTest, PollsStatusWhileActive) {
    auto job = makeJob(std::chrono::milliseconds(10));
    job->process(protocol_);

    EXPECT_TRUE(testsupport::waitFor([&]() { return protocol_->statusQueries() >= 2; }));
    job->cancel();
}

TEST_F(DeviceFilePrintJobTest, CancelStopsPolling) {
    auto job = makeJob(std::chrono::milliseconds(10));
    job->process(protocol_);
    ASSERT_TRUE(testsupport::waitFor([&]() { return protocol_->statusQueries() >= 2; }));

    job->cancel();
    auto queriesAtCancel = protocol_->statusQueries();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));

    EXPECT_EQ(job->getState(), JobState::Cancelled);
    EXPECT_FALSE(job->isActive());
    EXPECT_EQ(protocol_->statusQueries(), queriesAtCancel);
    EXPECT_EQ(protocol_->listenerCount(), 0u);
    EXPECT_EQ(listener_->count("cancelled"), 1u);
}

TEST_F(DeviceFilePrintJobTest, RefusedStartFailsJob) {
    auto job = makeJob(std::chrono::milliseconds(10));
    protocol_->refuseStart();

    EXPECT_NO_THROW(job->process(protocol_));

    EXPECT_EQ(job->getState(), JobState::Failed);
    EXPECT_FALSE(job->isActive());
    EXPECT_EQ(protocol_->listenerCount(), 0u);
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    EXPECT_EQ(protocol_->statusQueries(), 0u);
}

TEST_F(DeviceFilePrintJobTest, DoneDuringStartIsNotOverwritten) {
    auto job = makeJob(std::chrono::milliseconds(10));
    protocol_->onStart([this]() { protocol_->firePrintDone(); });

    job->process(protocol_);

    EXPECT_EQ(job->getState(), JobState::Done);
    EXPECT_FALSE(job->isActive());
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    EXPECT_EQ(protocol_->statusQueries(), 0u);
    EXPECT_EQ(listener_->events(), (std::vector<std::string>{"started", "done"}));
}

TEST_F(DeviceFilePrintJobTest, JobNotOwnedBySharedPtrFails) {
    DeviceFilePrintJob job("job.gcode");

    EXPECT_THROW(job.process(protocol_), jobcore::types::InvalidJobStateException);
    EXPECT_EQ(job.getState(), JobState::Failed);
    EXPECT_EQ(protocol_->listenerCount(), 0u);
}

TEST_F(DeviceFilePrintJobTest, DestroyingActiveJobStopsPolling) {
    auto job = makeJob(std::chrono::milliseconds(10));
    job->process(protocol_);
    ASSERT_TRUE(testsupport::waitFor([&]() { return protocol_->statusQueries() >= 1; }));

    job.reset();
    auto queries = protocol_->statusQueries();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_LE(protocol_->statusQueries(), queries + 1);
}

TEST_F(DeviceFilePrintJobTest, CancelDuringStartDoesNotStartDevicePrint) {
    auto job = makeJob(std::chrono::milliseconds(10));
    auto canceller = std::make_shared<testsupport::CancelOnStartListener>();
    job->registerListener(canceller);

    EXPECT_NO_THROW(job->process(protocol_));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));

    EXPECT_EQ(job->getState(), JobState::Cancelled);
    EXPECT_FALSE(job->isActive());
    EXPECT_TRUE(protocol_->startedName().empty());
    EXPECT_EQ(protocol_->listenerCount(), 0u);
    EXPECT_EQ(protocol_->statusQueries(), 0u);
    EXPECT_EQ(listener_->events(), (std::vector<std::string>{"started", "cancelled"}));
}

TEST_F(DeviceFilePrintJobTest, CancelFromAnotherThreadWhileStartingLeavesNothingRunning) {
    for (int attempt = 0; attempt < 20; ++attempt) {
        auto protocol = std::make_shared<testsupport::FakeProtocol>(
                std::set<JobVariant>{JobVariant::DeviceFile}, false, true);
        auto job = std::make_shared<DeviceFilePrintJob>("job.gcode", std::chrono::milliseconds(5));

        std::thread canceller([&job]() {
            testsupport::waitFor([&job]() { return job->getState() != JobState::Idle; });
            job->cancel();
        });
        job->process(protocol);
        canceller.join();

        EXPECT_EQ(job->getState(), JobState::Cancelled);
        EXPECT_FALSE(job->isActive());
        EXPECT_EQ(protocol->listenerCount(), 0u);
        auto queries = protocol->statusQueries();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        EXPECT_EQ(protocol->statusQueries(), queries) << "attempt " << attempt;
    }
}
