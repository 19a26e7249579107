#include "jobcore/job/tracking/JobTracker.hpp"
#include "jobcore/job/PrintJob.hpp"
#include "logger/Logger.hpp"

#include <iomanip>
#include <sstream>

namespace jobcore::jobs {
    void JobTracker::onJobStarted(job::PrintJob &job) {
        record(job, job::JobState::Processing, &Statistics::startedJobs);
    }

    void JobTracker::onJobDone(job::PrintJob &job) {
        record(job, job::JobState::Done, &Statistics::completedJobs);
    }

    void JobTracker::onJobCancelled(job::PrintJob &job) {
        record(job, job::JobState::Cancelled, &Statistics::cancelledJobs);
    }

    void JobTracker::onJobFailed(job::PrintJob &job) {
        record(job, job::JobState::Failed, &Statistics::failedJobs);
    }

    void JobTracker::record(job::PrintJob &job, job::JobState state, size_t Statistics::*counter) {
        std::string name = job.getName();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++(stats_.*counter);
            lastJobName_ = name;
            lastJobState_ = state;
        }

        std::ostringstream message;
        message << "[JobTracker] " << name << " -> " << job::jobStateToString(state);
        if (auto progress = job.getProgress()) {
            message << " (" << std::fixed << std::setprecision(1) << *progress * 100.0 << "%)";
        }
        Logger::logInfo(message.str());
    }

    JobTracker::Statistics JobTracker::getStatistics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    std::optional<std::string> JobTracker::getLastJobName() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastJobName_;
    }

    std::optional<job::JobState> JobTracker::getLastJobState() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastJobState_;
    }

    bool JobTracker::hasActiveJob() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastJobState_ && *lastJobState_ == job::JobState::Processing;
    }
} // namespace jobcore::jobs
