#pragma once

#include "jobcore/job/PrintJobListener.hpp"
#include "jobcore/job/PrintJobState.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace jobcore::jobs {

    /**
     * @brief Listener that logs job transitions and keeps lifecycle counters.
     */
    class JobTracker : public job::PrintJobListener {
    public:
        struct Statistics {
            size_t startedJobs = 0;
            size_t completedJobs = 0;
            size_t cancelledJobs = 0;
            size_t failedJobs = 0;
        };

        JobTracker() = default;

        void onJobStarted(job::PrintJob &job) override;

        void onJobDone(job::PrintJob &job) override;

        void onJobCancelled(job::PrintJob &job) override;

        void onJobFailed(job::PrintJob &job) override;

        Statistics getStatistics() const;

        std::optional<std::string> getLastJobName() const;

        std::optional<job::JobState> getLastJobState() const;

        bool hasActiveJob() const;

    private:
        mutable std::mutex mutex_;
        Statistics stats_;
        std::optional<std::string> lastJobName_;
        std::optional<job::JobState> lastJobState_;

        void record(job::PrintJob &job, job::JobState state, size_t Statistics::*counter);
    };

} // namespace jobcore::jobs
