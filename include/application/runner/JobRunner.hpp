#pragma once

#include "DryRunProtocol.hpp"
#include "jobcore/job/PrintJob.hpp"

#include <atomic>
#include <cstddef>
#include <memory>

namespace jobcore::application {

    /**
     * @brief Drives a streaming job: pulls lines with getNext() and hands them to the protocol.
     */
    class JobRunner {
    public:
        JobRunner(std::shared_ptr<job::PrintJob> job, std::shared_ptr<DryRunProtocol> protocol);

        /**
         * @return final state of the job.
         */
        job::JobState run(size_t position = 0);

        void requestCancel();

        size_t getLinesSent() const { return linesSent_; }

    private:
        std::shared_ptr<job::PrintJob> job_;
        std::shared_ptr<DryRunProtocol> protocol_;
        std::atomic<bool> cancelRequested_{false};
        std::atomic<size_t> linesSent_{0};

        void reportProgress() const;
    };

} // namespace jobcore::application
