#include "application/runner/JobRunner.hpp"
#include "jobcore/types/Error.hpp"
#include "logger/Logger.hpp"

#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

namespace jobcore::application {
    namespace {
        constexpr size_t PROGRESS_REPORT_EVERY = 500;
    }

    JobRunner::JobRunner(std::shared_ptr<job::PrintJob> job, std::shared_ptr<DryRunProtocol> protocol)
            : job_(std::move(job)), protocol_(std::move(protocol)) {
    }

    job::JobState JobRunner::run(size_t position) {
        try {
            job_->process(protocol_, position);
        } catch (const types::JobException &e) {
            Logger::logError("[JobRunner] Cannot start " + job_->getName() + ": " + e.what());
            return job_->getState();
        }

        while (!cancelRequested_) {
            std::optional<std::string> line;
            try {
                line = job_->getNext();
            } catch (const types::JobException &e) {
                Logger::logError("[JobRunner] Streaming " + job_->getName() + " failed: " + e.what());
                job_->processJobFailed();
                break;
            }

            if (!line) {
                break;
            }

            protocol_->send(*line);
            if (++linesSent_ % PROGRESS_REPORT_EVERY == 0) {
                reportProgress();
            }
        }

        if (cancelRequested_) {
            job_->cancel();
        }

        Logger::logInfo("[JobRunner] " + job_->getName() + " finished as " + job::jobStateToString(job_->getState()) +
                        " after " + std::to_string(linesSent_) + " lines");
        return job_->getState();
    }

    void JobRunner::requestCancel() {
        cancelRequested_ = true;
    }

    void JobRunner::reportProgress() const {
        std::ostringstream message;
        message << "[JobRunner] " << linesSent_ << " lines sent";
        if (auto progress = job_->getProgress()) {
            message << ", " << std::fixed << std::setprecision(1) << *progress * 100.0 << "%";
        }
        if (auto estimate = job_->getTimeEstimate()) {
            message << ", estimated total " << std::fixed << std::setprecision(0) << *estimate << "s";
        }
        Logger::logInfo(message.str());
    }
} // namespace jobcore::application
