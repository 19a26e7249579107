#include "jobcore/job/PrintJob.hpp"
#include "jobcore/types/Error.hpp"
#include "logger/Logger.hpp"

#include <exception>
#include <utility>

namespace jobcore::job {
    PrintJob::PrintJob(std::string component)
            : component_(std::move(component)), listeners_(component_) {
    }

    bool PrintJob::registerListener(const std::shared_ptr<PrintJobListener> &listener) {
        return listeners_.add(listener);
    }

    bool PrintJob::unregisterListener(const std::shared_ptr<PrintJobListener> &listener) {
        if (!listeners_.remove(listener)) {
            Logger::logWarning("[" + component_ + "] Ignoring removal of a listener that is not registered");
            return false;
        }
        return true;
    }

    bool PrintJob::canProcess(const protocol::Protocol &protocol) const {
        return false;
    }

    void PrintJob::process(const std::shared_ptr<protocol::Protocol> &protocol, size_t position) {
        if (!protocol) {
            throw types::UnsupportedJobException("[" + component_ + "] No protocol given for " + getName());
        }
        if (!canProcess(*protocol)) {
            throw types::UnsupportedJobException("[" + component_ + "] Protocol cannot process " + getName());
        }

        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (state_ != JobState::Idle) {
                throw types::InvalidJobStateException(
                        "[" + component_ + "] Job " + getName() + " cannot be processed again, state is " +
                        jobStateToString(state_));
            }
            state_ = JobState::Processing;
            startTime_ = Clock::now();
            protocol_ = protocol;
        }

        Logger::logInfo("[" + component_ + "] Processing " + getName() + " from position " + std::to_string(position));
        processJobStarted();

        try {
            onProcess(position);
        } catch (const std::exception &e) {
            Logger::logError("[" + component_ + "] Failed to start " + getName() + ": " + e.what());
            processJobFailed();
            throw;
        }
    }

    void PrintJob::cancel() {
    }

    std::optional<std::string> PrintJob::getNext() {
        return std::nullopt;
    }

    std::optional<double> PrintJob::getProgress() const {
        return 0.0;
    }

    std::optional<double> PrintJob::getTimeEstimate(double lostTime) const {
        auto start = getStartTime();
        if (!start) {
            return std::nullopt;
        }

        auto progress = getProgress();
        if (!progress || *progress <= 0.0) {
            return std::nullopt;
        }

        double spent = std::chrono::duration<double>(Clock::now() - *start).count() - lostTime;
        return spent / *progress;
    }

    bool PrintJob::canGetContent() const {
        return false;
    }

    std::unique_ptr<ContentGenerator> PrintJob::getContentGenerator() const {
        return nullptr;
    }

    JobState PrintJob::getState() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return state_;
    }

    std::optional<PrintJob::Clock::time_point> PrintJob::getStartTime() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return startTime_;
    }

    std::shared_ptr<protocol::Protocol> PrintJob::getProtocol() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return protocol_.lock();
    }

    void PrintJob::processJobStarted() {
        notifyListeners("on_job_started", [this](PrintJobListener &listener) {
            listener.onJobStarted(*this);
        });
    }

    bool PrintJob::processJobDone() {
        if (!finish(JobState::Done)) {
            return false;
        }
        notifyListeners("on_job_done", [this](PrintJobListener &listener) {
            listener.onJobDone(*this);
        });
        return true;
    }

    bool PrintJob::processJobCancelled() {
        if (!finish(JobState::Cancelled)) {
            return false;
        }
        notifyListeners("on_job_cancelled", [this](PrintJobListener &listener) {
            listener.onJobCancelled(*this);
        });
        return true;
    }

    bool PrintJob::processJobFailed() {
        if (!finish(JobState::Failed)) {
            return false;
        }
        notifyListeners("on_job_failed", [this](PrintJobListener &listener) {
            listener.onJobFailed(*this);
        });
        return true;
    }

    bool PrintJob::finish(JobState terminal) {
        JobState previous;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (state_ != JobState::Processing) {
                return false;
            }
            previous = state_;
            state_ = terminal;
        }

        Logger::logInfo("[" + component_ + "] State change for " + getName() + ": " + jobStateToString(previous) +
                        " -> " + jobStateToString(terminal));

        try {
            releaseResources();
        } catch (const std::exception &e) {
            Logger::logError("[" + component_ + "] Failed to release resources of " + getName() + ": " + e.what());
        }
        return true;
    }

    events::DispatchResult PrintJob::notifyListeners(const std::string &eventName,
                                                     const std::function<void(PrintJobListener &)> &handler) {
        auto result = listeners_.notify(eventName, handler);
        if (!result.allDelivered()) {
            Logger::logWarning("[" + component_ + "] " + eventName + " failed on " + std::to_string(result.failed) +
                               " of " + std::to_string(result.delivered + result.failed) + " listeners");
        }
        return result;
    }
} // namespace jobcore::job
