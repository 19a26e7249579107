#pragma once

#include "PrintJobState.hpp"
#include "PrintJobListener.hpp"
#include "ContentGenerator.hpp"
#include "jobcore/events/ListenerRegistry.hpp"
#include "jobcore/protocol/Protocol.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace jobcore::job {

/**
 * @brief A single unit of work streamed to a device through a protocol.
 *
 * Lifecycle is Idle -> Processing -> {Done | Cancelled | Failed}. A job is processed at
 * most once; terminal transitions happen exactly once, and the thread that wins the
 * transition releases the job's resources before the listeners are notified.
 */
    class PrintJob {
    public:
        using Clock = std::chrono::steady_clock;

        virtual ~PrintJob() = default;

        PrintJob(const PrintJob &) = delete;

        PrintJob &operator=(const PrintJob &) = delete;

        bool registerListener(const std::shared_ptr<PrintJobListener> &listener);

        /**
         * @return false (and a warning) when the listener was not registered.
         */
        bool unregisterListener(const std::shared_ptr<PrintJobListener> &listener);

        virtual bool canProcess(const protocol::Protocol &protocol) const;

        /**
         * @brief Binds the protocol, records the start time and starts the job.
         * @param position resume offset, meaning depends on the job variant.
         * @throws types::UnsupportedJobException if canProcess(protocol) is false.
         * @throws types::InvalidJobStateException if the job was already processed.
         */
        void process(const std::shared_ptr<protocol::Protocol> &protocol, size_t position = 0);

        virtual void cancel();

        virtual std::optional<std::string> getNext();

        virtual std::optional<double> getProgress() const;

        /**
         * @brief Linear extrapolation of the total duration in seconds from the progress so far.
         * @param lostTime seconds to discount from the elapsed time (e.g. spent paused).
         */
        std::optional<double> getTimeEstimate(double lostTime = 0.0) const;

        virtual bool canGetContent() const;

        virtual std::unique_ptr<ContentGenerator> getContentGenerator() const;

        virtual std::string getName() const = 0;

        JobState getState() const;

        std::optional<Clock::time_point> getStartTime() const;

        void processJobStarted();

        bool processJobDone();

        bool processJobCancelled();

        bool processJobFailed();

    protected:
        explicit PrintJob(std::string component);

        virtual void onProcess(size_t position) = 0;

        /**
         * @brief Called once, by the thread that moved the job into a terminal state.
         */
        virtual void releaseResources() {}

        std::shared_ptr<protocol::Protocol> getProtocol() const;

        const std::string &component() const { return component_; }

    private:
        std::string component_;
        mutable std::mutex stateMutex_;
        JobState state_ = JobState::Idle;
        std::optional<Clock::time_point> startTime_;
        std::weak_ptr<protocol::Protocol> protocol_;
        events::ListenerRegistry<PrintJobListener> listeners_;

        bool finish(JobState terminal);

        events::DispatchResult notifyListeners(const std::string &eventName,
                                               const std::function<void(PrintJobListener &)> &handler);
    };

} // namespace jobcore::job
