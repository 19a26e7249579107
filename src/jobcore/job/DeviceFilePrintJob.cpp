#include "jobcore/job/DeviceFilePrintJob.hpp"
#include "jobcore/types/Error.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <utility>

namespace jobcore::job {
    DeviceFilePrintJob::DeviceFilePrintJob(std::string filename, std::chrono::milliseconds statusInterval)
            : PrintJob("DeviceFilePrintJob"),
              filename_(std::move(filename)),
              statusInterval_(statusInterval) {
    }

    DeviceFilePrintJob::~DeviceFilePrintJob() {
        active_ = false;
        std::unique_ptr<timer::RepeatedTimer> stopping;
        {
            std::lock_guard<std::mutex> lock(timerMutex_);
            stopping = std::move(statusTimer_);
        }
        if (stopping) {
            stopping->stop();
        }
    }

    bool DeviceFilePrintJob::canProcess(const protocol::Protocol &protocol) const {
        return protocol.supportsJob(protocol::JobVariant::DeviceFile) && protocol.supportsFileAware();
    }

    std::string DeviceFilePrintJob::getName() const {
        return filename_;
    }

    void DeviceFilePrintJob::onProcess(size_t position) {
        auto protocol = getProtocol();
        if (!protocol) {
            throw types::InvalidJobStateException("Protocol for " + filename_ + " is gone");
        }

        std::shared_ptr<DeviceFilePrintJob> self = weak_from_this().lock();
        if (!self) {
            throw types::InvalidJobStateException("DeviceFilePrintJob for " + filename_ +
                                                  " must be owned by a std::shared_ptr");
        }

        {
            std::lock_guard<std::mutex> lock(statusMutex_);
            lastPosition_ = position;
        }
        // set before starting so a done callback delivered synchronously is not overwritten
        active_ = true;
        protocol->registerListener(self);

        // ended while starting (e.g. cancelled from on_job_started): the release may have run
        // before anything was acquired
        if (getState() != JobState::Processing) {
            active_ = false;
            protocol->unregisterListener(self);
            Logger::logInfo("[" + component() + "] " + filename_ + " ended before the device print was started");
            return;
        }

        auto result = protocol->startFilePrint(filename_, position);
        if (!result.isSuccess()) {
            Logger::logError("[" + component() + "] Device refused to print " + filename_ + ": " + result.message);
            processJobFailed();
            return;
        }

        std::weak_ptr<DeviceFilePrintJob> weak = self;
        auto pollTimer = std::make_unique<timer::RepeatedTimer>(
                statusInterval_,
                [weak]() {
                    if (auto job = weak.lock()) {
                        job->queryStatus();
                    }
                },
                [weak]() {
                    auto job = weak.lock();
                    return job && job->queryActive();
                },
                "DeviceFilePrintJob:" + filename_);

        std::lock_guard<std::mutex> lock(timerMutex_);
        if (!active_ || getState() != JobState::Processing) {
            return;
        }
        statusTimer_ = std::move(pollTimer);
        statusTimer_->start();
        Logger::logInfo("[" + component() + "] Polling status of " + filename_ + " every " +
                        std::to_string(statusInterval_.count()) + "ms");
    }

    void DeviceFilePrintJob::releaseResources() {
        active_ = false;

        std::unique_ptr<timer::RepeatedTimer> stopping;
        {
            std::lock_guard<std::mutex> lock(timerMutex_);
            stopping = std::move(statusTimer_);
        }
        if (stopping) {
            stopping->stop();
        }

        auto protocol = getProtocol();
        auto self = weak_from_this().lock();
        if (protocol && self) {
            protocol->unregisterListener(self);
        }
    }

    std::optional<double> DeviceFilePrintJob::getProgress() const {
        std::lock_guard<std::mutex> lock(statusMutex_);
        if (!size_ || !lastPosition_ || *size_ == 0) {
            return std::nullopt;
        }
        return std::min(1.0, static_cast<double>(*lastPosition_) / static_cast<double>(*size_));
    }

    std::optional<size_t> DeviceFilePrintJob::getSize() const {
        std::lock_guard<std::mutex> lock(statusMutex_);
        return size_;
    }

    std::optional<size_t> DeviceFilePrintJob::getLastPosition() const {
        std::lock_guard<std::mutex> lock(statusMutex_);
        return lastPosition_;
    }

    void DeviceFilePrintJob::cancel() {
        if (processJobCancelled()) {
            Logger::logInfo("[" + component() + "] Cancelled " + filename_);
        }
    }

    void DeviceFilePrintJob::onProtocolFilePrintStarted(const std::string &name, size_t size) {
        if (name != filename_) {
            return;
        }
        std::lock_guard<std::mutex> lock(statusMutex_);
        size_ = size;
    }

    void DeviceFilePrintJob::onProtocolSdStatus(const std::string &name, size_t position, size_t total) {
        if (name != filename_) {
            return;
        }
        std::lock_guard<std::mutex> lock(statusMutex_);
        lastPosition_ = position;
        if (!size_ && total > 0) {
            size_ = total;
        }
    }

    void DeviceFilePrintJob::onProtocolFilePrintDone() {
        // only one file print can run on the device, so no name to match
        if (processJobDone()) {
            Logger::logInfo("[" + component() + "] Device finished " + filename_);
        }
    }

    void DeviceFilePrintJob::onProtocolFilePrintFailed(const std::string &reason) {
        if (processJobFailed()) {
            Logger::logError("[" + component() + "] Device aborted " + filename_ + ": " + reason);
        }
    }

    void DeviceFilePrintJob::queryStatus() {
        auto protocol = getProtocol();
        if (!protocol) {
            Logger::logWarning("[" + component() + "] Protocol gone, skipping status query for " + filename_);
            return;
        }

        auto result = protocol->getFilePrintStatus();
        if (!result.isSuccess()) {
            Logger::logWarning("[" + component() + "] Status query for " + filename_ + " failed: " + result.message);
        }
    }

    bool DeviceFilePrintJob::queryActive() const {
        return active_;
    }
} // namespace jobcore::job
