#pragma once

#include "PrintJob.hpp"
#include "jobcore/protocol/FileAwareProtocolListener.hpp"
#include "jobcore/timer/RepeatedTimer.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace jobcore::job {

/**
 * @brief Prints a file already stored on the device.
 *
 * The device runs the print itself; the job starts it through the protocol, listens to
 * the protocol's file callbacks and polls the print status on a repeating timer while
 * active. Must be owned by a std::shared_ptr since it registers itself on the protocol.
 */
    class DeviceFilePrintJob : public PrintJob,
                               public protocol::FileAwareProtocolListener,
                               public std::enable_shared_from_this<DeviceFilePrintJob> {
    public:
        static constexpr std::chrono::milliseconds DEFAULT_STATUS_INTERVAL{2000};

        explicit DeviceFilePrintJob(std::string filename,
                                    std::chrono::milliseconds statusInterval = DEFAULT_STATUS_INTERVAL);

        ~DeviceFilePrintJob() override;

        bool canProcess(const protocol::Protocol &protocol) const override;

        /**
         * @return lastPosition / size, or std::nullopt until both are known.
         */
        std::optional<double> getProgress() const override;

        void cancel() override;

        std::string getName() const override;

        const std::string &getFilename() const { return filename_; }

        std::chrono::milliseconds getStatusInterval() const { return statusInterval_; }

        bool isActive() const { return active_; }

        std::optional<size_t> getSize() const;

        std::optional<size_t> getLastPosition() const;

        void onProtocolFilePrintStarted(const std::string &name, size_t size) override;

        void onProtocolSdStatus(const std::string &name, size_t position, size_t total) override;

        void onProtocolFilePrintDone() override;

        void onProtocolFilePrintFailed(const std::string &reason) override;

    protected:
        void onProcess(size_t position) override;

        void releaseResources() override;

    private:
        std::string filename_;
        std::chrono::milliseconds statusInterval_;
        std::atomic<bool> active_{false};

        mutable std::mutex statusMutex_;
        std::optional<size_t> size_;
        std::optional<size_t> lastPosition_;

        std::mutex timerMutex_;
        std::unique_ptr<timer::RepeatedTimer> statusTimer_;

        void queryStatus();

        bool queryActive() const;
    };

} // namespace jobcore::job
