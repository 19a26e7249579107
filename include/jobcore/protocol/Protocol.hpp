#pragma once

#include "JobVariant.hpp"
#include "FileAwareProtocolListener.hpp"
#include "jobcore/types/Result.hpp"

#include <cstddef>
#include <memory>
#include <set>
#include <string>

namespace jobcore::protocol {

/**
 * @brief Communication channel towards the controlled device, as seen by a print job.
 *
 * Connection handling and command encoding live behind this interface. A job only asks
 * which variants and capabilities are available and, for device resident files, drives
 * the file print and listens for its status callbacks.
 */
    class Protocol {
    public:
        virtual ~Protocol() = default;

        virtual std::set<JobVariant> supportedJobs() const = 0;

        bool supportsJob(JobVariant variant) const {
            auto jobs = supportedJobs();
            return jobs.find(variant) != jobs.end();
        }

        /**
         * @brief Raw file content can be streamed to the device storage.
         */
        virtual bool supportsFileStreaming() const { return false; }

        /**
         * @brief Files stored on the device can be printed and polled for status.
         */
        virtual bool supportsFileAware() const { return false; }

        virtual types::Result startFilePrint(const std::string &name, size_t position) {
            return types::Result::unsupported("startFilePrint not supported by protocol");
        }

        virtual types::Result getFilePrintStatus() {
            return types::Result::unsupported("getFilePrintStatus not supported by protocol");
        }

        virtual void registerListener(std::shared_ptr<FileAwareProtocolListener> listener) = 0;

        virtual void unregisterListener(const std::shared_ptr<FileAwareProtocolListener> &listener) = 0;
    };

} // namespace jobcore::protocol
