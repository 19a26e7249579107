#pragma once

#include "PrintJob.hpp"
#include "jobcore/gcode/GCodeLineProcessor.hpp"
#include "jobcore/protocol/Protocol.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace jobcore::job {

    enum class JobSource {
        LocalFile,         // print a local file, lines sent by the client
        LocalFileToDevice, // stream a local file unchanged into the device storage
        DeviceFile         // print a file already stored on the device
    };

    struct JobRequest {
        JobSource source = JobSource::LocalFile;
        std::string path;
        std::string encoding = "utf-8";
        gcode::GCodeProcessingOptions gcodeOptions;
        std::chrono::milliseconds statusInterval{2000};
    };

    /**
     * @brief Picks the job variant matching a content source and checks it against the protocol.
     */
    class PrintJobFactory {
    public:
        /**
         * @throws types::UnsupportedJobException if the protocol cannot process the chosen variant.
         */
        static std::shared_ptr<PrintJob> create(const JobRequest &request, const protocol::Protocol &protocol);

        static std::string jobSourceToString(JobSource source);
    };

} // namespace jobcore::job
