#include "jobcore/job/PrintJobFactory.hpp"
#include "jobcore/job/DeviceFilePrintJob.hpp"
#include "jobcore/job/LocalGCodeFilePrintJob.hpp"
#include "jobcore/job/LocalGCodeStreamJob.hpp"
#include "jobcore/types/Error.hpp"
#include "logger/Logger.hpp"

namespace jobcore::job {
    std::shared_ptr<PrintJob> PrintJobFactory::create(const JobRequest &request, const protocol::Protocol &protocol) {
        std::shared_ptr<PrintJob> job;
        switch (request.source) {
            case JobSource::LocalFile:
                job = std::make_shared<LocalGCodeFilePrintJob>(request.path, request.encoding, request.gcodeOptions);
                break;
            case JobSource::LocalFileToDevice:
                job = std::make_shared<LocalGCodeStreamJob>(request.path, request.encoding);
                break;
            case JobSource::DeviceFile:
                job = std::make_shared<DeviceFilePrintJob>(request.path, request.statusInterval);
                break;
        }

        if (!job || !job->canProcess(protocol)) {
            throw types::UnsupportedJobException(
                    "[PrintJobFactory] Protocol cannot process " + jobSourceToString(request.source) + " job for " +
                    request.path);
        }

        Logger::logInfo("[PrintJobFactory] Created " + jobSourceToString(request.source) + " job for " + request.path);
        return job;
    }

    std::string PrintJobFactory::jobSourceToString(JobSource source) {
        switch (source) {
            case JobSource::LocalFile: return "LocalFile";
            case JobSource::LocalFileToDevice: return "LocalFileToDevice";
            case JobSource::DeviceFile: return "DeviceFile";
            default: return "Unknown";
        }
    }
} // namespace jobcore::job
