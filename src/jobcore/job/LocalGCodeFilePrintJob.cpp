#include "jobcore/job/LocalGCodeFilePrintJob.hpp"

#include <utility>

namespace jobcore::job {
    LocalGCodeFilePrintJob::LocalGCodeFilePrintJob(std::string path, const std::string &encoding,
                                                   gcode::GCodeProcessingOptions options)
            : LocalGCodeFilePrintJob(std::move(path), encoding, options, "LocalGCodeFilePrintJob") {
    }

    LocalGCodeFilePrintJob::LocalGCodeFilePrintJob(std::string path, const std::string &encoding,
                                                   gcode::GCodeProcessingOptions options, std::string component)
            : LocalFilePrintJob(std::move(path), encoding, std::move(component)),
              lineProcessor_(options) {
    }

    protocol::JobVariant LocalGCodeFilePrintJob::variant() const {
        return protocol::JobVariant::LocalGCodeFile;
    }

    std::string LocalGCodeFilePrintJob::processLine(const std::string &line) {
        return lineProcessor_.process(line);
    }
} // namespace jobcore::job
