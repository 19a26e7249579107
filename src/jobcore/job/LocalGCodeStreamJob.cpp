#include "jobcore/job/LocalGCodeStreamJob.hpp"

#include <utility>

namespace jobcore::job {
    LocalGCodeStreamJob::LocalGCodeStreamJob(std::string path, const std::string &encoding)
            : LocalGCodeFilePrintJob(std::move(path), encoding, {}, "LocalGCodeStreamJob") {
    }

    bool LocalGCodeStreamJob::canProcess(const protocol::Protocol &protocol) const {
        return protocol.supportsJob(variant()) && protocol.supportsFileStreaming();
    }

    protocol::JobVariant LocalGCodeStreamJob::variant() const {
        return protocol::JobVariant::LocalGCodeStream;
    }

    std::string LocalGCodeStreamJob::processLine(const std::string &line) {
        return line;
    }
} // namespace jobcore::job
