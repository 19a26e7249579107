#pragma once

#include "LocalFilePrintJob.hpp"
#include "jobcore/gcode/GCodeLineProcessor.hpp"

namespace jobcore::job {

    /**
     * @brief Local G-code print: comments are stripped and offsets applied on the client.
     */
    class LocalGCodeFilePrintJob : public LocalFilePrintJob {
    public:
        explicit LocalGCodeFilePrintJob(std::string path, const std::string &encoding = "utf-8",
                                        gcode::GCodeProcessingOptions options = {});

        const gcode::GCodeLineProcessor &getLineProcessor() const { return lineProcessor_; }

    protected:
        LocalGCodeFilePrintJob(std::string path, const std::string &encoding, gcode::GCodeProcessingOptions options,
                               std::string component);

        protocol::JobVariant variant() const override;

        std::string processLine(const std::string &line) override;

    private:
        gcode::GCodeLineProcessor lineProcessor_;
    };

} // namespace jobcore::job
