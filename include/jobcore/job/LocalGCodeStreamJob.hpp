#pragma once

#include "LocalGCodeFilePrintJob.hpp"

namespace jobcore::job {

    /**
     * @brief Streams a local G-code file unchanged into the device storage.
     *
     * The device interprets the content itself, so no client side transform is applied.
     * Requires a protocol with file streaming support.
     */
    class LocalGCodeStreamJob : public LocalGCodeFilePrintJob {
    public:
        explicit LocalGCodeStreamJob(std::string path, const std::string &encoding = "utf-8");

        bool canProcess(const protocol::Protocol &protocol) const override;

    protected:
        protocol::JobVariant variant() const override;

        std::string processLine(const std::string &line) override;
    };

} // namespace jobcore::job
