#pragma once

#include <string>
#include <vector>

namespace jobcore::gcode {

    struct GCodeProcessingOptions {
        bool stripComments = true;
        double toolTemperatureOffset = 0.0;
        double bedTemperatureOffset = 0.0;
    };

    /**
     * @brief Client side transform applied to every G-code line before it is sent.
     *
     * Strips comments (everything after an unescaped ';'), trims whitespace and adds the
     * configured temperature offsets to M104/M109 (tool) and M140/M190 (bed) targets.
     * Returns an empty string for lines with nothing left to send.
     */
    class GCodeLineProcessor {
    public:
        GCodeLineProcessor() = default;

        explicit GCodeLineProcessor(GCodeProcessingOptions options);

        std::string process(const std::string &line) const;

        const GCodeProcessingOptions &getOptions() const { return options_; }

        static std::string stripComment(const std::string &line);

        static std::string trim(const std::string &value);

    private:
        GCodeProcessingOptions options_;

        std::string applyTemperatureOffsets(const std::string &line) const;

        static std::vector<std::string> tokenize(const std::string &line);
    };

} // namespace jobcore::gcode
