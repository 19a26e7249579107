#include "jobcore/gcode/GCodeLineProcessor.hpp"
#include "jobcore/utils/FloatFormatter.hpp"
#include "logger/Logger.hpp"

#include <cctype>
#include <exception>
#include <sstream>

namespace jobcore::gcode {
    GCodeLineProcessor::GCodeLineProcessor(GCodeProcessingOptions options)
            : options_(options) {
    }

    std::string GCodeLineProcessor::process(const std::string &line) const {
        std::string processed = options_.stripComments ? stripComment(line) : line;
        processed = trim(processed);
        if (processed.empty()) {
            return processed;
        }

        if (options_.toolTemperatureOffset != 0.0 || options_.bedTemperatureOffset != 0.0) {
            processed = applyTemperatureOffsets(processed);
        }
        return processed;
    }

    std::string GCodeLineProcessor::stripComment(const std::string &line) {
        std::string result;
        result.reserve(line.size());

        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (c == '\\' && i + 1 < line.size() && line[i + 1] == ';') {
                result.push_back(';');
                ++i;
                continue;
            }
            if (c == ';') {
                break;
            }
            result.push_back(c);
        }
        return result;
    }

    std::string GCodeLineProcessor::trim(const std::string &value) {
        const char *whitespace = " \t\r\n\f\v";
        size_t start = value.find_first_not_of(whitespace);
        if (start == std::string::npos) {
            return "";
        }
        size_t end = value.find_last_not_of(whitespace);
        return value.substr(start, end - start + 1);
    }

    std::vector<std::string> GCodeLineProcessor::tokenize(const std::string &line) {
        std::istringstream stream(line);
        std::vector<std::string> tokens;
        std::string token;
        while (stream >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    std::string GCodeLineProcessor::applyTemperatureOffsets(const std::string &line) const {
        auto tokens = tokenize(line);
        if (tokens.empty()) {
            return line;
        }

        std::string command = tokens.front();
        for (char &c: command) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }

        double offset;
        if (command == "M104" || command == "M109") {
            offset = options_.toolTemperatureOffset;
        } else if (command == "M140" || command == "M190") {
            offset = options_.bedTemperatureOffset;
        } else {
            return line;
        }

        if (offset == 0.0) {
            return line;
        }

        bool changed = false;
        for (size_t i = 1; i < tokens.size(); ++i) {
            auto &token = tokens[i];
            if (token.size() < 2 || std::toupper(static_cast<unsigned char>(token[0])) != 'S') {
                continue;
            }

            try {
                double target = std::stod(token.substr(1));
                // S0 switches the heater off and must stay off
                if (target == 0.0) {
                    continue;
                }
                token = token.substr(0, 1) + utils::formatFloat(target + offset);
                changed = true;
            } catch (const std::exception &e) {
                Logger::logWarning("[GCodeLineProcessor] Failed to parse temperature parameter: " + token);
            }
        }

        if (!changed) {
            return line;
        }

        std::string rebuilt = tokens.front();
        for (size_t i = 1; i < tokens.size(); ++i) {
            rebuilt += " " + tokens[i];
        }
        return rebuilt;
    }
} // namespace jobcore::gcode
