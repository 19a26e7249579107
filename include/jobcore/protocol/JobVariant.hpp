#pragma once

#include <string>

namespace jobcore::protocol {
    enum class JobVariant {
        LocalFile,
        LocalGCodeFile,
        LocalGCodeStream,
        DeviceFile
    };

    inline std::string jobVariantToString(JobVariant variant) {
        switch (variant) {
            case JobVariant::LocalFile: return "LocalFile";
            case JobVariant::LocalGCodeFile: return "LocalGCodeFile";
            case JobVariant::LocalGCodeStream: return "LocalGCodeStream";
            case JobVariant::DeviceFile: return "DeviceFile";
            default: return "Unknown";
        }
    }
}
