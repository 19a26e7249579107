#pragma once

#include <string>

namespace jobcore::utils {
    enum class TextEncoding {
        Utf8,
        Ascii,
        Latin1
    };

    /**
     * @brief Resolves an encoding name (case insensitive, common aliases accepted).
     * @throws types::UnsupportedEncodingException for unknown names.
     */
    TextEncoding parseEncoding(const std::string &name);

    std::string encodingToString(TextEncoding encoding);

    /**
     * @brief Converts raw bytes in the given encoding to UTF-8, replacing undecodable
     * sequences with U+FFFD.
     */
    std::string decodeToUtf8(const std::string &raw, TextEncoding encoding);

    inline constexpr const char *REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";
}
