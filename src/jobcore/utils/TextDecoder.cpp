#include "jobcore/utils/TextDecoder.hpp"
#include "jobcore/types/Error.hpp"

#include <algorithm>
#include <cctype>

namespace jobcore::utils {
    namespace {
        std::string normalize(const std::string &name) {
            std::string key;
            key.reserve(name.size());
            for (char c: name) {
                if (c == '-' || c == '_' || c == ' ') continue;
                key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
            return key;
        }

        void decodeUtf8(const std::string &raw, std::string &out) {
            const size_t n = raw.size();
            size_t i = 0;
            while (i < n) {
                auto c = static_cast<unsigned char>(raw[i]);
                if (c < 0x80) {
                    out.push_back(static_cast<char>(c));
                    ++i;
                    continue;
                }

                size_t length;
                unsigned char low = 0x80;
                unsigned char high = 0xBF;
                if (c >= 0xC2 && c <= 0xDF) {
                    length = 2;
                } else if (c == 0xE0) {
                    length = 3;
                    low = 0xA0;
                } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
                    length = 3;
                } else if (c == 0xED) {
                    // UTF-16 surrogates are not valid scalar values
                    length = 3;
                    high = 0x9F;
                } else if (c == 0xF0) {
                    length = 4;
                    low = 0x90;
                } else if (c >= 0xF1 && c <= 0xF3) {
                    length = 4;
                } else if (c == 0xF4) {
                    length = 4;
                    high = 0x8F;
                } else {
                    out += REPLACEMENT_CHARACTER;
                    ++i;
                    continue;
                }

                size_t valid = 1;
                while (valid < length && i + valid < n) {
                    auto next = static_cast<unsigned char>(raw[i + valid]);
                    unsigned char min = valid == 1 ? low : 0x80;
                    unsigned char max = valid == 1 ? high : 0xBF;
                    if (next < min || next > max) break;
                    ++valid;
                }

                if (valid == length) {
                    out.append(raw, i, length);
                } else {
                    out += REPLACEMENT_CHARACTER;
                }
                i += valid;
            }
        }
    }

    TextEncoding parseEncoding(const std::string &name) {
        const std::string key = normalize(name);
        if (key == "utf8") return TextEncoding::Utf8;
        if (key == "ascii" || key == "usascii") return TextEncoding::Ascii;
        if (key == "latin1" || key == "iso88591" || key == "l1") return TextEncoding::Latin1;
        throw types::UnsupportedEncodingException(name);
    }

    std::string encodingToString(TextEncoding encoding) {
        switch (encoding) {
            case TextEncoding::Utf8: return "utf-8";
            case TextEncoding::Ascii: return "ascii";
            case TextEncoding::Latin1: return "latin-1";
            default: return "unknown";
        }
    }

    std::string decodeToUtf8(const std::string &raw, TextEncoding encoding) {
        std::string out;
        out.reserve(raw.size());

        switch (encoding) {
            case TextEncoding::Utf8:
                decodeUtf8(raw, out);
                break;
            case TextEncoding::Ascii:
                for (char c: raw) {
                    if (static_cast<unsigned char>(c) < 0x80) {
                        out.push_back(c);
                    } else {
                        out += REPLACEMENT_CHARACTER;
                    }
                }
                break;
            case TextEncoding::Latin1:
                for (char c: raw) {
                    auto byte = static_cast<unsigned char>(c);
                    if (byte < 0x80) {
                        out.push_back(c);
                    } else {
                        out.push_back(static_cast<char>(0xC0 | (byte >> 6)));
                        out.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
                    }
                }
                break;
        }
        return out;
    }
}
