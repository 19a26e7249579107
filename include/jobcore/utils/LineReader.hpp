#pragma once

#include "TextDecoder.hpp"

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>

namespace jobcore::utils {

/**
 * @brief Sequential line reader over a text file that tracks its byte offset.
 *
 * Lines come back decoded to UTF-8 and without their terminator. A UTF-8 byte order
 * mark at the start of the file is skipped when opening at offset 0; position() counts
 * it as part of the first line.
 */
    class LineReader {
    public:
        LineReader(std::string path, TextEncoding encoding);

        LineReader(const LineReader &) = delete;

        LineReader &operator=(const LineReader &) = delete;

        /**
         * @throws types::JobIOException if the file cannot be opened or positioned.
         */
        void open(size_t position = 0);

        /**
         * @return next line, or std::nullopt at end of file.
         * @throws types::JobIOException on a stream failure.
         */
        std::optional<std::string> readLine();

        void close() noexcept;

        bool isOpen() const;

        size_t position() const { return position_; }

        const std::string &path() const { return path_; }

    private:
        std::string path_;
        TextEncoding encoding_;
        std::ifstream stream_;
        size_t position_ = 0;
        size_t pendingPrefix_ = 0;

        void skipByteOrderMark();
    };

} // namespace jobcore::utils
