#include "jobcore/utils/LineReader.hpp"
#include "jobcore/types/Error.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

namespace jobcore::utils {
    LineReader::LineReader(std::string path, TextEncoding encoding)
            : path_(std::move(path)), encoding_(encoding) {
    }

    void LineReader::open(size_t position) {
        close();

        stream_.open(path_, std::ios::in | std::ios::binary);
        if (!stream_.is_open()) {
            throw types::JobIOException(path_, std::error_code(errno, std::generic_category()).message());
        }

        if (position == 0) {
            skipByteOrderMark();
            return;
        }

        stream_.seekg(static_cast<std::streamoff>(position), std::ios::beg);
        if (stream_.fail()) {
            close();
            throw types::JobIOException(path_, "cannot seek to offset " + std::to_string(position));
        }
        position_ = position;
    }

    std::optional<std::string> LineReader::readLine() {
        if (!stream_.is_open()) {
            throw types::JobIOException(path_, "file is not open for reading");
        }

        std::string line;
        if (!std::getline(stream_, line)) {
            if (stream_.bad()) {
                throw types::JobIOException(path_, "read failed at offset " + std::to_string(position_));
            }
            return std::nullopt;
        }

        // eof() after a successful getline means the last line had no terminator
        position_ += pendingPrefix_ + line.size() + (stream_.eof() ? 0 : 1);
        pendingPrefix_ = 0;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return decodeToUtf8(line, encoding_);
    }

    void LineReader::close() noexcept {
        if (stream_.is_open()) {
            stream_.close();
        }
        stream_.clear();
        position_ = 0;
        pendingPrefix_ = 0;
    }

    bool LineReader::isOpen() const {
        return stream_.is_open();
    }

    void LineReader::skipByteOrderMark() {
        static const unsigned char BOM[] = {0xEF, 0xBB, 0xBF};

        char head[3] = {0, 0, 0};
        stream_.read(head, sizeof(head));
        // the mark is accounted to the first line, so the offset stays at 0 until it is read
        if (stream_.gcount() == 3 && std::memcmp(head, BOM, sizeof(BOM)) == 0) {
            pendingPrefix_ = sizeof(BOM);
            return;
        }

        stream_.clear();
        stream_.seekg(0, std::ios::beg);
        position_ = 0;
    }
}
