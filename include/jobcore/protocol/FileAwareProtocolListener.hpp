#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace jobcore::protocol {

/**
 * @brief Callbacks a file aware protocol emits about prints running from device storage.
 *
 * Callbacks may arrive on any thread owned by the protocol.
 */
    class FileAwareProtocolListener {
    public:
        virtual ~FileAwareProtocolListener() = default;

        virtual void onProtocolSdFileList(const std::vector<std::string> &files) {}

        virtual void onProtocolFilePrintStarted(const std::string &name, size_t size) {}

        virtual void onProtocolSdStatus(const std::string &name, size_t position, size_t total) {}

        virtual void onProtocolFilePrintDone() {}

        /**
         * @brief The device aborted the running file print.
         */
        virtual void onProtocolFilePrintFailed(const std::string &reason) {}
    };

} // namespace jobcore::protocol
