#pragma once

#include <string>

namespace jobcore::types {

    enum class ResultCode {
        Success,
        Error,
        Unsupported,
        Busy
    };

    /**
     * @brief Outcome of a protocol operation requested by a job.
     */
    struct Result {
        ResultCode code;
        std::string message;

        inline bool isSuccess() const {
            return code == ResultCode::Success;
        }

        inline bool isError() const {
            return code == ResultCode::Error;
        }

        inline bool isUnsupported() const {
            return code == ResultCode::Unsupported;
        }

        inline bool isBusy() const {
            return code == ResultCode::Busy;
        }

        static inline Result success(const std::string &msg = "Success") {
            return {ResultCode::Success, msg};
        }

        static inline Result error(const std::string &msg = "Error") {
            return {ResultCode::Error, msg};
        }

        static inline Result unsupported(const std::string &msg = "Operation not supported") {
            return {ResultCode::Unsupported, msg};
        }

        static inline Result busy(const std::string &msg = "Busy") {
            return {ResultCode::Busy, msg};
        }
    };

}
