#pragma once
#include <stdexcept>
#include <string>

namespace jobcore::types {

class JobException : public std::runtime_error {
public:
    explicit JobException(const std::string& msg)
        : std::runtime_error(msg) {}
};

/**
 * @brief An operation was requested in a lifecycle state that does not allow it.
 */
class InvalidJobStateException : public JobException {
public:
    explicit InvalidJobStateException(const std::string& msg)
        : JobException(msg) {}
};

class JobIOException : public JobException {
public:
    JobIOException(const std::string& path, const std::string& reason)
        : JobException("I/O error on " + path + ": " + reason), path_(path) {}

    const std::string& getPath() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

class UnsupportedJobException : public JobException {
public:
    explicit UnsupportedJobException(const std::string& msg)
        : JobException(msg) {}
};

class UnsupportedEncodingException : public JobException {
public:
    explicit UnsupportedEncodingException(const std::string& encoding)
        : JobException("Unsupported encoding: " + encoding) {}
};

}
