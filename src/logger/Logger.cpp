#include "logger/Logger.hpp"

#include <algorithm>
#include <iostream>
#include <chrono>
#include <condition_variable>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

std::ofstream Logger::logFile_;
std::mutex Logger::logMutex_;
std::string Logger::logsFolder_ = "logs";
std::string Logger::currentLogPath_;
std::atomic<size_t> Logger::currentLogSize_{0};
std::atomic<bool> Logger::fileOutput_{false};
std::thread Logger::cleanupThread_;
std::atomic<bool> Logger::shutdownRequested_{false};

namespace {
    constexpr size_t MAX_LOG_SIZE = 10 * 1024 * 1024; // 10MB
    constexpr size_t MAX_LOG_FILES = 10;
    constexpr std::chrono::hours LOG_RETENTION{24 * 7}; // 7 days

    std::mutex cleanupWaitMutex;
    std::condition_variable cleanupWake;
}

void Logger::init(const std::string &logsFolder) {
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        if (fileOutput_) {
            return;
        }
        logsFolder_ = logsFolder;
        shutdownRequested_ = false;
        rotateLogFile();
        fileOutput_ = logFile_.is_open();
    }
    startCleanupThread();
    std::cout << "[Logger] Initialized in " << logsFolder_ << " (max " << MAX_LOG_SIZE / 1024 / 1024
              << "MB per file)" << std::endl;
}

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> wait(cleanupWaitMutex);
        shutdownRequested_ = true;
    }
    cleanupWake.notify_all();
    if (cleanupThread_.joinable()) {
        cleanupThread_.join();
    }
    std::lock_guard<std::mutex> lock(logMutex_);
    fileOutput_ = false;
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::logInfo(const std::string &message) {
    log("INFO", message);
}

void Logger::logWarning(const std::string &message) {
    log("WARNING", message);
}

void Logger::logError(const std::string &message) {
    log("ERROR", message);
}

bool Logger::isFileOutputEnabled() {
    return fileOutput_;
}

void Logger::log(const std::string &level, const std::string &message) {
    if (message.empty() || message.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }

    std::string formatted = "[" + level + "] [" + currentTimestamp() + "] " + message;

    std::lock_guard<std::mutex> lock(logMutex_);
    if (level == "ERROR") {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }

    if (!fileOutput_) {
        return;
    }

    if (currentLogSize_ > MAX_LOG_SIZE) {
        rotateLogFile();
    }

    if (logFile_.is_open()) {
        logFile_ << formatted << std::endl;
        currentLogSize_ += formatted.length() + 1;
    }
}

void Logger::rotateLogFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }

    currentLogPath_ = generateLogFilename();
    logFile_.open(currentLogPath_, std::ios::out | std::ios::trunc);
    currentLogSize_ = 0;

    if (!logFile_.is_open()) {
        std::cerr << "[Logger] ERROR: Cannot open log file: " << currentLogPath_ << std::endl;
    }
}

void Logger::startCleanupThread() {
    if (cleanupThread_.joinable()) {
        return;
    }
    cleanupThread_ = std::thread([]() {
        std::unique_lock<std::mutex> lock(cleanupWaitMutex);
        while (!shutdownRequested_) {
            lock.unlock();
            cleanupOldLogs();
            lock.lock();
            cleanupWake.wait_for(lock, std::chrono::hours(1), [] { return shutdownRequested_.load(); });
        }
    });
}

void Logger::cleanupOldLogs() {
    try {
        std::string logsFolder;
        {
            std::lock_guard<std::mutex> lock(logMutex_);
            logsFolder = logsFolder_;
        }
        if (!fs::exists(logsFolder)) return;

        auto cutoffTime = std::chrono::system_clock::now() - LOG_RETENTION;
        std::vector<fs::path> logFiles;

        for (const auto &entry: fs::directory_iterator(logsFolder)) {
            if (entry.path().extension() != ".log") {
                continue;
            }
            auto writeTime = fs::last_write_time(entry);
            auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                    writeTime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());

            if (sctp < cutoffTime) {
                fs::remove(entry);
            } else {
                logFiles.push_back(entry.path());
            }
        }

        if (logFiles.size() > MAX_LOG_FILES) {
            std::sort(logFiles.begin(), logFiles.end(), [](const fs::path &a, const fs::path &b) {
                return fs::last_write_time(a) < fs::last_write_time(b);
            });

            for (size_t i = 0; i < logFiles.size() - MAX_LOG_FILES; ++i) {
                fs::remove(logFiles[i]);
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "[Logger] Cleanup error: " << e.what() << std::endl;
    }
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&in_time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << millis.count();
    return ss.str();
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&in_time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y%m%d_%H%M%S");

    std::error_code ec;
    if (!fs::exists(logsFolder_, ec)) {
        fs::create_directories(logsFolder_, ec);
    }

    return logsFolder_ + "/printjob_" + ss.str() + ".log";
}
