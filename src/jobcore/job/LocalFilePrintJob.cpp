#include "jobcore/job/LocalFilePrintJob.hpp"
#include "jobcore/types/Error.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

namespace jobcore::job {
    namespace {
        size_t statFileSize(const std::string &path) {
            std::error_code ec;
            auto size = std::filesystem::file_size(path, ec);
            if (ec) {
                throw types::JobIOException(path, ec.message());
            }
            return static_cast<size_t>(size);
        }

        class FileContentGenerator : public ContentGenerator {
        public:
            FileContentGenerator(const std::string &path, utils::TextEncoding encoding)
                    : reader_(path, encoding) {
            }

            std::optional<std::string> next() override {
                if (finished_) {
                    return std::nullopt;
                }
                if (!reader_.isOpen()) {
                    reader_.open(0);
                }

                auto line = reader_.readLine();
                if (!line) {
                    reader_.close();
                    finished_ = true;
                }
                return line;
            }

        private:
            utils::LineReader reader_;
            bool finished_ = false;
        };
    }

    LocalFilePrintJob::LocalFilePrintJob(std::string path, const std::string &encoding)
            : LocalFilePrintJob(std::move(path), encoding, "LocalFilePrintJob") {
    }

    LocalFilePrintJob::LocalFilePrintJob(std::string path, const std::string &encoding, std::string component)
            : PrintJob(std::move(component)),
              path_(std::move(path)),
              encoding_(utils::parseEncoding(encoding)),
              size_(statFileSize(path_)) {
    }

    protocol::JobVariant LocalFilePrintJob::variant() const {
        return protocol::JobVariant::LocalFile;
    }

    bool LocalFilePrintJob::canProcess(const protocol::Protocol &protocol) const {
        return protocol.supportsJob(variant());
    }

    std::string LocalFilePrintJob::getName() const {
        return path_;
    }

    void LocalFilePrintJob::onProcess(size_t position) {
        std::error_code ec;
        auto liveSize = std::filesystem::file_size(path_, ec);
        if (!ec && liveSize != size_) {
            Logger::logWarning("[" + component() + "] Size of " + path_ + " changed since job creation: " +
                               std::to_string(size_) + " -> " + std::to_string(liveSize) + " bytes");
            size_ = static_cast<size_t>(liveSize);
        }

        if (position > size_) {
            throw types::JobException("Resume position " + std::to_string(position) + " is beyond the end of " +
                                      path_ + " (" + std::to_string(size_) + " bytes)");
        }

        auto reader = std::make_unique<utils::LineReader>(path_, encoding_);
        reader->open(position);

        std::lock_guard<std::mutex> lock(fileMutex_);
        handle_ = std::move(reader);
        // cancelled while opening: the release already ran and found nothing to close
        if (getState() != JobState::Processing) {
            closeLocked();
        }
    }

    std::optional<std::string> LocalFilePrintJob::getNext() {
        {
            std::lock_guard<std::mutex> lock(fileMutex_);
            if (!handle_) {
                if (isTerminal(getState())) {
                    return std::nullopt;
                }
                throw types::InvalidJobStateException("File " + path_ + " is not open for reading");
            }

            try {
                while (auto line = handle_->readLine()) {
                    auto processed = processLine(*line);
                    if (!processed.empty()) {
                        return processed;
                    }
                }
            } catch (const std::exception &e) {
                closeLocked();
                Logger::logError("[" + component() + "] Exception while processing line of " + path_ + ": " +
                                 e.what());
                throw;
            }
        }

        Logger::logInfo("[" + component() + "] Reached end of " + path_);
        processJobDone();
        close();
        return std::nullopt;
    }

    std::string LocalFilePrintJob::processLine(const std::string &line) {
        return line;
    }

    std::optional<double> LocalFilePrintJob::getProgress() const {
        std::lock_guard<std::mutex> lock(fileMutex_);
        if (!handle_ || size_ == 0) {
            return 0.0;
        }
        return std::min(1.0, static_cast<double>(handle_->position()) / static_cast<double>(size_));
    }

    void LocalFilePrintJob::cancel() {
        if (processJobCancelled()) {
            Logger::logInfo("[" + component() + "] Cancelled " + path_);
        }
    }

    void LocalFilePrintJob::close() {
        std::lock_guard<std::mutex> lock(fileMutex_);
        closeLocked();
    }

    void LocalFilePrintJob::closeLocked() {
        if (handle_) {
            handle_->close();
        }
        handle_.reset();
    }

    void LocalFilePrintJob::releaseResources() {
        close();
    }

    bool LocalFilePrintJob::canGetContent() const {
        return true;
    }

    std::unique_ptr<ContentGenerator> LocalFilePrintJob::getContentGenerator() const {
        return std::make_unique<FileContentGenerator>(path_, encoding_);
    }
} // namespace jobcore::job
