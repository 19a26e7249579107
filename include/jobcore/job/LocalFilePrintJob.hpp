#pragma once

#include "PrintJob.hpp"
#include "jobcore/utils/LineReader.hpp"
#include "jobcore/utils/TextDecoder.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace jobcore::job {

/**
 * @brief Streams a local text file line by line, tracking the byte offset as progress.
 *
 * process() accepts a byte offset to resume an interrupted job. Each line read goes
 * through processLine(); lines for which it returns an empty string are skipped.
 */
    class LocalFilePrintJob : public PrintJob {
    public:
        /**
         * @throws types::JobIOException if the file cannot be stat'ed.
         * @throws types::UnsupportedEncodingException for an unknown encoding.
         */
        explicit LocalFilePrintJob(std::string path, const std::string &encoding = "utf-8");

        bool canProcess(const protocol::Protocol &protocol) const override;

        /**
         * @return next processed line, or std::nullopt once the file is exhausted or the
         * job has ended. Reaching end of file closes the file and completes the job.
         * @throws types::InvalidJobStateException before process() or after a read error.
         * @throws types::JobIOException when reading fails; the file is closed first.
         */
        std::optional<std::string> getNext() override;

        std::optional<double> getProgress() const override;

        void cancel() override;

        /**
         * @brief Releases the file. Safe to call any number of times.
         */
        void close();

        bool canGetContent() const override;

        std::unique_ptr<ContentGenerator> getContentGenerator() const override;

        std::string getName() const override;

        const std::string &getPath() const { return path_; }

        utils::TextEncoding getEncoding() const { return encoding_; }

        size_t getSize() const { return size_; }

    protected:
        LocalFilePrintJob(std::string path, const std::string &encoding, std::string component);

        virtual protocol::JobVariant variant() const;

        virtual std::string processLine(const std::string &line);

        void onProcess(size_t position) override;

        void releaseResources() override;

    private:
        std::string path_;
        utils::TextEncoding encoding_;
        std::atomic<size_t> size_;

        mutable std::mutex fileMutex_;
        std::unique_ptr<utils::LineReader> handle_;

        void closeLocked();
    };

} // namespace jobcore::job
