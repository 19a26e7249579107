#include "application/config/ConfigManager.hpp"
#include "application/runner/DryRunProtocol.hpp"
#include "application/runner/JobRunner.hpp"
#include "jobcore/job/PrintJobFactory.hpp"
#include "jobcore/job/tracking/JobTracker.hpp"
#include "jobcore/types/Error.hpp"
#include "logger/Logger.hpp"

#include <csignal>
#include <atomic>
#include <iostream>
#include <memory>
#include <string>

namespace {
    std::atomic<jobcore::application::JobRunner *> activeRunner{nullptr};

    void handleSignal(int signal) {
        if (auto *runner = activeRunner.load()) {
            runner->requestCancel();
        }
    }

    void printUsage(const char *program) {
        std::cerr << "Usage: " << program << " <gcode file> [resume position] [--config <config.json>]" << std::endl;
    }
}

int main(int argc, char **argv) {
    std::string gcodePath;
    std::string configPath = "config.json";
    size_t position = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (gcodePath.empty()) {
            gcodePath = arg;
        } else {
            try {
                position = std::stoul(arg);
            } catch (const std::exception &) {
                printUsage(argv[0]);
                return 2;
            }
        }
    }

    if (gcodePath.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    auto &config = jobcore::config::ConfigManager::getInstance();
    config.loadFromFile(configPath);
    config.loadFromEnv();

    auto validation = config.validate();
    if (!validation.isValid) {
        for (const auto &error: validation.errors) {
            Logger::logError("[Config] " + error);
        }
        return 1;
    }

    auto loggingConfig = config.getLoggingConfig();
    if (loggingConfig.fileOutput) {
        Logger::init(loggingConfig.folder);
    }

    int exitCode = 0;
    try {
        auto protocol = std::make_shared<jobcore::application::DryRunProtocol>();

        jobcore::job::JobRequest request;
        request.source = jobcore::job::JobSource::LocalFile;
        request.path = gcodePath;
        request.encoding = config.getJobConfig().defaultEncoding;
        request.gcodeOptions = config.getGCodeConfig().toOptions();

        auto job = jobcore::job::PrintJobFactory::create(request, *protocol);
        auto tracker = std::make_shared<jobcore::jobs::JobTracker>();
        job->registerListener(tracker);

        jobcore::application::JobRunner runner(job, protocol);
        activeRunner = &runner;
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        auto state = runner.run(position);
        activeRunner = nullptr;

        exitCode = state == jobcore::job::JobState::Done ? 0 : 1;
    } catch (const jobcore::types::JobException &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        exitCode = 1;
    }

    Logger::shutdown();
    return exitCode;
}
