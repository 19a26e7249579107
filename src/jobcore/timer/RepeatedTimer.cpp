#include "jobcore/timer/RepeatedTimer.hpp"
#include "logger/Logger.hpp"

#include <exception>
#include <utility>

namespace jobcore::timer {
    RepeatedTimer::RepeatedTimer(std::chrono::milliseconds interval, Callback callback, Condition condition,
                                 std::string name)
            : interval_(interval),
              callback_(std::move(callback)),
              condition_(std::move(condition)),
              name_(std::move(name)),
              context_(std::make_shared<Context>()) {
        if (interval_ <= std::chrono::milliseconds::zero()) {
            interval_ = std::chrono::milliseconds(1);
        }
    }

    RepeatedTimer::~RepeatedTimer() {
        stop();
        // Destroyed from inside its own callback: the worker keeps the context alive and exits on its own
        if (worker_.joinable()) {
            worker_.detach();
        }
    }

    void RepeatedTimer::start() {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (started_) {
            Logger::logWarning("[" + name_ + "] Already started");
            return;
        }

        started_ = true;
        running_ = true;
        scheduleNext();

        worker_ = std::thread([context = context_, name = name_]() {
            try {
                context->io.run();
            } catch (const std::exception &e) {
                Logger::logError("[" + name + "] Timer thread crashed: " + std::string(e.what()));
            }
        });
    }

    void RepeatedTimer::stop() {
        std::lock_guard<std::mutex> lock(controlMutex_);
        auto context = context_;
        if (context->stopRequested.exchange(true)) {
            return;
        }
        running_ = false;

        boost::asio::post(context->io, [context]() {
            context->timer.cancel();
        });
        context->io.stop();

        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    }

    bool RepeatedTimer::isRunning() const {
        return running_ && !context_->stopRequested;
    }

    void RepeatedTimer::scheduleNext() {
        auto context = context_;
        context->timer.expires_after(interval_);
        context->timer.async_wait([this, context](const boost::system::error_code &ec) {
            onTick(context, ec);
        });
    }

    void RepeatedTimer::onTick(const std::shared_ptr<Context> &context, const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted || context->stopRequested) {
            return;
        }

        bool proceed = !condition_ || condition_();
        if (context->stopRequested) {
            return;
        }
        if (!proceed) {
            running_ = false;
            Logger::logInfo("[" + name_ + "] Condition no longer met, stopping");
            return;
        }

        ++ticks_;
        try {
            callback_();
        } catch (const std::exception &e) {
            Logger::logError("[" + name_ + "] Callback failed: " + std::string(e.what()));
        } catch (...) {
            Logger::logError("[" + name_ + "] Callback failed with unknown exception");
        }

        // The callback may have stopped or destroyed this timer
        if (context->stopRequested) {
            return;
        }
        scheduleNext();
    }
} // namespace jobcore::timer
