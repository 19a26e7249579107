#pragma once

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace jobcore::timer {

/**
 * @brief Runs a callback every interval on a dedicated Boost.Asio thread.
 *
 * The optional condition is evaluated before every tick; once it returns false the timer
 * stops on its own. stop() called from another thread returns only after the worker has
 * exited, so no callback runs after it. stop() from inside the callback is allowed and
 * prevents any further tick.
 */
    class RepeatedTimer {
    public:
        using Callback = std::function<void()>;
        using Condition = std::function<bool()>;

        RepeatedTimer(std::chrono::milliseconds interval, Callback callback, Condition condition = nullptr,
                      std::string name = "RepeatedTimer");

        ~RepeatedTimer();

        RepeatedTimer(const RepeatedTimer &) = delete;

        RepeatedTimer &operator=(const RepeatedTimer &) = delete;

        void start();

        void stop();

        bool isRunning() const;

        size_t getTickCount() const { return ticks_; }

        std::chrono::milliseconds getInterval() const { return interval_; }

    private:
        struct Context {
            boost::asio::io_context io;
            boost::asio::steady_timer timer{io};
            std::atomic<bool> stopRequested{false};
        };

        std::chrono::milliseconds interval_;
        Callback callback_;
        Condition condition_;
        std::string name_;

        std::shared_ptr<Context> context_;
        std::thread worker_;
        std::mutex controlMutex_;
        std::atomic<bool> started_{false};
        std::atomic<bool> running_{false};
        std::atomic<size_t> ticks_{0};

        void scheduleNext();

        void onTick(const std::shared_ptr<Context> &context, const boost::system::error_code &ec);
    };

} // namespace jobcore::timer
