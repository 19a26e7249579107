#pragma once

#include "logger/Logger.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace jobcore::events {

    struct DispatchResult {
        size_t delivered = 0;
        size_t failed = 0;

        bool allDelivered() const {
            return failed == 0;
        }
    };

    /**
     * @brief Ordered set of non-owned listeners with fault isolated fan-out.
     *
     * Listeners are kept as weak references in registration order. notify() runs every
     * handler outside the registry lock, so a handler may register or unregister
     * listeners, and an exception thrown by one handler is logged and counted without
     * reaching the caller or the remaining listeners.
     */
    template<typename Listener>
    class ListenerRegistry {
    public:
        using Handler = std::function<void(Listener &)>;

        explicit ListenerRegistry(std::string owner) : owner_(std::move(owner)) {}

        bool add(const std::shared_ptr<Listener> &listener) {
            if (!listener) {
                return false;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &existing: listeners_) {
                if (sameListener(existing, listener)) {
                    return false;
                }
            }
            listeners_.push_back(listener);
            return true;
        }

        bool remove(const std::shared_ptr<Listener> &listener) {
            std::lock_guard<std::mutex> lock(mutex_);
            bool removed = false;
            auto it = listeners_.begin();
            while (it != listeners_.end()) {
                if (listener && !removed && sameListener(*it, listener)) {
                    it = listeners_.erase(it);
                    removed = true;
                } else if (it->expired()) {
                    it = listeners_.erase(it);
                } else {
                    ++it;
                }
            }
            return removed;
        }

        bool contains(const std::shared_ptr<Listener> &listener) const {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &existing: listeners_) {
                if (sameListener(existing, listener)) {
                    return !existing.expired();
                }
            }
            return false;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t alive = 0;
            for (const auto &existing: listeners_) {
                if (!existing.expired()) {
                    ++alive;
                }
            }
            return alive;
        }

        DispatchResult notify(const std::string &eventName, const Handler &handler) {
            DispatchResult result;
            for (const auto &listener: snapshot()) {
                try {
                    handler(*listener);
                    ++result.delivered;
                } catch (const std::exception &e) {
                    ++result.failed;
                    Logger::logError("[" + owner_ + "] Exception while calling " + eventName +
                                     " on listener: " + e.what());
                } catch (...) {
                    ++result.failed;
                    Logger::logError("[" + owner_ + "] Unknown exception while calling " + eventName +
                                     " on listener");
                }
            }
            return result;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<std::weak_ptr<Listener>> listeners_;
        std::string owner_;

        static bool sameListener(const std::weak_ptr<Listener> &a, const std::shared_ptr<Listener> &b) {
            return !a.owner_before(b) && !b.owner_before(a);
        }

        std::vector<std::shared_ptr<Listener>> snapshot() {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<std::shared_ptr<Listener>> alive;
            alive.reserve(listeners_.size());

            auto it = listeners_.begin();
            while (it != listeners_.end()) {
                if (auto listener = it->lock()) {
                    alive.push_back(std::move(listener));
                    ++it;
                } else {
                    it = listeners_.erase(it);
                }
            }
            return alive;
        }
    };

} // namespace jobcore::events
