#pragma once

#include "jobcore/events/ListenerRegistry.hpp"
#include "jobcore/protocol/Protocol.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <set>
#include <string>

namespace jobcore::application {

/**
 * @brief Protocol without a device: every line handed to it is logged and counted.
 */
    class DryRunProtocol : public protocol::Protocol {
    public:
        explicit DryRunProtocol(bool echoLines = true);

        std::set<protocol::JobVariant> supportedJobs() const override;

        void registerListener(std::shared_ptr<protocol::FileAwareProtocolListener> listener) override;

        void unregisterListener(const std::shared_ptr<protocol::FileAwareProtocolListener> &listener) override;

        void send(const std::string &line);

        size_t getSentLines() const { return sentLines_; }

    private:
        bool echoLines_;
        std::atomic<size_t> sentLines_{0};
        events::ListenerRegistry<protocol::FileAwareProtocolListener> listeners_{"DryRunProtocol"};
    };

} // namespace jobcore::application
