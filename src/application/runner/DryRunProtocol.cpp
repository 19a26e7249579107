#include "application/runner/DryRunProtocol.hpp"
#include "logger/Logger.hpp"

#include <utility>

namespace jobcore::application {
    DryRunProtocol::DryRunProtocol(bool echoLines)
            : echoLines_(echoLines) {
    }

    std::set<protocol::JobVariant> DryRunProtocol::supportedJobs() const {
        return {protocol::JobVariant::LocalFile, protocol::JobVariant::LocalGCodeFile};
    }

    void DryRunProtocol::registerListener(std::shared_ptr<protocol::FileAwareProtocolListener> listener) {
        listeners_.add(listener);
    }

    void DryRunProtocol::unregisterListener(const std::shared_ptr<protocol::FileAwareProtocolListener> &listener) {
        listeners_.remove(listener);
    }

    void DryRunProtocol::send(const std::string &line) {
        ++sentLines_;
        if (echoLines_) {
            Logger::logInfo("[DryRunProtocol] >> " + line);
        }
    }
} // namespace jobcore::application
