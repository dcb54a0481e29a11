#include "mirrorsync/ReconnectSupervisor.hpp"
#include "mirrorsync/Log.hpp"

namespace mirrorsync {

bool ReconnectSupervisor::recover() {
    reporter_.warn("Connection lost. Attempting to reconnect...");
    transport_.disconnect();
    if (!ctx_.sleepFor(delay_)) return false;

    std::string err;
    if (!transport_.connect(options_, err)) {
        reporter_.error(ErrorKind::Connection, "Reconnection failed: " + err);
        return false;
    }
    ++reconnects_;
    LOGI("reconnected to %s:%u", options_.host.c_str(), (unsigned)options_.port);
    reporter_.info("Reconnected successfully");
    return true;
}

} // namespace mirrorsync
