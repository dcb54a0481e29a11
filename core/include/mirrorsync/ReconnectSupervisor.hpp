// Re-establishes a dropped transport connection. One attempt per loss: a failed
// attempt ends the session with a connection error.
#pragma once
#include "Reporter.hpp"
#include "SessionContext.hpp"
#include "TransportClient.hpp"

namespace mirrorsync {

class ReconnectSupervisor {
public:
    ReconnectSupervisor(TransportClient& transport,
                        const SessionOptions& options,
                        Reporter& reporter,
                        SessionContext& ctx,
                        std::chrono::milliseconds delay)
        : transport_(transport), options_(options), reporter_(reporter), ctx_(ctx), delay_(delay) {}

    // Disconnect, wait the reconnect delay, connect again.
    // False when the attempt failed or the session was stopped during the wait.
    bool recover();

    int reconnects() const { return reconnects_; }

private:
    TransportClient& transport_;
    const SessionOptions& options_;
    Reporter& reporter_;
    SessionContext& ctx_;
    const std::chrono::milliseconds delay_;
    int reconnects_ = 0;
};

} // namespace mirrorsync
