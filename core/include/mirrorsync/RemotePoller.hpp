// Remote -> local mode: periodic listing of the remote folder with adaptive intervals.
#pragma once
#include "FileStateTable.hpp"
#include "ReconnectSupervisor.hpp"
#include "SessionContext.hpp"
#include "SyncTypes.hpp"

namespace mirrorsync {

// Adaptive poll interval. After a change the poller checks often, then backs
// off to the configured base interval while the remote stays quiet.
struct PollState {
    int noChangeCount = 0;
    std::chrono::milliseconds interval{0};

    // Back to the fastest band.
    void reset(const EngineTuning& tuning);
    // Account for one finished cycle and pick the next interval.
    void advance(bool changed, const EngineTuning& tuning, std::chrono::milliseconds base);
};

// Interval for a given count of consecutive quiet cycles.
std::chrono::milliseconds pollIntervalFor(int noChangeCount,
                                          const EngineTuning& tuning,
                                          std::chrono::milliseconds base);

class RemotePoller {
public:
    RemotePoller(TransportClient& transport,
                 const SyncConfig& cfg,
                 Reporter& reporter,
                 SessionContext& ctx,
                 ReconnectSupervisor& supervisor);

    // One detection cycle followed by connection recovery if needed.
    // False when the session has to end with a connection error.
    bool cycle();

    // Cycle and sleep until stopped. False on a fatal connection error.
    bool run();

    const PollState& pollState() const { return poll_; }
    const FileStateTable& table() const { return table_; }

private:
    TransportClient& transport_;
    const SyncConfig& cfg_;
    Reporter& reporter_;
    SessionContext& ctx_;
    ReconnectSupervisor& supervisor_;
    FileStateTable table_;
    PollState poll_;
};

} // namespace mirrorsync
