// =============================================================================
// HostLink - Connection State Machine
// =============================================================================
// Merges PermissionGate and TransportLink outcomes into one ConnectionState.
//
//   Disconnected --connect--> Connecting(UsbDirect)      (permission held)
//   Disconnected --connect--> PermissionRequired         (no permission)
//   PermissionRequired --granted--> Connecting(UsbDirect)
//   PermissionRequired --denied---> Connecting(AdbTunnel)
//   Connecting(UsbDirect) --BackendUnavailable--> Connecting(AdbTunnel)
//   Connecting(AdbTunnel) --HostUnreachable--> Connecting(SimulatedTcp)
//                                              (simulation enabled, else Error)
//   Connecting(k) --open ok--> Connected(k)
//   Connected(k) --link error--> Error(reason)
//   any --disconnect--> Disconnected
//
// Error is never retried automatically.
// =============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include "event_bus.hpp"
#include "hostlink_types.hpp"
#include "observable.hpp"
#include "permission_gate.hpp"
#include "result.hpp"
#include "transport_link.hpp"

namespace hostlink {

class ConnectionStateMachine {
public:
    struct Options {
        bool enable_simulation = false;
        std::chrono::milliseconds permission_timeout{30000};
    };

    ConnectionStateMachine(PermissionGate& gate, TransportLink& link, Options opts);
    ~ConnectionStateMachine();

    ConnectionStateMachine(const ConnectionStateMachine&) = delete;
    ConnectionStateMachine& operator=(const ConnectionStateMachine&) = delete;

    // Runs the fallback sequence to Connected or Error.
    //   Ok         Connected (also when already connected)
    //   Busy       another connect() is running
    //   Cancelled  disconnect() interrupted this attempt
    // Other errors are the failure that ended in Error(reason).
    Status connect();

    // Always reaches Disconnected. Cancels a pending permission prompt and
    // closes the link, unblocking a connect() in progress.
    void disconnect();

    // Collaborator-initiated prompt outside connect()
    Result<PermissionResult> requestPermission();

    // Called by the link reader on an I/O failure. Ignored unless Connected,
    // or when `link_session` (non-zero) names a link that is no longer open.
    void reportLinkError(const Error& err, uint64_t link_session = 0);

    ConnectionState current() const { return state_.get(); }
    Observable<ConnectionState>& state() { return state_; }

    TransportLink& link() { return link_; }
    const Options& options() const { return opts_; }

private:
    // Applies `next` unless a disconnect superseded session `gen`
    bool transition(uint64_t gen, const ConnectionState& next);
    void publish(const ConnectionState& prev, const ConnectionState& next);
    Status fail(uint64_t gen, const Error& err);

    PermissionGate& gate_;
    TransportLink& link_;
    Options opts_;

    Observable<ConnectionState> state_;
    std::recursive_mutex publish_mutex_;   // orders transitions with their notifications
    std::mutex gen_mutex_;
    uint64_t session_gen_ = 0;
    std::atomic<bool> connecting_{false};

    SubscriptionHandle permission_sub_;
};

} // namespace hostlink
