#include "connection_state_machine.hpp"
#include "hostlink_log.hpp"

namespace hostlink {

ConnectionStateMachine::ConnectionStateMachine(PermissionGate& gate, TransportLink& link, Options opts)
    : gate_(gate), link_(link), opts_(opts) {
    // Revocation while on USB behaves like a dropped link
    permission_sub_ = gate_.onPermissionChanged([this](bool granted) {
        if (granted) return;
        auto s = current();
        if (s.phase == ConnectionState::Phase::Connected && s.transport == TransportKind::UsbDirect) {
            reportLinkError(Error(ErrorKind::PermissionDenied, "USB permission revoked"));
        }
    });
}

ConnectionStateMachine::~ConnectionStateMachine() {
    permission_sub_.reset();
    disconnect();
}

void ConnectionStateMachine::publish(const ConnectionState& prev, const ConnectionState& next) {
    HLOG_INFO("conn", "%s -> %s", prev.toString().c_str(), next.toString().c_str());
    state_.set(next);
    ConnectionStateChangedEvent ev;
    ev.previous = prev;
    ev.current = next;
    bus().publish(ev);
}

bool ConnectionStateMachine::transition(uint64_t gen, const ConnectionState& next) {
    std::lock_guard<std::recursive_mutex> plock(publish_mutex_);
    {
        std::lock_guard<std::mutex> lock(gen_mutex_);
        if (gen != session_gen_) return false;
    }
    auto prev = state_.get();
    if (prev == next) return true;
    publish(prev, next);
    return true;
}

Status ConnectionStateMachine::fail(uint64_t gen, const Error& err) {
    if (!transition(gen, ConnectionState::error(err.describe()))) {
        return Error(ErrorKind::Cancelled, "connect interrupted by disconnect");
    }
    return err;
}

Status ConnectionStateMachine::connect() {
    if (connecting_.exchange(true)) {
        return Error(ErrorKind::Busy, "connect already in progress");
    }
    struct Reset {
        std::atomic<bool>& f;
        ~Reset() { f = false; }
    } reset{connecting_};

    if (current().isConnected()) return Ok();

    uint64_t gen;
    {
        std::lock_guard<std::mutex> lock(gen_mutex_);
        gen = ++session_gen_;
    }
    const Status cancelled = Error(ErrorKind::Cancelled, "connect interrupted by disconnect");

    // Fresh attempt always starts from Disconnected's logic
    TransportKind kind = TransportKind::UsbDirect;
    if (!gate_.hasPermission()) {
        if (!transition(gen, ConnectionState::permissionRequired())) return cancelled;
        auto perm = gate_.requestPermission(opts_.permission_timeout);
        if (perm.is_err()) {
            if (perm.error().kind == ErrorKind::Cancelled) return cancelled;
            return fail(gen, perm.error());
        }
        kind = perm.value() == PermissionResult::Granted ? TransportKind::UsbDirect : TransportKind::AdbTunnel;
    }

    for (;;) {
        if (!transition(gen, ConnectionState::connecting(kind))) return cancelled;

        auto opened = link_.open(kind);
        if (opened.is_ok()) {
            if (!transition(gen, ConnectionState::connected(kind))) {
                // disconnect() ran while open() was in flight
                link_.close();
                return cancelled;
            }
            return Ok();
        }

        const Error& err = opened.error();
        if (kind == TransportKind::UsbDirect && err.kind == ErrorKind::BackendUnavailable) {
            HLOG_INFO("conn", "USB backend unavailable, falling back to ADB tunnel");
            kind = TransportKind::AdbTunnel;
            continue;
        }
        if (kind == TransportKind::AdbTunnel && err.kind == ErrorKind::HostUnreachable &&
            opts_.enable_simulation) {
            HLOG_INFO("conn", "ADB tunnel unreachable, falling back to simulated TCP");
            kind = TransportKind::SimulatedTcp;
            continue;
        }
        return fail(gen, err);
    }
}

void ConnectionStateMachine::disconnect() {
    {
        std::lock_guard<std::mutex> lock(gen_mutex_);
        ++session_gen_;
    }
    gate_.cancelPendingRequest();
    link_.close();

    std::lock_guard<std::recursive_mutex> plock(publish_mutex_);
    auto prev = state_.get();
    if (prev.phase == ConnectionState::Phase::Disconnected) return;
    publish(prev, ConnectionState::disconnected());
}

Result<PermissionResult> ConnectionStateMachine::requestPermission() {
    return gate_.requestPermission(opts_.permission_timeout);
}

void ConnectionStateMachine::reportLinkError(const Error& err, uint64_t link_session) {
    std::lock_guard<std::recursive_mutex> plock(publish_mutex_);
    auto prev = state_.get();
    if (link_session != 0) {
        auto h = link_.handle();
        if (!h || h->session != link_session) {
            HLOG_DEBUG("conn", "Ignoring error from stale link session %llu: %s",
                       (unsigned long long)link_session, err.describe().c_str());
            return;
        }
    }
    if (!prev.isConnected()) {
        HLOG_DEBUG("conn", "Ignoring link error while %s: %s", prev.toString().c_str(),
                   err.describe().c_str());
        return;
    }
    HLOG_WARN("conn", "Link error on %s: %s", transportKindName(prev.transport), err.describe().c_str());
    link_.close();
    publish(prev, ConnectionState::error(err.describe()));
}

} // namespace hostlink
