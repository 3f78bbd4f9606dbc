#include "permission_gate.hpp"
#include <algorithm>
#include "hostlink_log.hpp"

namespace hostlink {

PermissionGate::PermissionGate(std::shared_ptr<UsbPermissionPlatform> platform)
    : platform_(std::move(platform)) {}

PermissionGate::~PermissionGate() {
    cancelPendingRequest();
}

bool PermissionGate::hasPermission() const {
    return platform_ && platform_->hasPermission();
}

bool PermissionGate::requestPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_ != nullptr;
}

Result<PermissionResult> PermissionGate::requestPermission(std::chrono::milliseconds timeout) {
    if (!platform_) {
        return Err<PermissionResult>(ErrorKind::BackendUnavailable, "no USB permission platform");
    }
    if (platform_->hasPermission()) return Ok(PermissionResult::Granted);

    std::shared_ptr<Pending> p;
    std::shared_future<Outcome> fut;
    bool start = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_) {
            pending_ = std::make_shared<Pending>();
            pending_->future = pending_->promise.get_future().share();
            start = true;
        }
        p = pending_;
        fut = p->future;
    }

    if (start) {
        prompts_shown_.fetch_add(1);
        HLOG_INFO("perm", "Requesting USB permission");
        platform_->requestPermission([this, p](bool granted) {
            resolve(p, granted ? Outcome::Granted : Outcome::Denied);
        });
    } else {
        HLOG_DEBUG("perm", "Joining pending permission request");
    }

    if (fut.wait_for(timeout) != std::future_status::ready) {
        HLOG_WARN("perm", "Permission request timed out after %lld ms", (long long)timeout.count());
        return Err<PermissionResult>(ErrorKind::Timeout, "no answer to USB permission prompt");
    }

    switch (fut.get()) {
        case Outcome::Granted:   return Ok(PermissionResult::Granted);
        case Outcome::Denied:    return Ok(PermissionResult::Denied);
        case Outcome::Cancelled: break;
    }
    return Err<PermissionResult>(ErrorKind::Cancelled, "permission request cancelled");
}

void PermissionGate::cancelPendingRequest() {
    std::shared_ptr<Pending> p;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        p = pending_;
    }
    if (!p) return;
    HLOG_INFO("perm", "Cancelling pending permission request");
    if (platform_) platform_->cancelRequest();
    resolve(p, Outcome::Cancelled);
}

void PermissionGate::resolve(const std::shared_ptr<Pending>& p, Outcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (p->resolved) return;  // platform answered after cancel, or twice
        p->resolved = true;
        if (pending_ == p) pending_.reset();
    }
    p->promise.set_value(outcome);

    if (outcome == Outcome::Cancelled) return;
    bool granted = outcome == Outcome::Granted;
    HLOG_INFO("perm", "USB permission %s", granted ? "granted" : "denied");
    notifyPermissionChanged(granted);
}

SubscriptionHandle PermissionGate::onPermissionChanged(Listener fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(fn));
    return SubscriptionHandle([this, id]() {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
            [id](const std::pair<uint64_t, Listener>& l) { return l.first == id; }), listeners_.end());
    });
}

void PermissionGate::notifyPermissionChanged(bool granted) {
    std::vector<std::pair<uint64_t, Listener>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = listeners_;
    }
    for (auto& l : snapshot) l.second(granted);

    PermissionChangedEvent ev;
    ev.granted = granted;
    bus().publish(ev);
}

} // namespace hostlink
