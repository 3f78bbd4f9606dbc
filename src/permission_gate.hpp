// =============================================================================
// HostLink - USB Permission Gate
// =============================================================================
// Tracks and requests OS-level access to the USB device. The platform prompt
// is callback driven; requestPermission() bridges it to a blocking call.
// At most one prompt is in flight: concurrent callers share its outcome.
// =============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <vector>
#include "event_bus.hpp"
#include "result.hpp"

namespace hostlink {

// Platform side of the permission prompt.
class UsbPermissionPlatform {
public:
    virtual ~UsbPermissionPlatform() = default;

    virtual bool hasPermission() = 0;

    // Shows the prompt. `done` must be invoked exactly once, from any thread
    // (possibly before this call returns), while the gate is alive.
    virtual void requestPermission(std::function<void(bool granted)> done) = 0;

    // Best-effort dismissal of an open prompt
    virtual void cancelRequest() {}
};

enum class PermissionResult : uint8_t { Granted, Denied };

class PermissionGate {
public:
    using Listener = std::function<void(bool granted)>;

    explicit PermissionGate(std::shared_ptr<UsbPermissionPlatform> platform);
    ~PermissionGate();

    PermissionGate(const PermissionGate&) = delete;
    PermissionGate& operator=(const PermissionGate&) = delete;

    bool hasPermission() const;

    // Blocks until the platform answers.
    //   Timeout    this caller stopped waiting; the prompt stays pending
    //   Cancelled  cancelPendingRequest() resolved the prompt
    Result<PermissionResult> requestPermission(std::chrono::milliseconds timeout);

    bool requestPending() const;
    void cancelPendingRequest();

    // Grant/revoke notifications, including ones the platform reports outside
    // a request (e.g. device unplugged and replugged).
    SubscriptionHandle onPermissionChanged(Listener fn);
    void notifyPermissionChanged(bool granted);

    uint64_t promptsShown() const { return prompts_shown_; }

private:
    enum class Outcome : uint8_t { Granted, Denied, Cancelled };

    struct Pending {
        std::promise<Outcome> promise;
        std::shared_future<Outcome> future;
        bool resolved = false;
    };

    void resolve(const std::shared_ptr<Pending>& p, Outcome outcome);

    std::shared_ptr<UsbPermissionPlatform> platform_;

    mutable std::mutex mutex_;
    std::shared_ptr<Pending> pending_;
    std::vector<std::pair<uint64_t, Listener>> listeners_;
    uint64_t next_listener_id_ = 1;
    std::atomic<uint64_t> prompts_shown_{0};
};

} // namespace hostlink
