// =============================================================================
// HostLink - Transport Link
// =============================================================================
// One byte-stream contract over three link types:
//   UsbDirect     libusb bulk endpoint pair (needs PermissionGate access)
//   AdbTunnel     TCP to the local port a host-side tunnel forwards
//   SimulatedTcp  TCP to a configured loopback endpoint (dev/test only)
// At most one link is open per process. Writes are serialized; exactly one
// thread is expected to read.
// =============================================================================
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include "config_loader.hpp"
#include "hostlink_types.hpp"
#include "permission_gate.hpp"
#include "result.hpp"

namespace hostlink {

// Backend for one transport kind. Instances are single-use: open once,
// shutdown, destroy.
class TransportBackend {
public:
    virtual ~TransportBackend() = default;

    // Kind-specific failures:
    //   UsbDirect     BackendUnavailable (no device / endpoints)
    //   TCP kinds     HostUnreachable
    virtual Status open() = 0;

    // Blocks until at least one byte arrives. Ok(0) means end of stream.
    virtual Result<size_t> read(uint8_t* buf, size_t len) = 0;

    // May write fewer than `len` bytes
    virtual Result<size_t> write(const uint8_t* buf, size_t len) = 0;

    // Unblocks a pending read and fails later I/O. Idempotent, thread-safe.
    virtual void shutdown() = 0;

    virtual const char* name() const = 0;
};

using BackendFactory = std::function<std::unique_ptr<TransportBackend>(TransportKind)>;

// libusb for UsbDirect, POSIX TCP for AdbTunnel/SimulatedTcp
BackendFactory defaultBackendFactory(const config::AppConfig& cfg);

struct LinkHandle {
    TransportKind kind = TransportKind::UsbDirect;
    uint64_t session = 0;   // increments on every successful open
};

class TransportLink {
public:
    TransportLink(PermissionGate& gate, BackendFactory factory);
    ~TransportLink();

    TransportLink(const TransportLink&) = delete;
    TransportLink& operator=(const TransportLink&) = delete;

    //   PermissionDenied    UsbDirect without a grant
    //   BackendUnavailable  UsbDirect with no responding device
    //   HostUnreachable     TCP endpoint refused / timed out
    //   Busy                a link is already open in this process
    Result<LinkHandle> open(TransportKind kind);

    // Ok(0) on end of stream; LinkLost once closed
    Result<size_t> read(uint8_t* buf, size_t len);

    // Writes all of `buf` or fails. Concurrent callers never interleave.
    Result<size_t> write(const uint8_t* buf, size_t len);

    // Safe to call repeatedly, before open, and while another thread reads.
    void close();

    bool isOpen() const;
    std::optional<LinkHandle> handle() const;

    uint64_t bytesRead() const { return bytes_read_.load(); }
    uint64_t bytesWritten() const { return bytes_written_.load(); }

private:
    std::shared_ptr<TransportBackend> backend() const;

    PermissionGate& gate_;
    BackendFactory factory_;

    mutable std::mutex mutex_;
    std::mutex write_mutex_;
    std::shared_ptr<TransportBackend> backend_;
    std::optional<LinkHandle> handle_;
    uint64_t session_counter_ = 0;

    std::atomic<uint64_t> bytes_read_{0};
    std::atomic<uint64_t> bytes_written_{0};

    static std::atomic<TransportLink*> s_active_;
};

} // namespace hostlink
