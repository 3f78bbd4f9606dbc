#include "transport_link.hpp"
#include "hostlink_log.hpp"
#include "tcp_backend.hpp"
#include "usb_bulk_backend.hpp"

namespace hostlink {

std::atomic<TransportLink*> TransportLink::s_active_{nullptr};

BackendFactory defaultBackendFactory(const config::AppConfig& cfg) {
    return [cfg](TransportKind kind) -> std::unique_ptr<TransportBackend> {
        switch (kind) {
            case TransportKind::UsbDirect:
                return std::make_unique<UsbBulkBackend>(cfg.usb);
            case TransportKind::AdbTunnel:
                return std::make_unique<TcpBackend>(cfg.link.adb_host, cfg.link.adb_port,
                                                    cfg.link.connect_timeout_ms);
            case TransportKind::SimulatedTcp:
                return std::make_unique<TcpBackend>(cfg.link.simulated_host, cfg.link.simulated_port,
                                                    cfg.link.connect_timeout_ms);
        }
        return nullptr;
    };
}

TransportLink::TransportLink(PermissionGate& gate, BackendFactory factory)
    : gate_(gate), factory_(std::move(factory)) {}

TransportLink::~TransportLink() {
    close();
}

Result<LinkHandle> TransportLink::open(TransportKind kind) {
    TransportLink* expected = nullptr;
    if (!s_active_.compare_exchange_strong(expected, this)) {
        HLOG_WARN("link", "open(%s) refused: a link is already open", transportKindName(kind));
        return Err<LinkHandle>(ErrorKind::Busy, "another transport link is open");
    }

    if (kind == TransportKind::UsbDirect && !gate_.hasPermission()) {
        s_active_ = nullptr;
        return Err<LinkHandle>(ErrorKind::PermissionDenied, "USB access not granted");
    }

    std::shared_ptr<TransportBackend> be = factory_ ? factory_(kind) : nullptr;
    if (!be) {
        s_active_ = nullptr;
        auto why = kind == TransportKind::UsbDirect ? ErrorKind::BackendUnavailable : ErrorKind::HostUnreachable;
        return Err<LinkHandle>(why, std::string("no backend for ") + transportKindName(kind));
    }

    auto s = be->open();
    if (s.is_err()) {
        HLOG_INFO("link", "%s open failed: %s", be->name(), s.error().describe().c_str());
        be->shutdown();
        s_active_ = nullptr;
        return s.error();
    }

    LinkHandle h;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend_ = std::move(be);
        h.kind = kind;
        h.session = ++session_counter_;
        handle_ = h;
    }
    HLOG_INFO("link", "Opened %s link (session %llu)", transportKindName(kind),
              (unsigned long long)h.session);
    return Ok(h);
}

std::shared_ptr<TransportBackend> TransportLink::backend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_;
}

Result<size_t> TransportLink::read(uint8_t* buf, size_t len) {
    // Holding a reference keeps the backend alive if close() races this read
    auto be = backend();
    if (!be) return Err<size_t>(ErrorKind::LinkLost, "link closed");
    auto r = be->read(buf, len);
    if (r.is_ok()) bytes_read_.fetch_add(r.value());
    return r;
}

Result<size_t> TransportLink::write(const uint8_t* buf, size_t len) {
    std::lock_guard<std::mutex> wlock(write_mutex_);
    auto be = backend();
    if (!be) return Err<size_t>(ErrorKind::LinkLost, "link closed");

    size_t sent = 0;
    while (sent < len) {
        auto r = be->write(buf + sent, len - sent);
        if (r.is_err()) return r;
        if (r.value() == 0) return Err<size_t>(ErrorKind::LinkLost, "backend accepted no bytes");
        sent += r.value();
    }
    bytes_written_.fetch_add(sent);
    return Ok(sent);
}

void TransportLink::close() {
    std::shared_ptr<TransportBackend> be;
    std::optional<LinkHandle> h;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        be = std::move(backend_);
        backend_.reset();
        h = handle_;
        handle_.reset();
    }
    if (!be) return;
    be->shutdown();
    HLOG_INFO("link", "Closed %s link (session %llu)", transportKindName(h->kind),
              (unsigned long long)h->session);
    TransportLink* self = this;
    s_active_.compare_exchange_strong(self, nullptr);
}

bool TransportLink::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_ != nullptr;
}

std::optional<LinkHandle> TransportLink::handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_;
}

} // namespace hostlink
