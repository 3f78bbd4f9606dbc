#pragma once
#include <atomic>
#include <cstdint>
#include <vector>
#include <libusb-1.0/libusb.h>
#include "config_loader.hpp"
#include "permission_gate.hpp"
#include "transport_link.hpp"

namespace hostlink {

/**
 * USB bulk byte stream (libusb-1.0).
 * Opens the configured VID/PID, claims the interface and locates its bulk
 * IN/OUT endpoint pair. Reads loop on short bulk timeouts so shutdown() is
 * noticed promptly; bytes beyond the caller's buffer are kept for the next
 * read.
 */
class UsbBulkBackend : public TransportBackend {
public:
    explicit UsbBulkBackend(const config::UsbConfig& cfg);
    ~UsbBulkBackend() override;

    Status open() override;
    Result<size_t> read(uint8_t* buf, size_t len) override;
    Result<size_t> write(const uint8_t* buf, size_t len) override;
    void shutdown() override;
    const char* name() const override { return "usb"; }

private:
    bool find_bulk_endpoints();
    void release();

    config::UsbConfig cfg_;
    libusb_context* ctx_ = nullptr;
    libusb_device_handle* handle_ = nullptr;
    bool claimed_ = false;
    uint8_t ep_out_ = 0;
    uint8_t ep_in_ = 0;
    uint16_t max_packet_in_ = 512;

    std::vector<uint8_t> rx_buf_;
    size_t rx_pos_ = 0;
    size_t rx_len_ = 0;
    std::atomic<bool> shut_{false};
};

/**
 * Desktop permission platform: access is granted when the configured device
 * can be opened (libusb_open does not fail with LIBUSB_ERROR_ACCESS). There is
 * no interactive prompt; a request answers with the current access state.
 */
class LibusbPermissionPlatform : public UsbPermissionPlatform {
public:
    explicit LibusbPermissionPlatform(const config::UsbConfig& cfg) : cfg_(cfg) {}

    bool hasPermission() override;
    void requestPermission(std::function<void(bool granted)> done) override;

private:
    config::UsbConfig cfg_;
};

} // namespace hostlink
