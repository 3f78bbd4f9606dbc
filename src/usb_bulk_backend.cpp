#include "usb_bulk_backend.hpp"
#include <algorithm>
#include <cstring>
#include "hostlink_log.hpp"

namespace hostlink {

UsbBulkBackend::UsbBulkBackend(const config::UsbConfig& cfg) : cfg_(cfg) {}

UsbBulkBackend::~UsbBulkBackend() {
    shutdown();
    release();
}

void UsbBulkBackend::release() {
    if (handle_) {
        if (claimed_) libusb_release_interface(handle_, cfg_.interface_number);
        libusb_close(handle_);
        handle_ = nullptr;
        claimed_ = false;
    }
    if (ctx_) {
        libusb_exit(ctx_);
        ctx_ = nullptr;
    }
}

Status UsbBulkBackend::open() {
    int ret = libusb_init(&ctx_);
    if (ret != LIBUSB_SUCCESS) {
        HLOG_ERROR("usb", "Failed to init libusb: %s", libusb_error_name(ret));
        ctx_ = nullptr;
        return Error(ErrorKind::BackendUnavailable, "libusb_init failed");
    }

    handle_ = libusb_open_device_with_vid_pid(ctx_, (uint16_t)cfg_.vendor_id, (uint16_t)cfg_.product_id);
    if (!handle_) {
        HLOG_INFO("usb", "No device %04x:%04x", cfg_.vendor_id, cfg_.product_id);
        release();
        return Error(ErrorKind::BackendUnavailable, "no USB device responded");
    }

    libusb_set_auto_detach_kernel_driver(handle_, 1);
    ret = libusb_claim_interface(handle_, cfg_.interface_number);
    if (ret != LIBUSB_SUCCESS) {
        HLOG_ERROR("usb", "Failed to claim interface %d: %s", cfg_.interface_number, libusb_error_name(ret));
        release();
        return Error(ErrorKind::BackendUnavailable, "claim interface failed");
    }
    claimed_ = true;

    if (!find_bulk_endpoints()) {
        release();
        return Error(ErrorKind::BackendUnavailable, "no bulk endpoint pair");
    }

    // Whole multiple of the packet size so a bulk IN never overflows
    size_t pkt = max_packet_in_ > 0 ? max_packet_in_ : 512;
    rx_buf_.resize(((16 * 1024 + pkt - 1) / pkt) * pkt);
    rx_pos_ = 0;
    rx_len_ = 0;
    HLOG_INFO("usb", "Opened %04x:%04x (IN 0x%02x, OUT 0x%02x)",
              cfg_.vendor_id, cfg_.product_id, ep_in_, ep_out_);
    return Ok();
}

bool UsbBulkBackend::find_bulk_endpoints() {
    libusb_device* dev = libusb_get_device(handle_);
    struct libusb_config_descriptor* config = nullptr;
    if (libusb_get_active_config_descriptor(dev, &config) != LIBUSB_SUCCESS) {
        HLOG_ERROR("usb", "Failed to get config descriptor");
        return false;
    }

    ep_out_ = 0;
    ep_in_ = 0;
    if (cfg_.interface_number < config->bNumInterfaces) {
        const auto& alt = config->interface[cfg_.interface_number].altsetting[0];
        for (int i = 0; i < alt.bNumEndpoints; i++) {
            const struct libusb_endpoint_descriptor* ep = &alt.endpoint[i];
            if ((ep->bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) != LIBUSB_TRANSFER_TYPE_BULK) continue;
            if ((ep->bEndpointAddress & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_OUT) {
                ep_out_ = ep->bEndpointAddress;
            } else {
                ep_in_ = ep->bEndpointAddress;
                max_packet_in_ = ep->wMaxPacketSize;
            }
        }
    }
    libusb_free_config_descriptor(config);

    if (ep_out_ == 0 || ep_in_ == 0) {
        HLOG_WARN("usb", "Bulk endpoints incomplete (IN 0x%02x, OUT 0x%02x)", ep_in_, ep_out_);
        return false;
    }
    return true;
}

Result<size_t> UsbBulkBackend::read(uint8_t* buf, size_t len) {
    if (!handle_) return Err<size_t>(ErrorKind::LinkLost, "device closed");

    while (rx_pos_ >= rx_len_) {
        if (shut_.load()) return Err<size_t>(ErrorKind::LinkLost, "device shut down");
        int transferred = 0;
        int ret = libusb_bulk_transfer(handle_, ep_in_, rx_buf_.data(), (int)rx_buf_.size(),
                                       &transferred, cfg_.io_timeout_ms);
        if (ret != LIBUSB_SUCCESS && ret != LIBUSB_ERROR_TIMEOUT) {
            HLOG_ERROR("usb", "Bulk IN error: %s", libusb_error_name(ret));
            return Err<size_t>(ErrorKind::LinkLost, std::string("bulk IN: ") + libusb_error_name(ret));
        }
        // Timeout with no data is normal: loop to poll shut_
        rx_pos_ = 0;
        rx_len_ = (size_t)transferred;
    }

    size_t n = std::min(len, rx_len_ - rx_pos_);
    memcpy(buf, rx_buf_.data() + rx_pos_, n);
    rx_pos_ += n;
    return Ok(n);
}

Result<size_t> UsbBulkBackend::write(const uint8_t* buf, size_t len) {
    if (!handle_ || shut_.load()) return Err<size_t>(ErrorKind::LinkLost, "device shut down");

    int transferred = 0;
    int ret = libusb_bulk_transfer(handle_, ep_out_, const_cast<uint8_t*>(buf), (int)len,
                                   &transferred, 1000);
    if (ret == LIBUSB_ERROR_TIMEOUT && transferred > 0) return Ok((size_t)transferred);
    if (ret != LIBUSB_SUCCESS) {
        HLOG_ERROR("usb", "Bulk OUT error: %s", libusb_error_name(ret));
        return Err<size_t>(ErrorKind::LinkLost, std::string("bulk OUT: ") + libusb_error_name(ret));
    }
    return Ok((size_t)transferred);
}

void UsbBulkBackend::shutdown() {
    shut_.store(true);
}

// =============================================================================
// LibusbPermissionPlatform
// =============================================================================

bool LibusbPermissionPlatform::hasPermission() {
    libusb_context* ctx = nullptr;
    if (libusb_init(&ctx) != LIBUSB_SUCCESS) return false;

    bool granted = false;
    libusb_device** devs = nullptr;
    ssize_t cnt = libusb_get_device_list(ctx, &devs);
    for (ssize_t i = 0; i < cnt; i++) {
        struct libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(devs[i], &desc) != 0) continue;
        if (desc.idVendor != (uint16_t)cfg_.vendor_id || desc.idProduct != (uint16_t)cfg_.product_id) continue;

        libusb_device_handle* h = nullptr;
        int ret = libusb_open(devs[i], &h);
        if (ret == LIBUSB_SUCCESS) {
            libusb_close(h);
            granted = true;
        } else if (ret == LIBUSB_ERROR_ACCESS) {
            HLOG_INFO("perm", "Device %04x:%04x present but not accessible", desc.idVendor, desc.idProduct);
        }
        break;
    }
    if (cnt >= 0) libusb_free_device_list(devs, 1);
    libusb_exit(ctx);
    return granted;
}

void LibusbPermissionPlatform::requestPermission(std::function<void(bool granted)> done) {
    done(hasPermission());
}

} // namespace hostlink
