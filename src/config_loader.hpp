#pragma once
// =============================================================================
// HostLink Config Loader
// =============================================================================
// Loads settings from hostlink.json with nlohmann/json
// =============================================================================

#include <cstdint>
#include <fstream>
#include <string>
#include "hostlink_log.hpp"
#include <nlohmann/json.hpp>

namespace hostlink {
namespace config {

struct LinkConfig {
    std::string adb_host = "127.0.0.1";
    int adb_port = 5555;                // host-side tunnel forwards this port
    std::string simulated_host = "127.0.0.1";
    int simulated_port = 5555;
    bool enable_simulation = false;     // SimulatedTcp is never picked unless set
    int connect_timeout_ms = 3000;
    int permission_timeout_ms = 30000;
};

struct UsbConfig {
    int vendor_id = 0x18D1;
    int product_id = 0x2D00;            // accessory mode
    int interface_number = 0;
    int io_timeout_ms = 100;            // per libusb call; read loops on timeout
};

struct ProtocolConfig {
    uint32_t max_payload_bytes = 1024 * 1024;
    int request_timeout_ms = 5000;
    uint32_t correlation_id_space = 0xFFFFFFFFu;
    std::string client_id = "HostLink-Client-1.0";
};

struct TransferConfig {
    uint32_t chunk_size = 64 * 1024;
    int max_concurrent = 2;
    int chunk_timeout_ms = 10000;
    std::string history_path;           // empty: no persistence
};

struct LogConfig {
    std::string log_path;               // empty: stderr only
    std::string level = "info";
};

struct AppConfig {
    LinkConfig link;
    UsbConfig usb;
    ProtocolConfig protocol;
    TransferConfig transfer;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    auto sit = j.find(section);
    if (sit == j.end() || !sit->is_object()) return def;
    auto kit = sit->find(key);
    if (kit == sit->end()) return def;
    try {
        return kit->template get<T>();
    } catch (const nlohmann::json::exception& e) {
        HLOG_WARN("config", "%s.%s has wrong type (%s), using default",
                  section.c_str(), key.c_str(), e.what());
    }
    return def;
}

inline AppConfig configFromJson(const nlohmann::json& j) {
    AppConfig config;
    const AppConfig d;

    config.link.adb_host = jsonGet<std::string>(j, "link", "adb_host", d.link.adb_host);
    config.link.adb_port = jsonGet<int>(j, "link", "adb_port", d.link.adb_port);
    config.link.simulated_host = jsonGet<std::string>(j, "link", "simulated_host", d.link.simulated_host);
    config.link.simulated_port = jsonGet<int>(j, "link", "simulated_port", d.link.simulated_port);
    config.link.enable_simulation = jsonGet<bool>(j, "link", "enable_simulation", d.link.enable_simulation);
    config.link.connect_timeout_ms = jsonGet<int>(j, "link", "connect_timeout_ms", d.link.connect_timeout_ms);
    config.link.permission_timeout_ms = jsonGet<int>(j, "link", "permission_timeout_ms", d.link.permission_timeout_ms);

    config.usb.vendor_id = jsonGet<int>(j, "usb", "vendor_id", d.usb.vendor_id);
    config.usb.product_id = jsonGet<int>(j, "usb", "product_id", d.usb.product_id);
    config.usb.interface_number = jsonGet<int>(j, "usb", "interface_number", d.usb.interface_number);
    config.usb.io_timeout_ms = jsonGet<int>(j, "usb", "io_timeout_ms", d.usb.io_timeout_ms);

    config.protocol.max_payload_bytes = jsonGet<uint32_t>(j, "protocol", "max_payload_bytes", d.protocol.max_payload_bytes);
    config.protocol.request_timeout_ms = jsonGet<int>(j, "protocol", "request_timeout_ms", d.protocol.request_timeout_ms);
    config.protocol.correlation_id_space = jsonGet<uint32_t>(j, "protocol", "correlation_id_space", d.protocol.correlation_id_space);
    config.protocol.client_id = jsonGet<std::string>(j, "protocol", "client_id", d.protocol.client_id);

    config.transfer.chunk_size = jsonGet<uint32_t>(j, "transfer", "chunk_size", d.transfer.chunk_size);
    config.transfer.max_concurrent = jsonGet<int>(j, "transfer", "max_concurrent", d.transfer.max_concurrent);
    config.transfer.chunk_timeout_ms = jsonGet<int>(j, "transfer", "chunk_timeout_ms", d.transfer.chunk_timeout_ms);
    config.transfer.history_path = jsonGet<std::string>(j, "transfer", "history_path", d.transfer.history_path);

    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", d.log.log_path);
    config.log.level = jsonGet<std::string>(j, "log", "level", d.log.level);

    if (config.transfer.chunk_size == 0) {
        HLOG_WARN("config", "transfer.chunk_size must be > 0, using %u", d.transfer.chunk_size);
        config.transfer.chunk_size = d.transfer.chunk_size;
    }
    // A WRITE_CHUNK payload is a u64 offset plus the chunk
    {
        const uint32_t max_payload = config.protocol.max_payload_bytes;
        const uint32_t chunk_limit = max_payload > 8 ? max_payload - 8 : 1;
        if (config.transfer.chunk_size > chunk_limit) {
            HLOG_WARN("config", "transfer.chunk_size %u exceeds protocol.max_payload_bytes - 8, using %u",
                      config.transfer.chunk_size, chunk_limit);
            config.transfer.chunk_size = chunk_limit;
        }
    }
    if (config.transfer.max_concurrent < 1) config.transfer.max_concurrent = 1;
    if (config.protocol.correlation_id_space == 0) config.protocol.correlation_id_space = 1;
    return config;
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "hostlink.json",
                            bool strict = false) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("../hostlink.json");
    }
    if (!file.is_open()) {
        HLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config = configFromJson(j);
    } catch (const nlohmann::json::exception& e) {
        HLOG_ERROR("config", "JSON parse error: %s", e.what());
        return AppConfig{};
    }

    HLOG_INFO("config", "Loaded: adb=%s:%d, usb=%04x:%04x, chunk=%u, workers=%d",
              config.link.adb_host.c_str(), config.link.adb_port,
              config.usb.vendor_id, config.usb.product_id,
              config.transfer.chunk_size, config.transfer.max_concurrent);

    return config;
}

inline AppConfig& getConfig() {
    static AppConfig config = loadConfig();
    return config;
}

} // namespace config
} // namespace hostlink
