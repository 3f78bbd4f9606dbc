// =============================================================================
// HostLink - Shared data model
// =============================================================================
// Connection state, remote file entities and transfer tasks. These are the
// snapshots collaborators observe; only their owning component mutates them.
// =============================================================================
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "result.hpp"

namespace hostlink {

// =============================================================================
// Connection
// =============================================================================

// Fallback order on connect: UsbDirect -> AdbTunnel -> SimulatedTcp
enum class TransportKind : uint8_t { UsbDirect = 0, AdbTunnel = 1, SimulatedTcp = 2 };

const char* transportKindName(TransportKind k);

struct ConnectionState {
    enum class Phase : uint8_t {
        Disconnected = 0,
        PermissionRequired,
        Connecting,
        Connected,
        Error,
    };

    Phase phase = Phase::Disconnected;
    TransportKind transport = TransportKind::UsbDirect;  // Connecting/Connected only
    std::string reason;                                  // Error only

    static ConnectionState disconnected() { return {}; }
    static ConnectionState permissionRequired() {
        ConnectionState s;
        s.phase = Phase::PermissionRequired;
        return s;
    }
    static ConnectionState connecting(TransportKind k) {
        ConnectionState s;
        s.phase = Phase::Connecting;
        s.transport = k;
        return s;
    }
    static ConnectionState connected(TransportKind k) {
        ConnectionState s;
        s.phase = Phase::Connected;
        s.transport = k;
        return s;
    }
    static ConnectionState error(std::string why) {
        ConnectionState s;
        s.phase = Phase::Error;
        s.reason = std::move(why);
        return s;
    }

    bool isConnected() const { return phase == Phase::Connected; }

    // "Disconnected", "Connecting(AdbTunnel)", "Error(host unreachable)"
    std::string toString() const;

    bool operator==(const ConnectionState& o) const {
        if (phase != o.phase) return false;
        if (phase == Phase::Connecting || phase == Phase::Connected) return transport == o.transport;
        if (phase == Phase::Error) return reason == o.reason;
        return true;
    }
    bool operator!=(const ConnectionState& o) const { return !(*this == o); }
};

// =============================================================================
// Remote files
// =============================================================================

struct FileItem {
    std::string path;           // unique within one listing
    std::string name;
    uint64_t size_bytes = 0;
    bool is_directory = false;
    int64_t modified_at = 0;    // ms since epoch (host clock)
    uint32_t permission_bits = 0;

    // Text after the last '.', empty for directories and dotless names
    std::string extension() const;
    std::string formattedSize() const;
};

enum class SortField : uint8_t { Name = 0, Size, ModifiedAt, Type };

struct SortOrder {
    SortField field = SortField::Name;
    bool ascending = true;

    SortOrder toggled() const { return SortOrder{field, !ascending}; }
};

// Directories first, then files; each group ordered by `order`.
// Name and Type compare case-insensitively.
void sortFileItems(std::vector<FileItem>& items, const SortOrder& order);

struct StorageInfo {
    std::string drive_label;
    std::string volume_name;
    uint64_t total_bytes = 0;
    uint64_t free_bytes = 0;    // <= total_bytes

    uint64_t usedBytes() const { return total_bytes - free_bytes; }
    float usagePercent() const {
        return total_bytes > 0 ? 100.0f * (float)usedBytes() / (float)total_bytes : 0.0f;
    }
};

std::string formatBytes(uint64_t bytes);

// =============================================================================
// Transfers
// =============================================================================

using TransferId = uint64_t;

enum class TransferDirection : uint8_t { Upload = 0, Download = 1 };

enum class TransferState : uint8_t {
    Pending = 0,
    InProgress,
    Paused,
    Completed,
    Failed,
    Cancelled,
};

const char* transferDirectionName(TransferDirection d);
const char* transferStateName(TransferState s);

struct TransferTask {
    TransferId id = 0;
    TransferDirection direction = TransferDirection::Download;
    std::string remote_path;
    std::string local_path;
    std::string file_name;
    uint64_t total_bytes = 0;
    uint64_t transferred_bytes = 0;
    TransferState state = TransferState::Pending;
    std::optional<Error> failure;   // set while state == Failed
    int64_t created_at = 0;         // ms since epoch
    int64_t completed_at = 0;       // 0 until Completed

    int progressPercent() const;
    bool isActive() const {
        return state == TransferState::Pending || state == TransferState::InProgress;
    }
    bool isTerminal() const {
        return state == TransferState::Completed || state == TransferState::Failed ||
               state == TransferState::Cancelled;
    }
};

} // namespace hostlink
