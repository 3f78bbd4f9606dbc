#include "hostlink_types.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace hostlink {

const char* transportKindName(TransportKind k) {
    switch (k) {
        case TransportKind::UsbDirect:    return "UsbDirect";
        case TransportKind::AdbTunnel:    return "AdbTunnel";
        case TransportKind::SimulatedTcp: return "SimulatedTcp";
    }
    return "?";
}

std::string ConnectionState::toString() const {
    switch (phase) {
        case Phase::Disconnected:       return "Disconnected";
        case Phase::PermissionRequired: return "PermissionRequired";
        case Phase::Connecting:         return std::string("Connecting(") + transportKindName(transport) + ")";
        case Phase::Connected:          return std::string("Connected(") + transportKindName(transport) + ")";
        case Phase::Error:              return "Error(" + reason + ")";
    }
    return "?";
}

std::string FileItem::extension() const {
    if (is_directory) return {};
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 >= name.size()) return {};
    return name.substr(dot + 1);
}

std::string FileItem::formattedSize() const {
    return formatBytes(size_bytes);
}

std::string formatBytes(uint64_t bytes) {
    char buf[32];
    if (bytes < 1024ULL) {
        snprintf(buf, sizeof(buf), "%llu B", (unsigned long long)bytes);
    } else if (bytes < 1024ULL * 1024) {
        snprintf(buf, sizeof(buf), "%llu KB", (unsigned long long)(bytes / 1024));
    } else if (bytes < 1024ULL * 1024 * 1024) {
        snprintf(buf, sizeof(buf), "%llu MB", (unsigned long long)(bytes / (1024 * 1024)));
    } else {
        snprintf(buf, sizeof(buf), "%.2f GB", (double)bytes / (1024.0 * 1024.0 * 1024.0));
    }
    return buf;
}

static int compareNoCase(const std::string& a, const std::string& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        int ca = std::tolower(static_cast<unsigned char>(a[i]));
        int cb = std::tolower(static_cast<unsigned char>(b[i]));
        if (ca != cb) return ca < cb ? -1 : 1;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

static int compareBy(const FileItem& a, const FileItem& b, SortField field) {
    switch (field) {
        case SortField::Name:
            return compareNoCase(a.name, b.name);
        case SortField::Size:
            return a.size_bytes == b.size_bytes ? 0 : (a.size_bytes < b.size_bytes ? -1 : 1);
        case SortField::ModifiedAt:
            return a.modified_at == b.modified_at ? 0 : (a.modified_at < b.modified_at ? -1 : 1);
        case SortField::Type:
            return compareNoCase(a.extension(), b.extension());
    }
    return 0;
}

void sortFileItems(std::vector<FileItem>& items, const SortOrder& order) {
    std::stable_sort(items.begin(), items.end(), [&](const FileItem& a, const FileItem& b) {
        if (a.is_directory != b.is_directory) return a.is_directory;
        int c = compareBy(a, b, order.field);
        return order.ascending ? c < 0 : c > 0;
    });
}

const char* transferDirectionName(TransferDirection d) {
    return d == TransferDirection::Upload ? "upload" : "download";
}

const char* transferStateName(TransferState s) {
    switch (s) {
        case TransferState::Pending:    return "Pending";
        case TransferState::InProgress: return "InProgress";
        case TransferState::Paused:     return "Paused";
        case TransferState::Completed:  return "Completed";
        case TransferState::Failed:     return "Failed";
        case TransferState::Cancelled:  return "Cancelled";
    }
    return "?";
}

int TransferTask::progressPercent() const {
    if (total_bytes == 0) return state == TransferState::Completed ? 100 : 0;
    uint64_t done = std::min(transferred_bytes, total_bytes);
    // 100 * done fits in 64 bits for any file below ~184 PB
    return static_cast<int>((100 * done) / total_bytes);
}

} // namespace hostlink
