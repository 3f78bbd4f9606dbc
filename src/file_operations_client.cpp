#include "file_operations_client.hpp"
#include "hostlink_log.hpp"
#include "payload_codec.hpp"

namespace hostlink {

namespace proto = protocol;

Status DeleteReport::status() const {
    if (failed.empty()) return Ok();
    std::string msg = std::to_string(failed.size()) + " of " +
                      std::to_string(failed.size() + deleted.size()) + " path(s) not deleted: ";
    for (size_t i = 0; i < failed.size(); ++i) {
        if (i > 0) msg += "; ";
        msg += failed[i].path + " (" + failed[i].error.describe() + ")";
    }
    return Error(failed.front().error.kind, msg, failed.front().error.code);
}

std::string joinRemotePath(const std::string& parent, const std::string& name) {
    if (parent.empty()) return name;
    char last = parent.back();
    if (last == '/' || last == '\\') return parent + name;
    return parent + "/" + name;
}

FileOperationsClient::FileOperationsClient(RequestDispatcher& dispatcher,
                                           std::chrono::milliseconds default_timeout)
    : dispatcher_(dispatcher), default_timeout_(default_timeout) {}

Result<std::string> FileOperationsClient::handshake(const std::string& client_id, Timeout timeout) {
    auto r = dispatcher_.send(proto::OP_HANDSHAKE, proto::encodeString(client_id), pick(timeout));
    if (r.is_err()) return r.error();
    if (r.value().empty()) return Ok(std::string());
    auto host = proto::decodeString(r.value());
    if (host.is_ok()) HLOG_INFO("fileops", "Handshake ok, host: %s", host.value().c_str());
    return host;
}

Result<std::vector<FileItem>> FileOperationsClient::list(const std::string& path, const SortOrder& order,
                                                         Timeout timeout) {
    auto r = dispatcher_.send(proto::OP_LIST_DIR, proto::encodeString(path), pick(timeout));
    if (r.is_err()) return r.error();
    auto items = proto::decodeFileList(r.value());
    if (items.is_err()) return items.error();
    sortFileItems(items.value(), order);
    HLOG_DEBUG("fileops", "list %s: %zu entries", path.c_str(), items.value().size());
    return items;
}

Result<std::vector<FileItem>> FileOperationsClient::search(const std::string& query, const std::string& root_path,
                                                           Timeout timeout) {
    proto::SearchRequest req{query, root_path};
    auto r = dispatcher_.send(proto::OP_SEARCH, proto::encodeSearch(req), pick(timeout));
    if (r.is_err()) return r.error();
    return proto::decodeFileList(r.value());
}

Result<FileItem> FileOperationsClient::getInfo(const std::string& path, Timeout timeout) {
    auto r = dispatcher_.send(proto::OP_GET_FILE_INFO, proto::encodeString(path), pick(timeout));
    if (r.is_err()) return r.error();
    return proto::decodeFileItem(r.value());
}

Status FileOperationsClient::createFolder(const std::string& parent_path, const std::string& name,
                                          Timeout timeout) {
    if (name.empty()) return Error(ErrorKind::InvalidArgument, "folder name is empty");
    std::string path = joinRemotePath(parent_path, name);
    auto r = dispatcher_.send(proto::OP_CREATE_DIR, proto::encodeString(path), pick(timeout));
    if (r.is_err()) return r.error();
    HLOG_INFO("fileops", "Created folder %s", path.c_str());
    return Ok();
}

Status FileOperationsClient::rename(const std::string& path, const std::string& new_name, Timeout timeout) {
    if (new_name.empty()) return Error(ErrorKind::InvalidArgument, "new name is empty");
    proto::RenameRequest req{path, new_name};
    auto r = dispatcher_.send(proto::OP_RENAME, proto::encodeRename(req), pick(timeout));
    if (r.is_err()) return r.error();
    HLOG_INFO("fileops", "Renamed %s -> %s", path.c_str(), new_name.c_str());
    return Ok();
}

DeleteReport FileOperationsClient::remove(const std::vector<std::string>& paths, Timeout timeout) {
    DeleteReport report;
    for (const auto& path : paths) {
        auto r = dispatcher_.send(proto::OP_DELETE, proto::encodeString(path), pick(timeout));
        if (r.is_ok()) {
            report.deleted.push_back(path);
        } else {
            HLOG_WARN("fileops", "Delete %s failed: %s", path.c_str(), r.error().describe().c_str());
            report.failed.push_back({path, r.error()});
        }
    }
    if (!paths.empty()) {
        HLOG_INFO("fileops", "Deleted %zu/%zu path(s)", report.deleted.size(), paths.size());
    }
    return report;
}

Result<StorageInfo> FileOperationsClient::getStorageInfo(const std::string& drive, Timeout timeout) {
    auto r = dispatcher_.send(proto::OP_GET_STORAGE_INFO, proto::encodeString(drive), pick(timeout));
    if (r.is_err()) return r.error();
    return proto::decodeStorageInfo(r.value());
}

Result<std::vector<std::string>> FileOperationsClient::getDrives(Timeout timeout) {
    auto r = dispatcher_.send(proto::OP_GET_DRIVES, {}, pick(timeout));
    if (r.is_err()) return r.error();
    return proto::decodeDriveList(r.value());
}

} // namespace hostlink
