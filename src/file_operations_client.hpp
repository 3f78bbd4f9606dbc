#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "hostlink_types.hpp"
#include "request_dispatcher.hpp"
#include "result.hpp"

namespace hostlink {

struct DeleteFailure {
    std::string path;
    Error error;
};

// Outcome of a best-effort multi-path delete
struct DeleteReport {
    std::vector<std::string> deleted;
    std::vector<DeleteFailure> failed;

    bool ok() const { return failed.empty(); }

    // Ok when nothing failed, otherwise one error listing every failed path.
    // Its kind is the first failure's kind.
    Status status() const;
};

// parent + "/" + name, without doubling a trailing '/' or '\'
std::string joinRemotePath(const std::string& parent, const std::string& name);

/**
 * Typed remote file operations. One opcode per call; each call waits for its
 * response with the default timeout unless one is given.
 */
class FileOperationsClient {
public:
    using Timeout = std::optional<std::chrono::milliseconds>;

    explicit FileOperationsClient(RequestDispatcher& dispatcher,
                                  std::chrono::milliseconds default_timeout = std::chrono::milliseconds(5000));

    // Returns the host's identification string (may be empty)
    Result<std::string> handshake(const std::string& client_id, Timeout timeout = std::nullopt);

    // Sorted client-side: directories first, then by `order`
    Result<std::vector<FileItem>> list(const std::string& path, const SortOrder& order = {},
                                       Timeout timeout = std::nullopt);
    Result<std::vector<FileItem>> search(const std::string& query, const std::string& root_path,
                                         Timeout timeout = std::nullopt);
    Result<FileItem> getInfo(const std::string& path, Timeout timeout = std::nullopt);

    Status createFolder(const std::string& parent_path, const std::string& name,
                        Timeout timeout = std::nullopt);
    Status rename(const std::string& path, const std::string& new_name, Timeout timeout = std::nullopt);

    // Every path is attempted, in order. An empty list does nothing.
    DeleteReport remove(const std::vector<std::string>& paths, Timeout timeout = std::nullopt);

    Result<StorageInfo> getStorageInfo(const std::string& drive, Timeout timeout = std::nullopt);
    Result<std::vector<std::string>> getDrives(Timeout timeout = std::nullopt);

private:
    std::chrono::milliseconds pick(Timeout t) const { return t.value_or(default_timeout_); }

    RequestDispatcher& dispatcher_;
    std::chrono::milliseconds default_timeout_;
};

} // namespace hostlink
