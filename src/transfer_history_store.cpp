#include "transfer_history_store.hpp"
#include <cstdio>
#include <fstream>
#include "hostlink_log.hpp"

namespace hostlink {

static constexpr int HISTORY_VERSION = 1;

static const char* stateKey(TransferState s) {
    switch (s) {
        case TransferState::Pending:    return "pending";
        case TransferState::InProgress: return "in_progress";
        case TransferState::Paused:     return "paused";
        case TransferState::Completed:  return "completed";
        case TransferState::Failed:     return "failed";
        case TransferState::Cancelled:  return "cancelled";
    }
    return "failed";
}

static bool stateFromKey(const std::string& k, TransferState& out) {
    static const std::pair<const char*, TransferState> table[] = {
        {"pending", TransferState::Pending},     {"in_progress", TransferState::InProgress},
        {"paused", TransferState::Paused},       {"completed", TransferState::Completed},
        {"failed", TransferState::Failed},       {"cancelled", TransferState::Cancelled},
    };
    for (const auto& e : table) {
        if (k == e.first) {
            out = e.second;
            return true;
        }
    }
    return false;
}

nlohmann::json transferTaskToJson(const TransferTask& t) {
    nlohmann::json j;
    j["id"] = t.id;
    j["direction"] = transferDirectionName(t.direction);
    j["remote_path"] = t.remote_path;
    j["local_path"] = t.local_path;
    j["file_name"] = t.file_name;
    j["total_bytes"] = t.total_bytes;
    j["transferred_bytes"] = t.transferred_bytes;
    j["state"] = stateKey(t.state);
    j["created_at"] = t.created_at;
    j["completed_at"] = t.completed_at;
    if (t.failure) {
        j["failure"] = {
            {"kind", errorKindName(t.failure->kind)},
            {"message", t.failure->message},
            {"code", t.failure->code},
        };
    }
    return j;
}

static ErrorKind errorKindFromName(const std::string& name) {
    for (int k = (int)ErrorKind::PermissionDenied; k <= (int)ErrorKind::Remote; ++k) {
        if (name == errorKindName((ErrorKind)k)) return (ErrorKind)k;
    }
    return ErrorKind::Io;
}

Result<TransferTask> transferTaskFromJson(const nlohmann::json& j) {
    try {
        TransferTask t;
        t.id = j.at("id").get<TransferId>();
        std::string dir = j.at("direction").get<std::string>();
        if (dir == "upload") {
            t.direction = TransferDirection::Upload;
        } else if (dir == "download") {
            t.direction = TransferDirection::Download;
        } else {
            return Err<TransferTask>(ErrorKind::Malformed, "bad direction '" + dir + "'");
        }
        t.remote_path = j.at("remote_path").get<std::string>();
        t.local_path = j.at("local_path").get<std::string>();
        t.file_name = j.value("file_name", std::string());
        t.total_bytes = j.value("total_bytes", (uint64_t)0);
        t.transferred_bytes = j.value("transferred_bytes", (uint64_t)0);
        if (!stateFromKey(j.at("state").get<std::string>(), t.state)) {
            return Err<TransferTask>(ErrorKind::Malformed, "bad state");
        }
        t.created_at = j.value("created_at", (int64_t)0);
        t.completed_at = j.value("completed_at", (int64_t)0);
        if (j.contains("failure") && j["failure"].is_object()) {
            const auto& f = j["failure"];
            t.failure = Error(errorKindFromName(f.value("kind", std::string("Io"))),
                              f.value("message", std::string()), f.value("code", 0));
        }
        if (t.state == TransferState::Failed && !t.failure) t.failure = Error(ErrorKind::Io, "unknown");
        return Ok(std::move(t));
    } catch (const nlohmann::json::exception& e) {
        return Err<TransferTask>(ErrorKind::Malformed, e.what());
    }
}

Status TransferHistoryStore::save(const std::vector<TransferTask>& tasks) const {
    nlohmann::json root;
    root["version"] = HISTORY_VERSION;
    root["tasks"] = nlohmann::json::array();
    for (const auto& t : tasks) root["tasks"].push_back(transferTaskToJson(t));

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) return Error(ErrorKind::Io, "cannot write " + tmp);
        out << root.dump(2);
        if (!out) return Error(ErrorKind::Io, "write failed: " + tmp);
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        std::remove(tmp.c_str());
        return Error(ErrorKind::Io, "cannot replace " + path_);
    }
    HLOG_DEBUG("history", "Saved %zu task(s) to %s", tasks.size(), path_.c_str());
    return Ok();
}

Result<std::vector<TransferTask>> TransferHistoryStore::load() const {
    std::vector<TransferTask> tasks;
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        HLOG_INFO("history", "No history at %s", path_.c_str());
        return Ok(std::move(tasks));
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        HLOG_ERROR("history", "JSON parse error in %s: %s", path_.c_str(), e.what());
        return Err<std::vector<TransferTask>>(ErrorKind::Malformed, e.what());
    }
    if (!root.contains("tasks") || !root["tasks"].is_array()) {
        return Err<std::vector<TransferTask>>(ErrorKind::Malformed, "missing tasks array");
    }

    for (const auto& jt : root["tasks"]) {
        auto t = transferTaskFromJson(jt);
        if (t.is_err()) {
            HLOG_WARN("history", "Skipping entry: %s", t.error().describe().c_str());
            continue;
        }
        tasks.push_back(std::move(t).value());
    }
    HLOG_INFO("history", "Loaded %zu task(s) from %s", tasks.size(), path_.c_str());
    return Ok(std::move(tasks));
}

} // namespace hostlink
