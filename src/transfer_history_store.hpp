#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "hostlink_types.hpp"
#include "result.hpp"

namespace hostlink {

nlohmann::json transferTaskToJson(const TransferTask& task);
Result<TransferTask> transferTaskFromJson(const nlohmann::json& j);

/**
 * JSON file holding the transfer task list:
 *   { "version": 1, "tasks": [ { "id": 3, "direction": "download", ... } ] }
 * save() writes a sibling temp file and renames it over the target, so a
 * crash leaves either the old or the new list.
 */
class TransferHistoryStore {
public:
    explicit TransferHistoryStore(std::string path) : path_(std::move(path)) {}

    Status save(const std::vector<TransferTask>& tasks) const;

    // Missing file loads as an empty list. Unreadable entries are skipped.
    Result<std::vector<TransferTask>> load() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace hostlink
