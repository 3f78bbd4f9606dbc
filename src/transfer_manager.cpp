#include "transfer_manager.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include "hostlink_log.hpp"
#include "payload_codec.hpp"

namespace fs = std::filesystem;

namespace hostlink {

namespace proto = protocol;

static int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

static std::string baseName(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

static const Status kStopped = Error(ErrorKind::Cancelled, "stopped at chunk boundary");

TransferManager::TransferManager(RequestDispatcher& dispatcher, Options opts)
    : dispatcher_(dispatcher), opts_(std::move(opts)) {
    if (opts_.chunk_size == 0) opts_.chunk_size = 64 * 1024;
    if (opts_.max_concurrent < 1) opts_.max_concurrent = 1;
    // WRITE_CHUNK carries a u64 offset ahead of the data
    const uint32_t max_payload = dispatcher_.options().max_payload;
    const uint32_t chunk_limit = max_payload > 8 ? max_payload - 8 : 1;
    if (opts_.chunk_size > chunk_limit) {
        HLOG_WARN("xfer", "chunk_size %u exceeds payload limit, using %u",
                  (unsigned)opts_.chunk_size, (unsigned)chunk_limit);
        opts_.chunk_size = chunk_limit;
    }

    if (!opts_.history_path.empty()) {
        history_ = std::make_unique<TransferHistoryStore>(opts_.history_path);
        auto loaded = history_->load();
        if (loaded.is_err()) {
            HLOG_ERROR("xfer", "History not restored: %s", loaded.error().describe().c_str());
        } else {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& t : loaded.value()) {
                if (t.isActive()) {
                    // The process died mid-transfer; offer retry instead of resume
                    t.state = TransferState::Failed;
                    t.failure = Error(ErrorKind::Io, "interrupted");
                }
                next_id_ = std::max(next_id_, t.id + 1);
                Entry e;
                e.task = t;
                tasks_[t.id] = std::move(e);
            }
            HLOG_INFO("xfer", "Restored %zu task(s), next id %llu", tasks_.size(),
                      (unsigned long long)next_id_);
        }
    }

    conn_sub_ = bus().subscribe<ConnectionStateChangedEvent>([this](const ConnectionStateChangedEvent& e) {
        if (!e.current.isConnected()) return;
        { std::lock_guard<std::mutex> lock(mutex_); }
        queue_cv_.notify_all();
    });

    for (int i = 0; i < opts_.max_concurrent; ++i) {
        workers_.emplace_back(&TransferManager::worker_loop, this, i);
    }
    publish(false);
}

TransferManager::~TransferManager() {
    shutdown();
}

void TransferManager::shutdown() {
    conn_sub_.reset();
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
        for (auto& kv : tasks_) {
            auto& e = kv.second;
            if (e.task.isActive()) {
                e.task.state = TransferState::Paused;
                if (e.control) e.control->pause = true;
            }
        }
        queue_.clear();
        workers.swap(workers_);
    }
    queue_cv_.notify_all();
    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }
    HLOG_INFO("xfer", "Transfer workers stopped");
    publish();
}

// =============================================================================
// Commands
// =============================================================================

TransferTask& TransferManager::create_locked(TransferDirection dir, const std::string& remote,
                                             const std::string& local, uint64_t total) {
    TransferId id = next_id_++;
    Entry e;
    e.task.id = id;
    e.task.direction = dir;
    e.task.remote_path = remote;
    e.task.local_path = local;
    e.task.file_name = baseName(dir == TransferDirection::Download ? remote : local);
    e.task.total_bytes = total;
    e.task.created_at = nowMs();
    auto& slot = tasks_[id];
    slot = std::move(e);
    enqueue_locked(slot);
    return slot.task;
}

void TransferManager::enqueue_locked(Entry& e) {
    e.task.state = TransferState::Pending;
    e.task.failure.reset();
    e.control = std::make_shared<Control>();
    if (e.running) {
        e.requeue_when_idle = true;
    } else {
        queue_.push_back(e.task.id);
        queue_cv_.notify_one();
    }
}

Result<TransferTask> TransferManager::downloadFile(const std::string& remote_path, const std::string& local_path) {
    if (remote_path.empty() || local_path.empty()) {
        return Err<TransferTask>(ErrorKind::InvalidArgument, "empty path");
    }
    TransferTask snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return Err<TransferTask>(ErrorKind::Cancelled, "transfer manager stopped");
        snapshot = create_locked(TransferDirection::Download, remote_path, local_path, 0);
    }
    HLOG_INFO("xfer", "Queued download #%llu %s -> %s", (unsigned long long)snapshot.id,
              remote_path.c_str(), local_path.c_str());
    publish();
    return Ok(snapshot);
}

Result<TransferTask> TransferManager::uploadFile(const std::string& local_path, const std::string& remote_path) {
    if (remote_path.empty() || local_path.empty()) {
        return Err<TransferTask>(ErrorKind::InvalidArgument, "empty path");
    }
    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        return Err<TransferTask>(ErrorKind::NotFound, "no local file " + local_path);
    }
    uint64_t size = fs::file_size(local_path, ec);
    if (ec) return Err<TransferTask>(ErrorKind::Io, "cannot stat " + local_path + ": " + ec.message());

    TransferTask snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return Err<TransferTask>(ErrorKind::Cancelled, "transfer manager stopped");
        snapshot = create_locked(TransferDirection::Upload, remote_path, local_path, size);
    }
    HLOG_INFO("xfer", "Queued upload #%llu %s -> %s (%llu bytes)", (unsigned long long)snapshot.id,
              local_path.c_str(), remote_path.c_str(), (unsigned long long)size);
    publish();
    return Ok(snapshot);
}

Status TransferManager::cancelTransfer(TransferId id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return Error(ErrorKind::NotFound, "no transfer #" + std::to_string(id));
        auto& e = it->second;
        if (e.task.isTerminal()) return Ok();
        e.task.state = TransferState::Cancelled;
        e.requeue_when_idle = false;
        if (e.control) e.control->cancel = true;
        queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
    }
    HLOG_INFO("xfer", "Cancelled #%llu", (unsigned long long)id);
    publish();
    return Ok();
}

Status TransferManager::pauseTransfer(TransferId id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return Error(ErrorKind::NotFound, "no transfer #" + std::to_string(id));
        auto& e = it->second;
        if (e.task.state == TransferState::Paused) return Ok();
        if (!e.task.isActive()) {
            return Error(ErrorKind::InvalidArgument,
                         std::string("cannot pause ") + transferStateName(e.task.state) + " transfer");
        }
        e.task.state = TransferState::Paused;
        e.requeue_when_idle = false;
        if (e.control) e.control->pause = true;
        queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
    }
    HLOG_INFO("xfer", "Paused #%llu", (unsigned long long)id);
    publish();
    return Ok();
}

Status TransferManager::resumeTransfer(TransferId id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return Error(ErrorKind::NotFound, "no transfer #" + std::to_string(id));
        auto& e = it->second;
        if (e.task.isActive()) return Ok();
        if (e.task.state != TransferState::Paused) {
            return Error(ErrorKind::InvalidArgument,
                         std::string("cannot resume ") + transferStateName(e.task.state) + " transfer");
        }
        if (stopping_) return Error(ErrorKind::Cancelled, "transfer manager stopped");
        enqueue_locked(e);
    }
    HLOG_INFO("xfer", "Resumed #%llu", (unsigned long long)id);
    publish();
    return Ok();
}

Status TransferManager::retryTransfer(TransferId id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return Error(ErrorKind::NotFound, "no transfer #" + std::to_string(id));
        auto& e = it->second;
        if (e.task.state != TransferState::Failed) {
            return Error(ErrorKind::InvalidArgument,
                         std::string("only failed transfers can be retried, #") + std::to_string(id) +
                         " is " + transferStateName(e.task.state));
        }
        if (stopping_) return Error(ErrorKind::Cancelled, "transfer manager stopped");
        e.task.transferred_bytes = 0;
        e.task.completed_at = 0;
        enqueue_locked(e);
    }
    HLOG_INFO("xfer", "Retrying #%llu", (unsigned long long)id);
    publish();
    return Ok();
}

void TransferManager::clearHistory() {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (it->second.task.isTerminal()) {
                it = tasks_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    HLOG_INFO("xfer", "Cleared %zu finished task(s)", removed);
    publish();
}

// =============================================================================
// Queries
// =============================================================================

std::optional<TransferTask> TransferManager::getTask(TransferId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second.task;
}

std::vector<TransferTask> TransferManager::tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferTask> out;
    out.reserve(tasks_.size());
    for (const auto& kv : tasks_) out.push_back(kv.second.task);
    return out;
}

std::vector<TransferTask> TransferManager::activeTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferTask> out;
    for (const auto& kv : tasks_) {
        if (kv.second.task.isActive()) out.push_back(kv.second.task);
    }
    return out;
}

void TransferManager::publish(bool persist) {
    std::lock_guard<std::recursive_mutex> plock(publish_mutex_);
    auto all = tasks();
    std::vector<TransferTask> active;
    for (const auto& t : all) {
        if (t.isActive()) active.push_back(t);
    }
    all_stream_.set(all);
    active_stream_.set(active);

    TransferTasksChangedEvent ev;
    ev.tasks = all;
    bus().publish(ev);

    if (persist && history_) {
        auto s = history_->save(all);
        if (s.is_err()) HLOG_ERROR("xfer", "History not saved: %s", s.error().describe().c_str());
    }
}

// =============================================================================
// Workers
// =============================================================================

bool TransferManager::should_stop(const std::shared_ptr<Control>& ctl) const {
    return ctl->cancel.load() || ctl->pause.load();
}

bool TransferManager::set_total(TransferId id, const std::shared_ptr<Control>& ctl, uint64_t total) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end() || it->second.control != ctl ||
            it->second.task.state != TransferState::InProgress) {
            return false;
        }
        if (it->second.task.total_bytes == total) return true;
        it->second.task.total_bytes = total;
    }
    publish(false);
    return true;
}

bool TransferManager::set_progress(TransferId id, const std::shared_ptr<Control>& ctl, uint64_t transferred) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end() || it->second.control != ctl ||
            it->second.task.state != TransferState::InProgress) {
            return false;
        }
        auto& t = it->second.task;
        // Non-decreasing and bounded by total
        t.transferred_bytes = std::min(std::max(t.transferred_bytes, transferred), t.total_bytes);
    }
    publish(false);
    return true;
}

void TransferManager::fail_all_in_progress_locked(const Error& err) {
    for (auto& kv : tasks_) {
        auto& t = kv.second.task;
        if (t.state != TransferState::InProgress) continue;
        t.state = TransferState::Failed;
        t.failure = err;
        if (kv.second.control) kv.second.control->cancel = true;
    }
}

void TransferManager::worker_loop(int index) {
    HLOG_DEBUG("xfer", "Worker %d started", index);
    for (;;) {
        TransferTask snapshot;
        std::shared_ptr<Control> ctl;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] {
                return stopping_ || (!queue_.empty() && dispatcher_.attached());
            });
            if (stopping_) break;
            TransferId id = queue_.front();
            queue_.pop_front();
            auto it = tasks_.find(id);
            if (it == tasks_.end() || it->second.task.state != TransferState::Pending) continue;
            auto& e = it->second;
            e.task.state = TransferState::InProgress;
            e.running = true;
            snapshot = e.task;
            ctl = e.control;
        }
        publish();

        HLOG_INFO("xfer", "Worker %d: %s #%llu %s", index, transferDirectionName(snapshot.direction),
                  (unsigned long long)snapshot.id, snapshot.file_name.c_str());
        Status result = snapshot.direction == TransferDirection::Download
                            ? run_download(snapshot, ctl)
                            : run_upload(snapshot, ctl);
        finish_run(snapshot.id, ctl, result);
    }
    HLOG_DEBUG("xfer", "Worker %d stopped", index);
}

void TransferManager::finish_run(TransferId id, const std::shared_ptr<Control>& ctl, const Status& result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return;
        auto& e = it->second;
        e.running = false;
        if (e.requeue_when_idle) {
            e.requeue_when_idle = false;
            queue_.push_back(id);
            queue_cv_.notify_one();
        }

        bool current = e.control == ctl && e.task.state == TransferState::InProgress;
        if (current) {
            if (result.is_ok()) {
                e.task.state = TransferState::Completed;
                e.task.transferred_bytes = e.task.total_bytes;
                e.task.completed_at = nowMs();
                HLOG_INFO("xfer", "#%llu completed (%llu bytes)", (unsigned long long)id,
                          (unsigned long long)e.task.total_bytes);
            } else if (result.error().kind == ErrorKind::LinkLost) {
                HLOG_WARN("xfer", "Link lost, failing all in-progress transfers: %s",
                          result.error().describe().c_str());
                fail_all_in_progress_locked(result.error());
            } else {
                e.task.state = TransferState::Failed;
                e.task.failure = result.error();
                HLOG_WARN("xfer", "#%llu failed: %s", (unsigned long long)id,
                          result.error().describe().c_str());
            }
        }
    }
    publish();
}

Status TransferManager::run_download(const TransferTask& task, const std::shared_ptr<Control>& ctl) {
    auto info = dispatcher_.send(proto::OP_GET_FILE_INFO, proto::encodeString(task.remote_path),
                                 opts_.chunk_timeout);
    if (info.is_err()) return info.error();
    auto item = proto::decodeFileItem(info.value());
    if (item.is_err()) return item.error();
    if (item.value().is_directory) {
        return Error(ErrorKind::InvalidArgument, task.remote_path + " is a directory");
    }
    const uint64_t total = item.value().size_bytes;
    if (!set_total(task.id, ctl, total)) return kStopped;

    // Resume continues after the last acknowledged chunk
    uint64_t offset = std::min(task.transferred_bytes, total);
    std::error_code ec;
    if (offset > 0 && fs::exists(task.local_path, ec)) {
        fs::resize_file(task.local_path, offset, ec);
        if (ec) return Error(ErrorKind::Io, "cannot truncate " + task.local_path + ": " + ec.message());
    } else {
        offset = 0;
    }

    std::ofstream out(task.local_path, std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc));
    if (!out) return Error(ErrorKind::Io, "cannot open " + task.local_path);

    while (offset < total) {
        if (should_stop(ctl)) return kStopped;
        uint64_t want = std::min<uint64_t>(opts_.chunk_size, total - offset);
        proto::ReadChunkRequest req{task.remote_path, offset, want};
        auto chunk = dispatcher_.send(proto::OP_READ_CHUNK, proto::encodeReadChunk(req), opts_.chunk_timeout);
        if (chunk.is_err()) return chunk.error();

        const auto& data = chunk.value();
        if (data.empty()) return Error(ErrorKind::Malformed, "host returned an empty chunk");
        if (data.size() > want) return Error(ErrorKind::Malformed, "host returned an oversized chunk");

        out.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
        out.flush();
        if (!out) return Error(ErrorKind::Io, "write failed: " + task.local_path);

        offset += data.size();
        if (!set_progress(task.id, ctl, offset)) return kStopped;
    }
    return Ok();
}

Status TransferManager::run_upload(const TransferTask& task, const std::shared_ptr<Control>& ctl) {
    std::error_code ec;
    uint64_t total = fs::file_size(task.local_path, ec);
    if (ec) return Error(ErrorKind::NotFound, "no local file " + task.local_path);
    if (!set_total(task.id, ctl, total)) return kStopped;

    uint64_t offset = std::min(task.transferred_bytes, total);
    std::ifstream in(task.local_path, std::ios::binary);
    if (!in) return Error(ErrorKind::Io, "cannot open " + task.local_path);
    in.seekg((std::streamoff)offset);

    proto::WriteBeginRequest begin{task.remote_path, total, opts_.chunk_size, offset};
    auto r = dispatcher_.send(proto::OP_WRITE_BEGIN, proto::encodeWriteBegin(begin), opts_.chunk_timeout);
    if (r.is_err()) return r.error();

    std::vector<uint8_t> buf(opts_.chunk_size);
    while (offset < total) {
        if (should_stop(ctl)) return kStopped;
        size_t want = (size_t)std::min<uint64_t>(opts_.chunk_size, total - offset);
        in.read(reinterpret_cast<char*>(buf.data()), (std::streamsize)want);
        size_t got = (size_t)in.gcount();
        if (got == 0) return Error(ErrorKind::Io, task.local_path + " shrank during upload");

        r = dispatcher_.send(proto::OP_WRITE_CHUNK, proto::encodeWriteChunk(offset, buf.data(), got),
                             opts_.chunk_timeout);
        if (r.is_err()) return r.error();

        offset += got;
        if (!set_progress(task.id, ctl, offset)) return kStopped;
    }

    if (should_stop(ctl)) return kStopped;
    r = dispatcher_.send(proto::OP_WRITE_END, proto::encodeWriteEnd(offset), opts_.chunk_timeout);
    if (r.is_err()) return r.error();
    return Ok();
}

} // namespace hostlink
