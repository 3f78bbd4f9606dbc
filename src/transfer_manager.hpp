// =============================================================================
// HostLink - Transfer Manager
// =============================================================================
// Owns every TransferTask and runs them on a bounded worker pool. Transfers
// are chunked request/response exchanges through the RequestDispatcher:
//   download  GET_FILE_INFO, then READ_CHUNK per chunk
//   upload    WRITE_BEGIN, WRITE_CHUNK per chunk, WRITE_END
// A chunk is acknowledged before the next one is sent, and progress moves
// only on acknowledgment. Cancel and pause take effect at chunk boundaries.
//
// Workers only pick up queued tasks while the dispatcher is attached, so
// tasks queued before connect() or after a link loss wait as Pending.
//
// Collaborators hold task ids and observe the task streams; they never
// mutate tasks directly.
// =============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "event_bus.hpp"
#include "hostlink_types.hpp"
#include "observable.hpp"
#include "request_dispatcher.hpp"
#include "result.hpp"
#include "transfer_history_store.hpp"

namespace hostlink {

class TransferManager {
public:
    struct Options {
        uint32_t chunk_size = 64 * 1024;
        int max_concurrent = 2;
        std::chrono::milliseconds chunk_timeout{10000};
        std::string history_path;   // empty: no persistence
    };

    TransferManager(RequestDispatcher& dispatcher, Options opts);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Creates a Pending task and queues it. totalBytes is learned from the
    // host when the transfer starts.
    Result<TransferTask> downloadFile(const std::string& remote_path, const std::string& local_path);

    // NotFound if the local file does not exist
    Result<TransferTask> uploadFile(const std::string& local_path, const std::string& remote_path);

    // Terminal tasks: no-op success. Unknown id: NotFound.
    Status cancelTransfer(TransferId id);
    // Pending/InProgress -> Paused at the next chunk boundary
    Status pauseTransfer(TransferId id);
    // Paused -> Pending at the queue tail; continues from transferredBytes
    Status resumeTransfer(TransferId id);
    // Failed -> Pending at the queue tail; restarts from byte 0
    Status retryTransfer(TransferId id);

    // Drops Completed, Failed and Cancelled tasks
    void clearHistory();

    std::optional<TransferTask> getTask(TransferId id) const;
    std::vector<TransferTask> tasks() const;
    std::vector<TransferTask> activeTasks() const;

    // Latest-value streams, updated on every mutation
    Observable<std::vector<TransferTask>>& taskStream() { return all_stream_; }
    Observable<std::vector<TransferTask>>& activeTaskStream() { return active_stream_; }

    // Stops the workers; Pending and InProgress tasks become Paused.
    // Idempotent; called by the destructor.
    void shutdown();

private:
    struct Control {
        std::atomic<bool> cancel{false};
        std::atomic<bool> pause{false};
    };

    struct Entry {
        TransferTask task;
        std::shared_ptr<Control> control;   // replaced on every (re)queue
        bool running = false;               // a worker still owns the previous run
        bool requeue_when_idle = false;
    };

    void worker_loop(int index);
    Status run_download(const TransferTask& task, const std::shared_ptr<Control>& ctl);
    Status run_upload(const TransferTask& task, const std::shared_ptr<Control>& ctl);
    void finish_run(TransferId id, const std::shared_ptr<Control>& ctl, const Status& result);

    // Apply only while `ctl` is the task's current run and it is InProgress
    bool set_total(TransferId id, const std::shared_ptr<Control>& ctl, uint64_t total);
    bool set_progress(TransferId id, const std::shared_ptr<Control>& ctl, uint64_t transferred);
    bool should_stop(const std::shared_ptr<Control>& ctl) const;

    TransferTask& create_locked(TransferDirection dir, const std::string& remote,
                                const std::string& local, uint64_t total);
    void enqueue_locked(Entry& e);
    void fail_all_in_progress_locked(const Error& err);

    // Pushes snapshots to the streams and the bus, then persists
    void publish(bool persist = true);

    RequestDispatcher& dispatcher_;
    Options opts_;
    std::unique_ptr<TransferHistoryStore> history_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::map<TransferId, Entry> tasks_;     // ordered by id = creation order
    std::deque<TransferId> queue_;
    TransferId next_id_ = 1;
    bool stopping_ = false;
    std::vector<std::thread> workers_;

    std::recursive_mutex publish_mutex_;
    Observable<std::vector<TransferTask>> all_stream_;
    Observable<std::vector<TransferTask>> active_stream_;

    // Wakes idle workers when the link comes back
    SubscriptionHandle conn_sub_;
};

} // namespace hostlink
