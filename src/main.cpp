// =============================================================================
// hostlink_cli - command-line front end for the HostLink core
// =============================================================================
// Connects (USB -> ADB tunnel -> simulated TCP), runs one command, disconnects.
//
//   hostlink_cli [--config FILE] [--sim] [--verbose] <command> [args...]
//
//   connect                     connect, handshake, print the transport
//   drives                      list host drives
//   df <drive>                  storage usage of a drive
//   ls <path> [name|size|date|type] [desc]
//   find <query> <root>
//   stat <path>
//   mkdir <parent> <name>
//   mv <path> <new-name>
//   rm <path>...
//   get <remote> <local>        download with progress
//   put <local> <remote>        upload with progress
// =============================================================================
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "config_loader.hpp"
#include "connection_state_machine.hpp"
#include "file_operations_client.hpp"
#include "hostlink_log.hpp"
#include "permission_gate.hpp"
#include "request_dispatcher.hpp"
#include "transfer_manager.hpp"
#include "transport_link.hpp"
#include "usb_bulk_backend.hpp"

using namespace hostlink;

static void printUsage() {
    fprintf(stderr,
        "usage: hostlink_cli [--config FILE] [--sim] [--verbose] <command> [args...]\n"
        "  connect | drives | df <drive> | ls <path> [name|size|date|type] [desc]\n"
        "  find <query> <root> | stat <path> | mkdir <parent> <name>\n"
        "  mv <path> <new-name> | rm <path>... | get <remote> <local> | put <local> <remote>\n");
}

static int fail(const Error& e) {
    fprintf(stderr, "error: %s\n", e.describe().c_str());
    return 1;
}

static void printItem(const FileItem& it) {
    printf("%c %10s  %s\n", it.is_directory ? 'd' : '-',
           it.is_directory ? "" : it.formattedSize().c_str(), it.path.c_str());
}

static bool parseSortOrder(const std::vector<std::string>& args, size_t from, SortOrder& out) {
    if (args.size() > from) {
        const std::string& f = args[from];
        if (f == "name") out.field = SortField::Name;
        else if (f == "size") out.field = SortField::Size;
        else if (f == "date") out.field = SortField::ModifiedAt;
        else if (f == "type") out.field = SortField::Type;
        else return false;
    }
    if (args.size() > from + 1) {
        if (args[from + 1] != "desc") return false;
        out.ascending = false;
    }
    return true;
}

// Blocks until the task leaves Pending/InProgress, printing progress
static int waitForTransfer(TransferManager& xfer, TransferId id) {
    std::mutex mtx;
    std::condition_variable cv;
    bool done = false;
    int last_pct = -1;

    auto sub = xfer.taskStream().subscribe([&](const std::vector<TransferTask>& tasks) {
        for (const auto& t : tasks) {
            if (t.id != id) continue;
            std::lock_guard<std::mutex> lock(mtx);
            int pct = t.progressPercent();
            if (pct != last_pct) {
                last_pct = pct;
                fprintf(stderr, "\r%s %3d%% (%s / %s)", t.file_name.c_str(), pct,
                        formatBytes(t.transferred_bytes).c_str(), formatBytes(t.total_bytes).c_str());
            }
            if (!t.isActive()) {
                done = true;
                cv.notify_all();
            }
        }
    });

    {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [&] { return done; });
    }
    sub.reset();
    fprintf(stderr, "\n");

    auto t = xfer.getTask(id);
    if (!t) return fail(Error(ErrorKind::NotFound, "transfer vanished"));
    if (t->state == TransferState::Completed) {
        printf("%s: %s\n", t->file_name.c_str(), transferStateName(t->state));
        return 0;
    }
    if (t->failure) return fail(*t->failure);
    fprintf(stderr, "transfer %s\n", transferStateName(t->state));
    return 1;
}

int main(int argc, char* argv[]) {
    std::string config_path = "hostlink.json";
    bool force_sim = false;
    bool verbose = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--sim") == 0) {
            force_sim = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            printUsage();
            return 0;
        } else {
            args.emplace_back(argv[i]);
        }
    }
    if (args.empty()) {
        printUsage();
        return 2;
    }

    auto& cfg = config::getConfig();
    cfg = config::loadConfig(config_path, true);
    if (force_sim) cfg.link.enable_simulation = true;

    log::setLogLevel(verbose ? log::Level::Debug : log::levelFromName(cfg.log.level));
    if (!cfg.log.log_path.empty() && !log::openLogFile(cfg.log.log_path.c_str())) {
        HLOG_WARN("cli", "Cannot open log file %s", cfg.log.log_path.c_str());
    }

    auto platform = std::make_shared<LibusbPermissionPlatform>(cfg.usb);
    PermissionGate gate(platform);
    TransportLink link(gate, defaultBackendFactory(cfg));

    ConnectionStateMachine::Options csm_opts;
    csm_opts.enable_simulation = cfg.link.enable_simulation;
    csm_opts.permission_timeout = std::chrono::milliseconds(cfg.link.permission_timeout_ms);
    ConnectionStateMachine csm(gate, link, csm_opts);

    RequestDispatcher::Options disp_opts;
    disp_opts.max_payload = cfg.protocol.max_payload_bytes;
    disp_opts.default_timeout = std::chrono::milliseconds(cfg.protocol.request_timeout_ms);
    disp_opts.id_space = cfg.protocol.correlation_id_space;
    RequestDispatcher dispatcher(csm, disp_opts);

    FileOperationsClient files(dispatcher, disp_opts.default_timeout);

    TransferManager::Options xfer_opts;
    xfer_opts.chunk_size = cfg.transfer.chunk_size;
    xfer_opts.max_concurrent = cfg.transfer.max_concurrent;
    xfer_opts.chunk_timeout = std::chrono::milliseconds(cfg.transfer.chunk_timeout_ms);
    xfer_opts.history_path = cfg.transfer.history_path;
    TransferManager xfer(dispatcher, xfer_opts);

    auto connected = csm.connect();
    if (connected.is_err()) return fail(connected.error());

    auto hello = files.handshake(cfg.protocol.client_id);
    if (hello.is_err()) return fail(hello.error());

    const std::string& cmd = args[0];
    int rc = 0;

    if (cmd == "connect") {
        auto s = csm.current();
        printf("%s host=%s\n", s.toString().c_str(), hello.value().c_str());
    } else if (cmd == "drives") {
        auto r = files.getDrives();
        if (r.is_err()) return fail(r.error());
        for (const auto& d : r.value()) printf("%s\n", d.c_str());
    } else if (cmd == "df" && args.size() == 2) {
        auto r = files.getStorageInfo(args[1]);
        if (r.is_err()) return fail(r.error());
        const auto& s = r.value();
        printf("%s (%s): %s used of %s, %s free (%.1f%%)\n", s.drive_label.c_str(), s.volume_name.c_str(),
               formatBytes(s.usedBytes()).c_str(), formatBytes(s.total_bytes).c_str(),
               formatBytes(s.free_bytes).c_str(), s.usagePercent());
    } else if (cmd == "ls" && args.size() >= 2) {
        SortOrder order;
        if (!parseSortOrder(args, 2, order)) {
            printUsage();
            return 2;
        }
        auto r = files.list(args[1], order);
        if (r.is_err()) return fail(r.error());
        for (const auto& it : r.value()) printItem(it);
    } else if (cmd == "find" && args.size() == 3) {
        auto r = files.search(args[1], args[2]);
        if (r.is_err()) return fail(r.error());
        for (const auto& it : r.value()) printItem(it);
    } else if (cmd == "stat" && args.size() == 2) {
        auto r = files.getInfo(args[1]);
        if (r.is_err()) return fail(r.error());
        const auto& it = r.value();
        printf("path:     %s\nsize:     %llu\ndir:      %s\nmodified: %lld\nperms:    %o\n",
               it.path.c_str(), (unsigned long long)it.size_bytes, it.is_directory ? "yes" : "no",
               (long long)it.modified_at, it.permission_bits);
    } else if (cmd == "mkdir" && args.size() == 3) {
        auto r = files.createFolder(args[1], args[2]);
        if (r.is_err()) return fail(r.error());
    } else if (cmd == "mv" && args.size() == 3) {
        auto r = files.rename(args[1], args[2]);
        if (r.is_err()) return fail(r.error());
    } else if (cmd == "rm" && args.size() >= 2) {
        auto report = files.remove(std::vector<std::string>(args.begin() + 1, args.end()));
        auto s = report.status();
        if (s.is_err()) return fail(s.error());
    } else if (cmd == "get" && args.size() == 3) {
        auto t = xfer.downloadFile(args[1], args[2]);
        if (t.is_err()) return fail(t.error());
        rc = waitForTransfer(xfer, t.value().id);
    } else if (cmd == "put" && args.size() == 3) {
        auto t = xfer.uploadFile(args[1], args[2]);
        if (t.is_err()) return fail(t.error());
        rc = waitForTransfer(xfer, t.value().id);
    } else {
        printUsage();
        rc = 2;
    }

    xfer.shutdown();
    csm.disconnect();
    log::closeLogFile();
    return rc;
}
