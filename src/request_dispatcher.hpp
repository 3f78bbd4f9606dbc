// =============================================================================
// HostLink - Request Dispatcher
// =============================================================================
// Framed request/response over the active link. Each send() gets a fresh
// correlation id and waits for the response frame carrying it. One background
// thread reads the link and routes frames to waiters by id, so responses may
// arrive in any order.
//
// The dispatcher follows the ConnectionStateMachine: it starts reading when
// the state becomes Connected and fails every outstanding waiter with
// LinkLost when it leaves Connected.
// =============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>
#include "connection_state_machine.hpp"
#include "hostlink_protocol.hpp"
#include "result.hpp"

namespace hostlink {

class RequestDispatcher {
public:
    struct Options {
        uint32_t max_payload = protocol::DEFAULT_MAX_PAYLOAD;
        std::chrono::milliseconds default_timeout{5000};
        uint32_t id_space = 0xFFFFFFFFu;   // ids are 1..id_space
    };

    struct Stats {
        uint64_t requests_sent = 0;
        uint64_t responses_matched = 0;
        uint64_t timeouts = 0;
        uint64_t unmatched_frames = 0;
        uint64_t remote_errors = 0;
    };

    RequestDispatcher(ConnectionStateMachine& csm, Options opts);
    // Disconnects the state machine: without the dispatcher the link has no reader.
    ~RequestDispatcher();

    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    // Returns the payload of an OK/DATA response.
    //   LinkLost   not connected, write failed, or the link dropped while waiting
    //   Timeout    no response in time (the id is released)
    //   Remote     host answered ERROR; code/message from the error record
    //   FrameTooLarge, Malformed (bad ERROR payload)
    Result<std::vector<uint8_t>> send(uint16_t opcode, const std::vector<uint8_t>& payload,
                                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    bool attached() const;
    size_t inFlight() const;
    Stats stats() const;
    const Options& options() const { return opts_; }

private:
    struct Waiter {
        std::promise<Result<protocol::Frame>> promise;
        bool done = false;
    };

    struct Reader {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void on_state(const ConnectionState& s);
    void attach();
    void detach(const std::string& reason);
    void read_loop(uint64_t session, std::shared_ptr<std::atomic<bool>> finished);
    void route(protocol::Frame&& frame);
    void reap_finished_readers();

    ConnectionStateMachine& csm_;
    Options opts_;

    mutable std::mutex mutex_;
    std::condition_variable id_cv_;
    std::unordered_map<uint32_t, std::shared_ptr<Waiter>> waiters_;
    uint32_t next_id_ = 1;
    bool attached_ = false;
    uint64_t link_session_ = 0;
    std::vector<Reader> readers_;

    std::atomic<uint64_t> requests_sent_{0};
    std::atomic<uint64_t> responses_matched_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> unmatched_frames_{0};
    std::atomic<uint64_t> remote_errors_{0};

    SubscriptionHandle state_sub_;
};

} // namespace hostlink
