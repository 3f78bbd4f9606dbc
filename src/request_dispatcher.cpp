#include "request_dispatcher.hpp"
#include "hostlink_log.hpp"
#include "payload_codec.hpp"

namespace hostlink {

using protocol::Frame;

RequestDispatcher::RequestDispatcher(ConnectionStateMachine& csm, Options opts)
    : csm_(csm), opts_(opts) {
    if (opts_.id_space == 0) opts_.id_space = 1;
    state_sub_ = csm_.state().subscribe([this](const ConnectionState& s) { on_state(s); });
}

RequestDispatcher::~RequestDispatcher() {
    state_sub_.reset();
    detach("dispatcher shutting down");
    // The reader only exits once the link is closed
    csm_.disconnect();

    std::vector<Reader> readers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        readers.swap(readers_);
    }
    for (auto& r : readers) {
        if (r.thread.joinable()) r.thread.join();
    }
}

void RequestDispatcher::on_state(const ConnectionState& s) {
    if (s.isConnected()) {
        attach();
    } else {
        detach("connection " + s.toString());
    }
}

void RequestDispatcher::reap_finished_readers() {
    // Caller holds mutex_. Finished readers have no locks left to take.
    for (auto it = readers_.begin(); it != readers_.end();) {
        if (it->finished->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = readers_.erase(it);
        } else {
            ++it;
        }
    }
}

void RequestDispatcher::attach() {
    auto h = csm_.link().handle();
    if (!h) {
        HLOG_WARN("dispatch", "Connected but no link is open");
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (attached_ && link_session_ == h->session) return;
    reap_finished_readers();

    attached_ = true;
    link_session_ = h->session;
    auto finished = std::make_shared<std::atomic<bool>>(false);
    Reader r;
    r.finished = finished;
    r.thread = std::thread(&RequestDispatcher::read_loop, this, h->session, finished);
    readers_.push_back(std::move(r));
    HLOG_INFO("dispatch", "Attached to %s link (session %llu)", transportKindName(h->kind),
              (unsigned long long)h->session);
}

void RequestDispatcher::detach(const std::string& reason) {
    std::unordered_map<uint32_t, std::shared_ptr<Waiter>> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!attached_ && waiters_.empty()) return;
        attached_ = false;
        failed.swap(waiters_);
        for (auto& kv : failed) kv.second->done = true;
    }
    id_cv_.notify_all();

    if (!failed.empty()) {
        HLOG_WARN("dispatch", "Failing %zu outstanding request(s): %s", failed.size(), reason.c_str());
    }
    for (auto& kv : failed) {
        kv.second->promise.set_value(Err<Frame>(ErrorKind::LinkLost, reason));
    }
}

void RequestDispatcher::read_loop(uint64_t session, std::shared_ptr<std::atomic<bool>> finished) {
    HLOG_INFO("dispatch", "Read loop started (session %llu)", (unsigned long long)session);
    TransportLink& link = csm_.link();
    protocol::ReadFn fn = [&link](uint8_t* buf, size_t len) { return link.read(buf, len); };

    for (;;) {
        auto fr = protocol::readFrame(fn, opts_.max_payload);
        if (fr.is_err()) {
            bool current;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                current = attached_ && link_session_ == session;
            }
            if (current) {
                HLOG_WARN("dispatch", "Read loop stopping: %s", fr.error().describe().c_str());
                csm_.reportLinkError(fr.error(), session);
            }
            break;
        }
        route(std::move(fr).value());
    }

    HLOG_INFO("dispatch", "Read loop ended (session %llu)", (unsigned long long)session);
    finished->store(true);
}

void RequestDispatcher::route(Frame&& frame) {
    std::shared_ptr<Waiter> w;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = waiters_.find(frame.correlation_id);
        if (it != waiters_.end() && protocol::isResponse(frame.opcode)) {
            w = it->second;
            w->done = true;
            waiters_.erase(it);
        }
    }

    if (!w) {
        unmatched_frames_.fetch_add(1);
        HLOG_WARN("dispatch", "Dropping unmatched %s frame id=%u (%zu bytes)",
                  protocol::opcodeName(frame.opcode), frame.correlation_id, frame.payload.size());
        UnmatchedFrameEvent ev;
        ev.opcode = frame.opcode;
        ev.correlation_id = frame.correlation_id;
        ev.payload_size = frame.payload.size();
        bus().publish(ev);
        return;
    }

    id_cv_.notify_one();
    responses_matched_.fetch_add(1);
    w->promise.set_value(Ok(std::move(frame)));
}

Result<std::vector<uint8_t>> RequestDispatcher::send(uint16_t opcode, const std::vector<uint8_t>& payload,
                                                     std::optional<std::chrono::milliseconds> timeout) {
    using Bytes = std::vector<uint8_t>;
    const auto wait = timeout.value_or(opts_.default_timeout);
    const auto deadline = std::chrono::steady_clock::now() + wait;
    const char* op_name = protocol::opcodeName(opcode);

    auto w = std::make_shared<Waiter>();
    auto fut = w->promise.get_future();
    uint32_t id = 0;
    uint64_t session = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            if (!attached_) return Err<Bytes>(ErrorKind::LinkLost, std::string("not connected (") + op_name + ")");
            if (waiters_.size() < opts_.id_space) break;
            if (id_cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
                waiters_.size() >= opts_.id_space) {
                timeouts_.fetch_add(1);
                return Err<Bytes>(ErrorKind::Timeout, std::string("no free correlation id for ") + op_name);
            }
        }
        // Skip ids still in flight; wraps within 1..id_space
        for (;;) {
            uint32_t candidate = next_id_;
            next_id_ = next_id_ >= opts_.id_space ? 1 : next_id_ + 1;
            if (waiters_.find(candidate) == waiters_.end()) {
                id = candidate;
                break;
            }
        }
        waiters_[id] = w;
        session = link_session_;
    }

    auto release = [&]() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = waiters_.find(id);
            if (it != waiters_.end() && it->second == w) waiters_.erase(it);
        }
        id_cv_.notify_one();
    };

    auto frame = protocol::encodeFrame(opcode, id, payload.data(), payload.size(), opts_.max_payload);
    if (frame.is_err()) {
        release();
        return frame.error();
    }

    auto wr = csm_.link().write(frame.value().data(), frame.value().size());
    if (wr.is_err()) {
        release();
        HLOG_ERROR("dispatch", "Write of %s id=%u failed: %s", op_name, id, wr.error().describe().c_str());
        csm_.reportLinkError(wr.error(), session);
        return Err<Bytes>(ErrorKind::LinkLost, std::string("write failed (") + op_name + "): " + wr.error().message);
    }
    requests_sent_.fetch_add(1);
    HLOG_TRACE("dispatch", "-> %s id=%u (%zu bytes)", op_name, id, payload.size());

    if (fut.wait_until(deadline) != std::future_status::ready) {
        bool answered;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            answered = w->done;   // response or detach raced the deadline
            if (!answered) waiters_.erase(id);
        }
        if (!answered) {
            id_cv_.notify_one();
            timeouts_.fetch_add(1);
            HLOG_WARN("dispatch", "%s id=%u timed out after %lld ms", op_name, id, (long long)wait.count());
            return Err<Bytes>(ErrorKind::Timeout, std::string("no response for ") + op_name);
        }
    }

    auto res = fut.get();
    if (res.is_err()) return res.error();
    Frame resp = std::move(res).value();

    if (resp.opcode == protocol::OP_ERROR) {
        remote_errors_.fetch_add(1);
        auto rec = protocol::decodeError(resp.payload);
        if (rec.is_err()) return rec.error();
        std::string msg = rec.value().message.empty() ? protocol::hostErrorName(rec.value().code)
                                                      : rec.value().message;
        HLOG_DEBUG("dispatch", "%s id=%u -> ERROR %u (%s)", op_name, id, rec.value().code, msg.c_str());
        return Err<Bytes>(ErrorKind::Remote, msg, (int)rec.value().code);
    }
    return Ok(std::move(resp.payload));
}

bool RequestDispatcher::attached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attached_;
}

size_t RequestDispatcher::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

RequestDispatcher::Stats RequestDispatcher::stats() const {
    Stats s;
    s.requests_sent = requests_sent_.load();
    s.responses_matched = responses_matched_.load();
    s.timeouts = timeouts_.load();
    s.unmatched_frames = unmatched_frames_.load();
    s.remote_errors = remote_errors_.load();
    return s;
}

} // namespace hostlink
