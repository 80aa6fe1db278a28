#include "ads_client.hpp"
#include "ads_device.hpp"
#include "ads_frame.hpp"
#include "ads_log.hpp"
#include "ads_pending.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace ads {

const char* connection_state_name(ConnectionState s) {
    switch (s) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Closed:       return "Closed";
    }
    return "Unknown";
}

// ============================================================================
// StateEventQueue
// ============================================================================

StateEventQueue::StateEventQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void StateEventQueue::push(const StateEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.size() >= capacity_) {
            events_.pop_front();
            ++dropped_;
        }
        events_.push_back(event);
    }
    cv_.notify_one();
}

std::optional<StateEvent> StateEventQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return std::nullopt;
    }
    StateEvent ev = events_.front();
    events_.pop_front();
    return ev;
}

std::optional<StateEvent> StateEventQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    StateEvent ev = events_.front();
    events_.pop_front();
    return ev;
}

size_t StateEventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

uint64_t StateEventQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void StateEventQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

namespace detail {

// ============================================================================
// ClientCore - state shared by Client and Reader
// ============================================================================
//
// Lock order: connect_mutex_ -> write_mutex_ -> state_mutex_.
// subs_mutex_ and callback_mutex_ are leaves and never held while calling out.
// State changes are published (event queue, then callback) with no lock held.

class ClientCore {
public:
    ClientCore(ClientConfig config, std::unique_ptr<Transport> transport)
        : config_(std::move(config)),
          transport_(std::move(transport)),
          default_queue_(std::make_shared<NotificationQueue>(config_.notification_queue_capacity)),
          state_events_(std::make_shared<StateEventQueue>()),
          logger_(log::get_logger("ads_client")),
          reader_log_(log::get_logger("ads_reader")) {}

    Status connect_once();
    void run_reader();
    bool reader_running() const;

    Result<std::vector<uint8_t>> request(Command command, const AmsAddr& target,
                                         const std::vector<uint8_t>& payload,
                                         std::chrono::milliseconds timeout,
                                         ReplyHook on_reply);

    AmsAddr source() const;
    uint64_t session_id() const;
    ConnectionState state() const;
    bool wait_connected(std::chrono::milliseconds timeout);
    void set_state_callback(StateCallback callback);
    std::shared_ptr<StateEventQueue> state_events() const { return state_events_; }

    Result<uint64_t> lock_session();
    void unlock_session();
    Status check_session(uint64_t session) const;

    void register_notification(const AmsAddr& device, NotificationHandle handle,
                               std::shared_ptr<NotificationSink> sink);
    void unregister_notification(const AmsAddr& device, NotificationHandle handle);
    size_t active_notifications() const;

    void shutdown();
    Statistics statistics() const;

    const ClientConfig& config() const { return config_; }
    std::shared_ptr<NotificationQueue> default_queue() const { return default_queue_; }

private:
    using SubscriptionKey = std::pair<AmsAddr, NotificationHandle>;

    // Keeps a reply hook registered for the lifetime of one request
    class HookGuard {
    public:
        HookGuard(ClientCore& core, uint32_t invoke_id, ReplyHook hook)
            : core_(core), invoke_id_(invoke_id), active_(static_cast<bool>(hook)) {
            if (active_) {
                std::lock_guard<std::mutex> lock(core_.hooks_mutex_);
                core_.hooks_[invoke_id_] = std::move(hook);
            }
        }
        ~HookGuard() {
            if (active_) {
                std::lock_guard<std::mutex> lock(core_.hooks_mutex_);
                core_.hooks_.erase(invoke_id_);
            }
        }
        HookGuard(const HookGuard&) = delete;
        HookGuard& operator=(const HookGuard&) = delete;

    private:
        ClientCore& core_;
        uint32_t invoke_id_;
        bool active_;
    };

    AmsAddr resolve_source() const;
    Status connect_locked(std::vector<StateEvent>& events);
    void change_state(ConnectionState s, std::vector<StateEvent>& events);
    void notify_state(ConnectionState s, uint64_t session);
    bool is_stopping() const;
    bool session_locked() const;
    void wait_for_stop(std::chrono::milliseconds d);
    void wait_for_unlock(std::chrono::milliseconds d);

    void dispatch(Frame frame);
    void deliver_notification(const Frame& frame);
    void handle_disconnect(const Error& reason);
    void finish_shutdown();

    Result<std::vector<uint8_t>> check_reply(Command command, const AmsAddr& target,
                                             uint32_t invoke_id, const Frame& frame) const;

    const ClientConfig config_;
    std::unique_ptr<Transport> transport_;
    PendingTable pending_;
    FrameAssembler assembler_;   // reader only

    std::mutex connect_mutex_;
    std::mutex write_mutex_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    ConnectionState state_ = ConnectionState::Disconnected;
    uint64_t session_id_ = 0;
    AmsAddr source_;
    bool stopping_ = false;
    bool reader_running_ = false;
    std::thread::id reader_thread_;
    size_t session_locks_ = 0;

    mutable std::mutex subs_mutex_;
    std::map<SubscriptionKey, std::shared_ptr<NotificationSink>> subscriptions_;
    std::shared_ptr<NotificationQueue> default_queue_;

    std::mutex callback_mutex_;
    StateCallback state_callback_;
    std::shared_ptr<StateEventQueue> state_events_;

    std::mutex hooks_mutex_;
    std::map<uint32_t, ReplyHook> hooks_;

    std::atomic<uint64_t> requests_sent_{0};
    std::atomic<uint64_t> responses_received_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> connection_lost_{0};
    std::atomic<uint64_t> connects_{0};
    std::atomic<uint64_t> disconnects_{0};
    std::atomic<uint64_t> notification_samples_{0};
    std::atomic<uint64_t> frames_dropped_{0};

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> reader_log_;
};

// ----------------------------------------------------------------------------
// State
// ----------------------------------------------------------------------------

AmsAddr ClientCore::resolve_source() const {
    if (!config_.source.is_auto()) {
        return config_.source.addr();
    }
    auto ip = transport_->local_ipv4();
    AmsNetId id = ip ? AmsNetId::from_ipv4(*ip) : AmsNetId::local();
    return AmsAddr(id, ports::AutoSource);
}

AmsAddr ClientCore::source() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return source_;
}

uint64_t ClientCore::session_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_id_;
}

ConnectionState ClientCore::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool ClientCore::is_stopping() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stopping_;
}

bool ClientCore::reader_running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return reader_running_;
}

bool ClientCore::session_locked() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_locks_ > 0;
}

// Records the event; the caller publishes it once its locks are released
void ClientCore::change_state(ConnectionState s, std::vector<StateEvent>& events) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ConnectionState::Closed) return;
        state_ = s;
        events.push_back(StateEvent{s, session_id_});
    }
    state_cv_.notify_all();
}

void ClientCore::notify_state(ConnectionState s, uint64_t session) {
    state_events_->push(StateEvent{s, session});

    StateCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = state_callback_;
    }
    if (cb) cb(s, session);
}

void ClientCore::set_state_callback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_callback_ = std::move(callback);
}

bool ClientCore::wait_connected(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, timeout, [this] {
        return state_ == ConnectionState::Connected || state_ == ConnectionState::Closed || stopping_;
    });
    return state_ == ConnectionState::Connected && !stopping_;
}

void ClientCore::wait_for_stop(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, d, [this] { return stopping_; });
}

void ClientCore::wait_for_unlock(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, d, [this] { return stopping_ || session_locks_ == 0; });
}

// ----------------------------------------------------------------------------
// Session lock
// ----------------------------------------------------------------------------

Result<uint64_t> ClientCore::lock_session() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (stopping_ || state_ == ConnectionState::Closed) {
        return make_error(ErrorKind::ConnectionLost, "client is shut down");
    }
    if (state_ != ConnectionState::Connected) {
        return make_error(ErrorKind::ConnectionLost, "no session to lock: not connected");
    }
    ++session_locks_;
    return session_id_;
}

void ClientCore::unlock_session() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (session_locks_ > 0) --session_locks_;
    }
    state_cv_.notify_all();
}

Status ClientCore::check_session(uint64_t session) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == ConnectionState::Connected && session_id_ == session) {
        return Status();
    }
    return make_error(ErrorKind::ConnectionLost,
                      "session " + std::to_string(session) + " is gone");
}

// ----------------------------------------------------------------------------
// Connect
// ----------------------------------------------------------------------------

Status ClientCore::connect_once() {
    std::vector<StateEvent> events;
    Status st;
    {
        std::lock_guard<std::mutex> guard(connect_mutex_);
        st = connect_locked(events);
    }
    for (const StateEvent& ev : events) {
        notify_state(ev.state, ev.session_id);
    }
    return st;
}

Status ClientCore::connect_locked(std::vector<StateEvent>& events) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stopping_ || state_ == ConnectionState::Closed) {
            return make_error(ErrorKind::ConnectionLost, "client is shut down");
        }
        if (state_ == ConnectionState::Connected) {
            return Status();
        }
        if (session_locks_ > 0) {
            return make_error(ErrorKind::ConnectionLost,
                              "session " + std::to_string(session_id_) + " is locked, not reconnecting");
        }
    }

    Status valid = config_.validate();
    if (!valid.ok()) {
        return valid;
    }

    change_state(ConnectionState::Connecting, events);

    Status st = transport_->open(config_.host, config_.port, config_.timeouts);
    if (!st.ok()) {
        change_state(ConnectionState::Disconnected, events);
        return st;
    }

    const AmsAddr src = resolve_source();
    uint64_t session = 0;
    {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stopping_) {
            transport_->close();
            return make_error(ErrorKind::ConnectionLost, "client is shut down");
        }
        source_ = src;
        session = ++session_id_;
        state_ = ConnectionState::Connected;
    }
    ++connects_;
    state_cv_.notify_all();

    logger_->info("connected to {}:{} as {} (session {})",
                  config_.host, config_.port, src.to_string(), session);
    events.push_back(StateEvent{ConnectionState::Connected, session});
    return Status();
}

// ----------------------------------------------------------------------------
// Reader loop
// ----------------------------------------------------------------------------

namespace {
constexpr size_t kReceiveChunk = 64 * 1024;
}

void ClientCore::run_reader() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ConnectionState::Closed || stopping_) {
            return;
        }
        if (reader_running_) {
            reader_log_->error("reader is already running for this client");
            return;
        }
        reader_running_ = true;
        reader_thread_ = std::this_thread::get_id();
    }

    std::string problems;
    if (!config_.is_valid(&problems)) {
        reader_log_->error("invalid client configuration: {}", problems);
        finish_shutdown();
        return;
    }

    reader_log_->debug("reader started for {}:{}", config_.host, config_.port);

    std::vector<uint8_t> buffer(kReceiveChunk);
    std::chrono::milliseconds backoff = config_.reconnect_delay;
    bool was_connected = false;

    while (!is_stopping()) {
        if (state() != ConnectionState::Connected) {
            if (session_locked()) {
                // A SessionGuard forbids a new session until it is released
                wait_for_unlock(config_.poll_interval);
                continue;
            }
            if (was_connected) {
                // Pause after a drop so a peer that accepts and closes at once
                // does not make us spin.
                was_connected = false;
                wait_for_stop(config_.reconnect_delay);
                continue;
            }
            Status st = connect_once();
            if (!st.ok()) {
                if (is_stopping()) break;
                reader_log_->warn("connect to {}:{} failed: {}; retrying in {} ms",
                                  config_.host, config_.port, st.error.message, backoff.count());
                wait_for_stop(backoff);
                backoff = std::min(backoff * 2, config_.max_reconnect_delay);
                continue;
            }
            backoff = config_.reconnect_delay;
            assembler_.reset();
        }
        was_connected = true;

        auto got = transport_->receive_some(buffer.data(), buffer.size(), config_.poll_interval);
        if (!got.ok()) {
            if (is_stopping()) break;
            handle_disconnect(got.error);
            continue;
        }
        if (got.value == 0) {
            continue;
        }

        assembler_.feed(buffer.data(), got.value);
        for (;;) {
            DecodeResult d = assembler_.next();
            if (d.status == DecodeStatus::Incomplete) {
                break;
            }
            if (d.status == DecodeStatus::Malformed) {
                handle_disconnect(make_error(ErrorKind::MalformedFrame, d.error));
                break;
            }
            dispatch(std::move(d.frame));
        }
    }

    finish_shutdown();
    reader_log_->debug("reader stopped");
}

void ClientCore::dispatch(Frame frame) {
    if (!frame.is_ads_command()) {
        reader_log_->trace("skipping AMS/TCP command 0x{:04x} ({} bytes)",
                           frame.ams_cmd, frame.payload.size());
        return;
    }

    const AmsAddr src = source();
    if (frame.header.target != src) {
        ++frames_dropped_;
        reader_log_->debug("dropping frame addressed to {} (we are {})",
                           frame.header.target.to_string(), src.to_string());
        return;
    }

    if (frame.header.command == static_cast<uint16_t>(Command::Notification)) {
        deliver_notification(frame);
        return;
    }

    const uint32_t invoke_id = frame.header.invoke_id;
    ReplyHook hook;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        auto it = hooks_.find(invoke_id);
        if (it != hooks_.end()) {
            hook = std::move(it->second);
            hooks_.erase(it);
        }
    }
    // The hook runs only if the caller is still waiting; a caller that times
    // out meanwhile receives this reply instead of Timeout.
    if (!pending_.complete(invoke_id, std::move(frame), hook)) {
        ++frames_dropped_;
        reader_log_->debug("no pending request for invoke id {}, reply dropped", invoke_id);
        return;
    }
    ++responses_received_;
}

void ClientCore::deliver_notification(const Frame& frame) {
    if (frame.header.state_flags != flags::Request || frame.header.error_code != 0) {
        ++frames_dropped_;
        reader_log_->debug("dropping notification with flags 0x{:04x}, error 0x{:x}",
                           frame.header.state_flags, frame.header.error_code);
        return;
    }

    auto parsed = parse_notification(frame.header.source, frame.payload);
    if (!parsed.ok()) {
        ++frames_dropped_;
        reader_log_->warn("dropping notification from {}: {}",
                          frame.header.source.to_string(), parsed.error.message);
        return;
    }

    for (const Sample& sample : parsed.value) {
        std::shared_ptr<NotificationSink> sink;
        {
            std::lock_guard<std::mutex> lock(subs_mutex_);
            auto it = subscriptions_.find(SubscriptionKey(sample.source, sample.handle));
            if (it != subscriptions_.end()) {
                sink = it->second;
            }
        }
        if (!sink) {
            ++frames_dropped_;
            reader_log_->debug("sample for unknown notification handle {} from {}",
                               sample.handle, sample.source.to_string());
            continue;
        }
        sink->deliver(sample);
        ++notification_samples_;
    }
}

void ClientCore::handle_disconnect(const Error& reason) {
    uint64_t session;
    {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        transport_->close();
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ConnectionState::Closed) {
            state_ = ConnectionState::Disconnected;
        }
        session = session_id_;
    }
    state_cv_.notify_all();

    const size_t failed = pending_.fail_all(
        make_error(ErrorKind::ConnectionLost, "connection lost: " + reason.message));
    size_t dropped_subs;
    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        dropped_subs = subscriptions_.size();
        subscriptions_.clear();
    }
    assembler_.reset();

    ++disconnects_;
    connection_lost_ += failed;
    logger_->warn("connection to {}:{} lost ({}); {} pending requests failed, {} notifications dropped",
                  config_.host, config_.port, to_string(reason), failed, dropped_subs);

    notify_state(ConnectionState::Disconnected, session);
}

void ClientCore::finish_shutdown() {
    uint64_t session;
    bool changed;
    {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        transport_->close();
        std::lock_guard<std::mutex> lock(state_mutex_);
        changed = state_ != ConnectionState::Closed;
        state_ = ConnectionState::Closed;
        stopping_ = true;
        reader_running_ = false;
        session = session_id_;
    }
    state_cv_.notify_all();

    const size_t failed = pending_.fail_all(
        make_error(ErrorKind::ConnectionLost, "client is shut down"));
    connection_lost_ += failed;
    {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        subscriptions_.clear();
    }

    if (changed) {
        logger_->info("client for {}:{} closed", config_.host, config_.port);
        notify_state(ConnectionState::Closed, session);
    }
}

// ----------------------------------------------------------------------------
// Requests
// ----------------------------------------------------------------------------

Result<std::vector<uint8_t>> ClientCore::request(Command command, const AmsAddr& target,
                                                 const std::vector<uint8_t>& payload,
                                                 std::chrono::milliseconds timeout,
                                                 ReplyHook on_reply) {
    const auto wait = timeout.count() > 0 ? timeout : config_.timeouts.read_or_default();
    const auto deadline = std::chrono::steady_clock::now() + wait;

    uint64_t session = 0;
    AmsAddr src;
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (reader_running_ && reader_thread_ == std::this_thread::get_id()) {
            return make_error(ErrorKind::InvalidArgument,
                              std::string(command_name(command)) +
                              ": issued on the reader thread, which alone could deliver its reply");
        }
        const bool ready = state_cv_.wait_until(lock, deadline, [this] {
            return state_ == ConnectionState::Connected || state_ == ConnectionState::Closed ||
                   stopping_ || session_locks_ > 0;
        });
        if (state_ == ConnectionState::Closed || stopping_) {
            return make_error(ErrorKind::ConnectionLost, "client is shut down");
        }
        if (state_ != ConnectionState::Connected && session_locks_ > 0) {
            ++connection_lost_;
            return make_error(ErrorKind::ConnectionLost,
                              std::string(command_name(command)) + ": locked session " +
                              std::to_string(session_id_) + " is gone");
        }
        if (!ready) {
            ++timeouts_;
            return make_error(ErrorKind::Timeout,
                              std::string(command_name(command)) + ": not connected within " +
                              std::to_string(wait.count()) + " ms");
        }
        session = session_id_;
        src = source_;
    }

    PendingTable::Ticket ticket = pending_.add();
    const uint32_t invoke_id = ticket.invoke_id;
    HookGuard hook_guard(*this, invoke_id, std::move(on_reply));
    const std::vector<uint8_t> bytes = encode_request(command, target, src, invoke_id, payload);

    {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        bool live;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            live = state_ == ConnectionState::Connected && session_id_ == session;
        }
        if (!live) {
            pending_.remove(invoke_id);
            ++connection_lost_;
            return make_error(ErrorKind::ConnectionLost,
                              std::string(command_name(command)) + ": connection lost before send");
        }
        Status st = transport_->send_all(bytes);
        if (!st.ok()) {
            pending_.remove(invoke_id);
            // The reader notices the dead socket and runs the disconnect sweep.
            transport_->shutdown();
            ++connection_lost_;
            return make_error(ErrorKind::ConnectionLost,
                              std::string(command_name(command)) + ": send failed: " + st.error.message);
        }
    }
    ++requests_sent_;
    log::log_buffer(logger_, spdlog::level::trace, bytes,
                    "tx " + std::string(command_name(command)) + " to " + target.to_string() +
                    " invoke " + std::to_string(invoke_id));

    if (ticket.reply.wait_until(deadline) != std::future_status::ready) {
        if (pending_.remove(invoke_id)) {
            ++timeouts_;
            logger_->debug("{} to {} (invoke {}) timed out after {} ms",
                           command_name(command), target.to_string(), invoke_id, wait.count());
            return make_error(ErrorKind::Timeout,
                              std::string(command_name(command)) + ": no response within " +
                              std::to_string(wait.count()) + " ms");
        }
        // Retired concurrently by the reader: the value is being set now.
    }

    Reply reply = ticket.reply.get();
    if (!reply.ok()) {
        return reply.error;
    }
    return check_reply(command, target, invoke_id, reply.frame);
}

Result<std::vector<uint8_t>> ClientCore::check_reply(Command command, const AmsAddr& target,
                                                     uint32_t invoke_id, const Frame& frame) const {
    const AmsHeader& h = frame.header;
    const std::string what = command_name(command);

    if (h.command != static_cast<uint16_t>(command)) {
        return make_error(ErrorKind::ProtocolError,
                          what + ": reply carries command " + std::to_string(h.command));
    }
    if ((h.state_flags & flags::Response) == 0) {
        return make_error(ErrorKind::ProtocolError, what + ": reply without response flag");
    }
    if (h.invoke_id != invoke_id) {
        return make_error(ErrorKind::ProtocolError, what + ": reply for another invoke id");
    }
    if (h.source != target) {
        return make_error(ErrorKind::ProtocolError,
                          what + ": reply from " + h.source.to_string() +
                          ", expected " + target.to_string());
    }
    if (h.error_code != 0) {
        return make_error(ErrorKind::ProtocolError,
                          what + " failed: " + errors::Interpreter::format_for_log(h.error_code),
                          h.error_code);
    }
    if (frame.payload.size() < 4) {
        return make_error(ErrorKind::ProtocolError, what + ": reply shorter than its result field");
    }

    const uint32_t result = codec::rd32(frame.payload.data());
    if (result != 0) {
        return make_error(ErrorKind::ProtocolError,
                          what + " failed: " + errors::Interpreter::format_for_log(result),
                          result);
    }
    return std::vector<uint8_t>(frame.payload.begin() + 4, frame.payload.end());
}

// ----------------------------------------------------------------------------
// Notifications and shutdown
// ----------------------------------------------------------------------------

void ClientCore::register_notification(const AmsAddr& device, NotificationHandle handle,
                                       std::shared_ptr<NotificationSink> sink) {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    subscriptions_[SubscriptionKey(device, handle)] = std::move(sink);
}

void ClientCore::unregister_notification(const AmsAddr& device, NotificationHandle handle) {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    subscriptions_.erase(SubscriptionKey(device, handle));
}

size_t ClientCore::active_notifications() const {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    return subscriptions_.size();
}

void ClientCore::shutdown() {
    bool reader_active;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stopping_) return;
        reader_active = reader_running_ && state_ == ConnectionState::Connected;
    }

    if (reader_active) {
        std::vector<SubscriptionKey> keys;
        {
            std::lock_guard<std::mutex> lock(subs_mutex_);
            for (const auto& entry : subscriptions_) keys.push_back(entry.first);
        }
        for (const auto& key : keys) {
            std::vector<uint8_t> payload;
            codec::le32(payload, key.second);
            auto res = request(Command::DeleteNotification, key.first, payload,
                               config_.timeouts.read_or_default(), ReplyHook());
            if (!res.ok()) {
                logger_->debug("delete notification {} on {} during shutdown: {}",
                               key.second, key.first.to_string(), to_string(res.error));
            }
        }
    }

    bool reader_owns_close;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stopping_ = true;
        reader_owns_close = reader_running_;
    }
    state_cv_.notify_all();

    if (reader_owns_close) {
        transport_->shutdown();
    } else {
        finish_shutdown();
    }
}

Statistics ClientCore::statistics() const {
    Statistics s;
    s.requests_sent = requests_sent_.load();
    s.responses_received = responses_received_.load();
    s.timeouts = timeouts_.load();
    s.connection_lost = connection_lost_.load();
    s.connects = connects_.load();
    s.disconnects = disconnects_.load();
    s.notification_samples = notification_samples_.load();
    s.frames_dropped = frames_dropped_.load();
    return s;
}

} // namespace detail

// ============================================================================
// SessionGuard
// ============================================================================

SessionGuard::~SessionGuard() {
    release();
}

SessionGuard::SessionGuard(SessionGuard&& other) noexcept
    : core_(std::move(other.core_)), session_(other.session_) {
    other.core_.reset();
}

SessionGuard& SessionGuard::operator=(SessionGuard&& other) noexcept {
    if (this != &other) {
        release();
        core_ = std::move(other.core_);
        session_ = other.session_;
        other.core_.reset();
    }
    return *this;
}

Status SessionGuard::check() const {
    if (!core_) {
        return make_error(ErrorKind::InvalidArgument, "session guard is not active");
    }
    return core_->check_session(session_);
}

void SessionGuard::release() {
    if (core_) {
        core_->unlock_session();
        core_.reset();
    }
}

// ============================================================================
// Reader
// ============================================================================

void Reader::run() {
    core_->run_reader();
}

bool Reader::running() const {
    return core_->reader_running();
}

// ============================================================================
// Client
// ============================================================================

Client::Client(ClientConfig config)
    : Client(std::move(config), std::make_unique<TcpTransport>()) {}

Client::Client(ClientConfig config, std::unique_ptr<Transport> transport)
    : core_(std::make_shared<detail::ClientCore>(std::move(config), std::move(transport))) {}

Client::~Client() {
    shutdown();
}

Status Client::connect() {
    return core_->connect_once();
}

Reader Client::reader() {
    return Reader(core_);
}

Result<std::vector<uint8_t>> Client::request(Command command, const AmsAddr& target,
                                             const std::vector<uint8_t>& payload,
                                             std::chrono::milliseconds timeout) {
    return core_->request(command, target, payload, timeout, ReplyHook());
}

Result<std::vector<uint8_t>> Client::request(Command command, const AmsAddr& target,
                                             const std::vector<uint8_t>& payload,
                                             std::chrono::milliseconds timeout,
                                             ReplyHook on_reply) {
    return core_->request(command, target, payload, timeout, std::move(on_reply));
}

Device Client::device(const AmsAddr& addr) {
    AmsAddr target = addr;
    if (target.netid == AmsNetId::local()) {
        const AmsAddr src = core_->source();
        if (!src.netid.is_zero()) {
            target.netid = src.netid;
        }
    }
    return Device(*this, target);
}

AmsAddr Client::source() const { return core_->source(); }
uint64_t Client::session_id() const { return core_->session_id(); }
ConnectionState Client::state() const { return core_->state(); }

bool Client::wait_connected(std::chrono::milliseconds timeout) const {
    return core_->wait_connected(timeout);
}

void Client::set_state_callback(StateCallback callback) {
    core_->set_state_callback(std::move(callback));
}

std::shared_ptr<StateEventQueue> Client::state_events() const {
    return core_->state_events();
}

Result<SessionGuard> Client::lock_session() {
    auto locked = core_->lock_session();
    if (!locked.ok()) return locked.error;
    return SessionGuard(core_, locked.value);
}

bool Client::reader_running() const {
    return core_->reader_running();
}

std::shared_ptr<NotificationQueue> Client::notifications() const {
    return core_->default_queue();
}

void Client::register_notification(const AmsAddr& device, NotificationHandle handle,
                                   std::shared_ptr<NotificationSink> sink) {
    core_->register_notification(device, handle, std::move(sink));
}

void Client::unregister_notification(const AmsAddr& device, NotificationHandle handle) {
    core_->unregister_notification(device, handle);
}

size_t Client::active_notifications() const {
    return core_->active_notifications();
}

void Client::shutdown() {
    core_->shutdown();
}

Statistics Client::statistics() const {
    return core_->statistics();
}

const ClientConfig& Client::config() const {
    return core_->config();
}

} // namespace ads
