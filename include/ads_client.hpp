#ifndef ADS_CLIENT_HPP
#define ADS_CLIENT_HPP

/**
 * @file ads_client.hpp
 * @brief ADS client: connection lifecycle, request/response correlation, reader loop
 *
 * ============================================================================
 * THREADING MODEL
 * ============================================================================
 *
 * - Exactly one thread runs Reader::run(). It owns the read side of the
 *   socket, (re)connects, and dispatches every incoming frame: replies go to
 *   the waiting caller by invoke id, notification samples go to the sink
 *   registered for their handle.
 * - Any number of threads call Client::request() (directly or through
 *   Device / SymbolHandle / Mapping). Each caller blocks only itself, until
 *   its own reply arrives or its own deadline passes.
 * - Frames are written under one lock, so bytes of two frames never
 *   interleave.
 *
 * The reader is not started implicitly. The application decides on which
 * thread (and with which scheduling class) it runs:
 *
 *   ads::Client client(ads::ClientConfig::for_host("192.168.0.10"));
 *   ads::Reader reader = client.reader();
 *   std::thread reader_thread([&reader] { reader.run(); });
 *   ...
 *   client.shutdown();
 *   reader_thread.join();
 *
 * Before the reader runs no reply can be delivered: requests are well
 * defined but end with Timeout.
 *
 * ============================================================================
 * CONNECTION STATES
 * ============================================================================
 *
 *   Disconnected -> Connecting -> Connected -> (I/O failure) Disconnected
 *   any -> Closed (shutdown)
 *
 * Requests are only sent while Connected. Entering Disconnected fails every
 * pending request with ConnectionLost at once, drops notification
 * subscriptions, and bumps nothing else: symbol handles notice the new
 * session id on their next use and re-resolve.
 *
 * Every change is also pushed to Client::state_events(). An application
 * re-adds its notifications after a reconnect by draining that queue on a
 * thread of its own:
 *
 *   auto events = client.state_events();
 *   while (running) {
 *     auto ev = events->pop(std::chrono::milliseconds(500));
 *     if (ev && ev->state == ads::ConnectionState::Connected && ev->session_id > 1) {
 *       plc.add_notification(group, offset, attributes);
 *     }
 *   }
 *
 * A SessionGuard from Client::lock_session() keeps the reader from
 * reconnecting while it is held, so a sequence of requests either runs on
 * one session or fails with ConnectionLost.
 */

#include "ads.hpp"
#include "ads_config.hpp"
#include "ads_error.hpp"
#include "ads_frame.hpp"
#include "ads_notification.hpp"
#include "ads_transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace ads {

class Device;

namespace detail {
class ClientCore;
}

enum class ConnectionState : uint8_t {
  Disconnected,
  Connecting,
  Connected,
  Closed
};

const char* connection_state_name(ConnectionState s);

/**
 * @brief Called on every state change with the session id current at that time
 *
 * Runs on the thread that changed the state, usually the reader thread, with
 * no client lock held. It must not block: a request issued from the reader
 * thread fails at once with InvalidArgument. Use state_events() to act on a
 * reconnect.
 */
using StateCallback = std::function<void(ConnectionState, uint64_t session_id)>;

struct StateEvent {
  ConnectionState state = ConnectionState::Disconnected;
  uint64_t session_id = 0;
};

/// Default capacity of Client::state_events()
constexpr size_t kStateEventQueueCapacity = 64;

/**
 * @brief Bounded FIFO of state changes; the oldest event is dropped when full
 */
class StateEventQueue {
public:
  explicit StateEventQueue(size_t capacity = kStateEventQueueCapacity);

  void push(const StateEvent& event);

  /// Wait up to `timeout` for an event
  std::optional<StateEvent> pop(std::chrono::milliseconds timeout);
  std::optional<StateEvent> try_pop();

  size_t size() const;
  uint64_t dropped() const;
  void clear();

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<StateEvent> events_;
  uint64_t dropped_ = 0;
};

/**
 * @brief Runs on the reader thread with the raw reply frame, before the
 * waiting caller is woken and before any later frame is dispatched
 *
 * Used to register notification handles so that the first sample, which the
 * server sends right after its reply, already finds its sink. The hook sees
 * the frame unvalidated and must not block.
 */
using ReplyHook = std::function<void(const Frame&)>;

/**
 * @brief Client counters, a snapshot
 */
struct Statistics {
  uint64_t requests_sent = 0;
  uint64_t responses_received = 0;
  uint64_t timeouts = 0;
  uint64_t connection_lost = 0;        ///< Requests failed by a disconnect
  uint64_t connects = 0;               ///< Successful (re)connects
  uint64_t disconnects = 0;
  uint64_t notification_samples = 0;   ///< Samples handed to sinks
  uint64_t frames_dropped = 0;         ///< Frames nobody took, samples for unknown handles included
};

/**
 * @brief Holds the current TCP session: no reconnect while it lives
 *
 * The connection can still drop. Requests then fail with ConnectionLost
 * instead of waiting for a new session, and check() reports the loss.
 * Releasing the last guard lets the reader reconnect.
 *
 * Example:
 * @code
 * auto session = client.lock_session();
 * if (session.ok()) {
 *     ads::SymbolHandle counter(plc, "MAIN.counter");
 *     counter.write_value<uint32_t>(0);
 *     auto v = counter.read_value<uint32_t>();   // same session, same handle
 * }                                // reconnects allowed again
 * @endcode
 */
class SessionGuard {
public:
  SessionGuard() = default;
  ~SessionGuard();

  // Non-copyable
  SessionGuard(const SessionGuard&) = delete;
  SessionGuard& operator=(const SessionGuard&) = delete;

  // Movable
  SessionGuard(SessionGuard&& other) noexcept;
  SessionGuard& operator=(SessionGuard&& other) noexcept;

  bool is_active() const { return core_ != nullptr; }

  /// Session id locked by this guard
  uint64_t session_id() const { return session_; }

  /// Ok while the locked session is still the live connection
  Status check() const;

  /// Unlock early
  void release();

private:
  friend class Client;
  SessionGuard(std::shared_ptr<detail::ClientCore> core, uint64_t session)
      : core_(std::move(core)), session_(session) {}

  std::shared_ptr<detail::ClientCore> core_;
  uint64_t session_ = 0;
};

/**
 * @brief The reader loop entry point
 *
 * Cheap to copy; all copies drive the same client. Only one run() may be
 * active per client.
 */
class Reader {
public:
  /// Blocks until Client::shutdown(). Reconnects with backoff on failures.
  void run();

  bool running() const;

private:
  friend class Client;
  explicit Reader(std::shared_ptr<detail::ClientCore> core) : core_(std::move(core)) {}

  std::shared_ptr<detail::ClientCore> core_;
};

/**
 * @brief Connection to one ADS router
 *
 * Multiple clients to different routers coexist independently; there is
 * no process-wide state.
 */
class Client {
public:
  explicit Client(ClientConfig config);

  /// Use a custom transport (tests, tunnels)
  Client(ClientConfig config, std::unique_ptr<Transport> transport);

  /// Calls shutdown()
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /**
   * @brief Explicit first connection attempt from the calling thread
   *
   * Optional: the reader connects by itself. Useful to report a wrong host
   * or a missing route early.
   * @return ConnectFailure / InvalidArgument, or ok when connected
   */
  Status connect();

  /// The reader loop; see the threading model above
  Reader reader();

  /**
   * @brief Issue one ADS command and wait for its reply
   *
   * @param command ADS command id
   * @param target  Target device address
   * @param payload Command data
   * @param timeout Deadline for the whole call; zero selects the configured
   *                read timeout (which itself defaults to kDefaultTimeout)
   * @return Reply data after the result field, or the failure
   */
  Result<std::vector<uint8_t>> request(Command command,
                                       const AmsAddr& target,
                                       const std::vector<uint8_t>& payload,
                                       std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  /// As above, running `on_reply` on the reader thread when the reply arrives
  Result<std::vector<uint8_t>> request(Command command,
                                       const AmsAddr& target,
                                       const std::vector<uint8_t>& payload,
                                       std::chrono::milliseconds timeout,
                                       ReplyHook on_reply);

  /**
   * @brief Command issuer bound to `addr`
   *
   * The local NetId 127.0.0.1.1.1 is replaced by the client's source NetId,
   * so a PLC on the router's own machine can be reached without knowing its
   * NetId. The replacement needs a resolved source (connect first when
   * using Source::Auto).
   */
  Device device(const AmsAddr& addr);

  /// Source address of the current connection (unresolved Auto: all zero)
  AmsAddr source() const;

  /// Incremented on every successful (re)connect; 0 before the first one
  uint64_t session_id() const;

  ConnectionState state() const;

  /// Wait until Connected; false on timeout or after shutdown
  bool wait_connected(std::chrono::milliseconds timeout) const;

  void set_state_callback(StateCallback callback);

  /// Every state change, for the application to drain on its own thread
  std::shared_ptr<StateEventQueue> state_events() const;

  /**
   * @brief Disable reconnects while the returned guard lives
   * @return ConnectionLost unless Connected
   */
  Result<SessionGuard> lock_session();

  /// True while a thread is inside Reader::run()
  bool reader_running() const;

  /// Queue receiving samples of notifications added without their own sink
  std::shared_ptr<NotificationQueue> notifications() const;

  /// Route samples for (device, handle) to `sink`; used by Device
  void register_notification(const AmsAddr& device, NotificationHandle handle,
                             std::shared_ptr<NotificationSink> sink);
  void unregister_notification(const AmsAddr& device, NotificationHandle handle);
  size_t active_notifications() const;

  /**
   * @brief Delete all notifications (best effort), stop the reader, close
   *
   * Idempotent. Pending and later requests fail with ConnectionLost.
   */
  void shutdown();

  Statistics statistics() const;
  const ClientConfig& config() const;

private:
  std::shared_ptr<detail::ClientCore> core_;
};

} // namespace ads

#endif // ADS_CLIENT_HPP
