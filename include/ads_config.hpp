#pragma once
/**
 * @file ads_config.hpp
 * @brief Client configuration: target, timeouts, source address, reconnect policy
 *
 * Timeout semantics:
 * - connect: upper bound for one TCP connection attempt
 * - read:    upper bound for waiting on a reply (per request)
 * - write:   upper bound for handing one frame to the socket
 *
 * A zero duration selects kDefaultTimeout. There is no way to configure an
 * unbounded wait.
 */

#include "ads.hpp"
#include "ads_error.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace ads {

/// Ceiling applied whenever a timeout is left at zero
constexpr std::chrono::milliseconds kDefaultTimeout{5000};

struct Timeouts {
    std::chrono::milliseconds connect{0};
    std::chrono::milliseconds read{0};
    std::chrono::milliseconds write{0};

    /// Resolve a configured value, zero meaning the default ceiling
    static std::chrono::milliseconds effective(std::chrono::milliseconds t) {
        return t.count() > 0 ? t : kDefaultTimeout;
    }

    std::chrono::milliseconds connect_or_default() const { return effective(connect); }
    std::chrono::milliseconds read_or_default() const { return effective(read); }
    std::chrono::milliseconds write_or_default() const { return effective(write); }

    /// Same value for all three phases
    static Timeouts uniform(std::chrono::milliseconds t) {
        Timeouts to;
        to.connect = t;
        to.read = t;
        to.write = t;
        return to;
    }
};

/**
 * @brief Source AMS address policy
 *
 * Auto derives the NetId from the local IPv4 address of the connected
 * socket with ".1.1" appended (127.0.0.1.1.1 without IPv4) and uses
 * ports::AutoSource. It is re-derived on every (re)connect.
 */
class Source {
public:
    enum class Kind { Auto, Explicit };

    Source() = default;
    static Source automatic() { return Source(); }
    static Source explicit_addr(const AmsAddr& addr) {
        Source s;
        s.kind_ = Kind::Explicit;
        s.addr_ = addr;
        return s;
    }

    Kind kind() const { return kind_; }
    bool is_auto() const { return kind_ == Kind::Auto; }
    const AmsAddr& addr() const { return addr_; }

private:
    Kind kind_ = Kind::Auto;
    AmsAddr addr_;
};

/**
 * @brief Everything a Client needs to reach one ADS router
 */
struct ClientConfig {
    std::string host = "127.0.0.1";                         ///< Router host name or IPv4 address
    uint16_t port = kTcpPort;                               ///< Router TCP port
    Timeouts timeouts;
    Source source;
    std::chrono::milliseconds reconnect_delay{500};         ///< First backoff after a failed attempt
    std::chrono::milliseconds max_reconnect_delay{5000};    ///< Backoff doubles up to this value
    std::chrono::milliseconds poll_interval{100};           ///< Reader wake-up interval while idle
    size_t notification_queue_capacity = 16384;             ///< Default notification queue size

    ClientConfig() = default;

    /**
     * @brief Config for a router reachable at host, default port and timeouts
     */
    static ClientConfig for_host(const std::string& host) {
        ClientConfig cfg;
        cfg.host = host;
        return cfg;
    }

    /**
     * @brief Config for the router on this machine
     */
    static ClientConfig local() {
        return for_host("127.0.0.1");
    }

    /// Every problem found, empty when valid
    std::vector<std::string> validation_errors() const;

    /// True when valid; otherwise joins the problems into error_message if given
    bool is_valid(std::string* error_message = nullptr) const;

    /// InvalidArgument status describing all problems
    Status validate() const;
};

} // namespace ads
