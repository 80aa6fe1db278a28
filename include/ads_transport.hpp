#pragma once
/**
 * @file ads_transport.hpp
 * @brief Byte stream transport to the AMS router
 *
 * The Client owns exactly one Transport. Threading contract:
 * - receive_some() is only called by the reader
 * - send_all() is serialized by the Client's write lock
 * - shutdown() may be called from any thread while I/O is in progress and
 *   makes a blocked receive_some() return promptly
 * - open() and close() are never called concurrently with I/O
 */

#include "ads_config.hpp"
#include "ads_error.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ads {

class Transport {
public:
    virtual ~Transport() = default;

    /// Connect within timeouts.connect; ConnectFailure on error
    virtual Status open(const std::string& host, uint16_t port, const Timeouts& timeouts) = 0;

    /// Release the connection. Safe to call when already closed.
    virtual void close() = 0;

    /// Abort the connection in both directions without releasing it
    virtual void shutdown() = 0;

    virtual bool is_open() const = 0;

    /// Write every byte or fail; a failure leaves the stream unusable
    virtual Status send_all(const std::vector<uint8_t>& bytes) = 0;

    /**
     * @brief Read whatever is available, waiting at most `wait`
     * @return Number of bytes read; 0 when nothing arrived within `wait`.
     *         ConnectionLost when the peer closed or the socket failed.
     */
    virtual Result<size_t> receive_some(uint8_t* buffer, size_t capacity,
                                        std::chrono::milliseconds wait) = 0;

    /// Local IPv4 address of the open connection, if it is IPv4
    virtual std::optional<std::array<uint8_t, 4>> local_ipv4() const = 0;
};

/**
 * @brief POSIX TCP implementation
 *
 * Sets TCP_NODELAY and SO_KEEPALIVE; the write timeout becomes SO_SNDTIMEO.
 */
class TcpTransport : public Transport {
public:
    TcpTransport() = default;
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    Status open(const std::string& host, uint16_t port, const Timeouts& timeouts) override;
    void close() override;
    void shutdown() override;
    bool is_open() const override { return fd_.load() >= 0; }
    Status send_all(const std::vector<uint8_t>& bytes) override;
    Result<size_t> receive_some(uint8_t* buffer, size_t capacity,
                                std::chrono::milliseconds wait) override;
    std::optional<std::array<uint8_t, 4>> local_ipv4() const override;

    /// Peer as "host:port" for logs
    const std::string& peer() const { return peer_; }

private:
    Status apply_socket_options(int fd, const Timeouts& timeouts);

    std::atomic<int> fd_{-1};
    std::string peer_;
};

} // namespace ads
