#pragma once
/**
 * @file ads_notification.hpp
 * @brief Device notifications: attributes, payload parsing and sinks
 *
 * Notification payload (command 8, sent by the server, no result field):
 *
 *   u32 length            bytes following this field
 *   u32 stamp count
 *   per stamp:
 *     u64 timestamp       FILETIME, 100 ns ticks since 1601-01-01 UTC
 *     u32 sample count
 *     per sample:
 *       u32 handle        notification handle from AddNotification
 *       u32 size
 *       u8[size] data
 *
 * Sinks run on the reader thread. They must return quickly; a sink that
 * cannot keep up must drop data itself (NotificationQueue drops the oldest).
 */

#include "ads.hpp"
#include "ads_codec.hpp"
#include "ads_error.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace ads {

using NotificationHandle = uint32_t;

/// When the server transmits samples
enum class TransmissionMode : uint32_t {
    NoTrans = 0,
    ServerCycle = 3,      ///< Every cycle_time
    ServerOnChange = 4    ///< When the value changed, checked every cycle_time
};

struct Attributes {
    uint32_t length = 0;                                ///< Bytes to observe
    TransmissionMode trans_mode = TransmissionMode::ServerOnChange;
    std::chrono::milliseconds max_delay{0};             ///< Latest transmission after a change
    std::chrono::milliseconds cycle_time{0};            ///< Check / transmit period

    Attributes() = default;
    Attributes(uint32_t len, TransmissionMode mode,
               std::chrono::milliseconds delay, std::chrono::milliseconds cycle)
        : length(len), trans_mode(mode), max_delay(delay), cycle_time(cycle) {}

    static Attributes on_change(uint32_t len, std::chrono::milliseconds cycle) {
        return Attributes(len, TransmissionMode::ServerOnChange, std::chrono::milliseconds(0), cycle);
    }
    static Attributes cyclic(uint32_t len, std::chrono::milliseconds cycle) {
        return Attributes(len, TransmissionMode::ServerCycle, std::chrono::milliseconds(0), cycle);
    }
};

/// Size of one AddNotification request body
constexpr size_t kAddNotificationSize = 40;

/// AddNotification request body: group, offset, length, mode, delay, cycle, 16 reserved
std::vector<uint8_t> encode_add_notification(uint32_t index_group, uint32_t index_offset,
                                             const Attributes& attributes);

/// Offset between the FILETIME epoch (1601) and the Unix epoch, in 100 ns ticks
constexpr uint64_t kFileTimeUnixOffset = 116444736000000000ULL;

/**
 * @brief One value delivered by a notification
 */
struct Sample {
    AmsAddr source;                 ///< Device that sent it
    NotificationHandle handle = 0;
    uint64_t filetime = 0;          ///< Raw timestamp
    std::vector<uint8_t> data;

    /// Timestamp converted to the system clock (epoch if before 1970)
    std::chrono::system_clock::time_point timestamp() const;

    /// Interpret the data as T; SizeMismatch unless the sizes are equal
    template<typename T>
    Result<T> value() const {
        if (data.size() != BinaryCodec<T>::size()) {
            return make_error(ErrorKind::SizeMismatch,
                              "sample has " + std::to_string(data.size()) + " bytes, type needs " +
                              std::to_string(BinaryCodec<T>::size()));
        }
        return BinaryCodec<T>::decode(data.data());
    }
};

/// Parse a Notification payload; MalformedFrame if counts and lengths disagree
Result<std::vector<Sample>> parse_notification(const AmsAddr& source,
                                               const std::vector<uint8_t>& payload);

// ============================================================================
// Sinks
// ============================================================================

class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void deliver(const Sample& sample) = 0;
};

/**
 * @brief Bounded FIFO of samples; the oldest sample is dropped when full
 */
class NotificationQueue : public NotificationSink {
public:
    explicit NotificationQueue(size_t capacity);

    void deliver(const Sample& sample) override;

    /// Wait up to `timeout` for a sample
    std::optional<Sample> pop(std::chrono::milliseconds timeout);
    std::optional<Sample> try_pop();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    /// Samples discarded because the queue was full
    uint64_t dropped() const;
    void clear();

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Sample> samples_;
    uint64_t dropped_ = 0;
};

/**
 * @brief Forwards every sample to a callback
 */
class CallbackSink : public NotificationSink {
public:
    using Callback = std::function<void(const Sample&)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

    void deliver(const Sample& sample) override {
        if (callback_) callback_(sample);
    }

private:
    Callback callback_;
};

} // namespace ads
