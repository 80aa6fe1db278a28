#include "ads_notification.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace ads {

std::vector<uint8_t> encode_add_notification(uint32_t index_group, uint32_t index_offset,
                                             const Attributes& attributes) {
    std::vector<uint8_t> out;
    out.reserve(kAddNotificationSize);
    codec::le32(out, index_group);
    codec::le32(out, index_offset);
    codec::le32(out, attributes.length);
    codec::le32(out, static_cast<uint32_t>(attributes.trans_mode));
    codec::le32(out, static_cast<uint32_t>(attributes.max_delay.count()));
    codec::le32(out, static_cast<uint32_t>(attributes.cycle_time.count()));
    out.resize(kAddNotificationSize, 0);  // reserved
    return out;
}

std::chrono::system_clock::time_point Sample::timestamp() const {
    if (filetime <= kFileTimeUnixOffset) {
        return std::chrono::system_clock::time_point();
    }
    // Clamped so the conversion to nanoseconds cannot overflow
    const uint64_t max_ticks = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) / 100;
    const uint64_t ticks = std::min(filetime - kFileTimeUnixOffset, max_ticks);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::nanoseconds(ticks * 100)));
}

Result<std::vector<Sample>> parse_notification(const AmsAddr& source,
                                               const std::vector<uint8_t>& payload) {
    codec::ByteReader in(payload);

    uint32_t length = 0;
    uint32_t nstamps = 0;
    if (!in.u32(length) || !in.u32(nstamps)) {
        return make_error(ErrorKind::MalformedFrame, "notification shorter than its header");
    }
    if (length != payload.size() - 4) {
        return make_error(ErrorKind::MalformedFrame,
                          "notification length " + std::to_string(length) +
                          " disagrees with payload size " + std::to_string(payload.size()));
    }

    std::vector<Sample> samples;
    for (uint32_t s = 0; s < nstamps; ++s) {
        uint64_t filetime = 0;
        uint32_t nsamples = 0;
        if (!in.u64(filetime) || !in.u32(nsamples)) {
            return make_error(ErrorKind::MalformedFrame, "truncated notification stamp");
        }
        for (uint32_t i = 0; i < nsamples; ++i) {
            Sample sample;
            sample.source = source;
            sample.filetime = filetime;
            uint32_t size = 0;
            if (!in.u32(sample.handle) || !in.u32(size) || !in.bytes(size, sample.data)) {
                return make_error(ErrorKind::MalformedFrame, "truncated notification sample");
            }
            samples.push_back(std::move(sample));
        }
    }

    if (in.remaining() != 0) {
        return make_error(ErrorKind::MalformedFrame,
                          std::to_string(in.remaining()) + " trailing bytes in notification");
    }
    return samples;
}

// ============================================================================
// NotificationQueue
// ============================================================================

NotificationQueue::NotificationQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void NotificationQueue::deliver(const Sample& sample) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (samples_.size() >= capacity_) {
            samples_.pop_front();
            ++dropped_;
        }
        samples_.push_back(sample);
    }
    cv_.notify_one();
}

std::optional<Sample> NotificationQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !samples_.empty(); })) {
        return std::nullopt;
    }
    Sample s = std::move(samples_.front());
    samples_.pop_front();
    return s;
}

std::optional<Sample> NotificationQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.empty()) {
        return std::nullopt;
    }
    Sample s = std::move(samples_.front());
    samples_.pop_front();
    return s;
}

size_t NotificationQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

uint64_t NotificationQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void NotificationQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
}

} // namespace ads
