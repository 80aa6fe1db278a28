#pragma once
/**
 * @file ads_frame.hpp
 * @brief AMS/TCP frame encoding and incremental decoding
 *
 * Frame layout (see ads.hpp):
 *   [AMS/TCP header 6][AMS header 32][payload data_length]
 *
 * Decoding is incremental: a frame may arrive split over several socket
 * reads. A frame whose length fields disagree with each other or exceed
 * kMaxFrameLength is reported as Malformed; the stream cannot be trusted
 * after that and the connection must be dropped.
 */

#include "ads.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ads {

constexpr size_t kTcpHeaderSize = 6;
constexpr size_t kAmsHeaderSize = 32;
constexpr size_t kFrameHeaderSize = kTcpHeaderSize + kAmsHeaderSize;  // 38
/// Upper bound for the AMS/TCP length field
constexpr size_t kMaxFrameLength = 16 * 1024 * 1024;

struct AmsHeader {
    AmsAddr target;
    AmsAddr source;
    uint16_t command = 0;
    uint16_t state_flags = 0;
    uint32_t data_length = 0;
    uint32_t error_code = 0;
    uint32_t invoke_id = 0;
};

struct Frame {
    uint16_t ams_cmd = tcp_cmd::AdsCommand;
    AmsHeader header;              ///< Only meaningful for ADS commands
    std::vector<uint8_t> payload;  ///< Command data, or the raw body of router frames

    bool is_ads_command() const { return ams_cmd == tcp_cmd::AdsCommand; }
    bool is_response() const { return (header.state_flags & flags::Response) != 0; }
};

/// Serialize a frame; header.data_length is taken from the payload size
std::vector<uint8_t> encode_frame(const Frame& frame);

/// Build a request frame with state flags 0x0004
std::vector<uint8_t> encode_request(Command command,
                                    const AmsAddr& target,
                                    const AmsAddr& source,
                                    uint32_t invoke_id,
                                    const std::vector<uint8_t>& payload);

enum class DecodeStatus {
    Complete,    ///< `frame` holds one frame of `consumed` bytes
    Incomplete,  ///< More bytes needed
    Malformed    ///< Inconsistent framing, `error` says why
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::Incomplete;
    Frame frame;
    size_t consumed = 0;
    std::string error;
};

/// Decode the first frame in [data, data + size)
DecodeResult decode_frame(const uint8_t* data, size_t size);

inline DecodeResult decode_frame(const std::vector<uint8_t>& bytes) {
    return decode_frame(bytes.data(), bytes.size());
}

/**
 * @brief Accumulates socket reads and yields complete frames
 *
 * Not thread-safe; owned by the reader.
 */
class FrameAssembler {
public:
    void feed(const uint8_t* data, size_t size);

    /// Next complete frame, Incomplete when buffered bytes do not hold one
    DecodeResult next();

    size_t buffered() const { return buffer_.size() - start_; }
    void reset();

private:
    std::vector<uint8_t> buffer_;
    size_t start_ = 0;
};

} // namespace ads
