#include "ads_frame.hpp"

namespace ads {

// ============================================================================
// Encoding
// ============================================================================

std::vector<uint8_t> encode_frame(const Frame& frame) {
    std::vector<uint8_t> out;
    const auto data_length = static_cast<uint32_t>(frame.payload.size());

    if (!frame.is_ads_command()) {
        out.reserve(kTcpHeaderSize + frame.payload.size());
        codec::le16(out, frame.ams_cmd);
        codec::le32(out, data_length);
        out.insert(out.end(), frame.payload.begin(), frame.payload.end());
        return out;
    }

    out.reserve(kFrameHeaderSize + frame.payload.size());
    codec::le16(out, frame.ams_cmd);
    codec::le32(out, static_cast<uint32_t>(kAmsHeaderSize) + data_length);

    const AmsHeader& h = frame.header;
    codec::put_addr(out, h.target);
    codec::put_addr(out, h.source);
    codec::le16(out, h.command);
    codec::le16(out, h.state_flags);
    codec::le32(out, data_length);
    codec::le32(out, h.error_code);
    codec::le32(out, h.invoke_id);

    out.insert(out.end(), frame.payload.begin(), frame.payload.end());
    return out;
}

std::vector<uint8_t> encode_request(Command command,
                                    const AmsAddr& target,
                                    const AmsAddr& source,
                                    uint32_t invoke_id,
                                    const std::vector<uint8_t>& payload) {
    Frame frame;
    frame.header.target = target;
    frame.header.source = source;
    frame.header.command = static_cast<uint16_t>(command);
    frame.header.state_flags = flags::Request;
    frame.header.invoke_id = invoke_id;
    frame.payload = payload;
    return encode_frame(frame);
}

// ============================================================================
// Decoding
// ============================================================================

namespace {

DecodeResult malformed(std::string why) {
    DecodeResult r;
    r.status = DecodeStatus::Malformed;
    r.error = std::move(why);
    return r;
}

} // namespace

DecodeResult decode_frame(const uint8_t* data, size_t size) {
    DecodeResult r;
    if (size < kTcpHeaderSize) {
        return r;
    }

    const uint16_t cmd = codec::rd16(data);
    const uint32_t length = codec::rd32(data + 2);

    if (!tcp_cmd::is_known(cmd)) {
        return malformed("unknown AMS/TCP command " + std::to_string(cmd));
    }
    if (length > kMaxFrameLength) {
        return malformed("frame length " + std::to_string(length) + " exceeds limit");
    }
    if (cmd == tcp_cmd::AdsCommand && length < kAmsHeaderSize) {
        return malformed("frame length " + std::to_string(length) + " shorter than AMS header");
    }
    if (size < kTcpHeaderSize + length) {
        return r;  // wait for the rest
    }

    r.frame.ams_cmd = cmd;
    r.consumed = kTcpHeaderSize + length;

    if (cmd != tcp_cmd::AdsCommand) {
        r.frame.payload.assign(data + kTcpHeaderSize, data + r.consumed);
        r.status = DecodeStatus::Complete;
        return r;
    }

    const uint8_t* p = data + kTcpHeaderSize;
    AmsHeader& h = r.frame.header;
    h.target = codec::get_addr(p);
    h.source = codec::get_addr(p + 8);
    h.command = codec::rd16(p + 16);
    h.state_flags = codec::rd16(p + 18);
    h.data_length = codec::rd32(p + 20);
    h.error_code = codec::rd32(p + 24);
    h.invoke_id = codec::rd32(p + 28);

    if (h.data_length != length - kAmsHeaderSize) {
        return malformed("AMS data length " + std::to_string(h.data_length) +
                         " disagrees with frame length " + std::to_string(length));
    }

    r.frame.payload.assign(p + kAmsHeaderSize, data + r.consumed);
    r.status = DecodeStatus::Complete;
    return r;
}

// ============================================================================
// FrameAssembler
// ============================================================================

void FrameAssembler::feed(const uint8_t* data, size_t size) {
    // Compact once the consumed prefix dominates the buffer
    if (start_ > 0 && start_ >= buffer_.size() / 2) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(start_));
        start_ = 0;
    }
    buffer_.insert(buffer_.end(), data, data + size);
}

DecodeResult FrameAssembler::next() {
    DecodeResult r = decode_frame(buffer_.data() + start_, buffer_.size() - start_);
    if (r.status == DecodeStatus::Complete) {
        start_ += r.consumed;
        if (start_ == buffer_.size()) {
            buffer_.clear();
            start_ = 0;
        }
    }
    return r;
}

void FrameAssembler::reset() {
    buffer_.clear();
    start_ = 0;
}

} // namespace ads
