#include "ads_device.hpp"
#include "ads_log.hpp"

#include <algorithm>
#include <limits>
#include <thread>

namespace ads {

namespace {

constexpr uint32_t kMaxSymbolInfoLength = 0xFFFF;
constexpr size_t kDevInfoNameSize = 16;
constexpr size_t kSymbolEntryHeaderSize = 30;

Error short_reply(const std::string& what) {
  return make_error(ErrorKind::ProtocolError, what + ": reply shorter than expected");
}

// Split "u32 length, data" as returned by Read and ReadWrite
Result<std::vector<uint8_t>> length_prefixed(const std::vector<uint8_t>& reply,
                                             uint32_t max_length, const std::string& what) {
  codec::ByteReader in(reply);
  uint32_t len = 0;
  if (!in.u32(len)) {
    return short_reply(what);
  }
  if (len > in.remaining()) {
    return make_error(ErrorKind::ProtocolError,
                      what + ": reply declares " + std::to_string(len) + " bytes but carries " +
                      std::to_string(in.remaining()));
  }
  if (len > max_length) {
    return make_error(ErrorKind::ProtocolError,
                      what + ": device returned " + std::to_string(len) + " bytes, " +
                      std::to_string(max_length) + " requested");
  }
  return std::vector<uint8_t>(in.current(), in.current() + len);
}

std::vector<uint8_t> read_write_payload(uint32_t index_group, uint32_t index_offset,
                                        uint32_t read_length,
                                        const std::vector<uint8_t>& write_data) {
  std::vector<uint8_t> p;
  p.reserve(16 + write_data.size());
  codec::le32(p, index_group);
  codec::le32(p, index_offset);
  codec::le32(p, read_length);
  codec::le32(p, static_cast<uint32_t>(write_data.size()));
  p.insert(p.end(), write_data.begin(), write_data.end());
  return p;
}

bool fits_u32(size_t n) {
  return n <= std::numeric_limits<uint32_t>::max();
}

// Reply frame carrying a successful result, seen from the reader thread
bool reply_succeeded(const Frame& frame, const AmsAddr& from) {
  return frame.header.source == from && frame.header.error_code == 0 &&
         frame.payload.size() >= 4 && codec::rd32(frame.payload.data()) == 0;
}

} // namespace

Status sub_status(uint32_t result) {
  if (result == 0) {
    return Status();
  }
  return make_error(ErrorKind::ProtocolError,
                    "sub-request failed: " + errors::Interpreter::format_for_log(result), result);
}

// ============================================================================
// Information and state
// ============================================================================

Result<DeviceInfo> Device::get_info() const {
  auto reply = client_.request(Command::DevInfo, addr_, std::vector<uint8_t>());
  if (!reply.ok()) return reply.error;

  codec::ByteReader in(reply.value);
  DeviceInfo info;
  if (!in.u8(info.major) || !in.u8(info.minor) || !in.u16(info.version) ||
      in.remaining() < kDevInfoNameSize) {
    return short_reply("DevInfo");
  }
  // NUL-terminated, Windows-1252 in theory, ASCII in practice
  const uint8_t* name = in.current();
  for (size_t i = 0; i < kDevInfoNameSize && name[i] != 0; ++i) {
    info.name.push_back(static_cast<char>(name[i]));
  }
  return info;
}

Result<DeviceState> Device::get_state() const {
  auto reply = client_.request(Command::ReadState, addr_, std::vector<uint8_t>());
  if (!reply.ok()) return reply.error;

  codec::ByteReader in(reply.value);
  uint16_t raw_state = 0;
  DeviceState st;
  if (!in.u16(raw_state) || !in.u16(st.device_state)) {
    return short_reply("ReadState");
  }
  auto state = state_from_raw(raw_state);
  if (!state) {
    return make_error(ErrorKind::ProtocolError,
                      "ReadState: unknown ADS state " + std::to_string(raw_state));
  }
  st.ads_state = *state;
  return st;
}

Status Device::write_control(AdsState ads_state, uint16_t device_state,
                             const std::vector<uint8_t>& data) const {
  if (!fits_u32(data.size())) {
    return make_error(ErrorKind::InvalidArgument, "WriteControl: data too large");
  }
  std::vector<uint8_t> p;
  codec::le16(p, static_cast<uint16_t>(ads_state));
  codec::le16(p, device_state);
  codec::le32(p, static_cast<uint32_t>(data.size()));
  p.insert(p.end(), data.begin(), data.end());

  auto reply = client_.request(Command::WriteControl, addr_, p);
  return reply.status();
}

bool Device::wait_running(std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    auto st = get_state();
    if (st.ok() && st.value.ads_state == AdsState::Run) {
      return true;
    }
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

// ============================================================================
// Raw access
// ============================================================================

Result<std::vector<uint8_t>> Device::read(uint32_t index_group, uint32_t index_offset,
                                          uint32_t length) const {
  std::vector<uint8_t> p;
  codec::le32(p, index_group);
  codec::le32(p, index_offset);
  codec::le32(p, length);

  auto reply = client_.request(Command::Read, addr_, p);
  if (!reply.ok()) return reply.error;
  return length_prefixed(reply.value, length, "Read");
}

Result<size_t> Device::read(uint32_t index_group, uint32_t index_offset,
                            uint8_t* out, size_t length) const {
  if (!fits_u32(length)) {
    return make_error(ErrorKind::InvalidArgument, "Read: length exceeds 32 bits");
  }
  auto data = read(index_group, index_offset, static_cast<uint32_t>(length));
  if (!data.ok()) return data.error;
  std::copy(data.value.begin(), data.value.end(), out);
  return data.value.size();
}

Status Device::read_exact(uint32_t index_group, uint32_t index_offset,
                          uint8_t* out, size_t length) const {
  auto got = read(index_group, index_offset, out, length);
  if (!got.ok()) return got.error;
  if (got.value != length) {
    return make_error(ErrorKind::SizeMismatch,
                      "Read: got " + std::to_string(got.value) + " bytes, expected " +
                      std::to_string(length));
  }
  return Status();
}

Status Device::write(uint32_t index_group, uint32_t index_offset,
                     const uint8_t* data, size_t length) const {
  if (!fits_u32(length)) {
    return make_error(ErrorKind::InvalidArgument, "Write: length exceeds 32 bits");
  }
  std::vector<uint8_t> p;
  p.reserve(12 + length);
  codec::le32(p, index_group);
  codec::le32(p, index_offset);
  codec::le32(p, static_cast<uint32_t>(length));
  p.insert(p.end(), data, data + length);

  auto reply = client_.request(Command::Write, addr_, p);
  return reply.status();
}

Result<std::vector<uint8_t>> Device::read_write(uint32_t index_group, uint32_t index_offset,
                                                uint32_t read_length,
                                                const std::vector<uint8_t>& write_data) const {
  if (!fits_u32(write_data.size())) {
    return make_error(ErrorKind::InvalidArgument, "ReadWrite: write data too large");
  }
  auto reply = client_.request(Command::ReadWrite, addr_,
                               read_write_payload(index_group, index_offset, read_length, write_data));
  if (!reply.ok()) return reply.error;
  return length_prefixed(reply.value, read_length, "ReadWrite");
}

// ============================================================================
// Sum-up commands
// ============================================================================

Result<std::vector<uint8_t>> Device::sum_up(uint32_t index_group, uint32_t count,
                                            uint32_t read_length,
                                            const std::vector<uint8_t>& write_data,
                                            ReplyHook on_reply) const {
  auto reply = client_.request(Command::ReadWrite, addr_,
                               read_write_payload(index_group, count, read_length, write_data),
                               std::chrono::milliseconds(0), std::move(on_reply));
  if (!reply.ok()) return reply.error;
  return length_prefixed(reply.value, read_length, "sum-up");
}

Status Device::read_multi(std::vector<ReadRequest>& requests) const {
  if (requests.empty()) return Status();

  std::vector<uint8_t> w;
  size_t read_length = 0;
  for (const auto& r : requests) {
    codec::le32(w, r.index_group);
    codec::le32(w, r.index_offset);
    codec::le32(w, r.length);
    read_length += 8 + r.length;
  }
  if (!fits_u32(read_length) || !fits_u32(requests.size())) {
    return make_error(ErrorKind::InvalidArgument, "read_multi: request too large");
  }

  auto reply = sum_up(index::SUMUP_READ_EX, static_cast<uint32_t>(requests.size()),
                      static_cast<uint32_t>(read_length), w);
  if (!reply.ok()) return reply.error;

  codec::ByteReader in(reply.value);
  std::vector<uint32_t> lengths(requests.size());
  for (size_t i = 0; i < requests.size(); ++i) {
    if (!in.u32(requests[i].result) || !in.u32(lengths[i])) {
      return short_reply("read_multi");
    }
  }
  // Each data area has the requested size; short reads leave padding behind.
  for (size_t i = 0; i < requests.size(); ++i) {
    ReadRequest& r = requests[i];
    const size_t area = std::min<size_t>(r.length, in.remaining());
    const size_t used = std::min<size_t>(lengths[i], area);
    r.data.assign(in.current(), in.current() + used);
    in.skip(area);
  }
  return Status();
}

Status Device::write_multi(std::vector<WriteRequest>& requests) const {
  if (requests.empty()) return Status();

  std::vector<uint8_t> w;
  for (const auto& r : requests) {
    if (!fits_u32(r.data.size())) {
      return make_error(ErrorKind::InvalidArgument, "write_multi: data too large");
    }
    codec::le32(w, r.index_group);
    codec::le32(w, r.index_offset);
    codec::le32(w, static_cast<uint32_t>(r.data.size()));
  }
  for (const auto& r : requests) {
    w.insert(w.end(), r.data.begin(), r.data.end());
  }

  const uint32_t n = static_cast<uint32_t>(requests.size());
  auto reply = sum_up(index::SUMUP_WRITE, n, 4 * n, w);
  if (!reply.ok()) return reply.error;

  codec::ByteReader in(reply.value);
  for (auto& r : requests) {
    if (!in.u32(r.result)) return short_reply("write_multi");
  }
  return Status();
}

Status Device::read_write_multi(std::vector<ReadWriteRequest>& requests) const {
  if (requests.empty()) return Status();

  std::vector<uint8_t> w;
  size_t read_length = 0;
  for (const auto& r : requests) {
    if (!fits_u32(r.write_data.size())) {
      return make_error(ErrorKind::InvalidArgument, "read_write_multi: data too large");
    }
    codec::le32(w, r.index_group);
    codec::le32(w, r.index_offset);
    codec::le32(w, r.read_length);
    codec::le32(w, static_cast<uint32_t>(r.write_data.size()));
    read_length += 8 + r.read_length;
  }
  for (const auto& r : requests) {
    w.insert(w.end(), r.write_data.begin(), r.write_data.end());
  }
  if (!fits_u32(read_length)) {
    return make_error(ErrorKind::InvalidArgument, "read_write_multi: request too large");
  }

  auto reply = sum_up(index::SUMUP_READWRITE, static_cast<uint32_t>(requests.size()),
                      static_cast<uint32_t>(read_length), w);
  if (!reply.ok()) return reply.error;

  codec::ByteReader in(reply.value);
  std::vector<uint32_t> lengths(requests.size());
  for (size_t i = 0; i < requests.size(); ++i) {
    if (!in.u32(requests[i].result) || !in.u32(lengths[i])) {
      return short_reply("read_write_multi");
    }
  }
  // Returned data is packed: each sub-request takes only what it got.
  for (size_t i = 0; i < requests.size(); ++i) {
    if (lengths[i] > requests[i].read_length || !in.bytes(lengths[i], requests[i].data)) {
      return short_reply("read_write_multi");
    }
  }
  return Status();
}

// ============================================================================
// Notifications
// ============================================================================

Result<NotificationHandle> Device::add_notification(uint32_t index_group, uint32_t index_offset,
                                                    const Attributes& attributes,
                                                    std::shared_ptr<NotificationSink> sink) const {
  if (!sink) {
    sink = client_.notifications();
  }

  Client* client = &client_;
  const AmsAddr addr = addr_;
  ReplyHook hook = [client, addr, sink](const Frame& frame) {
    if (reply_succeeded(frame, addr) && frame.payload.size() >= 8) {
      client->register_notification(addr, codec::rd32(frame.payload.data() + 4), sink);
    }
  };

  auto reply = client_.request(Command::AddNotification, addr_,
                               encode_add_notification(index_group, index_offset, attributes),
                               std::chrono::milliseconds(0), std::move(hook));
  if (!reply.ok()) return reply.error;

  codec::ByteReader in(reply.value);
  NotificationHandle handle = 0;
  if (!in.u32(handle)) {
    return short_reply("AddNotification");
  }
  log::get_logger("ads_client")->debug("notification {} added on {} for 0x{:x}:0x{:x}",
                                       handle, addr_.to_string(), index_group, index_offset);
  return handle;
}

Result<NotificationHandle> Device::add_symbol_notification(const std::string& symbol,
                                                           const Attributes& attributes,
                                                           std::shared_ptr<NotificationSink> sink) const {
  auto info = get_symbol_info(symbol);
  if (!info.ok()) return info.error;
  return add_notification(info.value.index_group, info.value.index_offset, attributes,
                          std::move(sink));
}

Status Device::delete_notification(NotificationHandle handle) const {
  std::vector<uint8_t> p;
  codec::le32(p, handle);
  auto reply = client_.request(Command::DeleteNotification, addr_, p);
  if (reply.ok() || reply.error.ads_code == errors::DeviceNotifyHandleInvalid) {
    client_.unregister_notification(addr_, handle);
  }
  return reply.status();
}

Status Device::add_notification_multi(std::vector<AddNotificationRequest>& requests) const {
  if (requests.empty()) return Status();

  std::vector<uint8_t> w;
  std::vector<std::shared_ptr<NotificationSink>> sinks;
  for (const auto& r : requests) {
    auto body = encode_add_notification(r.index_group, r.index_offset, r.attributes);
    w.insert(w.end(), body.begin(), body.end());
    sinks.push_back(r.sink ? r.sink : client_.notifications());
  }

  Client* client = &client_;
  const AmsAddr addr = addr_;
  ReplyHook hook = [client, addr, sinks](const Frame& frame) {
    if (!reply_succeeded(frame, addr)) return;
    // result, length, then (result, handle) per sub-request
    codec::ByteReader in(frame.payload);
    uint32_t skip = 0;
    if (!in.u32(skip) || !in.u32(skip)) return;
    for (const auto& sink : sinks) {
      uint32_t result = 0;
      uint32_t handle = 0;
      if (!in.u32(result) || !in.u32(handle)) return;
      if (result == 0) client->register_notification(addr, handle, sink);
    }
  };

  const uint32_t n = static_cast<uint32_t>(requests.size());
  auto reply = sum_up(index::SUMUP_ADDDEVNOTE, n, 8 * n, w, std::move(hook));
  if (!reply.ok()) return reply.error;

  codec::ByteReader in(reply.value);
  for (auto& r : requests) {
    if (!in.u32(r.result) || !in.u32(r.handle)) {
      return short_reply("add_notification_multi");
    }
  }
  return Status();
}

Status Device::delete_notification_multi(std::vector<DeleteNotificationRequest>& requests) const {
  if (requests.empty()) return Status();

  std::vector<uint8_t> w;
  for (const auto& r : requests) {
    codec::le32(w, r.handle);
  }

  const uint32_t n = static_cast<uint32_t>(requests.size());
  auto reply = sum_up(index::SUMUP_DELDEVNOTE, n, 4 * n, w);
  if (!reply.ok()) return reply.error;

  codec::ByteReader in(reply.value);
  for (auto& r : requests) {
    if (!in.u32(r.result)) {
      return short_reply("delete_notification_multi");
    }
    if (r.result == 0 || r.result == errors::DeviceNotifyHandleInvalid) {
      client_.unregister_notification(addr_, r.handle);
    }
  }
  return Status();
}

// ============================================================================
// Symbols
// ============================================================================

Result<SymbolInfo> Device::get_symbol_info(const std::string& name) const {
  std::vector<uint8_t> w(name.begin(), name.end());
  w.push_back(0);

  auto reply = read_write(index::GET_SYMINFO_BYNAMEEX, 0, kMaxSymbolInfoLength, w);
  if (!reply.ok()) return reply.error;

  codec::ByteReader in(reply.value);
  SymbolInfo info;
  uint32_t entry_length = 0;
  uint16_t name_len = 0;
  uint16_t type_len = 0;
  uint16_t comment_len = 0;
  if (!in.u32(entry_length) || !in.u32(info.index_group) || !in.u32(info.index_offset) ||
      !in.u32(info.size) || !in.u32(info.data_type) || !in.u32(info.flags) ||
      !in.u16(name_len) || !in.u16(type_len) || !in.u16(comment_len)) {
    return short_reply("symbol info");
  }
  if (entry_length < kSymbolEntryHeaderSize) {
    return make_error(ErrorKind::ProtocolError,
                      "symbol info: entry length " + std::to_string(entry_length) + " too small");
  }

  std::vector<uint8_t> text;
  if (!in.bytes(name_len, text) || !in.skip(1)) return short_reply("symbol info");
  info.name.assign(text.begin(), text.end());
  if (!in.bytes(type_len, text) || !in.skip(1)) return short_reply("symbol info");
  info.type_name.assign(text.begin(), text.end());
  // Some runtimes omit the comment terminator when the comment is empty
  if (!in.bytes(comment_len, text)) return short_reply("symbol info");
  info.comment.assign(text.begin(), text.end());
  return info;
}

} // namespace ads
