#ifndef ADS_DEVICE_HPP
#define ADS_DEVICE_HPP

/**
 * @file ads_device.hpp
 * @brief Command issuer bound to one AMS address
 *
 * A Device is an AmsAddr plus a reference to the Client; it has no other
 * state and is cheap to copy. The Client must outlive every Device taken
 * from it.
 *
 * Reply payloads (after the u32 result, which Client::request checks):
 *   DevInfo       u8 major, u8 minor, u16 build, char[16] name
 *   Read          u32 length, data
 *   ReadState     u16 ads state, u16 device state
 *   ReadWrite     u32 length, data
 *   AddNotif      u32 handle
 *
 * Sum-up commands bundle many sub-requests into one ReadWrite. They fail as
 * a whole only if the sum-up command itself fails; every sub-request carries
 * its own result code afterwards.
 */

#include "ads.hpp"
#include "ads_client.hpp"
#include "ads_codec.hpp"
#include "ads_error.hpp"
#include "ads_notification.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ads {

struct DeviceInfo {
  std::string name;
  uint8_t major = 0;
  uint8_t minor = 0;
  uint16_t version = 0;   ///< Build number
};

struct DeviceState {
  AdsState ads_state = AdsState::Invalid;
  uint16_t device_state = 0;
};

/// Symbol entry returned by GET_SYMINFO_BYNAMEEX
struct SymbolInfo {
  uint32_t index_group = 0;
  uint32_t index_offset = 0;
  uint32_t size = 0;
  uint32_t data_type = 0;   ///< ADST_* type id
  uint32_t flags = 0;
  std::string name;
  std::string type_name;
  std::string comment;
};

// ============================================================================
// Sum-up sub-requests
// ============================================================================

/// Result of one sub-request: ok, or ProtocolError carrying its code
Status sub_status(uint32_t result);

struct ReadRequest {
  uint32_t index_group = 0;
  uint32_t index_offset = 0;
  uint32_t length = 0;

  uint32_t result = 0;            ///< Filled by read_multi
  std::vector<uint8_t> data;      ///< Returned bytes, may be shorter than length

  ReadRequest() = default;
  ReadRequest(uint32_t group, uint32_t offset, uint32_t len)
    : index_group(group), index_offset(offset), length(len) {}

  Status status() const { return sub_status(result); }
};

struct WriteRequest {
  uint32_t index_group = 0;
  uint32_t index_offset = 0;
  std::vector<uint8_t> data;

  uint32_t result = 0;

  WriteRequest() = default;
  WriteRequest(uint32_t group, uint32_t offset, std::vector<uint8_t> bytes)
    : index_group(group), index_offset(offset), data(std::move(bytes)) {}

  Status status() const { return sub_status(result); }
};

struct ReadWriteRequest {
  uint32_t index_group = 0;
  uint32_t index_offset = 0;
  uint32_t read_length = 0;
  std::vector<uint8_t> write_data;

  uint32_t result = 0;
  std::vector<uint8_t> data;      ///< Returned bytes

  ReadWriteRequest() = default;
  ReadWriteRequest(uint32_t group, uint32_t offset, uint32_t rlen, std::vector<uint8_t> wdata)
    : index_group(group), index_offset(offset), read_length(rlen), write_data(std::move(wdata)) {}

  Status status() const { return sub_status(result); }
};

struct AddNotificationRequest {
  uint32_t index_group = 0;
  uint32_t index_offset = 0;
  Attributes attributes;
  std::shared_ptr<NotificationSink> sink;   ///< nullptr: the client's default queue

  uint32_t result = 0;
  NotificationHandle handle = 0;            ///< Valid when status() is ok

  AddNotificationRequest() = default;
  AddNotificationRequest(uint32_t group, uint32_t offset, const Attributes& attrs,
                         std::shared_ptr<NotificationSink> s = nullptr)
    : index_group(group), index_offset(offset), attributes(attrs), sink(std::move(s)) {}

  Status status() const { return sub_status(result); }
};

struct DeleteNotificationRequest {
  NotificationHandle handle = 0;

  uint32_t result = 0;

  DeleteNotificationRequest() = default;
  explicit DeleteNotificationRequest(NotificationHandle h) : handle(h) {}

  Status status() const { return sub_status(result); }
};

// ============================================================================
// Device
// ============================================================================

class Device {
public:
  Device(Client& client, const AmsAddr& addr) : client_(client), addr_(addr) {}

  const AmsAddr& addr() const { return addr_; }
  Client& client() const { return client_; }

  // --- Device information and state ---

  Result<DeviceInfo> get_info() const;
  Result<DeviceState> get_state() const;
  Status write_control(AdsState ads_state, uint16_t device_state,
                       const std::vector<uint8_t>& data = std::vector<uint8_t>()) const;

  /// Poll get_state() every 100 ms until Run; false when `timeout` passed first
  bool wait_running(std::chrono::milliseconds timeout) const;

  // --- Raw access by index group / offset ---

  /// Read up to `length` bytes; the device may return fewer
  Result<std::vector<uint8_t>> read(uint32_t index_group, uint32_t index_offset,
                                    uint32_t length) const;

  /// Read into `out`, returning the number of bytes the device delivered
  Result<size_t> read(uint32_t index_group, uint32_t index_offset,
                      uint8_t* out, size_t length) const;

  /// Read exactly `length` bytes; SizeMismatch on a short read
  Status read_exact(uint32_t index_group, uint32_t index_offset,
                    uint8_t* out, size_t length) const;

  Status write(uint32_t index_group, uint32_t index_offset,
               const uint8_t* data, size_t length) const;
  Status write(uint32_t index_group, uint32_t index_offset,
               const std::vector<uint8_t>& data) const {
    return write(index_group, index_offset, data.data(), data.size());
  }

  /// Write `write_data`, then read back up to `read_length` bytes (remote call)
  Result<std::vector<uint8_t>> read_write(uint32_t index_group, uint32_t index_offset,
                                          uint32_t read_length,
                                          const std::vector<uint8_t>& write_data) const;

  // --- Typed access ---

  template<typename T>
  Result<T> read_value(uint32_t index_group, uint32_t index_offset) const {
    std::vector<uint8_t> buf(BinaryCodec<T>::size());
    Status st = read_exact(index_group, index_offset, buf.data(), buf.size());
    if (!st.ok()) return st.error;
    return BinaryCodec<T>::decode(buf.data());
  }

  template<typename T>
  Status write_value(uint32_t index_group, uint32_t index_offset, const T& value) const {
    return write(index_group, index_offset, encode_value(value));
  }

  // --- Sum-up commands ---

  Status read_multi(std::vector<ReadRequest>& requests) const;
  Status write_multi(std::vector<WriteRequest>& requests) const;
  Status read_write_multi(std::vector<ReadWriteRequest>& requests) const;

  // --- Notifications ---

  /**
   * @brief Register a device notification
   *
   * Samples go to `sink`, or to Client::notifications() when it is null.
   * The handle is registered before any sample can be dispatched. The remote
   * router forgets notifications with the TCP session: after a reconnect
   * they must be added again.
   */
  Result<NotificationHandle> add_notification(uint32_t index_group, uint32_t index_offset,
                                              const Attributes& attributes,
                                              std::shared_ptr<NotificationSink> sink = nullptr) const;

  /// add_notification() on the location of a named symbol
  Result<NotificationHandle> add_symbol_notification(const std::string& symbol,
                                                     const Attributes& attributes,
                                                     std::shared_ptr<NotificationSink> sink = nullptr) const;

  Status delete_notification(NotificationHandle handle) const;

  Status add_notification_multi(std::vector<AddNotificationRequest>& requests) const;
  Status delete_notification_multi(std::vector<DeleteNotificationRequest>& requests) const;

  // --- Symbols ---

  Result<SymbolInfo> get_symbol_info(const std::string& name) const;

private:
  Result<std::vector<uint8_t>> sum_up(uint32_t index_group, uint32_t count, uint32_t read_length,
                                      const std::vector<uint8_t>& write_data,
                                      ReplyHook on_reply = ReplyHook()) const;

  Client& client_;
  const AmsAddr addr_;
};

} // namespace ads

#endif // ADS_DEVICE_HPP
