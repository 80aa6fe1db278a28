#ifndef ADS_HPP
#define ADS_HPP

/**
 * @file ads.hpp
 * @brief ADS (Automation Device Specification) client - core protocol types
 *
 * ADS is the Beckhoff TwinCAT protocol used to reach process memory, symbols
 * and device state of a PLC. Every ADS command travels inside an AMS packet:
 *
 * ============================================================================
 * WIRE LAYOUT (all fields little-endian)
 * ============================================================================
 *
 *   AMS/TCP header (6 bytes)
 *     u16 ams_cmd        0 = ADS command, 1/0x1000/0x1001/0x1002 router traffic
 *     u32 length         number of bytes following this header
 *
 *   AMS header (32 bytes)
 *     u8[6] target netid, u16 target port
 *     u8[6] source netid, u16 source port
 *     u16 command id      see Command
 *     u16 state flags     0x0004 request, 0x0005 response
 *     u32 data length     bytes of command payload
 *     u32 error code      AMS level error (0 = none)
 *     u32 invoke id       correlates request and response
 *
 *   Command payload (data length bytes)
 *
 * Replies to every command start with a u32 result code; a non-zero value
 * is a remote ADS error (see ads_error.hpp).
 *
 * High-level layout:
 * 1) Addressing (AmsNetId, AmsAddr, well-known ports)
 * 2) Commands, state flags and device states
 * 3) Reserved index groups
 * 4) Little-endian codec helpers
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ads {

// ============================================================================
// 1) Addressing
// ============================================================================

/// Default TCP port of the AMS router
constexpr uint16_t kTcpPort = 0xBF02;  // 48898
/// Default UDP port of the AMS router (discovery, route management)
constexpr uint16_t kUdpPort = 0xBF03;  // 48899

/**
 * @brief 6-byte AMS NetId, e.g. "5.23.10.4.1.1"
 *
 * Identifies a logical ADS participant. It is not an IP address although
 * by convention the first four bytes often match the host's IPv4 address.
 */
class AmsNetId {
public:
  AmsNetId() = default;
  AmsNetId(uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint8_t e, uint8_t f)
    : bytes_{{a, b, c, d, e, f}} {}
  explicit AmsNetId(const std::array<uint8_t, 6>& bytes) : bytes_(bytes) {}

  /// Parse the dotted form. Returns nullopt unless there are six numbers in 0..255.
  static std::optional<AmsNetId> parse(const std::string& text);

  /// NetId of the local router, 127.0.0.1.1.1
  static AmsNetId local() { return AmsNetId(127, 0, 0, 1, 1, 1); }

  /// NetId built from an IPv4 address with ".1.1" appended
  static AmsNetId from_ipv4(const std::array<uint8_t, 4>& ip) {
    return AmsNetId(ip[0], ip[1], ip[2], ip[3], 1, 1);
  }

  const std::array<uint8_t, 6>& bytes() const { return bytes_; }
  bool is_zero() const;
  std::string to_string() const;

  bool operator==(const AmsNetId& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const AmsNetId& other) const { return bytes_ != other.bytes_; }
  bool operator<(const AmsNetId& other) const { return bytes_ < other.bytes_; }

private:
  std::array<uint8_t, 6> bytes_{};
};

/**
 * @brief AMS address: NetId plus AMS port
 *
 * Identifies the target or the source of a command. Two addresses are equal
 * iff both the NetId and the port match.
 */
struct AmsAddr {
  AmsNetId netid;
  uint16_t port{0};

  AmsAddr() = default;
  AmsAddr(const AmsNetId& id, uint16_t p) : netid(id), port(p) {}

  /// Parse "a.b.c.d.e.f:port"
  static std::optional<AmsAddr> parse(const std::string& text);
  std::string to_string() const;

  bool operator==(const AmsAddr& other) const { return netid == other.netid && port == other.port; }
  bool operator!=(const AmsAddr& other) const { return !(*this == other); }
  bool operator<(const AmsAddr& other) const {
    return netid < other.netid || (netid == other.netid && port < other.port);
  }
};

/// Well-known AMS ports
namespace ports {
  constexpr uint16_t Logger = 100;
  constexpr uint16_t EventLog = 110;
  constexpr uint16_t Io = 300;
  constexpr uint16_t Nc = 500;
  constexpr uint16_t Plc2 = 801;          ///< TwinCAT 2 runtime 1
  constexpr uint16_t Plc = 851;           ///< TwinCAT 3 runtime 1
  constexpr uint16_t SystemService = 10000;
  constexpr uint16_t AutoSource = 58913;  ///< Source port used with Source::Auto
}

// ============================================================================
// 2) Commands and states
// ============================================================================

/// ADS command identifiers (AMS header "command id")
enum class Command : uint16_t {
  DevInfo = 1,             ///< Read device name and version
  Read = 2,                ///< Read by index group / offset
  Write = 3,               ///< Write by index group / offset
  ReadState = 4,           ///< Read ADS and device state
  WriteControl = 5,        ///< Change ADS and device state
  AddNotification = 6,     ///< Register a device notification
  DeleteNotification = 7,  ///< Remove a device notification
  Notification = 8,        ///< Notification samples (server to client only)
  ReadWrite = 9            ///< Write then read back, used as a remote call
};

const char* command_name(Command cmd);

/// AMS header state flags
namespace flags {
  constexpr uint16_t Response = 0x0001;
  constexpr uint16_t NoReturn = 0x0002;
  constexpr uint16_t AdsCommand = 0x0004;
  constexpr uint16_t SystemCommand = 0x0008;
  constexpr uint16_t HighPriority = 0x0010;
  constexpr uint16_t TimestampAdded = 0x0020;
  constexpr uint16_t Udp = 0x0040;
  constexpr uint16_t InitCommand = 0x0080;
  constexpr uint16_t Broadcast = 0x8000;

  constexpr uint16_t Request = AdsCommand;
  constexpr uint16_t Reply = AdsCommand | Response;
}

/// AMS/TCP header command values
namespace tcp_cmd {
  constexpr uint16_t AdsCommand = 0x0000;
  constexpr uint16_t PortClose = 0x0001;
  constexpr uint16_t PortConnect = 0x1000;
  constexpr uint16_t RouterNote = 0x1001;
  constexpr uint16_t GetLocalNetId = 0x1002;

  inline bool is_known(uint16_t c) {
    return c == AdsCommand || c == PortClose || c == PortConnect ||
           c == RouterNote || c == GetLocalNetId;
  }
}

/**
 * @brief ADS state of a device (ReadState / WriteControl)
 */
enum class AdsState : uint16_t {
  Invalid = 0,
  Idle = 1,
  Reset = 2,
  Init = 3,
  Start = 4,
  Run = 5,
  Stop = 6,
  SaveCfg = 7,
  LoadCfg = 8,
  PowerFail = 9,
  PowerGood = 10,
  Error = 11,
  Shutdown = 12,
  Suspend = 13,
  Resume = 14,
  Config = 15,
  Reconfig = 16,
  Stopping = 17,
  Incompatible = 18,
  Exception = 19
};

const char* state_name(AdsState s);
/// Map a raw state value; nullopt for values outside 0..19
std::optional<AdsState> state_from_raw(uint16_t raw);
/// Case-insensitive lookup by name ("run", "Config", ...)
std::optional<AdsState> parse_state(const std::string& name);

// ============================================================================
// 3) Reserved index groups
// ============================================================================

namespace index {
  constexpr uint32_t PLC_RW_M = 0x4020;
  constexpr uint32_t PLC_RW_MX = 0x4021;
  constexpr uint32_t PLC_RO_I = 0xF020;
  constexpr uint32_t PLC_RW_Q = 0xF030;

  constexpr uint32_t GET_SYMHANDLE_BYNAME = 0xF003;
  constexpr uint32_t RW_SYMVAL_BYHANDLE = 0xF005;
  constexpr uint32_t RELEASE_SYMHANDLE = 0xF006;
  constexpr uint32_t GET_SYMINFO_BYNAMEEX = 0xF009;

  constexpr uint32_t SUMUP_READ = 0xF080;
  constexpr uint32_t SUMUP_WRITE = 0xF081;
  constexpr uint32_t SUMUP_READWRITE = 0xF082;
  constexpr uint32_t SUMUP_READ_EX = 0xF083;
  constexpr uint32_t SUMUP_ADDDEVNOTE = 0xF085;
  constexpr uint32_t SUMUP_DELDEVNOTE = 0xF086;
}

// ============================================================================
// 4) Little-endian codec helpers
// ============================================================================

namespace codec {
  // append little-endian integers
  inline void le16(std::vector<uint8_t>& v, uint16_t x){ v.push_back(uint8_t(x)); v.push_back(uint8_t(x>>8)); }
  inline void le32(std::vector<uint8_t>& v, uint32_t x){ le16(v, uint16_t(x)); le16(v, uint16_t(x>>16)); }
  inline void le64(std::vector<uint8_t>& v, uint64_t x){ le32(v, uint32_t(x)); le32(v, uint32_t(x>>32)); }

  // read little-endian integers, caller checks bounds
  inline uint16_t rd16(const uint8_t* p){ return uint16_t(p[0] | (p[1] << 8)); }
  inline uint32_t rd32(const uint8_t* p){ return uint32_t(rd16(p)) | (uint32_t(rd16(p + 2)) << 16); }
  inline uint64_t rd64(const uint8_t* p){ return uint64_t(rd32(p)) | (uint64_t(rd32(p + 4)) << 32); }

  inline void put_addr(std::vector<uint8_t>& v, const AmsAddr& a) {
    v.insert(v.end(), a.netid.bytes().begin(), a.netid.bytes().end());
    le16(v, a.port);
  }
  inline AmsAddr get_addr(const uint8_t* p) {
    std::array<uint8_t, 6> id{{p[0], p[1], p[2], p[3], p[4], p[5]}};
    return AmsAddr(AmsNetId(id), rd16(p + 6));
  }

  /**
   * @brief Bounds-checked cursor over a reply payload
   *
   * Every getter returns false once the data runs out; the cursor does not
   * move on failure.
   */
  class ByteReader {
  public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<uint8_t>& v) : data_(v.data()), size_(v.size()) {}

    bool u8(uint8_t& out) {
      if (remaining() < 1) return false;
      out = data_[pos_++];
      return true;
    }
    bool u16(uint16_t& out) {
      if (remaining() < 2) return false;
      out = rd16(data_ + pos_); pos_ += 2;
      return true;
    }
    bool u32(uint32_t& out) {
      if (remaining() < 4) return false;
      out = rd32(data_ + pos_); pos_ += 4;
      return true;
    }
    bool u64(uint64_t& out) {
      if (remaining() < 8) return false;
      out = rd64(data_ + pos_); pos_ += 8;
      return true;
    }
    bool bytes(size_t n, std::vector<uint8_t>& out) {
      if (remaining() < n) return false;
      out.assign(data_ + pos_, data_ + pos_ + n);
      pos_ += n;
      return true;
    }
    bool skip(size_t n) {
      if (remaining() < n) return false;
      pos_ += n;
      return true;
    }

    const uint8_t* current() const { return data_ + pos_; }
    size_t position() const { return pos_; }
    size_t remaining() const { return size_ - pos_; }

  private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
  };
}

} // namespace ads

#endif // ADS_HPP
