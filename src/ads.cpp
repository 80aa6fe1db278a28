#include "ads.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace ads {

// ============================================================================
// Addressing
// ============================================================================

namespace {

// Parse an unsigned decimal number in [0, max]; rejects empty and signed input.
bool parse_number(const std::string& s, unsigned long max, unsigned long& out) {
  if (s.empty() || s.size() > 5) return false;
  unsigned long v = 0;
  for (char ch : s) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
    v = v * 10 + static_cast<unsigned long>(ch - '0');
  }
  if (v > max) return false;
  out = v;
  return true;
}

} // namespace

std::optional<AmsNetId> AmsNetId::parse(const std::string& text) {
  std::array<uint8_t, 6> bytes{};
  size_t start = 0;
  for (size_t i = 0; i < 6; ++i) {
    size_t dot = text.find('.', start);
    bool last = (i == 5);
    if (last != (dot == std::string::npos)) return std::nullopt;
    std::string part = text.substr(start, last ? std::string::npos : dot - start);
    unsigned long v = 0;
    if (!parse_number(part, 255, v)) return std::nullopt;
    bytes[i] = static_cast<uint8_t>(v);
    start = dot + 1;
  }
  return AmsNetId(bytes);
}

bool AmsNetId::is_zero() const {
  return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

std::string AmsNetId::to_string() const {
  std::ostringstream oss;
  for (size_t i = 0; i < bytes_.size(); ++i) {
    if (i) oss << '.';
    oss << static_cast<unsigned>(bytes_[i]);
  }
  return oss.str();
}

std::optional<AmsAddr> AmsAddr::parse(const std::string& text) {
  size_t colon = text.rfind(':');
  if (colon == std::string::npos) return std::nullopt;
  auto id = AmsNetId::parse(text.substr(0, colon));
  unsigned long port = 0;
  if (!id || !parse_number(text.substr(colon + 1), 0xFFFF, port)) return std::nullopt;
  return AmsAddr(*id, static_cast<uint16_t>(port));
}

std::string AmsAddr::to_string() const {
  return netid.to_string() + ":" + std::to_string(port);
}

// ============================================================================
// Commands and states
// ============================================================================

const char* command_name(Command cmd) {
  switch (cmd) {
    case Command::DevInfo:            return "DevInfo";
    case Command::Read:               return "Read";
    case Command::Write:              return "Write";
    case Command::ReadState:          return "ReadState";
    case Command::WriteControl:       return "WriteControl";
    case Command::AddNotification:    return "AddNotification";
    case Command::DeleteNotification: return "DeleteNotification";
    case Command::Notification:       return "Notification";
    case Command::ReadWrite:          return "ReadWrite";
  }
  return "Unknown";
}

namespace {

const char* const kStateNames[] = {
  "Invalid", "Idle", "Reset", "Init", "Start", "Run", "Stop", "SaveCfg",
  "LoadCfg", "PowerFail", "PowerGood", "Error", "Shutdown", "Suspend",
  "Resume", "Config", "Reconfig", "Stopping", "Incompatible", "Exception"
};

constexpr uint16_t kStateCount = sizeof(kStateNames) / sizeof(kStateNames[0]);

} // namespace

const char* state_name(AdsState s) {
  auto raw = static_cast<uint16_t>(s);
  return raw < kStateCount ? kStateNames[raw] : "Unknown";
}

std::optional<AdsState> state_from_raw(uint16_t raw) {
  if (raw >= kStateCount) return std::nullopt;
  return static_cast<AdsState>(raw);
}

std::optional<AdsState> parse_state(const std::string& name) {
  auto lower = [](std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  };
  const std::string wanted = lower(name);
  for (uint16_t i = 0; i < kStateCount; ++i) {
    if (lower(kStateNames[i]) == wanted) return static_cast<AdsState>(i);
  }
  return std::nullopt;
}

} // namespace ads
