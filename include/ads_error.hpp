#pragma once
/**
 * @file ads_error.hpp
 * @brief Failure reporting and ADS error code interpretation
 *
 * Every public operation returns a Status or a Result<T>; nothing throws
 * across the API.
 *
 * Failure taxonomy:
 *   ConnectFailure  - no session within the connect timeout (reconnect continues)
 *   Timeout         - no response before the request deadline
 *   ConnectionLost  - socket failed while the request was pending
 *   MalformedFrame  - framing or length inconsistency on the stream
 *   ProtocolError   - well-formed reply carrying a remote ADS error code
 *   InvalidHandle   - remote no longer knows a symbol handle
 *   SizeMismatch    - data length does not match the expected length
 *   InvalidArgument - rejected locally before any I/O
 *
 * ADS error code ranges:
 *   0x000:         No error
 *   0x001-0x01C:   Global AMS errors
 *   0x500-0x50A:   Router errors
 *   0x700-0x73F:   Device (server) errors
 *   0x740-0x75F:   Client errors
 */

#include <cstdint>
#include <string>
#include <utility>

namespace ads {

// ============================================================================
// Failure record
// ============================================================================

enum class ErrorKind {
    None,
    ConnectFailure,
    Timeout,
    ConnectionLost,
    MalformedFrame,
    ProtocolError,
    InvalidHandle,
    SizeMismatch,
    InvalidArgument
};

const char* kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::None;
    uint32_t ads_code = 0;      ///< Remote error code (ProtocolError / InvalidHandle)
    std::string message;
};

inline Error make_error(ErrorKind kind, std::string message, uint32_t ads_code = 0) {
    return Error{kind, ads_code, std::move(message)};
}

/// Render for logs, e.g. "ProtocolError: read failed (0x0710: ...)"
std::string to_string(const Error& e);

/**
 * @brief Outcome of an operation without a value
 */
struct Status {
    Error error;

    Status() = default;
    Status(Error e) : error(std::move(e)) {}

    bool ok() const { return error.kind == ErrorKind::None; }
    explicit operator bool() const { return ok(); }
    ErrorKind kind() const { return error.kind; }
};

/**
 * @brief Outcome of an operation producing a T
 *
 * `value` is only meaningful when ok().
 */
template<typename T>
struct Result {
    T value{};
    Error error;

    Result() = default;
    Result(T v) : value(std::move(v)) {}
    Result(Error e) : error(std::move(e)) {}

    bool ok() const { return error.kind == ErrorKind::None; }
    explicit operator bool() const { return ok(); }
    ErrorKind kind() const { return error.kind; }
    Status status() const { return Status(error); }
};

namespace errors {

// ============================================================================
// ADS error codes (subset used for classification)
// ============================================================================

constexpr uint32_t NoError = 0x000;
constexpr uint32_t TargetPortNotFound = 0x006;
constexpr uint32_t TargetMachineNotFound = 0x007;
constexpr uint32_t UnknownCommandId = 0x008;
constexpr uint32_t PortNotConnected = 0x00D;
constexpr uint32_t InvalidAmsLength = 0x00E;
constexpr uint32_t InvalidAmsNetId = 0x00F;
constexpr uint32_t SyncTimeout = 0x015;

constexpr uint32_t DeviceError = 0x700;
constexpr uint32_t DeviceServiceNotSupported = 0x701;
constexpr uint32_t DeviceInvalidGroup = 0x702;
constexpr uint32_t DeviceInvalidOffset = 0x703;
constexpr uint32_t DeviceInvalidAccess = 0x704;
constexpr uint32_t DeviceInvalidSize = 0x705;
constexpr uint32_t DeviceInvalidData = 0x706;
constexpr uint32_t DeviceNotReady = 0x707;
constexpr uint32_t DeviceBusy = 0x708;
constexpr uint32_t DeviceNotFound = 0x70C;
constexpr uint32_t DeviceSymbolNotFound = 0x710;
constexpr uint32_t DeviceSymbolVersionInvalid = 0x711;
constexpr uint32_t DeviceInvalidState = 0x712;
constexpr uint32_t DeviceNotifyHandleInvalid = 0x714;
constexpr uint32_t DeviceTimeout = 0x719;
constexpr uint32_t DeviceAccessDenied = 0x723;

constexpr uint32_t ClientError = 0x740;
constexpr uint32_t ClientTimeout = 0x745;

enum class Category {
    None,
    Global,         // AMS transport level
    Router,         // Local or remote router
    Device,         // Reported by the target service
    Client,         // Reported by the remote client side
    Unknown
};

// ============================================================================
// Interpreter - names and descriptions for ADS error codes
// ============================================================================

class Interpreter {
public:
    Interpreter() = default;

    /// Symbolic name, e.g. "ADSERR_DEVICE_SYMBOLNOTFOUND"
    static std::string get_name(uint32_t code);

    /// Human-readable description, e.g. "Symbol not found"
    static std::string get_description(uint32_t code);

    static Category get_category(uint32_t code);

    /// True for codes meaning the remote no longer recognizes a symbol handle
    static bool is_invalid_handle(uint32_t code) {
        return code == DeviceSymbolNotFound || code == DeviceSymbolVersionInvalid;
    }

    /// True for codes where repeating the same request later may succeed
    static bool is_transient(uint32_t code);

    /// Format for logging (e.g., "0x0710: ADSERR_DEVICE_SYMBOLNOTFOUND - Symbol not found")
    static std::string format_for_log(uint32_t code);

    std::string description(uint32_t code) const { return get_description(code); }
};

} // namespace errors

} // namespace ads
