#pragma once
/**
 * @file ads_symbol.hpp
 * @brief Symbol handles: access to PLC variables by name
 *
 * A SymbolHandle resolves its name to a numeric handle with
 * ReadWrite(GET_SYMHANDLE_BYNAME) and addresses the value through
 * RW_SYMVAL_BYHANDLE with that handle as index offset.
 *
 * Validity is tied to the connection: the handle remembers the session id
 * it was resolved in and is invalid as soon as the client's session id
 * differs. Any read or write resolves first when the handle is invalid, so
 * after a reconnect the next use re-resolves without application code.
 *
 * A read or write failing with ADSERR_DEVICE_SYMBOLNOTFOUND or
 * ADSERR_DEVICE_SYMBOLVERSIONINVALID (the PLC program was reloaded)
 * invalidates the handle and reports InvalidHandle. The handle does not
 * retry by itself; the caller decides (Mapping retries once).
 */

#include "ads_codec.hpp"
#include "ads_device.hpp"
#include "ads_error.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ads {

class SymbolHandle {
public:
    /// Does not resolve yet; the first use (or resolve()) does
    SymbolHandle(const Device& device, std::string name);

    /// Releases a still valid handle, best effort
    ~SymbolHandle();

    SymbolHandle(const SymbolHandle&) = delete;
    SymbolHandle& operator=(const SymbolHandle&) = delete;

    const std::string& name() const { return name_; }
    const Device& device() const { return device_; }

    /**
     * @brief Ask the device for a fresh handle
     *
     * A handle still valid in the current session is released first.
     */
    Status resolve();

    /// Resolved in the client's current session
    bool is_valid() const;

    /// Forget the numeric handle without releasing it remotely
    void invalidate();

    /// The numeric handle while valid
    std::optional<uint32_t> raw() const;

    /// Release the handle remotely and forget it; ok when there is none
    Status release();

    /// Read up to `length` bytes of the value; returns the count delivered
    Result<size_t> read_into(uint8_t* out, size_t length);

    /// Write `length` bytes to the value
    Status write_from(const uint8_t* data, size_t length);

    template<typename T>
    Result<T> read_value() {
        std::vector<uint8_t> buf(BinaryCodec<T>::size());
        auto got = read_into(buf.data(), buf.size());
        if (!got.ok()) return got.error;
        if (got.value != buf.size()) {
            return make_error(ErrorKind::SizeMismatch,
                              name_ + ": got " + std::to_string(got.value) + " bytes, expected " +
                              std::to_string(buf.size()));
        }
        return BinaryCodec<T>::decode(buf.data());
    }

    template<typename T>
    Status write_value(const T& value) {
        const std::vector<uint8_t> buf = encode_value(value);
        return write_from(buf.data(), buf.size());
    }

private:
    /// Valid handle, resolving first if needed
    Result<uint32_t> acquire();
    Status resolve_locked();
    bool valid_locked() const;
    /// Invalidate if `used` is still current and `e` says the remote forgot it
    Error classify(const Error& e, uint32_t used);

    const Device device_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::optional<uint32_t> handle_;
    uint64_t session_ = 0;
};

} // namespace ads
