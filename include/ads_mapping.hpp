#pragma once
/**
 * @file ads_mapping.hpp
 * @brief Typed access to one PLC symbol through a fixed buffer
 *
 * A Mapping owns a SymbolHandle and a buffer of the symbol's size. read<T>()
 * reads exactly that many bytes into the buffer and decodes T from it;
 * write<T>() encodes T into the buffer and writes it. The buffer is allocated
 * once and reused.
 *
 * T must encode to exactly the mapped length (BinaryCodec<T>::size()),
 * otherwise the call fails with SizeMismatch before anything is sent.
 *
 * When the handle turned invalid (PLC program reloaded), the mapping
 * re-resolves once and repeats the operation once.
 *
 *   ads::Mapping speed(device, "MAIN.fSpeed", sizeof(double));
 *   auto v = speed.read<double>();
 *   if (v.ok()) ...
 */

#include "ads_codec.hpp"
#include "ads_device.hpp"
#include "ads_error.hpp"
#include "ads_symbol.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace ads {

class Mapping {
public:
    Mapping(const Device& device, const std::string& symbol, size_t length);

    Mapping(const Mapping&) = delete;
    Mapping& operator=(const Mapping&) = delete;

    template<typename T>
    Result<T> read() {
        std::lock_guard<std::mutex> lock(mutex_);
        Status st = check_size(BinaryCodec<T>::size());
        if (!st.ok()) return st.error;
        st = read_buffer();
        if (!st.ok()) return st.error;
        return BinaryCodec<T>::decode(buffer_.data());
    }

    template<typename T>
    Status write(const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        Status st = check_size(BinaryCodec<T>::size());
        if (!st.ok()) return st;
        BinaryCodec<T>::encode(value, buffer_.data());
        return write_buffer();
    }

    size_t length() const { return buffer_.size(); }
    const std::string& symbol() const { return handle_.name(); }
    SymbolHandle& handle() { return handle_; }

    /// Bytes of the last read or write
    std::vector<uint8_t> buffer() const;

private:
    Status check_size(size_t type_size) const;
    Status read_buffer();
    Status write_buffer();

    SymbolHandle handle_;
    mutable std::mutex mutex_;
    std::vector<uint8_t> buffer_;
};

} // namespace ads
