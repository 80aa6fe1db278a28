#pragma once
/**
 * @file ads_codec.hpp
 * @brief Binary encode/decode of PLC values
 *
 * BinaryCodec<T> is the single seam through which typed reads and writes
 * turn values into bytes and back:
 *
 *   static size_t size();                          // encoded size in bytes
 *   static void encode(const T& value, uint8_t* out);
 *   static T decode(const uint8_t* in);
 *
 * Built in: arithmetic types and bool (little-endian, as the PLC lays them
 * out) and std::array of any supported type. PLC structures get their own
 * specialization, for example:
 *
 *   struct Axis { int32_t position; uint16_t status; };
 *   template<> struct ads::BinaryCodec<Axis> {
 *       static size_t size() { return 6; }
 *       static void encode(const Axis& a, uint8_t* out) {
 *           BinaryCodec<int32_t>::encode(a.position, out);
 *           BinaryCodec<uint16_t>::encode(a.status, out + 4);
 *       }
 *       static Axis decode(const uint8_t* in) {
 *           return {BinaryCodec<int32_t>::decode(in), BinaryCodec<uint16_t>::decode(in + 4)};
 *       }
 *   };
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <vector>

namespace ads {

template<typename T, typename Enable = void>
struct BinaryCodec;

namespace detail {

template<size_t N> struct UintOfSize;
template<> struct UintOfSize<1> { using type = uint8_t; };
template<> struct UintOfSize<2> { using type = uint16_t; };
template<> struct UintOfSize<4> { using type = uint32_t; };
template<> struct UintOfSize<8> { using type = uint64_t; };

} // namespace detail

/// Integers and floating point, little-endian
template<typename T>
struct BinaryCodec<T, std::enable_if_t<std::is_arithmetic<T>::value && !std::is_same<T, bool>::value>> {
    using Bits = typename detail::UintOfSize<sizeof(T)>::type;

    static constexpr size_t size() { return sizeof(T); }

    static void encode(const T& value, uint8_t* out) {
        Bits bits;
        std::memcpy(&bits, &value, sizeof(T));
        for (size_t i = 0; i < sizeof(T); ++i) {
            out[i] = static_cast<uint8_t>(bits >> (8 * i));
        }
    }

    static T decode(const uint8_t* in) {
        Bits bits = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            bits = static_cast<Bits>(bits | (static_cast<Bits>(in[i]) << (8 * i)));
        }
        T value;
        std::memcpy(&value, &bits, sizeof(T));
        return value;
    }
};

/// PLC BOOL is one byte, any non-zero value reads as true
template<>
struct BinaryCodec<bool> {
    static constexpr size_t size() { return 1; }
    static void encode(const bool& value, uint8_t* out) { out[0] = value ? 1 : 0; }
    static bool decode(const uint8_t* in) { return in[0] != 0; }
};

/// Fixed-size PLC arrays
template<typename T, size_t N>
struct BinaryCodec<std::array<T, N>> {
    static size_t size() { return N * BinaryCodec<T>::size(); }

    static void encode(const std::array<T, N>& value, uint8_t* out) {
        const size_t step = BinaryCodec<T>::size();
        for (size_t i = 0; i < N; ++i) {
            BinaryCodec<T>::encode(value[i], out + i * step);
        }
    }

    static std::array<T, N> decode(const uint8_t* in) {
        std::array<T, N> value{};
        const size_t step = BinaryCodec<T>::size();
        for (size_t i = 0; i < N; ++i) {
            value[i] = BinaryCodec<T>::decode(in + i * step);
        }
        return value;
    }
};

/// Encode into a fresh buffer of exactly BinaryCodec<T>::size() bytes
template<typename T>
std::vector<uint8_t> encode_value(const T& value) {
    std::vector<uint8_t> out(BinaryCodec<T>::size());
    BinaryCodec<T>::encode(value, out.data());
    return out;
}

} // namespace ads
