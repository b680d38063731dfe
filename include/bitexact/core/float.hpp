#ifndef BITEXACT_CORE_FLOAT_HPP
#define BITEXACT_CORE_FLOAT_HPP

// BinaryFloat<T>: binds a native floating type to its interchange format.
//
// This is the only place the library reinterprets a native value as
// bits. Everything above it works on storage_type through toBits() and
// fromBits().

#include <bit>
#include <concepts>
#include <cstdint>
#include <limits>

#include "bitexact/core/format.hpp"

namespace bitexact {

template <typename T> struct BinaryFloat;

template <> struct BinaryFloat<float> {
  using value_type = float;
  using format = binary32;
  using storage_type = std::uint32_t;
  using masks = FieldMasks<storage_type, format>;
  using signed_storage_type = std::int32_t;

  static constexpr int byte_size = format::byte_size;

  static_assert(std::numeric_limits<float>::is_iec559,
                "float must be IEEE 754 binary32");
  static_assert(sizeof(float) == sizeof(storage_type));

  static constexpr storage_type toBits(float V) {
    return std::bit_cast<storage_type>(V);
  }
  static constexpr float fromBits(storage_type B) {
    return std::bit_cast<float>(B);
  }
};

template <> struct BinaryFloat<double> {
  using value_type = double;
  using format = binary64;
  using storage_type = std::uint64_t;
  using masks = FieldMasks<storage_type, format>;
  using signed_storage_type = std::int64_t;

  static constexpr int byte_size = format::byte_size;

  static_assert(std::numeric_limits<double>::is_iec559,
                "double must be IEEE 754 binary64");
  static_assert(sizeof(double) == sizeof(storage_type));

  static constexpr storage_type toBits(double V) {
    return std::bit_cast<storage_type>(V);
  }
  static constexpr double fromBits(storage_type B) {
    return std::bit_cast<double>(B);
  }
};

template <typename T>
concept NativeBinary = std::same_as<T, float> || std::same_as<T, double>;

template <NativeBinary T>
using storage_t = typename BinaryFloat<T>::storage_type;

template <NativeBinary T> constexpr storage_t<T> toBits(T V) {
  return BinaryFloat<T>::toBits(V);
}

template <NativeBinary T> constexpr T fromBits(storage_t<T> B) {
  return BinaryFloat<T>::fromBits(B);
}

// Named special values and limits, built from bit patterns so they do not
// depend on how the compiler spells NaN.
template <NativeBinary T> struct SpecialValues {
  using Bf = BinaryFloat<T>;
  using S = typename Bf::storage_type;
  using M = typename Bf::masks;

  static constexpr T positiveZero() { return Bf::fromBits(S{0}); }
  static constexpr T negativeZero() { return Bf::fromBits(M::sign); }
  static constexpr T positiveInfinity() { return Bf::fromBits(M::exponent); }
  static constexpr T negativeInfinity() {
    return Bf::fromBits(M::sign | M::exponent);
  }
  static constexpr T quietNaN() { return Bf::fromBits(M::exponent | M::quiet); }
  static constexpr T signalingNaN() {
    return Bf::fromBits(M::exponent | S{1});
  }

  static constexpr T epsilon() { return std::numeric_limits<T>::epsilon(); }
  static constexpr T minNormal() { return std::numeric_limits<T>::min(); }
  static constexpr T minSubnormal() {
    return std::numeric_limits<T>::denorm_min();
  }
  static constexpr T maxFinite() { return std::numeric_limits<T>::max(); }
};

} // namespace bitexact

#endif // BITEXACT_CORE_FLOAT_HPP
