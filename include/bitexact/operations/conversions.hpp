#ifndef BITEXACT_OPERATIONS_CONVERSIONS_HPP
#define BITEXACT_OPERATIONS_CONVERSIONS_HPP

// Format conversions (IEEE 754-2019 §5.4.2) and conversions to and from
// 64-bit integers (§5.4.1, §5.8).
//
// NaNs cross formats as quiet NaNs of the same sign with the payload
// left-aligned in the fraction: widening shifts the fraction left by
// 52 - 23 = 29 bits, narrowing drops the low 29 bits. The result is a NaN
// even when the narrowed payload would be zero, because the quiet bit is
// always set. binary16 has no native type; it travels as its storage bits,
// and its NaNs follow the same rule with shifts of 23 - 10 and 52 - 10.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>

#include "bitexact/core/float.hpp"
#include "bitexact/core/rounding.hpp"
#include "bitexact/operations/classify.hpp"
#include "bitexact/operations/round_integral.hpp"
#include "bitexact/operations/sign.hpp"

namespace bitexact {

namespace detail {

inline constexpr int FractionShift =
    binary64::mant_bits - binary32::mant_bits;
inline constexpr int HalfToSingleShift =
    binary32::mant_bits - binary16::mant_bits;
inline constexpr int HalfToDoubleShift =
    binary64::mant_bits - binary16::mant_bits;

// 2^63 and 2^64 are exact in both formats.
template <NativeBinary T> constexpr T twoPow63() {
  return static_cast<T>(9223372036854775808.0);
}
template <NativeBinary T> constexpr T twoPow64() {
  return static_cast<T>(18446744073709551616.0);
}

} // namespace detail

// Exact for every non-NaN value.
inline double toBinary64(float Value) {
  if (isNaN(Value)) {
    using M32 = BinaryFloat<float>::masks;
    using M64 = BinaryFloat<double>::masks;
    std::uint32_t Bits = toBits(Value);
    std::uint64_t Sign = std::uint64_t(Bits & M32::sign) << 32;
    std::uint64_t Fraction = std::uint64_t(Bits & M32::significand)
                             << detail::FractionShift;
    return fromBits<double>(Sign | M64::exponent | M64::quiet | Fraction);
  }
  return static_cast<double>(Value);
}

// Rounded under the current rounding mode.
inline float toBinary32(double Value) {
  if (isNaN(Value)) {
    using M32 = BinaryFloat<float>::masks;
    using M64 = BinaryFloat<double>::masks;
    std::uint64_t Bits = toBits(Value);
    auto Sign = static_cast<std::uint32_t>((Bits & M64::sign) >> 32);
    auto Fraction = static_cast<std::uint32_t>(
        (Bits & M64::significand) >> detail::FractionShift);
    return fromBits<float>(Sign | M32::exponent | M32::quiet | Fraction);
  }
  return static_cast<float>(Value);
}

// binary16 -> binary32. Exact for every non-NaN value.
inline float binary16ToBinary32(binary16::storage_type Bits) {
  using M16 = binary16::masks;
  using M32 = BinaryFloat<float>::masks;
  auto Half = static_cast<std::uint32_t>(Bits);
  bool Negative = (Half & std::uint32_t(M16::sign)) != 0;
  int Biased =
      int((Half & std::uint32_t(M16::exponent)) >> binary16::mant_bits);
  std::uint32_t Fraction = Half & std::uint32_t(M16::significand);

  if (Biased == binary16::max_biased_exponent) {
    std::uint32_t Sign = Negative ? M32::sign : 0;
    if (Fraction == 0)
      return fromBits<float>(Sign | M32::exponent);
    return fromBits<float>(Sign | M32::exponent | M32::quiet |
                           (Fraction << detail::HalfToSingleShift));
  }

  // Subnormals (and zeros) sit in the binade of emin without the
  // implicit bit.
  std::uint32_t Significand =
      Biased == 0 ? Fraction : Fraction | (1u << binary16::mant_bits);
  int Exponent =
      (Biased == 0 ? binary16::emin : Biased - binary16::exponent_bias) -
      binary16::mant_bits;
  float Magnitude = std::ldexp(static_cast<float>(Significand), Exponent);
  return Negative ? -Magnitude : Magnitude;
}

// binary16 -> binary64. Exact for every non-NaN value.
inline double binary16ToBinary64(binary16::storage_type Bits) {
  return toBinary64(binary16ToBinary32(Bits));
}

// binary64 -> binary16, rounded under the current rounding mode. Overflow
// gives infinity, or the largest finite value when the mode rounds toward
// zero for that sign.
inline binary16::storage_type binary64ToBinary16(double Value) {
  using M16 = binary16::masks;
  using M64 = BinaryFloat<double>::masks;
  using Half = binary16::storage_type;
  constexpr auto Infinity = std::uint32_t(M16::exponent);

  std::uint64_t Bits = toBits(Value);
  bool Negative = (Bits & M64::sign) != 0;
  std::uint32_t Sign = Negative ? std::uint32_t(M16::sign) : 0;

  if (isNaN(Value)) {
    auto Fraction = static_cast<std::uint32_t>(
        (Bits & M64::significand) >> detail::HalfToDoubleShift);
    return static_cast<Half>(Sign | Infinity | std::uint32_t(M16::quiet) |
                             Fraction);
  }
  if (isInfinite(Value))
    return static_cast<Half>(Sign | Infinity);
  if (isZero(Value))
    return static_cast<Half>(Sign);

  RoundingMode Mode = roundingMode();
  int Exponent = std::ilogb(bitexact::abs(Value));
  std::uint32_t Encoded = Infinity;
  if (Exponent <= binary16::emax) {
    // Scale so the binary16 quantum of Value's binade is 1; subnormals use
    // the quantum of emin. The scaling is exact.
    int Quantum = std::max(Exponent, binary16::emin) - binary16::mant_bits;
    double Scaled = std::ldexp(Value, -Quantum);
    auto Integral = static_cast<std::uint32_t>(
        bitexact::abs(roundToIntegral(Scaled, toDirection(Mode))));
    // Integral still holds the implicit bit, so it is added to the
    // exponent field one below the binade. A carry out of the significand
    // moves into the next binade, and past emax into infinity.
    auto Below = std::uint32_t(Quantum - binary16::emin + binary16::mant_bits);
    Encoded = (Below << binary16::mant_bits) + Integral;
  }

  if (Encoded >= Infinity) {
    bool TowardZero = Mode == RoundingMode::TowardZero ||
                      (Mode == RoundingMode::TowardPositive && Negative) ||
                      (Mode == RoundingMode::TowardNegative && !Negative);
    Encoded = TowardZero ? Infinity - 1 : Infinity;
  }
  return static_cast<Half>(Sign | Encoded);
}

// binary32 -> binary16, rounded once under the current rounding mode.
inline binary16::storage_type binary32ToBinary16(float Value) {
  return binary64ToBinary16(toBinary64(Value));
}

// Nearest integer, ties to even. nullopt for NaN, infinities and results
// outside int64_t.
template <NativeBinary T> std::optional<std::int64_t> toInt64(T Value) {
  if (!isFinite(Value))
    return std::nullopt;
  T Rounded = roundTiesToEven(Value);
  if (Rounded < -detail::twoPow63<T>() || Rounded >= detail::twoPow63<T>())
    return std::nullopt;
  return static_cast<std::int64_t>(Rounded);
}

template <NativeBinary T>
std::optional<std::int64_t> toInt64Truncating(T Value) {
  if (!isFinite(Value))
    return std::nullopt;
  T Rounded = bitexact::trunc(Value);
  if (Rounded < -detail::twoPow63<T>() || Rounded >= detail::twoPow63<T>())
    return std::nullopt;
  return static_cast<std::int64_t>(Rounded);
}

// Nearest integer, ties to even; values that round to zero from below
// (e.g. -0.25) convert to 0.
template <NativeBinary T> std::optional<std::uint64_t> toUInt64(T Value) {
  if (!isFinite(Value))
    return std::nullopt;
  T Rounded = roundTiesToEven(Value);
  if (Rounded < T(0) || Rounded >= detail::twoPow64<T>())
    return std::nullopt;
  return static_cast<std::uint64_t>(Rounded);
}

// Exact when representable, otherwise rounded under the current mode.
template <NativeBinary T> T fromInt64(std::int64_t Value) {
  return static_cast<T>(Value);
}

template <NativeBinary T> T fromUInt64(std::uint64_t Value) {
  return static_cast<T>(Value);
}

} // namespace bitexact

#endif // BITEXACT_OPERATIONS_CONVERSIONS_HPP
