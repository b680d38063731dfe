#ifndef BITEXACT_OPERATIONS_ROUND_INTEGRAL_HPP
#define BITEXACT_OPERATIONS_ROUND_INTEGRAL_HPP

// roundToIntegral (IEEE 754-2019 §5.9). The direction is explicit, the
// floating-point environment's rounding mode is neither read nor changed.

#include <cmath>
#include <type_traits>
#include <variant>

#include "bitexact/core/exceptions.hpp"
#include "bitexact/core/float.hpp"
#include "bitexact/core/rounding.hpp"
#include "bitexact/operations/classify.hpp"
#include "bitexact/operations/payload.hpp"

namespace bitexact {

namespace detail {

template <NativeBinary T> T roundTiesToEvenFinite(T Value) {
  T Rounded = std::round(Value); // ties away from zero
  if (std::fabs(Value - std::trunc(Value)) == T(0.5))
    Rounded = T(2) * std::round(Value / T(2));
  return Rounded;
}

} // namespace detail

// NaN gives a quiet NaN; infinities and zeros are returned unchanged. A
// zero result keeps the sign of the input.
template <RoundingPolicy R, NativeBinary T> T roundToIntegral(T Value) {
  switch (classify(Value).Kind) {
  case NumberKind::SignalingNaN:
  case NumberKind::QuietNaN:
    return quietNaN(Value);
  case NumberKind::Infinity:
  case NumberKind::Zero:
    return Value;
  case NumberKind::Normal:
  case NumberKind::Subnormal:
    break;
  }

  if constexpr (std::is_same_v<R, rounding::ToNearestTiesToEven>)
    return detail::roundTiesToEvenFinite(Value);
  else if constexpr (std::is_same_v<R, rounding::ToNearestTiesAway>)
    return std::round(Value);
  else if constexpr (std::is_same_v<R, rounding::TowardPositive>)
    return std::ceil(Value);
  else if constexpr (std::is_same_v<R, rounding::TowardNegative>)
    return std::floor(Value);
  else {
    static_assert(std::is_same_v<R, rounding::TowardZero>,
                  "unsupported rounding direction");
    return std::trunc(Value);
  }
}

template <NativeBinary T> T roundToIntegral(T Value, RoundingDirection Dir) {
  return std::visit(
      [Value](auto Tag) { return roundToIntegral<decltype(Tag)>(Value); },
      Dir);
}

// roundToIntegralExact: as roundToIntegral, and raises inexact when the
// result differs from Value, invalid for a signaling NaN operand.
template <NativeBinary T>
T roundToIntegralExact(T Value, RoundingDirection Dir, ExceptionFlags &Flags) {
  if (isSignaling(Value))
    Flags.raise(ExceptionFlag::Invalid);
  T Result = roundToIntegral(Value, Dir);
  if (isFinite(Value) && Result != Value)
    Flags.raise(ExceptionFlag::Inexact);
  return Result;
}

// Named directions.

template <NativeBinary T> T floor(T Value) {
  return roundToIntegral<rounding::TowardNegative>(Value);
}

template <NativeBinary T> T ceil(T Value) {
  return roundToIntegral<rounding::TowardPositive>(Value);
}

template <NativeBinary T> T trunc(T Value) {
  return roundToIntegral<rounding::TowardZero>(Value);
}

template <NativeBinary T> T roundTiesToEven(T Value) {
  return roundToIntegral<rounding::ToNearestTiesToEven>(Value);
}

template <NativeBinary T> T roundTiesAway(T Value) {
  return roundToIntegral<rounding::ToNearestTiesAway>(Value);
}

} // namespace bitexact

#endif // BITEXACT_OPERATIONS_ROUND_INTEGRAL_HPP
