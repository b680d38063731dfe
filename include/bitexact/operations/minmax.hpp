#ifndef BITEXACT_OPERATIONS_MINMAX_HPP
#define BITEXACT_OPERATIONS_MINMAX_HPP

// minimum/maximum family (IEEE 754-2019 §9.6).
//
// Every variant is a point in Extremum x Basis x NanPolicy:
//
//   minimum / maximum                      Value      Propagate
//   minimumNumber / maximumNumber          Value      PreferNumber
//   minimumMagnitude / maximumMagnitude    Magnitude  Propagate
//   minimumMagnitudeNumber / ...           Magnitude  PreferNumber
//
// Propagate: any NaN operand gives a quiet NaN carrying the payload of the
// first NaN operand. PreferNumber: a single NaN operand is ignored; two
// NaN operands give a quiet NaN as above. For Value, -0 orders below +0.
// For Magnitude, equal magnitudes fall back to the Value rule on the
// signed operands. No combination of inputs is an error.

#include "bitexact/core/float.hpp"
#include "bitexact/operations/classify.hpp"
#include "bitexact/operations/payload.hpp"
#include "bitexact/operations/sign.hpp"

namespace bitexact {

enum class Extremum { Min, Max };

enum class Basis { Value, Magnitude };

enum class NanPolicy { Propagate, PreferNumber };

struct MinMaxSelection {
  Extremum Which;
  Basis By;
  NanPolicy Nan;

  friend constexpr bool operator==(MinMaxSelection,
                                   MinMaxSelection) = default;
};

namespace minmax {

inline constexpr MinMaxSelection Minimum{Extremum::Min, Basis::Value,
                                         NanPolicy::Propagate};
inline constexpr MinMaxSelection Maximum{Extremum::Max, Basis::Value,
                                         NanPolicy::Propagate};
inline constexpr MinMaxSelection MinimumNumber{Extremum::Min, Basis::Value,
                                               NanPolicy::PreferNumber};
inline constexpr MinMaxSelection MaximumNumber{Extremum::Max, Basis::Value,
                                               NanPolicy::PreferNumber};
inline constexpr MinMaxSelection MinimumMagnitude{
    Extremum::Min, Basis::Magnitude, NanPolicy::Propagate};
inline constexpr MinMaxSelection MaximumMagnitude{
    Extremum::Max, Basis::Magnitude, NanPolicy::Propagate};
inline constexpr MinMaxSelection MinimumMagnitudeNumber{
    Extremum::Min, Basis::Magnitude, NanPolicy::PreferNumber};
inline constexpr MinMaxSelection MaximumMagnitudeNumber{
    Extremum::Max, Basis::Magnitude, NanPolicy::PreferNumber};

} // namespace minmax

namespace detail {

// Both operands are numbers.
template <NativeBinary T> constexpr T selectByValue(Extremum Which, T X, T Y) {
  if (isZero(X) && isZero(Y)) {
    // -0 < +0: the minimum is negative if either is, the maximum positive
    // if either is.
    switch (Which) {
    case Extremum::Min: return isSignMinus(X) ? X : Y;
    case Extremum::Max: return isSignMinus(X) ? Y : X;
    }
  }
  switch (Which) {
  case Extremum::Min: return Y < X ? Y : X;
  case Extremum::Max: return Y > X ? Y : X;
  }
  return X;
}

template <NativeBinary T>
constexpr T selectByMagnitude(Extremum Which, T X, T Y) {
  T MagX = bitexact::abs(X);
  T MagY = bitexact::abs(Y);
  if (MagX == MagY)
    return selectByValue(Which, X, Y);
  switch (Which) {
  case Extremum::Min: return MagX < MagY ? X : Y;
  case Extremum::Max: return MagX > MagY ? X : Y;
  }
  return X;
}

} // namespace detail

template <NativeBinary T> constexpr T select(MinMaxSelection S, T X, T Y) {
  bool NanX = isNaN(X);
  bool NanY = isNaN(Y);
  if (NanX || NanY) {
    switch (S.Nan) {
    case NanPolicy::Propagate:
      return quietNaN(NanX ? X : Y);
    case NanPolicy::PreferNumber:
      if (NanX && NanY)
        return quietNaN(X);
      return NanX ? Y : X;
    }
  }
  switch (S.By) {
  case Basis::Value:     return detail::selectByValue(S.Which, X, Y);
  case Basis::Magnitude: return detail::selectByMagnitude(S.Which, X, Y);
  }
  return X;
}

template <NativeBinary T> constexpr T minimum(T X, T Y) {
  return select(minmax::Minimum, X, Y);
}

template <NativeBinary T> constexpr T maximum(T X, T Y) {
  return select(minmax::Maximum, X, Y);
}

template <NativeBinary T> constexpr T minimumNumber(T X, T Y) {
  return select(minmax::MinimumNumber, X, Y);
}

template <NativeBinary T> constexpr T maximumNumber(T X, T Y) {
  return select(minmax::MaximumNumber, X, Y);
}

template <NativeBinary T> constexpr T minimumMagnitude(T X, T Y) {
  return select(minmax::MinimumMagnitude, X, Y);
}

template <NativeBinary T> constexpr T maximumMagnitude(T X, T Y) {
  return select(minmax::MaximumMagnitude, X, Y);
}

template <NativeBinary T> constexpr T minimumMagnitudeNumber(T X, T Y) {
  return select(minmax::MinimumMagnitudeNumber, X, Y);
}

template <NativeBinary T> constexpr T maximumMagnitudeNumber(T X, T Y) {
  return select(minmax::MaximumMagnitudeNumber, X, Y);
}

} // namespace bitexact

#endif // BITEXACT_OPERATIONS_MINMAX_HPP
