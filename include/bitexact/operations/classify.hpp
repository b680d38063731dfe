#ifndef BITEXACT_OPERATIONS_CLASSIFY_HPP
#define BITEXACT_OPERATIONS_CLASSIFY_HPP

// Classification predicates (IEEE 754-2019 §5.7.2), computed from the
// bit fields:
//
//   exponent all ones, fraction != 0   NaN (quiet iff fraction MSB set)
//   exponent all ones, fraction == 0   infinity
//   exponent zero,     fraction == 0   zero
//   exponent zero,     fraction != 0   subnormal
//   otherwise                          normal
//
// The NaN test has to come before the infinity test and the zero test
// before the subnormal test; the rows are otherwise disjoint.

#include "bitexact/core/enums.hpp"
#include "bitexact/core/float.hpp"

namespace bitexact {

// Kind plus sign. NaN kinds keep the sign bit they were read with but
// compare equal regardless of it, matching the ten classes of the
// standard.
struct NumberClass {
  NumberKind Kind;
  Sign SignBit;

  constexpr bool isNaN() const {
    return Kind == NumberKind::SignalingNaN || Kind == NumberKind::QuietNaN;
  }

  friend constexpr bool operator==(NumberClass A, NumberClass B) {
    if (A.Kind != B.Kind)
      return false;
    return A.isNaN() || A.SignBit == B.SignBit;
  }

  static constexpr NumberClass positive(NumberKind K) {
    return {K, Sign::Plus};
  }
  static constexpr NumberClass negative(NumberKind K) {
    return {K, Sign::Minus};
  }
  static constexpr NumberClass nan(NanKind K) {
    return {K == NanKind::Signaling ? NumberKind::SignalingNaN
                                    : NumberKind::QuietNaN,
            Sign::Plus};
  }
};

template <NativeBinary T> constexpr bool isSignMinus(T Value) {
  return (toBits(Value) & BinaryFloat<T>::masks::sign) != 0;
}

template <NativeBinary T> constexpr NumberClass classify(T Value) {
  using M = typename BinaryFloat<T>::masks;
  auto Bits = toBits(Value);
  auto Exp = Bits & M::exponent;
  auto Frac = Bits & M::significand;
  Sign S = (Bits & M::sign) != 0 ? Sign::Minus : Sign::Plus;

  if (Exp == M::exponent) {
    if (Frac != 0)
      return {(Frac & M::quiet) != 0 ? NumberKind::QuietNaN
                                     : NumberKind::SignalingNaN,
              S};
    return {NumberKind::Infinity, S};
  }
  if (Exp == 0)
    return {Frac == 0 ? NumberKind::Zero : NumberKind::Subnormal, S};
  return {NumberKind::Normal, S};
}

template <NativeBinary T> constexpr IeeeClass ieeeClass(T Value) {
  NumberClass C = classify(Value);
  bool Neg = C.SignBit == Sign::Minus;
  switch (C.Kind) {
  case NumberKind::SignalingNaN: return IeeeClass::SignalingNaN;
  case NumberKind::QuietNaN:     return IeeeClass::QuietNaN;
  case NumberKind::Infinity:
    return Neg ? IeeeClass::NegativeInfinity : IeeeClass::PositiveInfinity;
  case NumberKind::Normal:
    return Neg ? IeeeClass::NegativeNormal : IeeeClass::PositiveNormal;
  case NumberKind::Subnormal:
    return Neg ? IeeeClass::NegativeSubnormal : IeeeClass::PositiveSubnormal;
  case NumberKind::Zero:
    return Neg ? IeeeClass::NegativeZero : IeeeClass::PositiveZero;
  }
  return IeeeClass::QuietNaN;
}

template <NativeBinary T> constexpr bool isNaN(T Value) {
  return classify(Value).isNaN();
}

template <NativeBinary T> constexpr bool isSignaling(T Value) {
  return classify(Value).Kind == NumberKind::SignalingNaN;
}

template <NativeBinary T> constexpr bool isQuietNaN(T Value) {
  return classify(Value).Kind == NumberKind::QuietNaN;
}

template <NativeBinary T> constexpr bool isInfinite(T Value) {
  return classify(Value).Kind == NumberKind::Infinity;
}

template <NativeBinary T> constexpr bool isZero(T Value) {
  return classify(Value).Kind == NumberKind::Zero;
}

template <NativeBinary T> constexpr bool isSubnormal(T Value) {
  return classify(Value).Kind == NumberKind::Subnormal;
}

template <NativeBinary T> constexpr bool isNormal(T Value) {
  return classify(Value).Kind == NumberKind::Normal;
}

// Zero, subnormal or normal.
template <NativeBinary T> constexpr bool isFinite(T Value) {
  NumberKind K = classify(Value).Kind;
  return K == NumberKind::Zero || K == NumberKind::Subnormal ||
         K == NumberKind::Normal;
}

// Binary formats have exactly one encoding per value.
template <NativeBinary T> constexpr bool isCanonical(T) { return true; }

template <NativeBinary T> constexpr int radix(T) { return 2; }

} // namespace bitexact

#endif // BITEXACT_OPERATIONS_CLASSIFY_HPP
