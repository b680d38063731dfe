#ifndef BITEXACT_OPERATIONS_SCALING_HPP
#define BITEXACT_OPERATIONS_SCALING_HPP

// scaleB and logB (IEEE 754-2019 §5.3.3) plus the exponent/significand
// split. For finite non-zero x:
//
//   abs(x) == significand(x) * 2^logB(x),   1 <= significand(x) < 2
//
// which also holds for subnormals, whose logB is below emin.

#include <climits>
#include <cmath>

#include "bitexact/core/float.hpp"
#include "bitexact/operations/classify.hpp"
#include "bitexact/operations/sign.hpp"

namespace bitexact {

// Value * 2^N, rounded once under the current rounding mode. NaN, +/-inf
// and +/-0 are returned unchanged.
template <NativeBinary T> T scaleB(T Value, int N) {
  switch (classify(Value).Kind) {
  case NumberKind::Normal:
  case NumberKind::Subnormal:
    return std::scalbn(Value, N);
  default:
    return Value;
  }
}

// Unbiased exponent; INT_MAX for NaN and infinities, INT_MIN for zeros.
template <NativeBinary T> int logB(T Value) {
  switch (classify(Value).Kind) {
  case NumberKind::SignalingNaN:
  case NumberKind::QuietNaN:
  case NumberKind::Infinity:
    return INT_MAX;
  case NumberKind::Zero:
    return INT_MIN;
  case NumberKind::Normal:
  case NumberKind::Subnormal:
    break;
  }
  return std::ilogb(Value);
}

// logB as a floating value: NaN for NaN, +inf for infinities, -inf for
// zeros.
template <NativeBinary T> T exponent(T Value) {
  switch (classify(Value).Kind) {
  case NumberKind::SignalingNaN:
  case NumberKind::QuietNaN:
    return Value;
  case NumberKind::Infinity:
    return SpecialValues<T>::positiveInfinity();
  case NumberKind::Zero:
    return SpecialValues<T>::negativeInfinity();
  case NumberKind::Normal:
  case NumberKind::Subnormal:
    break;
  }
  return static_cast<T>(std::ilogb(Value));
}

// abs(Value) scaled into [1, 2). Zeros give +0, infinities +inf, NaN is
// returned as is.
template <NativeBinary T> T significand(T Value) {
  switch (classify(Value).Kind) {
  case NumberKind::SignalingNaN:
  case NumberKind::QuietNaN:
    return Value;
  case NumberKind::Infinity:
  case NumberKind::Zero:
    return bitexact::abs(Value);
  case NumberKind::Normal:
  case NumberKind::Subnormal:
    break;
  }
  return std::ldexp(bitexact::abs(Value), -std::ilogb(Value));
}

} // namespace bitexact

#endif // BITEXACT_OPERATIONS_SCALING_HPP
