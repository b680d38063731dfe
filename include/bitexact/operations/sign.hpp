#ifndef BITEXACT_OPERATIONS_SIGN_HPP
#define BITEXACT_OPERATIONS_SIGN_HPP

// Sign bit operations (IEEE 754-2019 §5.5.1). Quiet-computational: they
// touch only the sign bit, never signal, and keep NaN payloads intact.

#include "bitexact/core/float.hpp"

namespace bitexact {

template <NativeBinary T> constexpr T negate(T Value) {
  using Bf = BinaryFloat<T>;
  return Bf::fromBits(Bf::toBits(Value) ^ Bf::masks::sign);
}

template <NativeBinary T> constexpr T abs(T Value) {
  using Bf = BinaryFloat<T>;
  return Bf::fromBits(Bf::toBits(Value) & Bf::masks::magnitude);
}

// Magnitude's exponent and significand, SignSource's sign bit.
template <NativeBinary T> constexpr T copySign(T Magnitude, T SignSource) {
  using Bf = BinaryFloat<T>;
  using M = typename Bf::masks;
  return Bf::fromBits((Bf::toBits(Magnitude) & M::magnitude) |
                      (Bf::toBits(SignSource) & M::sign));
}

} // namespace bitexact

#endif // BITEXACT_OPERATIONS_SIGN_HPP
