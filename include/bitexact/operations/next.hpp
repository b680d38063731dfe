#ifndef BITEXACT_OPERATIONS_NEXT_HPP
#define BITEXACT_OPERATIONS_NEXT_HPP

// nextUp / nextDown (IEEE 754-2019 §5.3.1) and nextAfter.
//
// Within one sign the magnitude bits count up monotonically through
// zero, subnormals, normals and infinity, so a step is +/-1 on the bit
// pattern away from or toward zero. Zeros of either sign step to the
// smallest subnormal of the target direction.

#include "bitexact/core/float.hpp"
#include "bitexact/operations/classify.hpp"
#include "bitexact/operations/payload.hpp"

namespace bitexact {

// Least value that compares greater than Value. nextUp(+inf) = +inf,
// nextUp(-inf) = -max finite, NaN gives a quiet NaN.
template <NativeBinary T> constexpr T nextUp(T Value) {
  using M = typename BinaryFloat<T>::masks;
  using S = storage_t<T>;
  switch (classify(Value).Kind) {
  case NumberKind::SignalingNaN:
  case NumberKind::QuietNaN:
    return quietNaN(Value);
  case NumberKind::Zero:
    return fromBits<T>(S{1});
  case NumberKind::Infinity:
    if (!isSignMinus(Value))
      return Value;
    break;
  default:
    break;
  }
  S Bits = toBits(Value);
  if ((Bits & M::sign) != 0)
    return fromBits<T>(static_cast<S>(Bits - 1));
  return fromBits<T>(static_cast<S>(Bits + 1));
}

// Greatest value that compares less than Value.
template <NativeBinary T> constexpr T nextDown(T Value) {
  using M = typename BinaryFloat<T>::masks;
  using S = storage_t<T>;
  switch (classify(Value).Kind) {
  case NumberKind::SignalingNaN:
  case NumberKind::QuietNaN:
    return quietNaN(Value);
  case NumberKind::Zero:
    return fromBits<T>(static_cast<S>(M::sign | S{1}));
  case NumberKind::Infinity:
    if (isSignMinus(Value))
      return Value;
    break;
  default:
    break;
  }
  S Bits = toBits(Value);
  if ((Bits & M::sign) != 0)
    return fromBits<T>(static_cast<S>(Bits + 1));
  return fromBits<T>(static_cast<S>(Bits - 1));
}

// One step from Value toward Target. Equal operands return Target, so
// nextAfter(-0, +0) is +0.
template <NativeBinary T> constexpr T nextAfter(T Value, T Target) {
  if (isNaN(Value))
    return quietNaN(Value);
  if (isNaN(Target))
    return quietNaN(Target);
  if (Value == Target)
    return Target;
  return Value < Target ? nextUp(Value) : nextDown(Value);
}

} // namespace bitexact

#endif // BITEXACT_OPERATIONS_NEXT_HPP
