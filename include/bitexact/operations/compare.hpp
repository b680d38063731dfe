#ifndef BITEXACT_OPERATIONS_COMPARE_HPP
#define BITEXACT_OPERATIONS_COMPARE_HPP

// Comparison predicates (IEEE 754-2019 §5.6.1) and totalOrder (§5.10).
//
// The quiet predicates are the host's ordered comparisons: a NaN operand
// makes every predicate false except isNotEqual and isUnordered. The
// signaling predicates return the same answers and additionally raise
// invalid in the caller's ExceptionFlags when an operand is NaN.
//
// totalOrder ranks every bit pattern:
//
//   -qNaN < -sNaN < -inf < -finite < -0 < +0 < +finite < +inf < +sNaN < +qNaN
//
// with NaNs of the same sign and kind ordered by payload (larger payloads
// further from zero). Mapping the sign-magnitude encoding onto an unsigned
// key that sorts the same way gives it directly: flip every bit of a
// negative pattern, flip only the sign bit of a positive one.

#include "bitexact/core/exceptions.hpp"
#include "bitexact/core/float.hpp"
#include "bitexact/operations/classify.hpp"

namespace bitexact {

// ===================================================================
// Quiet predicates
// ===================================================================

template <NativeBinary T> constexpr bool isEqual(T A, T B) { return A == B; }

template <NativeBinary T> constexpr bool isNotEqual(T A, T B) {
  return A != B;
}

template <NativeBinary T> constexpr bool isLess(T A, T B) { return A < B; }

template <NativeBinary T> constexpr bool isLessEqual(T A, T B) {
  return A <= B;
}

template <NativeBinary T> constexpr bool isGreater(T A, T B) { return A > B; }

template <NativeBinary T> constexpr bool isGreaterEqual(T A, T B) {
  return A >= B;
}

template <NativeBinary T> constexpr bool isUnordered(T A, T B) {
  return isNaN(A) || isNaN(B);
}

// ===================================================================
// Signaling predicates
// ===================================================================

namespace detail {

template <NativeBinary T>
bool signalIfUnordered(T A, T B, ExceptionFlags &Flags) {
  if (!isUnordered(A, B))
    return false;
  Flags.raise(ExceptionFlag::Invalid);
  return true;
}

} // namespace detail

template <NativeBinary T>
bool signalingEqual(T A, T B, ExceptionFlags &Flags) {
  if (detail::signalIfUnordered(A, B, Flags))
    return false;
  return A == B;
}

template <NativeBinary T>
bool signalingNotEqual(T A, T B, ExceptionFlags &Flags) {
  if (detail::signalIfUnordered(A, B, Flags))
    return true;
  return A != B;
}

template <NativeBinary T>
bool signalingLess(T A, T B, ExceptionFlags &Flags) {
  if (detail::signalIfUnordered(A, B, Flags))
    return false;
  return A < B;
}

template <NativeBinary T>
bool signalingLessEqual(T A, T B, ExceptionFlags &Flags) {
  if (detail::signalIfUnordered(A, B, Flags))
    return false;
  return A <= B;
}

template <NativeBinary T>
bool signalingGreater(T A, T B, ExceptionFlags &Flags) {
  if (detail::signalIfUnordered(A, B, Flags))
    return false;
  return A > B;
}

template <NativeBinary T>
bool signalingGreaterEqual(T A, T B, ExceptionFlags &Flags) {
  if (detail::signalIfUnordered(A, B, Flags))
    return false;
  return A >= B;
}

// ===================================================================
// Total order
// ===================================================================

// Unsigned key whose natural order is the total order of the values.
template <NativeBinary T> constexpr storage_t<T> totalOrderKey(T Value) {
  using M = typename BinaryFloat<T>::masks;
  storage_t<T> Bits = toBits(Value);
  if ((Bits & M::sign) != 0)
    return static_cast<storage_t<T>>(~Bits);
  return static_cast<storage_t<T>>(Bits | M::sign);
}

// A orders below or equal to B.
template <NativeBinary T> constexpr bool totalOrder(T A, T B) {
  return totalOrderKey(A) <= totalOrderKey(B);
}

// totalOrder(abs(A), abs(B)).
template <NativeBinary T> constexpr bool totalOrderMag(T A, T B) {
  using M = typename BinaryFloat<T>::masks;
  return (toBits(A) & M::magnitude) <= (toBits(B) & M::magnitude);
}

// Strict companion of totalOrder; a strict weak ordering for std::sort.
template <NativeBinary T> constexpr bool totalOrderLess(T A, T B) {
  return totalOrderKey(A) < totalOrderKey(B);
}

struct TotalOrderLess {
  template <NativeBinary T> constexpr bool operator()(T A, T B) const {
    return totalOrderLess(A, B);
  }
};

} // namespace bitexact

#endif // BITEXACT_OPERATIONS_COMPARE_HPP
