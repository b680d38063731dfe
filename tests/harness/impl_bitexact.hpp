#ifndef BITEXACT_TESTS_HARNESS_IMPL_BITEXACT_HPP
#define BITEXACT_TESTS_HARNESS_IMPL_BITEXACT_HPP

// bitexact adapter: the library under test, as one implementation among
// equals.
//
// Provides BitexactAdapter<FloatType> satisfying the adapter interface:
//   dispatch(Op, BitsType, BitsType)  -> TestOutput<BitsType>
//   dispatchUnary(Op, BitsType)       -> TestOutput<BitsType>
//
// Specialized for BinaryFloat<float> and BinaryFloat<double>.

#include <cstdint>
#include <optional>

#include "harness/ops.hpp"
#include "bitexact/bitexact.hpp"

namespace bitexact::testing {

template <typename FloatType> struct BitexactAdapter;

template <NativeBinary T> struct BitexactAdapter<BinaryFloat<T>> {
  using BitsType = storage_t<T>;

  static constexpr const char *name() { return "bitexact"; }

  static TestOutput<BitsType> predicate(bool R, uint8_t Flags = 0) {
    return {BitsType(R ? 1 : 0), Flags};
  }

  static TestOutput<BitsType> value(T V, uint8_t Flags = 0) {
    return {toBits(V), Flags};
  }

  TestOutput<BitsType> dispatch(Op O, BitsType A, BitsType B) const {
    T Fa = fromBits<T>(A), Fb = fromBits<T>(B);
    ExceptionFlags Flags;
    switch (O) {
    case Op::Eq: return predicate(isEqual(Fa, Fb));
    case Op::Lt: return predicate(isLess(Fa, Fb));
    case Op::Le: return predicate(isLessEqual(Fa, Fb));
    case Op::SignalingEq: {
      bool R = signalingEqual(Fa, Fb, Flags);
      return predicate(R, flagByte(Flags));
    }
    case Op::SignalingLt: {
      bool R = signalingLess(Fa, Fb, Flags);
      return predicate(R, flagByte(Flags));
    }
    case Op::SignalingLe: {
      bool R = signalingLessEqual(Fa, Fb, Flags);
      return predicate(R, flagByte(Flags));
    }
    case Op::TotalOrder: return predicate(totalOrder(Fa, Fb));
    default: return {0, 0};
    }
  }

  TestOutput<BitsType> dispatchUnary(Op O, BitsType A) const {
    T Fa = fromBits<T>(A);
    switch (O) {
    case Op::Neg:         return value(negate(Fa));
    case Op::Abs:         return value(bitexact::abs(Fa));
    case Op::IsSignaling: return predicate(isSignalingNaN(Fa));
    case Op::RoundEven:   return value(roundTiesToEven(Fa));
    case Op::RoundAway:   return value(roundTiesAway(Fa));
    case Op::Floor:       return value(bitexact::floor(Fa));
    case Op::Ceil:        return value(bitexact::ceil(Fa));
    case Op::Trunc:       return value(bitexact::trunc(Fa));
    case Op::RoundEvenExact: {
      ExceptionFlags Flags;
      T R = roundToIntegralExact(Fa, RoundingDirection{rounding::Default{}},
                                 Flags);
      return value(R, flagByte(Flags));
    }
    case Op::NextUp:   return value(nextUp(Fa));
    case Op::NextDown: return value(nextDown(Fa));
    case Op::LogB:
      return {BitsType(static_cast<uint32_t>(logB(Fa))), 0};
    case Op::ToInt64: {
      std::optional<int64_t> R = toInt64(Fa);
      if (!R)
        return {0, flagBit(ExceptionFlag::Invalid)};
      return {BitsType(static_cast<uint64_t>(*R)), 0};
    }
    default: return {0, 0};
    }
  }
};

} // namespace bitexact::testing

#endif // BITEXACT_TESTS_HARNESS_IMPL_BITEXACT_HPP
