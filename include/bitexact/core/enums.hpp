#ifndef BITEXACT_CORE_ENUMS_HPP
#define BITEXACT_CORE_ENUMS_HPP

#include <cstdint>

namespace bitexact {

enum class Endianness { Little, Big };

enum class Sign { Plus, Minus };

enum class NumberKind {
  SignalingNaN,
  QuietNaN,
  Infinity,
  Normal,
  Subnormal,
  Zero
};

// IEEE 754-2019 §5.7.2 class(x): exactly one holds for every bit pattern.
enum class IeeeClass {
  SignalingNaN,
  QuietNaN,
  NegativeInfinity,
  NegativeNormal,
  NegativeSubnormal,
  NegativeZero,
  PositiveZero,
  PositiveSubnormal,
  PositiveNormal,
  PositiveInfinity
};

enum class NanKind { Quiet, Signaling };

// Rounding-direction attributes the floating-point environment can hold
// (IEEE 754-2019 §4.3). roundTiesToAway is only available to
// roundToIntegral, see rounding.hpp.
enum class RoundingMode : std::uint8_t {
  ToNearestTiesToEven = 0,
  TowardNegative = 1,
  TowardPositive = 2,
  TowardZero = 3
};

enum class ExceptionFlag : std::uint8_t {
  Invalid = 0,
  DivisionByZero = 1,
  Overflow = 2,
  Underflow = 3,
  Inexact = 4
};

inline constexpr int NumExceptionFlags = 5;

inline constexpr ExceptionFlag AllExceptionFlags[NumExceptionFlags] = {
    ExceptionFlag::Invalid, ExceptionFlag::DivisionByZero,
    ExceptionFlag::Overflow, ExceptionFlag::Underflow,
    ExceptionFlag::Inexact};

} // namespace bitexact

#endif // BITEXACT_CORE_ENUMS_HPP
