#ifndef BITEXACT_CORE_ROUNDING_HPP
#define BITEXACT_CORE_ROUNDING_HPP

#include <cfenv>
#include <concepts>
#include <system_error>
#include <variant>

#include "bitexact/core/enums.hpp"

namespace bitexact {

template <typename R>
concept RoundingPolicy = requires {
  { R::name } -> std::convertible_to<const char *>;
  { R::has_environment_mode } -> std::convertible_to<bool>;
};

namespace rounding {

// Round toward zero (truncation).
struct TowardZero {
  static constexpr const char *name = "towardZero";
  static constexpr bool has_environment_mode = true;
  static constexpr RoundingMode environment_mode = RoundingMode::TowardZero;
};

// Round to nearest, ties to even. IEEE 754 default.
struct ToNearestTiesToEven {
  static constexpr const char *name = "roundTiesToEven";
  static constexpr bool has_environment_mode = true;
  static constexpr RoundingMode environment_mode =
      RoundingMode::ToNearestTiesToEven;
};

// Round to nearest, ties away from zero. Only roundToIntegral offers it;
// the floating-point environment cannot hold this attribute.
struct ToNearestTiesAway {
  static constexpr const char *name = "roundTiesToAway";
  static constexpr bool has_environment_mode = false;
};

// Round toward positive infinity (ceiling).
struct TowardPositive {
  static constexpr const char *name = "towardPositive";
  static constexpr bool has_environment_mode = true;
  static constexpr RoundingMode environment_mode = RoundingMode::TowardPositive;
};

// Round toward negative infinity (floor).
struct TowardNegative {
  static constexpr const char *name = "towardNegative";
  static constexpr bool has_environment_mode = true;
  static constexpr RoundingMode environment_mode = RoundingMode::TowardNegative;
};

using Default = ToNearestTiesToEven;

static_assert(RoundingPolicy<TowardZero>);
static_assert(RoundingPolicy<ToNearestTiesToEven>);
static_assert(RoundingPolicy<ToNearestTiesAway>);
static_assert(RoundingPolicy<TowardPositive>);
static_assert(RoundingPolicy<TowardNegative>);

} // namespace rounding

// Runtime choice of rounding direction for roundToIntegral.
using RoundingDirection =
    std::variant<rounding::ToNearestTiesToEven, rounding::ToNearestTiesAway,
                 rounding::TowardPositive, rounding::TowardNegative,
                 rounding::TowardZero>;

inline RoundingDirection toDirection(RoundingMode Mode) {
  switch (Mode) {
  case RoundingMode::ToNearestTiesToEven: return rounding::ToNearestTiesToEven{};
  case RoundingMode::TowardNegative:      return rounding::TowardNegative{};
  case RoundingMode::TowardPositive:      return rounding::TowardPositive{};
  case RoundingMode::TowardZero:          return rounding::TowardZero{};
  }
  return rounding::ToNearestTiesToEven{};
}

inline const char *roundingModeName(RoundingMode Mode) {
  switch (Mode) {
  case RoundingMode::ToNearestTiesToEven: return rounding::ToNearestTiesToEven::name;
  case RoundingMode::TowardNegative:      return rounding::TowardNegative::name;
  case RoundingMode::TowardPositive:      return rounding::TowardPositive::name;
  case RoundingMode::TowardZero:          return rounding::TowardZero::name;
  }
  return "???";
}

// ===================================================================
// Floating-point environment: rounding-direction attribute
// ===================================================================
// Thin pass-through to <cfenv>. The attribute is per thread.

namespace detail {

inline int toFeRound(RoundingMode Mode) {
  switch (Mode) {
  case RoundingMode::ToNearestTiesToEven: return FE_TONEAREST;
  case RoundingMode::TowardNegative:      return FE_DOWNWARD;
  case RoundingMode::TowardPositive:      return FE_UPWARD;
  case RoundingMode::TowardZero:          return FE_TOWARDZERO;
  }
  return FE_TONEAREST;
}

inline RoundingMode fromFeRound(int FeMode) {
  switch (FeMode) {
  case FE_DOWNWARD:   return RoundingMode::TowardNegative;
  case FE_UPWARD:     return RoundingMode::TowardPositive;
  case FE_TOWARDZERO: return RoundingMode::TowardZero;
  default:            return RoundingMode::ToNearestTiesToEven;
  }
}

} // namespace detail

// Returns a non-zero error_code when the platform rejects the mode.
[[nodiscard]] inline std::error_code setRoundingMode(RoundingMode Mode) {
  if (std::fesetround(detail::toFeRound(Mode)) != 0)
    return std::make_error_code(std::errc::not_supported);
  return {};
}

inline RoundingMode roundingMode() {
  return detail::fromFeRound(std::fegetround());
}

// Sets a rounding mode for the lifetime of the object and restores the
// previous one on destruction.
class ScopedRoundingMode {
public:
  explicit ScopedRoundingMode(RoundingMode Mode) : Saved(roundingMode()) {
    Status = setRoundingMode(Mode);
  }

  ~ScopedRoundingMode() {
    if (!Status)
      (void)setRoundingMode(Saved);
  }

  ScopedRoundingMode(const ScopedRoundingMode &) = delete;
  ScopedRoundingMode &operator=(const ScopedRoundingMode &) = delete;

  // Result of the initial mode change.
  std::error_code status() const { return Status; }

private:
  RoundingMode Saved;
  std::error_code Status;
};

} // namespace bitexact

#endif // BITEXACT_CORE_ROUNDING_HPP
