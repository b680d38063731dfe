#ifndef BITEXACT_CORE_FORMAT_HPP
#define BITEXACT_CORE_FORMAT_HPP

#include <concepts>

#include "bitexact/core/bits.hpp"

namespace bitexact {

// Bit geometry
//
// Describes the physical layout of bits in the storage word.
// Says nothing about meaning; Interchange adds that.
template <int SignBits, int SignOffset, int ExpBits, int ExpOffset,
          int MantBits, int MantOffset, int TotalBits>
struct Format {
  static constexpr int sign_bits = SignBits;
  static constexpr int sign_offset = SignOffset;
  static constexpr int exp_bits = ExpBits;
  static constexpr int exp_offset = ExpOffset;
  static constexpr int mant_bits = MantBits;
  static constexpr int mant_offset = MantOffset;
  static constexpr int total_bits = TotalBits;

  static constexpr int padding_bits =
      TotalBits - SignBits - ExpBits - MantBits;

  static constexpr bool is_standard_layout() {
    return SignBits == 1 && SignOffset == ExpOffset + ExpBits &&
           ExpOffset == MantOffset + MantBits && MantOffset == 0 &&
           TotalBits == SignBits + ExpBits + MantBits;
  }

  // Compile-time validation
  static_assert(SignBits >= 0 && SignBits <= 1, "sign field is 0 or 1 bit");
  static_assert(ExpBits >= 1, "exponent field must be at least 1 bit");
  static_assert(MantBits >= 1, "mantissa field must be at least 1 bit");
  static_assert(TotalBits >= SignBits + ExpBits + MantBits,
                "total bits must accommodate all fields");
  static_assert(SignOffset >= 0 && ExpOffset >= 0 && MantOffset >= 0,
                "field offsets must be non-negative");
  static_assert(SignBits == 0 || SignOffset + SignBits <= TotalBits,
                "sign field must fit in storage word");
  static_assert(ExpOffset + ExpBits <= TotalBits,
                "exponent field must fit in storage word");
  static_assert(MantOffset + MantBits <= TotalBits,
                "mantissa field must fit in storage word");
};

// Standard IEEE 754 field ordering: [S][E][M]
template <int ExpBits, int MantBits>
using IEEE_Layout =
    Format<1,                      // SignBits
           ExpBits + MantBits,     // SignOffset (MSB)
           ExpBits,                // ExpBits
           MantBits,               // ExpOffset
           MantBits,               // MantBits
           0,                      // MantOffset (LSB)
           1 + ExpBits + MantBits  // TotalBits
           >;

namespace detail {

// floor(N * log10(2)) for the small N we need, without <cmath> in a
// constant expression. 30103 / 100000 is exact enough below N = 10000.
constexpr int floorLog10Pow2(int N) { return (N * 30103) / 100000; }

constexpr int ceilLog10Pow2(int N) {
  return (N * 30103 + 99999) / 100000;
}

} // namespace detail

// IEEE 754-2019 binary interchange format (§3.6): the layout plus the
// encoding parameters the standard derives from the field widths.
template <int ExpBits, int MantBits>
struct Interchange : IEEE_Layout<ExpBits, MantBits> {
  using layout = IEEE_Layout<ExpBits, MantBits>;
  using format = Interchange;
  using storage_type = bits_t<1 + ExpBits + MantBits>;
  using masks = FieldMasks<storage_type, layout>;

  static constexpr int byte_size = (1 + ExpBits + MantBits) / 8;

  static constexpr int exponent_bias = (1 << (ExpBits - 1)) - 1;
  static constexpr int max_biased_exponent = (1 << ExpBits) - 1;

  static constexpr int precision = MantBits + 1; // p, implicit bit included
  static constexpr int emax = exponent_bias;
  static constexpr int emin = 1 - emax;

  // epsilon = 2^epsilon_exponent
  static constexpr int epsilon_exponent = -MantBits;

  // Decimal digits that survive decimal -> binary -> decimal.
  static constexpr int decimal_precision =
      detail::floorLog10Pow2(precision - 1);
  // Decimal digits needed so binary -> decimal -> binary is exact.
  static constexpr int max_decimal_digits =
      1 + detail::ceilLog10Pow2(precision);

  static_assert((1 + ExpBits + MantBits) % 8 == 0,
                "interchange formats occupy whole bytes");
};

// ValidInterchange: the IEEE 754 relations between the constants hold.
template <typename F>
concept ValidInterchange =
    requires {
      { F::total_bits } -> std::convertible_to<int>;
      { F::exp_bits } -> std::convertible_to<int>;
      { F::mant_bits } -> std::convertible_to<int>;
      { F::exponent_bias } -> std::convertible_to<int>;
      { F::byte_size } -> std::convertible_to<int>;
      typename F::storage_type;
    } &&
    F::is_standard_layout() && (F::byte_size * 8 == F::total_bits) &&
    (F::emin == 1 - F::emax) && (F::emax == F::exponent_bias) &&
    (F::precision == F::mant_bits + 1) &&
    (int(sizeof(typename F::storage_type)) * 8 >= F::total_bits);

using binary16 = Interchange<5, 10>;
using binary32 = Interchange<8, 23>;
using binary64 = Interchange<11, 52>;
using binary128 = Interchange<15, 112>;

static_assert(ValidInterchange<binary16>);
static_assert(ValidInterchange<binary32>);
static_assert(ValidInterchange<binary64>);
static_assert(ValidInterchange<binary128>);

} // namespace bitexact

#endif // BITEXACT_CORE_FORMAT_HPP
