#ifndef BITEXACT_CORE_BITS_HPP
#define BITEXACT_CORE_BITS_HPP

// bits_t<N>: a fixed-width bit container parameterized on width.
//
// Not an integer semantically, a bag of bits. Supports shift, mask,
// OR, AND, comparison. The underlying type is _BitInt(N) on Clang,
// with a fallback to standard types / __int128 on GCC.
//
// FieldMasks<Storage, Fmt> derives the sign/exponent/significand masks
// of a format in a chosen storage type.

#include <cstdint>

namespace bitexact {

#if defined(__clang__)

template <int N>
using bits_t = unsigned _BitInt(N);

#elif defined(__SIZEOF_INT128__)

// GCC C++ mode: no _BitInt. Map to the smallest standard unsigned
// type that fits N bits. Limited to N <= 128.
namespace detail {

template <int N>
struct BitsStorage {
  static_assert(N > 0 && N <= 128,
                "GCC fallback limited to 128 bits; use Clang for wider types");
};

template <int N>
  requires(N > 0 && N <= 8)
struct BitsStorage<N> {
  using type = uint8_t;
};

template <int N>
  requires(N > 8 && N <= 16)
struct BitsStorage<N> {
  using type = uint16_t;
};

template <int N>
  requires(N > 16 && N <= 32)
struct BitsStorage<N> {
  using type = uint32_t;
};

template <int N>
  requires(N > 32 && N <= 64)
struct BitsStorage<N> {
  using type = uint64_t;
};

template <int N>
  requires(N > 64 && N <= 128)
struct BitsStorage<N> {
  using type = unsigned __int128;
};

} // namespace detail

template <int N>
using bits_t = typename detail::BitsStorage<N>::type;

#else
#error "Requires Clang (_BitInt) or GCC (__int128)"
#endif

// Low Width bits set. Width may equal the storage width.
template <typename Storage>
constexpr Storage lowMask(int Width) {
  if (Width <= 0)
    return Storage{0};
  if (Width >= int(sizeof(Storage) * 8))
    return static_cast<Storage>(~Storage{0});
  return static_cast<Storage>((Storage{1} << Width) - 1);
}

template <typename Storage>
constexpr Storage extractField(Storage Bits, int Offset, int Width) {
  return static_cast<Storage>((Bits >> Offset) & lowMask<Storage>(Width));
}

template <typename Storage, typename Fmt>
struct FieldMasks {
  static_assert(int(sizeof(Storage) * 8) >= Fmt::total_bits,
                "storage type narrower than the format");

  static constexpr Storage sign = static_cast<Storage>(
      lowMask<Storage>(Fmt::sign_bits) << Fmt::sign_offset);
  static constexpr Storage exponent = static_cast<Storage>(
      lowMask<Storage>(Fmt::exp_bits) << Fmt::exp_offset);
  static constexpr Storage significand = static_cast<Storage>(
      lowMask<Storage>(Fmt::mant_bits) << Fmt::mant_offset);

  // Most significant stored significand bit: set for quiet NaNs.
  static constexpr Storage quiet =
      static_cast<Storage>(Storage{1} << (Fmt::mant_offset + Fmt::mant_bits - 1));
  // Significand bits below the quiet bit.
  static constexpr Storage payload = static_cast<Storage>(
      lowMask<Storage>(Fmt::mant_bits - 1) << Fmt::mant_offset);

  static constexpr Storage magnitude =
      static_cast<Storage>(exponent | significand);
  static constexpr Storage all = static_cast<Storage>(sign | magnitude);
};

} // namespace bitexact

#endif // BITEXACT_CORE_BITS_HPP
