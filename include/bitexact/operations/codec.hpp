#ifndef BITEXACT_OPERATIONS_CODEC_HPP
#define BITEXACT_OPERATIONS_CODEC_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "bitexact/core/enums.hpp"
#include "bitexact/core/float.hpp"
#include "bitexact/core/format.hpp"

namespace bitexact {

namespace detail {

// Write the ByteSize low bytes of Bits to Out. Byte I of the value
// (counting from the least significant) lands at Out[I] for Little and at
// Out[ByteSize - 1 - I] for Big.
template <typename Storage, int ByteSize>
constexpr void storeBytes(Storage Bits, std::uint8_t *Out, Endianness E) {
  for (int I = 0; I < ByteSize; ++I) {
    auto Byte = static_cast<std::uint8_t>((Bits >> (I * 8)) & Storage{0xFF});
    Out[E == Endianness::Little ? I : ByteSize - 1 - I] = Byte;
  }
}

template <typename Storage, int ByteSize>
constexpr Storage loadBytes(const std::uint8_t *In, Endianness E) {
  Storage Bits{0};
  for (int I = 0; I < ByteSize; ++I) {
    Storage Byte =
        static_cast<Storage>(In[E == Endianness::Little ? I : ByteSize - 1 - I]);
    Bits = static_cast<Storage>(Bits | static_cast<Storage>(Byte << (I * 8)));
  }
  return Bits;
}

template <NativeBinary T>
constexpr void encodeTo(T Value, std::uint8_t *Out, Endianness E) {
  using Bf = BinaryFloat<T>;
  storeBytes<typename Bf::storage_type, Bf::byte_size>(Bf::toBits(Value), Out,
                                                        E);
}

template <NativeBinary T>
constexpr T decodeFrom(const std::uint8_t *In, Endianness E) {
  using Bf = BinaryFloat<T>;
  return Bf::fromBits(
      loadBytes<typename Bf::storage_type, Bf::byte_size>(In, E));
}

} // namespace detail

// Encode a native value into its interchange bytes.
//
// Every bit of the value, sign, NaN payload and signaling bit included,
// is carried over. Never fails.
template <NativeBinary T>
constexpr std::array<std::uint8_t, BinaryFloat<T>::byte_size>
encode(T Value, Endianness E = Endianness::Little) {
  std::array<std::uint8_t, BinaryFloat<T>::byte_size> Bytes{};
  detail::encodeTo(Value, Bytes.data(), E);
  return Bytes;
}

// Decode interchange bytes into a native value.
//
// Returns nullopt if and only if Bytes.size() differs from the format's
// byte width. Any bit pattern of the right width is accepted as is.
template <NativeBinary T>
constexpr std::optional<T> decode(std::span<const std::uint8_t> Bytes,
                                  Endianness E = Endianness::Little) {
  if (Bytes.size() != std::size_t(BinaryFloat<T>::byte_size))
    return std::nullopt;
  return detail::decodeFrom<T>(Bytes.data(), E);
}

// Raw-bit codec for any interchange format, including the ones without a
// native type (binary16, binary128).
template <ValidInterchange Fmt>
constexpr std::array<std::uint8_t, Fmt::byte_size>
encodeBits(typename Fmt::storage_type Bits, Endianness E = Endianness::Little) {
  std::array<std::uint8_t, Fmt::byte_size> Bytes{};
  detail::storeBytes<typename Fmt::storage_type, Fmt::byte_size>(
      Bits, Bytes.data(), E);
  return Bytes;
}

template <ValidInterchange Fmt>
constexpr std::optional<typename Fmt::storage_type>
decodeBits(std::span<const std::uint8_t> Bytes,
           Endianness E = Endianness::Little) {
  if (Bytes.size() != std::size_t(Fmt::byte_size))
    return std::nullopt;
  return detail::loadBytes<typename Fmt::storage_type, Fmt::byte_size>(
      Bytes.data(), E);
}

} // namespace bitexact

#endif // BITEXACT_OPERATIONS_CODEC_HPP
