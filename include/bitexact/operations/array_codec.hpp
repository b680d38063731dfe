#ifndef BITEXACT_OPERATIONS_ARRAY_CODEC_HPP
#define BITEXACT_OPERATIONS_ARRAY_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "bitexact/operations/codec.hpp"

namespace bitexact {

// Concatenated interchange encodings of Values, element 0 first.
template <NativeBinary T>
std::vector<std::uint8_t> encodeArray(std::span<const T> Values,
                                      Endianness E = Endianness::Little) {
  constexpr std::size_t Width = BinaryFloat<T>::byte_size;
  std::vector<std::uint8_t> Bytes(Values.size() * Width);
  for (std::size_t I = 0; I < Values.size(); ++I)
    detail::encodeTo(Values[I], Bytes.data() + I * Width, E);
  return Bytes;
}

// Inverse of encodeArray. nullopt when the byte count is not a multiple
// of the element width; an empty buffer decodes to an empty vector.
template <NativeBinary T>
std::optional<std::vector<T>>
decodeArray(std::span<const std::uint8_t> Bytes,
            Endianness E = Endianness::Little) {
  constexpr std::size_t Width = BinaryFloat<T>::byte_size;
  if (Bytes.size() % Width != 0)
    return std::nullopt;
  std::vector<T> Values;
  Values.reserve(Bytes.size() / Width);
  for (std::size_t Offset = 0; Offset < Bytes.size(); Offset += Width)
    Values.push_back(detail::decodeFrom<T>(Bytes.data() + Offset, E));
  return Values;
}

} // namespace bitexact

#endif // BITEXACT_OPERATIONS_ARRAY_CODEC_HPP
