#ifndef BITEXACT_OPERATIONS_PAYLOAD_HPP
#define BITEXACT_OPERATIONS_PAYLOAD_HPP

// NaN payloads (IEEE 754-2019 §6.2).
//
// A NaN's fraction field is [quiet bit][payload], the quiet bit being the
// most significant fraction bit (1 = quiet, 0 = signaling):
//
//   binary32   quiet 0x0040'0000   payload 0x003F'FFFF
//   binary64   quiet 0x0008'0000'0000'0000   payload 0x0007'FFFF'FFFF'FFFF
//
// extractPayload() reports the whole fraction field, quiet bit included,
// for both formats. The encoders mask their argument to the payload
// bits, so feeding an extracted payload back through the encoder of the
// same kind reproduces the original NaN. The encoders always produce a
// positive NaN; use copySign() for a negative one.

#include <cstdint>
#include <optional>

#include "bitexact/core/enums.hpp"
#include "bitexact/core/float.hpp"
#include "bitexact/operations/classify.hpp"

namespace bitexact {

struct NanDescriptor {
  NanKind Kind;
  std::uint64_t Payload;

  friend constexpr bool operator==(const NanDescriptor &,
                                   const NanDescriptor &) = default;
};

template <NativeBinary T>
constexpr T encodeQuietNaN(storage_t<T> Payload = 0) {
  using M = typename BinaryFloat<T>::masks;
  return fromBits<T>(M::exponent | M::quiet | (Payload & M::payload));
}

// A signaling NaN needs a non-zero payload; a payload that masks to zero
// is replaced by 1.
template <NativeBinary T>
constexpr T encodeSignalingNaN(storage_t<T> Payload = 1) {
  using M = typename BinaryFloat<T>::masks;
  storage_t<T> Masked = Payload & M::payload;
  if (Masked == 0)
    Masked = 1;
  return fromBits<T>(M::exponent | Masked);
}

template <NativeBinary T> constexpr T encodeNaN(NanDescriptor Desc) {
  auto Payload = static_cast<storage_t<T>>(Desc.Payload);
  switch (Desc.Kind) {
  case NanKind::Quiet:     return encodeQuietNaN<T>(Payload);
  case NanKind::Signaling: return encodeSignalingNaN<T>(Payload);
  }
  return encodeQuietNaN<T>(Payload);
}

// Fraction field of a NaN (quiet bit included); nullopt for non-NaNs.
template <NativeBinary T>
constexpr std::optional<storage_t<T>> extractPayload(T Value) {
  if (!isNaN(Value))
    return std::nullopt;
  return static_cast<storage_t<T>>(toBits(Value) &
                                   BinaryFloat<T>::masks::significand);
}

template <NativeBinary T>
constexpr std::optional<NanDescriptor> decodeNaN(T Value) {
  std::optional<storage_t<T>> Payload = extractPayload(Value);
  if (!Payload)
    return std::nullopt;
  return NanDescriptor{isSignaling(Value) ? NanKind::Signaling : NanKind::Quiet,
                       static_cast<std::uint64_t>(*Payload)};
}

template <NativeBinary T> constexpr bool isSignalingNaN(T Value) {
  return isSignaling(Value);
}

// Same NaN with the quiet bit set; non-NaNs are returned unchanged.
template <NativeBinary T> constexpr T quietNaN(T Value) {
  if (!isNaN(Value))
    return Value;
  return fromBits<T>(toBits(Value) | BinaryFloat<T>::masks::quiet);
}

} // namespace bitexact

#endif // BITEXACT_OPERATIONS_PAYLOAD_HPP
