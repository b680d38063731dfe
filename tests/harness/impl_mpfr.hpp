#ifndef BITEXACT_TESTS_HARNESS_IMPL_MPFR_HPP
#define BITEXACT_TESTS_HARNESS_IMPL_MPFR_HPP

// MPFR adapter: one implementation among equals.
//
// Provides MpfrAdapter<FloatType> satisfying the adapter interface:
//   dispatch(Op, BitsType, BitsType)  -> TestOutput<BitsType>
//   dispatchUnary(Op, BitsType)       -> TestOutput<BitsType>
//
// Internally contains:
//   MpfrFloat         : RAII wrapper around mpfr_t
//   decodeToMpfr      : bit pattern -> exact MPFR value (any interchange
//                       format, binary16 through binary128)
//   mpfrRoundToFormat : round MPFR value back to format bits
//
// These are internals of the MPFR adapter, not a privileged oracle API.
// MPFR NaNs carry a sign but no payload.

#include <climits>
#include <cstdint>
#include <cstring>
#include <utility>

#include <gmp.h>
#include <mpfr.h>

#include "harness/ops.hpp"
#include "bitexact/core/bits.hpp"

namespace bitexact::testing {

// Working precision for exact computation. 256 bits is far more than
// enough for any format up to binary128.
inline constexpr mpfr_prec_t ExactPrecision = 256;

// ===================================================================
// MpfrFloat: RAII wrapper around mpfr_t
// ===================================================================

class MpfrFloat {
public:
  explicit MpfrFloat(mpfr_prec_t Prec = ExactPrecision) {
    mpfr_init2(Val, Prec);
  }

  ~MpfrFloat() { mpfr_clear(Val); }

  MpfrFloat(const MpfrFloat &) = delete;
  MpfrFloat &operator=(const MpfrFloat &) = delete;

  MpfrFloat(MpfrFloat &&Other) noexcept {
    Val[0] = Other.Val[0];
    mpfr_init2(Other.Val, 2);
    mpfr_set_nan(Other.Val);
  }

  MpfrFloat &operator=(MpfrFloat &&Other) noexcept {
    if (this != &Other) {
      mpfr_clear(Val);
      Val[0] = Other.Val[0];
      mpfr_init2(Other.Val, 2);
      mpfr_set_nan(Other.Val);
    }
    return *this;
  }

  mpfr_ptr get() { return Val; }
  mpfr_srcptr get() const { return Val; }
  operator mpfr_ptr() { return Val; }
  operator mpfr_srcptr() const { return Val; }

  bool isNan() const { return mpfr_nan_p(Val) != 0; }
  bool isInf() const { return mpfr_inf_p(Val) != 0; }
  bool isZero() const { return mpfr_zero_p(Val) != 0; }
  int sign() const { return mpfr_sgn(Val); }
  bool isNegative() const { return mpfr_signbit(Val) != 0; }

private:
  mpfr_t Val;
};

// ===================================================================
// Width-agnostic BitsType <-> mpz_t conversion
// ===================================================================

namespace detail {

template <typename BitsType> void bitsToMpz(mpz_t Z, BitsType Val) {
  constexpr int NumBytes = sizeof(BitsType);
  unsigned char Bytes[NumBytes];
  for (int I = 0; I < NumBytes; ++I) {
    Bytes[I] = static_cast<unsigned char>(Val & BitsType{0xFF});
    Val >>= 8;
  }
  mpz_import(Z, NumBytes, -1, 1, 0, 0, Bytes);
}

template <typename BitsType> BitsType mpzToBits(const mpz_t Z) {
  constexpr int NumBytes = sizeof(BitsType);
  unsigned char Bytes[NumBytes] = {};
  mpz_export(Bytes, nullptr, -1, 1, 0, 0, Z);
  BitsType Val = 0;
  for (int I = NumBytes - 1; I >= 0; --I)
    Val = (Val << 8) | BitsType(Bytes[I]);
  return Val;
}

} // namespace detail

// ===================================================================
// decodeToMpfr: Convert a bit pattern to its exact MPFR value
// ===================================================================

template <typename FloatType>
MpfrFloat decodeToMpfr(typename FloatType::storage_type Bits) {
  using Fmt = typename FloatType::format;
  using BitsType = typename FloatType::storage_type;

  constexpr int TotalBits = Fmt::total_bits;
  if constexpr (TotalBits < int(sizeof(BitsType) * 8)) {
    constexpr BitsType WordMask = (BitsType{1} << TotalBits) - 1;
    Bits &= WordMask;
  }

  MpfrFloat Result;

  bool IsNegative =
      extractField(Bits, Fmt::sign_offset, Fmt::sign_bits) != 0;
  BitsType Exp = extractField(Bits, Fmt::exp_offset, Fmt::exp_bits);
  BitsType Mant = extractField(Bits, Fmt::mant_offset, Fmt::mant_bits);

  constexpr BitsType ExpMax = (BitsType{1} << Fmt::exp_bits) - 1;

  if (Exp == ExpMax) {
    if (Mant != 0) {
      mpfr_set_nan(Result);
      mpfr_setsign(Result, Result, IsNegative, MPFR_RNDN);
    } else {
      mpfr_set_inf(Result, IsNegative ? -1 : +1);
    }
    return Result;
  }

  if (Exp == 0 && Mant == 0) {
    mpfr_set_zero(Result, IsNegative ? -1 : +1);
    return Result;
  }

  constexpr int Bias = Fmt::exponent_bias;
  mpfr_exp_t Exponent;
  BitsType Significand;
  if (Exp == 0) {
    Exponent = 1 - Bias - Fmt::mant_bits;
    Significand = Mant;
  } else {
    Exponent = static_cast<mpfr_exp_t>(static_cast<int>(Exp)) - Bias -
               Fmt::mant_bits;
    Significand = (BitsType{1} << Fmt::mant_bits) | Mant;
  }

  mpz_t Z;
  mpz_init(Z);
  detail::bitsToMpz(Z, Significand);
  mpfr_set_z_2exp(Result, Z, Exponent, MPFR_RNDN);
  mpz_clear(Z);

  if (IsNegative) {
    mpfr_neg(Result, Result, MPFR_RNDN);
  }

  return Result;
}

// ===================================================================
// mpfrRoundToFormat: Round MPFR value to an interchange format
// ===================================================================

template <typename FloatType>
typename FloatType::storage_type mpfrRoundToFormat(const MpfrFloat &Val) {
  using Fmt = typename FloatType::format;
  using BitsType = typename FloatType::storage_type;
  constexpr int MantBits = Fmt::mant_bits;
  constexpr int ExpBits = Fmt::exp_bits;
  constexpr int Bias = Fmt::exponent_bias;
  constexpr BitsType ExpAllOnes = (BitsType{1} << ExpBits) - 1;
  constexpr BitsType MantMask = (BitsType{1} << MantBits) - 1;
  constexpr BitsType SignBit = BitsType{1} << Fmt::sign_offset;
  constexpr int MaxBiasedExp = (1 << ExpBits) - 2;
  constexpr int EminIeee = 1 - Bias;

  // --- Special values ---

  if (Val.isNan())
    return (ExpAllOnes << Fmt::exp_offset) | (BitsType{1} << (MantBits - 1));

  if (Val.isInf()) {
    BitsType InfBits = ExpAllOnes << Fmt::exp_offset;
    return Val.isNegative() ? (InfBits | SignBit) : InfBits;
  }

  if (Val.isZero())
    return Val.isNegative() ? SignBit : BitsType{0};

  // --- Finite: round by scaling to integer significand + mpfr_rint ---

  bool Negative = mpfr_signbit(Val) != 0;
  int IeeeExp = static_cast<int>(mpfr_get_exp(Val)) - 1;

  MpfrFloat Scaled;
  mpfr_abs(Scaled, Val, MPFR_RNDN);

  BitsType StoredExp;
  BitsType StoredMant;

  if (IeeeExp >= EminIeee) {
    // Normal range
    mpfr_mul_2si(Scaled, Scaled, MantBits - IeeeExp, MPFR_RNDN);
    mpfr_rint(Scaled, Scaled, MPFR_RNDN);

    mpz_t Z;
    mpz_init(Z);
    mpfr_get_z(Z, Scaled, MPFR_RNDN);
    BitsType IntSig = detail::mpzToBits<BitsType>(Z);
    mpz_clear(Z);

    if (IntSig >= (BitsType{1} << (MantBits + 1))) {
      IeeeExp++;
      IntSig >>= 1;
    }

    int BiasedExp = IeeeExp + Bias;
    if (BiasedExp > MaxBiasedExp) {
      BitsType InfBits = ExpAllOnes << Fmt::exp_offset;
      return Negative ? (InfBits | SignBit) : InfBits;
    }

    StoredExp = static_cast<BitsType>(BiasedExp);
    StoredMant = IntSig & MantMask;
  } else {
    // Subnormal range
    mpfr_mul_2si(Scaled, Scaled, Bias - 1 + MantBits, MPFR_RNDN);
    mpfr_rint(Scaled, Scaled, MPFR_RNDN);

    mpz_t Z;
    mpz_init(Z);
    mpfr_get_z(Z, Scaled, MPFR_RNDN);
    BitsType Mant = detail::mpzToBits<BitsType>(Z);
    mpz_clear(Z);

    if (Mant >= (BitsType{1} << MantBits)) {
      StoredExp = 1;
      StoredMant = 0;
    } else if (Mant == 0) {
      return Negative ? SignBit : BitsType{0};
    } else {
      StoredExp = 0;
      StoredMant = Mant;
    }
  }

  BitsType Result = 0;
  if (Negative)
    Result |= SignBit;
  Result |= StoredExp << Fmt::exp_offset;
  Result |= StoredMant << Fmt::mant_offset;
  return Result;
}

// ===================================================================
// Exact unary operations
// ===================================================================

// Integral rounding in the direction of the op. mpfr_rint keeps the sign
// of a zero result.
inline MpfrFloat mpfrRoundIntegral(Op Operation, const MpfrFloat &A) {
  MpfrFloat Result;
  switch (Operation) {
  case Op::RoundEven: mpfr_rint(Result, A, MPFR_RNDN); break;
  case Op::RoundAway: mpfr_round(Result, A); break;
  case Op::Floor:     mpfr_floor(Result, A); break;
  case Op::Ceil:      mpfr_ceil(Result, A); break;
  case Op::Trunc:     mpfr_trunc(Result, A); break;
  default: mpfr_set(Result, A, MPFR_RNDN); break;
  }
  return Result;
}

// Unbiased exponent of A; INT_MAX for NaN and infinities, INT_MIN for
// zeros. MPFR normalizes to [0.5, 1), IEEE to [1, 2).
inline int mpfrLogB(const MpfrFloat &A) {
  if (A.isNan() || A.isInf())
    return INT_MAX;
  if (A.isZero())
    return INT_MIN;
  return static_cast<int>(mpfr_get_exp(A)) - 1;
}

// ===================================================================
// MpfrAdapter: the adapter struct
// ===================================================================

template <typename FloatType> struct MpfrAdapter {
  using BitsType = typename FloatType::storage_type;

  static constexpr const char *name() { return "MPFR"; }

  TestOutput<BitsType> dispatch(Op O, BitsType A, BitsType B) const {
    MpfrFloat Ma = decodeToMpfr<FloatType>(A);
    MpfrFloat Mb = decodeToMpfr<FloatType>(B);

    // Comparison ops: direct comparison, no rounding
    switch (O) {
    case Op::Eq: return {BitsType(mpfr_equal_p(Ma, Mb) ? 1 : 0), 0};
    case Op::Lt: return {BitsType(mpfr_less_p(Ma, Mb) ? 1 : 0), 0};
    case Op::Le: return {BitsType(mpfr_lessequal_p(Ma, Mb) ? 1 : 0), 0};
    case Op::TotalOrder:
      return {BitsType(mpfr_total_order_p(Ma, Mb) ? 1 : 0), 0};
    default: return {0, 0};
    }
  }

  TestOutput<BitsType> dispatchUnary(Op O, BitsType A) const {
    using Fmt = typename FloatType::format;
    // Neg and Abs are non-computational sign-bit operations: they must
    // not decode/reencode, which would drop NaN payloads.
    constexpr BitsType SignBit = BitsType{1} << Fmt::sign_offset;
    switch (O) {
    case Op::Neg: return {BitsType(A ^ SignBit), 0};
    case Op::Abs: return {BitsType(A & ~SignBit), 0};
    default: break;
    }
    MpfrFloat Ma = decodeToMpfr<FloatType>(A);
    switch (O) {
    case Op::RoundEven:
    case Op::RoundAway:
    case Op::Floor:
    case Op::Ceil:
    case Op::Trunc: {
      MpfrFloat R = mpfrRoundIntegral(O, Ma);
      return {mpfrRoundToFormat<FloatType>(R), 0};
    }
    case Op::LogB:
      return {BitsType(static_cast<uint32_t>(mpfrLogB(Ma))), 0};
    default: return {0, 0};
    }
  }
};

} // namespace bitexact::testing

#endif // BITEXACT_TESTS_HARNESS_IMPL_MPFR_HPP
