#ifndef BITEXACT_HPP
#define BITEXACT_HPP

#include "bitexact/core/bits.hpp"
#include "bitexact/core/enums.hpp"
#include "bitexact/core/exceptions.hpp"
#include "bitexact/core/float.hpp"
#include "bitexact/core/format.hpp"
#include "bitexact/core/rounding.hpp"
#include "bitexact/operations/array_codec.hpp"
#include "bitexact/operations/classify.hpp"
#include "bitexact/operations/codec.hpp"
#include "bitexact/operations/compare.hpp"
#include "bitexact/operations/conversions.hpp"
#include "bitexact/operations/minmax.hpp"
#include "bitexact/operations/next.hpp"
#include "bitexact/operations/payload.hpp"
#include "bitexact/operations/round_integral.hpp"
#include "bitexact/operations/scaling.hpp"
#include "bitexact/operations/sign.hpp"

#endif // BITEXACT_HPP
