#ifndef BITEXACT_CORE_EXCEPTIONS_HPP
#define BITEXACT_CORE_EXCEPTIONS_HPP

// IEEE 754-2019 §7 status flags.
//
// ExceptionFlags is a software flag store: five booleans behind one
// mutex. It is an ordinary object, so each caller (or test) can own one;
// ExceptionFlags::shared() is the process-wide instance for code that
// wants a single global store. Raises, tests and clears from different
// threads are serialized, last writer wins.
//
// testFpuExceptions()/clearFpuExceptions() read and reset the hardware
// flags through <cfenv>. The two stores are independent.

#include <cfenv>
#include <mutex>
#include <vector>

#include "bitexact/core/enums.hpp"

namespace bitexact {

inline const char *flagName(ExceptionFlag Flag) {
  switch (Flag) {
  case ExceptionFlag::Invalid:        return "invalid";
  case ExceptionFlag::DivisionByZero: return "divisionByZero";
  case ExceptionFlag::Overflow:       return "overflow";
  case ExceptionFlag::Underflow:      return "underflow";
  case ExceptionFlag::Inexact:        return "inexact";
  }
  return "???";
}

class ExceptionFlags {
public:
  ExceptionFlags() = default;

  ExceptionFlags(const ExceptionFlags &) = delete;
  ExceptionFlags &operator=(const ExceptionFlags &) = delete;

  void raise(ExceptionFlag Flag) {
    std::lock_guard<std::mutex> Lock(Mutex);
    slot(Flag) = true;
  }

  bool test(ExceptionFlag Flag) const {
    std::lock_guard<std::mutex> Lock(Mutex);
    return slot(Flag);
  }

  void clear(ExceptionFlag Flag) {
    std::lock_guard<std::mutex> Lock(Mutex);
    slot(Flag) = false;
  }

  void clearAll() {
    std::lock_guard<std::mutex> Lock(Mutex);
    Invalid = DivisionByZero = Overflow = Underflow = Inexact = false;
  }

  bool anyRaised() const {
    std::lock_guard<std::mutex> Lock(Mutex);
    return Invalid || DivisionByZero || Overflow || Underflow || Inexact;
  }

  // Raised flags in declaration order.
  std::vector<ExceptionFlag> raised() const {
    std::lock_guard<std::mutex> Lock(Mutex);
    std::vector<ExceptionFlag> Result;
    for (ExceptionFlag Flag : AllExceptionFlags)
      if (slot(Flag))
        Result.push_back(Flag);
    return Result;
  }

  static ExceptionFlags &shared() {
    static ExceptionFlags Instance;
    return Instance;
  }

private:
  // Self is ExceptionFlags or const ExceptionFlags; the result carries
  // its constness.
  template <typename Self>
  static auto &slotOf(Self &Flags, ExceptionFlag Flag) {
    switch (Flag) {
    case ExceptionFlag::Invalid:        return Flags.Invalid;
    case ExceptionFlag::DivisionByZero: return Flags.DivisionByZero;
    case ExceptionFlag::Overflow:       return Flags.Overflow;
    case ExceptionFlag::Underflow:      return Flags.Underflow;
    case ExceptionFlag::Inexact:        return Flags.Inexact;
    }
    return Flags.Invalid;
  }

  bool &slot(ExceptionFlag Flag) { return slotOf(*this, Flag); }
  const bool &slot(ExceptionFlag Flag) const { return slotOf(*this, Flag); }

  mutable std::mutex Mutex;
  bool Invalid = false;
  bool DivisionByZero = false;
  bool Overflow = false;
  bool Underflow = false;
  bool Inexact = false;
};

// ===================================================================
// Hardware FPU flags
// ===================================================================

struct FpuExceptionState {
  bool Invalid = false;
  bool DivisionByZero = false;
  bool Overflow = false;
  bool Underflow = false;
  bool Inexact = false;

  bool any() const {
    return Invalid || DivisionByZero || Overflow || Underflow || Inexact;
  }
};

inline FpuExceptionState testFpuExceptions() {
  int Raised = std::fetestexcept(FE_ALL_EXCEPT);
  FpuExceptionState State;
  State.Invalid = (Raised & FE_INVALID) != 0;
  State.DivisionByZero = (Raised & FE_DIVBYZERO) != 0;
  State.Overflow = (Raised & FE_OVERFLOW) != 0;
  State.Underflow = (Raised & FE_UNDERFLOW) != 0;
  State.Inexact = (Raised & FE_INEXACT) != 0;
  return State;
}

// False when the platform could not clear the flags.
inline bool clearFpuExceptions() {
  return std::feclearexcept(FE_ALL_EXCEPT) == 0;
}

} // namespace bitexact

#endif // BITEXACT_CORE_EXCEPTIONS_HPP
