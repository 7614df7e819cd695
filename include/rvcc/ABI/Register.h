#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdint>
#include <string>

#include "llvm/ADT/StringRef.h"

#include "rvcc/Support/Assert.h"

/// The argument registers of the RISC-V calling convention
namespace rvcc::abi::Register {

enum Values {
  Invalid,
  a0,
  a1,
  a2,
  a3,
  a4,
  a5,
  a6,
  a7,
  fa0,
  fa1,
  fa2,
  fa3,
  fa4,
  fa5,
  fa6,
  fa7,
  Count
};

/// Number of argument registers in each register file
inline constexpr uint64_t ArgumentRegisterCount = 8;

inline llvm::StringRef getName(Values V) {
  switch (V) {
  case Invalid:
    return "Invalid";
  case a0:
    return "a0";
  case a1:
    return "a1";
  case a2:
    return "a2";
  case a3:
    return "a3";
  case a4:
    return "a4";
  case a5:
    return "a5";
  case a6:
    return "a6";
  case a7:
    return "a7";
  case fa0:
    return "fa0";
  case fa1:
    return "fa1";
  case fa2:
    return "fa2";
  case fa3:
    return "fa3";
  case fa4:
    return "fa4";
  case fa5:
    return "fa5";
  case fa6:
    return "fa6";
  case fa7:
    return "fa7";
  case Count:
    rvcc_abort();
    break;
  }
  rvcc_abort();
}

inline Values fromName(llvm::StringRef Name) {
  for (unsigned I = a0; I < Count; ++I)
    if (getName(static_cast<Values>(I)) == Name)
      return static_cast<Values>(I);
  return Invalid;
}

inline bool isFloatingPoint(Values V) {
  rvcc_assert(V != Invalid and V != Count);
  return V >= fa0;
}

/// Position of \p V within its register file, i.e., 0 for a0 and fa0
inline uint64_t getArgumentIndex(Values V) {
  rvcc_assert(V != Invalid and V != Count);
  return isFloatingPoint(V) ? V - fa0 : V - a0;
}

inline Values getGPR(uint64_t Index) {
  rvcc_assert(Index < ArgumentRegisterCount);
  return static_cast<Values>(a0 + Index);
}

inline Values getFPR(uint64_t Index) {
  rvcc_assert(Index < ArgumentRegisterCount);
  return static_cast<Values>(fa0 + Index);
}

/// Number of the register in its architectural register file: argument
/// registers start at x10 and f10
inline uint64_t getArchitecturalNumber(Values V) {
  return 10 + getArgumentIndex(V);
}

/// The architectural name of the register, e.g., `x10` for a0
inline std::string getArchitecturalName(Values V) {
  return (isFloatingPoint(V) ? "f" : "x")
         + std::to_string(getArchitecturalNumber(V));
}

} // namespace rvcc::abi::Register
