#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdint>
#include <optional>
#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/YAMLTraits.h"

#include "rvcc/Support/Assert.h"

namespace rvcc::abi {

/// The standard RISC-V ABI names
namespace ABI {

enum Values {
  Invalid,
  ilp32,
  ilp32f,
  ilp32d,
  lp64,
  lp64f,
  lp64d,
  lp64q,
  Count
};

inline llvm::StringRef getName(Values V) {
  switch (V) {
  case Invalid:
    return "Invalid";
  case ilp32:
    return "ilp32";
  case ilp32f:
    return "ilp32f";
  case ilp32d:
    return "ilp32d";
  case lp64:
    return "lp64";
  case lp64f:
    return "lp64f";
  case lp64d:
    return "lp64d";
  case lp64q:
    return "lp64q";
  case Count:
    rvcc_abort();
    break;
  }
  rvcc_abort();
}

inline Values fromName(llvm::StringRef Name) {
  if (Name == "ilp32") {
    return ilp32;
  } else if (Name == "ilp32f") {
    return ilp32f;
  } else if (Name == "ilp32d") {
    return ilp32d;
  } else if (Name == "lp64") {
    return lp64;
  } else if (Name == "lp64f") {
    return lp64f;
  } else if (Name == "lp64d") {
    return lp64d;
  } else if (Name == "lp64q") {
    return lp64q;
  } else {
    return Invalid;
  }
}

} // namespace ABI

/// Register widths, in bits, selecting a calling convention
struct Configuration {
  uint64_t XLEN = 64;

  /// Width of the floating-point argument registers, if the hardware
  /// floating-point convention is in use
  std::optional<uint64_t> FLEN;

public:
  bool hasFPRs() const { return FLEN.has_value(); }

  /// Check that XLEN and FLEN are widths RISC-V defines
  llvm::Error verify() const;

public:
  static Configuration fromABI(ABI::Values V);

  /// Resolve a RISC-V ABI name, such as `lp64d`
  static llvm::Expected<Configuration> fromABIName(llvm::StringRef Name);

  /// Parse and verify a YAML document such as `{ XLEN: 64, FLEN: 64 }`
  static llvm::Expected<Configuration> fromYAML(llvm::StringRef YAML);

  std::string toYAML() const;

  bool operator==(const Configuration &) const = default;
};

} // namespace rvcc::abi

template<>
struct llvm::yaml::MappingTraits<rvcc::abi::Configuration> {
  static void mapping(IO &TheIO, rvcc::abi::Configuration &Obj) {
    TheIO.mapRequired("XLEN", Obj.XLEN);

    // Zero stands for "no floating-point registers"
    uint64_t FLEN = Obj.FLEN.value_or(0);
    TheIO.mapOptional("FLEN", FLEN, uint64_t(0));
    if (not TheIO.outputting()) {
      if (FLEN != 0)
        Obj.FLEN = FLEN;
      else
        Obj.FLEN.reset();
    }
  }
};
