#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Error.h"

#include "rvcc/ABI/AllocationState.h"
#include "rvcc/ABI/Configuration.h"
#include "rvcc/Model/Type.h"

namespace rvcc::abi {

class Parameter;

/// Wraps the trailing parameters of a call to mark them as variadic
struct VariadicArguments {
  std::vector<Parameter> Parameters;
};

/// An element of the parameter list of a call: either a type or the
/// variadic arguments
class Parameter {
private:
  std::variant<model::TypePtr, VariadicArguments> Value;

public:
  Parameter(model::TypePtr Type) : Value(std::move(Type)) {
    rvcc_assert(std::get<model::TypePtr>(Value) != nullptr);
  }

  Parameter(VariadicArguments Arguments) : Value(std::move(Arguments)) {}

public:
  bool isVariadic() const {
    return std::holds_alternative<VariadicArguments>(Value);
  }

  const model::TypePtr &type() const {
    rvcc_assert(not isVariadic());
    return std::get<model::TypePtr>(Value);
  }

  const VariadicArguments &variadicArguments() const {
    rvcc_assert(isVariadic());
    return std::get<VariadicArguments>(Value);
  }
};

template<typename... Ts>
inline VariadicArguments varArgs(Ts &&...Parameters) {
  return VariadicArguments{ { Parameter(std::forward<Ts>(Parameters))... } };
}

/// Computes where the arguments and the return value of a call are placed
/// according to the RISC-V integer calling convention and, if FLEN is set,
/// its hardware floating-point extension
class Classifier {
private:
  Configuration Config;

private:
  explicit Classifier(const Configuration &Config) : Config(Config) {}

public:
  static llvm::Expected<Classifier> create(const Configuration &Config);

  static llvm::Expected<Classifier>
  create(uint64_t XLEN, std::optional<uint64_t> FLEN = std::nullopt) {
    return create(Configuration{ XLEN, FLEN });
  }

public:
  uint64_t XLEN() const { return Config.XLEN; }
  std::optional<uint64_t> FLEN() const { return Config.FLEN; }
  const Configuration &configuration() const { return Config; }

public:
  /// Classify a call with the given parameters and, optionally, return type
  ///
  /// The last parameter can be a VariadicArguments. Every type must be a
  /// distinct instance.
  llvm::Expected<AllocationState>
  classifyCall(llvm::ArrayRef<Parameter> Arguments,
               std::optional<Parameter> ReturnValue = std::nullopt) const;

  /// Classify how \p ReturnValue is returned by a function
  ///
  /// If it's returned through memory, the pointer to it is not shown in a0,
  /// since it's an argument of the call.
  llvm::Expected<AllocationState>
  classifyReturn(const Parameter &ReturnValue) const;
};

} // namespace rvcc::abi
