#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include "rvcc/ABI/Register.h"
#include "rvcc/Model/Type.h"
#include "rvcc/Support/Debug.h"

namespace rvcc::abi {

/// An argument (or the return value) of the classified call
struct ArgumentEntry {
  /// The instance that has been classified
  model::TypePtr Type;

  /// The instance the caller provided. It differs from `Type` only for
  /// promoted variadic arguments.
  model::TypePtr Original;

  std::string Label;

  /// For a pointer synthesized to pass an object by reference, the index of
  /// the entry of that object
  std::optional<uint64_t> Referenced;

  bool IsReturnValue = false;
};

/// The registers and stack slots used by a call, and the names of the objects
/// placed in them
///
/// The allocation methods expect their preconditions to be checked by the
/// caller: violating them is a bug of the routing algorithm.
class AllocationState {
public:
  using RegisterFile = std::array<model::TypePtr,
                                  Register::ArgumentRegisterCount>;

private:
  uint64_t XLENValue = 0;
  std::optional<uint64_t> FLENValue;

  RegisterFile GPRs;
  RegisterFile FPRs;
  uint64_t UsedGPRCount = 0;
  uint64_t UsedFPRCount = 0;

  llvm::SmallVector<model::TypePtr, 4> Stack;

  llvm::SmallVector<ArgumentEntry, 8> Entries;
  llvm::DenseMap<const model::Type *, uint64_t> EntryIndex;

public:
  AllocationState(uint64_t XLEN, std::optional<uint64_t> FLEN);

public:
  uint64_t XLEN() const { return XLENValue; }
  std::optional<uint64_t> FLEN() const { return FLENValue; }
  bool hasFPRs() const { return FLENValue.has_value(); }

  uint64_t remainingGPRs() const {
    return Register::ArgumentRegisterCount - UsedGPRCount;
  }

  uint64_t remainingFPRs() const {
    if (not hasFPRs())
      return 0;
    return Register::ArgumentRegisterCount - UsedFPRCount;
  }

public:
  /// \name Arena
  /// @{

  /// Record an argument so that it can be named, returning its index
  uint64_t addArgument(model::TypePtr Type,
                       model::TypePtr Original,
                       std::string Label);

  /// Record the return value, labelled `ret`
  uint64_t addReturnValue(model::TypePtr Type);

  /// Turn the argument at \p Index into the return value
  void markAsReturnValue(uint64_t Index);

  llvm::ArrayRef<ArgumentEntry> entries() const { return Entries; }

  const ArgumentEntry *findEntry(const model::Type *Type) const;

  /// @}

public:
  /// \name Allocation
  /// @{

  /// Place \p Type in the next GPR or, if none is left, on the stack
  void assignToGPROrStack(model::TypePtr Type);

  void assignToGPR(model::TypePtr Type);

  /// Leave the next GPR empty
  void skipGPR();

  void assignToFPR(model::TypePtr Type);

  void assignToStack(model::TypePtr Type);

  /// Replace \p Owner with a pointer to it, placed as an XLEN-sized integer
  void passByReference(const model::TypePtr &Owner);

  /// Empty \p R without making it available again
  void clearRegister(Register::Values R);

  /// @}

public:
  /// \name Inspection
  /// @{

  /// The occupant of \p R, or nullptr
  const model::Type *lookup(Register::Values R) const;

  llvm::ArrayRef<model::TypePtr> gprs() const { return GPRs; }

  /// The FPR file, empty if the floating-point convention is not in use
  llvm::ArrayRef<model::TypePtr> fprs() const {
    if (not hasFPRs())
      return {};
    return FPRs;
  }

  llvm::ArrayRef<model::TypePtr> stack() const { return Stack; }

  /// Offsets, in bytes, of the stack objects from the stack pointer of the
  /// caller
  llvm::SmallVector<uint64_t, 4> stackOffsetsFromCallerSP() const;
  uint64_t stackOffsetFromCallerSP(uint64_t Index) const;

  /// Whether \p Type is a pointer synthesized to pass an object by reference
  bool isReference(const model::Type *Type) const;

  /// The name of \p Type in this call: `arg00`, `&varg01`, `ret`,
  /// `arg02[0:31]` or, for unknown types, their textual representation
  std::string labelOf(const model::Type *Type) const;

  /// As labelOf, but `?` for an empty slot
  std::string describe(const model::Type *Type) const;

  bool returnValueIsPassedByReference() const;

  /// @}

public:
  void print(llvm::raw_ostream &OS) const;
  void dump() const debug_function;
};

} // namespace rvcc::abi
