/// \file AllocationState.cpp
/// Bookkeeping of the registers and stack slots used by a call.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/MathExtras.h"

#include "rvcc/ABI/AllocationState.h"

using namespace llvm;

static Logger Log("rvcc-allocation");

namespace rvcc::abi {

using model::TypePtr;

AllocationState::AllocationState(uint64_t XLEN, std::optional<uint64_t> FLEN) :
  XLENValue(XLEN), FLENValue(FLEN) {
}

uint64_t AllocationState::addArgument(TypePtr Type,
                                      TypePtr Original,
                                      std::string Label) {
  rvcc_assert(Type != nullptr and Original != nullptr);

  uint64_t Index = Entries.size();
  bool Inserted = EntryIndex.try_emplace(Type.get(), Index).second;
  rvcc_assert(Inserted, "The same instance has been recorded twice");

  Entries.push_back({ .Type = std::move(Type),
                      .Original = std::move(Original),
                      .Label = std::move(Label),
                      .Referenced = std::nullopt,
                      .IsReturnValue = false });
  return Index;
}

uint64_t AllocationState::addReturnValue(TypePtr Type) {
  TypePtr Original = Type;
  uint64_t Index = addArgument(std::move(Type), std::move(Original), "ret");
  Entries[Index].IsReturnValue = true;
  return Index;
}

void AllocationState::markAsReturnValue(uint64_t Index) {
  rvcc_assert(Index < Entries.size());
  Entries[Index].Label = "ret";
  Entries[Index].IsReturnValue = true;
}

const ArgumentEntry *AllocationState::findEntry(const model::Type *Type) const {
  auto It = EntryIndex.find(Type);
  if (It == EntryIndex.end())
    return nullptr;
  return &Entries[It->second];
}

void AllocationState::assignToGPROrStack(TypePtr Type) {
  rvcc_assert(Type->size() <= XLENValue, "Object is larger than XLEN");

  if (remainingGPRs() >= 1)
    assignToGPR(std::move(Type));
  else
    assignToStack(std::move(Type));
}

void AllocationState::assignToGPR(TypePtr Type) {
  rvcc_assert(Type->size() <= XLENValue, "Object is larger than XLEN");
  rvcc_assert(remainingGPRs() > 0, "All the GPRs have already been assigned");

  Register::Values R = Register::getGPR(UsedGPRCount);
  rvcc_log(Log, labelOf(Type.get()) << " -> " << Register::getName(R));
  GPRs[UsedGPRCount] = std::move(Type);
  ++UsedGPRCount;
}

void AllocationState::skipGPR() {
  rvcc_assert(remainingGPRs() > 0, "All the GPRs have already been assigned");
  Register::Values R = Register::getGPR(UsedGPRCount);
  rvcc_log(Log, "Skipping " << Register::getName(R));
  ++UsedGPRCount;
}

void AllocationState::assignToFPR(TypePtr Type) {
  rvcc_assert(hasFPRs());
  rvcc_assert(Type->size() <= *FLENValue, "Object is larger than FLEN");
  rvcc_assert(remainingFPRs() > 0, "All the FPRs have already been assigned");

  Register::Values R = Register::getFPR(UsedFPRCount);
  rvcc_log(Log, labelOf(Type.get()) << " -> " << Register::getName(R));
  FPRs[UsedFPRCount] = std::move(Type);
  ++UsedFPRCount;
}

void AllocationState::assignToStack(TypePtr Type) {
  rvcc_assert(Type->size() <= 2 * XLENValue,
              "Objects larger than 2*XLEN must be passed by reference");

  rvcc_log(Log, labelOf(Type.get()) << " -> stack object " << Stack.size());
  Stack.push_back(std::move(Type));
}

void AllocationState::passByReference(const TypePtr &Owner) {
  TypePtr Pointer = model::makePointer(XLENValue);

  auto It = EntryIndex.find(Owner.get());
  if (It != EntryIndex.end()) {
    uint64_t OwnerIndex = It->second;
    uint64_t Index = addArgument(Pointer, Pointer, "");
    Entries[Index].Referenced = OwnerIndex;
  }

  assignToGPROrStack(std::move(Pointer));
}

void AllocationState::clearRegister(Register::Values R) {
  uint64_t Index = Register::getArgumentIndex(R);
  if (Register::isFloatingPoint(R)) {
    rvcc_assert(hasFPRs());
    FPRs[Index].reset();
  } else {
    GPRs[Index].reset();
  }
}

const model::Type *AllocationState::lookup(Register::Values R) const {
  uint64_t Index = Register::getArgumentIndex(R);
  if (Register::isFloatingPoint(R)) {
    if (not hasFPRs())
      return nullptr;
    return FPRs[Index].get();
  }
  return GPRs[Index].get();
}

SmallVector<uint64_t, 4> AllocationState::stackOffsetsFromCallerSP() const {
  SmallVector<uint64_t, 4> Result;

  // Offsets are tracked in bits
  uint64_t Offset = 0;
  for (uint64_t Index = 0; Index < Stack.size(); ++Index) {
    if (Index != 0) {
      Offset += Stack[Index - 1]->size();
      Offset = alignTo(Offset, XLENValue);
      Offset = alignTo(Offset, Stack[Index]->alignment());
    }
    Result.push_back(Offset / 8);
  }

  return Result;
}

uint64_t AllocationState::stackOffsetFromCallerSP(uint64_t Index) const {
  rvcc_assert(Index < Stack.size(), "Invalid stack object");
  return stackOffsetsFromCallerSP()[Index];
}

bool AllocationState::isReference(const model::Type *Type) const {
  const ArgumentEntry *Entry = findEntry(Type);
  return Entry != nullptr and Entry->Referenced.has_value();
}

std::string AllocationState::labelOf(const model::Type *Type) const {
  rvcc_assert(Type != nullptr);

  if (auto *Slice = Type->getAs<model::SliceType>()) {
    if (findEntry(Slice->Owner) == nullptr)
      return Type->toString();

    return (Twine(labelOf(Slice->Owner)) + "[" + Twine(Slice->Low) + ":"
            + Twine(Slice->High) + "]")
      .str();
  }

  const ArgumentEntry *Entry = findEntry(Type);
  if (Entry == nullptr)
    return Type->toString();

  if (Entry->Referenced)
    return "&" + Entries[*Entry->Referenced].Label;

  return Entry->Label;
}

std::string AllocationState::describe(const model::Type *Type) const {
  if (Type == nullptr)
    return "?";
  return labelOf(Type);
}

bool AllocationState::returnValueIsPassedByReference() const {
  return llvm::any_of(Entries, [this](const ArgumentEntry &Entry) {
    return Entry.Referenced and Entries[*Entry.Referenced].IsReturnValue;
  });
}

void AllocationState::print(raw_ostream &OS) const {
  SmallVector<const ArgumentEntry *, 8> Named;
  for (const ArgumentEntry &Entry : Entries)
    if (not Entry.Referenced)
      Named.push_back(&Entry);

  if (not Named.empty()) {
    llvm::sort(Named, [](const ArgumentEntry *LHS, const ArgumentEntry *RHS) {
      return LHS->Label < RHS->Label;
    });

    OS << "Args:\n";
    for (const ArgumentEntry *Entry : Named)
      OS << Entry->Label << ": " << Entry->Type->toString() << "\n";
    OS << "\n";
  }

  OS << "GPRs:\n";
  for (uint64_t I = 0; I < Register::ArgumentRegisterCount; ++I)
    OS << "GPR[" << Register::getName(Register::getGPR(I))
       << "]: " << describe(GPRs[I].get()) << "\n";

  if (hasFPRs()) {
    OS << "\nFPRs:\n";
    for (uint64_t I = 0; I < Register::ArgumentRegisterCount; ++I)
      OS << "FPR[" << Register::getName(Register::getFPR(I))
         << "]: " << describe(FPRs[I].get()) << "\n";
  }

  OS << "\nStack:\n";
  auto Offsets = stackOffsetsFromCallerSP();
  for (auto &&[Object, Offset] : llvm::zip(Stack, Offsets))
    OS << describe(Object.get()) << " (oldsp+" << Offset << ")\n";
}

void AllocationState::dump() const {
  std::string Buffer;
  {
    raw_string_ostream Stream(Buffer);
    print(Stream);
  }
  dbg << Buffer;
}

} // namespace rvcc::abi
