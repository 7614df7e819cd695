/// \file Type.cpp
/// Layout of the type descriptors.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>

#include "llvm/ADT/Twine.h"
#include "llvm/Support/MathExtras.h"
#include "llvm/Support/raw_ostream.h"

#include "rvcc/Model/Type.h"

using namespace llvm;

namespace rvcc::model {

static constexpr uint64_t EmptyStructAlignment = 8;

static bool isValidIntegerSize(uint64_t Size) {
  return Size == 8 or Size == 16 or Size == 32 or Size == 64 or Size == 128;
}

/// Floating-point values and pointers are as wide as a RISC-V register
static bool isValidRegisterSize(uint64_t Size) {
  return Size == 32 or Size == 64 or Size == 128;
}

TypePtr makeInteger(uint64_t Size, bool IsSigned) {
  rvcc_assert(isValidIntegerSize(Size), "Invalid integer size");
  return std::make_shared<const Type>(Size, Size, IntegerType{ IsSigned });
}

TypePtr makeFloat(uint64_t Size) {
  rvcc_assert(isValidRegisterSize(Size), "Invalid floating-point size");
  return std::make_shared<const Type>(Size, Size, FloatingPointType{});
}

TypePtr makePointer(uint64_t Size) {
  rvcc_assert(isValidRegisterSize(Size), "Invalid pointer size");
  return std::make_shared<const Type>(Size, Size, PointerType{});
}

TypePtr makePadding(uint64_t Size) {
  rvcc_assert(Size != 0);
  return std::make_shared<const Type>(Size, 1, PaddingType{});
}

TypePtr makeStruct(ArrayRef<TypePtr> Members) {
  if (Members.empty())
    return std::make_shared<const Type>(0, EmptyStructAlignment, StructType{});

  StructType Result;
  uint64_t Offset = 0;
  uint64_t Alignment = 1;
  for (const TypePtr &Member : Members) {
    rvcc_assert(Member != nullptr);
    rvcc_assert(Member->alignment() != 0);

    uint64_t Aligned = alignTo(Offset, Member->alignment());
    if (Aligned != Offset)
      Result.Members.push_back(makePadding(Aligned - Offset));

    Result.Members.push_back(Member);
    Offset = Aligned + Member->size();
    Alignment = std::max(Alignment, Member->alignment());
  }

  uint64_t Size = alignTo(Offset, Alignment);
  return std::make_shared<const Type>(Size, Alignment, std::move(Result));
}

TypePtr makeUnion(ArrayRef<TypePtr> Members) {
  rvcc_assert(not Members.empty(), "A union needs at least one member");

  UnionType Result;
  uint64_t Size = 0;
  uint64_t Alignment = 1;
  for (const TypePtr &Member : Members) {
    rvcc_assert(Member != nullptr);
    Result.Members.push_back(Member);
    Size = std::max(Size, Member->size());
    Alignment = std::max(Alignment, Member->alignment());
  }

  Size = alignTo(Size, Alignment);
  return std::make_shared<const Type>(Size, Alignment, std::move(Result));
}

TypePtr makeArray(TypePtr Element, uint64_t ElementCount) {
  rvcc_assert(Element != nullptr);
  uint64_t Size = Element->size() * ElementCount;
  uint64_t Alignment = Element->alignment();
  return std::make_shared<const Type>(Size,
                                      Alignment,
                                      ArrayType{ std::move(Element),
                                                 ElementCount });
}

TypePtr makeSlice(const TypePtr &Owner, uint64_t Low, uint64_t High) {
  rvcc_assert(Owner != nullptr);
  rvcc_assert(Low <= High);
  uint64_t Size = High - Low + 1;
  return std::make_shared<const Type>(Size,
                                      Size,
                                      SliceType{ Owner.get(), Low, High });
}

FlattenedFields Type::flatten() const {
  FlattenedFields Result;
  flatten(Result, 0);
  return Result;
}

void Type::flatten(FlattenedFields &Result, uint64_t BaseOffset) const {
  if (auto *Struct = getAs<StructType>()) {
    uint64_t Offset = BaseOffset;
    for (const TypePtr &Member : Struct->Members) {
      Member->flatten(Result, Offset);
      Offset += Member->size();
    }
  } else if (auto *Array = getAs<ArrayType>()) {
    for (uint64_t I = 0; I < Array->ElementCount; ++I)
      Array->Element->flatten(Result, BaseOffset + I * Array->Element->size());
  } else {
    Result.push_back({ this, BaseOffset });
  }
}

TypePtr Type::withSize(uint64_t NewSize) const {
  if (auto *Integer = getAs<IntegerType>())
    return makeInteger(NewSize, Integer->IsSigned);
  else if (is<FloatingPointType>())
    return makeFloat(NewSize);
  else if (is<PointerType>())
    return makePointer(NewSize);

  rvcc_abort("Only scalars can be resized");
}

static void printMembers(raw_ostream &OS, ArrayRef<TypePtr> Members) {
  OS << "[";
  bool First = true;
  for (const TypePtr &Member : Members) {
    if (not First)
      OS << ", ";
    First = false;
    OS << Member->toString();
  }
  OS << "]";
}

std::string Type::toString() const {
  std::string Result;
  raw_string_ostream OS(Result);

  switch (kind()) {
  case TypeKind::Integer:
    OS << (getAs<IntegerType>()->IsSigned ? "SInt" : "UInt") << Size;
    break;

  case TypeKind::FloatingPoint:
    OS << "FP" << Size;
    break;

  case TypeKind::Pointer:
    OS << "Ptr" << Size;
    break;

  case TypeKind::Padding:
    OS << "Pad" << Size;
    break;

  case TypeKind::Struct:
    OS << "Struct(";
    printMembers(OS, getAs<StructType>()->Members);
    OS << ", s" << Size << ", a" << Alignment << ")";
    break;

  case TypeKind::Union:
    OS << "Union(";
    printMembers(OS, getAs<UnionType>()->Members);
    OS << ", s" << Size << ", a" << Alignment << ")";
    break;

  case TypeKind::Array: {
    auto *Array = getAs<ArrayType>();
    OS << "Array(" << Array->Element->toString() << "*" << Array->ElementCount
       << ", s" << Size << ", a" << Alignment << ")";
  } break;

  case TypeKind::Slice: {
    auto *Slice = getAs<SliceType>();
    OS << Slice->Owner->toString() << "[" << Slice->Low << ":" << Slice->High
       << "]";
  } break;

  case TypeKind::Invalid:
  case TypeKind::Count:
    rvcc_abort();
  }

  OS.flush();
  return Result;
}

void Type::dump() const {
  dbg << toString() << "\n";
}

} // namespace rvcc::model
