#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

#include "rvcc/Support/Assert.h"
#include "rvcc/Support/Debug.h"

namespace rvcc::model {

class Type;

/// Type descriptors are immutable and shared: the identity of the pointee is
/// what distinguishes two arguments of the same shape.
using TypePtr = std::shared_ptr<const Type>;

namespace TypeKind {

enum Values {
  Invalid,
  Integer,
  FloatingPoint,
  Pointer,
  Padding,
  Struct,
  Union,
  Array,
  Slice,
  Count
};

inline llvm::StringRef getName(Values V) {
  switch (V) {
  case Invalid:
    return "Invalid";
  case Integer:
    return "Integer";
  case FloatingPoint:
    return "FloatingPoint";
  case Pointer:
    return "Pointer";
  case Padding:
    return "Padding";
  case Struct:
    return "Struct";
  case Union:
    return "Union";
  case Array:
    return "Array";
  case Slice:
    return "Slice";
  case Count:
    rvcc_abort();
    break;
  }
  rvcc_abort();
}

} // namespace TypeKind

struct IntegerType {
  bool IsSigned = true;
};

struct FloatingPointType {};

struct PointerType {};

/// Synthetic filler inserted between struct members
struct PaddingType {};

struct StructType {
  /// The members, including the padding inserted to align them.
  llvm::SmallVector<TypePtr, 4> Members;
};

struct UnionType {
  llvm::SmallVector<TypePtr, 2> Members;
};

struct ArrayType {
  TypePtr Element;
  uint64_t ElementCount = 0;
};

/// A view on the bits `[Low, High]` of another type.
///
/// \note the owner is not kept alive by the slice.
struct SliceType {
  const Type *Owner = nullptr;
  uint64_t Low = 0;
  uint64_t High = 0;
};

/// A leaf produced by Type::flatten, with its offset in bits from the start
/// of the flattened object.
struct FlattenedField {
  const Type *Leaf = nullptr;
  uint64_t Offset = 0;
};
using FlattenedFields = llvm::SmallVector<FlattenedField, 4>;

/// A type descriptor. Sizes and alignments are expressed in bits.
class Type {
public:
  using Storage = std::variant<IntegerType,
                               FloatingPointType,
                               PointerType,
                               PaddingType,
                               StructType,
                               UnionType,
                               ArrayType,
                               SliceType>;

private:
  uint64_t Size = 0;
  uint64_t Alignment = 0;
  Storage Kind;

public:
  Type(uint64_t Size, uint64_t Alignment, Storage Kind) :
    Size(Size), Alignment(Alignment), Kind(std::move(Kind)) {}

public:
  uint64_t size() const { return Size; }
  uint64_t alignment() const { return Alignment; }

  TypeKind::Values kind() const {
    // The order of the alternatives in `Storage` follows `TypeKind::Values`
    return static_cast<TypeKind::Values>(Kind.index() + 1);
  }

  template<typename T>
  bool is() const {
    return std::holds_alternative<T>(Kind);
  }

  template<typename T>
  const T *getAs() const {
    return std::get_if<T>(&Kind);
  }

public:
  /// Recursively expand structs and arrays into their leaves, padding
  /// included. Any other type is its own single leaf.
  FlattenedFields flatten() const;

  /// Copy of this scalar with a different size (and alignment).
  TypePtr withSize(uint64_t NewSize) const;

  std::string toString() const;
  void dump() const debug_function;

private:
  void flatten(FlattenedFields &Result, uint64_t BaseOffset) const;
};

TypePtr makeInteger(uint64_t Size, bool IsSigned);
inline TypePtr makeSigned(uint64_t Size) {
  return makeInteger(Size, true);
}
inline TypePtr makeUnsigned(uint64_t Size) {
  return makeInteger(Size, false);
}

TypePtr makeFloat(uint64_t Size);
TypePtr makePointer(uint64_t Size);
TypePtr makePadding(uint64_t Size);

/// Build a struct, inserting padding so that every member is placed at an
/// offset multiple of its alignment.
///
/// A struct without members has size 0 and an alignment of one byte.
TypePtr makeStruct(llvm::ArrayRef<TypePtr> Members);

template<typename... Ts>
  requires(std::convertible_to<Ts, TypePtr> && ...)
TypePtr makeStruct(Ts &&...Members) {
  return makeStruct(llvm::ArrayRef<TypePtr>{ TypePtr(Members)... });
}

TypePtr makeUnion(llvm::ArrayRef<TypePtr> Members);

template<typename... Ts>
  requires(sizeof...(Ts) > 0 && (std::convertible_to<Ts, TypePtr> && ...))
TypePtr makeUnion(Ts &&...Members) {
  return makeUnion(llvm::ArrayRef<TypePtr>{ TypePtr(Members)... });
}

TypePtr makeArray(TypePtr Element, uint64_t ElementCount);

/// Build a view on the bits `[Low, High]` of \p Owner.
TypePtr makeSlice(const TypePtr &Owner, uint64_t Low, uint64_t High);

} // namespace rvcc::model
