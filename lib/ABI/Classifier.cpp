/// \file Classifier.cpp
/// Classification of the arguments and return value of a call.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallPtrSet.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/Twine.h"

#include "rvcc/ABI/Classifier.h"
#include "rvcc/ABI/Errors.h"
#include "rvcc/Support/Debug.h"

using namespace llvm;

static Logger Log("rvcc-classification");

namespace rvcc::abi {

using model::FlattenedField;
using model::TypePtr;

llvm::Expected<Classifier> Classifier::create(const Configuration &Config) {
  if (Error VerifyError = Config.verify())
    return std::move(VerifyError);
  return Classifier(Config);
}

namespace {

/// The types of a call, once variadic arguments have been unwrapped
struct ArgumentList {
  SmallVector<TypePtr, 8> Types;

  /// Index of the first variadic argument, `Types.size()` if there's none
  size_t FirstVariadic = 0;

  bool isVariadic(size_t Index) const { return Index >= FirstVariadic; }
};

} // namespace

static Expected<ArgumentList>
unwrapArguments(ArrayRef<Parameter> Arguments,
                const std::optional<Parameter> &ReturnValue) {
  if (ReturnValue and ReturnValue->isVariadic())
    return createError(ErrorKind::VariadicMisuse,
                       "The return type cannot be variadic");

  SmallVector<const Parameter *, 8> Flat;
  ArrayRef<Parameter> Fixed = Arguments;
  const VariadicArguments *Variadic = nullptr;
  if (not Arguments.empty() and Arguments.back().isVariadic()) {
    Fixed = Arguments.drop_back();
    Variadic = &Arguments.back().variadicArguments();
  }

  for (const Parameter &P : Fixed)
    Flat.push_back(&P);

  size_t FirstVariadic = Flat.size();
  if (Variadic != nullptr)
    for (const Parameter &P : Variadic->Parameters)
      Flat.push_back(&P);

  ArgumentList Result;
  Result.FirstVariadic = FirstVariadic;
  for (const Parameter *P : Flat) {
    if (P->isVariadic())
      return createError(ErrorKind::VariadicMisuse,
                         "Variadic arguments must be the last parameter and "
                         "cannot be nested");
    Result.Types.push_back(P->type());
  }

  // Every instance must appear once, since instances identify arguments
  SmallPtrSet<const model::Type *, 8> Seen;
  for (const TypePtr &Type : Result.Types)
    if (not Seen.insert(Type.get()).second)
      return createError(ErrorKind::Usage,
                         "Arguments must be unique instances: "
                           + Type->toString() + " appears more than once");

  if (ReturnValue and Seen.count(ReturnValue->type().get()) != 0)
    return createError(ErrorKind::Usage,
                       "Arguments must be unique instances: the return type "
                         + ReturnValue->type()->toString()
                         + " is also an argument");

  return Result;
}

/// Empty structs take no space, they are not passed at all
static void dropEmptyArguments(ArgumentList &Arguments) {
  ArgumentList Result;
  Result.FirstVariadic = Arguments.FirstVariadic;
  for (size_t Index = 0; Index < Arguments.Types.size(); ++Index) {
    const TypePtr &Type = Arguments.Types[Index];
    if (Type->size() == 0) {
      if (Index < Arguments.FirstVariadic)
        --Result.FirstVariadic;
      continue;
    }
    Result.Types.push_back(Type);
  }
  Arguments = std::move(Result);
}

/// Integers narrower than XLEN and floating-point values narrower than FLEN
/// are widened when passed as variadic arguments
static TypePtr promote(const TypePtr &Type,
                       uint64_t XLEN,
                       std::optional<uint64_t> FLEN) {
  if (Type->is<model::IntegerType>() and Type->size() < XLEN)
    return Type->withSize(XLEN);

  if (FLEN and Type->is<model::FloatingPointType>() and Type->size() < *FLEN)
    return Type->withSize(*FLEN);

  return Type;
}

static Error verifyPassable(const model::Type &Type) {
  switch (Type.kind()) {
  case model::TypeKind::Array:
    return createError(ErrorKind::UnsupportedConstruct,
                       "Arrays cannot be passed or returned by value: "
                         + Type.toString());

  case model::TypeKind::Padding:
  case model::TypeKind::Slice:
    return createError(ErrorKind::UnsupportedConstruct,
                       "Not a valid parameter type: " + Type.toString());

  case model::TypeKind::Integer:
  case model::TypeKind::FloatingPoint:
  case model::TypeKind::Pointer:
  case model::TypeKind::Struct:
  case model::TypeKind::Union:
    return Error::success();

  case model::TypeKind::Invalid:
  case model::TypeKind::Count:
    rvcc_abort();
  }
  rvcc_abort();
}

static std::string makeLabel(StringRef Prefix, uint64_t Index) {
  std::string Number = std::to_string(Index);
  if (Number.size() < 2)
    Number.insert(0, 2 - Number.size(), '0');
  return Prefix.str() + Number;
}

static bool isFloatingPoint(const model::Type *Type) {
  return Type->is<model::FloatingPointType>();
}

static bool isInteger(const model::Type *Type) {
  return Type->is<model::IntegerType>();
}

/// The leaves of \p Type, padding excluded
static model::FlattenedFields significantFields(const model::Type &Type) {
  model::FlattenedFields Result = Type.flatten();
  llvm::erase_if(Result, [](const FlattenedField &Field) {
    return Field.Leaf->is<model::PaddingType>();
  });
  return Result;
}

/// Can a pair of leaves be passed or returned in a floating-point register
/// and another register?
static bool isFloatingPointPair(const FlattenedField &First,
                                const FlattenedField &Second,
                                uint64_t XLEN,
                                uint64_t FLEN) {
  uint64_t FirstSize = First.Leaf->size();
  uint64_t SecondSize = Second.Leaf->size();
  if (isFloatingPoint(First.Leaf) and isFloatingPoint(Second.Leaf))
    return FirstSize <= FLEN and SecondSize <= FLEN;
  if (isFloatingPoint(First.Leaf) and isInteger(Second.Leaf))
    return FirstSize <= FLEN and SecondSize <= XLEN;
  if (isInteger(First.Leaf) and isFloatingPoint(Second.Leaf))
    return FirstSize <= XLEN and SecondSize <= FLEN;
  return false;
}

static TypePtr sliceOf(const TypePtr &Owner, const FlattenedField &Field) {
  return model::makeSlice(Owner,
                          Field.Offset,
                          Field.Offset + Field.Leaf->size() - 1);
}

/// Decide whether the return value is returned through memory
static void classifyReturnValue(AllocationState &State,
                                const TypePtr &ReturnValue) {
  uint64_t XLEN = State.XLEN();
  std::optional<uint64_t> FLEN = State.FLEN();

  if (FLEN and ReturnValue->is<model::StructType>()
      and ReturnValue->size() <= 2 * *FLEN) {
    auto Fields = significantFields(*ReturnValue);
    bool InRegisters = Fields.size() == 2
                       and isFloatingPointPair(Fields[0],
                                               Fields[1],
                                               XLEN,
                                               *FLEN);
    if (not InRegisters) {
      rvcc_log(Log, "The return value is returned through memory");
      State.passByReference(ReturnValue);
    }
  } else if (ReturnValue->size() > 2 * XLEN) {
    rvcc_log(Log, "The return value is returned through memory");
    State.passByReference(ReturnValue);
  }
}

/// Try to place \p Argument according to the hardware floating-point
/// convention
///
/// \return true if \p Argument has been placed.
static bool assignFloatingPoint(AllocationState &State,
                                const TypePtr &Argument) {
  uint64_t XLEN = State.XLEN();
  uint64_t FLEN = *State.FLEN();

  // Structs that might hold at most two values are examined by their leaves.
  // Padding is not a value.
  const model::Type *Scalar = Argument.get();
  model::FlattenedFields Fields;
  bool IsFlattened = false;
  if (Argument->is<model::StructType>()
      and Argument->size() <= std::max(2 * FLEN, 2 * XLEN)) {
    Fields = significantFields(*Argument);
    if (Fields.size() == 1)
      Scalar = Fields[0].Leaf;
    else
      IsFlattened = true;
  }

  if (not IsFlattened) {
    if (not isFloatingPoint(Scalar) or Scalar->size() > FLEN
        or State.remainingFPRs() < 1)
      return false;

    // A struct with trailing or leading padding only hands over its value
    if (Scalar != Argument.get() and Scalar->size() != Argument->size())
      State.assignToFPR(sliceOf(Argument, Fields[0]));
    else
      State.assignToFPR(Argument);
    return true;
  }

  if (Argument->size() > 2 * FLEN or Fields.size() != 2)
    return false;

  const FlattenedField &First = Fields[0];
  const FlattenedField &Second = Fields[1];
  if (not isFloatingPointPair(First, Second, XLEN, FLEN))
    return false;

  if (isFloatingPoint(First.Leaf) and isFloatingPoint(Second.Leaf)) {
    if (State.remainingFPRs() < 2)
      return false;
    State.assignToFPR(sliceOf(Argument, First));
    State.assignToFPR(sliceOf(Argument, Second));
    return true;
  }

  if (State.remainingFPRs() < 1 or State.remainingGPRs() < 1)
    return false;

  if (isFloatingPoint(First.Leaf)) {
    State.assignToFPR(sliceOf(Argument, First));
    State.assignToGPR(sliceOf(Argument, Second));
  } else {
    State.assignToGPR(sliceOf(Argument, First));
    State.assignToFPR(sliceOf(Argument, Second));
  }
  return true;
}

/// Place \p Argument according to the integer calling convention
static void assignInteger(AllocationState &State,
                          const TypePtr &Argument,
                          bool IsVariadic) {
  uint64_t XLEN = State.XLEN();

  if (Argument->size() <= XLEN) {
    State.assignToGPROrStack(Argument);
  } else if (Argument->size() <= 2 * XLEN) {
    // Variadic arguments aligned to 2*XLEN go in an aligned register pair
    if (IsVariadic and Argument->alignment() == 2 * XLEN
        and State.remainingGPRs() % 2 == 1)
      State.skipGPR();

    if (State.remainingGPRs() > 0) {
      State.assignToGPROrStack(model::makeSlice(Argument, 0, XLEN - 1));
      State.assignToGPROrStack(model::makeSlice(Argument,
                                                XLEN,
                                                2 * XLEN - 1));
    } else {
      State.assignToStack(Argument);
    }
  } else {
    State.passByReference(Argument);
  }
}

Expected<AllocationState>
Classifier::classifyCall(ArrayRef<Parameter> Arguments,
                         std::optional<Parameter> ReturnValue) const {
  auto MaybeArguments = unwrapArguments(Arguments, ReturnValue);
  if (not MaybeArguments)
    return MaybeArguments.takeError();
  ArgumentList &List = *MaybeArguments;

  dropEmptyArguments(List);

  TypePtr ReturnType;
  if (ReturnValue and ReturnValue->type()->size() != 0)
    ReturnType = ReturnValue->type();

  SmallVector<TypePtr, 8> Classified;
  for (size_t Index = 0; Index < List.Types.size(); ++Index) {
    const TypePtr &Type = List.Types[Index];
    if (List.isVariadic(Index))
      Classified.push_back(promote(Type, XLEN(), FLEN()));
    else
      Classified.push_back(Type);
  }

  if (ReturnType)
    if (Error PassableError = verifyPassable(*ReturnType))
      return std::move(PassableError);

  for (const TypePtr &Type : Classified)
    if (Error PassableError = verifyPassable(*Type))
      return std::move(PassableError);

  AllocationState State(XLEN(), FLEN());

  uint64_t VariadicCount = 0;
  for (size_t Index = 0; Index < Classified.size(); ++Index) {
    std::string Label;
    if (List.isVariadic(Index))
      Label = makeLabel("varg", VariadicCount++);
    else
      Label = makeLabel("arg", Index);
    State.addArgument(Classified[Index], List.Types[Index], std::move(Label));
  }

  if (ReturnType) {
    State.addReturnValue(ReturnType);
    rvcc_log(Log, "Classifying the return value " << ReturnType->toString());
    LoggerIndent Indent(Log);
    classifyReturnValue(State, ReturnType);
  }

  for (size_t Index = 0; Index < Classified.size(); ++Index) {
    const TypePtr &Type = Classified[Index];
    bool IsVariadic = List.isVariadic(Index);
    rvcc_log(Log,
             "Classifying " << State.labelOf(Type.get()) << ": "
                            << Type->toString());
    LoggerIndent Indent(Log);

    if (State.hasFPRs() and not IsVariadic
        and assignFloatingPoint(State, Type))
      continue;

    assignInteger(State, Type, IsVariadic);
  }

  return State;
}

Expected<AllocationState>
Classifier::classifyReturn(const Parameter &ReturnValue) const {
  if (ReturnValue.isVariadic())
    return createError(ErrorKind::VariadicMisuse,
                       "The return type cannot be variadic");

  auto MaybeState = classifyCall({ ReturnValue });
  if (not MaybeState)
    return MaybeState.takeError();
  AllocationState &State = *MaybeState;

  // The pointer to the memory holding the return value is an argument of the
  // call, not part of the return value
  if (const model::Type *First = State.lookup(Register::a0))
    if (State.isReference(First))
      State.clearRegister(Register::a0);

  if (not State.entries().empty())
    State.markAsReturnValue(0);

  return std::move(State);
}

} // namespace rvcc::abi
