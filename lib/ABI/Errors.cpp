/// \file Errors.cpp
/// Errors reported by the classifier.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "rvcc/ABI/Errors.h"

using namespace llvm;

namespace rvcc::abi {

char ClassificationError::ID;

void ClassificationError::log(raw_ostream &OS) const {
  OS << ErrorKind::getName(Kind) << " error: " << Message;
}

std::error_code ClassificationError::convertToErrorCode() const {
  return inconvertibleErrorCode();
}

ErrorKind::Values takeErrorKind(Error &&Error) {
  rvcc_assert(Error);

  ErrorKind::Values Result = ErrorKind::Invalid;
  auto Extractor = [&Result](const ClassificationError &E) {
    Result = E.kind();
  };
  auto CatchAll = [](const ErrorInfoBase &) {
    rvcc_abort("Unexpected error type");
  };
  handleAllErrors(std::move(Error), Extractor, CatchAll);

  rvcc_assert(Result != ErrorKind::Invalid);
  return Result;
}

} // namespace rvcc::abi
