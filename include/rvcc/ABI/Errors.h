#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "rvcc/Support/Assert.h"

namespace rvcc::abi {

namespace ErrorKind {

enum Values {
  Invalid,
  /// The register widths or the configuration document are not acceptable
  Configuration,
  /// The same type instance has been used twice in a call
  Usage,
  /// Variadic arguments are not the last parameter, are nested or are used
  /// as a return type
  VariadicMisuse,
  /// A type that can be described but not passed, such as a bare array
  UnsupportedConstruct,
  Count
};

inline llvm::StringRef getName(Values V) {
  switch (V) {
  case Invalid:
    return "Invalid";
  case Configuration:
    return "Configuration";
  case Usage:
    return "Usage";
  case VariadicMisuse:
    return "VariadicMisuse";
  case UnsupportedConstruct:
    return "UnsupportedConstruct";
  case Count:
    rvcc_abort();
    break;
  }
  rvcc_abort();
}

} // namespace ErrorKind

/// Error reported when a call cannot be classified or when a classifier
/// cannot be created
class ClassificationError : public llvm::ErrorInfo<ClassificationError> {
public:
  static char ID;

private:
  ErrorKind::Values Kind;
  std::string Message;

public:
  ClassificationError(ErrorKind::Values Kind, const llvm::Twine &Message) :
    Kind(Kind), Message(Message.str()) {}

public:
  ErrorKind::Values kind() const { return Kind; }

  /// The message alone, without the kind
  std::string message() const override { return Message; }

public:
  std::error_code convertToErrorCode() const override;
  void log(llvm::raw_ostream &OS) const override;
};

inline llvm::Error createError(ErrorKind::Values Kind,
                               const llvm::Twine &Message) {
  return llvm::make_error<ClassificationError>(Kind, Message);
}

/// Consume \p Error and return its kind
///
/// \note any error other than a ClassificationError is a programming error.
ErrorKind::Values takeErrorKind(llvm::Error &&Error);

} // namespace rvcc::abi
