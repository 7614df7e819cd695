/// \file Assert.cpp
/// Reporting of failed assertions, failed checks and aborts.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <cstdlib>

#include "llvm/Support/Signals.h"
#include "llvm/Support/raw_ostream.h"

#include "rvcc/Support/Assert.h"

namespace FailureKind {

enum Values {
  Assertion,
  Check,
  Abort
};

static const char *getName(Values V) {
  switch (V) {
  case Assertion:
    return "Assertion failed";
  case Check:
    return "Check failed";
  case Abort:
    return "Abort";
  }
  return "Failure";
}

} // namespace FailureKind

/// Print what failed and where, followed by a backtrace, then abort
///
/// \p Body and \p Message can be null.
[[noreturn]] static void fail(FailureKind::Values Kind,
                              const char *Body,
                              const char *Message,
                              const char *File,
                              unsigned Line) {
  llvm::raw_ostream &OS = llvm::errs();
  OS << "rvcc: " << FailureKind::getName(Kind) << " at " << File << ":"
     << Line;
  if (Message != nullptr)
    OS << ":\n\n" << Message;
  OS << "\n";

  if (Body != nullptr)
    OS << "\n" << Body << "\n";

  OS << "\n";
  llvm::sys::PrintStackTrace(OS);
  OS.flush();

  abort();
}

void rvcc_assert_fail(const char *AssertionBody,
                      const char *Message,
                      const char *File,
                      unsigned Line) {
  fail(FailureKind::Assertion, AssertionBody, Message, File, Line);
}

void rvcc_check_fail(const char *CheckBody,
                     const char *Message,
                     const char *File,
                     unsigned Line) {
  fail(FailureKind::Check, CheckBody, Message, File, Line);
}

void rvcc_do_abort(const char *Message, const char *File, unsigned Line) {
  fail(FailureKind::Abort, nullptr, Message, File, Line);
}
