/// \file Configuration.cpp
/// Register widths and RISC-V ABI presets.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include "llvm/ADT/Twine.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLTraits.h"
#include "llvm/Support/raw_ostream.h"

#include "rvcc/ABI/Configuration.h"
#include "rvcc/ABI/Errors.h"

using namespace llvm;

namespace rvcc::abi {

static bool isValidWidth(uint64_t Width) {
  return Width == 32 or Width == 64 or Width == 128;
}

Error Configuration::verify() const {
  if (not isValidWidth(XLEN))
    return createError(ErrorKind::Configuration,
                       "XLEN must be 32, 64 or 128, got " + Twine(XLEN));

  if (FLEN and not isValidWidth(*FLEN))
    return createError(ErrorKind::Configuration,
                       "FLEN must be 32, 64 or 128, got " + Twine(*FLEN));

  return Error::success();
}

Configuration Configuration::fromABI(ABI::Values V) {
  switch (V) {
  case ABI::ilp32:
    return { 32, std::nullopt };
  case ABI::ilp32f:
    return { 32, 32 };
  case ABI::ilp32d:
    return { 32, 64 };
  case ABI::lp64:
    return { 64, std::nullopt };
  case ABI::lp64f:
    return { 64, 32 };
  case ABI::lp64d:
    return { 64, 64 };
  case ABI::lp64q:
    return { 64, 128 };
  case ABI::Invalid:
  case ABI::Count:
    rvcc_abort("Not a RISC-V ABI");
  }
  rvcc_abort();
}

Expected<Configuration> Configuration::fromABIName(StringRef Name) {
  ABI::Values V = ABI::fromName(Name);
  if (V == ABI::Invalid)
    return createError(ErrorKind::Configuration,
                       "Unknown RISC-V ABI: \"" + Name + "\"");
  return fromABI(V);
}

static void collectDiagnostic(const SMDiagnostic &Diagnostic, void *Context) {
  auto *Messages = static_cast<std::string *>(Context);
  if (not Messages->empty())
    *Messages += "\n";
  *Messages += Diagnostic.getMessage().str();
}

Expected<Configuration> Configuration::fromYAML(StringRef YAML) {
  Configuration Result;
  std::string Messages;

  yaml::Input YAMLInput(YAML, nullptr, collectDiagnostic, &Messages);
  YAMLInput >> Result;

  if (std::error_code EC = YAMLInput.error()) {
    if (Messages.empty())
      Messages = EC.message();
    return createError(ErrorKind::Configuration,
                       "Invalid configuration: " + Twine(Messages));
  }

  if (Error VerifyError = Result.verify())
    return std::move(VerifyError);

  return Result;
}

std::string Configuration::toYAML() const {
  std::string Buffer;
  {
    raw_string_ostream Stream(Buffer);
    yaml::Output YAMLOutput(Stream);
    Configuration Copy = *this;
    YAMLOutput << Copy;
  }
  return Buffer;
}

} // namespace rvcc::abi
