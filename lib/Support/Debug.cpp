/// \file Debug.cpp
/// Implementation of the logging framework.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "llvm/ADT/Twine.h"
#include "llvm/Support/ManagedStatic.h"

#include "rvcc/Support/Assert.h"
#include "rvcc/Support/CommandLine.h"
#include "rvcc/Support/Debug.h"

namespace cl = llvm::cl;
using llvm::Twine;

static cl::opt<unsigned> MaxLocationLength("debug-location-max-length",
                                           cl::desc("emit file and line number "
                                                    "for log messages of at "
                                                    "most this size."),
                                           cl::cat(MainCategory),
                                           cl::init(0));

size_t MaxLoggerNameLength = 0;

/// A global registry for all the loggers
///
/// Loggers are usually global static variables in translation units, the role
/// of this class is collecting them.
class LoggersRegistry {
public:
  void add(Logger *L) { Loggers.push_back(L); }

  size_t size() const { return Loggers.size(); }

  void enable(llvm::StringRef Name) { find(Name)->enable(); }
  void disable(llvm::StringRef Name) { find(Name)->disable(); }

private:
  Logger *find(llvm::StringRef Name) {
    auto It = std::find_if(Loggers.begin(), Loggers.end(), [&](Logger *L) {
      return L->name() == Name;
    });
    if (It == Loggers.end())
      rvcc_abort("Requested logger not available");
    return *It;
  }

private:
  std::vector<Logger *> Loggers;
};

static llvm::ManagedStatic<LoggersRegistry> Loggers;

ScopedDebugFeature::ScopedDebugFeature(std::string Name, bool Enable) :
  Name(Name), Enabled(Enable) {
  if (Enabled)
    Loggers->enable(this->Name);
}

ScopedDebugFeature::~ScopedDebugFeature() {
  if (Enabled)
    Loggers->disable(Name);
}

std::ostream &dbg(std::cerr);

void Logger::flush(const LogTerminator &LineInfo) {
  if (not Enabled)
    return;

  if (MaxLocationLength != 0) {
    std::string Suffix = (Twine(":") + Twine(LineInfo.Line)).str();
    rvcc_assert(Suffix.size() < MaxLocationLength);
    std::string Location(LineInfo.File);
    size_t LastSlash = Location.rfind("/");
    if (LastSlash != std::string::npos)
      Location.erase(0, LastSlash + 1);

    if (Location.size() > MaxLocationLength - Suffix.size())
      Location.erase(MaxLocationLength - Suffix.size(), std::string::npos);

    std::string Pad(MaxLocationLength - Location.size() - Suffix.size(), ' ');
    dbg << "[" << Location << Suffix << Pad << "] ";
  }

  std::string Pad(MaxLoggerNameLength - Name.size(), ' ');
  dbg << "[" << Name.str() << Pad << "] ";
  dbg << std::string(IndentLevel * 2, ' ');

  std::string Data = Buffer.str();
  if (Data.size() > 0 and Data.back() == '\n')
    Data.resize(Data.size() - 1);

  // Continuation lines are aligned with the first one
  const std::string Delimiter = "\n";
  size_t Start = 0;
  size_t End = Data.find(Delimiter);
  dbg << Data.substr(Start, End) << "\n";

  if (End != std::string::npos) {
    Pad = std::string(3 + MaxLoggerNameLength + IndentLevel * 2, ' ');
    do {
      Start = End + Delimiter.length();
      End = Data.find(Delimiter, Start);
      dbg << Pad << Data.substr(Start, End - Start) << "\n";
    } while (End != std::string::npos);
  }

  Buffer.str("");
  Buffer.clear();
}

enum PlaceholderEnum : unsigned {
};

/// `-debug-log=<name>` enables the logger called `<name>`
struct DebugLogOptionList : public cl::list<PlaceholderEnum> {
  using list = cl::list<PlaceholderEnum>;
  DebugLogOptionList() :
    list("debug-log",
         cl::desc("enable verbose logging"),
         cl::cat(MainCategory)) {}

  bool addOccurrence(unsigned Pos,
                     llvm::StringRef ArgName,
                     llvm::StringRef Value,
                     bool MultiArg = false) override {
    Loggers->enable(Value);
    return list::addOccurrence(Pos, ArgName, Value, MultiArg);
  }
};

struct DebugLogOptionWrapper {
  DebugLogOptionList TheOption;
};

static llvm::ManagedStatic<DebugLogOptionWrapper> DebugLogOption;

void Logger::init() {
  Loggers->add(this);
  if (Name.size() > 0) {
    auto &Parser = DebugLogOption->TheOption.getParser();
    Parser.addLiteralOption(Name, Loggers->size(), "");
  }
}

unsigned Logger::IndentLevel;

void Logger::indent(unsigned Level) {
  if (isEnabled())
    IndentLevel += Level;
}

void Logger::unindent(unsigned Level) {
  if (isEnabled()) {
    rvcc_assert(IndentLevel >= Level);
    IndentLevel -= Level;
  }
}
