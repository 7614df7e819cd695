#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "rvcc/Support/Assert.h"

#define debug_function __attribute__((used, noinline))

/// The stream all the loggers write to
extern std::ostream &dbg;
extern size_t MaxLoggerNameLength;

/// Stream an instance of this class to call Logger::flush()
struct LogTerminator {
  const char *File;
  uint64_t Line;
};
#define DoLog (LogTerminator{ __FILE__, __LINE__ })

/// A named log channel, disabled by default
///
/// Each translation unit declares its own static Logger. Loggers register
/// themselves at construction, so that `-debug-log=<name>` and
/// ScopedDebugFeature can find them by name.
class Logger {
private:
  static unsigned IndentLevel;

public:
  Logger(llvm::StringRef Name) : Name(Name), Enabled(false) { init(); }

  void indent(unsigned Level = 1);
  void unindent(unsigned Level = 1);

  bool isEnabled() const { return Enabled; }
  llvm::StringRef name() const { return Name; }

  void enable() {
    MaxLoggerNameLength = std::max(MaxLoggerNameLength, Name.size());
    Enabled = true;
  }

  void disable() { Enabled = false; }

  /// Emit the buffered line, prefixed by the logger name and indentation
  ///
  /// Usually invoked by streaming DoLog.
  void flush(const LogTerminator &LineInfo = LogTerminator{ "", 0 });

  template<typename T>
  Logger &operator<<(const T &Other) {
    if (Enabled)
      Buffer << Other;
    return *this;
  }

  Logger &operator<<(const LogTerminator &LineInfo) {
    flush(LineInfo);
    return *this;
  }

  Logger &operator<<(const llvm::StringRef &S) { return *this << S.str(); }

private:
  void init();

private:
  llvm::StringRef Name;
  std::stringstream Buffer;
  bool Enabled;
};

/// Increases the indentation of all the loggers while alive
class LoggerIndent {
public:
  LoggerIndent(Logger &L) : L(L) { L.indent(); }
  ~LoggerIndent() { L.unindent(); }

private:
  Logger &L;
};

/// Enables a logger and disables it when it goes out of scope
class ScopedDebugFeature {
public:
  /// \param Name the name of the logger
  /// \param Enable whether to actually enable it or not
  ScopedDebugFeature(std::string Name, bool Enable);

  ~ScopedDebugFeature();

private:
  std::string Name;
  bool Enabled;
};

inline std::string consumeToString(llvm::Error &&Error) {
  rvcc_assert(Error);

  std::string Message;
  {
    llvm::raw_string_ostream Stream(Message);
    Stream << Error;
  }
  llvm::consumeError(std::move(Error));
  return Message;
}

template<typename T>
inline std::string consumeToString(llvm::Expected<T> &Expected) {
  rvcc_assert(not Expected);
  return consumeToString(Expected.takeError());
}

#define rvcc_log(Logger, Expr)   \
  do {                           \
    if ((Logger).isEnabled()) {  \
      (Logger) << Expr << DoLog; \
    }                            \
  } while (0)
