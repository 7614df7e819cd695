#ifndef RVCC_ASSERT_H
#define RVCC_ASSERT_H

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stdlib.h>

#ifndef __has_builtin
#define __has_builtin(x) 0
#endif

#if __has_builtin(__builtin_assume)
#define rvcc_assume(what) __builtin_assume(what)
#else
#define rvcc_assume(what) \
  do {                    \
  } while (0)
#endif

#ifdef __cplusplus
#define rvcc_boolcast(what) static_cast<bool>(what)
#define rvcc_noreturn [[noreturn]]
#else
#define rvcc_boolcast(what) (bool) (what)
#define rvcc_noreturn __attribute__((noreturn))
#endif

rvcc_noreturn void rvcc_assert_fail(const char *AssertionBody,
                                    const char *Message,
                                    const char *File,
                                    unsigned Line);
rvcc_noreturn void rvcc_check_fail(const char *CheckBody,
                                   const char *Message,
                                   const char *File,
                                   unsigned Line);
rvcc_noreturn void
rvcc_do_abort(const char *Message, const char *File, unsigned Line);

#undef rvcc_noreturn

/// Aborts program execution with a message, in release mode too.
#define rvcc_abort_impl(message)                \
  do {                                          \
    rvcc_do_abort(message, __FILE__, __LINE__); \
  } while (0)

/// Asserts \a what or aborts with \a message, in release mode too.
///
/// Use this macro for conditions that must hold regardless of the build type,
/// e.g. in tests.
#define rvcc_check_impl(what, message)                     \
  do {                                                     \
    bool Condition = rvcc_boolcast(what);                  \
    if (!Condition) {                                      \
      rvcc_check_fail(#what, message, __FILE__, __LINE__); \
    }                                                      \
    rvcc_assume(Condition);                                \
  } while (0)

#ifndef NDEBUG

/// Marks a program path as unreachable. In debug mode, aborts with \a
/// message.
#define rvcc_unreachable_impl(message) rvcc_abort_impl(message)

/// Asserts \a what or, in debug mode, aborts with \a message.
///
/// Internal invariants of the classification algorithm are expressed through
/// this macro: a failure means the algorithm itself is broken, not that the
/// input was invalid.
#define rvcc_assert_impl(what, message)                     \
  do {                                                      \
    bool Condition = rvcc_boolcast(what);                   \
    if (!Condition) {                                       \
      rvcc_assert_fail(#what, message, __FILE__, __LINE__); \
    }                                                       \
    rvcc_assume(Condition);                                 \
  } while (0)

#else

#define rvcc_unreachable_impl(message) __builtin_unreachable()

#define rvcc_assert_impl(what, message) \
  do {                                  \
    (void) sizeof((what));              \
  } while (0)

#endif

#define RVCC_COMMA_IF_INVOKED(...) ,
#define RVCC_CONCAT_TOKENS(a, b) a##b
#define RVCC_CONCAT2(a, b) RVCC_CONCAT_TOKENS(a, b)
#define RVCC_CONCAT5(a, b, c, d, e) \
  RVCC_CONCAT2(RVCC_CONCAT2(RVCC_CONCAT2(RVCC_CONCAT2(a, b), c), d), e)
#define RVCC_GET_10TH(_1, _2, _3, _4, _5, _6, _7, _8, _9, _10, ...) _10

/// Check if the argument list contains a comma
#define RVCC_HAS_COMMA(...) \
  RVCC_GET_10TH(__VA_ARGS__, 1, 1, 1, 1, 1, 1, 1, 1, 0, 0)

/// Check if the argument list is empty, without relying on the GNU
/// `##__VA_ARGS__` extension
#define RVCC_IS_EMPTY(...)                                             \
  RVCC_HAS_COMMA(RVCC_CONCAT5(RVCC_IS_EMPTY_,                          \
                              RVCC_HAS_COMMA(__VA_ARGS__),             \
                              RVCC_HAS_COMMA(RVCC_COMMA_IF_INVOKED     \
                                               __VA_ARGS__),           \
                              RVCC_HAS_COMMA(__VA_ARGS__()),           \
                              RVCC_HAS_COMMA(RVCC_COMMA_IF_INVOKED     \
                                               __VA_ARGS__())))
#define RVCC_IS_EMPTY_0001 ,

#define RVCC_ABORT_0(...) rvcc_abort_impl(__VA_ARGS__)
#define RVCC_ABORT_1(...) rvcc_abort_impl(NULL)
#define rvcc_abort(...) \
  RVCC_CONCAT2(RVCC_ABORT_, RVCC_IS_EMPTY(__VA_ARGS__))(__VA_ARGS__)

#define RVCC_UNREACHABLE_0(...) rvcc_unreachable_impl(__VA_ARGS__)
#define RVCC_UNREACHABLE_1(...) rvcc_unreachable_impl(NULL)
#define rvcc_unreachable(...) \
  RVCC_CONCAT2(RVCC_UNREACHABLE_, RVCC_IS_EMPTY(__VA_ARGS__))(__VA_ARGS__)

#define RVCC_MACRO_1_OR_2(_1, _2, NAME, ...) NAME

#define rvcc_assert_impl_nomsg(what) rvcc_assert_impl(what, NULL)
#define rvcc_assert(...)                                                      \
  RVCC_MACRO_1_OR_2(__VA_ARGS__, rvcc_assert_impl, rvcc_assert_impl_nomsg) \
  (__VA_ARGS__)

#define rvcc_check_impl_nomsg(what) rvcc_check_impl(what, NULL)
#define rvcc_check(...)                                                     \
  RVCC_MACRO_1_OR_2(__VA_ARGS__, rvcc_check_impl, rvcc_check_impl_nomsg) \
  (__VA_ARGS__)

#ifdef __cplusplus
}
#endif

#endif // RVCC_ASSERT_H
