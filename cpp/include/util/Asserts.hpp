#pragma once

#include "util/CppUtil.hpp"
#include "util/Exception.hpp"

#include <format>
#include <source_location>
#include <utility>

/*
 * RELEASE_ASSERT(cond)                    - throws util::ReleaseAssertionError
 * CLEAN_ASSERT(cond, "bad token {}", tok) - throws util::CleanAssertionError (a CleanException)
 * DEBUG_ASSERT(cond, ...)                 - throws util::DebugAssertionError, only if DEBUG_BUILD=1
 *
 * The message is "<MACRO> failed: <message or condition text> [file:line]".
 *
 * A disabled DEBUG_ASSERT still compiles its arguments but never evaluates them.
 */
#define BITTACTOE_ASSERT_IMPL(ERROR_T, COND, ...)                                             \
  ::util::detail::check<ERROR_T>(static_cast<bool>(COND), #COND,                              \
                                 std::source_location::current() __VA_OPT__(, ) __VA_ARGS__)

#define RELEASE_ASSERT(COND, ...) \
  BITTACTOE_ASSERT_IMPL(::util::ReleaseAssertionError, COND __VA_OPT__(, ) __VA_ARGS__)

#define CLEAN_ASSERT(COND, ...) \
  BITTACTOE_ASSERT_IMPL(::util::CleanAssertionError, COND __VA_OPT__(, ) __VA_ARGS__)

#define DEBUG_ASSERT(COND, ...)                                                               \
  do {                                                                                        \
    if (IS_MACRO_ENABLED(DEBUG_BUILD)) {                                                      \
      BITTACTOE_ASSERT_IMPL(::util::DebugAssertionError, COND __VA_OPT__(, ) __VA_ARGS__);   \
    }                                                                                         \
  } while (0)

namespace util {
namespace detail {

template <typename ErrorT>
void check(bool cond, const char* cond_text, const std::source_location& loc) {
  if (cond) return;
  throw ErrorT("{} failed: {} [{}:{}]", ErrorT::kMacroName, cond_text, loc.file_name(),
               loc.line());
}

template <typename ErrorT, typename... Ts>
void check(bool cond, const char*, const std::source_location& loc,
           std::format_string<Ts...> fmt, Ts&&... ts) {
  if (cond) return;
  throw ErrorT("{} failed: {} [{}:{}]", ErrorT::kMacroName,
               std::format(fmt, std::forward<Ts>(ts)...), loc.file_name(), loc.line());
}

}  // namespace detail
}  // namespace util
