#pragma once

#include <format>
#include <stdexcept>
#include <utility>

namespace util {

/*
 * std::runtime_error with a std::format() constructor:
 *
 * throw util::Exception("bad mask: {:#010x}", mask);
 *
 * A plain util::Exception means the program has a bug. Nothing in this codebase catches one; it is
 * left to terminate the process.
 */
class Exception : public std::runtime_error {
 public:
  template <typename... Ts>
  explicit Exception(std::format_string<Ts...> fmt, Ts&&... ts)
      : std::runtime_error(std::format(fmt, std::forward<Ts>(ts)...)) {}
};

/*
 * The program is fine, the input is not: an occupied square, an unknown cmdline option. main()
 * catches these, logs the message and exits with a nonzero status.
 */
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

// Thrown by the macros in util/Asserts.hpp. kMacroName prefixes the message.
class DebugAssertionError : public Exception {
 public:
  static constexpr const char* kMacroName = "DEBUG_ASSERT";
  using Exception::Exception;
};

class ReleaseAssertionError : public Exception {
 public:
  static constexpr const char* kMacroName = "RELEASE_ASSERT";
  using Exception::Exception;
};

class CleanAssertionError : public CleanException {
 public:
  static constexpr const char* kMacroName = "CLEAN_ASSERT";
  using CleanException::CleanException;
};

}  // namespace util
