#pragma once

#define BITTACTOE_XSTR(a) BITTACTOE_STR(a)
#define BITTACTOE_STR(a) #a

/*
 * True iff macro expands to 1. Build flags are passed as -DNAME=1, and an unset NAME stringifies
 * to "NAME", so IS_MACRO_ENABLED(DEBUG_BUILD) is usable in an ordinary if-statement.
 */
#define IS_MACRO_ENABLED(macro) (BITTACTOE_XSTR(macro)[0] == '1')

/*
 * Type-checks its arguments without evaluating them. The LOG_*() macros use this so that a
 * compiled-out log line still catches typos and does not leave locals unused.
 */
#define USE_UNEVALUATED(...) ((void)sizeof(::util::detail::swallow(__VA_ARGS__)))

namespace util {
namespace detail {

template <typename... Ts>
int swallow(Ts&&...);

}  // namespace detail
}  // namespace util
