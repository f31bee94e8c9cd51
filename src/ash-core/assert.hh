#pragma once

// This is a very lean header with minimal dependencies - easy to include everywhere and low cost.
// For formatted assertions with std::format support, use <ash-core/assertf.hh> instead.
#include <ash-core/macros.hh>
#include <ash-core/source_location.hh>

// =========================================================================================================
// ASH_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   Assertions are enabled in ASH_DEBUG and ASH_RELWITHDEBINFO builds.
//   In ASH_RELEASE builds, assertions are disabled unless ASH_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   They catch PROGRAMMER ERRORS early during development.
//   Container contract violations (indexing past the end, splitting a UTF-8 sequence, ...) are
//   programmer errors and are reported through assertions, never through return values.
//
// What assertions are NOT for:
//   - NOT for user input validation
//   - NOT for common/expected error conditions
//   (e.g. gap_string::try_create_from_bytes reports invalid UTF-8 via an empty optional)
//
// Important:
//   Assertions are semantically equivalent to std::terminate().
//   A custom handler (see <ash-core/assert-handler.hh>) may throw to unwind instead.
//   Every container operation checks its preconditions before mutating anything,
//   so an unwinding handler always leaves the container in its previous state.
//
// Usage:
//   ASH_ASSERT(ptr != nullptr, "pointer must not be null");
//   ASH_ASSERT(idx < size(), "index out of bounds");
//
// Note:
//   For formatted messages with arguments, use ASH_ASSERTF from <ash-core/assertf.hh>
//
#define ASH_ASSERT(cond, msg) ASH_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// ASH_ASSERT_ALWAYS - Always-active assertion
//
// Like ASH_ASSERT but remains active in all build configurations, including release builds.
// Use this for checks whose failure would otherwise corrupt memory, i.e. every bounds,
// char-boundary, and capacity check of the gap containers.
//
// Usage:
//   ASH_ASSERT_ALWAYS(index <= size(), "index out of bounds");
//
#define ASH_ASSERT_ALWAYS(cond, msg) ASH_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// ASH_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define ASH_DEBUG_BREAK() ASH_IMPL_DEBUG_BREAK()

// =========================================================================================================
// ASH_BREAK_AND_ABORT - Debug break followed by program termination
//
// Used by ASH_ASSERT after the handler returned.
// The debugger break happens first to allow inspection before termination.
//
#define ASH_BREAK_AND_ABORT() (ASH_DEBUG_BREAK(), ::ash::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ash::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler or prints to stderr
// Note: does not abort, caller must follow with ASH_BREAK_AND_ABORT()
ASH_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, ash::source_location location);

// Checks if a debugger is currently attached to the process
// Platform-specific implementation (Windows: IsDebuggerPresent, Linux: /proc, macOS: sysctl)
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace ash::impl

// Platform-specific debugger break implementation
// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef ASH_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define ASH_IMPL_DEBUG_BREAK() (::ash::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(ASH_COMPILER_POSIX)

// we use a SIGTRAP to signal a trace/breakpoint
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
//       SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
extern "C" int raise(int) noexcept;
#define ASH_IMPL_DEBUG_BREAK() (::ash::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define ASH_IMPL_DEBUG_BREAK() void(0)

#endif

// ASH_ASSERT_ALWAYS implementation - always enabled regardless of build configuration
#define ASH_IMPL_ASSERT_ALWAYS(cond, msg)                                                      \
    do                                                                                         \
    {                                                                                          \
        if (!(cond)) [[unlikely]]                                                              \
        {                                                                                      \
            ::ash::impl::handle_assert_failure(#cond, msg, ::ash::source_location::current()); \
            ASH_BREAK_AND_ABORT();                                                             \
        }                                                                                      \
    } while (false)

// Assert implementation - enabled in debug/relwithdebinfo, optionally in release

#if ASH_ASSERT_ENABLED

#define ASH_IMPL_ASSERT(cond, msg) ASH_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// assertions are stripped, we still check that the expression and message compile
#define ASH_IMPL_ASSERT(cond, msg) \
    do                             \
    {                              \
        ASH_UNUSED(cond);          \
        ASH_UNUSED(msg);           \
    } while (false)

#endif
