#pragma once

#include <ash-core/assert.hh>

#include <format>

// =========================================================================================================
// ASH_ASSERTF - Runtime assertion with formatted message
//
// The formatted version of ASH_ASSERT, supporting std::format-style arguments.
// Same activation rules as ASH_ASSERT (see <ash-core/assert.hh>).
// The arguments are only evaluated when the condition fails.
//
// Usage:
//   ASH_ASSERTF(size > 0, "size must be positive, got {}", size);
//   ASH_ASSERTF(ptr != nullptr, "allocation of {} bytes failed", bytes);
//
// Note:
//   For simple string literal messages without formatting, prefer ASH_ASSERT from <ash-core/assert.hh>
//   as it has minimal dependencies and can be used in low-level code.
//
#define ASH_ASSERTF(cond, msg, ...) ASH_IMPL_ASSERTF(cond, msg, ##__VA_ARGS__)

// =========================================================================================================
// ASH_ASSERTF_ALWAYS - Always-active assertion with formatted message
//
// Like ASH_ASSERTF but remains active in all build configurations, including release builds.
//
#define ASH_ASSERTF_ALWAYS(cond, msg, ...) ASH_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define ASH_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                     \
    {                                                                                                      \
        if (!(cond)) [[unlikely]]                                                                          \
        {                                                                                                  \
            ::ash::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                               ::ash::source_location::current());                         \
            ASH_BREAK_AND_ABORT();                                                                         \
        }                                                                                                  \
    } while (false)

#if ASH_ASSERT_ENABLED

#define ASH_IMPL_ASSERTF(cond, msg, ...) ASH_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)

#else

// assertions are stripped, we still check that the format string compiles
#define ASH_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                           \
    {                                                            \
        ASH_UNUSED(cond);                                        \
        ASH_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)

#endif
