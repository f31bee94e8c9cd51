#include "assert.hh"

#include <ash-core/assert-handler.hh>
#include <ash-core/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#ifdef ASH_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef ASH_COMPILER_POSIX
#include <unistd.h>

#include <cstring>
#endif

namespace
{
// Global stack of assertion handlers
// NOTE: This is not thread-safe and must be externally synchronized
std::vector<std::move_only_function<void(ash::impl::assertion_info const&)>> g_assertion_handlers;

// Default assertion handler, the only place where ash-core writes diagnostics
void default_assert_handler(ash::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";

    std::cerr << "\nStacktrace:\n";
    auto trace = ash::stacktrace::current();
    std::cerr << std::to_string(trace) << '\n';
}
} // namespace

void ash::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void ash::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

ash::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

ash::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

ASH_COLD_FUNC void ash::impl::handle_assert_failure(char const* expression, char const* message, ash::source_location location)
{
    assertion_info const info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    // Call the topmost handler if available, otherwise use default handler
    if (!g_assertion_handlers.empty())
    {
        g_assertion_handlers.back()(info);
    }
    else
    {
        default_assert_handler(info);
    }

    // no abort here, it's outside
}

bool ash::impl::is_debugger_connected() noexcept
{
#ifdef ASH_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(ASH_OS_LINUX)
    // Check /proc/self/status for TracerPid
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                std::sscanf(buf + 10, "%d", &pid);
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#elif defined(ASH_OS_APPLE)
    // Use sysctl to check P_TRACED flag
    extern "C" int sysctl(int*, unsigned int, void*, unsigned long*, void*, unsigned long) noexcept;

    int mib[4] = {1 /* CTL_KERN */, 14 /* KERN_PROC */, 1 /* KERN_PROC_PID */, 0};
    mib[3] = getpid();

    struct kinfo_proc
    {
        char pad[32];
        int p_flag;
    } info{};

    unsigned long size = sizeof(info);
    if (sysctl(mib, 4, &info, &size, nullptr, 0) == 0)
        return (info.p_flag & 0x00000800 /* P_TRACED */) != 0;

    return false;
#else
    return false;
#endif
}

[[noreturn]] void ash::impl::perform_abort() noexcept
{
    std::abort();
}
