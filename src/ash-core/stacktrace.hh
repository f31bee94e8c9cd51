#pragma once

#include <stacktrace>

namespace ash
{
/// Type alias for std::stacktrace
/// The default assertion handler prints one of these after the failure message
using stacktrace = std::stacktrace;
} // namespace ash
