#pragma once

#include <source_location>

namespace ash
{
/// Type alias for std::source_location
/// Used by the assertion macros to report the failing call site
using source_location = std::source_location;
} // namespace ash
