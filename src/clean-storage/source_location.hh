#pragma once

#include <source_location>

namespace cs
{
/// Type alias for std::source_location
/// Captured by the assertion macros so failure reports point at the violated precondition
using source_location = std::source_location;
} // namespace cs
