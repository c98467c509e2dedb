#pragma once

#include <chrono>
#include <string>

namespace items_service
{

// Formats a time point as RFC 3339 in UTC, e.g. "2024-05-01T10:20:30.5Z".
//
// The fractional part keeps nanosecond precision without trailing zeros
// and is omitted completely for whole seconds.
std::string
format_rfc3339(std::chrono::system_clock::time_point tp);

// Formats a time point for HTML pages, e.g. "Jan 02, 2006 15:04" (UTC).
std::string
format_for_humans(std::chrono::system_clock::time_point tp);

} /* namespace items_service */
