#pragma once

#include <chrono>
#include <string>

namespace utils
{

// "YYYY-MM-DD HH:MM:SS", followed by " <zone abbreviation>" when with_zone is set
std::string format_local_time(std::chrono::system_clock::time_point tp, bool with_zone);

} // namespace utils
