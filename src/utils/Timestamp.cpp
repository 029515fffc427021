#include "Timestamp.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils
{

std::string format_local_time(std::chrono::system_clock::time_point tp, bool with_zone)
{
    auto time_t_now = std::chrono::system_clock::to_time_t(tp);

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::stringstream ss;
    ss << std::put_time(&tm_buf, with_zone ? "%Y-%m-%d %H:%M:%S %Z" : "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
