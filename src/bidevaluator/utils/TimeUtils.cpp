#include "TimeUtils.h"
#include <chrono>
#include <sstream>
#include <iomanip>

namespace bidevaluator
{
namespace utils
{

std::string getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%b_%d_%Y_%H%M");
    return ss.str();
}

std::string toIsoUtcString(const boost::posix_time::ptime& timestamp)
{
    if (timestamp.is_special())
        return boost::posix_time::to_simple_string(timestamp);

    // Boost writes fractional seconds with a comma; append milliseconds by hand
    const boost::posix_time::time_duration timeOfDay = timestamp.time_of_day();
    boost::posix_time::ptime whole(timestamp.date(),
                                   boost::posix_time::seconds(
                                       static_cast<long>(timeOfDay.total_seconds())));
    long millis = static_cast<long>(timeOfDay.total_milliseconds() % 1000);

    std::ostringstream ss;
    ss << boost::posix_time::to_iso_extended_string(whole)
       << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

} // namespace utils
} // namespace bidevaluator
