#pragma once

#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace bidevaluator
{
namespace utils
{

/**
 * @brief Generate a timestamp string for file naming
 *
 * Creates a timestamp in the format "MMM_DD_YYYY_HHMM" suitable for use in filenames.
 * Example: "Mar_01_2025_1430"
 *
 * @return Current timestamp as a formatted string
 */
std::string getCurrentTimestamp();

/**
 * @brief ISO-8601 UTC text for a timestamp, with milliseconds
 *
 * Example: "2025-03-01T10:15:00.250Z". Sub-millisecond digits are dropped. Special values (not-a-date-time,
 * +/-infinity) are written with Boost's simple string form.
 */
std::string toIsoUtcString(const boost::posix_time::ptime& timestamp);

} // namespace utils
} // namespace bidevaluator
