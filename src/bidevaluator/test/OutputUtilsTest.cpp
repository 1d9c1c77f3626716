#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include "utils/OutputUtils.h"
#include "utils/TimeUtils.h"

using namespace bidevaluator::utils;

TEST_CASE ("TeeStream mirrors output to both streams", "[OutputUtils]")
{
  std::ostringstream console;
  std::ostringstream logFile;

  TeeStream tee(console, logFile);
  tee << "Evaluating 3 bids" << std::endl;
  tee << 42 << std::flush;

  REQUIRE (console.str() == "Evaluating 3 bids\n42");
  REQUIRE (logFile.str() == console.str());
}

TEST_CASE ("Evaluation file names", "[OutputUtils]")
{
  REQUIRE (sanitizeFileNameComponent("RFQ-2025_001") == "RFQ-2025_001");
  REQUIRE (sanitizeFileNameComponent("RFQ 2025/001") == "RFQ_2025_001");
  REQUIRE (sanitizeFileNameComponent("") == "unnamed");

  std::string logName = createEvaluationLogFileName("RFQ-9");
  REQUIRE (logName.find("RFQ-9_Evaluation_Log_") == 0);
  REQUIRE (logName.size() > std::string("RFQ-9_Evaluation_Log_.txt").size());
  REQUIRE (logName.substr(logName.size() - 4) == ".txt");

  std::string reportName = createEvaluationReportFileName("RFQ-9");
  REQUIRE (reportName.find("RFQ-9_Evaluation_Report_") == 0);

  REQUIRE_FALSE (getCurrentTimestamp().empty());
}

TEST_CASE ("ISO UTC timestamps", "[TimeUtils]")
{
  using boost::posix_time::ptime;
  using boost::posix_time::time_duration;

  ptime withFraction(boost::gregorian::date(2025, 1, 2),
                     time_duration(3, 4, 5) + boost::posix_time::microseconds(250000));
  REQUIRE (toIsoUtcString(withFraction) == "2025-01-02T03:04:05.250Z");

  ptime sameSecond(boost::gregorian::date(2025, 1, 2),
                   time_duration(3, 4, 5) + boost::posix_time::microseconds(7999));
  REQUIRE (toIsoUtcString(sameSecond) == "2025-01-02T03:04:05.007Z");
  REQUIRE (toIsoUtcString(sameSecond) != toIsoUtcString(withFraction));

  ptime midnight(boost::gregorian::date(2025, 12, 31));
  REQUIRE (toIsoUtcString(midnight) == "2025-12-31T00:00:00.000Z");

  REQUIRE (toIsoUtcString(ptime()) == "not-a-date-time");
}
