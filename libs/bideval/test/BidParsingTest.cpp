#include <catch2/catch_test_macros.hpp>
#include "BidParsing.h"
#include "TestUtils.h"

using namespace bideval;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;

TEST_CASE ("isDecimalLiteral", "[BidParsing]")
{
  REQUIRE (isDecimalLiteral("100"));
  REQUIRE (isDecimalLiteral("12.50"));
  REQUIRE (isDecimalLiteral("-3"));
  REQUIRE (isDecimalLiteral(".5"));
  REQUIRE (isDecimalLiteral("+7.25"));

  REQUIRE_FALSE (isDecimalLiteral(""));
  REQUIRE_FALSE (isDecimalLiteral("-"));
  REQUIRE_FALSE (isDecimalLiteral("."));
  REQUIRE_FALSE (isDecimalLiteral("1e5"));
  REQUIRE_FALSE (isDecimalLiteral("1,000"));
  REQUIRE_FALSE (isDecimalLiteral("1.2.3"));
  REQUIRE_FALSE (isDecimalLiteral("abc"));
}

TEST_CASE ("parseUnitPrice", "[BidParsing]")
{
  REQUIRE (parseUnitPrice<DecimalType>("A", "125.75") == createDecimal("125.75"));
  REQUIRE (parseUnitPrice<DecimalType>("A", "0") == createDecimal("0"));

  try
    {
      parseUnitPrice<DecimalType>("BID-7", "twelve");
      FAIL ("expected MalformedBidException");
    }
  catch (const MalformedBidException& e)
    {
      REQUIRE (e.getBidId() == "BID-7");
      REQUIRE (e.getField() == "unit_price");
      REQUIRE (e.getReceivedValue() == "twelve");
    }
}

TEST_CASE ("parseDeliveryDate date-only forms", "[BidParsing]")
{
  ptime expected(boost::gregorian::date(2025, 3, 15));

  REQUIRE (parseDeliveryDate("A", "2025-03-15") == expected);
  REQUIRE (parseDeliveryDate("A", "20250315") == expected);
  REQUIRE (parseDeliveryDate("A", "  2025-03-15 ") == expected);
}

TEST_CASE ("parseDeliveryDate date-time forms", "[BidParsing]")
{
  boost::gregorian::date day(2025, 3, 15);

  REQUIRE (parseDeliveryDate("A", "2025-03-15T10:30:00") == ptime(day, time_duration(10, 30, 0)));
  REQUIRE (parseDeliveryDate("A", "2025-03-15T10:30:00Z") == ptime(day, time_duration(10, 30, 0)));
  REQUIRE (parseDeliveryDate("A", "20250315T103000") == ptime(day, time_duration(10, 30, 0)));

  SECTION ("Offsets are converted to UTC")
    {
      REQUIRE (parseDeliveryDate("A", "2025-03-15T10:30:00+02:00") == ptime(day, time_duration(8, 30, 0)));
      REQUIRE (parseDeliveryDate("A", "2025-03-15T10:30:00-05:00") == ptime(day, time_duration(15, 30, 0)));
    }
}

TEST_CASE ("parseDeliveryDate rejects bad input", "[BidParsing]")
{
  REQUIRE_THROWS_AS (parseDeliveryDate("A", ""), MalformedBidException);
  REQUIRE_THROWS_AS (parseDeliveryDate("A", "next tuesday"), MalformedBidException);
  REQUIRE_THROWS_AS (parseDeliveryDate("A", "2025-02-30"), MalformedBidException);
  REQUIRE_THROWS_AS (parseDeliveryDate("A", "2025-13-01"), MalformedBidException);
  REQUIRE_THROWS_AS (parseDeliveryDate("A", "2025-03-15T10:30:00+99:75"), MalformedBidException);
  REQUIRE_THROWS_AS (parseDeliveryDate("A", "2025-03-15T10:30:00-24:00"), MalformedBidException);
  REQUIRE_THROWS_AS (parseDeliveryDate("A", "2025-03-15T10:30:00+0560"), MalformedBidException);
  REQUIRE (parseDeliveryDate("A", "2025-03-15T10:30:00+23:59")
	   == ptime(boost::gregorian::date(2025, 3, 14), time_duration(10, 31, 0)));

  try
    {
      parseDeliveryDate("BID-3", "soon");
      FAIL ("expected MalformedBidException");
    }
  catch (const MalformedBidException& e)
    {
      REQUIRE (e.getBidId() == "BID-3");
      REQUIRE (e.getField() == "delivery_date");
      REQUIRE (e.getReceivedValue() == "soon");
    }
}
