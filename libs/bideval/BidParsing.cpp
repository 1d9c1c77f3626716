// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "BidParsing.h"
#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace bideval
{
  using boost::posix_time::ptime;
  using boost::posix_time::time_duration;

  static MalformedBidException malformedDate(const std::string& bidId, const std::string& text)
  {
    return MalformedBidException(bidId, "delivery_date", text,
				 "Bid " + bidId + ": delivery_date '" + text + "' is not a valid date");
  }

  // Splits a trailing UTC offset ("Z", "+02:00", "-0530") off an ISO time
  // component. Returns the offset to subtract to get UTC.
  static time_duration stripUtcOffset(std::string& timePart)
  {
    if (!timePart.empty() && (timePart.back() == 'Z' || timePart.back() == 'z'))
      {
	timePart.pop_back();
	return time_duration(0, 0, 0);
      }

    std::string::size_type signPos = timePart.find_last_of("+-");
    if (signPos == std::string::npos || signPos == 0)
      return time_duration(0, 0, 0);

    std::string offset = timePart.substr(signPos + 1);
    boost::erase_all(offset, ":");
    if (offset.size() != 4 || !std::all_of(offset.begin(), offset.end(),
					   [](unsigned char c) { return std::isdigit(c) != 0; }))
      throw std::invalid_argument("bad UTC offset");

    int hours = std::stoi(offset.substr(0, 2));
    int minutes = std::stoi(offset.substr(2, 2));
    if (hours > 23 || minutes > 59)
      throw std::out_of_range("UTC offset out of range");

    time_duration shift(hours, minutes, 0);
    bool negative = timePart[signPos] == '-';
    timePart.erase(signPos);

    return negative ? shift.invert_sign() : shift;
  }

  bool isDecimalLiteral(const std::string& text)
  {
    if (text.empty())
      return false;

    std::string::size_type pos = 0;
    if (text[0] == '+' || text[0] == '-')
      pos = 1;

    bool seenDigit = false;
    bool seenPoint = false;
    for (; pos < text.size(); ++pos)
      {
	unsigned char c = static_cast<unsigned char>(text[pos]);
	if (std::isdigit(c))
	  seenDigit = true;
	else if (c == '.' && !seenPoint)
	  seenPoint = true;
	else
	  return false;
      }

    return seenDigit;
  }

  ptime parseDeliveryDate(const std::string& bidId, const std::string& text)
  {
    std::string trimmed = boost::algorithm::trim_copy(text);
    if (trimmed.empty())
      throw malformedDate(bidId, text);

    ptime result;
    try
      {
	std::string::size_type tPos = trimmed.find_first_of("Tt");
	if (tPos == std::string::npos)
	  {
	    boost::gregorian::date d = (trimmed.find('-') == std::string::npos)
	      ? boost::gregorian::from_undelimited_string(trimmed)
	      : boost::gregorian::from_simple_string(trimmed);
	    result = ptime(d);
	  }
	else
	  {
	    std::string datePart = trimmed.substr(0, tPos);
	    std::string timePart = trimmed.substr(tPos + 1);
	    time_duration offset = stripUtcOffset(timePart);
	    std::string local = datePart + "T" + timePart;

	    ptime parsed = (datePart.find('-') == std::string::npos)
	      ? boost::posix_time::from_iso_string(local)
	      : boost::posix_time::from_iso_extended_string(local);
	    result = parsed - offset;
	  }
      }
    catch (const std::exception&)
      {
	throw malformedDate(bidId, text);
      }

    if (result.is_special())
      throw malformedDate(bidId, text);

    return result;
  }
}
