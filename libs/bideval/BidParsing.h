// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_BID_PARSING_H
#define __BIDEVAL_BID_PARSING_H 1

#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BidEvaluationException.h"
#include "DecimalConstants.h"

namespace bideval
{
  /**
   * @brief True when text is an optionally signed plain decimal literal
   * ("100", "-3", "12.50", ".5"). Exponents and thousands separators are
   * not accepted.
   */
  bool isDecimalLiteral(const std::string& text);

  /**
   * @brief Parse a delivery date into a UTC instant.
   *
   * Accepted forms:
   *  - YYYY-MM-DD and YYYYMMDD (midnight of that day)
   *  - YYYY-MM-DDTHH:MM:SS[.ffffff] with an optional 'Z' or +HH:MM / -HH:MM offset
   *  - YYYYMMDDTHHMMSS
   *
   * @param bidId Bid the date belongs to, used for error context
   * @param text The date as received
   * @throws MalformedBidException when the text is not a valid date
   */
  boost::posix_time::ptime parseDeliveryDate(const std::string& bidId, const std::string& text);

  /**
   * @brief Parse a unit price received as text.
   *
   * Sign is not checked here; a negative price is rejected by request
   * validation so the error names the value the caller sent.
   *
   * @throws MalformedBidException when text is not a decimal literal
   */
  template <class Decimal>
  Decimal parseUnitPrice(const std::string& bidId, const std::string& text)
  {
    if (!isDecimalLiteral(text))
      throw MalformedBidException(bidId, "unit_price", text,
				  "Bid " + bidId + ": unit_price '" + text + "' is not a decimal number");

    return DecimalConstants<Decimal>::createDecimal(text);
  }
}

#endif
