// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_CRITERION_NORMALIZERS_H
#define __BIDEVAL_CRITERION_NORMALIZERS_H 1

#include <vector>
#include <algorithm>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "Bid.h"
#include "DecimalConstants.h"
#include "BidEvaluationException.h"

namespace bideval
{
  /**
   * @brief Min-max scales unit prices across the bid set: the cheapest bid
   * scores 100, the most expensive 0.
   *
   * When every bid has the same price all bids score 100.
   */
  template <class Decimal>
  class PriceNormalizer
  {
  public:
    explicit PriceNormalizer(const std::vector<Bid<Decimal>>& bids)
    {
      if (bids.empty())
	throw EmptyBidSetException("PriceNormalizer: at least one bid is required");

      auto bounds = std::minmax_element(bids.begin(), bids.end(),
					[](const Bid<Decimal>& a, const Bid<Decimal>& b) {
					  return a.getUnitPrice() < b.getUnitPrice();
					});
      mMinPrice = bounds.first->getUnitPrice();
      mMaxPrice = bounds.second->getUnitPrice();
    }

    /**
     * @return unrounded score in [0, 100] for a bid from the normalized set
     */
    Decimal score(const Bid<Decimal>& bid) const
    {
      if (mMaxPrice == mMinPrice)
	return DecimalConstants<Decimal>::DecimalOneHundred;

      Decimal ratio = (mMaxPrice - bid.getUnitPrice()) / (mMaxPrice - mMinPrice);
      return ratio * DecimalConstants<Decimal>::DecimalOneHundred;
    }

    const Decimal& getMinPrice() const
    {
      return mMinPrice;
    }

    const Decimal& getMaxPrice() const
    {
      return mMaxPrice;
    }

  private:
    Decimal mMinPrice;
    Decimal mMaxPrice;
  };

  /**
   * @brief Min-max scales delivery dates across the bid set: the earliest
   * delivery scores 100, the latest 0. Identical dates all score 100.
   */
  template <class Decimal>
  class DeliveryNormalizer
  {
  public:
    explicit DeliveryNormalizer(const std::vector<Bid<Decimal>>& bids)
    {
      if (bids.empty())
	throw EmptyBidSetException("DeliveryNormalizer: at least one bid is required");

      auto bounds = std::minmax_element(bids.begin(), bids.end(),
					[](const Bid<Decimal>& a, const Bid<Decimal>& b) {
					  return a.getDeliveryDate() < b.getDeliveryDate();
					});
      mEarliest = bounds.first->getDeliveryDate();
      mLatest = bounds.second->getDeliveryDate();
    }

    Decimal score(const Bid<Decimal>& bid) const
    {
      if (mLatest == mEarliest)
	return DecimalConstants<Decimal>::DecimalOneHundred;

      // Spans are measured in milliseconds and divided in double precision;
      // a year in milliseconds times 10^7 would overflow the decimal.
      double span = static_cast<double>((mLatest - mEarliest).total_milliseconds());
      double remaining = static_cast<double>((mLatest - bid.getDeliveryDate()).total_milliseconds());

      return Decimal((remaining / span) * 100.0);
    }

    const boost::posix_time::ptime& getEarliest() const
    {
      return mEarliest;
    }

    const boost::posix_time::ptime& getLatest() const
    {
      return mLatest;
    }

  private:
    boost::posix_time::ptime mEarliest;
    boost::posix_time::ptime mLatest;
  };
}

#endif
