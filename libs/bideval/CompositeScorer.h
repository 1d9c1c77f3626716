// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_COMPOSITE_SCORER_H
#define __BIDEVAL_COMPOSITE_SCORER_H 1

#include "EvaluationCriteria.h"
#include "DecimalConstants.h"

namespace bideval
{
  // Unrounded per-dimension scores of one bid
  template <class Decimal>
  struct SubScores
  {
    Decimal price;
    Decimal delivery;
    Decimal quality;
    Decimal experience;
    Decimal sustainability;
  };

  /**
   * @brief Weighted average of the five sub-scores under validated criteria.
   *
   * total = (price*wp + delivery*wd + quality*wq + experience*we + sustainability*ws) / 100
   */
  template <class Decimal>
  class CompositeScorer
  {
  public:
    explicit CompositeScorer(const EvaluationCriteria<Decimal>& criteria)
      : mCriteria(criteria)
    {}

    Decimal total(const SubScores<Decimal>& scores) const
    {
      Decimal weighted = scores.price * mCriteria.getPriceWeight() +
	scores.delivery * mCriteria.getDeliveryWeight() +
	scores.quality * mCriteria.getQualityWeight() +
	scores.experience * mCriteria.getExperienceWeight() +
	scores.sustainability * mCriteria.getSustainabilityWeight();

      return weighted / DecimalConstants<Decimal>::DecimalOneHundred;
    }

  private:
    EvaluationCriteria<Decimal> mCriteria;
  };
}

#endif
