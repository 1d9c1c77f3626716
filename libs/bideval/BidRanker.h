// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_BID_RANKER_H
#define __BIDEVAL_BID_RANKER_H 1

#include <vector>
#include <algorithm>
#include "EvaluationResult.h"
#include "Recommendation.h"
#include "ScoringPolicy.h"

namespace bideval
{
  /**
   * @brief Maps a rounded total score to a recommendation tier.
   *
   * Thresholds are inclusive at their lower bound:
   * total >= award -> Award, total >= shortlist -> Shortlist, else Reject.
   */
  template <class Decimal>
  class RecommendationClassifier
  {
  public:
    RecommendationClassifier(const Decimal& awardThreshold, const Decimal& shortlistThreshold)
      : mAwardThreshold(awardThreshold),
	mShortlistThreshold(shortlistThreshold)
    {}

    explicit RecommendationClassifier(const ScoringPolicy<Decimal>& policy)
      : RecommendationClassifier(policy.awardThreshold, policy.shortlistThreshold)
    {}

    Recommendation classify(const Decimal& totalScore) const
    {
      if (totalScore >= mAwardThreshold)
	return Recommendation::Award;
      if (totalScore >= mShortlistThreshold)
	return Recommendation::Shortlist;

      return Recommendation::Reject;
    }

  private:
    Decimal mAwardThreshold;
    Decimal mShortlistThreshold;
  };

  /**
   * @brief Orders evaluations by total score, highest first, and assigns
   * rankings 1..N.
   *
   * The sort is stable: bids with equal totals keep the order in which they
   * appeared in the request.
   */
  template <class Decimal>
  class BidRanker
  {
  public:
    static std::vector<BidEvaluation<Decimal>> rank(const std::vector<BidEvaluation<Decimal>>& evaluations)
    {
      std::vector<BidEvaluation<Decimal>> ordered(evaluations);
      std::stable_sort(ordered.begin(), ordered.end(),
		       [](const BidEvaluation<Decimal>& lhs, const BidEvaluation<Decimal>& rhs) {
			 return rhs.getTotalScore() < lhs.getTotalScore();
		       });

      std::vector<BidEvaluation<Decimal>> ranked;
      ranked.reserve(ordered.size());
      for (size_t i = 0; i < ordered.size(); ++i)
	ranked.push_back(ordered[i].withRanking(static_cast<unsigned int>(i + 1)));

      return ranked;
    }
  };
}

#endif
