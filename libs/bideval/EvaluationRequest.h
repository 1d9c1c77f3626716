// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_EVALUATION_REQUEST_H
#define __BIDEVAL_EVALUATION_REQUEST_H 1

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Bid.h"
#include "EvaluationCriteria.h"

namespace bideval
{
  /**
   * @brief Input of one evaluation run: the weighting, the bids and any
   * advisory evaluator notes keyed by bid id. Notes never affect scoring.
   */
  template <class Decimal>
  class EvaluationRequest
  {
  public:
    EvaluationRequest(const EvaluationCriteria<Decimal>& criteria,
		      const std::vector<Bid<Decimal>>& bids,
		      const std::map<std::string, std::string>& evaluatorNotes = {})
      : mCriteria(criteria),
	mBids(bids),
	mEvaluatorNotes(evaluatorNotes)
    {}

    const EvaluationCriteria<Decimal>& getCriteria() const
    {
      return mCriteria;
    }

    const std::vector<Bid<Decimal>>& getBids() const
    {
      return mBids;
    }

    std::optional<std::string> getEvaluatorNote(const std::string& bidId) const
    {
      auto it = mEvaluatorNotes.find(bidId);
      if (it == mEvaluatorNotes.end())
	return std::nullopt;

      return it->second;
    }

  private:
    EvaluationCriteria<Decimal> mCriteria;
    std::vector<Bid<Decimal>> mBids;
    std::map<std::string, std::string> mEvaluatorNotes;
  };
}

#endif
