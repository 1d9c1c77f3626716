// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_EVALUATION_RESULT_H
#define __BIDEVAL_EVALUATION_RESULT_H 1

#include <string>
#include <vector>
#include <optional>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "EvaluationCriteria.h"
#include "Recommendation.h"
#include "BidEvaluationException.h"

namespace bideval
{
  /**
   * @brief Scored, ranked and classified output row for one bid.
   *
   * All scores are rounded to two decimal places. A ranking of 0 means the
   * row has not been through BidRanker yet.
   */
  template <class Decimal>
  class BidEvaluation
  {
  public:
    BidEvaluation(const std::string& bidId,
		  const Decimal& priceScore,
		  const Decimal& deliveryScore,
		  const Decimal& qualityScore,
		  const Decimal& experienceScore,
		  const Decimal& sustainabilityScore,
		  const Decimal& totalScore,
		  unsigned int ranking,
		  Recommendation recommendation,
		  const std::string& notes,
		  const std::optional<std::string>& evaluatorNote = std::nullopt)
      : mBidId(bidId),
	mPriceScore(priceScore),
	mDeliveryScore(deliveryScore),
	mQualityScore(qualityScore),
	mExperienceScore(experienceScore),
	mSustainabilityScore(sustainabilityScore),
	mTotalScore(totalScore),
	mRanking(ranking),
	mRecommendation(recommendation),
	mNotes(notes),
	mEvaluatorNote(evaluatorNote)
    {}

    BidEvaluation(const BidEvaluation&) = default;
    BidEvaluation& operator=(const BidEvaluation&) = default;

    BidEvaluation withRanking(unsigned int ranking) const
    {
      BidEvaluation ranked(*this);
      ranked.mRanking = ranking;
      return ranked;
    }

    const std::string& getBidId() const
    {
      return mBidId;
    }

    const Decimal& getPriceScore() const
    {
      return mPriceScore;
    }

    const Decimal& getDeliveryScore() const
    {
      return mDeliveryScore;
    }

    const Decimal& getQualityScore() const
    {
      return mQualityScore;
    }

    const Decimal& getExperienceScore() const
    {
      return mExperienceScore;
    }

    const Decimal& getSustainabilityScore() const
    {
      return mSustainabilityScore;
    }

    const Decimal& getTotalScore() const
    {
      return mTotalScore;
    }

    unsigned int getRanking() const
    {
      return mRanking;
    }

    Recommendation getRecommendation() const
    {
      return mRecommendation;
    }

    const std::string& getNotes() const
    {
      return mNotes;
    }

    const std::optional<std::string>& getEvaluatorNote() const
    {
      return mEvaluatorNote;
    }

  private:
    std::string mBidId;
    Decimal mPriceScore;
    Decimal mDeliveryScore;
    Decimal mQualityScore;
    Decimal mExperienceScore;
    Decimal mSustainabilityScore;
    Decimal mTotalScore;
    unsigned int mRanking;
    Recommendation mRecommendation;
    std::string mNotes;
    std::optional<std::string> mEvaluatorNote;
  };

  /**
   * @brief Aggregate counts over a ranked evaluation list. Only constructible
   * from the evaluations themselves.
   */
  template <class Decimal>
  class EvaluationSummary
  {
  public:
    /**
     * @param rankedEvaluations evaluations in ranking order; must not be empty
     * @throws EmptyBidSetException when there is nothing to summarize
     */
    static EvaluationSummary fromEvaluations(const std::vector<BidEvaluation<Decimal>>& rankedEvaluations)
    {
      if (rankedEvaluations.empty())
	throw EmptyBidSetException("EvaluationSummary: no evaluations to summarize");

      EvaluationSummary summary(rankedEvaluations.front().getBidId(),
				rankedEvaluations.front().getTotalScore());
      summary.mTotalBids = rankedEvaluations.size();

      for (const auto& evaluation : rankedEvaluations)
	{
	  switch (evaluation.getRecommendation())
	    {
	    case Recommendation::Award:
	      ++summary.mRecommendedAwards;
	      break;
	    case Recommendation::Shortlist:
	      ++summary.mShortlisted;
	      break;
	    case Recommendation::Reject:
	      ++summary.mRejected;
	      break;
	    }
	}

      return summary;
    }

    size_t getTotalBids() const
    {
      return mTotalBids;
    }

    size_t getRecommendedAwards() const
    {
      return mRecommendedAwards;
    }

    size_t getShortlisted() const
    {
      return mShortlisted;
    }

    size_t getRejected() const
    {
      return mRejected;
    }

    const std::string& getWinningBidId() const
    {
      return mWinningBidId;
    }

    const Decimal& getWinningScore() const
    {
      return mWinningScore;
    }

  private:
    EvaluationSummary(const std::string& winningBidId, const Decimal& winningScore)
      : mTotalBids(0),
	mRecommendedAwards(0),
	mShortlisted(0),
	mRejected(0),
	mWinningBidId(winningBidId),
	mWinningScore(winningScore)
    {}

    size_t mTotalBids;
    size_t mRecommendedAwards;
    size_t mShortlisted;
    size_t mRejected;
    std::string mWinningBidId;
    Decimal mWinningScore;
  };

  /**
   * @brief Complete response of one evaluation run
   */
  template <class Decimal>
  class EvaluationResult
  {
  public:
    EvaluationResult(const std::string& rfqId,
		     const boost::posix_time::ptime& evaluatedAt,
		     const std::string& evaluatorId,
		     const EvaluationCriteria<Decimal>& criteria,
		     const std::vector<BidEvaluation<Decimal>>& rankedEvaluations)
      : mRfqId(rfqId),
	mEvaluatedAt(evaluatedAt),
	mEvaluatorId(evaluatorId),
	mCriteria(criteria),
	mEvaluations(rankedEvaluations),
	mSummary(EvaluationSummary<Decimal>::fromEvaluations(rankedEvaluations))
    {}

    const std::string& getRfqId() const
    {
      return mRfqId;
    }

    const boost::posix_time::ptime& getEvaluatedAt() const
    {
      return mEvaluatedAt;
    }

    const std::string& getEvaluatorId() const
    {
      return mEvaluatorId;
    }

    const EvaluationCriteria<Decimal>& getCriteria() const
    {
      return mCriteria;
    }

    const std::vector<BidEvaluation<Decimal>>& getEvaluations() const
    {
      return mEvaluations;
    }

    const EvaluationSummary<Decimal>& getSummary() const
    {
      return mSummary;
    }

  private:
    std::string mRfqId;
    boost::posix_time::ptime mEvaluatedAt;
    std::string mEvaluatorId;
    EvaluationCriteria<Decimal> mCriteria;
    std::vector<BidEvaluation<Decimal>> mEvaluations;
    EvaluationSummary<Decimal> mSummary;
  };
}

#endif
