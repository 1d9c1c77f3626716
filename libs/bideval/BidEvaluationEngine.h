// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_BID_EVALUATION_ENGINE_H
#define __BIDEVAL_BID_EVALUATION_ENGINE_H 1

#include <memory>
#include <set>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "number.h"
#include "Bid.h"
#include "BidEvaluationException.h"
#include "BidRanker.h"
#include "BidScorer.h"
#include "CompositeScorer.h"
#include "CriterionNormalizers.h"
#include "EvaluationCriteria.h"
#include "EvaluationRequest.h"
#include "EvaluationResult.h"
#include "QualityScorer.h"
#include "ScoringPolicy.h"

namespace bideval
{
  /**
   * @brief Scores, ranks and classifies the bids of one RFQ.
   *
   * evaluate() is a pure function of its arguments: the engine holds only
   * the policy and the injected scorers, all immutable after construction,
   * so one engine may serve concurrent evaluations.
   *
   * Pipeline:
   *  1. validate criteria and bids (nothing is scored if this fails)
   *  2. min-max normalize price and delivery date across the bid set
   *  3. quality from compliance and certifications
   *  4. experience and sustainability from the injected scorers
   *  5. weighted total, rounded to 0.01
   *  6. stable sort, rank and classify
   *  7. summarize
   */
  template <class Decimal>
  class BidEvaluationEngine
  {
  public:
    using BidType = Bid<Decimal>;
    using ScorerPtr = std::shared_ptr<IBidScorer<Decimal>>;

    /**
     * @brief Engine with the default policy and deterministic scorers
     */
    BidEvaluationEngine()
      : BidEvaluationEngine(ScoringPolicy<Decimal>())
    {}

    /**
     * @brief Engine using the policy's fallback scores: a fixed experience
     * score and declared-or-fixed sustainability.
     */
    explicit BidEvaluationEngine(const ScoringPolicy<Decimal>& policy)
      : BidEvaluationEngine(policy,
			    createDefaultExperienceScorer(policy),
			    createDefaultSustainabilityScorer(policy))
    {}

    /**
     * @throws ScoringPolicyException if the policy is inconsistent
     * @throws std::invalid_argument if a scorer is null
     */
    BidEvaluationEngine(const ScoringPolicy<Decimal>& policy,
			ScorerPtr experienceScorer,
			ScorerPtr sustainabilityScorer)
      : mPolicy(policy),
	mExperienceScorer(experienceScorer),
	mSustainabilityScorer(sustainabilityScorer),
	mQualityScorer(policy),
	mClassifier(policy)
    {
      mPolicy.validate();

      if (!mExperienceScorer)
	throw std::invalid_argument("BidEvaluationEngine: experience scorer is required");

      if (!mSustainabilityScorer)
	throw std::invalid_argument("BidEvaluationEngine: sustainability scorer is required");
    }

    static ScorerPtr createDefaultExperienceScorer(const ScoringPolicy<Decimal>& policy)
    {
      return std::make_shared<FixedScorer<Decimal>>(policy.defaultExperienceScore);
    }

    static ScorerPtr createDefaultSustainabilityScorer(const ScoringPolicy<Decimal>& policy)
    {
      return std::make_shared<DeclaredSustainabilityScorer<Decimal>>(
	       std::make_shared<FixedScorer<Decimal>>(policy.defaultSustainabilityScore));
    }

    /**
     * @brief Evaluate a request, stamping the result with the current UTC time
     */
    EvaluationResult<Decimal> evaluate(const EvaluationRequest<Decimal>& request,
				       const std::string& rfqId,
				       const std::string& evaluatorId) const
    {
      return evaluate(request, rfqId, evaluatorId,
		      boost::posix_time::microsec_clock::universal_time());
    }

    /**
     * @throws InvalidCriteriaException, EmptyBidSetException, MalformedBidException
     * before any scoring takes place
     * @throws ScorerRangeException if an injected scorer leaves [0, 100]
     */
    EvaluationResult<Decimal> evaluate(const EvaluationRequest<Decimal>& request,
				       const std::string& rfqId,
				       const std::string& evaluatorId,
				       const boost::posix_time::ptime& evaluatedAt) const
    {
      validateRequest(request);

      const std::vector<BidType>& bids = request.getBids();
      PriceNormalizer<Decimal> priceNormalizer(bids);
      DeliveryNormalizer<Decimal> deliveryNormalizer(bids);
      CompositeScorer<Decimal> compositeScorer(request.getCriteria());

      std::vector<BidEvaluation<Decimal>> evaluations;
      evaluations.reserve(bids.size());

      for (const auto& bid : bids)
	{
	  SubScores<Decimal> scores;
	  scores.price = priceNormalizer.score(bid);
	  scores.delivery = deliveryNormalizer.score(bid);
	  scores.quality = mQualityScorer.score(bid);
	  scores.experience = checkedScore(*mExperienceScorer, bid);
	  scores.sustainability = checkedScore(*mSustainabilityScorer, bid);

	  Decimal total = num::roundToHundredths(clampScore(compositeScorer.total(scores)));

	  evaluations.emplace_back(bid.getId(),
				   num::roundToHundredths(clampScore(scores.price)),
				   num::roundToHundredths(clampScore(scores.delivery)),
				   num::roundToHundredths(clampScore(scores.quality)),
				   num::roundToHundredths(scores.experience),
				   num::roundToHundredths(scores.sustainability),
				   total,
				   0,
				   mClassifier.classify(total),
				   createNotes(bid),
				   request.getEvaluatorNote(bid.getId()));
	}

      return EvaluationResult<Decimal>(rfqId, evaluatedAt, evaluatorId,
				       request.getCriteria(),
				       BidRanker<Decimal>::rank(evaluations));
    }

    /**
     * @brief All-or-nothing input validation run ahead of scoring
     */
    void validateRequest(const EvaluationRequest<Decimal>& request) const
    {
      CriteriaValidator<Decimal>(mPolicy.weightTolerance).validate(request.getCriteria());

      if (request.getBids().empty())
	throw EmptyBidSetException("Bid evaluation requires at least one bid");

      std::set<std::string> seenIds;
      for (const auto& bid : request.getBids())
	{
	  validateBid(bid);

	  if (!seenIds.insert(bid.getId()).second)
	    throw MalformedBidException(bid.getId(), "id", bid.getId(),
					"Bid id " + bid.getId() + " appears more than once");
	}
    }

    const ScoringPolicy<Decimal>& getPolicy() const
    {
      return mPolicy;
    }

    const IBidScorer<Decimal>& getExperienceScorer() const
    {
      return *mExperienceScorer;
    }

    const IBidScorer<Decimal>& getSustainabilityScorer() const
    {
      return *mSustainabilityScorer;
    }

  private:
    static void validateBid(const BidType& bid)
    {
      if (bid.getId().empty())
	throw MalformedBidException(bid.getId(), "id", "",
				    "Bid id must not be empty");

      if (bid.getUnitPrice() < DecimalConstants<Decimal>::DecimalZero)
	throw MalformedBidException(bid.getId(), "unit_price", num::toFixedString(bid.getUnitPrice(), 2),
				    "Bid " + bid.getId() + ": unit_price must not be negative (received "
				    + num::toFixedString(bid.getUnitPrice(), 2) + ")");

      if (bid.getDeliveryDate().is_special())
	throw MalformedBidException(bid.getId(), "delivery_date",
				    boost::posix_time::to_simple_string(bid.getDeliveryDate()),
				    "Bid " + bid.getId() + ": delivery_date is not a valid date");

      const auto& declared = bid.getSustainabilityScore();
      if (declared.has_value() && !isPercentage(declared.value()))
	throw MalformedBidException(bid.getId(), "sustainability_score",
				    num::toFixedString(declared.value(), 2),
				    "Bid " + bid.getId() + ": sustainability_score must lie in [0, 100] (received "
				    + num::toFixedString(declared.value(), 2) + ")");
    }

    static bool isPercentage(const Decimal& value)
    {
      return !(value < DecimalConstants<Decimal>::DecimalZero) &&
	!(DecimalConstants<Decimal>::DecimalOneHundred < value);
    }

    static Decimal clampScore(const Decimal& value)
    {
      return num::clamp(value,
			DecimalConstants<Decimal>::DecimalZero,
			DecimalConstants<Decimal>::DecimalOneHundred);
    }

    static Decimal checkedScore(const IBidScorer<Decimal>& scorer, const BidType& bid)
    {
      Decimal value = scorer.score(bid);
      if (!isPercentage(value))
	throw ScorerRangeException(scorer.getName(), bid.getId(),
				   "Scorer " + scorer.getName() + " returned "
				   + num::toFixedString(value, 2) + " for bid "
				   + bid.getId() + "; scores must lie in [0, 100]");
      return value;
    }

    static std::string createNotes(const BidType& bid)
    {
      const boost::posix_time::ptime& delivery = bid.getDeliveryDate();
      std::string deliveryText = (delivery.time_of_day().total_microseconds() == 0)
	? boost::gregorian::to_iso_extended_string(delivery.date())
	: boost::posix_time::to_iso_extended_string(delivery);

      return "Price: $" + num::toFixedString(bid.getUnitPrice(), 2) + ", Delivery: " + deliveryText;
    }

  private:
    ScoringPolicy<Decimal> mPolicy;
    ScorerPtr mExperienceScorer;
    ScorerPtr mSustainabilityScorer;
    QualityScorer<Decimal> mQualityScorer;
    RecommendationClassifier<Decimal> mClassifier;
  };
}

#endif
