// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_SCORING_POLICY_H
#define __BIDEVAL_SCORING_POLICY_H 1

#include <string>
#include "number.h"
#include "DecimalConstants.h"
#include "BidEvaluationException.h"

namespace bideval
{
  /**
   * @brief Policy constants used by the quality scorer, the fallback scorers
   * and the recommendation classifier.
   *
   * The defaults reproduce the procurement policy the evaluation has always
   * used: quality = 70% compliance plus 10 points per certification capped
   * at 30, Award from 85, Shortlist from 70.
   */
  template <class Decimal>
  struct ScoringPolicy
  {
    ScoringPolicy()
      : complianceWeight(DecimalConstants<Decimal>::DecimalSeventy),
	pointsPerCertification(DecimalConstants<Decimal>::DecimalTen),
	certificationBonusCap(DecimalConstants<Decimal>::DecimalThirty),
	qualityCap(DecimalConstants<Decimal>::DecimalOneHundred),
	awardThreshold(DecimalConstants<Decimal>::DecimalEightyFive),
	shortlistThreshold(DecimalConstants<Decimal>::DecimalSeventy),
	defaultExperienceScore(DecimalConstants<Decimal>::DecimalSeventyFive),
	defaultSustainabilityScore(DecimalConstants<Decimal>::DecimalSixty),
	weightTolerance(DecimalConstants<Decimal>::DefaultWeightTolerance)
    {}

    Decimal complianceWeight;            ///< Quality points for a fully compliant bid
    Decimal pointsPerCertification;      ///< Quality points per distinct certification
    Decimal certificationBonusCap;       ///< Maximum certification bonus
    Decimal qualityCap;                  ///< Upper bound of the quality score
    Decimal awardThreshold;              ///< Lowest total score classified Award
    Decimal shortlistThreshold;          ///< Lowest total score classified Shortlist
    Decimal defaultExperienceScore;      ///< Experience score when no history is known
    Decimal defaultSustainabilityScore;  ///< Sustainability score when a bid declares none
    Decimal weightTolerance;             ///< Allowed |sum(weights) - 100|

    /**
     * @throws ScoringPolicyException when a constant lies outside [0, 100]
     * or the Shortlist threshold exceeds the Award threshold
     */
    void validate() const
    {
      checkPercentage("compliance_weight", complianceWeight);
      checkPercentage("points_per_certification", pointsPerCertification);
      checkPercentage("certification_bonus_cap", certificationBonusCap);
      checkPercentage("quality_cap", qualityCap);
      checkPercentage("award_threshold", awardThreshold);
      checkPercentage("shortlist_threshold", shortlistThreshold);
      checkPercentage("default_experience_score", defaultExperienceScore);
      checkPercentage("default_sustainability_score", defaultSustainabilityScore);
      checkPercentage("weight_tolerance", weightTolerance);

      if (awardThreshold < shortlistThreshold)
	throw ScoringPolicyException("ScoringPolicy: shortlist threshold "
				     + num::toFixedString(shortlistThreshold, 2)
				     + " exceeds award threshold "
				     + num::toFixedString(awardThreshold, 2));
    }

  private:
    static void checkPercentage(const std::string& name, const Decimal& value)
    {
      if (value < DecimalConstants<Decimal>::DecimalZero ||
	  DecimalConstants<Decimal>::DecimalOneHundred < value)
	throw ScoringPolicyException("ScoringPolicy: " + name + " must lie in [0, 100], received "
				     + num::toFixedString(value, 2));
    }
  };
}

#endif
