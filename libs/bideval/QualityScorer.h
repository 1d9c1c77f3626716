// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_QUALITY_SCORER_H
#define __BIDEVAL_QUALITY_SCORER_H 1

#include <algorithm>
#include "Bid.h"
#include "ScoringPolicy.h"
#include "DecimalConstants.h"

namespace bideval
{
  /**
   * @brief Scores a bid's quality from its specification compliance and
   * certifications.
   *
   *   complianceRate = compliant / max(requirements, 1)
   *   bonus          = min(certifications * pointsPerCertification, certificationBonusCap)
   *   quality        = min(complianceRate * complianceWeight + bonus, qualityCap)
   *
   * A bid with no compliance lines gets no compliance credit.
   */
  template <class Decimal>
  class QualityScorer
  {
  public:
    explicit QualityScorer(const ScoringPolicy<Decimal>& policy)
      : mComplianceWeight(policy.complianceWeight),
	mPointsPerCertification(policy.pointsPerCertification),
	mCertificationBonusCap(policy.certificationBonusCap),
	mQualityCap(policy.qualityCap)
    {}

    Decimal getComplianceRate(const Bid<Decimal>& bid) const
    {
      size_t requirements = std::max<size_t>(bid.getNumRequirements(), 1);

      return Decimal(static_cast<double>(bid.getNumCompliant())) /
	Decimal(static_cast<double>(requirements));
    }

    Decimal getCertificationBonus(const Bid<Decimal>& bid) const
    {
      Decimal bonus = Decimal(static_cast<double>(bid.getNumCertifications())) * mPointsPerCertification;
      return std::min(bonus, mCertificationBonusCap);
    }

    Decimal score(const Bid<Decimal>& bid) const
    {
      Decimal raw = getComplianceRate(bid) * mComplianceWeight + getCertificationBonus(bid);
      return std::min(raw, mQualityCap);
    }

  private:
    Decimal mComplianceWeight;
    Decimal mPointsPerCertification;
    Decimal mCertificationBonusCap;
    Decimal mQualityCap;
  };
}

#endif
