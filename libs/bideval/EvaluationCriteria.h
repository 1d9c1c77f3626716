// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_EVALUATION_CRITERIA_H
#define __BIDEVAL_EVALUATION_CRITERIA_H 1

#include <string>
#include "number.h"
#include "DecimalConstants.h"
#include "BidEvaluationException.h"

namespace bideval
{
  /**
   * @brief Percentage weights for the five evaluation dimensions.
   *
   * Construction does not validate; CriteriaValidator decides whether a set
   * of weights may be used for scoring.
   */
  template <class Decimal>
  class EvaluationCriteria
  {
  public:
    EvaluationCriteria(const Decimal& priceWeight,
		       const Decimal& deliveryWeight,
		       const Decimal& qualityWeight,
		       const Decimal& experienceWeight,
		       const Decimal& sustainabilityWeight)
      : mPriceWeight(priceWeight),
	mDeliveryWeight(deliveryWeight),
	mQualityWeight(qualityWeight),
	mExperienceWeight(experienceWeight),
	mSustainabilityWeight(sustainabilityWeight)
    {}

    EvaluationCriteria(const EvaluationCriteria&) = default;
    EvaluationCriteria& operator=(const EvaluationCriteria&) = default;

    const Decimal& getPriceWeight() const
    {
      return mPriceWeight;
    }

    const Decimal& getDeliveryWeight() const
    {
      return mDeliveryWeight;
    }

    const Decimal& getQualityWeight() const
    {
      return mQualityWeight;
    }

    const Decimal& getExperienceWeight() const
    {
      return mExperienceWeight;
    }

    const Decimal& getSustainabilityWeight() const
    {
      return mSustainabilityWeight;
    }

    Decimal getWeightSum() const
    {
      return mPriceWeight + mDeliveryWeight + mQualityWeight +
	mExperienceWeight + mSustainabilityWeight;
    }

  private:
    Decimal mPriceWeight;
    Decimal mDeliveryWeight;
    Decimal mQualityWeight;
    Decimal mExperienceWeight;
    Decimal mSustainabilityWeight;
  };

  template <class Decimal>
  inline bool operator==(const EvaluationCriteria<Decimal>& lhs, const EvaluationCriteria<Decimal>& rhs)
  {
    return lhs.getPriceWeight() == rhs.getPriceWeight() &&
      lhs.getDeliveryWeight() == rhs.getDeliveryWeight() &&
      lhs.getQualityWeight() == rhs.getQualityWeight() &&
      lhs.getExperienceWeight() == rhs.getExperienceWeight() &&
      lhs.getSustainabilityWeight() == rhs.getSustainabilityWeight();
  }

  /**
   * @brief Rejects criteria whose weights are negative or do not sum to 100.
   */
  template <class Decimal>
  class CriteriaValidator
  {
  public:
    explicit CriteriaValidator(const Decimal& tolerance = DecimalConstants<Decimal>::DefaultWeightTolerance)
      : mTolerance(tolerance)
    {}

    /**
     * @throws InvalidCriteriaException naming the negative weight, or the
     * weight sum when |sum - 100| exceeds the tolerance
     */
    void validate(const EvaluationCriteria<Decimal>& criteria) const
    {
      checkNonNegative("price_weight", criteria.getPriceWeight());
      checkNonNegative("delivery_weight", criteria.getDeliveryWeight());
      checkNonNegative("quality_weight", criteria.getQualityWeight());
      checkNonNegative("experience_weight", criteria.getExperienceWeight());
      checkNonNegative("sustainability_weight", criteria.getSustainabilityWeight());

      Decimal sum = criteria.getWeightSum();
      Decimal deviation = sum - DecimalConstants<Decimal>::DecimalOneHundred;
      if (deviation < DecimalConstants<Decimal>::DecimalZero)
	deviation = DecimalConstants<Decimal>::DecimalZero - deviation;

      if (mTolerance < deviation)
	throw InvalidCriteriaException("weights", num::toFixedString(sum, 2),
				       "Evaluation criteria weights must sum to 100 (received "
				       + num::toFixedString(sum, 2) + ")");
    }

    const Decimal& getTolerance() const
    {
      return mTolerance;
    }

  private:
    static void checkNonNegative(const std::string& field, const Decimal& weight)
    {
      if (weight < DecimalConstants<Decimal>::DecimalZero)
	throw InvalidCriteriaException(field, num::toFixedString(weight, 2),
				       "Evaluation criteria " + field + " must not be negative (received "
				       + num::toFixedString(weight, 2) + ")");
    }

  private:
    Decimal mTolerance;
  };
}

#endif
