#include <catch2/catch_test_macros.hpp>
#include "EvaluationCriteria.h"
#include "ScoringPolicy.h"
#include "TestUtils.h"

using namespace bideval;

TEST_CASE ("CriteriaValidator accepts weights summing to 100", "[CriteriaValidator]")
{
  CriteriaValidator<DecimalType> validator;

  REQUIRE_NOTHROW (validator.validate(createEqualCriteria()));
  REQUIRE_NOTHROW (validator.validate(createCriteria("40", "25", "20", "10", "5")));
  REQUIRE_NOTHROW (validator.validate(createCriteria("100", "0", "0", "0", "0")));

  SECTION ("Sums within the 0.01 tolerance are accepted")
    {
      REQUIRE_NOTHROW (validator.validate(createCriteria("20.01", "20", "20", "20", "20")));
      REQUIRE_NOTHROW (validator.validate(createCriteria("19.99", "20", "20", "20", "20")));
    }
}

TEST_CASE ("CriteriaValidator rejects bad sums", "[CriteriaValidator]")
{
  CriteriaValidator<DecimalType> validator;

  SECTION ("Weights summing to 90")
    {
      auto criteria = createCriteria("20", "20", "20", "20", "10");
      REQUIRE (criteria.getWeightSum() == createDecimal("90"));
      REQUIRE_THROWS_AS (validator.validate(criteria), InvalidCriteriaException);

      try
	{
	  validator.validate(criteria);
	  FAIL ("expected InvalidCriteriaException");
	}
      catch (const InvalidCriteriaException& e)
	{
	  REQUIRE (e.getField() == "weights");
	  REQUIRE (e.getReceivedValue() == "90.00");
	}
    }

  SECTION ("Just outside the tolerance")
    {
      REQUIRE_THROWS_AS (validator.validate(createCriteria("20.02", "20", "20", "20", "20")),
			 InvalidCriteriaException);
      REQUIRE_THROWS_AS (validator.validate(createCriteria("19.98", "20", "20", "20", "20")),
			 InvalidCriteriaException);
    }

  SECTION ("Weights summing to more than 100")
    {
      REQUIRE_THROWS_AS (validator.validate(createCriteria("30", "30", "20", "20", "20")),
			 InvalidCriteriaException);
    }

  SECTION ("All zero weights")
    {
      REQUIRE_THROWS_AS (validator.validate(createCriteria("0", "0", "0", "0", "0")),
			 InvalidCriteriaException);
    }
}

TEST_CASE ("CriteriaValidator rejects negative weights", "[CriteriaValidator]")
{
  CriteriaValidator<DecimalType> validator;

  // Sums to 100 but one weight is negative
  auto criteria = createCriteria("60", "-10", "20", "20", "10");

  try
    {
      validator.validate(criteria);
      FAIL ("expected InvalidCriteriaException");
    }
  catch (const InvalidCriteriaException& e)
    {
      REQUIRE (e.getField() == "delivery_weight");
      REQUIRE (e.getReceivedValue() == "-10.00");
    }
}

TEST_CASE ("CriteriaValidator honours a custom tolerance", "[CriteriaValidator]")
{
  CriteriaValidator<DecimalType> strict(createDecimal("0"));
  CriteriaValidator<DecimalType> loose(createDecimal("1"));
  auto criteria = createCriteria("20.5", "20", "20", "20", "20");

  REQUIRE (strict.getTolerance() == createDecimal("0"));
  REQUIRE_THROWS_AS (strict.validate(criteria), InvalidCriteriaException);
  REQUIRE_NOTHROW (loose.validate(criteria));
}

TEST_CASE ("EvaluationCriteria equality", "[EvaluationCriteria]")
{
  REQUIRE (createEqualCriteria() == createCriteria("20", "20", "20", "20", "20"));
  REQUIRE_FALSE (createEqualCriteria() == createCriteria("20", "20", "20", "30", "10"));
}

TEST_CASE ("ScoringPolicy validation", "[ScoringPolicy]")
{
  ScoringPolicy<DecimalType> policy;
  REQUIRE_NOTHROW (policy.validate());

  REQUIRE (policy.complianceWeight == createDecimal("70"));
  REQUIRE (policy.pointsPerCertification == createDecimal("10"));
  REQUIRE (policy.certificationBonusCap == createDecimal("30"));
  REQUIRE (policy.awardThreshold == createDecimal("85"));
  REQUIRE (policy.shortlistThreshold == createDecimal("70"));
  REQUIRE (policy.defaultExperienceScore == createDecimal("75"));
  REQUIRE (policy.defaultSustainabilityScore == createDecimal("60"));
  REQUIRE (policy.weightTolerance == createDecimal("0.01"));

  SECTION ("Shortlist threshold above award threshold")
    {
      policy.shortlistThreshold = createDecimal("90");
      REQUIRE_THROWS_AS (policy.validate(), ScoringPolicyException);
    }

  SECTION ("Constant outside [0, 100]")
    {
      policy.defaultExperienceScore = createDecimal("101");
      REQUIRE_THROWS_AS (policy.validate(), ScoringPolicyException);
    }

  SECTION ("Negative constant")
    {
      policy.pointsPerCertification = createDecimal("-1");
      REQUIRE_THROWS_AS (policy.validate(), ScoringPolicyException);
    }
}
