#include <catch2/catch_test_macros.hpp>
#include "QualityScorer.h"
#include "TestUtils.h"

using namespace bideval;

TEST_CASE ("QualityScorer compliance rate", "[QualityScorer]")
{
  ScoringPolicy<DecimalType> policy;
  QualityScorer<DecimalType> scorer(policy);
  auto day1 = createDeliveryDate(2025, 3, 1);

  SECTION ("Fully compliant, no certifications")
    {
      auto bid = createBid("A", "100", day1, {true, true});
      REQUIRE (scorer.getComplianceRate(bid) == createDecimal("1"));
      REQUIRE (scorer.score(bid) == createDecimal("70"));
    }

  SECTION ("Half compliant")
    {
      auto bid = createBid("B", "100", day1, {true, false});
      REQUIRE (scorer.getComplianceRate(bid) == createDecimal("0.5"));
      REQUIRE (scorer.score(bid) == createDecimal("35"));
    }

  SECTION ("Empty compliance list earns nothing")
    {
      auto bid = createBid("C", "100", day1, {});
      REQUIRE (scorer.getComplianceRate(bid) == createDecimal("0"));
      REQUIRE (scorer.score(bid) == createDecimal("0"));
    }

  SECTION ("Nothing compliant")
    {
      auto bid = createBid("D", "100", day1, {false, false, false});
      REQUIRE (scorer.score(bid) == createDecimal("0"));
    }
}

TEST_CASE ("QualityScorer certification bonus", "[QualityScorer]")
{
  ScoringPolicy<DecimalType> policy;
  QualityScorer<DecimalType> scorer(policy);
  auto day1 = createDeliveryDate(2025, 3, 1);

  SECTION ("Ten points per certification")
    {
      auto bid = createBid("A", "100", day1, {}, {"ISO9001", "ISO14001"});
      REQUIRE (scorer.getCertificationBonus(bid) == createDecimal("20"));
      REQUIRE (scorer.score(bid) == createDecimal("20"));
    }

  SECTION ("Bonus is capped at 30")
    {
      auto bid = createBid("B", "100", day1, {true}, {"A", "B", "C", "D", "E"});
      REQUIRE (scorer.getCertificationBonus(bid) == createDecimal("30"));
      REQUIRE (scorer.score(bid) == createDecimal("100"));
    }

  SECTION ("Duplicate certifications count once")
    {
      std::set<std::string> certs;
      certs.insert("ISO9001");
      certs.insert("ISO9001");
      auto bid = createBid("C", "100", day1, {}, certs);
      REQUIRE (bid.getNumCertifications() == 1);
      REQUIRE (scorer.getCertificationBonus(bid) == createDecimal("10"));
    }
}

TEST_CASE ("QualityScorer respects the quality cap", "[QualityScorer]")
{
  ScoringPolicy<DecimalType> policy;
  policy.complianceWeight = createDecimal("80");
  policy.qualityCap = createDecimal("90");

  QualityScorer<DecimalType> scorer(policy);
  auto bid = createBid("A", "100", createDeliveryDate(2025, 3, 1), {true}, {"X", "Y"});

  // 80 + 20 would exceed the cap
  REQUIRE (scorer.score(bid) == createDecimal("90"));
}

TEST_CASE ("QualityScorer one third compliance", "[QualityScorer]")
{
  ScoringPolicy<DecimalType> policy;
  QualityScorer<DecimalType> scorer(policy);
  auto bid = createBid("A", "100", createDeliveryDate(2025, 3, 1), {true, false, false});

  REQUIRE (num::roundToHundredths(scorer.score(bid)) == createDecimal("23.33"));
}
