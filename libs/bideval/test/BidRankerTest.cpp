#include <catch2/catch_test_macros.hpp>
#include "BidRanker.h"
#include "TestUtils.h"

using namespace bideval;

namespace
{
  BidEvaluation<DecimalType> createEvaluation(const std::string& bidId,
					      const std::string& total,
					      Recommendation recommendation = Recommendation::Reject)
  {
    DecimalType score = createDecimal(total);
    return BidEvaluation<DecimalType>(bidId, score, score, score, score, score, score,
				      0, recommendation, "Price: $1.00, Delivery: 2025-03-01");
  }
}

TEST_CASE ("RecommendationClassifier threshold boundaries", "[BidRanker]")
{
  RecommendationClassifier<DecimalType> classifier(ScoringPolicy<DecimalType>{});

  REQUIRE (classifier.classify(createDecimal("100.00")) == Recommendation::Award);
  REQUIRE (classifier.classify(createDecimal("85.00")) == Recommendation::Award);
  REQUIRE (classifier.classify(createDecimal("84.99")) == Recommendation::Shortlist);
  REQUIRE (classifier.classify(createDecimal("70.00")) == Recommendation::Shortlist);
  REQUIRE (classifier.classify(createDecimal("69.99")) == Recommendation::Reject);
  REQUIRE (classifier.classify(createDecimal("0")) == Recommendation::Reject);
}

TEST_CASE ("RecommendationClassifier custom thresholds", "[BidRanker]")
{
  RecommendationClassifier<DecimalType> classifier(createDecimal("90"), createDecimal("50"));

  REQUIRE (classifier.classify(createDecimal("89.99")) == Recommendation::Shortlist);
  REQUIRE (classifier.classify(createDecimal("90")) == Recommendation::Award);
  REQUIRE (classifier.classify(createDecimal("50")) == Recommendation::Shortlist);
  REQUIRE (classifier.classify(createDecimal("49.99")) == Recommendation::Reject);
}

TEST_CASE ("BidRanker orders by total descending", "[BidRanker]")
{
  std::vector<BidEvaluation<DecimalType>> evaluations = {
    createEvaluation("low", "40"),
    createEvaluation("high", "90"),
    createEvaluation("middle", "72.5")
  };

  auto ranked = BidRanker<DecimalType>::rank(evaluations);

  REQUIRE (ranked.size() == 3);
  REQUIRE (ranked[0].getBidId() == "high");
  REQUIRE (ranked[0].getRanking() == 1);
  REQUIRE (ranked[1].getBidId() == "middle");
  REQUIRE (ranked[1].getRanking() == 2);
  REQUIRE (ranked[2].getBidId() == "low");
  REQUIRE (ranked[2].getRanking() == 3);

  // input untouched
  REQUIRE (evaluations[0].getBidId() == "low");
  REQUIRE (evaluations[0].getRanking() == 0);
}

TEST_CASE ("BidRanker keeps input order on ties", "[BidRanker]")
{
  std::vector<BidEvaluation<DecimalType>> evaluations = {
    createEvaluation("first", "80"),
    createEvaluation("best", "95"),
    createEvaluation("second", "80"),
    createEvaluation("third", "80")
  };

  auto ranked = BidRanker<DecimalType>::rank(evaluations);

  REQUIRE (ranked[0].getBidId() == "best");
  REQUIRE (ranked[1].getBidId() == "first");
  REQUIRE (ranked[2].getBidId() == "second");
  REQUIRE (ranked[3].getBidId() == "third");

  for (size_t i = 0; i < ranked.size(); ++i)
    REQUIRE (ranked[i].getRanking() == i + 1);
}

TEST_CASE ("BidRanker on an empty list", "[BidRanker]")
{
  std::vector<BidEvaluation<DecimalType>> none;
  REQUIRE (BidRanker<DecimalType>::rank(none).empty());
}

TEST_CASE ("EvaluationSummary counts tiers", "[EvaluationResult]")
{
  std::vector<BidEvaluation<DecimalType>> ranked = BidRanker<DecimalType>::rank({
      createEvaluation("A", "90", Recommendation::Award),
      createEvaluation("B", "75", Recommendation::Shortlist),
      createEvaluation("C", "71", Recommendation::Shortlist),
      createEvaluation("D", "10", Recommendation::Reject)
    });

  auto summary = EvaluationSummary<DecimalType>::fromEvaluations(ranked);

  REQUIRE (summary.getTotalBids() == 4);
  REQUIRE (summary.getRecommendedAwards() == 1);
  REQUIRE (summary.getShortlisted() == 2);
  REQUIRE (summary.getRejected() == 1);
  REQUIRE (summary.getWinningBidId() == "A");
  REQUIRE (summary.getWinningScore() == createDecimal("90"));

  std::vector<BidEvaluation<DecimalType>> none;
  REQUIRE_THROWS_AS (EvaluationSummary<DecimalType>::fromEvaluations(none), EmptyBidSetException);
}

TEST_CASE ("Recommendation wire names", "[Recommendation]")
{
  REQUIRE (getRecommendationString(Recommendation::Award) == "award");
  REQUIRE (getRecommendationString(Recommendation::Shortlist) == "shortlist");
  REQUIRE (getRecommendationString(Recommendation::Reject) == "reject");
}
