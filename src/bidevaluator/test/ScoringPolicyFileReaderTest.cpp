#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <boost/filesystem.hpp>
#include "number.h"
#include "BidEvaluationException.h"
#include "io/ScoringPolicyFileReader.h"

using namespace bideval;
using namespace bidevaluator::io;

typedef num::DefaultNumber DecimalType;

static DecimalType toDecimal(const std::string& text)
{
  return dec::fromString<DecimalType>(text);
}

TEST_CASE ("ScoringPolicyFileReader parses every section", "[ScoringPolicyFileReader]")
{
  std::string json = R"({
    "quality": { "compliance_weight": 60, "points_per_certification": 15,
                 "certification_bonus_cap": 40, "quality_cap": 100 },
    "thresholds": { "award": 80, "shortlist": 65.5 },
    "fallback_scores": { "experience": 70, "sustainability": 50 },
    "weight_tolerance": 0.05,
    "supplier_history": { "SUP-001": 92.5, "SUP-002": 40 }
  })";

  auto configuration = ScoringPolicyFileReader::parseConfiguration(json);
  const ScoringPolicy<DecimalType>& policy = configuration->getPolicy();

  REQUIRE (policy.complianceWeight == toDecimal("60"));
  REQUIRE (policy.pointsPerCertification == toDecimal("15"));
  REQUIRE (policy.certificationBonusCap == toDecimal("40"));
  REQUIRE (policy.qualityCap == toDecimal("100"));
  REQUIRE (policy.awardThreshold == toDecimal("80"));
  REQUIRE (policy.shortlistThreshold == toDecimal("65.5"));
  REQUIRE (policy.defaultExperienceScore == toDecimal("70"));
  REQUIRE (policy.defaultSustainabilityScore == toDecimal("50"));
  REQUIRE (policy.weightTolerance == toDecimal("0.05"));

  REQUIRE (configuration->getSupplierHistory().size() == 2);
  REQUIRE (configuration->getSupplierHistory().at("SUP-001") == toDecimal("92.5"));
  REQUIRE (configuration->getSupplierHistory().at("SUP-002") == toDecimal("40"));
}

TEST_CASE ("ScoringPolicyFileReader keeps defaults for absent keys", "[ScoringPolicyFileReader]")
{
  auto configuration = ScoringPolicyFileReader::parseConfiguration(R"({ "thresholds": { "award": 90 } })");
  const ScoringPolicy<DecimalType>& policy = configuration->getPolicy();

  REQUIRE (policy.awardThreshold == toDecimal("90"));
  REQUIRE (policy.shortlistThreshold == toDecimal("70"));
  REQUIRE (policy.complianceWeight == toDecimal("70"));
  REQUIRE (policy.defaultExperienceScore == toDecimal("75"));
  REQUIRE (configuration->getSupplierHistory().empty());

  auto empty = ScoringPolicyFileReader::parseConfiguration("{}");
  REQUIRE (empty->getPolicy().awardThreshold == toDecimal("85"));
}

TEST_CASE ("ScoringPolicyFileReader rejects bad policies", "[ScoringPolicyFileReader]")
{
  SECTION ("Invalid JSON")
    {
      REQUIRE_THROWS_AS (ScoringPolicyFileReader::parseConfiguration("{ \"quality\": "),
                         ScoringPolicyException);
    }

  SECTION ("Shortlist above award")
    {
      REQUIRE_THROWS_AS (ScoringPolicyFileReader::parseConfiguration(
                           R"({ "thresholds": { "award": 60, "shortlist": 70 } })"),
                         ScoringPolicyException);
    }

  SECTION ("Unknown key")
    {
      REQUIRE_THROWS_AS (ScoringPolicyFileReader::parseConfiguration(
                           R"({ "quality": { "compliance_wieght": 70 } })"),
                         ScoringPolicyException);
    }

  SECTION ("Non-numeric value")
    {
      REQUIRE_THROWS_AS (ScoringPolicyFileReader::parseConfiguration(
                           R"({ "fallback_scores": { "experience": "high" } })"),
                         ScoringPolicyException);
    }

  SECTION ("History score out of range")
    {
      REQUIRE_THROWS_AS (ScoringPolicyFileReader::parseConfiguration(
                           R"({ "supplier_history": { "SUP-001": 120 } })"),
                         ScoringPolicyException);
    }

  SECTION ("Section of the wrong type")
    {
      REQUIRE_THROWS_AS (ScoringPolicyFileReader::parseConfiguration(R"({ "thresholds": [85, 70] })"),
                         ScoringPolicyException);
    }
}

TEST_CASE ("ScoringPolicyFileReader reads a file", "[ScoringPolicyFileReader]")
{
  boost::filesystem::path dir = boost::filesystem::temp_directory_path()
    / boost::filesystem::unique_path("bidevaluator-policy-%%%%-%%%%");
  boost::filesystem::create_directories(dir);
  std::string policyPath = (dir / "policy.json").string();

  {
    std::ofstream policyFile(policyPath);
    policyFile << R"({ "thresholds": { "award": 88, "shortlist": 72 } })";
  }

  ScoringPolicyFileReader reader(policyPath);
  REQUIRE (reader.getConfigFilePath() == policyPath);

  auto configuration = reader.readConfigurationFile();
  REQUIRE (configuration->getPolicy().awardThreshold == toDecimal("88"));
  REQUIRE (configuration->getPolicy().shortlistThreshold == toDecimal("72"));

  ScoringPolicyFileReader missing((dir / "missing.json").string());
  REQUIRE_THROWS_AS (missing.readConfigurationFile(), ScoringPolicyException);

  boost::filesystem::remove_all(dir);
}
