#pragma once

#include <map>
#include <memory>
#include <string>
#include <rapidjson/document.h>
#include "number.h"
#include "ScoringPolicy.h"

namespace bidevaluator
{
namespace io
{

using Num = num::DefaultNumber;

/**
 * @brief Scoring policy plus the supplier history table read from a policy file
 */
class ScoringConfiguration
{
public:
    ScoringConfiguration(const bideval::ScoringPolicy<Num>& policy,
                         const std::map<std::string, Num>& supplierHistory)
        : mPolicy(policy),
          mSupplierHistory(supplierHistory)
    {
    }

    const bideval::ScoringPolicy<Num>& getPolicy() const
    {
        return mPolicy;
    }

    const std::map<std::string, Num>& getSupplierHistory() const
    {
        return mSupplierHistory;
    }

private:
    bideval::ScoringPolicy<Num> mPolicy;
    std::map<std::string, Num> mSupplierHistory;
};

/**
 * @brief Reads a JSON scoring policy file
 *
 * Recognized sections: "quality", "thresholds", "fallback_scores",
 * "weight_tolerance" and "supplier_history". Keys that are absent keep the
 * default policy values. The resulting policy is validated before it is
 * returned.
 *
 * Example:
 * {
 *   "quality": { "compliance_weight": 70, "points_per_certification": 10,
 *                "certification_bonus_cap": 30, "quality_cap": 100 },
 *   "thresholds": { "award": 85, "shortlist": 70 },
 *   "fallback_scores": { "experience": 75, "sustainability": 60 },
 *   "weight_tolerance": 0.01,
 *   "supplier_history": { "SUP-001": 92.5 }
 * }
 */
class ScoringPolicyFileReader
{
public:
    explicit ScoringPolicyFileReader(const std::string& configFilePath);

    /**
     * @throws bideval::ScoringPolicyException if the file is missing,
     * unparseable or holds an invalid policy
     */
    std::shared_ptr<ScoringConfiguration> readConfigurationFile() const;

    /**
     * @brief Parse policy JSON text
     * @throws bideval::ScoringPolicyException on any error
     */
    static std::shared_ptr<ScoringConfiguration> parseConfiguration(const std::string& jsonStr);

    const std::string& getConfigFilePath() const
    {
        return mConfigFilePath;
    }

private:
    static void readSection(const rapidjson::Value& section,
                            const std::string& sectionName,
                            const std::map<std::string, Num*>& fields);
    static Num readNumber(const rapidjson::Value& value, const std::string& name);

private:
    std::string mConfigFilePath;
};

} // namespace io
} // namespace bidevaluator
