#include "ScoringPolicyFileReader.h"
#include "BidEvaluationException.h"
#include "BidParsing.h"
#include <rapidjson/error/en.h>
#include <boost/filesystem.hpp>
#include <fstream>
#include <iterator>

using namespace rapidjson;
using namespace bideval;

namespace bidevaluator
{
namespace io
{

ScoringPolicyFileReader::ScoringPolicyFileReader(const std::string& configFilePath)
    : mConfigFilePath(configFilePath)
{
}

std::shared_ptr<ScoringConfiguration> ScoringPolicyFileReader::readConfigurationFile() const
{
    boost::filesystem::path policyPath(mConfigFilePath);
    if (!boost::filesystem::exists(policyPath) || !boost::filesystem::is_regular_file(policyPath))
        throw ScoringPolicyException("Scoring policy file not found: " + mConfigFilePath);

    std::ifstream file(mConfigFilePath);
    if (!file.is_open())
        throw ScoringPolicyException("Cannot open scoring policy file: " + mConfigFilePath);

    std::string jsonStr((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return parseConfiguration(jsonStr);
}

std::shared_ptr<ScoringConfiguration> ScoringPolicyFileReader::parseConfiguration(const std::string& jsonStr)
{
    Document doc;
    doc.Parse<kParseNumbersAsStringsFlag>(jsonStr.c_str());

    if (doc.HasParseError())
        throw ScoringPolicyException(std::string("Scoring policy is not valid JSON: ")
                                     + GetParseError_En(doc.GetParseError())
                                     + " (offset " + std::to_string(doc.GetErrorOffset()) + ")");

    if (!doc.IsObject())
        throw ScoringPolicyException("Scoring policy must be a JSON object");

    ScoringPolicy<Num> policy;

    if (doc.HasMember("quality"))
        readSection(doc["quality"], "quality",
                    {{"compliance_weight", &policy.complianceWeight},
                     {"points_per_certification", &policy.pointsPerCertification},
                     {"certification_bonus_cap", &policy.certificationBonusCap},
                     {"quality_cap", &policy.qualityCap}});

    if (doc.HasMember("thresholds"))
        readSection(doc["thresholds"], "thresholds",
                    {{"award", &policy.awardThreshold},
                     {"shortlist", &policy.shortlistThreshold}});

    if (doc.HasMember("fallback_scores"))
        readSection(doc["fallback_scores"], "fallback_scores",
                    {{"experience", &policy.defaultExperienceScore},
                     {"sustainability", &policy.defaultSustainabilityScore}});

    if (doc.HasMember("weight_tolerance"))
        policy.weightTolerance = readNumber(doc["weight_tolerance"], "weight_tolerance");

    policy.validate();

    std::map<std::string, Num> supplierHistory;
    if (doc.HasMember("supplier_history"))
    {
        const Value& history = doc["supplier_history"];
        if (!history.IsObject())
            throw ScoringPolicyException("Scoring policy supplier_history must be an object");

        for (Value::ConstMemberIterator it = history.MemberBegin(); it != history.MemberEnd(); ++it)
        {
            std::string supplierId = it->name.GetString();
            Num score = readNumber(it->value, "supplier_history." + supplierId);

            if (score < DecimalConstants<Num>::DecimalZero ||
                DecimalConstants<Num>::DecimalOneHundred < score)
                throw ScoringPolicyException("Scoring policy supplier_history." + supplierId
                                             + " must lie in [0, 100], received "
                                             + num::toFixedString(score, 2));

            supplierHistory[supplierId] = score;
        }
    }

    return std::make_shared<ScoringConfiguration>(policy, supplierHistory);
}

void ScoringPolicyFileReader::readSection(const Value& section,
                                          const std::string& sectionName,
                                          const std::map<std::string, Num*>& fields)
{
    if (!section.IsObject())
        throw ScoringPolicyException("Scoring policy section " + sectionName + " must be an object");

    for (Value::ConstMemberIterator it = section.MemberBegin(); it != section.MemberEnd(); ++it)
    {
        std::string key = it->name.GetString();
        auto field = fields.find(key);
        if (field == fields.end())
            throw ScoringPolicyException("Unknown key " + sectionName + "." + key + " in scoring policy");

        *(field->second) = readNumber(it->value, sectionName + "." + key);
    }
}

Num ScoringPolicyFileReader::readNumber(const Value& value, const std::string& name)
{
    if (!value.IsString() || !isDecimalLiteral(value.GetString()))
        throw ScoringPolicyException("Scoring policy value " + name + " is not a number");

    return DecimalConstants<Num>::createDecimal(value.GetString());
}

} // namespace io
} // namespace bidevaluator
