#include "EvaluationSerializer.h"
#include "BidParsing.h"
#include "utils/TimeUtils.h"
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <boost/filesystem.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>

using namespace rapidjson;
using namespace bideval;

namespace bidevaluator
{
namespace io
{

ParsedEvaluationRequest EvaluationSerializer::importRequestFromJson(const std::string& jsonStr,
                                                                    const Num& weightTolerance)
{
    Document doc;
    doc.Parse<kParseNumbersAsStringsFlag>(jsonStr.c_str());

    if (doc.HasParseError())
    {
        throw EvaluationRequestFormatException(
            std::string("Evaluation request is not valid JSON: ")
            + GetParseError_En(doc.GetParseError())
            + " (offset " + std::to_string(doc.GetErrorOffset()) + ")");
    }

    if (!doc.IsObject())
        throw EvaluationRequestFormatException("Evaluation request must be a JSON object");

    if (!doc.HasMember("criteria") || !doc["criteria"].IsObject())
        throw InvalidCriteriaException("criteria", "",
                                       "Evaluation request has no criteria object");

    EvaluationCriteria<Num> criteria = deserializeCriteria(doc["criteria"]);
    CriteriaValidator<Num>(weightTolerance).validate(criteria);

    if (!doc.HasMember("bids") || doc["bids"].IsNull())
        throw EmptyBidSetException("Evaluation request has no bids");

    if (!doc["bids"].IsArray())
        throw EvaluationRequestFormatException("Evaluation request field bids must be an array");

    const Value& bidsJson = doc["bids"];
    if (bidsJson.Empty())
        throw EmptyBidSetException("Evaluation request has no bids");

    std::vector<Bid<Num>> bids;
    bids.reserve(bidsJson.Size());
    for (SizeType i = 0; i < bidsJson.Size(); ++i)
        bids.push_back(deserializeBid(bidsJson[i], i));

    std::map<std::string, std::string> notes;
    if (doc.HasMember("evaluator_notes"))
        notes = deserializeEvaluatorNotes(doc["evaluator_notes"]);

    std::optional<std::string> rfqId;
    if (doc.HasMember("rfq_id") && !doc["rfq_id"].IsNull())
    {
        if (!doc["rfq_id"].IsString())
            throw EvaluationRequestFormatException("Evaluation request field rfq_id must be a string");
        rfqId = doc["rfq_id"].GetString();
    }

    return ParsedEvaluationRequest{EvaluationRequest<Num>(criteria, bids, notes), rfqId};
}

ParsedEvaluationRequest EvaluationSerializer::loadRequestFromFile(const std::string& filePath,
                                                                  const Num& weightTolerance)
{
    if (!boost::filesystem::exists(filePath) || !boost::filesystem::is_regular_file(filePath))
        throw EvaluationRequestFormatException("Request file not found: " + filePath);

    std::ifstream file(filePath);
    if (!file.is_open())
        throw EvaluationRequestFormatException("Cannot open request file: " + filePath);

    std::string jsonStr((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return importRequestFromJson(jsonStr, weightTolerance);
}

std::string EvaluationSerializer::exportToJson(const EvaluationResult<Num>& result)
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("rfq_id", Value(result.getRfqId().c_str(), allocator), allocator);
    doc.AddMember("evaluated_at",
                  Value(utils::toIsoUtcString(result.getEvaluatedAt()).c_str(), allocator),
                  allocator);
    doc.AddMember("evaluator_id", Value(result.getEvaluatorId().c_str(), allocator), allocator);
    doc.AddMember("criteria", serializeCriteria(result.getCriteria(), allocator), allocator);

    Value evaluations(kArrayType);
    for (const auto& evaluation : result.getEvaluations())
        evaluations.PushBack(serializeEvaluation(evaluation, allocator), allocator);
    doc.AddMember("evaluations", evaluations, allocator);

    doc.AddMember("summary", serializeSummary(result.getSummary(), allocator), allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    writer.SetMaxDecimalPlaces(2);
    doc.Accept(writer);

    return buffer.GetString();
}

void EvaluationSerializer::saveToFile(const EvaluationResult<Num>& result, const std::string& filePath)
{
    std::string jsonStr = exportToJson(result);

    std::ofstream file(filePath);
    if (!file.is_open())
        throw std::runtime_error("Cannot open file for writing: " + filePath);

    file << jsonStr << std::endl;
    if (!file)
        throw std::runtime_error("Error writing evaluation result to " + filePath);
}

EvaluationCriteria<Num> EvaluationSerializer::deserializeCriteria(const Value& json)
{
    // total_weight, when present, is derived data and is not read
    return EvaluationCriteria<Num>(readWeight(json, "price_weight"),
                                   readWeight(json, "delivery_weight"),
                                   readWeight(json, "quality_weight"),
                                   readWeight(json, "experience_weight"),
                                   readWeight(json, "sustainability_weight"));
}

Num EvaluationSerializer::readWeight(const Value& criteria, const char* field)
{
    if (!criteria.HasMember(field))
        throw InvalidCriteriaException(field, "",
                                       std::string("Evaluation criteria ") + field + " is missing");

    const Value& weight = criteria[field];
    if (!weight.IsString() || !isDecimalLiteral(weight.GetString()))
        throw InvalidCriteriaException(field, describeValue(weight),
                                       std::string("Evaluation criteria ") + field
                                       + " is not a number (received " + describeValue(weight) + ")");

    return DecimalConstants<Num>::createDecimal(weight.GetString());
}

Bid<Num> EvaluationSerializer::deserializeBid(const Value& json, size_t position)
{
    std::string location = "bids[" + std::to_string(position) + "]";

    if (!json.IsObject())
        throw MalformedBidException("", "bid", describeValue(json),
                                    "Evaluation request " + location + " is not an object");

    if (!json.HasMember("id") || !json["id"].IsString())
        throw MalformedBidException("", "id", json.HasMember("id") ? describeValue(json["id"]) : "",
                                    "Evaluation request " + location + " has no string id");

    std::string bidId = json["id"].GetString();

    std::string supplierId = readOptionalString(bidId, json, "supplier_id").value_or("");
    std::string supplierName = readOptionalString(bidId, json, "supplier_name").value_or("");
    std::string currency = readOptionalString(bidId, json, "currency").value_or("USD");

    if (!json.HasMember("unit_price") || json["unit_price"].IsNull())
        throw MalformedBidException(bidId, "unit_price", "",
                                    "Bid " + bidId + ": unit_price is missing");
    if (!json["unit_price"].IsString())
        throw MalformedBidException(bidId, "unit_price", describeValue(json["unit_price"]),
                                    "Bid " + bidId + ": unit_price is not a number (received "
                                    + describeValue(json["unit_price"]) + ")");
    Num unitPrice = parseUnitPrice<Num>(bidId, json["unit_price"].GetString());

    if (!json.HasMember("delivery_date") || json["delivery_date"].IsNull())
        throw MalformedBidException(bidId, "delivery_date", "",
                                    "Bid " + bidId + ": delivery_date is missing");
    if (!json["delivery_date"].IsString())
        throw MalformedBidException(bidId, "delivery_date", describeValue(json["delivery_date"]),
                                    "Bid " + bidId + ": delivery_date is not a date (received "
                                    + describeValue(json["delivery_date"]) + ")");
    boost::posix_time::ptime deliveryDate = parseDeliveryDate(bidId, json["delivery_date"].GetString());

    std::vector<SpecificationCompliance> compliance;
    if (json.HasMember("specifications_compliance"))
        compliance = deserializeCompliance(bidId, json["specifications_compliance"]);

    std::set<std::string> certifications;
    if (json.HasMember("certifications"))
        certifications = deserializeCertifications(bidId, json["certifications"]);

    std::optional<Num> sustainability;
    if (json.HasMember("sustainability_score") && !json["sustainability_score"].IsNull())
    {
        const Value& score = json["sustainability_score"];
        if (!score.IsString() || !isDecimalLiteral(score.GetString()))
            throw MalformedBidException(bidId, "sustainability_score", describeValue(score),
                                        "Bid " + bidId + ": sustainability_score is not a number (received "
                                        + describeValue(score) + ")");
        sustainability = DecimalConstants<Num>::createDecimal(score.GetString());
    }

    return Bid<Num>(bidId, supplierId, supplierName, unitPrice, currency, deliveryDate,
                    compliance, certifications, sustainability);
}

std::vector<SpecificationCompliance>
EvaluationSerializer::deserializeCompliance(const std::string& bidId, const Value& json)
{
    std::vector<SpecificationCompliance> compliance;
    if (json.IsNull())
        return compliance;

    if (!json.IsArray())
        throw MalformedBidException(bidId, "specifications_compliance", describeValue(json),
                                    "Bid " + bidId + ": specifications_compliance must be an array");

    for (SizeType i = 0; i < json.Size(); ++i)
    {
        const Value& entry = json[i];
        if (!entry.IsObject() || !entry.HasMember("compliant") || !entry["compliant"].IsBool())
            throw MalformedBidException(bidId, "specifications_compliance", describeValue(entry),
                                        "Bid " + bidId + ": specifications_compliance["
                                        + std::to_string(i) + "] needs a boolean compliant flag");

        std::string requirement;
        if (entry.HasMember("requirement") && entry["requirement"].IsString())
            requirement = entry["requirement"].GetString();
        else if (entry.HasMember("specification_id") && entry["specification_id"].IsString())
            requirement = entry["specification_id"].GetString();

        compliance.emplace_back(requirement, entry["compliant"].GetBool());
    }

    return compliance;
}

std::set<std::string> EvaluationSerializer::deserializeCertifications(const std::string& bidId,
                                                                      const Value& json)
{
    std::set<std::string> certifications;
    if (json.IsNull())
        return certifications;

    if (!json.IsArray())
        throw MalformedBidException(bidId, "certifications", describeValue(json),
                                    "Bid " + bidId + ": certifications must be an array");

    for (SizeType i = 0; i < json.Size(); ++i)
    {
        if (!json[i].IsString())
            throw MalformedBidException(bidId, "certifications", describeValue(json[i]),
                                        "Bid " + bidId + ": certifications["
                                        + std::to_string(i) + "] is not a string");
        certifications.insert(json[i].GetString());
    }

    return certifications;
}

std::map<std::string, std::string> EvaluationSerializer::deserializeEvaluatorNotes(const Value& json)
{
    std::map<std::string, std::string> notes;
    if (json.IsNull())
        return notes;

    if (!json.IsObject())
        throw EvaluationRequestFormatException("Evaluation request field evaluator_notes must be an object");

    for (Value::ConstMemberIterator it = json.MemberBegin(); it != json.MemberEnd(); ++it)
    {
        if (!it->value.IsString())
            throw EvaluationRequestFormatException(std::string("Evaluator note for bid ")
                                                   + it->name.GetString() + " is not a string");
        notes[it->name.GetString()] = it->value.GetString();
    }

    return notes;
}

std::optional<std::string> EvaluationSerializer::readOptionalString(const std::string& bidId,
                                                                    const Value& json,
                                                                    const char* field)
{
    if (!json.HasMember(field) || json[field].IsNull())
        return std::nullopt;

    if (!json[field].IsString())
        throw MalformedBidException(bidId, field, describeValue(json[field]),
                                    "Bid " + bidId + ": " + field + " must be a string");

    return std::string(json[field].GetString());
}

std::string EvaluationSerializer::describeValue(const Value& value)
{
    if (value.IsString())
        return value.GetString();
    if (value.IsNull())
        return "null";
    if (value.IsBool())
        return value.GetBool() ? "true" : "false";
    if (value.IsObject())
        return "{...}";
    if (value.IsArray())
        return "[...]";

    return "?";
}

Value EvaluationSerializer::serializeCriteria(const EvaluationCriteria<Num>& criteria,
                                              Document::AllocatorType& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("price_weight", toJsonNumber(criteria.getPriceWeight()), allocator);
    obj.AddMember("delivery_weight", toJsonNumber(criteria.getDeliveryWeight()), allocator);
    obj.AddMember("quality_weight", toJsonNumber(criteria.getQualityWeight()), allocator);
    obj.AddMember("experience_weight", toJsonNumber(criteria.getExperienceWeight()), allocator);
    obj.AddMember("sustainability_weight", toJsonNumber(criteria.getSustainabilityWeight()), allocator);
    return obj;
}

Value EvaluationSerializer::serializeEvaluation(const BidEvaluation<Num>& evaluation,
                                                Document::AllocatorType& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("bid_id", Value(evaluation.getBidId().c_str(), allocator), allocator);
    obj.AddMember("price_score", toJsonNumber(evaluation.getPriceScore()), allocator);
    obj.AddMember("delivery_score", toJsonNumber(evaluation.getDeliveryScore()), allocator);
    obj.AddMember("quality_score", toJsonNumber(evaluation.getQualityScore()), allocator);
    obj.AddMember("experience_score", toJsonNumber(evaluation.getExperienceScore()), allocator);
    obj.AddMember("sustainability_score", toJsonNumber(evaluation.getSustainabilityScore()), allocator);
    obj.AddMember("total_score", toJsonNumber(evaluation.getTotalScore()), allocator);
    obj.AddMember("ranking", evaluation.getRanking(), allocator);
    obj.AddMember("recommendation",
                  Value(getRecommendationString(evaluation.getRecommendation()).c_str(), allocator),
                  allocator);
    obj.AddMember("notes", Value(evaluation.getNotes().c_str(), allocator), allocator);

    if (evaluation.getEvaluatorNote().has_value())
        obj.AddMember("evaluator_note",
                      Value(evaluation.getEvaluatorNote().value().c_str(), allocator),
                      allocator);

    return obj;
}

Value EvaluationSerializer::serializeSummary(const EvaluationSummary<Num>& summary,
                                             Document::AllocatorType& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("total_bids", static_cast<uint64_t>(summary.getTotalBids()), allocator);
    obj.AddMember("recommended_awards", static_cast<uint64_t>(summary.getRecommendedAwards()), allocator);
    obj.AddMember("shortlisted", static_cast<uint64_t>(summary.getShortlisted()), allocator);
    obj.AddMember("rejected", static_cast<uint64_t>(summary.getRejected()), allocator);
    obj.AddMember("winning_bid_id", Value(summary.getWinningBidId().c_str(), allocator), allocator);
    obj.AddMember("winning_score", toJsonNumber(summary.getWinningScore()), allocator);
    return obj;
}

double EvaluationSerializer::toJsonNumber(const Num& value)
{
    return num::to_double(value);
}

} // namespace io
} // namespace bidevaluator
