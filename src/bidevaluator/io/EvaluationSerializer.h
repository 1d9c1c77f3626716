#pragma once

#include <optional>
#include <string>
#include <rapidjson/document.h>
#include "number.h"
#include "DecimalConstants.h"
#include "BidEvaluationException.h"
#include "EvaluationRequest.h"
#include "EvaluationResult.h"

namespace bidevaluator
{
namespace io
{

using Num = num::DefaultNumber;

/**
 * @brief The request document is not valid JSON or not shaped like a request
 */
class EvaluationRequestFormatException : public bideval::BidEvaluationException
{
public:
    explicit EvaluationRequestFormatException(const std::string& msg)
        : bideval::BidEvaluationException(msg)
    {
    }
};

/**
 * @brief A decoded request document
 *
 * The RFQ id is optional in the document; the command line may supply it.
 */
struct ParsedEvaluationRequest
{
    bideval::EvaluationRequest<Num> request;
    std::optional<std::string> rfqId;
};

/**
 * @brief Converts evaluation requests and results to and from JSON
 *
 * Numbers are read as text so prices and weights reach the engine as exact
 * decimals. Errors are reported with the engine's exception types so the
 * offending field and value are named regardless of where they are caught.
 */
class EvaluationSerializer
{
public:
    /**
     * @brief Parse a request document
     *
     * Criteria are decoded and validated before any bid is read, so errors
     * come out in the same order as BidEvaluationEngine::validateRequest.
     *
     * @param jsonStr JSON text of the request
     * @param weightTolerance allowed |sum(weights) - 100|
     * @throws EvaluationRequestFormatException for unparseable JSON
     * @throws bideval::InvalidCriteriaException for a missing, non-numeric or
     * negative weight, or weights not summing to 100
     * @throws bideval::EmptyBidSetException when bids is missing or empty
     * @throws bideval::MalformedBidException for an unreadable bid field
     */
    static ParsedEvaluationRequest importRequestFromJson(
        const std::string& jsonStr,
        const Num& weightTolerance = bideval::DecimalConstants<Num>::DefaultWeightTolerance);

    /**
     * @brief Read and parse a request file
     * @throws EvaluationRequestFormatException if the file cannot be read
     */
    static ParsedEvaluationRequest loadRequestFromFile(
        const std::string& filePath,
        const Num& weightTolerance = bideval::DecimalConstants<Num>::DefaultWeightTolerance);

    /**
     * @brief Export an evaluation result as pretty-printed JSON
     */
    static std::string exportToJson(const bideval::EvaluationResult<Num>& result);

    /**
     * @brief Write an evaluation result to a file
     * @throws std::runtime_error if the file cannot be written
     */
    static void saveToFile(const bideval::EvaluationResult<Num>& result, const std::string& filePath);

private:
    static bideval::EvaluationCriteria<Num> deserializeCriteria(const rapidjson::Value& json);
    static bideval::Bid<Num> deserializeBid(const rapidjson::Value& json, size_t position);
    static std::vector<bideval::SpecificationCompliance>
    deserializeCompliance(const std::string& bidId, const rapidjson::Value& json);
    static std::set<std::string> deserializeCertifications(const std::string& bidId,
                                                           const rapidjson::Value& json);
    static std::map<std::string, std::string> deserializeEvaluatorNotes(const rapidjson::Value& json);

    static Num readWeight(const rapidjson::Value& criteria, const char* field);
    static std::optional<std::string> readOptionalString(const std::string& bidId,
                                                         const rapidjson::Value& json,
                                                         const char* field);
    static std::string describeValue(const rapidjson::Value& value);

    static rapidjson::Value serializeCriteria(const bideval::EvaluationCriteria<Num>& criteria,
                                              rapidjson::Document::AllocatorType& allocator);
    static rapidjson::Value serializeEvaluation(const bideval::BidEvaluation<Num>& evaluation,
                                                rapidjson::Document::AllocatorType& allocator);
    static rapidjson::Value serializeSummary(const bideval::EvaluationSummary<Num>& summary,
                                             rapidjson::Document::AllocatorType& allocator);
    static double toJsonNumber(const Num& value);
};

} // namespace io
} // namespace bidevaluator
