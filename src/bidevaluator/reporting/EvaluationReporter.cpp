#include "EvaluationReporter.h"
#include "Recommendation.h"
#include <iomanip>
#include "utils/TimeUtils.h"

using namespace bideval;

namespace bidevaluator
{
namespace reporting
{

void EvaluationReporter::writeEvaluationReport(std::ostream& out,
                                               const EvaluationResult<Num>& result)
{
    const EvaluationCriteria<Num>& criteria = result.getCriteria();

    writeSectionHeader(out, "Bid Evaluation Report");
    out << "RFQ: " << result.getRfqId() << std::endl;
    out << "Evaluator: " << result.getEvaluatorId() << std::endl;
    out << "Evaluated At: " << utils::toIsoUtcString(result.getEvaluatedAt()) << std::endl;
    out << "Weights: Price " << formatScore(criteria.getPriceWeight())
        << "%, Delivery " << formatScore(criteria.getDeliveryWeight())
        << "%, Quality " << formatScore(criteria.getQualityWeight())
        << "%, Experience " << formatScore(criteria.getExperienceWeight())
        << "%, Sustainability " << formatScore(criteria.getSustainabilityWeight())
        << "%" << std::endl;
    writeSectionFooter(out);
    out << std::endl;

    writeRankingTable(out, result);
    out << std::endl;

    writeSummary(out, result.getSummary());
    out << std::endl;
}

void EvaluationReporter::writeRankingTable(std::ostream& out,
                                           const EvaluationResult<Num>& result)
{
    writeSectionHeader(out, "Ranking");

    out << std::left
        << std::setw(6) << "Rank"
        << std::setw(16) << "Bid"
        << std::right
        << std::setw(9) << "Price"
        << std::setw(10) << "Delivery"
        << std::setw(9) << "Quality"
        << std::setw(12) << "Experience"
        << std::setw(16) << "Sustainability"
        << std::setw(9) << "Total"
        << "  Recommendation" << std::endl;

    for (const auto& evaluation : result.getEvaluations())
    {
        out << std::left
            << std::setw(6) << evaluation.getRanking()
            << std::setw(16) << evaluation.getBidId()
            << std::right
            << std::setw(9) << formatScore(evaluation.getPriceScore())
            << std::setw(10) << formatScore(evaluation.getDeliveryScore())
            << std::setw(9) << formatScore(evaluation.getQualityScore())
            << std::setw(12) << formatScore(evaluation.getExperienceScore())
            << std::setw(16) << formatScore(evaluation.getSustainabilityScore())
            << std::setw(9) << formatScore(evaluation.getTotalScore())
            << "  " << getRecommendationString(evaluation.getRecommendation())
            << std::endl;

        out << "      " << evaluation.getNotes() << std::endl;
        if (evaluation.getEvaluatorNote().has_value())
            out << "      Evaluator note: " << evaluation.getEvaluatorNote().value() << std::endl;
    }

    writeSectionFooter(out);
}

void EvaluationReporter::writeSummary(std::ostream& out, const EvaluationSummary<Num>& summary)
{
    writeSectionHeader(out, "Summary");
    out << "Total Bids: " << summary.getTotalBids() << std::endl;
    out << "Recommended Awards: " << summary.getRecommendedAwards() << std::endl;
    out << "Shortlisted: " << summary.getShortlisted() << std::endl;
    out << "Rejected: " << summary.getRejected() << std::endl;
    out << "Winning Bid: " << summary.getWinningBidId()
        << " (" << formatScore(summary.getWinningScore()) << ")" << std::endl;
    writeSectionFooter(out);
}

void EvaluationReporter::writeSectionHeader(std::ostream& out, const std::string& title)
{
    out << "=== " << title << " ===" << std::endl;
}

void EvaluationReporter::writeSectionFooter(std::ostream& out)
{
    out << "===================================" << std::endl;
}

std::string EvaluationReporter::formatScore(const Num& score)
{
    return num::toFixedString(score, 2);
}

} // namespace reporting
} // namespace bidevaluator
