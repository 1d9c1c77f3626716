#pragma once

#include <ostream>
#include <string>
#include "number.h"
#include "EvaluationResult.h"

namespace bidevaluator
{
namespace reporting
{

using Num = num::DefaultNumber;

/**
 * @brief Plain-text report of an evaluation run
 *
 * Writes the run header, the criteria weights, one row per bid in ranking
 * order and the summary counts.
 */
class EvaluationReporter
{
public:
    /**
     * @brief Write the full evaluation report
     * @param out Stream to write the report to
     * @param result Evaluation to report on
     */
    static void writeEvaluationReport(std::ostream& out,
                                      const bideval::EvaluationResult<Num>& result);

    static void writeRankingTable(std::ostream& out,
                                  const bideval::EvaluationResult<Num>& result);

    static void writeSummary(std::ostream& out,
                             const bideval::EvaluationSummary<Num>& summary);

private:
    static void writeSectionHeader(std::ostream& out, const std::string& title);
    static void writeSectionFooter(std::ostream& out);
    static std::string formatScore(const Num& score);
};

} // namespace reporting
} // namespace bidevaluator
