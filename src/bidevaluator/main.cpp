#include <cstdint>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/program_options.hpp>
#include "number.h"
#include "BidEvaluationEngine.h"
#include "BidEvaluationException.h"
#include "BidScorer.h"
#include "io/EvaluationSerializer.h"
#include "io/ScoringPolicyFileReader.h"
#include "reporting/EvaluationReporter.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;

using Num = num::DefaultNumber;
using namespace bideval;
using namespace bidevaluator;

static const int kExitSuccess = 0;
static const int kExitEvaluationError = 1;
static const int kExitUsageError = 2;

void printUsage(const po::options_description& desc)
{
    std::cout << "Bid Evaluator - score, rank and classify procurement bids\n\n";
    std::cout << "Usage: bidevaluator --request <file> --evaluator-id <id> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Evaluate with the default policy, result JSON on stdout\n";
    std::cout << "  bidevaluator --request rfq_bids.json --evaluator-id jdoe\n\n";
    std::cout << "  # Custom policy, result and report written to files\n";
    std::cout << "  bidevaluator --request rfq_bids.json --evaluator-id jdoe --policy policy.json \\\n";
    std::cout << "               --output result.json --report report.txt\n\n";
    std::cout << "  # Supplier history drives the experience score\n";
    std::cout << "  bidevaluator --request rfq_bids.json --evaluator-id jdoe --policy policy.json \\\n";
    std::cout << "               --experience-scorer history\n";
}

static BidEvaluationEngine<Num> createEngine(const std::string& scorerName,
                                             const io::ScoringConfiguration& configuration,
                                             uint64_t seed)
{
    const ScoringPolicy<Num>& policy = configuration.getPolicy();

    if (scorerName == "random")
    {
        // Legacy ranges: experience [75, 100], sustainability [60, 100]
        auto experience = std::make_shared<SeededRandomScorer<Num>>(
            DecimalConstants<Num>::DecimalSeventyFive, DecimalConstants<Num>::DecimalOneHundred, seed);
        auto sustainability = std::make_shared<DeclaredSustainabilityScorer<Num>>(
            std::make_shared<SeededRandomScorer<Num>>(
                DecimalConstants<Num>::DecimalSixty, DecimalConstants<Num>::DecimalOneHundred, seed + 1));
        return BidEvaluationEngine<Num>(policy, experience, sustainability);
    }

    if (scorerName == "history")
    {
        auto experience = std::make_shared<SupplierHistoryScorer<Num>>(
            configuration.getSupplierHistory(), policy.defaultExperienceScore);
        return BidEvaluationEngine<Num>(policy, experience,
                                        BidEvaluationEngine<Num>::createDefaultSustainabilityScorer(policy));
    }

    return BidEvaluationEngine<Num>(policy);
}

int main(int argc, char* argv[])
{
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("request,r", po::value<std::string>(), "Evaluation request JSON file (required)")
        ("rfq-id", po::value<std::string>(), "RFQ id (overrides rfq_id in the request)")
        ("evaluator-id,e", po::value<std::string>(), "Id of the evaluator running the evaluation (required)")
        ("policy,p", po::value<std::string>(), "Scoring policy JSON file")
        ("output,o", po::value<std::string>(), "Write result JSON to this file instead of stdout")
        ("report", po::value<std::string>()->implicit_value(""), "Write a plain-text ranking report (default name if no file given)")
        ("log", po::value<std::string>()->implicit_value(""), "Mirror log output to a file (default name if no file given)")
        ("experience-scorer", po::value<std::string>()->default_value("fixed"), "Experience scorer: fixed, random or history")
        ("seed", po::value<uint64_t>()->default_value(0), "Seed for the random experience scorer")
        ("verbose,v", "Verbose output");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            printUsage(desc);
            return kExitSuccess;
        }

        po::notify(vm);
    }
    catch (const po::error& e)
    {
        std::cerr << "Error: " << e.what() << std::endl << std::endl;
        printUsage(desc);
        return kExitUsageError;
    }

    if (!vm.count("request") || !vm.count("evaluator-id"))
    {
        std::cerr << "Error: --request and --evaluator-id are required" << std::endl << std::endl;
        printUsage(desc);
        return kExitUsageError;
    }

    std::string scorerName = vm["experience-scorer"].as<std::string>();
    if (scorerName != "fixed" && scorerName != "random" && scorerName != "history")
    {
        std::cerr << "Error: Unknown experience scorer '" << scorerName
                  << "' (expected fixed, random or history)" << std::endl;
        return kExitUsageError;
    }

    bool verbose = vm.count("verbose") > 0;
    std::string requestPath = vm["request"].as<std::string>();
    std::string evaluatorId = vm["evaluator-id"].as<std::string>();
    std::string cliRfqId = vm.count("rfq-id") ? vm["rfq-id"].as<std::string>() : std::string();

    // Log to stderr so result JSON on stdout stays clean
    std::ofstream logFile;
    std::unique_ptr<utils::TeeStream> teeStream;
    std::ostream* log = &std::cerr;

    if (vm.count("log"))
    {
        std::string logPath = vm["log"].as<std::string>();
        if (logPath.empty())
            logPath = utils::createEvaluationLogFileName(cliRfqId.empty() ? "evaluation" : cliRfqId);

        logFile.open(logPath);
        if (!logFile.is_open())
        {
            std::cerr << "Error: Cannot open log file " << logPath << std::endl;
            return kExitEvaluationError;
        }

        teeStream = std::make_unique<utils::TeeStream>(std::cerr, logFile);
        log = teeStream.get();
    }

    try
    {
        ScoringPolicy<Num> defaultPolicy;
        std::shared_ptr<io::ScoringConfiguration> configuration =
            std::make_shared<io::ScoringConfiguration>(defaultPolicy, std::map<std::string, Num>());

        if (vm.count("policy"))
        {
            std::string policyPath = vm["policy"].as<std::string>();
            if (verbose)
                *log << "Reading scoring policy from " << policyPath << std::endl;

            io::ScoringPolicyFileReader reader(policyPath);
            configuration = reader.readConfigurationFile();

            if (verbose)
                *log << "Supplier history entries: " << configuration->getSupplierHistory().size() << std::endl;
        }

        if (verbose)
            *log << "Reading evaluation request from " << requestPath << std::endl;

        io::ParsedEvaluationRequest parsed = io::EvaluationSerializer::loadRequestFromFile(
            requestPath, configuration->getPolicy().weightTolerance);

        std::string rfqId = cliRfqId;
        if (rfqId.empty())
            rfqId = parsed.rfqId.value_or("unspecified");

        BidEvaluationEngine<Num> engine = createEngine(scorerName, *configuration,
                                                       vm["seed"].as<uint64_t>());

        if (verbose)
        {
            *log << "Evaluating " << parsed.request.getBids().size() << " bids for RFQ " << rfqId
                 << " (experience scorer: " << engine.getExperienceScorer().getName()
                 << ", sustainability scorer: " << engine.getSustainabilityScorer().getName()
                 << ")" << std::endl;
        }

        EvaluationResult<Num> result = engine.evaluate(parsed.request, rfqId, evaluatorId);

        if (vm.count("output"))
        {
            std::string outputPath = vm["output"].as<std::string>();
            io::EvaluationSerializer::saveToFile(result, outputPath);
            *log << "Evaluation result written to " << outputPath << std::endl;
        }
        else
        {
            std::cout << io::EvaluationSerializer::exportToJson(result) << std::endl;
        }

        if (vm.count("report"))
        {
            std::string reportPath = vm["report"].as<std::string>();
            if (reportPath.empty())
                reportPath = utils::createEvaluationReportFileName(rfqId);

            std::ofstream reportFile(reportPath);
            if (!reportFile.is_open())
                throw std::runtime_error("Cannot open report file for writing: " + reportPath);

            reporting::EvaluationReporter::writeEvaluationReport(reportFile, result);
            *log << "Evaluation report written to " << reportPath << std::endl;
        }

        const EvaluationSummary<Num>& summary = result.getSummary();
        *log << "RFQ " << rfqId << ": " << summary.getTotalBids() << " bids, "
             << summary.getRecommendedAwards() << " award, "
             << summary.getShortlisted() << " shortlist, "
             << summary.getRejected() << " reject; winner " << summary.getWinningBidId()
             << " (" << num::toFixedString(summary.getWinningScore(), 2) << ")" << std::endl;

        return kExitSuccess;
    }
    catch (const InvalidCriteriaException& e)
    {
        *log << "Invalid criteria [" << e.getField() << " = " << e.getReceivedValue() << "]: "
             << e.what() << std::endl;
    }
    catch (const MalformedBidException& e)
    {
        *log << "Malformed bid " << e.getBidId() << " [" << e.getField() << " = "
             << e.getReceivedValue() << "]: " << e.what() << std::endl;
    }
    catch (const BidEvaluationException& e)
    {
        *log << "Evaluation failed: " << e.what() << std::endl;
    }
    catch (const std::exception& e)
    {
        *log << "Error: " << e.what() << std::endl;
    }

    return kExitEvaluationError;
}
