#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace bidevaluator
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to log to the console and a log file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Characters that are unsafe in file names replaced by '_'
 */
std::string sanitizeFileNameComponent(const std::string& component);

/**
 * @brief Default log file name for an evaluation run
 * @param rfqId RFQ being evaluated
 * @return e.g. "RFQ-7_Evaluation_Log_Mar_01_2025_1430.txt"
 */
std::string createEvaluationLogFileName(const std::string& rfqId);

/**
 * @brief Default ranking report file name for an evaluation run
 */
std::string createEvaluationReportFileName(const std::string& rfqId);

} // namespace utils
} // namespace bidevaluator
