#include "OutputUtils.h"
#include "TimeUtils.h"
#include <cctype>
#include <cstdio>

namespace bidevaluator
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string sanitizeFileNameComponent(const std::string& component)
{
    std::string sanitized;
    sanitized.reserve(component.size());

    for (char c : component)
    {
        unsigned char uc = static_cast<unsigned char>(c);
        sanitized.push_back((std::isalnum(uc) || c == '-' || c == '_' || c == '.') ? c : '_');
    }

    return sanitized.empty() ? std::string("unnamed") : sanitized;
}

std::string createEvaluationLogFileName(const std::string& rfqId)
{
    return sanitizeFileNameComponent(rfqId) + "_Evaluation_Log_" + getCurrentTimestamp() + ".txt";
}

std::string createEvaluationReportFileName(const std::string& rfqId)
{
    return sanitizeFileNameComponent(rfqId) + "_Evaluation_Report_" + getCurrentTimestamp() + ".txt";
}

} // namespace utils
} // namespace bidevaluator
