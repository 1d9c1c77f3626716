// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_BID_EVALUATION_EXCEPTION_H
#define __BIDEVAL_BID_EVALUATION_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace bideval
{
  // Base of every error an evaluation call can surface to its caller
  class BidEvaluationException : public std::runtime_error
  {
  public:
    BidEvaluationException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~BidEvaluationException() = default;
  };

  /**
   * @brief Criteria weights are negative, missing or do not sum to 100.
   *
   * getField() names the offending weight, or "weights" when the sum is the
   * problem; getReceivedValue() is the value that was rejected.
   */
  class InvalidCriteriaException : public BidEvaluationException
  {
  public:
    InvalidCriteriaException(const std::string& field,
			     const std::string& receivedValue,
			     const std::string& msg)
      : BidEvaluationException(msg),
	mField(field),
	mReceivedValue(receivedValue)
    {}

    const std::string& getField() const
    {
      return mField;
    }

    const std::string& getReceivedValue() const
    {
      return mReceivedValue;
    }

  private:
    std::string mField;
    std::string mReceivedValue;
  };

  class EmptyBidSetException : public BidEvaluationException
  {
  public:
    explicit EmptyBidSetException(const std::string& msg)
      : BidEvaluationException(msg)
    {}
  };

  /**
   * @brief A bid carries a value that cannot be scored (negative or
   * unparseable price, unparseable delivery date, duplicate id, ...).
   */
  class MalformedBidException : public BidEvaluationException
  {
  public:
    MalformedBidException(const std::string& bidId,
			  const std::string& field,
			  const std::string& receivedValue,
			  const std::string& msg)
      : BidEvaluationException(msg),
	mBidId(bidId),
	mField(field),
	mReceivedValue(receivedValue)
    {}

    const std::string& getBidId() const
    {
      return mBidId;
    }

    const std::string& getField() const
    {
      return mField;
    }

    const std::string& getReceivedValue() const
    {
      return mReceivedValue;
    }

  private:
    std::string mBidId;
    std::string mField;
    std::string mReceivedValue;
  };

  // An injected scorer produced a value outside [0, 100]
  class ScorerRangeException : public BidEvaluationException
  {
  public:
    ScorerRangeException(const std::string& scorerName,
			 const std::string& bidId,
			 const std::string& msg)
      : BidEvaluationException(msg),
	mScorerName(scorerName),
	mBidId(bidId)
    {}

    const std::string& getScorerName() const
    {
      return mScorerName;
    }

    const std::string& getBidId() const
    {
      return mBidId;
    }

  private:
    std::string mScorerName;
    std::string mBidId;
  };

  class ScoringPolicyException : public BidEvaluationException
  {
  public:
    explicit ScoringPolicyException(const std::string& msg)
      : BidEvaluationException(msg)
    {}
  };

} // namespace bideval

#endif // __BIDEVAL_BID_EVALUATION_EXCEPTION_H
