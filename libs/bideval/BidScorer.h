// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_BID_SCORER_H
#define __BIDEVAL_BID_SCORER_H 1

#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include "Bid.h"
#include "DecimalConstants.h"
#include "BidEvaluationException.h"

namespace bideval
{
  /**
   * @brief Source of a 0-100 score for one bid along a single dimension
   * (experience, sustainability) that the bid's own price, date and
   * compliance data do not determine.
   *
   * Implementations must be deterministic and safe to call concurrently:
   * the engine is shared across evaluations and holds no per-call state.
   */
  template <class Decimal>
  class IBidScorer
  {
  public:
    virtual ~IBidScorer() = default;

    virtual Decimal score(const Bid<Decimal>& bid) const = 0;

    virtual std::string getName() const = 0;
  };

  /**
   * @brief Gives every bid the same score.
   */
  template <class Decimal>
  class FixedScorer : public IBidScorer<Decimal>
  {
  public:
    explicit FixedScorer(const Decimal& value)
      : mValue(value)
    {}

    Decimal score(const Bid<Decimal>&) const override
    {
      return mValue;
    }

    std::string getName() const override
    {
      return "fixed";
    }

  private:
    Decimal mValue;
  };

  /**
   * @brief Uses the sustainability score a bid declares, deferring to a
   * fallback scorer for bids that declare none.
   */
  template <class Decimal>
  class DeclaredSustainabilityScorer : public IBidScorer<Decimal>
  {
  public:
    explicit DeclaredSustainabilityScorer(std::shared_ptr<IBidScorer<Decimal>> fallback)
      : mFallback(fallback)
    {
      if (!mFallback)
	throw std::invalid_argument("DeclaredSustainabilityScorer: fallback scorer is required");
    }

    Decimal score(const Bid<Decimal>& bid) const override
    {
      if (bid.getSustainabilityScore().has_value())
	return bid.getSustainabilityScore().value();

      return mFallback->score(bid);
    }

    std::string getName() const override
    {
      return "declared-sustainability(" + mFallback->getName() + ")";
    }

  private:
    std::shared_ptr<IBidScorer<Decimal>> mFallback;
  };

  /**
   * @brief Looks a bid's supplier up in a table of historical performance
   * scores, using a fixed fallback for suppliers with no history.
   */
  template <class Decimal>
  class SupplierHistoryScorer : public IBidScorer<Decimal>
  {
  public:
    SupplierHistoryScorer(const std::map<std::string, Decimal>& historyBySupplier,
			  const Decimal& fallback)
      : mHistoryBySupplier(historyBySupplier),
	mFallback(fallback)
    {}

    Decimal score(const Bid<Decimal>& bid) const override
    {
      auto it = mHistoryBySupplier.find(bid.getSupplierId());
      if (it == mHistoryBySupplier.end())
	return mFallback;

      return it->second;
    }

    std::string getName() const override
    {
      return "supplier-history";
    }

    size_t getNumSuppliers() const
    {
      return mHistoryBySupplier.size();
    }

  private:
    std::map<std::string, Decimal> mHistoryBySupplier;
    Decimal mFallback;
  };

  /**
   * @brief Mix a master seed with a bid id into a 64-bit generator seed.
   *
   * FNV-1a over the id followed by a splitmix64 finalizer; stable across
   * platforms and standard library implementations.
   */
  uint64_t mixBidSeed(uint64_t masterSeed, const std::string& bidId);

  /**
   * @brief Draws a pseudo-random score uniformly from [low, high].
   *
   * Each call seeds a private std::mt19937_64 from (seed, bid id), so the
   * same bid always receives the same score for a given seed and no
   * generator state is shared between calls or threads.
   */
  template <class Decimal>
  class SeededRandomScorer : public IBidScorer<Decimal>
  {
  public:
    SeededRandomScorer(const Decimal& low, const Decimal& high, uint64_t seed)
      : mLow(low),
	mHigh(high),
	mSeed(seed)
    {
      if (mHigh < mLow)
	throw std::invalid_argument("SeededRandomScorer: high bound is below low bound");
    }

    Decimal score(const Bid<Decimal>& bid) const override
    {
      std::mt19937_64 engine(mixBidSeed(mSeed, bid.getId()));

      // 53 high-order bits -> double in [0, 1)
      double unit = static_cast<double>(engine() >> 11) * (1.0 / 9007199254740992.0);
      double low = mLow.getAsDouble();
      double high = mHigh.getAsDouble();

      return Decimal(low + unit * (high - low));
    }

    std::string getName() const override
    {
      return "seeded-random";
    }

    uint64_t getSeed() const
    {
      return mSeed;
    }

  private:
    Decimal mLow;
    Decimal mHigh;
    uint64_t mSeed;
  };
}

#endif
