// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "BidScorer.h"

namespace bideval
{
  uint64_t mixBidSeed(uint64_t masterSeed, const std::string& bidId)
  {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : bidId)
      {
	hash ^= static_cast<uint64_t>(c);
	hash *= 1099511628211ULL;
      }

    uint64_t z = masterSeed ^ hash;
    z += 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
  }
}
