// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_RECOMMENDATION_H
#define __BIDEVAL_RECOMMENDATION_H 1

#include <string>

namespace bideval
{
  /**
   * @brief Recommendation tier derived from a bid's total score
   */
  enum class Recommendation
  {
    Award,      ///< total score at or above the award threshold
    Shortlist,  ///< total score at or above the shortlist threshold
    Reject      ///< everything else
  };

  /**
   * @brief Wire name of a recommendation ("award", "shortlist", "reject")
   * @throws std::invalid_argument if the tier is unknown
   */
  std::string getRecommendationString(Recommendation recommendation);
}

#endif
