// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "Recommendation.h"
#include <stdexcept>

namespace bideval
{
  std::string getRecommendationString(Recommendation recommendation)
  {
    switch (recommendation)
      {
      case Recommendation::Award:
	return "award";
      case Recommendation::Shortlist:
	return "shortlist";
      case Recommendation::Reject:
	return "reject";
      default:
	throw std::invalid_argument("Unknown recommendation");
      }
  }
}
