// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BIDEVAL_DECIMAL_CONSTANTS_H
#define __BIDEVAL_DECIMAL_CONSTANTS_H 1

#include <string>
#include <type_traits>
#include "decimal.h"

namespace bideval
{
  template <class Decimal>
  class DecimalConstants
    {
    public:
      static Decimal DecimalZero;
      static Decimal DecimalTen;
      static Decimal DecimalThirty;
      static Decimal DecimalSixty;
      static Decimal DecimalSeventy;
      static Decimal DecimalSeventyFive;
      static Decimal DecimalEightyFive;
      static Decimal DecimalOneHundred;
      static Decimal OneHundredth;            // score resolution (0.01)
      static Decimal HalfHundredth;           // rounding midpoint for OneHundredth
      static Decimal DefaultWeightTolerance;

      static Decimal createDecimal (const std::string& valueString)
      {
        if constexpr (std::is_floating_point_v<Decimal>) {
          return static_cast<Decimal>(std::stod(valueString));
        } else {
          return dec::fromString<Decimal>(valueString);
        }
      }
    };

  // ---------------------------------------------------------------------------
  // Static member definitions
  //
  // Values are built from strings so the full precision of the Decimal type
  // is used instead of a rounded floating-point literal.
  // ---------------------------------------------------------------------------

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalZero(
      DecimalConstants<Decimal>::createDecimal("0.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalTen(
      DecimalConstants<Decimal>::createDecimal("10.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalThirty(
      DecimalConstants<Decimal>::createDecimal("30.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalSixty(
      DecimalConstants<Decimal>::createDecimal("60.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalSeventy(
      DecimalConstants<Decimal>::createDecimal("70.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalSeventyFive(
      DecimalConstants<Decimal>::createDecimal("75.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalEightyFive(
      DecimalConstants<Decimal>::createDecimal("85.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalOneHundred(
      DecimalConstants<Decimal>::createDecimal("100.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::OneHundredth(
      DecimalConstants<Decimal>::createDecimal("0.01"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::HalfHundredth(
      DecimalConstants<Decimal>::createDecimal("0.005"));

  // Weights may drift from 100 by this much before criteria are rejected
  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultWeightTolerance(
      DecimalConstants<Decimal>::createDecimal("0.01"));
}

#endif
