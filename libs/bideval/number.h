#ifndef __BIDEVAL_NUMBER_H
#define __BIDEVAL_NUMBER_H 1

#include <string>
#include <sstream>
#include <iomanip>
#include "decimal.h"
#include "DecimalConstants.h"

/**
 * @file number.h
 * @brief Decimal helpers shared by the bid evaluation engine.
 *
 * Prices, weights and scores are fixed-point decimals. This namespace holds
 * the project-wide decimal type plus conversion and rounding helpers.
 */
namespace num
{
  /**
   * @brief Default decimal type with 7 decimal places using the default rounding policy.
   * @see dec::decimal
   */
  using DefaultNumber  = dec::decimal<7>;

  /**
   * @brief Converts a DefaultNumber to a double.
   * Note: This conversion may result in a loss of precision.
   */
  inline double to_double(const DefaultNumber& d) {
    return d.getAsDouble();
  }

  using bideval::DecimalConstants;

  /**
   * @brief Rounds a value to the nearest multiple of tick.
   *
   * `tickDiv2` is `tick / 2`; a remainder at or above it rounds up, so
   * midpoints round away from zero for non-negative inputs.
   *
   * @param price The value to be rounded.
   * @param tick The rounding increment.
   * @param tickDiv2 Half of the rounding increment.
   * @return The value rounded to the nearest tick.
   */
  template<typename Decimal>
  inline Decimal Round2Tick(Decimal price,
                            Decimal tick,
                            Decimal tickDiv2)
  {
    static const Decimal zero = DecimalConstants<Decimal>::DecimalZero;
    Decimal rem = price % tick;

    return price - rem + ((rem < tickDiv2) ? zero : tick);
  }

  /**
   * @brief Rounds a score to two decimal places (half-up).
   *
   * Every sub-score and total score the engine publishes goes through here.
   */
  template<typename Decimal>
  inline Decimal roundToHundredths(const Decimal& value)
  {
    return Round2Tick<Decimal>(value,
			       DecimalConstants<Decimal>::OneHundredth,
			       DecimalConstants<Decimal>::HalfHundredth);
  }

  /**
   * @brief Clamp a decimal to the closed interval [lo, hi].
   */
  template<typename Decimal>
  inline Decimal clamp(const Decimal& value, const Decimal& lo, const Decimal& hi)
  {
    if (value < lo)
      return lo;
    if (hi < value)
      return hi;
    return value;
  }

  /**
   * @brief Fixed-point text with the requested number of fractional digits.
   */
  template<typename Decimal>
  inline std::string toFixedString(const Decimal& value, int places = 2)
  {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(places) << value.getAsDouble();
    return oss.str();
  }

} // namespace num

#endif // __BIDEVAL_NUMBER_H
