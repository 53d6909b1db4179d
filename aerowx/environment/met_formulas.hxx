// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Derived quantities: relative humidity and pressure conversions.
 */

#pragma once

namespace aerowx {

/**
 * Round @a r to @a digits decimal places, halves away from zero for
 * positive values.
 */
double roundTo(double r, int digits = 0);

/**
 * Relative humidity in percent from temperature and dew point (deg C),
 * Magnus approximation, rounded to one decimal.
 */
double relativeHumidity(double temperature_C, double dewpoint_C);

/// hPa value of an A-group altimeter setting in inHg, rounded to 0.1
double altimeterInHgToHPa(double inHg);

/// secondary value of a Q-group altimeter setting (hPa * 3 / 4), rounded to 0.01
double altimeterHPaToInHg(double hPa);

/**
 * Sea level pressure (hPa) from the three digit SLP remark value, which
 * carries tenths of hPa without the leading 9 or 10.
 */
double seaLevelPressureFromRemark(int value);

/// mmHg to hPa, rounded to 0.1
double mmHgToHPa(double mmHg);

} // namespace aerowx
