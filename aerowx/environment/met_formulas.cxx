// SPDX-License-Identifier: LGPL-2.1-or-later

#include <aerowx_config.h>

#include "met_formulas.hxx"

#include <cmath>

#include <aerowx/constants.h>

namespace aerowx {

double roundTo(double r, int digits)
{
    double f = std::pow(10.0, digits);
    return std::floor(r * f + 0.5) / f;
}

double relativeHumidity(double temperature_C, double dewpoint_C)
{
    double dewp = std::exp(AW_MAGNUS_B * dewpoint_C / (AW_MAGNUS_C + dewpoint_C));
    double temp = std::exp(AW_MAGNUS_B * temperature_C / (AW_MAGNUS_C + temperature_C));
    return roundTo(100.0 * dewp / temp, 1);
}

double altimeterInHgToHPa(double inHg)
{
    return roundTo(inHg * AW_INHG_TO_HPA, 1);
}

double altimeterHPaToInHg(double hPa)
{
    // not the inverse of altimeterInHgToHPa()
    return roundTo(hPa * AW_HPA_TO_Q_NUMERATOR / AW_HPA_TO_Q_DENOMINATOR, 2);
}

double seaLevelPressureFromRemark(int value)
{
    if (value < 500)
        return 1000.0 + value / 10.0;
    return 900.0 + value / 10.0;
}

double mmHgToHPa(double mmHg)
{
    return roundTo(mmHg * AW_MMHG_TO_HPA, 1);
}

} // namespace aerowx
