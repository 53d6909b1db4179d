// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Plain text (Russian) rendering of decoded reports.
 */

#pragma once

#include <string>

namespace aerowx {

class Metar;
class Taf;
struct CloudLayer;
struct ForecastBody;
struct Visibility;
struct Wind;

/**
 * One line per decoded item, in a fixed order: header, wind, visibility,
 * runway visual range, runway state, weather, clouds, temperature and
 * humidity, altimeter, trend groups in report order, remarks.
 */
std::string describeMetar(const Metar& m);

/// header, base forecast, temperature extremes, then every change group
std::string describeTaf(const Taf& t);

std::string describeWind(const Wind& w);
std::string describeVisibility(const Visibility& v);
std::string describeCloudLayer(const CloudLayer& c);

} // namespace aerowx
