// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Code vocabularies of METAR and TAF reports with their Russian
 * wording, and the weather phrase builder.
 */

#pragma once

#include <string>

#include "forecast_fields.hxx"
#include "token_scanner.hxx"

namespace aerowx {

extern const Token weather_phenomena[];
extern const Token weather_compounds[];
extern const Token weather_descriptors[];
extern const Token cloud_coverage[];
extern const Token cloud_qualifiers[];
extern const Token trend_markers[];
extern const Token runway_deposits[];
extern const Token runway_extents[];
extern const Token rvr_tendencies[];
extern const Token wind_units[];
extern const Token change_group_types[];

/// wording of @a id in @a list, or @a id itself when the code is unknown
std::string translateCode(const Token* list, const std::string& id);

/**
 * Instrumental case of a weather term, as needed after the connector "с".
 * The leading words with a known form are inflected ("ливневой дождь" gives
 * "ливневым дождём"); from the first unknown word on the phrase is kept.
 */
std::string instrumentalCase(const std::string& term);

/**
 * Russian phrase for one weather group. Precomposed compounds win over
 * code by code composition; a thunderstorm descriptor makes the storm the
 * subject; intensity comes first.
 */
std::string describeWeather(const WeatherPhenomenon& w);

} // namespace aerowx
