// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Report fields shared by METAR and TAF: wind, visibility, weather
 * phenomena and cloud layers, and their token parsers.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <aerowx/constants.h>
#include <aerowx/environment/report_tokens.hxx>

namespace aerowx {

struct Wind {
    int direction = -1;             ///< degrees true, -1 for VRB
    int speed = 0;
    std::optional<int> gust;
    std::string unit = "KT";        ///< KT, MPS or KMH

    bool isVariable() const { return direction < 0; }
};

struct WindVariability {
    int from = 0;
    int to = 0;
};

struct Visibility {
    std::optional<int> meters;
    std::optional<double> miles;    ///< statute miles, when reported in SM
    bool cavok = false;
};

struct CloudLayer {
    std::string coverage;           ///< SKC, CLR, NSC, NCD, FEW, SCT, BKN, OVC, VV
    std::string heightCode;         ///< three digits, hundreds of feet, or empty
    std::optional<int> height_m;
    std::string qualifier;          ///< CB, TCU or empty
    bool typeUnknown = false;       ///< trailing ///
};

struct WeatherPhenomenon {
    char intensity = 0;             ///< '-', '+' or 0
    string_list descriptors;
    string_list phenomena;
    std::string code;               ///< the token as reported

    /// concatenated descriptor codes ("SH", "VCTS")
    std::string descriptor() const;
    /// concatenated phenomenon codes ("SNRA")
    std::string phenomenon() const;
    bool hasDescriptor(const std::string& d) const;
};

struct ForecastBody {
    std::optional<Wind> wind;
    std::optional<Visibility> visibility;
    std::vector<WeatherPhenomenon> weather;
    std::vector<CloudLayer> clouds;
    bool noSignificantWeather = false;
    string_list unparsed;
};

std::optional<Wind> parseWind(const std::string& token);
std::optional<WindVariability> parseWindVariability(const std::string& token);

/**
 * Meters (one to four digits, 9999 meaning 10 km or more), statute miles
 * (N, N/D or NN/D followed by SM) or CAVOK.
 */
std::optional<Visibility> parseVisibility(const std::string& token);

std::optional<WeatherPhenomenon> parseWeather(const std::string& token);

/// @param heightScale meters per unit of the three digit height code
std::optional<CloudLayer> parseCloudLayer(const std::string& token,
                                          int heightScale = AW_CLOUD_CODE_TO_METER);

bool isNoSignificantWeather(const std::string& token);

/**
 * TX or TN forecast temperature token ("TX15/2114Z", "TNM02/0306Z").
 * @param kind 'X' or 'N' to accept only one of them, 0 for both
 */
bool isTemperatureExtreme(const std::string& token, char kind = 0);

/**
 * Parse the tokens of one forecast period. Tokens matching no field end up
 * in ForecastBody::unparsed; a repeated wind or visibility group replaces
 * the earlier one. A TX group directly followed by a TN group is skipped,
 * the pair belongs to the whole report; a lone TX or TN is unparsed.
 */
ForecastBody parseForecastBody(const string_list& tokens);

} // namespace aerowx
