// SPDX-License-Identifier: LGPL-2.1-or-later

#include <aerowx_config.h>

#include "forecast_fields.hxx"

#include <algorithm>
#include <cmath>

#include <boost/algorithm/string/join.hpp>

#include <aerowx/debug/logstream.hxx>

#include "token_scanner.hxx"
#include "weather_codes.hxx"

namespace aerowx {

std::string WeatherPhenomenon::descriptor() const
{
    return boost::algorithm::join(descriptors, "");
}

std::string WeatherPhenomenon::phenomenon() const
{
    return boost::algorithm::join(phenomena, "");
}

bool WeatherPhenomenon::hasDescriptor(const std::string& d) const
{
    return std::find(descriptors.begin(), descriptors.end(), d) != descriptors.end();
}

// (\d{3}|VRB)(\d{2,3})(G\d{2,3})?(KT|MPS|KMH)?
std::optional<Wind> parseWind(const std::string& token)
{
    TokenScanner s(token);
    Wind w;
    if (s.scanLiteral("VRB"))
        w.direction = -1;
    else if (!s.scanNumber(&w.direction, 3))
        return {};

    if (!s.scanNumber(&w.speed, 2, 3))
        return {};

    if (s.scanChar('G')) {
        int gust;
        if (!s.scanNumber(&gust, 2, 3))
            return {};
        w.gust = gust;
    }

    if (s.scanLiteral("KT"))
        w.unit = "KT";
    else if (s.scanLiteral("MPS"))
        w.unit = "MPS";
    else if (s.scanLiteral("KMH"))
        w.unit = "KMH";

    if (!s.atEnd())
        return {};
    return w;
}

// \d{3}V\d{3}
std::optional<WindVariability> parseWindVariability(const std::string& token)
{
    TokenScanner s(token);
    WindVariability v;
    if (!s.scanNumber(&v.from, 3) || !s.scanChar('V') || !s.scanNumber(&v.to, 3))
        return {};
    if (!s.atEnd())
        return {};
    return v;
}

std::optional<Visibility> parseVisibility(const std::string& token)
{
    Visibility v;
    if (token == "CAVOK") {
        v.cavok = true;
        v.meters = AW_VISIBILITY_UNLIMITED_M;
        return v;
    }

    TokenScanner s(token);
    int num;
    int digits = s.scanNumber(&num, 1, 4);
    if (!digits)
        return {};

    if (s.atEnd()) {
        v.meters = num == 9999 ? AW_VISIBILITY_UNLIMITED_M : num;
        return v;
    }

    // N, N/D or NN/D statute miles
    if (digits > 2)
        return {};
    double miles = num;
    if (s.scanChar('/')) {
        int den;
        if (!s.scanNumber(&den, 1, 2) || den == 0)
            return {};
        miles = static_cast<double>(num) / den;
    }
    if (!s.scanLiteral("SM") || !s.atEnd())
        return {};

    v.miles = miles;
    v.meters = static_cast<int>(std::lround(miles * AW_SM_TO_METER));
    return v;
}

std::optional<WeatherPhenomenon> parseWeather(const std::string& token)
{
    TokenScanner s(token);
    WeatherPhenomenon w;
    w.code = token;

    char intensity;
    if (s.scanOneOf("-+", &intensity))
        w.intensity = intensity;

    const Token* a;
    for (int i = 0; i < 2 && (a = s.scanToken(weather_descriptors)); i++)
        w.descriptors.push_back(a->id);

    while ((a = s.scanToken(weather_phenomena)))
        w.phenomena.push_back(a->id);

    if (!s.atEnd())
        return {};

    if (w.phenomena.empty()) {
        // thunderstorm or showers without precipitation: TS, VCTS, VCSH
        if (!w.hasDescriptor("TS") && !w.hasDescriptor("SH"))
            return {};
    }
    return w;
}

std::optional<CloudLayer> parseCloudLayer(const std::string& token, int heightScale)
{
    TokenScanner s(token);
    const Token* a = s.scanToken(cloud_coverage);
    if (!a)
        return {};

    CloudLayer cl;
    cl.coverage = a->id;

    if (s.scanDigits(&cl.heightCode, 3))
        cl.height_m = std::stoi(cl.heightCode) * heightScale;

    if ((a = s.scanToken(cloud_qualifiers)))
        cl.qualifier = a->id;

    if (s.scanLiteral("///"))
        cl.typeUnknown = true;

    if (!s.atEnd())
        return {};
    return cl;
}

bool isNoSignificantWeather(const std::string& token)
{
    return token == "NSW";
}

// T[XN]M?\d{2}/\d{4}Z
bool isTemperatureExtreme(const std::string& token, char kind)
{
    TokenScanner s(token);
    int num;
    char found;
    if (!s.scanChar('T') || !s.scanOneOf("XN", &found))
        return false;
    if (kind && found != kind)
        return false;
    s.scanChar('M');
    return s.scanNumber(&num, 2) && s.scanChar('/') && s.scanNumber(&num, 4)
        && s.scanChar('Z') && s.atEnd();
}

ForecastBody parseForecastBody(const string_list& tokens)
{
    ForecastBody body;
    for (size_t i = 0; i < tokens.size(); i++) {
        const std::string& token = tokens[i];
        if (auto wind = parseWind(token)) {
            body.wind = wind;
        } else if (auto vis = parseVisibility(token)) {
            body.visibility = vis;
        } else if (auto wx = parseWeather(token)) {
            body.weather.push_back(*wx);
        } else if (auto cloud = parseCloudLayer(token)) {
            body.clouds.push_back(*cloud);
        } else if (isNoSignificantWeather(token)) {
            body.noSignificantWeather = true;
        } else if (i + 1 < tokens.size() && isTemperatureExtreme(token, 'X')
                   && isTemperatureExtreme(tokens[i + 1], 'N')) {
            // collected over the whole report by the caller
            i++;
        } else {
            AW_LOG(AW_TAF, AW_DEBUG, "unparsed forecast group '" << token << "'");
            body.unparsed.push_back(token);
        }
    }
    return body;
}

} // namespace aerowx
