// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Decoder for encoded Meteorological Aerodrome Reports (METAR).
 *
 * The header groups are positional: each is optional, but they are only
 * looked for in their fixed order. The rest of the report is matched
 * group by group against an ordered scanner table where the first match
 * wins. A trend marker switches weather, cloud, visibility and wind
 * groups over to the trend fields for the rest of the report.
 */

#include <aerowx_config.h>

#include "metar.hxx"

#include <cctype>

#include <boost/algorithm/string/join.hpp>

#include <aerowx/debug/logstream.hxx>

#include "met_formulas.hxx"
#include "report_printer.hxx"
#include "token_scanner.hxx"

namespace aerowx {

namespace {

// R\d\d[LCR]?/
bool scanRunwayDesignator(TokenScanner& s, std::string* runway)
{
    const char* mark = s.position();
    int num;
    if (!s.scanChar('R') || !s.scanNumber(&num, 2))
        return false;
    s.scanOneOf("LCR");
    *runway = s.since(mark).substr(1);
    return s.scanChar('/');
}

// two digits or "//"
bool scanTwoDigitsOrSlashes(TokenScanner& s, std::string* value)
{
    if (s.scanLiteral("//")) {
        *value = "//";
        return true;
    }
    return s.scanDigits(value, 2) != 0;
}

} // of anonymous namespace

Metar::Metar(const std::string& report) :
    _tokens(report),
    _state(HEADER),
    _automated(false),
    _corrected(false),
    _trend_nsw(false)
{
    const string_list& tokens = _tokens.getBody();
    size_t pos = 0;

    scanHeader(tokens, pos);
    if (_state == NIL) {
        AW_LOG(AW_METAR, AW_DEBUG, "NIL report for " << _icao);
        return;
    }

    _state = MAIN_BODY;
    scanBody(tokens, pos);

    if (_tokens.hasRemarks())
        _remark_details = scanRemarks(_tokens.getRemarks());

    if (!_unparsed.empty())
        AW_LOG(AW_METAR, AW_INFO, _icao << ": " << _unparsed.size() << " unparsed groups");
}

void Metar::scanHeader(const string_list& tokens, size_t& pos)
{
    static const Scanner leading[] = {
        &Metar::scanPreambleDate,
        &Metar::scanPreambleTime,
        &Metar::scanType,
        &Metar::scanId,
        &Metar::scanDate,
    };
    static const Scanner baseSet[] = {
        &Metar::scanWind,
        &Metar::scanVariability,
        &Metar::scanVisibility,
    };

    for (auto scan : leading) {
        if (pos < tokens.size() && (this->*scan)(tokens[pos]))
            pos++;
    }

    while (pos < tokens.size() && scanModifier(tokens[pos]))
        pos++;

    if (pos < tokens.size() && scanNil(tokens[pos])) {
        _state = NIL;
        return;
    }

    for (auto scan : baseSet) {
        if (pos < tokens.size() && (this->*scan)(tokens[pos]))
            pos++;
    }
}

void Metar::scanBody(const string_list& tokens, size_t pos)
{
    struct BodyScanner {
        Scanner scan;
        bool trendOnly;
    };

    // order matters: a runway state group would also pass as RVR
    static const BodyScanner scanners[] = {
        { &Metar::scanRunwayCondition, false },
        { &Metar::scanRwyVisRange, false },
        { &Metar::scanWeather, false },
        { &Metar::scanSkyCondition, false },
        { &Metar::scanTemperature, false },
        { &Metar::scanPressure, false },
        { &Metar::scanTrendMarker, false },
        { &Metar::scanTrendVisibility, true },
        { &Metar::scanTrendWind, true },
        { &Metar::scanTrendNoSigWeather, true },
    };

    for (; pos < tokens.size(); pos++) {
        const std::string& token = tokens[pos];
        bool found = false;
        for (const auto& s : scanners) {
            if (s.trendOnly && _state != TREND)
                continue;
            if ((found = (this->*s.scan)(token)))
                break;
        }
        if (!found) {
            AW_LOG(AW_METAR, AW_DEBUG, "unparsed METAR group '" << token << "'");
            _unparsed.push_back(token);
        }
    }
}

std::string Metar::getUnparsedData() const
{
    return boost::algorithm::join(_unparsed, " ");
}

std::string Metar::getDescription() const
{
    return describeMetar(*this);
}

// YYYY/MM/DD
bool Metar::scanPreambleDate(const std::string& token)
{
    TokenScanner s(token);
    MetarPreamble p;
    if (!s.scanNumber(&p.year, 4) || !s.scanChar('/')
            || !s.scanNumber(&p.month, 2) || !s.scanChar('/')
            || !s.scanNumber(&p.day, 2) || !s.atEnd())
        return false;
    _preamble = p;
    return true;
}

// HH:MM
bool Metar::scanPreambleTime(const std::string& token)
{
    TokenScanner s(token);
    int hour, minute;
    if (!s.scanNumber(&hour, 2) || !s.scanChar(':')
            || !s.scanNumber(&minute, 2) || !s.atEnd())
        return false;
    if (!_preamble)
        _preamble = MetarPreamble();
    _preamble->hour = hour;
    _preamble->minute = minute;
    return true;
}

bool Metar::scanType(const std::string& token)
{
    if (token != "METAR" && token != "SPECI")
        return false;
    _report_type = token;
    return true;
}

// [A-Z]{4}
bool Metar::scanId(const std::string& token)
{
    if (token.size() != 4)
        return false;
    for (char c : token) {
        if (!isupper(static_cast<unsigned char>(c)))
            return false;
    }
    _icao = token;
    return true;
}

// DDHHMMZ
bool Metar::scanDate(const std::string& token)
{
    TokenScanner s(token);
    ReportTime t;
    if (!s.scanNumber(&t.day, 2) || !s.scanNumber(&t.hour, 2)
            || !s.scanNumber(&t.minute, 2) || !s.scanChar('Z') || !s.atEnd())
        return false;
    _time = t;
    return true;
}

// AUTO, COR, CCx
bool Metar::scanModifier(const std::string& token)
{
    if (token == "AUTO") {
        _automated = true;
        return true;
    }
    if (token == "COR" || (token.size() == 3 && token[0] == 'C' && token[1] == 'C'
                           && isupper(static_cast<unsigned char>(token[2])))) {
        _corrected = true;
        return true;
    }
    return false;
}

bool Metar::scanNil(const std::string& token)
{
    return token == "NIL";
}

bool Metar::scanWind(const std::string& token)
{
    _wind = parseWind(token);
    return static_cast<bool>(_wind);
}

bool Metar::scanVariability(const std::string& token)
{
    _wind_range = parseWindVariability(token);
    return static_cast<bool>(_wind_range);
}

bool Metar::scanVisibility(const std::string& token)
{
    _visibility = parseVisibility(token);
    return static_cast<bool>(_visibility);
}

// R\d\d[LCR]?/(\d|/)(\d|/|NR)(\d\d|//)(\d\d|//)
bool Metar::scanRunwayCondition(const std::string& token)
{
    TokenScanner s(token);
    RunwayCondition rc;
    if (!scanRunwayDesignator(s, &rc.runway))
        return false;

    char c;
    if (!s.scanOneOf("0123456789/", &c))
        return false;
    rc.deposit = c;

    if (s.scanLiteral("NR"))
        rc.extent = "NR";
    else if (s.scanOneOf("0123456789/", &c))
        rc.extent = c;
    else
        return false;

    if (!scanTwoDigitsOrSlashes(s, &rc.depth) || !scanTwoDigitsOrSlashes(s, &rc.friction))
        return false;
    if (!s.atEnd())
        return false;

    _runway_conditions.push_back(rc);
    return true;
}

// R\d\d[LCR]?/ followed by [PM]?\d{3,4}(V[PM]?\d{4})?, \d{5,6} or
// \d{1,4}//\d{1,4}, then an optional tendency U, D or N
bool Metar::scanRwyVisRange(const std::string& token)
{
    TokenScanner s(token);
    RunwayVisualRange r;
    if (!scanRunwayDesignator(s, &r.runway))
        return false;

    const char* mark = s.position();
    int num;
    if (s.scanOneOf("PM")) {
        if (!s.scanNumber(&num, 3, 4))
            return false;
        r.format = RunwayVisualRange::STANDARD;
    } else {
        int digits = s.scanNumber(&num, 1, 6);
        if (!digits)
            return false;
        if (digits <= 4 && s.scanLiteral("//")) {
            if (!s.scanNumber(&num, 1, 4))
                return false;
            r.format = RunwayVisualRange::SLASHED;
        } else if (digits >= 5) {
            r.format = RunwayVisualRange::LONG;
        } else if (digits >= 3) {
            r.format = RunwayVisualRange::STANDARD;
        } else {
            return false;
        }
    }
    r.value = s.since(mark);

    if (r.format == RunwayVisualRange::STANDARD && s.scanChar('V')) {
        mark = s.position();
        s.scanOneOf("PM");
        if (!s.scanNumber(&num, 4))
            return false;
        r.maximum = s.since(mark);
    }

    char tendency;
    if (s.scanOneOf("UDN", &tendency))
        r.tendency = tendency;

    if (!s.atEnd())
        return false;

    _rvr.push_back(r);
    return true;
}

bool Metar::scanWeather(const std::string& token)
{
    auto w = parseWeather(token);
    if (!w)
        return false;
    (_state == TREND ? _trend_weather : _weather).push_back(*w);
    return true;
}

bool Metar::scanSkyCondition(const std::string& token)
{
    auto cl = parseCloudLayer(token);
    if (!cl)
        return false;
    (_state == TREND ? _trend_clouds : _clouds).push_back(*cl);
    return true;
}

// M?\d{1,2}/M?\d{1,2}
bool Metar::scanTemperature(const std::string& token)
{
    TokenScanner s(token);
    int temp, dewp;
    bool neg = s.scanChar('M');
    if (!s.scanNumber(&temp, 1, 2) || !s.scanChar('/'))
        return false;
    if (neg)
        temp = -temp;

    neg = s.scanChar('M');
    if (!s.scanNumber(&dewp, 1, 2) || !s.atEnd())
        return false;
    if (neg)
        dewp = -dewp;

    _temp = temp;
    _dewp = dewp;
    _rel_humidity = relativeHumidity(temp, dewp);
    return true;
}

// [AQ]\d{4}
bool Metar::scanPressure(const std::string& token)
{
    TokenScanner s(token);
    Altimeter a;
    if (!s.scanOneOf("AQ", &a.group) || !s.scanNumber(&a.value, 4) || !s.atEnd())
        return false;

    if (a.group == 'A') {
        a.pressure_inHg = a.value / 100.0;
        a.pressure_hPa = altimeterInHgToHPa(a.pressure_inHg);
    } else {
        a.pressure_hPa = a.value;
        a.pressure_inHg = altimeterHPaToInHg(a.value);
    }
    _altimeter = a;
    return true;
}

// TEMPO, BECMG, NOSIG, PROB\d\d, (FM|TL|AT)\d{4}
bool Metar::scanTrendMarker(const std::string& token)
{
    TrendGroup t;
    t.code = token;

    TokenScanner s(token);
    int num;
    if (token == "TEMPO" || token == "BECMG" || token == "NOSIG") {
        t.type = token;
    } else if (s.scanLiteral("PROB")) {
        if (!s.scanNumber(&num, 2) || !s.atEnd())
            return false;
        t.type = token;
    } else if (s.scanLiteral("FM") || s.scanLiteral("TL") || s.scanLiteral("AT")) {
        t.type = token.substr(0, 2);
        if (!s.scanNumber(&t.hour, 2) || !s.scanNumber(&t.minute, 2) || !s.atEnd())
            return false;
    } else {
        return false;
    }

    if (_state != TREND)
        AW_LOG(AW_METAR, AW_BULK, "trend section starts at '" << token << "'");
    _state = TREND;
    _trends.push_back(t);
    return true;
}

bool Metar::scanTrendVisibility(const std::string& token)
{
    auto v = parseVisibility(token);
    if (!v)
        return false;
    _trend_visibility.push_back(*v);
    return true;
}

bool Metar::scanTrendWind(const std::string& token)
{
    auto w = parseWind(token);
    if (!w)
        return false;
    _trend_wind.push_back(*w);
    return true;
}

bool Metar::scanTrendNoSigWeather(const std::string& token)
{
    if (!isNoSignificantWeather(token))
        return false;
    _trend_nsw = true;
    return true;
}

} // namespace aerowx
