// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Decoder for Terminal Aerodrome Forecasts (TAF).
 *
 * Format: [TAF] [AMD|COR] CCCC DDHHMMZ DDHH/DDHH <base forecast>
 * followed by change groups, each introduced by BECMG, TEMPO, PROBnn
 * [TEMPO] (with an optional DDHH/DDHH period) or FMDDHHMM.
 */

#include <aerowx_config.h>

#include "taf.hxx"

#include <cctype>

#include <aerowx/debug/logstream.hxx>
#include <aerowx/structure/exception.hxx>

#include "report_printer.hxx"
#include "token_scanner.hxx"

namespace aerowx {

namespace {

bool scanDayHour(TokenScanner& s, DayHour* dh)
{
    return s.scanNumber(&dh->day, 2) && s.scanNumber(&dh->hour, 2);
}

// FMDDHHMM
std::optional<ForecastTime> parseFromTime(const std::string& token)
{
    TokenScanner s(token);
    ForecastTime t;
    if (!s.scanLiteral("FM") || !s.scanNumber(&t.day, 2) || !s.scanNumber(&t.hour, 2)
            || !s.scanNumber(&t.minute, 2) || !s.atEnd())
        return {};
    return t;
}

// PROB\d\d
bool isProbability(const std::string& token)
{
    TokenScanner s(token);
    int num;
    return s.scanLiteral("PROB") && s.scanNumber(&num, 2) && s.atEnd();
}

// T[XN]M?\d\d/DDHHZ
bool parseExtreme(const std::string& token, char kind, int* temp, DayHour* when)
{
    TokenScanner s(token);
    if (!s.scanChar('T') || !s.scanChar(kind))
        return false;
    bool neg = s.scanChar('M');
    if (!s.scanNumber(temp, 2) || !s.scanChar('/') || !scanDayHour(s, when)
            || !s.scanChar('Z') || !s.atEnd())
        return false;
    if (neg)
        *temp = -*temp;
    return true;
}

bool isStation(const std::string& token)
{
    if (token.size() != 4)
        return false;
    for (char c : token) {
        if (!isupper(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

} // of anonymous namespace

std::optional<ValidityPeriod> parseValidityPeriod(const std::string& token)
{
    TokenScanner s(token);
    ValidityPeriod p;
    if (!scanDayHour(s, &p.from) || !s.scanChar('/') || !scanDayHour(s, &p.to) || !s.atEnd())
        return {};
    return p;
}

bool isChangeMarker(const std::string& token)
{
    return token == "BECMG" || token == "TEMPO" || isProbability(token)
        || static_cast<bool>(parseFromTime(token));
}

Taf::Taf(const std::string& report) :
    _tokens(report),
    _amendment(false),
    _correction(false)
{
    const string_list& tokens = _tokens.getBody();
    try {
        size_t pos = scanHeader(tokens);
        scanChangeGroups(tokens, pos);
        scanTemperatures();
    } catch (const aw_format_exception& e) {
        AW_LOG(AW_TAF, AW_WARN, e.getFormattedMessage() << ": " << e.getText());
        _error = e.getMessage();
        _icao.clear();
        _issue_time = ForecastTime();
        _validity = ValidityPeriod();
        _amendment = _correction = false;
    }
}

std::string Taf::getDescription() const
{
    return describeTaf(*this);
}

size_t Taf::scanHeader(const string_list& tokens)
{
    size_t pos = 0;
    if (pos < tokens.size() && tokens[pos] == "TAF")
        pos++;

    if (pos < tokens.size()) {
        if (tokens[pos] == "AMD") {
            _amendment = true;
            pos++;
        } else if (tokens[pos] == "COR") {
            _correction = true;
            pos++;
        }
    }

    if (pos >= tokens.size() || !isStation(tokens[pos]))
        throw aw_format_exception("TAF station identifier missing", _tokens.getText(), AW_ORIGIN);
    _icao = tokens[pos++];

    TokenScanner issue(pos < tokens.size() ? tokens[pos] : std::string());
    if (!issue.scanNumber(&_issue_time.day, 2) || !issue.scanNumber(&_issue_time.hour, 2)
            || !issue.scanNumber(&_issue_time.minute, 2) || !issue.scanChar('Z')
            || !issue.atEnd())
        throw aw_format_exception("TAF issue time malformed or missing", _tokens.getText(), AW_ORIGIN);
    pos++;

    auto validity = pos < tokens.size() ? parseValidityPeriod(tokens[pos]) : std::nullopt;
    if (!validity)
        throw aw_format_exception("TAF validity period malformed or missing", _tokens.getText(), AW_ORIGIN);
    _validity = *validity;
    return pos + 1;
}

void Taf::scanChangeGroups(const string_list& tokens, size_t pos)
{
    string_list group;
    while (pos < tokens.size() && !isChangeMarker(tokens[pos]))
        group.push_back(tokens[pos++]);
    _base = parseForecastBody(group);

    while (pos < tokens.size()) {
        ChangeGroup g;
        const std::string& marker = tokens[pos++];

        if (auto t = parseFromTime(marker)) {
            g.type = "FM";
            g.time = t;
        } else {
            g.type = marker;
            if (isProbability(marker) && pos < tokens.size() && tokens[pos] == "TEMPO") {
                g.type += " TEMPO";
                pos++;
            }
            if (pos < tokens.size()) {
                if ((g.period = parseValidityPeriod(tokens[pos])))
                    pos++;
            }
        }

        group.clear();
        while (pos < tokens.size() && !isChangeMarker(tokens[pos]))
            group.push_back(tokens[pos++]);
        g.forecast = parseForecastBody(group);

        AW_LOG(AW_TAF, AW_BULK, _icao << ": change group " << g.type
               << " with " << group.size() << " groups");
        _groups.push_back(g);
    }
}

// the first TX group directly followed by a TN group, remarks included
void Taf::scanTemperatures()
{
    string_list tokens = _tokens.getBody();
    tokens.insert(tokens.end(), _tokens.getRemarks().begin(), _tokens.getRemarks().end());

    for (size_t i = 0; i + 1 < tokens.size(); i++) {
        TemperatureExtremes t;
        if (parseExtreme(tokens[i], 'X', &t.max_C, &t.maxTime)
                && parseExtreme(tokens[i + 1], 'N', &t.min_C, &t.minTime)) {
            _temperatures = t;
            return;
        }
    }
}

} // namespace aerowx
