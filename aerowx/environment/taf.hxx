// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Interface for Terminal Aerodrome Forecasts (TAF).
 */

#ifndef _AW_TAF_HXX
#define _AW_TAF_HXX

#include <optional>
#include <string>
#include <vector>

#include <aerowx/environment/forecast_fields.hxx>
#include <aerowx/environment/report_tokens.hxx>

namespace aerowx {

/// day of month and hour; hour 24 is kept as coded
struct DayHour {
    int day = -1;
    int hour = -1;
};

struct ValidityPeriod {
    DayHour from;
    DayHour to;
};

struct ForecastTime {
    int day = -1;
    int hour = -1;
    int minute = -1;
};

struct ChangeGroup {
    /// BECMG, TEMPO, FM, PROB30, PROB40, "PROB30 TEMPO" or "PROB40 TEMPO"
    std::string type;
    std::optional<ValidityPeriod> period;
    std::optional<ForecastTime> time;   ///< FM groups only
    ForecastBody forecast;
};

struct TemperatureExtremes {
    int max_C = 0;
    DayHour maxTime;
    int min_C = 0;
    DayHour minTime;
};

/**
 * A decoded TAF. A report whose header (station, issue time, validity)
 * does not scan is not decoded any further: hasError() is set and only
 * the raw text is kept.
 */
class Taf
{
public:
    explicit Taf(const std::string& report);

    /// the normalized report text
    const std::string& getData() const { return _tokens.getText(); }

    bool hasError() const { return !_error.empty(); }
    const std::string& getError() const { return _error; }

    const std::string& getId() const { return _icao; }
    const ForecastTime& getIssueTime() const { return _issue_time; }
    const ValidityPeriod& getValidity() const { return _validity; }
    bool isAmendment() const { return _amendment; }
    bool isCorrection() const { return _correction; }

    const ForecastBody& getBaseForecast() const { return _base; }
    const std::vector<ChangeGroup>& getChangeGroups() const { return _groups; }
    const std::optional<TemperatureExtremes>& getTemperatures() const { return _temperatures; }

    /// the text after RMK, not decoded
    const std::string& getRemarks() const { return _tokens.getRemarksText(); }

    /// the Russian plain text rendering, see describeTaf()
    std::string getDescription() const;

private:
    size_t scanHeader(const string_list& tokens);
    void scanChangeGroups(const string_list& tokens, size_t pos);
    void scanTemperatures();

    ReportTokens _tokens;
    std::string _error;

    std::string _icao;
    ForecastTime _issue_time;
    ValidityPeriod _validity;
    bool _amendment;
    bool _correction;

    ForecastBody _base;
    std::vector<ChangeGroup> _groups;
    std::optional<TemperatureExtremes> _temperatures;
};

/// DDHH/DDHH
std::optional<ValidityPeriod> parseValidityPeriod(const std::string& token);

/// BECMG, TEMPO, PROB30, PROB40 or FMddhhmm
bool isChangeMarker(const std::string& token);

} // namespace aerowx

#endif // _AW_TAF_HXX
