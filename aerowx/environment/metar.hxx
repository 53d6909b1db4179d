// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Interface for encoded Meteorological Aerodrome Reports (METAR).
 */

#ifndef _AW_METAR_HXX
#define _AW_METAR_HXX

#include <optional>
#include <string>
#include <vector>

#include <aerowx/environment/forecast_fields.hxx>
#include <aerowx/environment/metar_remarks.hxx>
#include <aerowx/environment/report_tokens.hxx>

namespace aerowx {

/// NOAA preamble, "2011/10/20 11:25"
struct MetarPreamble {
    int year = -1;
    int month = -1;
    int day = -1;
    int hour = -1;
    int minute = -1;
};

/// day of month and time of a report, as coded (not validated)
struct ReportTime {
    int day = -1;
    int hour = -1;
    int minute = -1;
};

struct RunwayVisualRange {
    enum Format { STANDARD, LONG, SLASHED };

    std::string runway;         ///< "25", "24L"
    std::string value;          ///< "P1500", "0600", "45024", "123//60"
    std::string maximum;        ///< upper bound of a varying range, or empty
    char tendency = 0;          ///< 'U', 'D', 'N' or 0
    Format format = STANDARD;
};

/// runway state group Rnn/ERddBB; '/' , "//" and "NR" mean not reported
struct RunwayCondition {
    std::string runway;
    std::string deposit;
    std::string extent;
    std::string depth;
    std::string friction;
};

struct Altimeter {
    char group = 0;             ///< 'A' (inHg) or 'Q' (hPa)
    int value = 0;              ///< the four digits as coded
    double pressure_hPa = 0.0;
    double pressure_inHg = 0.0;
};

/// a trend marker; hour and minute are set for FM, TL and AT
struct TrendGroup {
    std::string type;           ///< TEMPO, BECMG, PROBnn, NOSIG, FM, TL, AT
    std::string code;           ///< the token as reported
    int hour = -1;
    int minute = -1;
};

/**
 * A decoded METAR. The constructor does all the work and never throws:
 * groups it cannot place are collected in getUnparsed().
 *
 * @code
 * aerowx::Metar m("METAR USRR 211730Z 23004MPS CAVOK M02/M04 Q1027");
 * double rh = *m.getRelHumidity();
 * @endcode
 */
class Metar
{
public:
    enum ScanState { HEADER, MAIN_BODY, TREND, NIL };

    explicit Metar(const std::string& report);

    /// the normalized report text
    const std::string& getData() const { return _tokens.getText(); }

    const std::string& getReportType() const { return _report_type; }
    const std::optional<MetarPreamble>& getPreamble() const { return _preamble; }
    const std::string& getId() const { return _icao; }
    const std::optional<ReportTime>& getTime() const { return _time; }

    int getDay() const { return _time ? _time->day : -1; }
    int getHour() const { return _time ? _time->hour : -1; }
    int getMinute() const { return _time ? _time->minute : -1; }

    bool isAutomated() const { return _automated; }
    bool isCorrected() const { return _corrected; }
    bool isNil() const { return _state == NIL; }

    const std::optional<Wind>& getWind() const { return _wind; }
    const std::optional<WindVariability>& getWindVariability() const { return _wind_range; }
    const std::optional<Visibility>& getVisibility() const { return _visibility; }
    const std::vector<RunwayVisualRange>& getRunwayVisualRanges() const { return _rvr; }
    const std::vector<RunwayCondition>& getRunwayConditions() const { return _runway_conditions; }
    const std::vector<WeatherPhenomenon>& getWeather() const { return _weather; }
    const std::vector<CloudLayer>& getClouds() const { return _clouds; }

    const std::optional<int>& getTemperature_C() const { return _temp; }
    const std::optional<int>& getDewpoint_C() const { return _dewp; }
    const std::optional<double>& getRelHumidity() const { return _rel_humidity; }

    const std::optional<Altimeter>& getAltimeter() const { return _altimeter; }

    const std::vector<TrendGroup>& getTrends() const { return _trends; }
    const std::vector<Wind>& getTrendWinds() const { return _trend_wind; }
    const std::vector<Visibility>& getTrendVisibilities() const { return _trend_visibility; }
    const std::vector<WeatherPhenomenon>& getTrendWeather() const { return _trend_weather; }
    const std::vector<CloudLayer>& getTrendClouds() const { return _trend_clouds; }
    bool getTrendNoSignificantWeather() const { return _trend_nsw; }

    const std::string& getRemarks() const { return _tokens.getRemarksText(); }
    const MetarRemarks& getRemarkDetails() const { return _remark_details; }

    const string_list& getUnparsed() const { return _unparsed; }
    std::string getUnparsedData() const;

    ScanState getScanState() const { return _state; }

    /// the Russian plain text rendering, see describeMetar()
    std::string getDescription() const;

private:
    typedef bool (Metar::*Scanner)(const std::string& token);

    void scanHeader(const string_list& tokens, size_t& pos);
    void scanBody(const string_list& tokens, size_t pos);

    bool scanPreambleDate(const std::string& token);
    bool scanPreambleTime(const std::string& token);
    bool scanType(const std::string& token);
    bool scanId(const std::string& token);
    bool scanDate(const std::string& token);
    bool scanModifier(const std::string& token);
    bool scanNil(const std::string& token);
    bool scanWind(const std::string& token);
    bool scanVariability(const std::string& token);
    bool scanVisibility(const std::string& token);

    bool scanRunwayCondition(const std::string& token);
    bool scanRwyVisRange(const std::string& token);
    bool scanWeather(const std::string& token);
    bool scanSkyCondition(const std::string& token);
    bool scanTemperature(const std::string& token);
    bool scanPressure(const std::string& token);
    bool scanTrendMarker(const std::string& token);
    bool scanTrendVisibility(const std::string& token);
    bool scanTrendWind(const std::string& token);
    bool scanTrendNoSigWeather(const std::string& token);

    ReportTokens _tokens;
    ScanState _state;

    std::string _report_type;
    std::optional<MetarPreamble> _preamble;
    std::string _icao;
    std::optional<ReportTime> _time;
    bool _automated;
    bool _corrected;

    std::optional<Wind> _wind;
    std::optional<WindVariability> _wind_range;
    std::optional<Visibility> _visibility;
    std::vector<RunwayVisualRange> _rvr;
    std::vector<RunwayCondition> _runway_conditions;
    std::vector<WeatherPhenomenon> _weather;
    std::vector<CloudLayer> _clouds;
    std::optional<int> _temp;
    std::optional<int> _dewp;
    std::optional<double> _rel_humidity;
    std::optional<Altimeter> _altimeter;

    std::vector<TrendGroup> _trends;
    std::vector<Wind> _trend_wind;
    std::vector<Visibility> _trend_visibility;
    std::vector<WeatherPhenomenon> _trend_weather;
    std::vector<CloudLayer> _trend_clouds;
    bool _trend_nsw;

    MetarRemarks _remark_details;
    string_list _unparsed;
};

} // namespace aerowx

#endif // _AW_METAR_HXX
