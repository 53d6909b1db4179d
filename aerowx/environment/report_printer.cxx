// SPDX-License-Identifier: LGPL-2.1-or-later

#include <aerowx_config.h>

#include "report_printer.hxx"

#include <iomanip>
#include <sstream>

#include <boost/algorithm/string/join.hpp>

#include <aerowx/debug/logstream.hxx>

#include "metar.hxx"
#include "taf.hxx"
#include "weather_codes.hxx"

namespace aerowx {

namespace {

/* A manipulator for two digit, zero padded day and time fields. */
struct TwoDigits
{
    explicit TwoDigits(int v) : _v(v) {}
    int _v;
};

std::ostream& operator << (std::ostream& out, const TwoDigits& d)
{
    return out << std::setw(2) << std::setfill('0') << d._v << std::setfill(' ');
}

std::string formatTenths(double v)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << v;
    return out.str();
}

void describeWeatherList(std::ostream& out, const std::vector<WeatherPhenomenon>& weather,
                         const char* indent = "")
{
    if (weather.empty())
        return;
    out << indent << "Явления:\n";
    for (const auto& w : weather)
        out << indent << "  - " << describeWeather(w) << "\n";
}

void describeClouds(std::ostream& out, const std::vector<CloudLayer>& clouds,
                    const char* indent = "")
{
    if (clouds.empty())
        return;
    out << indent << "Облачность:\n";
    for (const auto& c : clouds)
        out << indent << "  - " << describeCloudLayer(c) << "\n";
}

void describeRunwayVisualRange(std::ostream& out, const RunwayVisualRange& r)
{
    out << "Дальность видимости на ВПП " << r.runway << ": ";
    switch (r.format) {
    case RunwayVisualRange::SLASHED: {
        std::string::size_type slash = r.value.find("//");
        out << r.value.substr(0, slash) << " м (данные: " << r.value.substr(slash + 2) << ")";
        break;
    }
    case RunwayVisualRange::LONG:
        out << r.value << " (составное значение)";
        break;
    case RunwayVisualRange::STANDARD: {
        std::string v = r.value;
        if (v[0] == 'P')
            v[0] = '>';
        else if (v[0] == 'M')
            v[0] = '<';
        out << v << " м";
        break;
    }
    }

    if (!r.maximum.empty())
        out << " до " << r.maximum << " м";
    if (r.tendency)
        out << " (" << translateCode(rvr_tendencies, std::string(1, r.tendency)) << ")";
    out << "\n";
}

void describeRunwayCondition(std::ostream& out, const RunwayCondition& rc)
{
    out << "Состояние ВПП " << rc.runway << ": " << translateCode(runway_deposits, rc.deposit);
    if (rc.extent != "/" && rc.extent != "NR")
        out << ", покрытие " << translateCode(runway_extents, rc.extent);
    if (rc.depth != "//" && rc.depth != "00")
        out << ", глубина " << rc.depth << " мм";
    if (rc.friction != "//") {
        out << ", коэффициент сцепления 0." << rc.friction;
        if (std::stoi(rc.friction) >= 95)
            out << "+";
    }
    out << "\n";
}

void describeTrendGroup(std::ostream& out, const TrendGroup& t)
{
    if (t.hour >= 0) {
        out << translateCode(trend_markers, t.type) << " " << TwoDigits(t.hour) << ":"
            << TwoDigits(t.minute) << " UTC\n";
    } else {
        out << translateCode(trend_markers, t.type) << "\n";
    }
}

void describeForecastBody(std::ostream& out, const ForecastBody& f, const char* indent)
{
    bool empty = true;
    if (f.wind) {
        out << indent << describeWind(*f.wind) << "\n";
        empty = false;
    }
    if (f.visibility) {
        out << indent << describeVisibility(*f.visibility) << "\n";
        empty = false;
    }
    if (!f.weather.empty() || !f.clouds.empty())
        empty = false;
    describeWeatherList(out, f.weather, indent);
    describeClouds(out, f.clouds, indent);
    if (f.noSignificantWeather) {
        out << indent << "Без существенных явлений погоды\n";
        empty = false;
    }
    if (!f.unparsed.empty()) {
        out << indent << "Нераспознанные группы: " << boost::algorithm::join(f.unparsed, " ") << "\n";
        empty = false;
    }
    if (empty)
        out << indent << "(нет изменений)\n";
}

void describePeriod(std::ostream& out, const ValidityPeriod& p)
{
    out << "с " << TwoDigits(p.from.day) << " " << TwoDigits(p.from.hour) << ":00 до "
        << TwoDigits(p.to.day) << " " << TwoDigits(p.to.hour) << ":00 UTC";
}

} // of anonymous namespace

std::string describeWind(const Wind& w)
{
    std::ostringstream out;
    out << "Ветер: ";
    if (w.isVariable())
        out << "переменный";
    else
        out << w.direction << "°";
    out << " " << w.speed << " " << translateCode(wind_units, w.unit);
    if (w.gust)
        out << ", порывы " << *w.gust;
    return out.str();
}

std::string describeVisibility(const Visibility& v)
{
    std::ostringstream out;
    if (v.cavok)
        out << "CAVOK: (Погода хорошая)";
    else if (v.miles)
        out << "Видимость: " << *v.miles << " миль (~" << *v.meters << " м)";
    else if (v.meters)
        out << "Видимость: " << *v.meters << " м";
    return out.str();
}

std::string describeCloudLayer(const CloudLayer& c)
{
    std::vector<std::string> parts{translateCode(cloud_coverage, c.coverage)};
    if (c.height_m)
        parts.push_back("на " + std::to_string(*c.height_m) + " метров");
    if (!c.qualifier.empty())
        parts.push_back(translateCode(cloud_qualifiers, c.qualifier));
    if (c.typeUnknown)
        parts.push_back("(тип облаков не определён)");
    return boost::algorithm::join(parts, " ");
}

std::string describeMetar(const Metar& m)
{
    std::ostringstream out;

    out << "Исходный METAR: " << m.getData() << "\n";
    if (m.getReportType() == "SPECI")
        out << "Специальная сводка (SPECI)\n";
    if (const auto& p = m.getPreamble()) {
        out << "Дата наблюдения: ";
        if (p->year >= 0)
            out << p->year << "/" << TwoDigits(p->month) << "/" << TwoDigits(p->day) << " ";
        if (p->hour >= 0)
            out << TwoDigits(p->hour) << ":" << TwoDigits(p->minute);
        out << "\n";
    }
    if (!m.getId().empty())
        out << "Станция: " << m.getId() << "\n";
    if (const auto& t = m.getTime())
        out << "Время: " << TwoDigits(t->day) << " число, " << TwoDigits(t->hour) << ":"
            << TwoDigits(t->minute) << " UTC\n";

    if (m.isNil()) {
        out << "Отчёт NIL (данные отсутствуют)\n";
        return out.str();
    }

    if (m.isAutomated())
        out << "Автоматическое наблюдение\n";
    if (m.isCorrected())
        out << "Исправленная сводка (COR)\n";

    if (m.getWind())
        out << describeWind(*m.getWind()) << "\n";
    if (const auto& v = m.getWindVariability())
        out << "Ветер переменный " << v->from << "°-" << v->to << "°\n";
    if (m.getVisibility())
        out << describeVisibility(*m.getVisibility()) << "\n";

    for (const auto& r : m.getRunwayVisualRanges())
        describeRunwayVisualRange(out, r);
    for (const auto& rc : m.getRunwayConditions())
        describeRunwayCondition(out, rc);

    describeWeatherList(out, m.getWeather());
    describeClouds(out, m.getClouds());

    if (m.getTemperature_C()) {
        out << "Температура " << *m.getTemperature_C() << "°C\n";
        out << "Точка росы " << *m.getDewpoint_C() << "°C\n";
        out << "Относительная влажность " << *m.getRelHumidity() << "%\n";
    }

    if (const auto& a = m.getAltimeter()) {
        out << "Давление: " << a->pressure_hPa << " гПа (" << a->pressure_inHg
            << (a->group == 'Q' ? " мм рт. ст.)\n" : " дюйм рт. ст.)\n");
    }

    for (const auto& t : m.getTrends())
        describeTrendGroup(out, t);
    for (const auto& w : m.getTrendWinds())
        out << describeWind(w) << "\n";
    for (const auto& v : m.getTrendVisibilities())
        out << describeVisibility(v) << "\n";
    describeWeatherList(out, m.getTrendWeather());
    describeClouds(out, m.getTrendClouds());
    if (m.getTrendNoSignificantWeather())
        out << "Без существенных явлений погоды\n";

    if (!m.getRemarks().empty()) {
        const MetarRemarks& r = m.getRemarkDetails();
        out << "Замечания: " << m.getRemarks() << "\n";
        if (!r.stationType.empty())
            out << "  - тип станции: " << r.stationType << "\n";
        if (r.seaLevelPressure_hPa)
            out << "  - давление на уровне моря: " << formatTenths(*r.seaLevelPressure_hPa) << " гПа\n";
        if (!r.extraTemperatures_C.empty()) {
            std::vector<std::string> temps;
            for (double t : r.extraTemperatures_C)
                temps.push_back(formatTenths(t));
            out << "  - дополнительные температуры: " << boost::algorithm::join(temps, ", ") << " °C\n";
        }
        if (r.qfe_mmHg)
            out << "  - QFE: " << *r.qfe_mmHg << " мм рт. ст. (" << formatTenths(*r.qfe_hPa) << " гПа)\n";
    }

    if (!m.getUnparsed().empty())
        out << "Нераспознанные группы: " << m.getUnparsedData() << "\n";

    AW_LOG(AW_PRINTER, AW_BULK, "described METAR " << m.getId());
    return out.str();
}

std::string describeTaf(const Taf& t)
{
    std::ostringstream out;

    if (t.hasError()) {
        out << "Ошибка: Неверный формат TAF (" << t.getError() << ")\n";
        out << "Исходный TAF: " << t.getData() << "\n";
        return out.str();
    }

    out << "Исходный TAF: " << t.getData() << "\n\n";
    out << "Станция: " << t.getId() << "\n";

    const ForecastTime& issue = t.getIssueTime();
    out << "Время выпуска: " << TwoDigits(issue.day) << " число, " << TwoDigits(issue.hour)
        << ":" << TwoDigits(issue.minute) << " UTC\n";

    out << "Период действия: ";
    describePeriod(out, t.getValidity());
    out << "\n";

    if (t.isAmendment())
        out << "Исправленный прогноз (AMD)\n";
    if (t.isCorrection())
        out << "Корректировка (COR)\n";

    out << "\n=== БАЗОВЫЙ ПРОГНОЗ ===\n";
    describeForecastBody(out, t.getBaseForecast(), "");

    if (const auto& temps = t.getTemperatures()) {
        out << "\nМаксимальная температура: " << temps->max_C << "°C в "
            << TwoDigits(temps->maxTime.day) << " " << TwoDigits(temps->maxTime.hour) << ":00 UTC\n";
        out << "Минимальная температура: " << temps->min_C << "°C в "
            << TwoDigits(temps->minTime.day) << " " << TwoDigits(temps->minTime.hour) << ":00 UTC\n";
    }

    if (!t.getChangeGroups().empty()) {
        out << "\n=== ИЗМЕНЕНИЯ ===\n";
        for (const auto& g : t.getChangeGroups()) {
            out << "\n" << translateCode(change_group_types, g.type) << ":\n";
            if (g.time) {
                out << "  С " << TwoDigits(g.time->day) << " " << TwoDigits(g.time->hour) << ":"
                    << TwoDigits(g.time->minute) << " UTC\n";
            } else if (g.period) {
                out << "  Период: ";
                describePeriod(out, *g.period);
                out << "\n";
            }
            describeForecastBody(out, g.forecast, "  ");
        }
    }

    if (!t.getRemarks().empty())
        out << "\nЗамечания: " << t.getRemarks() << "\n";

    AW_LOG(AW_PRINTER, AW_BULK, "described TAF " << t.getId());
    return out.str();
}

} // namespace aerowx
