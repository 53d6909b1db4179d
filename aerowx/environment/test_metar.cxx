// SPDX-License-Identifier: LGPL-2.1-or-later

#include <aerowx_config.h>

#include <aerowx/misc/test_macros.hxx>

#include <iostream>
#include <cstdlib>

#include <aerowx/structure/exception.hxx>

#include "metar.hxx"

using namespace aerowx;

const double TEST_EPSILON = 1e-9;

void test_basic()
{
    Metar m1("2011/10/20 11:25 EHAM 201125Z 27012KT 240V300 9999 VCSH FEW025CB SCT048 10/05 Q1025 TEMPO VRB03KT");
    AW_VERIFY(m1.getPreamble());
    AW_CHECK_EQUAL(m1.getPreamble()->year, 2011);
    AW_CHECK_EQUAL(m1.getPreamble()->month, 10);
    AW_CHECK_EQUAL(m1.getPreamble()->day, 20);
    AW_CHECK_EQUAL(m1.getPreamble()->hour, 11);
    AW_CHECK_EQUAL(m1.getPreamble()->minute, 25);
    AW_CHECK_EQUAL(m1.getReportType(), "");

    AW_CHECK_EQUAL(m1.getId(), "EHAM");
    AW_CHECK_EQUAL(m1.getDay(), 20);
    AW_CHECK_EQUAL(m1.getHour(), 11);
    AW_CHECK_EQUAL(m1.getMinute(), 25);

    AW_VERIFY(m1.getWind());
    AW_CHECK_EQUAL(m1.getWind()->direction, 270);
    AW_CHECK_EQUAL(m1.getWind()->speed, 12);
    AW_CHECK_EQUAL(m1.getWind()->unit, "KT");
    AW_CHECK_FALSE(m1.getWind()->gust);

    AW_VERIFY(m1.getWindVariability());
    AW_CHECK_EQUAL(m1.getWindVariability()->from, 240);
    AW_CHECK_EQUAL(m1.getWindVariability()->to, 300);

    AW_VERIFY(m1.getVisibility());
    AW_CHECK_EQUAL(*m1.getVisibility()->meters, 10000);
    AW_CHECK_FALSE(m1.getVisibility()->cavok);

    AW_CHECK_EQUAL(m1.getWeather().size(), 1);
    AW_CHECK_EQUAL(m1.getWeather()[0].descriptor(), "VCSH");
    AW_CHECK_EQUAL(m1.getClouds().size(), 2);
    AW_CHECK_EQUAL(m1.getClouds()[0].coverage, "FEW");
    AW_CHECK_EQUAL(*m1.getClouds()[0].height_m, 750);
    AW_CHECK_EQUAL(m1.getClouds()[0].qualifier, "CB");
    AW_CHECK_EQUAL(*m1.getClouds()[1].height_m, 1440);

    AW_CHECK_EQUAL(*m1.getTemperature_C(), 10);
    AW_CHECK_EQUAL(*m1.getDewpoint_C(), 5);
    AW_CHECK_EQUAL_EP2(*m1.getRelHumidity(), 71.1, TEST_EPSILON);

    AW_VERIFY(m1.getAltimeter());
    AW_CHECK_EQUAL(m1.getAltimeter()->group, 'Q');
    AW_CHECK_EQUAL_EP2(m1.getAltimeter()->pressure_hPa, 1025, TEST_EPSILON);
    AW_CHECK_EQUAL_EP2(m1.getAltimeter()->pressure_inHg, 768.75, TEST_EPSILON);

    AW_CHECK_EQUAL(m1.getTrends().size(), 1);
    AW_CHECK_EQUAL(m1.getTrends()[0].type, "TEMPO");
    AW_CHECK_EQUAL(m1.getTrendWinds().size(), 1);
    AW_VERIFY(m1.getTrendWinds()[0].isVariable());
    AW_CHECK_EQUAL(m1.getTrendWinds()[0].speed, 3);
    AW_CHECK_EQUAL(m1.getScanState(), Metar::TREND);
    AW_VERIFY(m1.getUnparsed().empty());

    // negative temperature and negative dew point
    Metar m2("XXXX 012345Z 15005KT 9999 -SN OVC060CB SCT050TCU M20/M30 Q1005");
    AW_CHECK_EQUAL(*m2.getTemperature_C(), -20);
    AW_CHECK_EQUAL(*m2.getDewpoint_C(), -30);
    AW_CHECK_EQUAL(m2.getClouds()[1].qualifier, "TCU");
}

void test_usrr()
{
    Metar m1("METAR USRR 211730Z 23004MPS CAVOK M02/M04 Q1027 R25/12//60 RMK QFE765=");
    AW_CHECK_EQUAL(m1.getReportType(), "METAR");
    AW_CHECK_EQUAL(m1.getId(), "USRR");
    AW_CHECK_EQUAL(m1.getWind()->direction, 230);
    AW_CHECK_EQUAL(m1.getWind()->speed, 4);
    AW_CHECK_EQUAL(m1.getWind()->unit, "MPS");

    AW_VERIFY(m1.getVisibility()->cavok);
    AW_CHECK_EQUAL(*m1.getVisibility()->meters, 10000);

    AW_CHECK_EQUAL(*m1.getTemperature_C(), -2);
    AW_CHECK_EQUAL(*m1.getDewpoint_C(), -4);
    AW_CHECK_EQUAL_EP2(*m1.getRelHumidity(), 86.2, TEST_EPSILON);
    AW_CHECK_EQUAL_EP2(m1.getAltimeter()->pressure_inHg, 770.25, TEST_EPSILON);

    // a runway state group, never a runway visual range
    AW_CHECK_EQUAL(m1.getRunwayConditions().size(), 1);
    AW_VERIFY(m1.getRunwayVisualRanges().empty());
    const RunwayCondition& rc = m1.getRunwayConditions()[0];
    AW_CHECK_EQUAL(rc.runway, "25");
    AW_CHECK_EQUAL(rc.deposit, "1");
    AW_CHECK_EQUAL(rc.extent, "2");
    AW_CHECK_EQUAL(rc.depth, "//");
    AW_CHECK_EQUAL(rc.friction, "60");

    AW_CHECK_EQUAL(m1.getRemarks(), "QFE765");
    AW_CHECK_EQUAL(*m1.getRemarkDetails().qfe_mmHg, 765);
    AW_CHECK_EQUAL_EP2(*m1.getRemarkDetails().qfe_hPa, 1019.9, TEST_EPSILON);
    AW_VERIFY(m1.getUnparsed().empty());
}

void test_nil()
{
    Metar m1("METAR UUWW 161630Z NIL");
    AW_VERIFY(m1.isNil());
    AW_CHECK_EQUAL(m1.getScanState(), Metar::NIL);
    AW_CHECK_EQUAL(m1.getId(), "UUWW");
    AW_CHECK_EQUAL(m1.getDay(), 16);

    // nothing after NIL is decoded
    Metar m2("UUWW 161630Z NIL 22005MPS 9999 05/04 Q1014");
    AW_VERIFY(m2.isNil());
    AW_CHECK_FALSE(m2.getWind());
    AW_CHECK_FALSE(m2.getVisibility());
    AW_CHECK_FALSE(m2.getTemperature_C());
    AW_CHECK_FALSE(m2.getAltimeter());
    AW_VERIFY(m2.getUnparsed().empty());
}

void test_runway_state()
{
    Metar m1("UUWW 161630Z 22005MPS 9999 BKN007 OVC023 05/04 Q1014 R24/290047 NOSIG");
    AW_CHECK_EQUAL(m1.getRunwayConditions().size(), 1);
    const RunwayCondition& rc = m1.getRunwayConditions()[0];
    AW_CHECK_EQUAL(rc.runway, "24");
    AW_CHECK_EQUAL(rc.deposit, "2");
    AW_CHECK_EQUAL(rc.extent, "9");
    AW_CHECK_EQUAL(rc.depth, "00");
    AW_CHECK_EQUAL(rc.friction, "47");
    AW_CHECK_EQUAL(m1.getTrends().size(), 1);
    AW_CHECK_EQUAL(m1.getTrends()[0].type, "NOSIG");

    Metar m2("ULLI 101200Z 09003MPS 9999 SCT020 M05/M08 Q1020 R28L/5NR//95");
    AW_CHECK_EQUAL(m2.getRunwayConditions().size(), 1);
    AW_CHECK_EQUAL(m2.getRunwayConditions()[0].runway, "28L");
    AW_CHECK_EQUAL(m2.getRunwayConditions()[0].extent, "NR");
    AW_CHECK_EQUAL(m2.getRunwayConditions()[0].friction, "95");
}

void test_runway_visual_range()
{
    Metar m1("EDDF 201150Z 27010KT 0800 R25L/P1500 R25C/0600V1200U R07/45024 R18/123//60 FG VV002 05/05 Q1010");
    AW_CHECK_EQUAL(*m1.getVisibility()->meters, 800);
    AW_CHECK_EQUAL(m1.getRunwayVisualRanges().size(), 4);
    AW_VERIFY(m1.getRunwayConditions().empty());

    const auto& rvr = m1.getRunwayVisualRanges();
    AW_CHECK_EQUAL(rvr[0].runway, "25L");
    AW_CHECK_EQUAL(rvr[0].value, "P1500");
    AW_CHECK_EQUAL(rvr[0].format, RunwayVisualRange::STANDARD);

    AW_CHECK_EQUAL(rvr[1].runway, "25C");
    AW_CHECK_EQUAL(rvr[1].value, "0600");
    AW_CHECK_EQUAL(rvr[1].maximum, "1200");
    AW_CHECK_EQUAL(rvr[1].tendency, 'U');

    AW_CHECK_EQUAL(rvr[2].value, "45024");
    AW_CHECK_EQUAL(rvr[2].format, RunwayVisualRange::LONG);

    AW_CHECK_EQUAL(rvr[3].value, "123//60");
    AW_CHECK_EQUAL(rvr[3].format, RunwayVisualRange::SLASHED);

    AW_CHECK_EQUAL(m1.getWeather().size(), 1);
    AW_CHECK_EQUAL(m1.getClouds().size(), 1);
    AW_CHECK_EQUAL(m1.getClouds()[0].coverage, "VV");
    AW_CHECK_EQUAL(*m1.getClouds()[0].height_m, 60);
}

void test_trend()
{
    Metar m1("EGLL 201150Z 24015KT 9999 -RA BKN010 12/10 Q1005 BECMG 4000 +SHRA BKN005CB FM1230 30020G35KT NSW");
    AW_CHECK_EQUAL(m1.getWeather().size(), 1);
    AW_CHECK_EQUAL(m1.getClouds().size(), 1);

    AW_CHECK_EQUAL(m1.getTrends().size(), 2);
    AW_CHECK_EQUAL(m1.getTrends()[0].type, "BECMG");
    AW_CHECK_EQUAL(m1.getTrends()[1].type, "FM");
    AW_CHECK_EQUAL(m1.getTrends()[1].hour, 12);
    AW_CHECK_EQUAL(m1.getTrends()[1].minute, 30);

    AW_CHECK_EQUAL(m1.getTrendVisibilities().size(), 1);
    AW_CHECK_EQUAL(*m1.getTrendVisibilities()[0].meters, 4000);
    AW_CHECK_EQUAL(m1.getTrendWeather().size(), 1);
    AW_CHECK_EQUAL(m1.getTrendWeather()[0].intensity, '+');
    AW_CHECK_EQUAL(m1.getTrendClouds().size(), 1);
    AW_CHECK_EQUAL(m1.getTrendClouds()[0].qualifier, "CB");
    AW_CHECK_EQUAL(m1.getTrendWinds().size(), 1);
    AW_CHECK_EQUAL(*m1.getTrendWinds()[0].gust, 35);
    AW_VERIFY(m1.getTrendNoSignificantWeather());
    AW_VERIFY(m1.getUnparsed().empty());

    // the trend state is never left again
    Metar m2("EGLL 201150Z 24015KT 9999 TEMPO -RA BKN010");
    AW_VERIFY(m2.getWeather().empty());
    AW_VERIFY(m2.getClouds().empty());
    AW_CHECK_EQUAL(m2.getTrendWeather().size(), 1);
    AW_CHECK_EQUAL(m2.getTrendClouds().size(), 1);
}

void test_unparsed()
{
    // a second visibility outside of a trend is not placed
    Metar m1("UUEE 201130Z 18005MPS 9999 4000 // BKN020 M01/M03 Q1015");
    AW_CHECK_EQUAL(*m1.getVisibility()->meters, 10000);
    AW_CHECK_EQUAL(m1.getUnparsed().size(), 2);
    AW_CHECK_EQUAL(m1.getUnparsed()[0], "4000");
    AW_CHECK_EQUAL(m1.getUnparsed()[1], "//");
    AW_CHECK_EQUAL(m1.getUnparsedData(), "4000 //");
    AW_CHECK_EQUAL(m1.getClouds().size(), 1);

    Metar m2("HELLO WORLD 123");
    AW_CHECK_EQUAL(m2.getId(), "");
    AW_CHECK_FALSE(m2.getTime());
    AW_CHECK_EQUAL(m2.getUnparsed().size(), 3);

    Metar m3("");
    AW_CHECK_EQUAL(m3.getScanState(), Metar::MAIN_BODY);
    AW_VERIFY(m3.getUnparsed().empty());
    AW_CHECK_EQUAL(m3.getDay(), -1);
}

void test_sensor_failure()
{
    Metar m1("2011/10/20 11:25 EHAM 201125Z 27012KT 240V300 9999 // FEW025CB SCT048 10/05 Q1025");
    AW_CHECK_EQUAL(m1.getWind()->direction, 270);
    AW_CHECK_EQUAL(m1.getWeather().size(), 0);
    AW_CHECK_EQUAL(m1.getClouds().size(), 2);
    AW_CHECK_EQUAL(m1.getUnparsed().size(), 1);

    Metar m2("2011/10/20 11:25 EHAM 201125Z 27012KT 240V300 9999 FEW025CB/// SCT048/// 10/05 Q1025");
    AW_CHECK_EQUAL(m2.getClouds().size(), 2);
    AW_VERIFY(m2.getClouds()[0].typeUnknown);
    AW_CHECK_EQUAL(m2.getClouds()[0].qualifier, "CB");
    AW_CHECK_EQUAL(*m2.getClouds()[1].height_m, 1440);
    AW_VERIFY(m2.getUnparsed().empty());

    Metar m3("EGPF 111420Z AUTO 24013KT 9000 -RA SCT019/// BKN023/// NCD 13/11 Q1011");
    AW_VERIFY(m3.isAutomated());
    AW_CHECK_EQUAL(m3.getClouds().size(), 3);
    AW_CHECK_EQUAL(m3.getClouds()[2].coverage, "NCD");
}

void test_pressure_and_remarks()
{
    Metar m1("KJFK 201151Z 31008KT 10SM FEW250 20/03 A2992 RMK AO2 SLP128 T02000033");
    AW_CHECK_EQUAL_EP2(*m1.getVisibility()->miles, 10.0, TEST_EPSILON);
    AW_CHECK_EQUAL(*m1.getVisibility()->meters, 16093);
    AW_CHECK_EQUAL(m1.getAltimeter()->group, 'A');
    AW_CHECK_EQUAL_EP2(m1.getAltimeter()->pressure_inHg, 29.92, TEST_EPSILON);
    AW_CHECK_EQUAL_EP2(m1.getAltimeter()->pressure_hPa, 1013.2, TEST_EPSILON);

    const MetarRemarks& r1 = m1.getRemarkDetails();
    AW_CHECK_EQUAL(r1.stationType, "AO2");
    AW_CHECK_EQUAL_EP2(*r1.seaLevelPressure_hPa, 1012.8, TEST_EPSILON);
    AW_CHECK_EQUAL(r1.extraTemperatures_C.size(), 2);
    AW_CHECK_EQUAL_EP2(r1.extraTemperatures_C[0], 20.0, TEST_EPSILON);
    AW_CHECK_EQUAL_EP2(r1.extraTemperatures_C[1], 3.3, TEST_EPSILON);

    Metar m2("KBOS 201154Z 05010G14 1/2SM FG VV002 M01/M01 A3001 RMK AO1 SLP612 T01001050 QFE745/0993");
    AW_CHECK_EQUAL(m2.getWind()->unit, "KT");
    AW_CHECK_EQUAL(*m2.getWind()->gust, 14);
    AW_CHECK_EQUAL_EP2(*m2.getVisibility()->miles, 0.5, TEST_EPSILON);
    AW_CHECK_EQUAL(*m2.getVisibility()->meters, 805);

    const MetarRemarks& r2 = m2.getRemarkDetails();
    AW_CHECK_EQUAL(r2.stationType, "AO1");
    AW_CHECK_EQUAL_EP2(*r2.seaLevelPressure_hPa, 961.2, TEST_EPSILON);
    AW_CHECK_EQUAL_EP2(r2.extraTemperatures_C[0], 10.0, TEST_EPSILON);
    AW_CHECK_EQUAL_EP2(r2.extraTemperatures_C[1], -5.0, TEST_EPSILON);
    AW_CHECK_EQUAL(*r2.qfe_mmHg, 745);
    AW_CHECK_EQUAL_EP2(*r2.qfe_hPa, 993.0, TEST_EPSILON);

    // no remarks, no details
    Metar m3("UUWW 161630Z 22005MPS 9999 BKN007 05/04 Q1014");
    AW_VERIFY(m3.getRemarkDetails().empty());
    AW_CHECK_EQUAL(m3.getRemarks(), "");
}

void test_modifiers()
{
    Metar m1("SPECI KXYZ 201151Z COR AUTO 00000KT 1/4SM FG VV001 M01/M01 A3001");
    AW_CHECK_EQUAL(m1.getReportType(), "SPECI");
    AW_VERIFY(m1.isCorrected());
    AW_VERIFY(m1.isAutomated());
    AW_CHECK_EQUAL(m1.getWind()->direction, 0);
    AW_CHECK_EQUAL(*m1.getVisibility()->meters, 402);

    Metar m2("CYTR 110000Z CCA 25013KT 15SM BKN220 17/02 A3006");
    AW_VERIFY(m2.isCorrected());
    AW_CHECK_FALSE(m2.isAutomated());
    AW_CHECK_EQUAL(*m2.getVisibility()->meters, 24140);
}

void test_multiline()
{
    Metar m1("METAR UUDD 201200Z 18004MPS 9999\n   OVC015 03/01 Q1011 =");
    AW_CHECK_EQUAL(m1.getData(), "METAR UUDD 201200Z 18004MPS 9999 OVC015 03/01 Q1011");
    AW_CHECK_EQUAL(m1.getClouds().size(), 1);
    AW_VERIFY(m1.getAltimeter());
    AW_VERIFY(m1.getUnparsed().empty());
}

int main(int argc, char* argv[])
{
    try {
        test_basic();
        test_usrr();
        test_nil();
        test_runway_state();
        test_runway_visual_range();
        test_trend();
        test_unparsed();
        test_sensor_failure();
        test_pressure_and_remarks();
        test_modifiers();
        test_multiline();
    } catch (aw_exception& e) {
        std::cerr << "Exception: " << e.getMessage() << std::endl;
        return -1;
    }

    return 0;
}
