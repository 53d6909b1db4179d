// SPDX-License-Identifier: LGPL-2.1-or-later

#include <aerowx_config.h>

#include <aerowx/misc/test_macros.hxx>

#include <iostream>
#include <string>

#include "weather_codes.hxx"

using namespace aerowx;

static std::string phrase(const std::string& code)
{
    auto w = parseWeather(code);
    if (!w)
        AW_TEST_FAIL("not a weather group: " << code);
    return describeWeather(*w);
}

void test_compounds()
{
    AW_CHECK_EQUAL(phrase("RASN"), "дождь со снегом");
    AW_CHECK_EQUAL(phrase("SHRA"), "ливневой дождь");
    AW_CHECK_EQUAL(phrase("-SHSNRA"), "слабый ливневой снег с дождём");
    AW_CHECK_EQUAL(phrase("+SHGS"), "сильный ливневая ледяная крупа");
}

void test_decomposition()
{
    AW_CHECK_EQUAL(phrase("RABR"), "дождь с дымкой");
    AW_CHECK_EQUAL(phrase("SNFG"), "снег с туманом");
    AW_CHECK_EQUAL(phrase("DZSG"), "морось со снежными зёрнами");
    // the shower descriptor stays when no compound covers it
    AW_CHECK_EQUAL(phrase("SHRABR"), "ливневой дождь с дымкой");
}

void test_descriptors()
{
    AW_CHECK_EQUAL(phrase("+TSRA"), "сильная гроза с дождём");
    AW_CHECK_EQUAL(phrase("-TSSN"), "слабая гроза со снегом");
    AW_CHECK_EQUAL(phrase("TSRASN"), "гроза с дождём со снегом");
    AW_CHECK_EQUAL(phrase("TSSHRA"), "гроза с ливневым дождём");
    AW_CHECK_EQUAL(phrase("+TSSHGS"), "сильная гроза с ливневой ледяной крупой");
    AW_CHECK_EQUAL(phrase("-TSSHSNRA"), "слабая гроза с ливневым снегом с дождём");
    AW_CHECK_EQUAL(phrase("TS"), "гроза");
    AW_CHECK_EQUAL(phrase("VCTS"), "в окрестностях гроза");
    AW_CHECK_EQUAL(phrase("SH"), "ливень");
    AW_CHECK_EQUAL(phrase("VCSH"), "в окрестностях ливни");
    AW_CHECK_EQUAL(phrase("-FZDZ"), "слабый переохлаждённый морось");
    AW_CHECK_EQUAL(phrase("BCFG"), "область туман");
    AW_CHECK_EQUAL(phrase("FG"), "туман");
    AW_CHECK_EQUAL(phrase("+FC"), "сильный смерч/воронка");
}

void test_instrumental_case()
{
    AW_CHECK_EQUAL(instrumentalCase("дождь"), "дождём");
    AW_CHECK_EQUAL(instrumentalCase("ледяной дождь"), "ледяным дождём");
    AW_CHECK_EQUAL(instrumentalCase("дождь со снегом"), "дождём со снегом");
    AW_CHECK_EQUAL(instrumentalCase("ливневой дождь"), "ливневым дождём");
    AW_CHECK_EQUAL(instrumentalCase("ливневой ледяной дождь"), "ливневым ледяным дождём");
    AW_CHECK_EQUAL(instrumentalCase("мелкий град/ледяная крупа"), "мелкий град/ледяная крупа");
    AW_CHECK_EQUAL(instrumentalCase("смерч/воронка"), "смерч/воронка");
    AW_CHECK_EQUAL(instrumentalCase(""), "");
}

void test_tables()
{
    AW_CHECK_EQUAL(translateCode(cloud_coverage, "BKN"), "разорванные облака (6-9 баллов)");
    AW_CHECK_EQUAL(translateCode(cloud_coverage, "XYZ"), "XYZ");
    AW_CHECK_EQUAL(translateCode(runway_extents, "NR"), "не сообщается");
    AW_CHECK_EQUAL(translateCode(wind_units, "MPS"), "м/с");
    AW_VERIFY(findToken(weather_phenomena, "GS"));
    AW_CHECK_FALSE(findToken(weather_phenomena, "SH"));
    AW_CHECK_FALSE(findToken(weather_descriptors, "RA"));
}

int main(int argc, char* argv[])
{
    test_compounds();
    test_decomposition();
    test_descriptors();
    test_instrumental_case();
    test_tables();

    std::cout << "all tests passed" << std::endl;
    return 0;
}
