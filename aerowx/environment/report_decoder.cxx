// SPDX-License-Identifier: LGPL-2.1-or-later

#include <aerowx_config.h>

#include "report_decoder.hxx"

#include <aerowx/debug/logstream.hxx>

#include "metar.hxx"
#include "report_printer.hxx"
#include "report_tokens.hxx"
#include "taf.hxx"
#include "token_scanner.hxx"

namespace aerowx {

namespace {

// DDHHMMZ
bool isIssueTime(const std::string& token)
{
    TokenScanner s(token);
    int num;
    return s.scanNumber(&num, 6) && s.scanChar('Z') && s.atEnd();
}

} // of anonymous namespace

ReportKind detectReportKind(const std::string& report)
{
    string_list tokens = splitTokens(report);
    if (tokens.empty())
        return REPORT_METAR;

    if (tokens[0] == "TAF")
        return REPORT_TAF;
    if (tokens[0] == "METAR" || tokens[0] == "SPECI")
        return REPORT_METAR;

    // [AMD|COR] CCCC DDHHMMZ DDHH/DDHH
    for (size_t i = 1; i < tokens.size() && i < 4; i++) {
        if (isIssueTime(tokens[i - 1]) && parseValidityPeriod(tokens[i]))
            return REPORT_TAF;
    }
    return REPORT_METAR;
}

const char* reportKindName(ReportKind kind)
{
    return kind == REPORT_TAF ? "TAF" : "METAR";
}

std::string describeReport(const std::string& report, ReportKind kind)
{
    AW_LOG(AW_GENERAL, AW_DEBUG, "decoding " << reportKindName(kind) << ": " << report);
    if (kind == REPORT_TAF)
        return describeTaf(Taf(report));
    return describeMetar(Metar(report));
}

std::string describeReport(const std::string& report)
{
    return describeReport(report, detectReportKind(report));
}

} // namespace aerowx
