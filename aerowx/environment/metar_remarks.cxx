// SPDX-License-Identifier: LGPL-2.1-or-later

#include <aerowx_config.h>

#include "metar_remarks.hxx"

#include <aerowx/debug/logstream.hxx>

#include "met_formulas.hxx"
#include "token_scanner.hxx"

namespace aerowx {

namespace {

bool scanStationType(const std::string& token, MetarRemarks& r)
{
    if (token != "AO1" && token != "AO2")
        return false;
    r.stationType = token;
    return true;
}

// SLPnnn
bool scanSeaLevelPressure(const std::string& token, MetarRemarks& r)
{
    TokenScanner s(token);
    int v;
    if (!s.scanLiteral("SLP") || !s.scanNumber(&v, 3) || !s.atEnd())
        return false;
    r.seaLevelPressure_hPa = seaLevelPressureFromRemark(v);
    return true;
}

// snnn: sign nibble, then whole degrees and tenths
bool scanTenths(TokenScanner& s, double* t)
{
    int sign, whole, tenths;
    if (!s.scanNumber(&sign, 1) || !s.scanNumber(&whole, 2) || !s.scanNumber(&tenths, 1))
        return false;
    *t = whole + tenths / 10.0;
    if (sign == 1)
        *t = -*t;
    return true;
}

// Tsnnn[snnn]
bool scanTemperatures(const std::string& token, MetarRemarks& r)
{
    TokenScanner s(token);
    double t;
    if (!s.scanChar('T') || !scanTenths(s, &t))
        return false;

    std::vector<double> temps{t};
    if (scanTenths(s, &t))
        temps.push_back(t);
    if (!s.atEnd())
        return false;

    r.extraTemperatures_C = temps;
    return true;
}

// QFEnnn[/nnnn]
bool scanQfe(const std::string& token, MetarRemarks& r)
{
    TokenScanner s(token);
    int mmHg, hPa;
    if (!s.scanLiteral("QFE") || !s.scanNumber(&mmHg, 3))
        return false;

    bool hasHPa = false;
    if (s.scanChar('/')) {
        if (!s.scanNumber(&hPa, 4))
            return false;
        hasHPa = true;
    }
    if (!s.atEnd())
        return false;

    r.qfe_mmHg = mmHg;
    r.qfe_hPa = hasHPa ? hPa : mmHgToHPa(mmHg);
    return true;
}

} // of anonymous namespace

bool MetarRemarks::empty() const
{
    return stationType.empty() && !seaLevelPressure_hPa
        && extraTemperatures_C.empty() && !qfe_mmHg;
}

MetarRemarks scanRemarks(const string_list& tokens)
{
    typedef bool (*RemarkScanner)(const std::string&, MetarRemarks&);
    static const RemarkScanner scanners[] = {
        scanStationType,
        scanSeaLevelPressure,
        scanTemperatures,
        scanQfe,
    };

    MetarRemarks r;
    for (const auto& token : tokens) {
        bool found = false;
        for (auto scan : scanners) {
            if ((found = scan(token, r)))
                break;
        }
        if (!found)
            AW_LOG(AW_REMARKS, AW_BULK, "remark kept as text: " << token);
    }
    return r;
}

} // namespace aerowx
