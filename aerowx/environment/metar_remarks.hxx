// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Decoding of the groups following RMK in a METAR.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <aerowx/environment/report_tokens.hxx>

namespace aerowx {

struct MetarRemarks {
    std::string stationType;                    ///< AO1, AO2 or empty
    std::optional<double> seaLevelPressure_hPa;
    std::vector<double> extraTemperatures_C;    ///< from the Tsnnnsnnn group
    std::optional<int> qfe_mmHg;
    std::optional<double> qfe_hPa;

    bool empty() const;
};

/**
 * Resolve the remark groups AOn, SLPnnn, Tsnnnsnnn and QFEnnn[/nnnn]. A
 * group that occurs twice overrides the earlier value; everything else is
 * left to the raw remarks text.
 */
MetarRemarks scanRemarks(const string_list& tokens);

} // namespace aerowx
