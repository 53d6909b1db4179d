// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Decoding of a report whose kind (METAR or TAF) is not known.
 */

#pragma once

#include <string>

namespace aerowx {

enum ReportKind {
    REPORT_METAR,
    REPORT_TAF
};

/**
 * A leading TAF keyword, or a validity period DDHH/DDHH right after the
 * issue time, marks a TAF. Everything else is taken for a METAR.
 */
ReportKind detectReportKind(const std::string& report);

const char* reportKindName(ReportKind kind);

/// decode @a report as @a kind and render it
std::string describeReport(const std::string& report, ReportKind kind);

/// detect the kind of @a report, decode and render it
std::string describeReport(const std::string& report);

} // namespace aerowx
