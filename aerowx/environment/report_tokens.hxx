// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Splitting of raw report text into main body and remarks tokens.
 */

#pragma once

#include <string>
#include <vector>

namespace aerowx {

typedef std::vector<std::string> string_list;

/**
 * Split @a text on any whitespace. Tokens are trimmed, never merged or
 * reordered; empty input gives an empty list.
 */
string_list splitTokens(const std::string& text);

/**
 * Collapse all whitespace runs (including line breaks of multi-line
 * reports) to a single space, trim both ends, and drop a trailing
 * end-of-message '='.
 */
std::string normalizeReport(const std::string& report);

/**
 * The token streams of one report: everything before the first " RMK "
 * is the main body, everything after it the remarks.
 */
class ReportTokens
{
public:
    explicit ReportTokens(const std::string& report);

    /// the normalized report text
    const std::string& getText() const { return _text; }

    const std::string& getRemarksText() const { return _remarks_text; }

    const string_list& getBody() const { return _body; }
    const string_list& getRemarks() const { return _remarks; }

    bool hasRemarks() const { return !_remarks_text.empty(); }

private:
    std::string _text;
    std::string _body_text;
    std::string _remarks_text;
    string_list _body;
    string_list _remarks;
};

} // namespace aerowx
