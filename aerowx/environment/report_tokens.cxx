// SPDX-License-Identifier: LGPL-2.1-or-later

#include <aerowx_config.h>

#include "report_tokens.hxx"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>

#include <aerowx/debug/logstream.hxx>

namespace aerowx {

namespace {
    const char REMARKS_DELIMITER[] = " RMK ";
}

string_list splitTokens(const std::string& text)
{
    typedef boost::tokenizer<boost::char_separator<char> > tokenizer;
    const boost::char_separator<char> del(" \t\r\n\v\f");

    string_list tokens;
    tokenizer tok(text, del);
    for (tokenizer::const_iterator it = tok.begin(); it != tok.end(); ++it)
        tokens.push_back(*it);
    return tokens;
}

std::string normalizeReport(const std::string& report)
{
    string_list tokens = splitTokens(report);
    if (!tokens.empty() && boost::ends_with(tokens.back(), "=")) {
        boost::trim_right_if(tokens.back(), boost::is_any_of("="));
        if (tokens.back().empty())
            tokens.pop_back();
    }
    return boost::join(tokens, " ");
}

ReportTokens::ReportTokens(const std::string& report) :
    _text(normalizeReport(report))
{
    // pad so that a leading or trailing RMK is still found at a word boundary
    const std::string padded = " " + _text + " ";
    const std::string::size_type pos = padded.find(REMARKS_DELIMITER);

    if (pos == std::string::npos) {
        _body_text = _text;
    } else {
        _body_text = boost::trim_copy(padded.substr(0, pos));
        _remarks_text = boost::trim_copy(padded.substr(pos + sizeof(REMARKS_DELIMITER) - 1));
    }

    _body = splitTokens(_body_text);
    _remarks = splitTokens(_remarks_text);

    AW_LOG(AW_GENERAL, AW_BULK, "report split into " << _body.size()
           << " body and " << _remarks.size() << " remark tokens");
}

} // namespace aerowx
