// SPDX-License-Identifier: LGPL-2.1-or-later

#include <aerowx_config.h>

#include "token_scanner.hxx"

#include <cctype>
#include <cstring>

namespace aerowx {

const Token* findToken(const Token* list, const std::string& id)
{
    for (int i = 0; list[i].id; i++) {
        if (id == list[i].id)
            return &list[i];
    }
    return 0;
}

TokenScanner::TokenScanner(const std::string& token) :
    _token(token),
    _m(_token.c_str())
{
}

bool TokenScanner::scanChar(char c)
{
    if (*_m != c || c == '\0')
        return false;
    _m++;
    return true;
}

bool TokenScanner::scanOneOf(const char* chars, char* found)
{
    if (!*_m || !strchr(chars, *_m))
        return false;
    if (found)
        *found = *_m;
    _m++;
    return true;
}

bool TokenScanner::scanLiteral(const char* literal)
{
    size_t len = strlen(literal);
    if (strncmp(_m, literal, len))
        return false;
    _m += len;
    return true;
}

int TokenScanner::scanNumber(int* num, int min, int max)
{
    int i;
    const char* s = _m;
    int n = 0;
    for (i = 0; i < min; i++) {
        if (!isdigit(static_cast<unsigned char>(*s)))
            return 0;
        else
            n = n * 10 + *s++ - '0';
    }
    for (; i < max && isdigit(static_cast<unsigned char>(*s)); i++)
        n = n * 10 + *s++ - '0';
    *num = n;
    _m = s;
    return i;
}

int TokenScanner::scanDigits(std::string* digits, int min, int max)
{
    const char* mark = _m;
    int num;
    int count = scanNumber(&num, min, max);
    if (count)
        *digits = since(mark);
    return count;
}

// find longest match of the remaining text in list
const Token* TokenScanner::scanToken(const Token* list)
{
    const Token* longest = 0;
    size_t maxlen = 0, len;
    const char* s;
    for (int i = 0; (s = list[i].id); i++) {
        len = strlen(s);
        if (!strncmp(s, _m, len) && len > maxlen) {
            maxlen = len;
            longest = &list[i];
        }
    }
    _m += maxlen;
    return longest;
}

std::string TokenScanner::since(const char* mark) const
{
    return std::string(mark, _m - mark);
}

} // namespace aerowx
