// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Character cursor over a single report token.
 */

#pragma once

#include <string>

namespace aerowx {

/// one entry of a code vocabulary, terminated by { 0, 0 }
struct Token {
    const char* id;
    const char* text;
};

/// exact lookup of @a id in @a list, or 0
const Token* findToken(const Token* list, const std::string& id);

/**
 * A cursor over the characters of one token. Every scan method either
 * consumes what it matched and returns true (or a non-zero count), or
 * leaves the cursor where it was.
 */
class TokenScanner
{
public:
    explicit TokenScanner(const std::string& token);

    TokenScanner(const TokenScanner&) = delete;
    TokenScanner& operator=(const TokenScanner&) = delete;

    bool atEnd() const { return *_m == '\0'; }

    bool scanChar(char c);

    /// consume one of @a chars; stores it in @a found if given
    bool scanOneOf(const char* chars, char* found = nullptr);

    bool scanLiteral(const char* literal);

    /**
     * Read at least @a min and at most @a max digits (max = 0 means
     * exactly @a min). Returns the number of digits read, 0 on failure.
     */
    int scanNumber(int* num, int min, int max = 0);

    /// like scanNumber(), keeping the digits as text ("020")
    int scanDigits(std::string* digits, int min, int max = 0);

    /// longest entry of @a list the remaining text starts with
    const Token* scanToken(const Token* list);

    /// the text consumed since @a mark (a value returned by position())
    std::string since(const char* mark) const;

    const char* position() const { return _m; }

private:
    std::string _token;
    const char* _m;
};

} // namespace aerowx
