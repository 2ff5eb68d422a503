//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Lexer that splits graph text (`.sg`) into tokens.
//
// Token Classes:
// - Ident: keywords, mnemonics, callee and child names; may contain '.'
// - ValueName: `%name` references and definitions (text excludes the '%')
// - String: double-quoted literal with C-style escapes already decoded
// - Int / Float: optionally negative numeric literals
// - Punct: one of `{ } ( ) [ ] , : = ! ?`
// - End: end of input
//
// Comments run from `#` or `//` to the end of the line. Every token records
// the 1-based line and column where it starts so the parser can point
// diagnostics at the offending text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace strata::io
{

struct Token
{
    enum class Kind
    {
        Ident,
        ValueName,
        String,
        Int,
        Float,
        Punct,
        End
    };

    Kind kind = Kind::End;
    std::string text;
    long long i64 = 0;
    double f64 = 0.0;
    unsigned line = 1;
    unsigned column = 1;

    [[nodiscard]] bool is(Kind k, std::string_view t) const
    {
        return kind == k && text == t;
    }

    [[nodiscard]] bool isPunct(char c) const
    {
        return kind == Kind::Punct && text.size() == 1 && text[0] == c;
    }
};

class Lexer
{
  public:
    explicit Lexer(std::string_view text, uint32_t fileId = 0);

    /// @brief Scan and return the next token, or a P3001 diagnostic.
    support::Expected<Token> next();

    /// @brief Source location of the current scan position.
    [[nodiscard]] support::SourceLoc here() const;

  private:
    void skipTrivia();
    char peek(size_t ahead = 0) const;
    char advance();
    support::Expected<Token> lexString(Token tok);
    support::Expected<Token> lexNumber(Token tok);
    support::Diag errorAt(const Token &tok, const std::string &msg) const;

    std::string_view text_;
    size_t pos_ = 0;
    unsigned line_ = 1;
    unsigned column_ = 1;
    uint32_t fileId_;
};

/// @brief Encode @p raw as a quoted literal accepted by the Lexer.
std::string quoteString(std::string_view raw);

} // namespace strata::io
