//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/io/Lexer.cpp
// Purpose: Tokenise graph text for the parser.
// Key invariants: Columns count bytes; tabs advance by one column.
//
//===----------------------------------------------------------------------===//

#include "ir/io/Lexer.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace strata::io
{

namespace
{

bool isIdentStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

bool isDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

unsigned hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return static_cast<unsigned>(c - '0');
    if (c >= 'a' && c <= 'f')
        return static_cast<unsigned>(10 + (c - 'a'));
    return static_cast<unsigned>(10 + (c - 'A'));
}

} // namespace

Lexer::Lexer(std::string_view text, uint32_t fileId) : text_(text), fileId_(fileId) {}

support::SourceLoc Lexer::here() const
{
    return support::SourceLoc{fileId_, line_, column_};
}

char Lexer::peek(size_t ahead) const
{
    return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
}

char Lexer::advance()
{
    const char c = text_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

void Lexer::skipTrivia()
{
    while (pos_ < text_.size())
    {
        const char c = peek();
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            advance();
            continue;
        }
        if (c == '#' || (c == '/' && peek(1) == '/'))
        {
            while (pos_ < text_.size() && peek() != '\n')
                advance();
            continue;
        }
        break;
    }
}

support::Diag Lexer::errorAt(const Token &tok, const std::string &msg) const
{
    return support::makeError("P3001", support::SourceLoc{fileId_, tok.line, tok.column}, msg);
}

support::Expected<Token> Lexer::next()
{
    skipTrivia();
    Token tok;
    tok.line = line_;
    tok.column = column_;
    if (pos_ >= text_.size())
    {
        tok.kind = Token::Kind::End;
        return tok;
    }

    const char c = peek();
    if (c == '%')
    {
        advance();
        tok.kind = Token::Kind::ValueName;
        while (pos_ < text_.size() && isIdentChar(peek()))
            tok.text.push_back(advance());
        if (tok.text.empty())
            return errorAt(tok, "expected a value name after '%'");
        return tok;
    }
    if (isIdentStart(c))
    {
        tok.kind = Token::Kind::Ident;
        while (pos_ < text_.size() && isIdentChar(peek()))
            tok.text.push_back(advance());
        return tok;
    }
    if (c == '"')
        return lexString(std::move(tok));
    if (isDigit(c) || (c == '-' && isDigit(peek(1))))
        return lexNumber(std::move(tok));

    static constexpr std::string_view kPunct = "{}()[],:=!?";
    if (kPunct.find(c) != std::string_view::npos)
    {
        tok.kind = Token::Kind::Punct;
        tok.text.push_back(advance());
        return tok;
    }
    return errorAt(tok, std::string("unexpected character '") + c + "'");
}

support::Expected<Token> Lexer::lexString(Token tok)
{
    tok.kind = Token::Kind::String;
    advance(); // opening quote
    while (true)
    {
        if (pos_ >= text_.size() || peek() == '\n')
            return errorAt(tok, "unterminated string literal");
        const char c = advance();
        if (c == '"')
            return tok;
        if (c != '\\')
        {
            tok.text.push_back(c);
            continue;
        }
        if (pos_ >= text_.size())
            return errorAt(tok, "unterminated escape sequence");
        const char esc = advance();
        switch (esc)
        {
            case '\\':
            case '"':
                tok.text.push_back(esc);
                break;
            case 'n':
                tok.text.push_back('\n');
                break;
            case 'r':
                tok.text.push_back('\r');
                break;
            case 't':
                tok.text.push_back('\t');
                break;
            case '0':
                tok.text.push_back('\0');
                break;
            case 'x':
            {
                if (!std::isxdigit(static_cast<unsigned char>(peek())) ||
                    !std::isxdigit(static_cast<unsigned char>(peek(1))))
                    return errorAt(tok, "invalid hex escape");
                const unsigned hi = hexValue(advance());
                const unsigned lo = hexValue(advance());
                tok.text.push_back(static_cast<char>((hi << 4) | lo));
                break;
            }
            default:
                return errorAt(tok, std::string("unknown escape sequence \\") + esc);
        }
    }
}

support::Expected<Token> Lexer::lexNumber(Token tok)
{
    bool isFloat = false;
    if (peek() == '-')
        tok.text.push_back(advance());
    while (isDigit(peek()))
        tok.text.push_back(advance());
    if (peek() == '.' && isDigit(peek(1)))
    {
        isFloat = true;
        tok.text.push_back(advance());
        while (isDigit(peek()))
            tok.text.push_back(advance());
    }
    if ((peek() == 'e' || peek() == 'E') &&
        (isDigit(peek(1)) || ((peek(1) == '-' || peek(1) == '+') && isDigit(peek(2)))))
    {
        isFloat = true;
        tok.text.push_back(advance());
        if (peek() == '-' || peek() == '+')
            tok.text.push_back(advance());
        while (isDigit(peek()))
            tok.text.push_back(advance());
    }

    errno = 0;
    if (isFloat)
    {
        tok.kind = Token::Kind::Float;
        tok.f64 = std::strtod(tok.text.c_str(), nullptr);
    }
    else
    {
        tok.kind = Token::Kind::Int;
        tok.i64 = std::strtoll(tok.text.c_str(), nullptr, 10);
    }
    if (errno == ERANGE)
        return errorAt(tok, "numeric literal '" + tok.text + "' out of range");
    return tok;
}

std::string quoteString(std::string_view raw)
{
    std::string out = "\"";
    for (unsigned char c : raw)
    {
        switch (c)
        {
            case '\\':
                out.append("\\\\");
                break;
            case '"':
                out.append("\\\"");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            case '\0':
                out.append("\\0");
                break;
            default:
                if (c < 0x20 || c == 0x7F)
                {
                    char buf[5];
                    std::snprintf(buf, sizeof(buf), "\\x%02X", c);
                    out.append(buf);
                }
                else
                {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back('"');
    return out;
}

} // namespace strata::io
