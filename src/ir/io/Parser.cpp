//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the graph text parser as a recursive-descent parser over the
// Lexer's token stream with one token of lookahead. Each graph block is parsed
// into its own Graph and attached to the enclosing one when its closing brace
// is reached.
//
//===----------------------------------------------------------------------===//

#include "ir/io/Parser.hpp"

#include "ir/io/Lexer.hpp"

#include <iterator>
#include <string>
#include <utility>
#include <vector>

using namespace strata::core;

namespace strata::io
{

namespace
{

class GraphParser
{
  public:
    GraphParser(std::string_view text, uint32_t fileId) : lex_(text, fileId), fileId_(fileId) {}

    support::Expected<Graph> parseFile()
    {
        if (auto r = advance(); !r)
            return r.error();
        if (!tok_.is(Token::Kind::Ident, "graph"))
            return error("expected 'graph'");
        auto g = parseGraphBlock();
        if (!g)
            return g;
        if (tok_.kind != Token::Kind::End)
            return error("unexpected text after the graph");
        return g;
    }

  private:
    support::Diag error(const std::string &msg) const
    {
        return support::makeError("P3001", support::SourceLoc{fileId_, tok_.line, tok_.column}, msg);
    }

    support::Expected<void> advance()
    {
        auto t = lex_.next();
        if (!t)
            return t.error();
        tok_ = std::move(t.value());
        return {};
    }

    support::Expected<void> expectPunct(char c)
    {
        if (!tok_.isPunct(c))
            return error(std::string("expected '") + c + "'");
        return advance();
    }

    support::Expected<std::string> expectIdent(const char *what)
    {
        if (tok_.kind != Token::Kind::Ident)
            return error(std::string("expected ") + what);
        std::string text = tok_.text;
        if (auto r = advance(); !r)
            return r.error();
        return text;
    }

    support::Expected<std::string> expectString()
    {
        if (tok_.kind != Token::Kind::String)
            return error("expected a string literal");
        std::string text = tok_.text;
        if (auto r = advance(); !r)
            return r.error();
        return text;
    }

    /// Parses `graph|subgraph NAME { body }`; the keyword is the current token.
    support::Expected<Graph> parseGraphBlock()
    {
        if (auto r = advance(); !r)
            return r.error();
        auto name = expectIdent("a graph name");
        if (!name)
            return name.error();
        if (auto r = expectPunct('{'); !r)
            return r.error();

        Graph g(name.value());
        while (!tok_.isPunct('}'))
        {
            if (tok_.kind == Token::Kind::End)
                return error("missing '}' closing graph '" + g.name() + "'");
            if (tok_.is(Token::Kind::Ident, "subgraph"))
            {
                auto child = parseGraphBlock();
                if (!child)
                    return child;
                if (g.subgraph(child.value().name()))
                    return error("duplicate subgraph '" + child.value().name() + "'");
                g.setSubgraph(std::move(child.value()));
                continue;
            }
            if (g.output())
                return error("node after the output of graph '" + g.name() + "'");
            if (tok_.is(Token::Kind::Ident, "output"))
            {
                if (auto r = parseOutput(g); !r)
                    return r.error();
                continue;
            }
            if (tok_.kind == Token::Kind::ValueName)
            {
                if (auto r = parseNode(g); !r)
                    return r.error();
                continue;
            }
            return error("expected a node definition, 'output' or 'subgraph'");
        }
        if (auto r = advance(); !r)
            return r.error();
        return g;
    }

    support::Expected<void> parseOutput(Graph &g)
    {
        if (auto r = advance(); !r)
            return r;
        auto v = parseValue(g);
        if (!v)
            return v.error();
        g.append(Opcode::Output, "", {std::move(v.value())}, "output");
        return {};
    }

    support::Expected<void> parseNode(Graph &g)
    {
        const std::string name = tok_.text;
        if (g.findByName(name))
            return error("redefinition of '%" + name + "'");
        if (auto r = advance(); !r)
            return r;
        if (auto r = expectPunct('='); !r)
            return r;

        const auto mnemonic = tok_.kind == Token::Kind::Ident ? opcodeFromMnemonic(tok_.text) : std::nullopt;
        if (!mnemonic || *mnemonic == Opcode::Output)
            return error("unknown operation '" + tok_.text + "'");
        const Opcode op = *mnemonic;
        if (auto r = advance(); !r)
            return r;

        std::string target;
        if (hasTarget(op))
        {
            auto t = expectIdent("a target name");
            if (!t)
                return t.error();
            target = std::move(t.value());
        }

        std::vector<Value> operands;
        if (op != Opcode::Param && op != Opcode::GraphRef)
        {
            if (auto r = expectPunct('('); !r)
                return r;
            auto list = parseValueList(g, ')');
            if (!list)
                return list.error();
            operands = std::move(list.value());
        }

        Meta meta;
        if (tok_.isPunct(':'))
        {
            if (auto r = advance(); !r)
                return r;
            auto type = parseType();
            if (!type)
                return type.error();
            meta.val = std::move(type.value());
        }
        while (tok_.isPunct('!'))
        {
            if (auto r = parseMeta(meta); !r)
                return r;
        }

        Node &n = g.append(op, std::move(target), std::move(operands), name);
        n.meta = std::move(meta);
        return {};
    }

    /// Parses values up to and including @p close; the opener is consumed.
    support::Expected<std::vector<Value>> parseValueList(const Graph &g, char close)
    {
        std::vector<Value> values;
        if (tok_.isPunct(close))
        {
            if (auto r = advance(); !r)
                return r.error();
            return values;
        }
        while (true)
        {
            auto v = parseValue(g);
            if (!v)
                return v.error();
            values.push_back(std::move(v.value()));
            if (tok_.isPunct(','))
            {
                if (auto r = advance(); !r)
                    return r.error();
                continue;
            }
            if (auto r = expectPunct(close); !r)
                return r.error();
            return values;
        }
    }

    support::Expected<Value> parseValue(const Graph &g)
    {
        Value v;
        switch (tok_.kind)
        {
            case Token::Kind::ValueName:
            {
                const Node *def = g.findByName(tok_.text);
                if (!def)
                    return error("unknown value '%" + tok_.text + "'");
                v = Value::ref(def->id);
                break;
            }
            case Token::Kind::Int:
                v = Value::constInt(tok_.i64);
                break;
            case Token::Kind::Float:
                v = Value::constFloat(tok_.f64);
                break;
            case Token::Kind::String:
                v = Value::constStr(tok_.text);
                break;
            case Token::Kind::Ident:
                if (tok_.text == "true" || tok_.text == "false")
                    v = Value::constBool(tok_.text == "true");
                else if (tok_.text == "none")
                    v = Value::none();
                else
                    return error("unexpected '" + tok_.text + "' in value position");
                break;
            case Token::Kind::Punct:
                if (tok_.isPunct('('))
                {
                    if (auto r = advance(); !r)
                        return r.error();
                    auto elems = parseValueList(g, ')');
                    if (!elems)
                        return elems.error();
                    return Value::list(std::move(elems.value()));
                }
                return error("unexpected '" + tok_.text + "' in value position");
            case Token::Kind::End:
                return error("unexpected end of input");
        }
        if (auto r = advance(); !r)
            return r.error();
        return v;
    }

    support::Expected<Type> parseType()
    {
        if (tok_.isPunct('?'))
        {
            if (auto r = advance(); !r)
                return r.error();
            return Type();
        }
        if (tok_.isPunct('('))
        {
            if (auto r = advance(); !r)
                return r.error();
            std::vector<Type> elems;
            while (!tok_.isPunct(')'))
            {
                if (!elems.empty())
                {
                    if (auto r = expectPunct(','); !r)
                        return r.error();
                }
                auto t = parseType();
                if (!t)
                    return t;
                elems.push_back(std::move(t.value()));
            }
            if (auto r = advance(); !r)
                return r.error();
            return Type::tuple(std::move(elems));
        }

        auto word = expectIdent("a type");
        if (!word)
            return word.error();
        if (tok_.isPunct('['))
        {
            if (auto r = advance(); !r)
                return r.error();
            std::vector<long long> shape;
            while (!tok_.isPunct(']'))
            {
                if (!shape.empty())
                {
                    if (auto r = expectPunct(','); !r)
                        return r.error();
                }
                if (tok_.kind != Token::Kind::Int)
                    return error("expected a dimension");
                if (tok_.i64 < 0)
                    return error("tensor dimension must be non-negative");
                shape.push_back(tok_.i64);
                if (auto r = advance(); !r)
                    return r.error();
            }
            if (auto r = advance(); !r)
                return r.error();
            return Type::tensor(word.value(), std::move(shape));
        }
        static const std::pair<const char *, Type::Kind> kScalars[] = {{"none", Type::Kind::None},
                                                                      {"i1", Type::Kind::I1},
                                                                      {"i64", Type::Kind::I64},
                                                                      {"f64", Type::Kind::F64},
                                                                      {"str", Type::Kind::Str}};
        for (const auto &[spelling, kind] : kScalars)
        {
            if (word.value() == spelling)
                return Type(kind);
        }
        return error("unknown type '" + word.value() + "'");
    }

    /// Parses one `!{...}` provenance list or `!origin(...)` tag.
    support::Expected<void> parseMeta(Meta &meta)
    {
        if (auto r = advance(); !r)
            return r;
        if (tok_.isPunct('{'))
        {
            if (auto r = advance(); !r)
                return r;
            while (!tok_.isPunct('}'))
            {
                if (!meta.provenance.empty())
                {
                    if (auto r = expectPunct(','); !r)
                        return r;
                }
                auto key = expectString();
                if (!key)
                    return key.error();
                if (auto r = expectPunct(':'); !r)
                    return r;
                auto path = expectString();
                if (!path)
                    return path.error();
                meta.provenance.push_back(ScopeFrame{std::move(key.value()), std::move(path.value())});
            }
            return advance();
        }
        if (tok_.is(Token::Kind::Ident, "origin"))
        {
            if (auto r = advance(); !r)
                return r;
            if (auto r = expectPunct('('); !r)
                return r;
            auto name = expectString();
            if (!name)
                return name.error();
            if (auto r = expectPunct(','); !r)
                return r;
            auto qualified = expectString();
            if (!qualified)
                return qualified.error();
            meta.origin = OriginTag{std::move(name.value()), std::move(qualified.value())};
            return expectPunct(')');
        }
        return error("expected '{' or 'origin' after '!'");
    }

    Lexer lex_;
    Token tok_;
    uint32_t fileId_;
};

} // namespace

support::Expected<Graph> Parser::parseString(std::string_view text, uint32_t fileId)
{
    GraphParser parser(text, fileId);
    return parser.parseFile();
}

support::Expected<Graph> Parser::parse(std::istream &is, uint32_t fileId)
{
    const std::string text((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    return parseString(text, fileId);
}

} // namespace strata::io
