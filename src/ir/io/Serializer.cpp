//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements graph serialization. Floating-point constants are printed in
// their shortest round-trippable form and always carry a '.' or an exponent so
// that the parser reads them back as floats.
//
//===----------------------------------------------------------------------===//

#include "ir/io/Serializer.hpp"

#include "ir/io/Lexer.hpp"

#include <charconv>
#include <sstream>

using namespace strata::core;

namespace strata::io
{

namespace
{

std::string formatFloat(double v)
{
    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    std::string text = ec == std::errc() ? std::string(buf, end) : std::to_string(v);
    if (text.find_first_of(".eEn") == std::string::npos)
        text += ".0";
    return text;
}

void writeMeta(const Meta &meta, std::ostream &os)
{
    if (meta.val.isKnown())
        os << " : " << meta.val.toString();
    if (!meta.provenance.empty())
    {
        os << " !{";
        for (size_t i = 0; i < meta.provenance.size(); ++i)
        {
            if (i)
                os << ", ";
            os << quoteString(meta.provenance[i].key) << ": " << quoteString(meta.provenance[i].path);
        }
        os << '}';
    }
    if (meta.origin)
        os << " !origin(" << quoteString(meta.origin->name) << ", " << quoteString(meta.origin->qualifiedName) << ')';
}

void writeGraph(const Graph &g, std::ostream &os, unsigned depth)
{
    const std::string indent(depth * 2, ' ');
    os << indent << (depth == 0 ? "graph " : "subgraph ") << g.name() << " {\n";
    for (const auto &n : g.nodes())
    {
        os << indent << "  ";
        if (n.op == Opcode::Output)
        {
            os << "output " << Serializer::formatValue(g, n.operands.empty() ? Value::none() : n.operands.front())
               << '\n';
            continue;
        }
        os << '%' << n.name << " = " << toString(n.op);
        if (hasTarget(n.op))
            os << ' ' << n.target;
        if (n.op != Opcode::Param && n.op != Opcode::GraphRef)
        {
            os << '(';
            for (size_t i = 0; i < n.operands.size(); ++i)
            {
                if (i)
                    os << ", ";
                os << Serializer::formatValue(g, n.operands[i]);
            }
            os << ')';
        }
        writeMeta(n.meta, os);
        os << '\n';
    }
    for (const auto &child : g.subgraphs())
        writeGraph(child, os, depth + 1);
    os << indent << "}\n";
}

} // namespace

std::string Serializer::formatValue(const Graph &g, const Value &v)
{
    switch (v.kind)
    {
        case Value::Kind::NodeRef:
        {
            const Node *n = g.find(v.id);
            return n ? "%" + n->name : "%<dangling#" + std::to_string(v.id) + ">";
        }
        case Value::Kind::ConstInt:
            if (v.isBool)
                return v.i64 ? "true" : "false";
            return std::to_string(v.i64);
        case Value::Kind::ConstFloat:
            return formatFloat(v.f64);
        case Value::Kind::ConstStr:
            return quoteString(v.str);
        case Value::Kind::None:
            return "none";
        case Value::Kind::List:
        {
            std::string text = "(";
            for (size_t i = 0; i < v.elems.size(); ++i)
            {
                if (i)
                    text += ", ";
                text += formatValue(g, v.elems[i]);
            }
            return text + ")";
        }
    }
    return "?";
}

void Serializer::write(const Graph &g, std::ostream &os)
{
    writeGraph(g, os, 0);
}

std::string Serializer::toString(const Graph &g)
{
    std::ostringstream os;
    write(g, os);
    return os.str();
}

} // namespace strata::io
