//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "ir/transform/OutputSignature.hpp"

#include "ir/transform/OutlineDiagnostics.hpp"

#include <algorithm>
#include <utility>

using namespace strata::core;

namespace strata::transform
{

std::vector<Value> outputValues(const Graph &g)
{
    const Node *out = g.output();
    if (!out || out->operands.empty())
        return {};
    const Value &v = out->operands.front();
    if (v.isList())
        return v.elems;
    return {v};
}

OutputSignature::OutputSignature(std::vector<OutputSpec> specs) : specs_(std::move(specs)) {}

OutputSignature OutputSignature::fromGraph(const Graph &g, const std::vector<std::string> &declaredNames)
{
    OutputSignature sig;
    const auto values = outputValues(g);
    for (size_t i = 0; i < declaredNames.size(); ++i)
    {
        std::optional<std::string> valueName;
        if (i < values.size() && values[i].isRef())
        {
            if (const Node *n = g.find(values[i].id))
                valueName = n->name;
        }
        sig.add(declaredNames[i], std::move(valueName));
    }
    return sig;
}

void OutputSignature::add(std::string declaredName, std::optional<std::string> valueName)
{
    specs_.push_back(OutputSpec{std::move(declaredName), std::move(valueName)});
}

const OutputSpec *OutputSignature::find(std::string_view declaredName) const
{
    auto it = std::find_if(
        specs_.begin(), specs_.end(), [declaredName](const OutputSpec &s) { return s.declaredName == declaredName; });
    return it == specs_.end() ? nullptr : &*it;
}

void OutputSignature::replaceAllUses(const std::string &oldName, const std::string &newName)
{
    for (auto &spec : specs_)
    {
        if (spec.valueName && *spec.valueName == oldName)
            spec.valueName = newName;
    }
}

support::Expected<void> OutputSignature::reconcile(const Graph &g)
{
    const auto values = outputValues(g);
    if (values.size() != specs_.size())
        return support::makeError(diag::kOutputSpecificationMismatch,
                                  {},
                                  "graph '" + g.name() + "' returns " + std::to_string(values.size()) +
                                      " output(s) but the signature declares " + std::to_string(specs_.size()));

    for (size_t i = 0; i < values.size(); ++i)
    {
        OutputSpec &spec = specs_[i];
        const Value &v = values[i];
        if (v.isNone())
        {
            if (spec.valueName)
                return support::makeError(diag::kOutputSpecificationMismatch,
                                          {},
                                          "output '" + spec.declaredName + "' is None but is declared as '%" +
                                              *spec.valueName + "'");
            continue;
        }
        const Node *producer = v.isRef() ? g.find(v.id) : nullptr;
        if (!producer || !spec.valueName)
            return support::makeError(diag::kOutputSpecificationMismatch,
                                      {},
                                      "output '" + spec.declaredName + "' is " + describeKind(v) +
                                          " but is declared as " +
                                          (spec.valueName ? "'%" + *spec.valueName + "'" : std::string("None")));
        if (*spec.valueName != producer->name)
            spec.valueName = producer->name;
    }
    return {};
}

Graph::OutputRenameHook OutputSignature::renameHook()
{
    return [this](const std::string &oldName, const std::string &newName) { replaceAllUses(oldName, newName); };
}

} // namespace strata::transform
