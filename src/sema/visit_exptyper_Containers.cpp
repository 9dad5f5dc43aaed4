/***
 * Name: ExpressionTyper::visit(containers)
 * Purpose: Sample and unify list/set/tuple/dict literal elements.
 */
#include "sema/detail/ExpressionTyper.h"
#include "sema/InferenceLimits.h"
#include "sema/Unify.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

using namespace pyinfer;
using namespace pyinfer::sema;

namespace {
TypeDescriptor sampledElements(const ExpressionTyper& typer, const std::vector<std::unique_ptr<ast::Expr>>& elements) {
    std::vector<TypeDescriptor> sampled;
    for (const std::size_t i : SampleIndices(elements.size())) { sampled.push_back(typer.infer(*elements[i])); }
    return Unify(sampled);
}

// Every sample carries the same descriptor
bool uniform(const std::vector<TypeDescriptor>& sampled) {
    for (const auto& t : sampled) {
        if (t != sampled.front()) return false;
    }
    return !sampled.empty();
}

std::string wrap(const char* head, const TypeDescriptor& elem) {
    if (IsAny(elem)) return head;
    return std::string(head) + "[" + elem + "]";
}
} // namespace

void ExpressionTyper::visit(const ast::ListLiteral& listLiteral) {
    if (listLiteral.elements.empty()) { out = types::kList; return; }
    out = wrap(types::kList, sampledElements(*this, listLiteral.elements));
}

void ExpressionTyper::visit(const ast::SetLiteral& setLiteral) {
    if (setLiteral.elements.empty()) { out = types::kSet; return; }
    out = wrap(types::kSet, sampledElements(*this, setLiteral.elements));
}

void ExpressionTyper::visit(const ast::TupleLiteral& tupleLiteral) {
    const auto& elements = tupleLiteral.elements;
    if (elements.empty()) { out = types::kTuple; return; }
    if (elements.size() <= InferenceLimits::kExactTupleArity) {
        std::vector<TypeDescriptor> exact;
        exact.reserve(elements.size());
        for (const auto& e : elements) { exact.push_back(infer(*e)); }
        out = std::string(types::kTuple) + "[" + JoinTypes(exact, ", ") + "]";
        return;
    }
    const auto elem = sampledElements(*this, elements);
    out = IsAny(elem) ? std::string(types::kTuple) : std::string(types::kTuple) + "[" + elem + ", ...]";
}

void ExpressionTyper::visit(const ast::DictLiteral& dictLiteral) {
    std::vector<std::size_t> entries; // '**x' unpack entries are skipped
    for (std::size_t i = 0; i < dictLiteral.items.size(); ++i) {
        if (dictLiteral.items[i].first) entries.push_back(i);
    }
    if (entries.empty()) { out = types::kDict; return; }
    std::vector<TypeDescriptor> keys;
    std::vector<TypeDescriptor> values;
    for (const std::size_t s : SampleIndices(entries.size())) {
        const auto& item = dictLiteral.items[entries[s]];
        keys.push_back(infer(*item.first));
        values.push_back(infer(*item.second));
    }
    // dict[K, V] only when both sides agree on one descriptor
    if (!uniform(keys) || !uniform(values)) { out = types::kDict; return; }
    const auto k = Unify(keys);
    const auto v = Unify(values);
    out = (IsAny(k) || IsAny(v)) ? std::string(types::kDict) : std::string(types::kDict) + "[" + k + ", " + v + "]";
}
