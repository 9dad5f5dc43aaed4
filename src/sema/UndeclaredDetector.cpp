/***
 * Name: pyinfer::sema::UndeclaredDetector (impl)
 */
#include "sema/UndeclaredDetector.h"
#include "ast/Children.h"
#include "ast/Visitor.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace pyinfer::sema {

std::vector<UndeclaredReference> UndeclaredDetector::detect(const ast::Module& mod) {
    params_.clear();
    currentFunction_.reset();
    found_.clear();
    visitChildren(mod);
    return std::move(found_);
}

void UndeclaredDetector::visitChildren(const ast::Node& node) {
    ast::ForEachChild(node, [this](const ast::Node& child) { ast::dispatch(child, *this); });
}

bool UndeclaredDetector::isParameter(const std::string& name) const {
    if (params_.empty()) return false;
    if (!options_.enclosingParameters) return params_.back().count(name) != 0;
    return std::any_of(params_.begin(), params_.end(), [&](const auto& set) { return set.count(name) != 0; });
}

void UndeclaredDetector::visit(const ast::FunctionDef& fn) {
    std::unordered_set<std::string> names;
    for (const auto& p : fn.params) { names.insert(p.name); }
    params_.push_back(std::move(names));
    auto saved = std::exchange(currentFunction_, fn.name);
    visitChildren(fn);
    currentFunction_ = std::move(saved);
    params_.pop_back();
}

void UndeclaredDetector::visit(const ast::Name& name) {
    if (name.ctx != ast::ExprContext::Load) return;
    if (table_.declares(name.id) || BuiltinNames().count(name.id) != 0 || isParameter(name.id)) return;
    UndeclaredReference ref{name.id, name.line, name.col, ast::to_string(name.ctx), currentFunction_};
    if (std::find(found_.begin(), found_.end(), ref) == found_.end()) found_.push_back(std::move(ref));
}

} // namespace pyinfer::sema
