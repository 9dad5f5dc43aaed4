/**
 * @file
 * @brief SymbolTable lookups and enum spellings.
 */
#include "sema/SymbolTable.h"

#include <algorithm>
#include <string>
#include <vector>

namespace pyinfer::sema {

const char* to_string(const SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Function: return "function";
        case SymbolKind::Class: return "class";
        case SymbolKind::Variable: return "variable";
        case SymbolKind::Import: return "import";
    }
    return "variable";
}

const char* to_string(const ImportKind kind) {
    switch (kind) {
        case ImportKind::Module: return "import";
        case ImportKind::Selective: return "from_import";
    }
    return "import";
}

std::vector<std::string> FunctionSymbol::paramNames() const {
    std::vector<std::string> out;
    out.reserve(params.size());
    for (const auto& p : params) { out.push_back(p.name); }
    return out;
}

bool FunctionSymbol::hasDecorator(const std::string& name) const {
    return std::find(decorators.begin(), decorators.end(), name) != decorators.end();
}

namespace {
template <typename M>
const typename M::mapped_type* findIn(const M& registry, const std::string& name) {
    const auto it = registry.find(name);
    return it == registry.end() ? nullptr : &it->second;
}
} // namespace

const FunctionSymbol* SymbolTable::findFunction(const std::string& name) const { return findIn(functions, name); }
const ClassSymbol* SymbolTable::findClass(const std::string& name) const { return findIn(classes, name); }
const VariableSymbol* SymbolTable::findVariable(const std::string& name) const { return findIn(variables, name); }
const ImportSymbol* SymbolTable::findImport(const std::string& name) const { return findIn(imports, name); }

bool SymbolTable::declares(const std::string& name) const {
    return functions.count(name) != 0 || classes.count(name) != 0 || variables.count(name) != 0 ||
           imports.count(name) != 0 || globalScope.count(name) != 0 || implicitBindings.count(name) != 0;
}

} // namespace pyinfer::sema
