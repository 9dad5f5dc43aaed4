/***
 * Name: pyinfer::sema::SymbolTable
 * Purpose: Registries of every declared name in one module.
 * Inputs:
 *   - Filled by SymbolTableBuilder in one pass, refined once by ResolveDeferred.
 * Outputs:
 *   - Functions, classes, variables and imports keyed by name, the module-level
 *     scope, and the set of names bound implicitly (loop targets, 'as' names...).
 * Theory of Operation:
 *   Each registry keeps one record per name; a later declaration replaces the
 *   earlier one. Scope depth counts enclosing function/class bodies (0 at
 *   module level).
 */
#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "ast/Param.h"
#include "sema/TypeDescriptor.h"

namespace pyinfer::sema {

    enum class SymbolKind { Function, Class, Variable, Import };

    const char* to_string(SymbolKind kind);

    enum class ImportKind { Module, Selective };

    const char* to_string(ImportKind kind);

    struct ParamSymbol {
        std::string name;
        ast::ParamKind kind{ast::ParamKind::Positional};
        std::optional<std::string> annotation;      // rendered declared annotation
        std::optional<TypeDescriptor> defaultType;  // inferred from a non-None default
        bool hasDefault{false};
    };

    struct FunctionSymbol {
        std::string name;
        int line{0};
        int col{0};
        std::vector<ParamSymbol> params;
        std::optional<std::string> returnAnnotation;
        std::vector<std::string> decorators;
        int scopeDepth{0};
        bool isAsync{false};
        std::string enclosingClass; // set for methods declared directly in a class body
        bool hasValueReturn{false}; // any 'return <expr>' in the subtree
        std::optional<TypeDescriptor> inferredReturn;

        std::vector<std::string> paramNames() const;
        bool isMethod() const { return !enclosingClass.empty(); }
        bool hasDecorator(const std::string& name) const;
    };

    struct ClassSymbol {
        std::string name;
        int line{0};
        int col{0};
        std::vector<std::string> bases;
        std::vector<std::string> decorators;
        std::vector<std::string> methods; // function defs directly in the body
        int scopeDepth{0};
    };

    struct VariableSymbol {
        std::string name;
        int line{0};
        int col{0};
        std::optional<std::string> annotation;
        std::optional<TypeDescriptor> inferredType;
        int scopeDepth{0};
    };

    struct ImportSymbol {
        std::string name;   // effective bound name
        std::string module; // leading dots for relative imports
        std::optional<std::string> originalName; // selective imports only
        std::optional<std::string> alias;
        int line{0};
        ImportKind kind{ImportKind::Module};
    };

    struct ScopeEntry {
        SymbolKind kind{SymbolKind::Variable};
        int line{0};
    };

    struct SymbolTable {
        std::map<std::string, FunctionSymbol> functions;
        std::map<std::string, ClassSymbol> classes;
        std::map<std::string, VariableSymbol> variables;
        std::map<std::string, ImportSymbol> imports;
        std::map<std::string, ScopeEntry> globalScope;
        std::set<std::string> implicitBindings;

        const FunctionSymbol* findFunction(const std::string& name) const;
        const ClassSymbol* findClass(const std::string& name) const;
        const VariableSymbol* findVariable(const std::string& name) const;
        const ImportSymbol* findImport(const std::string& name) const;

        // Name appears in any registry, the global scope or the implicit bindings.
        bool declares(const std::string& name) const;
    };

} // namespace pyinfer::sema
