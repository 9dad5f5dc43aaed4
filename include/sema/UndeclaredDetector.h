/***
 * Name: pyinfer::sema::UndeclaredDetector
 * Purpose: Report names read without any discoverable declaration.
 * Inputs:
 *   - ast::Module and its finished SymbolTable
 *   - UndeclaredOptions
 * Outputs:
 *   - UndeclaredReference records in source order of first occurrence
 * Theory of Operation:
 *   The declared set is every registry key, the global scope, the implicit
 *   bindings and the builtin names. Walking the tree, each function entered
 *   contributes its own parameter names (taken from the definition node, so
 *   same-named methods keep their own parameters). A Name in load context
 *   that is neither declared nor a visible parameter is recorded; records
 *   are de-duplicated on every field, so the same name at another position
 *   is reported again. The reported function is always the innermost one.
 *   By default only the innermost function's parameters are visible; with
 *   enclosingParameters on, parameters of every enclosing function are too.
 */
#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "ast/Nodes.h"
#include "sema/SymbolTable.h"

namespace pyinfer::sema {

    struct UndeclaredOptions {
        bool enclosingParameters{false};
    };

    struct UndeclaredReference {
        std::string name;
        int line{0};
        int col{0};
        std::string context{"load"};
        std::optional<std::string> function;

        bool operator==(const UndeclaredReference &other) const {
            return name == other.name && line == other.line && col == other.col && context == other.context &&
                   function == other.function;
        }
    };

    // Builtin functions, types, exceptions and predefined module names.
    const std::unordered_set<std::string> &BuiltinNames();

    class UndeclaredDetector {
    public:
        explicit UndeclaredDetector(const SymbolTable &table, UndeclaredOptions options = {})
            : table_(table), options_(options) {}

        std::vector<UndeclaredReference> detect(const ast::Module &mod);

        // Visitor overloads for ast::dispatch
        void visit(const ast::FunctionDef &fn);
        void visit(const ast::Name &name);

        template <typename T>
        void visit(const T &node) { visitChildren(node); }

    private:
        const SymbolTable &table_;
        UndeclaredOptions options_;
        std::vector<std::unordered_set<std::string>> params_{};
        std::optional<std::string> currentFunction_{};
        std::vector<UndeclaredReference> found_{};

        void visitChildren(const ast::Node &node);
        bool isParameter(const std::string &name) const;
    };

} // namespace pyinfer::sema
