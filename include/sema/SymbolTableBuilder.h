/***
 * Name: pyinfer::sema::SymbolTableBuilder
 * Purpose: Populate a SymbolTable in a single depth-first walk of the tree.
 * Inputs:
 *   - ast::Module
 * Outputs:
 *   - SymbolTable (functions, classes, variables, imports, global scope,
 *     implicit bindings)
 * Theory of Operation:
 *   Scope depth is pushed on entering a function or class body and popped on
 *   exit. Variables get the InferType() of their right-hand side unless they
 *   carry an explicit annotation. A function is registered before its body is
 *   walked, so recursive calls see it, and re-registered afterwards with the
 *   union of every 'return <expr>' found anywhere in its subtree. Parameters
 *   of the innermost function form a local overlay (annotation, default type
 *   or name heuristic) used while its body is inferred.
 *   Nothing is evaluated. A builder is single-use per build() call.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "sema/SymbolTable.h"
#include "sema/TypeInference.h"

namespace pyinfer::sema {

    class SymbolTableBuilder {
    public:
        SymbolTable build(const ast::Module &mod);

        // Visitor overloads for ast::dispatch
        void visit(const ast::FunctionDef &fn);
        void visit(const ast::ClassDef &cls);
        void visit(const ast::AssignStmt &assign);
        void visit(const ast::AnnAssignStmt &assign);
        void visit(const ast::Import &imp);
        void visit(const ast::ImportFrom &imp);
        void visit(const ast::ForStmt &loop);
        void visit(const ast::WithStmt &with);
        void visit(const ast::ExceptHandler &handler);
        void visit(const ast::NamedExpr &named);
        void visit(const ast::LambdaExpr &lambda);
        void visit(const ast::ListComp &comp);
        void visit(const ast::SetComp &comp);
        void visit(const ast::DictComp &comp);
        void visit(const ast::GeneratorExpr &comp);
        void visit(const ast::GlobalStmt &stmt);
        void visit(const ast::NonlocalStmt &stmt);

        template <typename T>
        void visit(const T &node) { visitChildren(node); }

    private:
        SymbolTable table_{};
        int depth_{0};
        std::string directClass_{};         // class whose body is walked directly
        std::optional<LocalTypes> params_{}; // parameter overlay of the innermost function

        void visitChildren(const ast::Node &node);
        void bindImplicit(const ast::Expr &target);
        void bindComprehension(const std::vector<ast::ComprehensionFor> &fors);
        void declare(const std::string &name, SymbolKind kind, int line);
        const LocalTypes *overlay() const { return params_ ? &*params_ : nullptr; }
        ParamSymbol recordParam(const ast::Param &param, LocalTypes &scope) const;
        std::vector<TypeDescriptor> collectReturns(const ast::FunctionDef &fn, const LocalTypes &scope) const;
    };

} // namespace pyinfer::sema
