/***
 * @file
 * @brief ExpressionTyper: node-kind visitor behind sema::InferType.
 */
#pragma once

#include "ast/Nodes.h"
#include "sema/SymbolTable.h"
#include "sema/TypeDescriptor.h"
#include "sema/TypeInference.h"

namespace pyinfer::sema {
    /***
     * @class ExpressionTyper
     * @brief Infers one expression; the result is left in `out`.
     *
     * Statement kinds never reach it through InferType; the catch-all
     * overload reports Any for them.
     */
    class ExpressionTyper {
    public:
        ExpressionTyper(const SymbolTable &table_, const LocalTypes *locals_) : table(&table_), locals(locals_) {}

        TypeDescriptor out{types::kAny};

        // Infer a child expression with the same table and overlay.
        TypeDescriptor infer(const ast::Expr &expr) const;

        // constants
        void visit(const ast::IntLiteral &);
        void visit(const ast::FloatLiteral &);
        void visit(const ast::ImagLiteral &);
        void visit(const ast::StringLiteral &);
        void visit(const ast::BytesLiteral &);
        void visit(const ast::BoolLiteral &);
        void visit(const ast::NoneLiteral &);
        void visit(const ast::EllipsisLiteral &);
        void visit(const ast::FStringLiteral &);

        // containers
        void visit(const ast::ListLiteral &);
        void visit(const ast::SetLiteral &);
        void visit(const ast::TupleLiteral &);
        void visit(const ast::DictLiteral &);

        // comprehensions
        void visit(const ast::ListComp &);
        void visit(const ast::SetComp &);
        void visit(const ast::DictComp &);
        void visit(const ast::GeneratorExpr &);

        // operators
        void visit(const ast::Binary &);
        void visit(const ast::Unary &);
        void visit(const ast::Compare &);
        void visit(const ast::BoolOp &);

        // names and access
        void visit(const ast::Name &);
        void visit(const ast::Attribute &);
        void visit(const ast::Subscript &);
        void visit(const ast::Call &);

        // remaining expressions
        void visit(const ast::IfExpr &);
        void visit(const ast::LambdaExpr &);
        void visit(const ast::NamedExpr &);
        void visit(const ast::Starred &);
        void visit(const ast::Slice &);
        void visit(const ast::YieldExpr &);
        void visit(const ast::AwaitExpr &);

        template <typename T>
        void visit(const T &) { out = types::kAny; }

    private:
        const SymbolTable *table{nullptr};
        const LocalTypes *locals{nullptr};

        // Element types of comprehension targets layered over `locals`.
        LocalTypes bindComprehensionTargets(const std::vector<ast::ComprehensionFor> &fors) const;
    };
} // namespace pyinfer::sema
