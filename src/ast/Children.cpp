/***
 * Name: pyinfer::ast::ForEachChild (impl)
 * Purpose: Single source of truth for tree shape used by every walker.
 */
#include "ast/Children.h"
#include "ast/Nodes.h"

#include <memory>
#include <vector>

namespace pyinfer::ast {

namespace {
using Fn = std::function<void(const Node&)>;

template <typename T>
void each(const std::vector<std::unique_ptr<T>>& nodes, const Fn& fn) {
    for (const auto& n : nodes) { if (n) { fn(*n); } }
}

template <typename T>
void one(const std::unique_ptr<T>& node, const Fn& fn) {
    if (node) { fn(*node); }
}

void params(const std::vector<Param>& ps, const Fn& fn) {
    for (const auto& p : ps) {
        one(p.annotation, fn);
        one(p.defaultValue, fn);
    }
}

void fors(const std::vector<ComprehensionFor>& clauses, const Fn& fn) {
    for (const auto& c : clauses) {
        one(c.target, fn);
        one(c.iter, fn);
        each(c.ifs, fn);
    }
}
} // namespace

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void ForEachChild(const Node& node, const Fn& fn) {
    switch (node.kind) {
        case NodeKind::Module:
            each(static_cast<const Module&>(node).body, fn);
            return;
        case NodeKind::FunctionDef: {
            const auto& f = static_cast<const FunctionDef&>(node);
            each(f.decorators, fn);
            params(f.params, fn);
            one(f.returns, fn);
            each(f.body, fn);
            return;
        }
        case NodeKind::ClassDef: {
            const auto& c = static_cast<const ClassDef&>(node);
            each(c.decorators, fn);
            each(c.bases, fn);
            for (const auto& kw : c.keywords) { one(kw.value, fn); }
            each(c.body, fn);
            return;
        }
        case NodeKind::ReturnStmt:
            one(static_cast<const ReturnStmt&>(node).value, fn);
            return;
        case NodeKind::AssignStmt: {
            const auto& a = static_cast<const AssignStmt&>(node);
            each(a.targets, fn);
            one(a.value, fn);
            return;
        }
        case NodeKind::AnnAssignStmt: {
            const auto& a = static_cast<const AnnAssignStmt&>(node);
            one(a.target, fn);
            one(a.annotation, fn);
            one(a.value, fn);
            return;
        }
        case NodeKind::AugAssignStmt: {
            const auto& a = static_cast<const AugAssignStmt&>(node);
            one(a.target, fn);
            one(a.value, fn);
            return;
        }
        case NodeKind::ExprStmt:
            one(static_cast<const ExprStmt&>(node).value, fn);
            return;
        case NodeKind::IfStmt: {
            const auto& s = static_cast<const IfStmt&>(node);
            one(s.cond, fn);
            each(s.thenBody, fn);
            each(s.elseBody, fn);
            return;
        }
        case NodeKind::WhileStmt: {
            const auto& s = static_cast<const WhileStmt&>(node);
            one(s.cond, fn);
            each(s.thenBody, fn);
            each(s.elseBody, fn);
            return;
        }
        case NodeKind::ForStmt: {
            const auto& s = static_cast<const ForStmt&>(node);
            one(s.target, fn);
            one(s.iterable, fn);
            each(s.thenBody, fn);
            each(s.elseBody, fn);
            return;
        }
        case NodeKind::TryStmt: {
            const auto& t = static_cast<const TryStmt&>(node);
            each(t.body, fn);
            each(t.handlers, fn);
            each(t.orelse, fn);
            each(t.finalbody, fn);
            return;
        }
        case NodeKind::ExceptHandler: {
            const auto& h = static_cast<const ExceptHandler&>(node);
            one(h.type, fn);
            each(h.body, fn);
            return;
        }
        case NodeKind::WithStmt: {
            const auto& w = static_cast<const WithStmt&>(node);
            for (const auto& item : w.items) {
                one(item.context, fn);
                one(item.optionalVars, fn);
            }
            each(w.body, fn);
            return;
        }
        case NodeKind::RaiseStmt: {
            const auto& r = static_cast<const RaiseStmt&>(node);
            one(r.exc, fn);
            one(r.cause, fn);
            return;
        }
        case NodeKind::AssertStmt: {
            const auto& a = static_cast<const AssertStmt&>(node);
            one(a.test, fn);
            one(a.msg, fn);
            return;
        }
        case NodeKind::DelStmt:
            each(static_cast<const DelStmt&>(node).targets, fn);
            return;
        case NodeKind::FStringLiteral:
            for (const auto& part : static_cast<const FStringLiteral&>(node).parts) { one(part.expr, fn); }
            return;
        case NodeKind::Attribute:
            one(static_cast<const Attribute&>(node).value, fn);
            return;
        case NodeKind::Subscript: {
            const auto& s = static_cast<const Subscript&>(node);
            one(s.value, fn);
            one(s.slice, fn);
            return;
        }
        case NodeKind::Slice: {
            const auto& s = static_cast<const Slice&>(node);
            one(s.lower, fn);
            one(s.upper, fn);
            one(s.step, fn);
            return;
        }
        case NodeKind::Starred:
            one(static_cast<const Starred&>(node).value, fn);
            return;
        case NodeKind::Call: {
            const auto& c = static_cast<const Call&>(node);
            one(c.callee, fn);
            each(c.args, fn);
            for (const auto& kw : c.keywords) { one(kw.value, fn); }
            return;
        }
        case NodeKind::BinaryExpr: {
            const auto& b = static_cast<const Binary&>(node);
            one(b.lhs, fn);
            one(b.rhs, fn);
            return;
        }
        case NodeKind::BoolOp:
            each(static_cast<const BoolOp&>(node).values, fn);
            return;
        case NodeKind::UnaryExpr:
            one(static_cast<const Unary&>(node).operand, fn);
            return;
        case NodeKind::Compare: {
            const auto& c = static_cast<const Compare&>(node);
            one(c.left, fn);
            each(c.comparators, fn);
            return;
        }
        case NodeKind::IfExpr: {
            // source order: body if test else orelse
            const auto& e = static_cast<const IfExpr&>(node);
            one(e.body, fn);
            one(e.test, fn);
            one(e.orelse, fn);
            return;
        }
        case NodeKind::LambdaExpr: {
            const auto& l = static_cast<const LambdaExpr&>(node);
            params(l.params, fn);
            one(l.body, fn);
            return;
        }
        case NodeKind::NamedExpr: {
            const auto& n = static_cast<const NamedExpr&>(node);
            one(n.target, fn);
            one(n.value, fn);
            return;
        }
        case NodeKind::ListLiteral:
            each(static_cast<const ListLiteral&>(node).elements, fn);
            return;
        case NodeKind::TupleLiteral:
            each(static_cast<const TupleLiteral&>(node).elements, fn);
            return;
        case NodeKind::SetLiteral:
            each(static_cast<const SetLiteral&>(node).elements, fn);
            return;
        case NodeKind::DictLiteral:
            for (const auto& [key, value] : static_cast<const DictLiteral&>(node).items) {
                one(key, fn);
                one(value, fn);
            }
            return;
        case NodeKind::ListComp: {
            const auto& c = static_cast<const ListComp&>(node);
            one(c.elt, fn);
            fors(c.fors, fn);
            return;
        }
        case NodeKind::SetComp: {
            const auto& c = static_cast<const SetComp&>(node);
            one(c.elt, fn);
            fors(c.fors, fn);
            return;
        }
        case NodeKind::DictComp: {
            const auto& c = static_cast<const DictComp&>(node);
            one(c.key, fn);
            one(c.value, fn);
            fors(c.fors, fn);
            return;
        }
        case NodeKind::GeneratorExpr: {
            const auto& c = static_cast<const GeneratorExpr&>(node);
            one(c.elt, fn);
            fors(c.fors, fn);
            return;
        }
        case NodeKind::YieldExpr:
            one(static_cast<const YieldExpr&>(node).value, fn);
            return;
        case NodeKind::AwaitExpr:
            one(static_cast<const AwaitExpr&>(node).value, fn);
            return;
        // leaves
        case NodeKind::BreakStmt:
        case NodeKind::ContinueStmt:
        case NodeKind::PassStmt:
        case NodeKind::GlobalStmt:
        case NodeKind::NonlocalStmt:
        case NodeKind::Import:
        case NodeKind::ImportFrom:
        case NodeKind::IntLiteral:
        case NodeKind::FloatLiteral:
        case NodeKind::ImagLiteral:
        case NodeKind::StringLiteral:
        case NodeKind::BytesLiteral:
        case NodeKind::BoolLiteral:
        case NodeKind::NoneLiteral:
        case NodeKind::EllipsisLiteral:
        case NodeKind::Name:
            return;
    }
}

} // namespace pyinfer::ast
