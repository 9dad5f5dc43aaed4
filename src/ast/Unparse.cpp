/***
 * Name: pyinfer::ast::RenderExpr (impl)
 * Purpose: Compact source rendering for annotations, decorators and bases.
 */
#include "ast/Unparse.h"
#include "ast/Nodes.h"

#include <memory>
#include <string>
#include <vector>

namespace pyinfer::ast {

namespace {
std::string join(const std::vector<std::unique_ptr<Expr>>& elems) {
    std::string out;
    for (const auto& e : elems) {
        if (!out.empty()) { out += ", "; }
        if (e) { out += RenderExpr(*e); }
    }
    return out;
}

std::string renderSliceContents(const Expr& slice) {
    if (slice.kind == NodeKind::TupleLiteral) {
        return join(static_cast<const TupleLiteral&>(slice).elements);
    }
    return RenderExpr(slice);
}

std::string optional(const std::unique_ptr<Expr>& e) { return e ? RenderExpr(*e) : std::string(); }
} // namespace

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
std::string RenderExpr(const Expr& expr) {
    switch (expr.kind) {
        case NodeKind::Name: return static_cast<const Name&>(expr).id;
        case NodeKind::Attribute: {
            const auto& a = static_cast<const Attribute&>(expr);
            return optional(a.value) + "." + a.attr;
        }
        case NodeKind::Subscript: {
            const auto& s = static_cast<const Subscript&>(expr);
            return optional(s.value) + "[" + (s.slice ? renderSliceContents(*s.slice) : std::string()) + "]";
        }
        case NodeKind::Slice: {
            const auto& s = static_cast<const Slice&>(expr);
            std::string out = optional(s.lower) + ":" + optional(s.upper);
            if (s.step) { out += ":" + RenderExpr(*s.step); }
            return out;
        }
        case NodeKind::TupleLiteral: {
            const auto& t = static_cast<const TupleLiteral&>(expr);
            if (t.elements.size() == 1) { return "(" + join(t.elements) + ",)"; }
            return "(" + join(t.elements) + ")";
        }
        case NodeKind::ListLiteral: return "[" + join(static_cast<const ListLiteral&>(expr).elements) + "]";
        case NodeKind::SetLiteral: return "{" + join(static_cast<const SetLiteral&>(expr).elements) + "}";
        case NodeKind::DictLiteral: {
            std::string out;
            for (const auto& [key, value] : static_cast<const DictLiteral&>(expr).items) {
                if (!out.empty()) { out += ", "; }
                out += key ? RenderExpr(*key) + ": " + optional(value) : "**" + optional(value);
            }
            return "{" + out + "}";
        }
        case NodeKind::BinaryExpr: {
            const auto& b = static_cast<const Binary&>(expr);
            return optional(b.lhs) + " " + to_string(b.op) + " " + optional(b.rhs);
        }
        case NodeKind::BoolOp: {
            const auto& b = static_cast<const BoolOp&>(expr);
            std::string out;
            for (const auto& v : b.values) {
                if (!out.empty()) { out += std::string(" ") + to_string(b.op) + " "; }
                out += optional(v);
            }
            return out;
        }
        case NodeKind::UnaryExpr: {
            const auto& u = static_cast<const Unary&>(expr);
            const std::string op = to_string(u.op);
            return (u.op == UnaryOperator::Not ? op + " " : op) + optional(u.operand);
        }
        case NodeKind::Compare: {
            const auto& c = static_cast<const Compare&>(expr);
            std::string out = optional(c.left);
            for (size_t i = 0; i < c.ops.size() && i < c.comparators.size(); ++i) {
                out += std::string(" ") + to_string(c.ops[i]) + " " + optional(c.comparators[i]);
            }
            return out;
        }
        case NodeKind::Call: {
            const auto& c = static_cast<const Call&>(expr);
            std::string args = join(c.args);
            for (const auto& kw : c.keywords) {
                if (!args.empty()) { args += ", "; }
                args += kw.name.empty() ? "**" + optional(kw.value) : kw.name + "=" + optional(kw.value);
            }
            return optional(c.callee) + "(" + args + ")";
        }
        case NodeKind::Starred: return "*" + optional(static_cast<const Starred&>(expr).value);
        case NodeKind::IntLiteral: return static_cast<const IntLiteral&>(expr).value;
        case NodeKind::FloatLiteral: return static_cast<const FloatLiteral&>(expr).value;
        case NodeKind::ImagLiteral: return static_cast<const ImagLiteral&>(expr).value;
        case NodeKind::StringLiteral: return static_cast<const StringLiteral&>(expr).value;
        case NodeKind::BytesLiteral: return "b'" + static_cast<const BytesLiteral&>(expr).value + "'";
        case NodeKind::BoolLiteral: return static_cast<const BoolLiteral&>(expr).value ? "True" : "False";
        case NodeKind::NoneLiteral: return "None";
        case NodeKind::EllipsisLiteral: return "...";
        case NodeKind::AwaitExpr: return "await " + optional(static_cast<const AwaitExpr&>(expr).value);
        default: return "...";
    }
}

std::string DottedName(const Expr& expr) {
    switch (expr.kind) {
        case NodeKind::Name: return static_cast<const Name&>(expr).id;
        case NodeKind::Attribute: {
            const auto& a = static_cast<const Attribute&>(expr);
            return (a.value ? DottedName(*a.value) : std::string()) + "." + a.attr;
        }
        case NodeKind::Call: {
            const auto& c = static_cast<const Call&>(expr);
            return c.callee ? DottedName(*c.callee) : std::string();
        }
        default: return RenderExpr(expr);
    }
}

} // namespace pyinfer::ast
