/***
 * Name: pyinfer::ast::dispatch
 * Purpose: Route a node to the visitor overload for its concrete type.
 * Theory of Operation:
 *   Switches over the closed NodeKind set with no default label, so adding
 *   a kind without handling it here is a -Wswitch diagnostic. Visitors
 *   supply one visit(const T&) overload per concrete node type.
 */
#pragma once

#include "ast/Nodes.h"

namespace pyinfer::ast {

// NOLINTNEXTLINE(readability-function-size)
template <typename V>
void dispatch(const Node& n, V& v) {
    switch (n.kind) {
        case NodeKind::Module: v.visit(static_cast<const Module&>(n)); return;
        case NodeKind::FunctionDef: v.visit(static_cast<const FunctionDef&>(n)); return;
        case NodeKind::ClassDef: v.visit(static_cast<const ClassDef&>(n)); return;
        case NodeKind::ReturnStmt: v.visit(static_cast<const ReturnStmt&>(n)); return;
        case NodeKind::AssignStmt: v.visit(static_cast<const AssignStmt&>(n)); return;
        case NodeKind::AnnAssignStmt: v.visit(static_cast<const AnnAssignStmt&>(n)); return;
        case NodeKind::AugAssignStmt: v.visit(static_cast<const AugAssignStmt&>(n)); return;
        case NodeKind::ExprStmt: v.visit(static_cast<const ExprStmt&>(n)); return;
        case NodeKind::IfStmt: v.visit(static_cast<const IfStmt&>(n)); return;
        case NodeKind::WhileStmt: v.visit(static_cast<const WhileStmt&>(n)); return;
        case NodeKind::ForStmt: v.visit(static_cast<const ForStmt&>(n)); return;
        case NodeKind::BreakStmt: v.visit(static_cast<const BreakStmt&>(n)); return;
        case NodeKind::ContinueStmt: v.visit(static_cast<const ContinueStmt&>(n)); return;
        case NodeKind::PassStmt: v.visit(static_cast<const PassStmt&>(n)); return;
        case NodeKind::TryStmt: v.visit(static_cast<const TryStmt&>(n)); return;
        case NodeKind::ExceptHandler: v.visit(static_cast<const ExceptHandler&>(n)); return;
        case NodeKind::WithStmt: v.visit(static_cast<const WithStmt&>(n)); return;
        case NodeKind::RaiseStmt: v.visit(static_cast<const RaiseStmt&>(n)); return;
        case NodeKind::GlobalStmt: v.visit(static_cast<const GlobalStmt&>(n)); return;
        case NodeKind::NonlocalStmt: v.visit(static_cast<const NonlocalStmt&>(n)); return;
        case NodeKind::AssertStmt: v.visit(static_cast<const AssertStmt&>(n)); return;
        case NodeKind::DelStmt: v.visit(static_cast<const DelStmt&>(n)); return;
        case NodeKind::Import: v.visit(static_cast<const Import&>(n)); return;
        case NodeKind::ImportFrom: v.visit(static_cast<const ImportFrom&>(n)); return;
        case NodeKind::IntLiteral: v.visit(static_cast<const IntLiteral&>(n)); return;
        case NodeKind::FloatLiteral: v.visit(static_cast<const FloatLiteral&>(n)); return;
        case NodeKind::ImagLiteral: v.visit(static_cast<const ImagLiteral&>(n)); return;
        case NodeKind::StringLiteral: v.visit(static_cast<const StringLiteral&>(n)); return;
        case NodeKind::BytesLiteral: v.visit(static_cast<const BytesLiteral&>(n)); return;
        case NodeKind::BoolLiteral: v.visit(static_cast<const BoolLiteral&>(n)); return;
        case NodeKind::NoneLiteral: v.visit(static_cast<const NoneLiteral&>(n)); return;
        case NodeKind::EllipsisLiteral: v.visit(static_cast<const EllipsisLiteral&>(n)); return;
        case NodeKind::FStringLiteral: v.visit(static_cast<const FStringLiteral&>(n)); return;
        case NodeKind::Name: v.visit(static_cast<const Name&>(n)); return;
        case NodeKind::Attribute: v.visit(static_cast<const Attribute&>(n)); return;
        case NodeKind::Subscript: v.visit(static_cast<const Subscript&>(n)); return;
        case NodeKind::Slice: v.visit(static_cast<const Slice&>(n)); return;
        case NodeKind::Starred: v.visit(static_cast<const Starred&>(n)); return;
        case NodeKind::Call: v.visit(static_cast<const Call&>(n)); return;
        case NodeKind::BinaryExpr: v.visit(static_cast<const Binary&>(n)); return;
        case NodeKind::BoolOp: v.visit(static_cast<const BoolOp&>(n)); return;
        case NodeKind::UnaryExpr: v.visit(static_cast<const Unary&>(n)); return;
        case NodeKind::Compare: v.visit(static_cast<const Compare&>(n)); return;
        case NodeKind::IfExpr: v.visit(static_cast<const IfExpr&>(n)); return;
        case NodeKind::LambdaExpr: v.visit(static_cast<const LambdaExpr&>(n)); return;
        case NodeKind::NamedExpr: v.visit(static_cast<const NamedExpr&>(n)); return;
        case NodeKind::ListLiteral: v.visit(static_cast<const ListLiteral&>(n)); return;
        case NodeKind::TupleLiteral: v.visit(static_cast<const TupleLiteral&>(n)); return;
        case NodeKind::SetLiteral: v.visit(static_cast<const SetLiteral&>(n)); return;
        case NodeKind::DictLiteral: v.visit(static_cast<const DictLiteral&>(n)); return;
        case NodeKind::ListComp: v.visit(static_cast<const ListComp&>(n)); return;
        case NodeKind::SetComp: v.visit(static_cast<const SetComp&>(n)); return;
        case NodeKind::DictComp: v.visit(static_cast<const DictComp&>(n)); return;
        case NodeKind::GeneratorExpr: v.visit(static_cast<const GeneratorExpr&>(n)); return;
        case NodeKind::YieldExpr: v.visit(static_cast<const YieldExpr&>(n)); return;
        case NodeKind::AwaitExpr: v.visit(static_cast<const AwaitExpr&>(n)); return;
    }
}

} // namespace pyinfer::ast
