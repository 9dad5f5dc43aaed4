/***
 * Name: pyinfer::ast operator/context names
 * Purpose: Source spellings for operators and names for contexts/param kinds.
 */
#include "ast/BinaryOperator.h"
#include "ast/ExprContext.h"
#include "ast/Param.h"
#include "ast/UnaryOperator.h"

namespace pyinfer::ast {

const char* to_string(const BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Add: return "+";
        case BinaryOperator::Sub: return "-";
        case BinaryOperator::Mul: return "*";
        case BinaryOperator::MatMul: return "@";
        case BinaryOperator::Div: return "/";
        case BinaryOperator::Mod: return "%";
        case BinaryOperator::FloorDiv: return "//";
        case BinaryOperator::Pow: return "**";
        case BinaryOperator::LShift: return "<<";
        case BinaryOperator::RShift: return ">>";
        case BinaryOperator::BitAnd: return "&";
        case BinaryOperator::BitOr: return "|";
        case BinaryOperator::BitXor: return "^";
        case BinaryOperator::Eq: return "==";
        case BinaryOperator::Ne: return "!=";
        case BinaryOperator::Lt: return "<";
        case BinaryOperator::Le: return "<=";
        case BinaryOperator::Gt: return ">";
        case BinaryOperator::Ge: return ">=";
        case BinaryOperator::Is: return "is";
        case BinaryOperator::IsNot: return "is not";
        case BinaryOperator::In: return "in";
        case BinaryOperator::NotIn: return "not in";
        case BinaryOperator::And: return "and";
        case BinaryOperator::Or: return "or";
    }
    return "?";
}

const char* to_string(const UnaryOperator op) {
    switch (op) {
        case UnaryOperator::Neg: return "-";
        case UnaryOperator::Pos: return "+";
        case UnaryOperator::Not: return "not";
        case UnaryOperator::BitNot: return "~";
    }
    return "?";
}

const char* to_string(const ExprContext ctx) {
    switch (ctx) {
        case ExprContext::Load: return "load";
        case ExprContext::Store: return "store";
        case ExprContext::Del: return "del";
    }
    return "load";
}

const char* to_string(const ParamKind kind) {
    switch (kind) {
        case ParamKind::PositionalOnly: return "positional_only";
        case ParamKind::Positional: return "positional";
        case ParamKind::VarArgs: return "var_args";
        case ParamKind::KeywordOnly: return "keyword_only";
        case ParamKind::VarKeywords: return "var_keywords";
    }
    return "positional";
}

} // namespace pyinfer::ast
