#pragma once

namespace pyinfer::ast {
enum class BinaryOperator {
    Add,
    Sub,
    Mul,
    MatMul,
    Div,
    Mod,
    FloorDiv,
    Pow,
    LShift,
    RShift,
    BitAnd,
    BitOr,
    BitXor,
    // comparison operators (Compare nodes only)
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    Is,
    IsNot,
    In,
    NotIn,
    // boolean operators (BoolOp nodes only)
    And,
    Or
};

// Source spelling, e.g. "+", "not in", "and"
const char* to_string(BinaryOperator op);
} // namespace pyinfer::ast
