/**
 * @file
 * @brief Closed set of AST node kinds.
 */
#pragma once

namespace pyinfer::ast {
    enum class NodeKind {
        Module,
        // statements
        FunctionDef,
        ClassDef,
        ReturnStmt,
        AssignStmt,
        AnnAssignStmt,
        AugAssignStmt,
        ExprStmt,
        IfStmt,
        WhileStmt,
        ForStmt,
        BreakStmt,
        ContinueStmt,
        PassStmt,
        TryStmt,
        ExceptHandler,
        WithStmt,
        RaiseStmt,
        GlobalStmt,
        NonlocalStmt,
        AssertStmt,
        DelStmt,
        Import,
        ImportFrom,
        // constants
        IntLiteral,
        FloatLiteral,
        ImagLiteral,
        StringLiteral,
        BytesLiteral,
        BoolLiteral,
        NoneLiteral,
        EllipsisLiteral,
        FStringLiteral,
        // expressions
        Name,
        Attribute,
        Subscript,
        Slice,
        Starred,
        Call,
        BinaryExpr,
        BoolOp,
        UnaryExpr,
        Compare,
        IfExpr,
        LambdaExpr,
        NamedExpr,
        ListLiteral,
        TupleLiteral,
        SetLiteral,
        DictLiteral,
        ListComp,
        SetComp,
        DictComp,
        GeneratorExpr,
        YieldExpr,
        AwaitExpr
    };

    // Stable name for dumps, graph export and JSON reports
    const char* to_string(NodeKind kind);

} // namespace pyinfer::ast
