#pragma once
#include <memory>
#include <string>

namespace pyinfer::ast {
    struct Expr; // fwd

    enum class ParamKind {
        PositionalOnly, // before '/'
        Positional,
        VarArgs,        // *args
        KeywordOnly,    // after '*' or '*args'
        VarKeywords     // **kwargs
    };

    struct Param {
        std::string name;
        ParamKind kind{ParamKind::Positional};
        std::unique_ptr<Expr> annotation{};   // optional
        std::unique_ptr<Expr> defaultValue{}; // optional
        int line{0};
        int col{0};
    };

    const char* to_string(ParamKind kind);
} // namespace pyinfer::ast
