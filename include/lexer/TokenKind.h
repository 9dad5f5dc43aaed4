/**
 * Name: pyinfer::lex::TokenKind
 * Purpose: Token kinds for the lexer.
 */
#pragma once

namespace pyinfer::lex {

enum class TokenKind {
    End, // EOF
    Newline, // end of a logical line
    Indent, // indentation increase
    Dedent, // indentation decrease

    // keywords
    Def, // def
    Return, // return
    Del, // del
    If, // if
    Else, // else
    Elif, // elif
    While, // while
    For, // for
    In, // in
    Break, // break
    Continue, // continue
    Pass, // pass
    Try, // try
    Except, // except
    Finally, // finally
    With, // with
    As, // as
    Import, // import
    From, // from
    Class, // class
    Async, // async
    Assert, // assert
    Raise, // raise
    Global, // global
    Nonlocal, // nonlocal
    Yield, // yield
    Await, // await
    Is, // is
    And, // and
    Or, // or
    Not, // not
    Lambda, // lambda
    BoolLit, // True/False
    NoneLit, // None

    // punctuation and operators
    At, // @
    AtEqual, // @=
    Arrow, // ->
    Colon, // :
    ColonEqual, // := (named expression)
    Semicolon, // ;
    Comma, // ,
    Equal, // =
    PlusEqual, // +=
    Plus, // +
    MinusEqual, // -=
    Minus, // -
    StarEqual, // *=
    Star, // *
    StarStarEqual, // **=
    StarStar, // ** (power)
    SlashEqual, // /=
    Slash, // /
    SlashSlashEqual, // //=
    SlashSlash, // // (floor-div)
    PercentEqual, // %=
    Percent, // %
    LShiftEqual, // <<=
    LShift, // <<
    RShiftEqual, // >>=
    RShift, // >>
    AmpEqual, // &=
    Amp, // &
    CaretEqual, // ^=
    Caret, // ^
    Tilde, // ~
    PipeEqual, // |=
    Pipe, // |
    EqEq, // ==
    NotEq, // !=
    Lt, // <
    Le, // <=
    Gt, // >
    Ge, // >=
    Dot, // .
    Ellipsis, // ...
    LParen, // (
    RParen, // )
    LBracket, // [
    RBracket, // ]
    LBrace, // {
    RBrace, // }

    // literals and names (text is the raw lexeme)
    Ident, // identifier (NFKC-normalized)
    Int, // integer literal
    Float, // float literal
    Imag, // imaginary numeric (e.g., 1j)
    String, // '...' "..." '''...''' with optional r/u prefix
    Bytes, // b'...'
    FString // f'...'
};

// Convert TokenKind to a stable string for diagnostics/logging
const char* to_string(TokenKind k);

} // namespace pyinfer::lex
