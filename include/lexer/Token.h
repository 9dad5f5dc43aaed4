/**
 * Name: pyinfer::lex::Token
 * Purpose: Token structure with source location and text.
 */
#pragma once

#include <string>
#include "lexer/TokenKind.h"

namespace pyinfer::lex {

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // raw lexeme; identifiers are NFKC-normalized
    std::string file{};
    int line{1}; // 1-based line number
    int col{1}; // 1-based byte column at token start
};

} // namespace pyinfer::lex
