/**
 * Name: pyinfer::lex::Lexer
 * Purpose: Tokenize one source buffer into an indentation-aware token stream.
 * Theory of Operation:
 *   The whole buffer is scanned eagerly on first access. Logical lines end
 *   with a Newline token; blank/comment-only lines and lines joined by an
 *   open bracket or a trailing backslash produce none. Indentation changes
 *   are reported as Indent/Dedent. Lexical errors throw ParseError.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "lexer/ITokenStream.h"

namespace pyinfer::lex {

class Lexer : public ITokenStream {
public:
    // Deepest bracket nesting and indentation accepted
    static constexpr int kMaxParenDepth = 200;
    static constexpr std::size_t kMaxIndentLevels = 100;

    Lexer() = default;

    // Read a file from disk; throws FileReadError when it cannot be read.
    void pushFile(const std::string& path);

    void pushString(const std::string& text, const std::string& name);

    // Lex an embedded expression (an f-string replacement field) whose first
    // character sits at line/col of the enclosing file. Newlines never end a
    // logical line and indentation is not tracked.
    void pushExpression(const std::string& text, const std::string& name, int line, int col);

    // ITokenStream
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    std::vector<Token> tokens();

    // One line per token: "<line>:<col> <KIND> <text>"
    std::string renderTokenLog();

private:
    bool finalized_{false};
    std::vector<Token> tokens_{};
    size_t pos_{0};

    std::string src_{};
    std::string name_{};
    size_t index_{0};
    size_t lineStart_{0};
    int lineNo_{1};
    int firstLine_{1};
    int firstLineColOffset_{0};
    int parenDepth_{0};
    bool atLineStart_{true};
    std::vector<int> indentStack_{0};

    void buildAll();
    bool handleIndentation(); // returns true when the whole line was blank/comment
    void scanToken();
    void scanName();
    void scanNumber();
    void scanString(size_t start, bool isBytes, bool isFString);
    bool scanOperator();
    void emitNewline();
    void emit(TokenKind kind, size_t start, size_t endExclusive, int line, int col);
    void consumeLineBreak();
    [[noreturn]] void fail(const std::string& msg, int line, int col) const;
    int colAt(size_t index) const;
    char at(size_t index) const { return index < src_.size() ? src_[index] : '\0'; }
};

} // namespace pyinfer::lex
