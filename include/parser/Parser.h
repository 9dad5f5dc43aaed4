/***
 * Name: pyinfer::parse::Parser
 * Purpose: Build a complete syntax tree for one module from a token stream.
 * Inputs:
 *   - Token stream from Lexer (pull-based)
 * Outputs:
 *   - Module AST; every node carries its 1-based line and 0-based column.
 * Theory of Operation:
 *   Recursive descent over the whole token buffer. Statements follow
 *     file       := { NEWLINE | statement } END
 *     statement  := compound_stmt | simple_stmt { ';' simple_stmt } NEWLINE
 *     suite      := ':' ( simple_stmts | NEWLINE INDENT { statement } DEDENT )
 *   and expressions follow the usual precedence ladder from lambda and
 *   conditional expressions down to await/primary/atom. String literals are
 *   decoded here; f-string replacement fields are re-lexed and parsed as
 *   expressions positioned inside the enclosing file. The first syntax error
 *   throws ParseError carrying the offending token's position.
 *   Every expression level and every link of an operator or postfix chain
 *   counts toward kMaxNesting, which bounds the depth of the built tree.
 */
#pragma once

#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pyinfer::parse {

class Parser {
 public:
  static constexpr int kMaxNesting = 1000;

  explicit Parser(lex::ITokenStream& stream) : ts_(stream) {}
  std::unique_ptr<ast::Module> parseModule();

  // Parse a standalone expression whose first character is at line/col (1-based).
  static std::unique_ptr<ast::Expr> parseExprFromString(const std::string& text, const std::string& name,
                                                        int line, int col);

 private:
  using StmtList = std::vector<std::unique_ptr<ast::Stmt>>;

  lex::ITokenStream& ts_;
  std::vector<lex::Token> tokens_;
  size_t pos_{0};
  bool initialized_{false};
  int nesting_{0};

  class NestingScope;

  void initBuffer();
  const lex::Token& peek() const;
  const lex::Token& peekNext() const;
  lex::Token get();
  bool match(lex::TokenKind tokenKind);
  lex::Token expect(lex::TokenKind tokenKind, const char* what);
  [[noreturn]] void fail(const lex::Token& tok, const std::string& msg) const;
  static bool startsExpression(lex::TokenKind kind);

  // statements
  void parseStatementInto(StmtList& out);
  void parseSimpleStmtsInto(StmtList& out);
  void parseSuiteInto(StmtList& out);
  std::unique_ptr<ast::Stmt> parseSmallStmt();
  std::unique_ptr<ast::Stmt> parseExprOrAssignStmt();
  std::unique_ptr<ast::FunctionDef> parseFunction(const lex::Token& startTok, bool isAsync);
  std::unique_ptr<ast::ClassDef> parseClass(const lex::Token& startTok);
  void parseParamList(std::vector<ast::Param>& outParams, lex::TokenKind closing, bool allowAnnotations);
  std::vector<std::unique_ptr<ast::Expr>> parseDecorators();
  std::unique_ptr<ast::Stmt> parseIfStmt(const lex::Token& startTok);
  std::unique_ptr<ast::Stmt> parseWhileStmt(const lex::Token& startTok);
  std::unique_ptr<ast::Stmt> parseForStmt(const lex::Token& startTok, bool isAsync);
  std::unique_ptr<ast::Stmt> parseTryStmt(const lex::Token& startTok);
  std::unique_ptr<ast::Stmt> parseWithStmt(const lex::Token& startTok, bool isAsync);
  bool tryParseParenthesizedWithItems(std::vector<ast::WithItem>& items);
  ast::WithItem parseWithItem();
  std::unique_ptr<ast::Stmt> parseImportStmt(const lex::Token& startTok);
  std::unique_ptr<ast::Stmt> parseFromImportStmt(const lex::Token& startTok);
  std::string parseDottedName();
  std::unique_ptr<ast::Stmt> parseRaiseStmt(const lex::Token& startTok);
  std::unique_ptr<ast::Stmt> parseGlobalStmt(const lex::Token& startTok);
  std::unique_ptr<ast::Stmt> parseNonlocalStmt(const lex::Token& startTok);
  std::unique_ptr<ast::Stmt> parseAssertStmt(const lex::Token& startTok);
  std::unique_ptr<ast::Stmt> parseDelStmt(const lex::Token& startTok);
  std::vector<std::string> parseNameList();

  // expressions
  std::unique_ptr<ast::Expr> parseStarExprList();
  std::unique_ptr<ast::Expr> parseStarExpr();
  std::unique_ptr<ast::Expr> parseAssignValue();
  std::unique_ptr<ast::Expr> parseYield();
  std::unique_ptr<ast::Expr> parseNamedExpr();
  std::unique_ptr<ast::Expr> parseExpr();
  std::unique_ptr<ast::Expr> parseLambda();
  std::unique_ptr<ast::Expr> parseLogicalOr();
  std::unique_ptr<ast::Expr> parseLogicalAnd();
  std::unique_ptr<ast::Expr> parseLogicalNot();
  std::unique_ptr<ast::Expr> parseComparison();
  std::unique_ptr<ast::Expr> parseBitwiseOr();
  std::unique_ptr<ast::Expr> parseBitwiseXor();
  std::unique_ptr<ast::Expr> parseBitwiseAnd();
  std::unique_ptr<ast::Expr> parseShift();
  std::unique_ptr<ast::Expr> parseAdditive();
  std::unique_ptr<ast::Expr> parseMultiplicative();
  std::unique_ptr<ast::Expr> parseUnary();
  std::unique_ptr<ast::Expr> parsePower();
  std::unique_ptr<ast::Expr> parsePrimary();
  std::unique_ptr<ast::Expr> parsePostfix(std::unique_ptr<ast::Expr> base);
  std::unique_ptr<ast::Expr> parseAtom();
  std::unique_ptr<ast::Expr> parseTupleOrParen(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseListLiteral(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseDictOrSetLiteral(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseSubscriptSlice();
  std::unique_ptr<ast::Expr> parseSliceItem();
  std::unique_ptr<ast::Expr> parseTargetList();
  std::unique_ptr<ast::Expr> parseTarget();
  std::vector<ast::ComprehensionFor> parseComprehensionFors();
  bool atComprehensionFor() const;
  void parseArgList(ast::Call& call);
  std::unique_ptr<ast::Expr> parseStrings();
  void parseFStringInto(const lex::Token& tok, ast::FStringLiteral& out);

  // String helpers
  static std::string unquoteString(const std::string& text, std::string& prefix, size_t& bodyOffset);
  static std::string decodeEscapes(const std::string& body, bool isBytes);

  // Set ExprContext recursively on assignment/del targets
  static void setTargetContext(ast::Expr* e, ast::ExprContext ctx);

  // Validate whether an expression is a legal assignment target
  static bool isValidAssignmentTarget(const ast::Expr* e);
};

} // namespace pyinfer::parse
