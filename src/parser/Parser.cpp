/***
 * Name: pyinfer::parse::Parser (statements)
 * Purpose: Token buffer helpers and statement-level recursive descent.
 */
#include "parser/Parser.h"
#include "parser/ParserInternals.h"
#include "pyinfer/exceptions/parse_error.h"

#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace pyinfer::parse {

using TK = lex::TokenKind;
using detail::stamp;

namespace {
bool augAssignOperator(const TK kind, ast::BinaryOperator& op) {
  using BO = ast::BinaryOperator;
  switch (kind) {
    case TK::PlusEqual: op = BO::Add; return true;
    case TK::MinusEqual: op = BO::Sub; return true;
    case TK::StarEqual: op = BO::Mul; return true;
    case TK::AtEqual: op = BO::MatMul; return true;
    case TK::SlashEqual: op = BO::Div; return true;
    case TK::PercentEqual: op = BO::Mod; return true;
    case TK::SlashSlashEqual: op = BO::FloorDiv; return true;
    case TK::StarStarEqual: op = BO::Pow; return true;
    case TK::LShiftEqual: op = BO::LShift; return true;
    case TK::RShiftEqual: op = BO::RShift; return true;
    case TK::AmpEqual: op = BO::BitAnd; return true;
    case TK::PipeEqual: op = BO::BitOr; return true;
    case TK::CaretEqual: op = BO::BitXor; return true;
    default: return false;
  }
}
} // namespace

void Parser::initBuffer() {
  if (initialized_) return;
  // Take the full token stream when backed by Lexer; otherwise drain it.
  if (auto* lx = dynamic_cast<lex::Lexer*>(&ts_)) {
    tokens_ = lx->tokens();
  } else {
    tokens_.clear();
    for (;;) {
      auto t = ts_.next();
      tokens_.push_back(t);
      if (t.kind == TK::End) break;
    }
  }
  if (tokens_.empty()) { tokens_.emplace_back(); }
  pos_ = 0;
  initialized_ = true;
}

const lex::Token& Parser::peek() const {
  // Safe in presence of End sentry
  return tokens_[pos_ < tokens_.size() ? pos_ : (tokens_.size() - 1)];
}
const lex::Token& Parser::peekNext() const {
  const size_t idx = pos_ + 1;
  return tokens_[idx < tokens_.size() ? idx : (tokens_.size() - 1)];
}
lex::Token Parser::get() {
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

bool Parser::match(TK tokenKind) {
  if (peek().kind == tokenKind) { (void)get(); return true; }
  return false;
}

lex::Token Parser::expect(TK tokenKind, const char* what) {
  if (peek().kind != tokenKind) {
    const auto& got = peek();
    std::string m = "expected ";
    m += what;
    m += ", got ";
    m += to_string(got.kind);
    m += " '";
    m += got.text;
    m += "'";
    fail(got, m);
  }
  return get();
}

void Parser::fail(const lex::Token& tok, const std::string& msg) const {
  std::ostringstream oss;
  oss << tok.file << ":" << tok.line << ":" << tok.col << ": " << msg;
  throw exceptions::ParseError(oss.str(), tok.line, tok.col);
}

bool Parser::startsExpression(const TK kind) {
  switch (kind) {
    case TK::Ident: case TK::Int: case TK::Float: case TK::Imag:
    case TK::String: case TK::Bytes: case TK::FString:
    case TK::BoolLit: case TK::NoneLit: case TK::Ellipsis:
    case TK::LParen: case TK::LBracket: case TK::LBrace:
    case TK::Minus: case TK::Plus: case TK::Tilde: case TK::Not:
    case TK::Lambda: case TK::Await: case TK::Star:
      return true;
    default:
      return false;
  }
}

std::unique_ptr<ast::Module> Parser::parseModule() {
  initBuffer();
  auto mod = std::make_unique<ast::Module>();
  mod->line = 1; mod->col = 0;
  while (peek().kind != TK::End) {
    if (peek().kind == TK::Newline) { get(); continue; }
    parseStatementInto(mod->body);
  }
  return mod;
}

// NOLINTNEXTLINE(readability-function-size)
void Parser::parseStatementInto(StmtList& out) {
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::At: {
      auto decorators = parseDecorators();
      const lex::Token start = peek();
      if (match(TK::Def)) {
        auto fn = parseFunction(start, false);
        fn->decorators = std::move(decorators);
        out.emplace_back(std::move(fn));
      } else if (start.kind == TK::Async && peekNext().kind == TK::Def) {
        get(); get();
        auto fn = parseFunction(start, true);
        fn->decorators = std::move(decorators);
        out.emplace_back(std::move(fn));
      } else if (match(TK::Class)) {
        auto cls = parseClass(start);
        cls->decorators = std::move(decorators);
        out.emplace_back(std::move(cls));
      } else {
        fail(start, "expected 'def' or 'class' after decorator");
      }
      return;
    }
    case TK::Def: get(); out.emplace_back(parseFunction(tok, false)); return;
    case TK::Class: get(); out.emplace_back(parseClass(tok)); return;
    case TK::If: get(); out.emplace_back(parseIfStmt(tok)); return;
    case TK::While: get(); out.emplace_back(parseWhileStmt(tok)); return;
    case TK::For: get(); out.emplace_back(parseForStmt(tok, false)); return;
    case TK::Try: get(); out.emplace_back(parseTryStmt(tok)); return;
    case TK::With: get(); out.emplace_back(parseWithStmt(tok, false)); return;
    case TK::Async: {
      get();
      if (match(TK::Def)) { out.emplace_back(parseFunction(tok, true)); return; }
      if (match(TK::For)) { out.emplace_back(parseForStmt(tok, true)); return; }
      if (match(TK::With)) { out.emplace_back(parseWithStmt(tok, true)); return; }
      fail(peek(), "expected 'def', 'for' or 'with' after 'async'");
    }
    case TK::Indent: fail(tok, "unexpected indent");
    default: parseSimpleStmtsInto(out); return;
  }
}

void Parser::parseSimpleStmtsInto(StmtList& out) {
  for (;;) {
    out.emplace_back(parseSmallStmt());
    if (!match(TK::Semicolon)) break;
    if (peek().kind == TK::Newline || peek().kind == TK::End) break;
  }
  if (peek().kind != TK::End) { expect(TK::Newline, "newline"); }
}

void Parser::parseSuiteInto(StmtList& out) {
  expect(TK::Colon, "':'");
  if (!match(TK::Newline)) {
    // simple statements on the same line as the header
    parseSimpleStmtsInto(out);
    return;
  }
  expect(TK::Indent, "an indented block");
  while (peek().kind != TK::Dedent) {
    if (peek().kind == TK::End) { fail(peek(), "unexpected end of file in block"); }
    parseStatementInto(out);
  }
  get();
}

// NOLINTNEXTLINE(readability-function-size)
std::unique_ptr<ast::Stmt> Parser::parseSmallStmt() {
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Pass: { get(); auto s = std::make_unique<ast::PassStmt>(); stamp(*s, tok); return s; }
    case TK::Break: { get(); auto s = std::make_unique<ast::BreakStmt>(); stamp(*s, tok); return s; }
    case TK::Continue: { get(); auto s = std::make_unique<ast::ContinueStmt>(); stamp(*s, tok); return s; }
    case TK::Return: {
      get();
      std::unique_ptr<ast::Expr> value;
      if (startsExpression(peek().kind)) { value = parseStarExprList(); }
      auto s = std::make_unique<ast::ReturnStmt>(std::move(value));
      stamp(*s, tok);
      return s;
    }
    case TK::Raise: get(); return parseRaiseStmt(tok);
    case TK::Global: get(); return parseGlobalStmt(tok);
    case TK::Nonlocal: get(); return parseNonlocalStmt(tok);
    case TK::Assert: get(); return parseAssertStmt(tok);
    case TK::Del: get(); return parseDelStmt(tok);
    case TK::Import: get(); return parseImportStmt(tok);
    case TK::From: get(); return parseFromImportStmt(tok);
    default: return parseExprOrAssignStmt();
  }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseExprOrAssignStmt() {
  const lex::Token startTok = peek();
  std::unique_ptr<ast::Expr> first = peek().kind == TK::Yield ? parseYield() : parseStarExprList();

  if (peek().kind == TK::Colon) {
    const lex::Token colonTok = get();
    const auto k = first->kind;
    if (k != ast::NodeKind::Name && k != ast::NodeKind::Attribute && k != ast::NodeKind::Subscript) {
      fail(colonTok, "only single target (not tuple) can be annotated");
    }
    auto stmt = std::make_unique<ast::AnnAssignStmt>();
    stmt->simple = (k == ast::NodeKind::Name && startTok.kind == TK::Ident);
    setTargetContext(first.get(), ast::ExprContext::Store);
    stmt->target = std::move(first);
    stmt->annotation = parseExpr();
    if (match(TK::Equal)) { stmt->value = parseAssignValue(); }
    stamp(*stmt, startTok);
    return stmt;
  }

  ast::BinaryOperator augOp{};
  if (augAssignOperator(peek().kind, augOp)) {
    const lex::Token opTok = get();
    const auto k = first->kind;
    if (k != ast::NodeKind::Name && k != ast::NodeKind::Attribute && k != ast::NodeKind::Subscript) {
      fail(opTok, "illegal expression for augmented assignment");
    }
    setTargetContext(first.get(), ast::ExprContext::Store);
    auto stmt = std::make_unique<ast::AugAssignStmt>(std::move(first), augOp, parseAssignValue());
    stamp(*stmt, startTok);
    return stmt;
  }

  if (peek().kind == TK::Equal) {
    std::vector<std::unique_ptr<ast::Expr>> chain;
    chain.emplace_back(std::move(first));
    while (match(TK::Equal)) { chain.emplace_back(parseAssignValue()); }
    auto stmt = std::make_unique<ast::AssignStmt>();
    stmt->value = std::move(chain.back());
    chain.pop_back();
    for (auto& target : chain) {
      if (!isValidAssignmentTarget(target.get())) {
        fail(startTok, std::string("cannot assign to ") + ast::to_string(target->kind));
      }
      setTargetContext(target.get(), ast::ExprContext::Store);
      stmt->targets.emplace_back(std::move(target));
    }
    stamp(*stmt, startTok);
    return stmt;
  }

  auto stmt = std::make_unique<ast::ExprStmt>(std::move(first));
  stamp(*stmt, startTok);
  return stmt;
}

std::unique_ptr<ast::FunctionDef> Parser::parseFunction(const lex::Token& startTok, const bool isAsync) {
  const auto nameTok = expect(TK::Ident, "function name");
  auto fn = std::make_unique<ast::FunctionDef>(nameTok.text);
  fn->isAsync = isAsync;
  stamp(*fn, startTok);
  expect(TK::LParen, "'('");
  parseParamList(fn->params, TK::RParen, true);
  expect(TK::RParen, "')'");
  if (match(TK::Arrow)) { fn->returns = parseExpr(); }
  parseSuiteInto(fn->body);
  return fn;
}

std::unique_ptr<ast::ClassDef> Parser::parseClass(const lex::Token& startTok) {
  const auto nameTok = expect(TK::Ident, "class name");
  auto cls = std::make_unique<ast::ClassDef>(nameTok.text);
  stamp(*cls, startTok);
  if (match(TK::LParen)) {
    // Reuse call-argument parsing: positional arguments are bases.
    ast::Call args(nullptr);
    parseArgList(args);
    cls->bases = std::move(args.args);
    cls->keywords = std::move(args.keywords);
  }
  parseSuiteInto(cls->body);
  return cls;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::parseParamList(std::vector<ast::Param>& outParams, const TK closing, const bool allowAnnotations) {
  bool keywordOnly = false;
  auto parseOne = [&](const ast::ParamKind kind) {
    const auto nameTok = expect(TK::Ident, "parameter name");
    ast::Param param;
    param.name = nameTok.text;
    param.kind = kind;
    param.line = nameTok.line;
    param.col = nameTok.col - 1;
    if (allowAnnotations && match(TK::Colon)) { param.annotation = parseExpr(); }
    const bool takesDefault = kind == ast::ParamKind::Positional || kind == ast::ParamKind::KeywordOnly;
    if (takesDefault && match(TK::Equal)) { param.defaultValue = parseExpr(); }
    outParams.emplace_back(std::move(param));
  };
  while (peek().kind != closing) {
    if (peek().kind == TK::Slash) {
      const auto slashTok = get();
      if (outParams.empty() || keywordOnly) { fail(slashTok, "'/' must follow at least one positional parameter"); }
      for (auto& param : outParams) { param.kind = ast::ParamKind::PositionalOnly; }
    } else if (match(TK::StarStar)) {
      parseOne(ast::ParamKind::VarKeywords);
    } else if (match(TK::Star)) {
      keywordOnly = true;
      if (peek().kind == TK::Ident) { parseOne(ast::ParamKind::VarArgs); }
    } else {
      parseOne(keywordOnly ? ast::ParamKind::KeywordOnly : ast::ParamKind::Positional);
    }
    if (!match(TK::Comma)) break;
  }
}

// Collect decorators: a sequence of '@' expr NEWLINE
std::vector<std::unique_ptr<ast::Expr>> Parser::parseDecorators() {
  std::vector<std::unique_ptr<ast::Expr>> decs;
  while (match(TK::At)) {
    decs.emplace_back(parseNamedExpr());
    expect(TK::Newline, "newline after decorator");
  }
  return decs;
}

std::unique_ptr<ast::Stmt> Parser::parseIfStmt(const lex::Token& startTok) {
  auto ifs = std::make_unique<ast::IfStmt>(parseNamedExpr());
  stamp(*ifs, startTok);
  parseSuiteInto(ifs->thenBody);
  // elif chain as nested IfStmt in else
  if (peek().kind == TK::Elif) {
    const auto elifTok = get();
    ifs->elseBody.emplace_back(parseIfStmt(elifTok));
  } else if (match(TK::Else)) {
    parseSuiteInto(ifs->elseBody);
  }
  return ifs;
}

std::unique_ptr<ast::Stmt> Parser::parseWhileStmt(const lex::Token& startTok) {
  auto loop = std::make_unique<ast::WhileStmt>(parseNamedExpr());
  stamp(*loop, startTok);
  parseSuiteInto(loop->thenBody);
  if (match(TK::Else)) { parseSuiteInto(loop->elseBody); }
  return loop;
}

std::unique_ptr<ast::Stmt> Parser::parseForStmt(const lex::Token& startTok, const bool isAsync) {
  const auto targetTok = peek();
  auto target = parseTargetList();
  if (!isValidAssignmentTarget(target.get())) { fail(targetTok, "invalid 'for' target"); }
  setTargetContext(target.get(), ast::ExprContext::Store);
  expect(TK::In, "'in'");
  auto iterable = parseStarExprList();
  auto loop = std::make_unique<ast::ForStmt>(std::move(target), std::move(iterable));
  loop->isAsync = isAsync;
  stamp(*loop, startTok);
  parseSuiteInto(loop->thenBody);
  if (match(TK::Else)) { parseSuiteInto(loop->elseBody); }
  return loop;
}

std::unique_ptr<ast::Stmt> Parser::parseTryStmt(const lex::Token& startTok) {
  auto stmt = std::make_unique<ast::TryStmt>();
  stamp(*stmt, startTok);
  parseSuiteInto(stmt->body);
  while (peek().kind == TK::Except) {
    const auto exceptTok = get();
    (void)match(TK::Star); // except* groups handle like except
    auto handler = std::make_unique<ast::ExceptHandler>();
    stamp(*handler, exceptTok);
    if (peek().kind != TK::Colon) {
      handler->type = parseExpr();
      if (match(TK::As)) { handler->name = expect(TK::Ident, "exception name").text; }
    }
    parseSuiteInto(handler->body);
    stmt->handlers.emplace_back(std::move(handler));
  }
  if (!stmt->handlers.empty() && match(TK::Else)) { parseSuiteInto(stmt->orelse); }
  if (match(TK::Finally)) { parseSuiteInto(stmt->finalbody); }
  if (stmt->handlers.empty() && stmt->finalbody.empty()) {
    fail(peek(), "expected 'except' or 'finally' block");
  }
  return stmt;
}

ast::WithItem Parser::parseWithItem() {
  ast::WithItem item;
  item.context = parseExpr();
  if (match(TK::As)) {
    const auto targetTok = peek();
    item.optionalVars = parseTarget();
    if (!isValidAssignmentTarget(item.optionalVars.get())) { fail(targetTok, "invalid 'with' target"); }
    setTargetContext(item.optionalVars.get(), ast::ExprContext::Store);
  }
  return item;
}

// with (a as b, c as d): ... ; backtracks when the parentheses belong to an expression
bool Parser::tryParseParenthesizedWithItems(std::vector<ast::WithItem>& items) {
  const size_t saved = pos_;
  try {
    get(); // '('
    while (peek().kind != TK::RParen) {
      items.emplace_back(parseWithItem());
      if (!match(TK::Comma)) break;
    }
    expect(TK::RParen, "')'");
    if (peek().kind == TK::Colon) { return true; }
  } catch (const exceptions::ParseError&) {
    // not the parenthesized form; reparse below as a plain expression
  }
  pos_ = saved;
  items.clear();
  return false;
}

std::unique_ptr<ast::Stmt> Parser::parseWithStmt(const lex::Token& startTok, const bool isAsync) {
  auto stmt = std::make_unique<ast::WithStmt>();
  stmt->isAsync = isAsync;
  stamp(*stmt, startTok);
  if (peek().kind != TK::LParen || !tryParseParenthesizedWithItems(stmt->items)) {
    do {
      stmt->items.emplace_back(parseWithItem());
    } while (match(TK::Comma));
  }
  parseSuiteInto(stmt->body);
  return stmt;
}

std::string Parser::parseDottedName() {
  std::string dotted = expect(TK::Ident, "module name").text;
  while (match(TK::Dot)) {
    dotted += ".";
    dotted += expect(TK::Ident, "name after '.'").text;
  }
  return dotted;
}

std::unique_ptr<ast::Stmt> Parser::parseImportStmt(const lex::Token& startTok) {
  auto imp = std::make_unique<ast::Import>();
  stamp(*imp, startTok);
  do {
    const auto nameTok = peek();
    ast::Alias alias;
    alias.name = parseDottedName();
    alias.line = nameTok.line;
    alias.col = nameTok.col - 1;
    if (match(TK::As)) { alias.asname = expect(TK::Ident, "alias name").text; }
    imp->names.emplace_back(std::move(alias));
  } while (match(TK::Comma));
  return imp;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseFromImportStmt(const lex::Token& startTok) {
  auto imp = std::make_unique<ast::ImportFrom>();
  stamp(*imp, startTok);
  for (;;) {
    if (match(TK::Dot)) { imp->level += 1; continue; }
    if (match(TK::Ellipsis)) { imp->level += 3; continue; }
    break;
  }
  if (peek().kind == TK::Ident) { imp->module = parseDottedName(); }
  if (imp->level == 0 && imp->module.empty()) { fail(peek(), "expected module name after 'from'"); }
  expect(TK::Import, "'import'");
  if (peek().kind == TK::Star) {
    const auto starTok = get();
    ast::Alias alias;
    alias.name = "*";
    alias.line = starTok.line;
    alias.col = starTok.col - 1;
    imp->names.emplace_back(std::move(alias));
    return imp;
  }
  const bool parenthesized = match(TK::LParen);
  for (;;) {
    const auto nameTok = expect(TK::Ident, "imported name");
    ast::Alias alias;
    alias.name = nameTok.text;
    alias.line = nameTok.line;
    alias.col = nameTok.col - 1;
    if (match(TK::As)) { alias.asname = expect(TK::Ident, "alias name").text; }
    imp->names.emplace_back(std::move(alias));
    if (!match(TK::Comma)) break;
    if (parenthesized && peek().kind == TK::RParen) break;
  }
  if (parenthesized) { expect(TK::RParen, "')'"); }
  return imp;
}

std::unique_ptr<ast::Stmt> Parser::parseRaiseStmt(const lex::Token& startTok) {
  auto stmt = std::make_unique<ast::RaiseStmt>();
  stamp(*stmt, startTok);
  if (startsExpression(peek().kind)) {
    stmt->exc = parseExpr();
    if (match(TK::From)) { stmt->cause = parseExpr(); }
  }
  return stmt;
}

std::vector<std::string> Parser::parseNameList() {
  std::vector<std::string> names;
  do {
    names.push_back(expect(TK::Ident, "name").text);
  } while (match(TK::Comma));
  return names;
}

std::unique_ptr<ast::Stmt> Parser::parseGlobalStmt(const lex::Token& startTok) {
  auto stmt = std::make_unique<ast::GlobalStmt>();
  stamp(*stmt, startTok);
  stmt->names = parseNameList();
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseNonlocalStmt(const lex::Token& startTok) {
  auto stmt = std::make_unique<ast::NonlocalStmt>();
  stamp(*stmt, startTok);
  stmt->names = parseNameList();
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseAssertStmt(const lex::Token& startTok) {
  auto stmt = std::make_unique<ast::AssertStmt>();
  stamp(*stmt, startTok);
  stmt->test = parseExpr();
  if (match(TK::Comma)) { stmt->msg = parseExpr(); }
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseDelStmt(const lex::Token& startTok) {
  auto stmt = std::make_unique<ast::DelStmt>();
  stamp(*stmt, startTok);
  do {
    if (!startsExpression(peek().kind)) break;
    const auto targetTok = peek();
    auto target = parseBitwiseOr();
    if (!isValidAssignmentTarget(target.get())) { fail(targetTok, "cannot delete expression"); }
    setTargetContext(target.get(), ast::ExprContext::Del);
    stmt->targets.emplace_back(std::move(target));
  } while (match(TK::Comma));
  if (stmt->targets.empty()) { fail(peek(), "expected target after 'del'"); }
  return stmt;
}

// Recursively set ExprContext on valid assignment/delete targets
void Parser::setTargetContext(ast::Expr* e, const ast::ExprContext ctx) {
  if (e == nullptr) return;
  using NK = ast::NodeKind;
  switch (e->kind) {
    case NK::Name:
      static_cast<ast::Name*>(e)->ctx = ctx;
      break;
    case NK::Attribute:
      static_cast<ast::Attribute*>(e)->ctx = ctx;
      break;
    case NK::Subscript:
      static_cast<ast::Subscript*>(e)->ctx = ctx;
      break;
    case NK::Starred: {
      auto* star = static_cast<ast::Starred*>(e);
      star->ctx = ctx;
      setTargetContext(star->value.get(), ctx);
      break;
    }
    case NK::TupleLiteral: {
      auto* tup = static_cast<ast::TupleLiteral*>(e);
      tup->ctx = ctx;
      for (auto& el : tup->elements) { setTargetContext(el.get(), ctx); }
      break;
    }
    case NK::ListLiteral: {
      auto* lst = static_cast<ast::ListLiteral*>(e);
      lst->ctx = ctx;
      for (auto& el : lst->elements) { setTargetContext(el.get(), ctx); }
      break;
    }
    default:
      break;
  }
}

// Validate assignment targets recursively (name, attr, subscript, starred, tuple, list)
bool Parser::isValidAssignmentTarget(const ast::Expr* e) {
  if (!e) return false;
  using NK = ast::NodeKind;
  switch (e->kind) {
    case NK::Name:
    case NK::Attribute:
    case NK::Subscript:
      return true;
    case NK::Starred:
      return isValidAssignmentTarget(static_cast<const ast::Starred*>(e)->value.get());
    case NK::TupleLiteral: {
      const auto* tup = static_cast<const ast::TupleLiteral*>(e);
      for (const auto& el : tup->elements) {
        if (!isValidAssignmentTarget(el.get())) return false;
      }
      return true;
    }
    case NK::ListLiteral: {
      const auto* lst = static_cast<const ast::ListLiteral*>(e);
      for (const auto& el : lst->elements) {
        if (!isValidAssignmentTarget(el.get())) return false;
      }
      return true;
    }
    default:
      return false;
  }
}

} // namespace pyinfer::parse
