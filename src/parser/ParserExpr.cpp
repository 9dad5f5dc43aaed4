/***
 * Name: pyinfer::parse::Parser (expressions)
 * Purpose: Expression precedence ladder, displays, comprehensions and calls.
 */
#include "parser/Parser.h"
#include "parser/ParserInternals.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pyinfer::parse {

using TK = lex::TokenKind;
using BO = ast::BinaryOperator;
using detail::stamp;
using detail::stampFrom;

// Restores the parser's nesting count on exit; deeper() charges one level.
class Parser::NestingScope {
 public:
  explicit NestingScope(Parser& parser) : parser_(parser), saved_(parser.nesting_) {}
  ~NestingScope() { parser_.nesting_ = saved_; }
  NestingScope(const NestingScope&) = delete;
  NestingScope& operator=(const NestingScope&) = delete;

  void deeper() {
    if (++parser_.nesting_ > kMaxNesting) { parser_.fail(parser_.peek(), "expression nested too deeply"); }
  }

 private:
  Parser& parser_;
  int saved_;
};

namespace {
std::unique_ptr<ast::Expr> makeBinary(const BO op, std::unique_ptr<ast::Expr> lhs, std::unique_ptr<ast::Expr> rhs) {
  auto node = std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs));
  stampFrom(*node, *node->lhs);
  return node;
}
} // namespace

std::unique_ptr<ast::Expr> Parser::parseStarExprList() {
  auto first = parseStarExpr();
  if (peek().kind != TK::Comma) { return first; }
  auto tup = std::make_unique<ast::TupleLiteral>();
  stampFrom(*tup, *first);
  tup->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpression(peek().kind)) break;
    tup->elements.emplace_back(parseStarExpr());
  }
  return tup;
}

std::unique_ptr<ast::Expr> Parser::parseStarExpr() {
  if (peek().kind == TK::Star) {
    const auto starTok = get();
    auto node = std::make_unique<ast::Starred>(parseBitwiseOr());
    stamp(*node, starTok);
    return node;
  }
  return parseNamedExpr();
}

std::unique_ptr<ast::Expr> Parser::parseAssignValue() {
  if (peek().kind == TK::Yield) { return parseYield(); }
  return parseStarExprList();
}

std::unique_ptr<ast::Expr> Parser::parseYield() {
  const auto tok = expect(TK::Yield, "'yield'");
  auto y = std::make_unique<ast::YieldExpr>();
  stamp(*y, tok);
  if (match(TK::From)) {
    y->isFrom = true;
    y->value = parseExpr();
  } else if (startsExpression(peek().kind)) {
    y->value = parseStarExprList();
  }
  return y;
}

std::unique_ptr<ast::Expr> Parser::parseNamedExpr() {
  // Named expression: NAME := expr
  if (peek().kind == TK::Ident && peekNext().kind == TK::ColonEqual) {
    const auto nameTok = get();
    (void)get(); // ':='
    auto target = std::make_unique<ast::Name>(nameTok.text);
    target->ctx = ast::ExprContext::Store;
    stamp(*target, nameTok);
    auto node = std::make_unique<ast::NamedExpr>(std::move(target), parseExpr());
    stamp(*node, nameTok);
    return node;
  }
  return parseExpr();
}

std::unique_ptr<ast::Expr> Parser::parseExpr() {
  NestingScope scope(*this);
  scope.deeper();
  if (peek().kind == TK::Lambda) { return parseLambda(); }
  // Conditional expression: <expr> if <expr> else <expr>
  auto body = parseLogicalOr();
  if (!match(TK::If)) { return body; }
  auto node = std::make_unique<ast::IfExpr>();
  stampFrom(*node, *body);
  node->body = std::move(body);
  node->test = parseLogicalOr();
  expect(TK::Else, "'else' in conditional expression");
  node->orelse = parseExpr();
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseLambda() {
  const auto tok = get();
  auto lam = std::make_unique<ast::LambdaExpr>();
  stamp(*lam, tok);
  parseParamList(lam->params, TK::Colon, false);
  expect(TK::Colon, "':'");
  lam->body = parseExpr();
  return lam;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalOr() {
  auto first = parseLogicalAnd();
  if (peek().kind != TK::Or) { return first; }
  auto node = std::make_unique<ast::BoolOp>(BO::Or);
  stampFrom(*node, *first);
  node->values.emplace_back(std::move(first));
  while (match(TK::Or)) { node->values.emplace_back(parseLogicalAnd()); }
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalAnd() {
  auto first = parseLogicalNot();
  if (peek().kind != TK::And) { return first; }
  auto node = std::make_unique<ast::BoolOp>(BO::And);
  stampFrom(*node, *first);
  node->values.emplace_back(std::move(first));
  while (match(TK::And)) { node->values.emplace_back(parseLogicalNot()); }
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalNot() {
  if (peek().kind == TK::Not) {
    NestingScope scope(*this);
    scope.deeper();
    const auto tok = get();
    auto node = std::make_unique<ast::Unary>(ast::UnaryOperator::Not, parseLogicalNot());
    stamp(*node, tok);
    return node;
  }
  return parseComparison();
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseComparison() {
  auto left = parseBitwiseOr();
  std::unique_ptr<ast::Compare> cmp;
  auto finish = [&]() -> std::unique_ptr<ast::Expr> {
    if (cmp) { return std::move(cmp); }
    return std::move(left);
  };
  for (;;) {
    BO op{};
    switch (peek().kind) {
      case TK::EqEq: op = BO::Eq; break;
      case TK::NotEq: op = BO::Ne; break;
      case TK::Lt: op = BO::Lt; break;
      case TK::Le: op = BO::Le; break;
      case TK::Gt: op = BO::Gt; break;
      case TK::Ge: op = BO::Ge; break;
      case TK::In: op = BO::In; break;
      case TK::Is: op = (peekNext().kind == TK::Not) ? BO::IsNot : BO::Is; break;
      case TK::Not:
        if (peekNext().kind != TK::In) { return finish(); }
        op = BO::NotIn;
        break;
      default:
        return finish();
    }
    (void)get();
    if (op == BO::IsNot || op == BO::NotIn) { (void)get(); }
    if (!cmp) {
      cmp = std::make_unique<ast::Compare>();
      stampFrom(*cmp, *left);
      cmp->left = std::move(left);
    }
    cmp->ops.push_back(op);
    cmp->comparators.emplace_back(parseBitwiseOr());
  }
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseOr() {
  NestingScope scope(*this);
  auto lhs = parseBitwiseXor();
  while (match(TK::Pipe)) { scope.deeper(); lhs = makeBinary(BO::BitOr, std::move(lhs), parseBitwiseXor()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseXor() {
  NestingScope scope(*this);
  auto lhs = parseBitwiseAnd();
  while (match(TK::Caret)) { scope.deeper(); lhs = makeBinary(BO::BitXor, std::move(lhs), parseBitwiseAnd()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseAnd() {
  NestingScope scope(*this);
  auto lhs = parseShift();
  while (match(TK::Amp)) { scope.deeper(); lhs = makeBinary(BO::BitAnd, std::move(lhs), parseShift()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseShift() {
  NestingScope scope(*this);
  auto lhs = parseAdditive();
  for (;;) {
    if (match(TK::LShift)) { scope.deeper(); lhs = makeBinary(BO::LShift, std::move(lhs), parseAdditive()); continue; }
    if (match(TK::RShift)) { scope.deeper(); lhs = makeBinary(BO::RShift, std::move(lhs), parseAdditive()); continue; }
    return lhs;
  }
}

std::unique_ptr<ast::Expr> Parser::parseAdditive() {
  NestingScope scope(*this);
  auto lhs = parseMultiplicative();
  for (;;) {
    if (match(TK::Plus)) { scope.deeper(); lhs = makeBinary(BO::Add, std::move(lhs), parseMultiplicative()); continue; }
    if (match(TK::Minus)) { scope.deeper(); lhs = makeBinary(BO::Sub, std::move(lhs), parseMultiplicative()); continue; }
    return lhs;
  }
}

std::unique_ptr<ast::Expr> Parser::parseMultiplicative() {
  NestingScope scope(*this);
  auto lhs = parseUnary();
  for (;;) {
    BO op{};
    switch (peek().kind) {
      case TK::Star: op = BO::Mul; break;
      case TK::Slash: op = BO::Div; break;
      case TK::SlashSlash: op = BO::FloorDiv; break;
      case TK::Percent: op = BO::Mod; break;
      case TK::At: op = BO::MatMul; break;
      default: return lhs;
    }
    (void)get();
    scope.deeper();
    lhs = makeBinary(op, std::move(lhs), parseUnary());
  }
}

std::unique_ptr<ast::Expr> Parser::parseUnary() {
  ast::UnaryOperator op{};
  switch (peek().kind) {
    case TK::Minus: op = ast::UnaryOperator::Neg; break;
    case TK::Plus: op = ast::UnaryOperator::Pos; break;
    case TK::Tilde: op = ast::UnaryOperator::BitNot; break;
    default: return parsePower();
  }
  NestingScope scope(*this);
  scope.deeper();
  const auto tok = get();
  auto node = std::make_unique<ast::Unary>(op, parseUnary());
  stamp(*node, tok);
  return node;
}

std::unique_ptr<ast::Expr> Parser::parsePower() {
  auto base = parsePrimary();
  if (match(TK::StarStar)) {
    NestingScope scope(*this);
    scope.deeper();
    // right-associative; the exponent may carry a unary sign
    return makeBinary(BO::Pow, std::move(base), parseUnary());
  }
  return base;
}

std::unique_ptr<ast::Expr> Parser::parsePrimary() {
  if (peek().kind == TK::Await) {
    const auto tok = get();
    auto node = std::make_unique<ast::AwaitExpr>(parsePostfix(parseAtom()));
    stamp(*node, tok);
    return node;
  }
  return parsePostfix(parseAtom());
}

std::unique_ptr<ast::Expr> Parser::parsePostfix(std::unique_ptr<ast::Expr> base) {
  NestingScope scope(*this);
  for (;;) {
    if (peek().kind != TK::LParen && peek().kind != TK::LBracket && peek().kind != TK::Dot) { return base; }
    scope.deeper();
    if (match(TK::LParen)) {
      auto call = std::make_unique<ast::Call>(std::move(base));
      stampFrom(*call, *call->callee);
      parseArgList(*call);
      base = std::move(call);
      continue;
    }
    if (match(TK::LBracket)) {
      auto slice = parseSubscriptSlice();
      expect(TK::RBracket, "']'");
      auto sub = std::make_unique<ast::Subscript>(std::move(base), std::move(slice));
      stampFrom(*sub, *sub->value);
      base = std::move(sub);
      continue;
    }
    if (match(TK::Dot)) {
      const auto nameTok = expect(TK::Ident, "attribute name");
      auto attr = std::make_unique<ast::Attribute>(std::move(base), nameTok.text);
      stampFrom(*attr, *attr->value);
      base = std::move(attr);
      continue;
    }
    return base;
  }
}

// Arguments after '(' up to and including ')'
// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::parseArgList(ast::Call& call) {
  while (peek().kind != TK::RParen) {
    if (match(TK::StarStar)) {
      call.keywords.push_back(ast::KeywordArg{"", parseExpr()});
    } else if (peek().kind == TK::Star) {
      const auto starTok = get();
      auto star = std::make_unique<ast::Starred>(parseExpr());
      stamp(*star, starTok);
      call.args.emplace_back(std::move(star));
    } else if (peek().kind == TK::Ident && peekNext().kind == TK::Equal) {
      const auto nameTok = get();
      (void)get(); // '='
      call.keywords.push_back(ast::KeywordArg{nameTok.text, parseExpr()});
    } else {
      auto arg = parseNamedExpr();
      if (atComprehensionFor()) {
        auto gen = std::make_unique<ast::GeneratorExpr>();
        stampFrom(*gen, *arg);
        gen->elt = std::move(arg);
        gen->fors = parseComprehensionFors();
        arg = std::move(gen);
      }
      call.args.emplace_back(std::move(arg));
    }
    if (!match(TK::Comma)) break;
  }
  expect(TK::RParen, "')'");
}

std::unique_ptr<ast::Expr> Parser::parseSubscriptSlice() {
  auto first = parseSliceItem();
  if (peek().kind != TK::Comma) { return first; }
  auto tup = std::make_unique<ast::TupleLiteral>();
  stampFrom(*tup, *first);
  tup->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) break;
    tup->elements.emplace_back(parseSliceItem());
  }
  return tup;
}

std::unique_ptr<ast::Expr> Parser::parseSliceItem() {
  const auto startTok = peek();
  std::unique_ptr<ast::Expr> lower;
  if (peek().kind != TK::Colon) {
    lower = parseStarExpr();
    if (peek().kind != TK::Colon) { return lower; }
  }
  auto slice = std::make_unique<ast::Slice>();
  if (lower) { stampFrom(*slice, *lower); } else { stamp(*slice, startTok); }
  slice->lower = std::move(lower);
  expect(TK::Colon, "':'");
  auto endsPart = [this]() {
    const auto k = peek().kind;
    return k == TK::Colon || k == TK::Comma || k == TK::RBracket;
  };
  if (!endsPart()) { slice->upper = parseExpr(); }
  if (match(TK::Colon) && !endsPart()) { slice->step = parseExpr(); }
  return slice;
}

std::unique_ptr<ast::Expr> Parser::parseTarget() {
  if (peek().kind == TK::Star) {
    const auto starTok = get();
    auto node = std::make_unique<ast::Starred>(parseBitwiseOr());
    stamp(*node, starTok);
    return node;
  }
  return parseBitwiseOr();
}

std::unique_ptr<ast::Expr> Parser::parseTargetList() {
  auto first = parseTarget();
  if (peek().kind != TK::Comma) { return first; }
  auto tup = std::make_unique<ast::TupleLiteral>();
  stampFrom(*tup, *first);
  tup->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpression(peek().kind)) break;
    tup->elements.emplace_back(parseTarget());
  }
  return tup;
}

bool Parser::atComprehensionFor() const {
  return peek().kind == TK::For || (peek().kind == TK::Async && peekNext().kind == TK::For);
}

std::vector<ast::ComprehensionFor> Parser::parseComprehensionFors() {
  std::vector<ast::ComprehensionFor> out;
  while (atComprehensionFor()) {
    ast::ComprehensionFor cf;
    cf.isAsync = match(TK::Async);
    expect(TK::For, "'for'");
    const auto targetTok = peek();
    cf.target = parseTargetList();
    if (!isValidAssignmentTarget(cf.target.get())) { fail(targetTok, "invalid comprehension target"); }
    setTargetContext(cf.target.get(), ast::ExprContext::Store);
    expect(TK::In, "'in'");
    cf.iter = parseLogicalOr();
    while (match(TK::If)) { cf.ifs.emplace_back(parseLogicalOr()); }
    out.emplace_back(std::move(cf));
  }
  return out;
}

// NOLINTNEXTLINE(readability-function-size)
std::unique_ptr<ast::Expr> Parser::parseAtom() {
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Ident: {
      get();
      auto node = std::make_unique<ast::Name>(tok.text);
      stamp(*node, tok);
      return node;
    }
    case TK::Int: { get(); auto node = std::make_unique<ast::IntLiteral>(tok.text); stamp(*node, tok); return node; }
    case TK::Float: { get(); auto node = std::make_unique<ast::FloatLiteral>(tok.text); stamp(*node, tok); return node; }
    case TK::Imag: { get(); auto node = std::make_unique<ast::ImagLiteral>(tok.text); stamp(*node, tok); return node; }
    case TK::String:
    case TK::Bytes:
    case TK::FString:
      return parseStrings();
    case TK::BoolLit: { get(); auto node = std::make_unique<ast::BoolLiteral>(tok.text == "True"); stamp(*node, tok); return node; }
    case TK::NoneLit: { get(); auto node = std::make_unique<ast::NoneLiteral>(); stamp(*node, tok); return node; }
    case TK::Ellipsis: { get(); auto node = std::make_unique<ast::EllipsisLiteral>(); stamp(*node, tok); return node; }
    case TK::LParen: get(); return parseTupleOrParen(tok);
    case TK::LBracket: get(); return parseListLiteral(tok);
    case TK::LBrace: get(); return parseDictOrSetLiteral(tok);
    default:
      fail(tok, std::string("expected expression, got ") + to_string(tok.kind) + " '" + tok.text + "'");
  }
}

std::unique_ptr<ast::Expr> Parser::parseTupleOrParen(const lex::Token& openTok) {
  if (match(TK::RParen)) {
    auto tup = std::make_unique<ast::TupleLiteral>();
    stamp(*tup, openTok);
    return tup;
  }
  if (peek().kind == TK::Yield) {
    auto y = parseYield();
    expect(TK::RParen, "')'");
    return y;
  }
  auto first = parseStarExpr();
  if (atComprehensionFor()) {
    auto gen = std::make_unique<ast::GeneratorExpr>();
    stamp(*gen, openTok);
    gen->elt = std::move(first);
    gen->fors = parseComprehensionFors();
    expect(TK::RParen, "')'");
    return gen;
  }
  if (peek().kind != TK::Comma) {
    expect(TK::RParen, "')'");
    return first;
  }
  auto tup = std::make_unique<ast::TupleLiteral>();
  stamp(*tup, openTok);
  tup->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RParen) break;
    tup->elements.emplace_back(parseStarExpr());
  }
  expect(TK::RParen, "')'");
  return tup;
}

std::unique_ptr<ast::Expr> Parser::parseListLiteral(const lex::Token& openTok) {
  if (match(TK::RBracket)) {
    auto list = std::make_unique<ast::ListLiteral>();
    stamp(*list, openTok);
    return list;
  }
  auto first = parseStarExpr();
  // List comprehension if 'for' or 'async for' follows
  if (atComprehensionFor()) {
    auto lc = std::make_unique<ast::ListComp>();
    stamp(*lc, openTok);
    lc->elt = std::move(first);
    lc->fors = parseComprehensionFors();
    expect(TK::RBracket, "']'");
    return lc;
  }
  auto list = std::make_unique<ast::ListLiteral>();
  stamp(*list, openTok);
  list->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) break;
    list->elements.emplace_back(parseStarExpr());
  }
  expect(TK::RBracket, "']'");
  return list;
}

// Parse a brace display: dict, set, or their comprehensions
// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseDictOrSetLiteral(const lex::Token& openTok) {
  // '{}' -> empty dict
  if (match(TK::RBrace)) {
    auto d = std::make_unique<ast::DictLiteral>();
    stamp(*d, openTok);
    return d;
  }
  auto parseDictEntry = [this](ast::DictLiteral& dict) {
    if (match(TK::StarStar)) {
      dict.items.emplace_back(nullptr, parseBitwiseOr());
      return;
    }
    auto key = parseExpr();
    expect(TK::Colon, "':'");
    dict.items.emplace_back(std::move(key), parseExpr());
  };
  auto parseDictTail = [&](std::unique_ptr<ast::DictLiteral> dict) {
    while (match(TK::Comma)) {
      if (peek().kind == TK::RBrace) break;
      parseDictEntry(*dict);
    }
    expect(TK::RBrace, "'}'");
    return dict;
  };

  if (peek().kind == TK::StarStar) {
    auto dict = std::make_unique<ast::DictLiteral>();
    stamp(*dict, openTok);
    parseDictEntry(*dict);
    return parseDictTail(std::move(dict));
  }

  auto first = parseStarExpr();
  if (match(TK::Colon)) {
    auto value = parseExpr();
    if (atComprehensionFor()) {
      auto dc = std::make_unique<ast::DictComp>();
      stamp(*dc, openTok);
      dc->key = std::move(first);
      dc->value = std::move(value);
      dc->fors = parseComprehensionFors();
      expect(TK::RBrace, "'}'");
      return dc;
    }
    auto dict = std::make_unique<ast::DictLiteral>();
    stamp(*dict, openTok);
    dict->items.emplace_back(std::move(first), std::move(value));
    return parseDictTail(std::move(dict));
  }

  if (atComprehensionFor()) {
    auto sc = std::make_unique<ast::SetComp>();
    stamp(*sc, openTok);
    sc->elt = std::move(first);
    sc->fors = parseComprehensionFors();
    expect(TK::RBrace, "'}'");
    return sc;
  }
  auto set = std::make_unique<ast::SetLiteral>();
  stamp(*set, openTok);
  set->elements.emplace_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBrace) break;
    set->elements.emplace_back(parseStarExpr());
  }
  expect(TK::RBrace, "'}'");
  return set;
}

} // namespace pyinfer::parse
