/***
 * Name: pyinfer::lex::Lexer
 * Purpose: Tokenize a source buffer into an indentation-aware token stream.
 */
#include "lexer/Lexer.h"
#include "pyinfer/exceptions/file_read_error.h"
#include "pyinfer/exceptions/parse_error.h"
#include "pyinfer/support/fs.h"
#include "pyinfer/support/unicode.h"

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pyinfer::lex {

namespace {
constexpr int kTabWidth = 8;

struct OpSpelling {
  std::string_view text;
  TokenKind kind;
};

// Longest spellings first so that a prefix never shadows a longer operator.
constexpr std::array<OpSpelling, 47> kOperators{{
    {"**=", TokenKind::StarStarEqual}, {"//=", TokenKind::SlashSlashEqual},
    {">>=", TokenKind::RShiftEqual},   {"<<=", TokenKind::LShiftEqual},
    {"...", TokenKind::Ellipsis},      {"->", TokenKind::Arrow},
    {":=", TokenKind::ColonEqual},     {"**", TokenKind::StarStar},
    {"//", TokenKind::SlashSlash},     {">>", TokenKind::RShift},
    {"<<", TokenKind::LShift},         {"<=", TokenKind::Le},
    {">=", TokenKind::Ge},             {"==", TokenKind::EqEq},
    {"!=", TokenKind::NotEq},          {"+=", TokenKind::PlusEqual},
    {"-=", TokenKind::MinusEqual},     {"*=", TokenKind::StarEqual},
    {"/=", TokenKind::SlashEqual},     {"%=", TokenKind::PercentEqual},
    {"&=", TokenKind::AmpEqual},       {"|=", TokenKind::PipeEqual},
    {"^=", TokenKind::CaretEqual},     {"@=", TokenKind::AtEqual},
    {"+", TokenKind::Plus},            {"-", TokenKind::Minus},
    {"*", TokenKind::Star},            {"/", TokenKind::Slash},
    {"%", TokenKind::Percent},         {"@", TokenKind::At},
    {"&", TokenKind::Amp},             {"|", TokenKind::Pipe},
    {"^", TokenKind::Caret},           {"~", TokenKind::Tilde},
    {"<", TokenKind::Lt},              {">", TokenKind::Gt},
    {"(", TokenKind::LParen},          {")", TokenKind::RParen},
    {"[", TokenKind::LBracket},        {"]", TokenKind::RBracket},
    {"{", TokenKind::LBrace},          {"}", TokenKind::RBrace},
    {",", TokenKind::Comma},           {":", TokenKind::Colon},
    {".", TokenKind::Dot},             {";", TokenKind::Semicolon},
    {"=", TokenKind::Equal},
}};

const std::unordered_map<std::string, TokenKind>& keywords() {
  static const std::unordered_map<std::string, TokenKind> kTable{
      {"def", TokenKind::Def},         {"return", TokenKind::Return},
      {"del", TokenKind::Del},         {"if", TokenKind::If},
      {"else", TokenKind::Else},       {"elif", TokenKind::Elif},
      {"while", TokenKind::While},     {"for", TokenKind::For},
      {"in", TokenKind::In},           {"break", TokenKind::Break},
      {"continue", TokenKind::Continue}, {"pass", TokenKind::Pass},
      {"try", TokenKind::Try},         {"except", TokenKind::Except},
      {"finally", TokenKind::Finally}, {"with", TokenKind::With},
      {"as", TokenKind::As},           {"import", TokenKind::Import},
      {"from", TokenKind::From},       {"class", TokenKind::Class},
      {"async", TokenKind::Async},     {"assert", TokenKind::Assert},
      {"raise", TokenKind::Raise},     {"global", TokenKind::Global},
      {"nonlocal", TokenKind::Nonlocal}, {"yield", TokenKind::Yield},
      {"await", TokenKind::Await},     {"is", TokenKind::Is},
      {"and", TokenKind::And},         {"or", TokenKind::Or},
      {"not", TokenKind::Not},         {"lambda", TokenKind::Lambda},
      {"True", TokenKind::BoolLit},    {"False", TokenKind::BoolLit},
      {"None", TokenKind::NoneLit},
  };
  return kTable;
}

bool isDigit(const char chr) { return chr >= '0' && chr <= '9'; }
bool isIdentStart(const char chr) { return (std::isalpha(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
bool isIdentChar(const char chr) { return (std::isalnum(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }

// r, u, b, f and their two-letter combinations (case-insensitive)
bool isStringPrefix(const std::string& word, bool& isBytes, bool& isFString) {
  if (word.empty() || word.size() > 2) { return false; }
  bool raw = false;
  bool unicode = false;
  isBytes = false;
  isFString = false;
  for (const char chr : word) {
    switch (std::tolower(static_cast<unsigned char>(chr))) {
      case 'r': if (raw) { return false; } raw = true; break;
      case 'b': if (isBytes) { return false; } isBytes = true; break;
      case 'f': if (isFString) { return false; } isFString = true; break;
      case 'u': if (unicode) { return false; } unicode = true; break;
      default: return false;
    }
  }
  if (unicode && word.size() != 1) { return false; }
  return !(isBytes && isFString);
}
} // namespace

void Lexer::pushFile(const std::string& path) {
  std::string text;
  std::string err;
  if (!support::ReadFile(path, text, err)) { throw exceptions::FileReadError(err); }
  pushString(text, path);
}

void Lexer::pushString(const std::string& text, const std::string& name) {
  src_ = text;
  name_ = name;
  index_ = 0;
  lineStart_ = 0;
  lineNo_ = 1;
  firstLineColOffset_ = 0;
  parenDepth_ = 0;
  atLineStart_ = true;
  indentStack_ = {0};
  tokens_.clear();
  pos_ = 0;
  finalized_ = false;
}

void Lexer::pushExpression(const std::string& text, const std::string& name, const int line, const int col) {
  pushString(text, name);
  lineNo_ = line;
  firstLine_ = line;
  firstLineColOffset_ = col - 1;
  // Behave as if inside brackets: no indentation, newlines are joins.
  parenDepth_ = 1;
  atLineStart_ = false;
}

int Lexer::colAt(const size_t index) const {
  const int base = static_cast<int>(index - lineStart_) + 1;
  return lineNo_ == firstLine_ ? base + firstLineColOffset_ : base;
}

void Lexer::fail(const std::string& msg, const int line, const int col) const {
  std::ostringstream oss;
  oss << name_ << ":" << line << ":" << col << ": " << msg;
  throw exceptions::ParseError(oss.str(), line, col);
}

void Lexer::emit(const TokenKind kind, const size_t start, const size_t endExclusive, const int line, const int col) {
  Token tok;
  tok.kind = kind;
  tok.text = src_.substr(start, endExclusive - start);
  tok.file = name_;
  tok.line = line;
  tok.col = col;
  tokens_.push_back(std::move(tok));
}

void Lexer::emitNewline() {
  if (tokens_.empty()) { return; }
  const TokenKind last = tokens_.back().kind;
  if (last == TokenKind::Newline || last == TokenKind::Indent || last == TokenKind::Dedent) { return; }
  Token tok;
  tok.kind = TokenKind::Newline;
  tok.text = "\n";
  tok.file = name_;
  tok.line = lineNo_;
  tok.col = colAt(index_);
  tokens_.push_back(std::move(tok));
}

void Lexer::consumeLineBreak() {
  if (at(index_) == '\r' && at(index_ + 1) == '\n') { index_ += 2; }
  else { ++index_; }
  ++lineNo_;
  lineStart_ = index_;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
bool Lexer::handleIndentation() {
  int width = 0;
  size_t idx = index_;
  for (;;) {
    const char chr = at(idx);
    if (chr == ' ') { ++width; ++idx; }
    else if (chr == '\t') { width = (width / kTabWidth + 1) * kTabWidth; ++idx; }
    else if (chr == '\f') { width = 0; ++idx; }
    else { break; }
  }
  const char chr = at(idx);
  if (idx >= src_.size() || chr == '#' || chr == '\n' || chr == '\r') {
    // blank or comment-only line
    while (idx < src_.size() && src_[idx] != '\n' && src_[idx] != '\r') { ++idx; }
    index_ = idx;
    if (index_ < src_.size()) { consumeLineBreak(); }
    return true;
  }
  index_ = idx;
  atLineStart_ = false;
  const int col = colAt(index_);
  if (width > indentStack_.back()) {
    if (indentStack_.size() > kMaxIndentLevels) { fail("too many levels of indentation", lineNo_, col); }
    indentStack_.push_back(width);
    Token tok; tok.kind = TokenKind::Indent; tok.text = "<INDENT>"; tok.file = name_; tok.line = lineNo_; tok.col = col;
    tokens_.push_back(std::move(tok));
    return false;
  }
  while (width < indentStack_.back()) {
    indentStack_.pop_back();
    Token tok; tok.kind = TokenKind::Dedent; tok.text = "<DEDENT>"; tok.file = name_; tok.line = lineNo_; tok.col = col;
    tokens_.push_back(std::move(tok));
  }
  if (width != indentStack_.back()) { fail("unindent does not match any outer indentation level", lineNo_, col); }
  return false;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Lexer::scanToken() {
  const char chr = at(index_);
  if (chr == ' ' || chr == '\t' || chr == '\f') { ++index_; return; }
  if (chr == '#') {
    while (index_ < src_.size() && src_[index_] != '\n' && src_[index_] != '\r') { ++index_; }
    return;
  }
  if (chr == '\\') {
    const char nextChr = at(index_ + 1);
    if (nextChr == '\n' || nextChr == '\r') { ++index_; consumeLineBreak(); return; }
    fail("unexpected character after line continuation character", lineNo_, colAt(index_));
  }
  if (chr == '\n' || chr == '\r') {
    if (parenDepth_ > 0) { consumeLineBreak(); return; }
    emitNewline();
    consumeLineBreak();
    atLineStart_ = true;
    return;
  }
  if (isDigit(chr) || (chr == '.' && isDigit(at(index_ + 1)))) { scanNumber(); return; }
  if (isIdentStart(chr) || static_cast<unsigned char>(chr) >= 0x80U) { scanName(); return; }
  if (chr == '"' || chr == '\'') { scanString(index_, false, false); return; }
  if (scanOperator()) { return; }
  fail(std::string("invalid character '") + chr + "'", lineNo_, colAt(index_));
}

void Lexer::scanName() {
  const size_t start = index_;
  const int col = colAt(start);
  bool nonAscii = false;
  while (index_ < src_.size()) {
    const auto byte = static_cast<unsigned char>(src_[index_]);
    if (byte < 0x80U) {
      if (isIdentChar(static_cast<char>(byte))) { ++index_; continue; }
      break;
    }
    size_t probe = index_;
    const int32_t codePoint = support::DecodeUtf8(src_, probe);
    if (codePoint < 0) { fail("invalid UTF-8 sequence", lineNo_, colAt(index_)); }
    const bool accepted = (index_ == start) ? support::IsIdentifierStart(codePoint)
                                            : support::IsIdentifierContinue(codePoint);
    if (!accepted) { break; }
    nonAscii = true;
    index_ = probe;
  }
  if (index_ == start) { fail("invalid character in identifier", lineNo_, col); }
  std::string word = src_.substr(start, index_ - start);
  const char quote = at(index_);
  if (!nonAscii && (quote == '"' || quote == '\'')) {
    bool isBytes = false;
    bool isFString = false;
    if (isStringPrefix(word, isBytes, isFString)) { scanString(start, isBytes, isFString); return; }
  }
  if (nonAscii) { word = support::NormalizeIdentifier(word); }
  Token tok;
  const auto keyword = keywords().find(word);
  tok.kind = keyword != keywords().end() ? keyword->second : TokenKind::Ident;
  tok.text = std::move(word);
  tok.file = name_;
  tok.line = lineNo_;
  tok.col = col;
  tokens_.push_back(std::move(tok));
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Lexer::scanNumber() {
  const size_t start = index_;
  const int col = colAt(start);
  auto digits = [&]() { while (isDigit(at(index_)) || at(index_) == '_') { ++index_; } };
  const char radix = static_cast<char>(std::tolower(static_cast<unsigned char>(at(index_ + 1))));
  if (at(index_) == '0' && (radix == 'x' || radix == 'o' || radix == 'b')) {
    index_ += 2;
    while (isIdentChar(at(index_))) { ++index_; }
    emit(TokenKind::Int, start, index_, lineNo_, col);
    return;
  }
  bool isFloat = false;
  digits();
  if (at(index_) == '.' && at(index_ + 1) != '.') {
    isFloat = true;
    ++index_;
    digits();
  }
  if (at(index_) == 'e' || at(index_) == 'E') {
    size_t probe = index_ + 1;
    if (at(probe) == '+' || at(probe) == '-') { ++probe; }
    if (isDigit(at(probe))) {
      isFloat = true;
      index_ = probe;
      digits();
    }
  }
  if (at(index_) == 'j' || at(index_) == 'J') {
    ++index_;
    emit(TokenKind::Imag, start, index_, lineNo_, col);
    return;
  }
  emit(isFloat ? TokenKind::Float : TokenKind::Int, start, index_, lineNo_, col);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Lexer::scanString(const size_t start, const bool isBytes, const bool isFString) {
  const int line = lineNo_;
  const int col = colAt(start);
  const char quote = at(index_);
  const bool triple = at(index_ + 1) == quote && at(index_ + 2) == quote;
  index_ += triple ? 3 : 1;
  for (;;) {
    if (index_ >= src_.size()) { fail("unterminated string literal", line, col); }
    const char chr = src_[index_];
    if (chr == '\\') {
      ++index_;
      if (index_ < src_.size()) {
        if (src_[index_] == '\n' || src_[index_] == '\r') { consumeLineBreak(); }
        else { ++index_; }
      }
      continue;
    }
    if (chr == '\n' || chr == '\r') {
      if (!triple) { fail("unterminated string literal", line, col); }
      consumeLineBreak();
      continue;
    }
    if (chr == quote) {
      if (!triple) { ++index_; break; }
      if (at(index_ + 1) == quote && at(index_ + 2) == quote) { index_ += 3; break; }
    }
    ++index_;
  }
  const TokenKind kind = isFString ? TokenKind::FString : (isBytes ? TokenKind::Bytes : TokenKind::String);
  emit(kind, start, index_, line, col);
}

bool Lexer::scanOperator() {
  for (const auto& op : kOperators) {
    if (src_.compare(index_, op.text.size(), op.text) != 0) { continue; }
    const int col = colAt(index_);
    emit(op.kind, index_, index_ + op.text.size(), lineNo_, col);
    index_ += op.text.size();
    switch (op.kind) {
      case TokenKind::LParen:
      case TokenKind::LBracket:
      case TokenKind::LBrace:
        if (++parenDepth_ > kMaxParenDepth) { fail("too many nested parentheses", lineNo_, col); }
        break;
      case TokenKind::RParen:
      case TokenKind::RBracket:
      case TokenKind::RBrace: if (parenDepth_ > 0) { --parenDepth_; } break;
      default: break;
    }
    return true;
  }
  return false;
}

void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  while (index_ < src_.size()) {
    if (atLineStart_ && parenDepth_ == 0) {
      if (handleIndentation()) { continue; }
      if (index_ >= src_.size()) { break; }
    }
    scanToken();
  }
  emitNewline();
  while (indentStack_.size() > 1) {
    indentStack_.pop_back();
    Token ded; ded.kind = TokenKind::Dedent; ded.text = "<DEDENT>"; ded.file = name_; ded.line = lineNo_; ded.col = 1;
    tokens_.push_back(std::move(ded));
  }
  Token eof; eof.kind = TokenKind::End; eof.text = "<EOF>"; eof.file = name_; eof.line = lineNo_; eof.col = colAt(index_);
  tokens_.push_back(std::move(eof));
}

const Token& Lexer::peek(const size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

std::string Lexer::renderTokenLog() {
  std::ostringstream oss;
  for (const auto& tok : tokens()) {
    oss << tok.line << ":" << tok.col << " " << to_string(tok.kind);
    if (tok.kind != TokenKind::Newline) { oss << " " << tok.text; }
    oss << "\n";
  }
  return oss.str();
}

} // namespace pyinfer::lex
