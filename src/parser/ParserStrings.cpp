/***
 * Name: pyinfer::parse::Parser (string literals)
 * Purpose: Decode string/bytes literals, concatenate adjacent literals and
 *   split f-strings into text and expression segments.
 * Theory of Operation:
 *   The lexer hands over the raw lexeme (prefix and quotes included). The
 *   body is cut out, escapes are applied unless the literal is raw, and for
 *   f-strings each replacement field is parsed with a nested Lexer/Parser
 *   that starts at the field's position in the enclosing file.
 */
#include "parser/Parser.h"
#include "parser/ParserInternals.h"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pyinfer::parse {

using TK = lex::TokenKind;
using detail::stamp;

namespace {
void appendUtf8(std::string& out, const uint32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

bool hexValue(const char chr, uint32_t& out) {
  if (chr >= '0' && chr <= '9') { out = static_cast<uint32_t>(chr - '0'); return true; }
  const int lower = std::tolower(static_cast<unsigned char>(chr));
  if (lower >= 'a' && lower <= 'f') { out = static_cast<uint32_t>(lower - 'a' + 10); return true; }
  return false;
}

bool hasRawPrefix(const std::string& prefix) {
  return prefix.find('r') != std::string::npos || prefix.find('R') != std::string::npos;
}

std::string trimRight(const std::string& text) {
  size_t end = text.size();
  while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) { --end; }
  return text.substr(0, end);
}

bool isBlank(const std::string& text) {
  for (const char chr : text) {
    if (std::isspace(static_cast<unsigned char>(chr)) == 0) return false;
  }
  return true;
}
} // namespace

// Split a raw lexeme into prefix and body; bodyOffset is the body's index in text.
std::string Parser::unquoteString(const std::string& text, std::string& prefix, size_t& bodyOffset) {
  size_t idx = 0;
  while (idx < text.size() && text[idx] != '\'' && text[idx] != '"') { ++idx; }
  prefix = text.substr(0, idx);
  if (idx >= text.size()) { bodyOffset = idx; return {}; }
  const char quote = text[idx];
  const bool triple = text.size() - idx >= 6 && text[idx + 1] == quote && text[idx + 2] == quote;
  const size_t qlen = triple ? 3 : 1;
  bodyOffset = idx + qlen;
  if (text.size() < bodyOffset + qlen) { return {}; }
  return text.substr(bodyOffset, text.size() - bodyOffset - qlen);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::string Parser::decodeEscapes(const std::string& body, const bool isBytes) {
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    const char chr = body[i];
    if (chr != '\\' || i + 1 >= body.size()) { out.push_back(chr); continue; }
    const char esc = body[++i];
    switch (esc) {
      case '\n': break; // line continuation
      case '\r': if (i + 1 < body.size() && body[i + 1] == '\n') { ++i; } break;
      case '\\': out.push_back('\\'); break;
      case '\'': out.push_back('\''); break;
      case '"': out.push_back('"'); break;
      case 'a': out.push_back('\a'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'v': out.push_back('\v'); break;
      case 'x':
      case 'u':
      case 'U': {
        if ((esc == 'u' || esc == 'U') && isBytes) { out.push_back('\\'); out.push_back(esc); break; }
        const size_t width = esc == 'x' ? 2 : (esc == 'u' ? 4 : 8);
        uint32_t value = 0;
        size_t used = 0;
        while (used < width && i + 1 + used < body.size()) {
          uint32_t digit = 0;
          if (!hexValue(body[i + 1 + used], digit)) break;
          value = (value << 4U) | digit;
          ++used;
        }
        if (used != width) { out.push_back('\\'); out.push_back(esc); break; }
        i += width;
        if (isBytes) { out.push_back(static_cast<char>(value)); }
        else { appendUtf8(out, value); }
        break;
      }
      default:
        if (esc >= '0' && esc <= '7') {
          uint32_t value = static_cast<uint32_t>(esc - '0');
          for (int k = 0; k < 2 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7'; ++k) {
            value = value * 8U + static_cast<uint32_t>(body[++i] - '0');
          }
          if (isBytes) { out.push_back(static_cast<char>(value & 0xFFU)); }
          else { appendUtf8(out, value); }
          break;
        }
        // unknown escapes (including \N{...}) are kept verbatim
        out.push_back('\\');
        out.push_back(esc);
        break;
    }
  }
  return out;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseStrings() {
  const lex::Token firstTok = peek();
  std::vector<lex::Token> parts;
  bool anyBytes = false;
  bool anyText = false;
  bool anyF = false;
  while (peek().kind == TK::String || peek().kind == TK::Bytes || peek().kind == TK::FString) {
    const auto tok = get();
    if (tok.kind == TK::Bytes) { anyBytes = true; } else { anyText = true; }
    if (tok.kind == TK::FString) { anyF = true; }
    parts.push_back(tok);
  }
  if (anyBytes && anyText) { fail(firstTok, "cannot mix bytes and nonbytes literals"); }

  auto decoded = [](const lex::Token& tok, const bool isBytes) {
    std::string prefix;
    size_t offset = 0;
    const std::string body = unquoteString(tok.text, prefix, offset);
    return hasRawPrefix(prefix) ? body : decodeEscapes(body, isBytes);
  };

  if (anyBytes) {
    std::string value;
    for (const auto& tok : parts) { value += decoded(tok, true); }
    auto node = std::make_unique<ast::BytesLiteral>(std::move(value));
    stamp(*node, firstTok);
    return node;
  }
  if (!anyF) {
    std::string value;
    for (const auto& tok : parts) { value += decoded(tok, false); }
    auto node = std::make_unique<ast::StringLiteral>(std::move(value));
    stamp(*node, firstTok);
    return node;
  }
  auto fs = std::make_unique<ast::FStringLiteral>();
  stamp(*fs, firstTok);
  for (const auto& tok : parts) {
    if (tok.kind == TK::FString) {
      parseFStringInto(tok, *fs);
      continue;
    }
    std::string text = decoded(tok, false);
    if (!fs->parts.empty() && !fs->parts.back().isExpr) {
      fs->parts.back().text += text;
    } else {
      ast::FStringSegment seg;
      seg.text = std::move(text);
      fs->parts.push_back(std::move(seg));
    }
  }
  return fs;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity,readability-function-size)
void Parser::parseFStringInto(const lex::Token& tok, ast::FStringLiteral& out) {
  std::string prefix;
  size_t bodyOffset = 0;
  const std::string body = unquoteString(tok.text, prefix, bodyOffset);
  const bool raw = hasRawPrefix(prefix);
  std::string lit;

  auto flush = [&]() {
    if (lit.empty()) return;
    std::string text = raw ? lit : decodeEscapes(lit, false);
    if (!out.parts.empty() && !out.parts.back().isExpr) {
      out.parts.back().text += text;
    } else {
      ast::FStringSegment seg;
      seg.text = std::move(text);
      out.parts.push_back(std::move(seg));
    }
    lit.clear();
  };

  // Position of body[index] within the enclosing file (1-based column).
  auto positionOf = [&](const size_t index, int& line, int& col) {
    const size_t rawIndex = bodyOffset + index;
    line = tok.line;
    size_t lastBreak = std::string::npos;
    for (size_t k = 0; k < rawIndex && k < tok.text.size(); ++k) {
      if (tok.text[k] == '\n') { ++line; lastBreak = k; }
    }
    col = lastBreak == std::string::npos ? tok.col + static_cast<int>(rawIndex)
                                         : static_cast<int>(rawIndex - lastBreak);
  };

  auto addExpr = [&](const size_t start, std::string text) {
    if (isBlank(text)) { fail(tok, "f-string: empty expression not allowed"); }
    int line = 0;
    int col = 0;
    positionOf(start, line, col);
    ast::FStringSegment seg;
    seg.isExpr = true;
    seg.expr = parseExprFromString(text, tok.file, line, col);
    out.parts.push_back(std::move(seg));
  };

  // Scan an expression starting at `start`; returns the index of the first
  // top-level '}', ':' or '!' conversion marker.
  auto scanExpr = [&](const size_t start) {
    int depth = 0;
    char quote = 0;
    size_t j = start;
    for (; j < body.size(); ++j) {
      const char chr = body[j];
      if (quote != 0) { if (chr == quote) { quote = 0; } continue; }
      if (chr == '\'' || chr == '"') { quote = chr; continue; }
      if (chr == '(' || chr == '[' || chr == '{') { ++depth; continue; }
      if (depth > 0 && (chr == ')' || chr == ']' || chr == '}')) { --depth; continue; }
      if (depth == 0) {
        if (chr == '}' || chr == ':') break;
        if (chr == '!' && (j + 1 >= body.size() || body[j + 1] != '=')) break;
      }
    }
    if (j >= body.size()) { fail(tok, "f-string: expecting '}'"); }
    return j;
  };

  size_t i = 0;
  while (i < body.size()) {
    const char chr = body[i];
    if (chr == '{') {
      if (i + 1 < body.size() && body[i + 1] == '{') { lit.push_back('{'); i += 2; continue; }
      flush();
      const size_t exprStart = i + 1;
      size_t j = scanExpr(exprStart);
      std::string exprText = trimRight(body.substr(exprStart, j - exprStart));
      // self-documenting form {expr=}
      if (exprText.size() > 1 && exprText.back() == '=') {
        const char before = exprText[exprText.size() - 2];
        if (before != '=' && before != '!' && before != '<' && before != '>') {
          exprText.pop_back();
        }
      }
      addExpr(exprStart, exprText);
      if (body[j] == '!') {
        while (j < body.size() && body[j] != ':' && body[j] != '}') { ++j; }
      }
      if (j < body.size() && body[j] == ':') {
        // format spec; nested replacement fields are expressions too
        ++j;
        while (j < body.size() && body[j] != '}') {
          if (body[j] == '{') {
            const size_t nestedStart = j + 1;
            const size_t nestedEnd = scanExpr(nestedStart);
            addExpr(nestedStart, body.substr(nestedStart, nestedEnd - nestedStart));
            j = nestedEnd;
            while (j < body.size() && body[j] != '}') { ++j; }
          }
          ++j;
        }
      }
      if (j >= body.size() || body[j] != '}') { fail(tok, "f-string: expecting '}'"); }
      i = j + 1;
      continue;
    }
    if (chr == '}') {
      if (i + 1 < body.size() && body[i + 1] == '}') { lit.push_back('}'); i += 2; continue; }
      fail(tok, "f-string: single '}' is not allowed");
    }
    lit.push_back(chr);
    ++i;
  }
  flush();
}

std::unique_ptr<ast::Expr> Parser::parseExprFromString(const std::string& text, const std::string& name,
                                                      const int line, const int col) {
  lex::Lexer L;
  L.pushExpression(text, name, line, col);
  Parser P(L);
  P.initBuffer();
  auto expr = P.parseStarExprList();
  (void)P.match(TK::Newline);
  if (P.peek().kind != TK::End) {
    P.fail(P.peek(), "expected end of f-string expression, got '" + P.peek().text + "'");
  }
  return expr;
}

} // namespace pyinfer::parse
