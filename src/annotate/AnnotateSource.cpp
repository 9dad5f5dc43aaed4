/***
 * Name: pyinfer::annotate::AnnotateSource (impl)
 * Purpose: Line-level rewriting of function signatures and simple assignments.
 */
#include "annotate/Annotator.h"

#include <cctype>
#include <cstddef>
#include <string>
#include <vector>

namespace pyinfer::annotate {

namespace {

bool isSpace(const char c) { return c == ' ' || c == '\t'; }

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) { ++b; }
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) { --e; }
  return s.substr(b, e - b);
}

std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  for (;;) {
    const auto nl = text.find('\n', start);
    if (nl == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

bool consumeWord(const std::string& line, std::size_t& i, const std::string& word) {
  if (line.compare(i, word.size(), word) != 0) return false;
  const std::size_t end = i + word.size();
  if (end >= line.size() || !isSpace(line[end])) return false;
  i = end;
  while (i < line.size() && isSpace(line[i])) { ++i; }
  return true;
}

// Index of the ')' closing the '(' at open, or npos when it is not on this line.
std::size_t matchingParen(const std::string& line, const std::size_t open) {
  int depth = 0;
  char quote = 0;
  for (std::size_t i = open; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != 0) {
      if (c == '\\') {
        ++i;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == '(' || c == '[' || c == '{') {
      ++depth;
    } else if (c == ')' || c == ']' || c == '}') {
      if (--depth == 0) return c == ')' ? i : std::string::npos;
    }
  }
  return std::string::npos;
}

std::vector<std::string> splitParams(const std::string& text) {
  std::vector<std::string> out;
  int depth = 0;
  char quote = 0;
  std::string cur;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (quote != 0) {
      cur.push_back(c);
      if (c == '\\' && i + 1 < text.size()) {
        cur.push_back(text[++i]);
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '\'' || c == '"') quote = c;
    if (c == '(' || c == '[' || c == '{') ++depth;
    if (c == ')' || c == ']' || c == '}') --depth;
    if (c == ',' && depth == 0) {
      out.push_back(trim(cur));
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  if (!trim(cur).empty()) out.push_back(trim(cur));
  return out;
}

std::string annotateParam(const std::string& param, const FunctionTypeInfo& fn) {
  if (param == "*" || param == "/") return param;
  std::string stars;
  std::string rest = param;
  while (!rest.empty() && rest.front() == '*') {
    stars.push_back('*');
    rest.erase(0, 1);
  }
  std::string name = rest;
  std::string defaultText;
  const auto eq = rest.find('=');
  if (eq != std::string::npos) {
    name = trim(rest.substr(0, eq));
    defaultText = trim(rest.substr(eq + 1));
  }
  const std::string* type = fn.paramType(name);
  if (type == nullptr) return param;
  std::string out = stars + name + ": " + *type;
  if (eq != std::string::npos) out += " = " + defaultText;
  return out;
}

std::string annotateFunctionLine(const std::string& line, const std::string& name, const FunctionTypeInfo& fn) {
  if (line.find("->") != std::string::npos) return line;
  std::size_t i = 0;
  while (i < line.size() && isSpace(line[i])) { ++i; }
  (void) consumeWord(line, i, "async");
  if (!consumeWord(line, i, "def")) return line;
  if (line.compare(i, name.size(), name) != 0) return line;
  i += name.size();
  while (i < line.size() && isSpace(line[i])) { ++i; }
  if (i >= line.size() || line[i] != '(') return line;
  const std::size_t open = i;
  const std::size_t close = matchingParen(line, open);
  if (close == std::string::npos) return line;
  std::size_t colon = close + 1;
  while (colon < line.size() && isSpace(line[colon])) { ++colon; }
  if (colon >= line.size() || line[colon] != ':') return line;

  const std::string argsText = line.substr(open + 1, close - open - 1);
  const auto params = splitParams(argsText);
  std::string args;
  for (const auto& p : params) {
    // Only the text ahead of a default can hold an annotation
    if (p.substr(0, p.find('=')).find(':') != std::string::npos) return line;
    if (!args.empty()) args += ", ";
    args += annotateParam(p, fn);
  }
  if (params.empty()) args = argsText;
  return line.substr(0, open + 1) + args + ") -> " + fn.returnType + ":" + line.substr(colon + 1);
}

std::string annotateVariableLine(const std::string& line, const std::string& name, const VariableTypeInfo& var) {
  if (line.find(name + ":") != std::string::npos) return line;
  std::size_t i = 0;
  while (i < line.size() && isSpace(line[i])) { ++i; }
  if (line.compare(i, name.size(), name) != 0) return line;
  const std::size_t afterName = i + name.size();
  std::size_t eq = afterName;
  while (eq < line.size() && isSpace(line[eq])) { ++eq; }
  if (eq >= line.size() || line[eq] != '=') return line;
  if (eq + 1 < line.size() && line[eq + 1] == '=') return line;
  return line.substr(0, afterName) + ": " + var.type + line.substr(afterName);
}

}  // namespace

std::string AnnotateSource(const std::string& source, const TypeInfo& info) {
  auto lines = splitLines(source);
  const auto lineAt = [&lines](const int line) -> std::string* {
    if (line <= 0 || static_cast<std::size_t>(line) > lines.size()) return nullptr;
    return &lines[static_cast<std::size_t>(line) - 1];
  };
  for (const auto& [name, fn] : info.functions) {
    if (std::string* text = lineAt(fn.line)) *text = annotateFunctionLine(*text, name, fn);
  }
  for (const auto& [name, var] : info.variables) {
    if (std::string* text = lineAt(var.line)) *text = annotateVariableLine(*text, name, var);
  }
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i != 0) out.push_back('\n');
    out += lines[i];
  }
  return out;
}

}  // namespace pyinfer::annotate
