/**
 * @file
 * @brief NormalizeType: final clean-up applied to every synthesized type.
 */
#include "annotate/Annotator.h"
#include "sema/TypeDescriptor.h"

#include <array>
#include <cctype>
#include <cstddef>
#include <string>
#include <utility>

namespace pyinfer::annotate {

namespace {

bool isIdentChar(const char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) { ++b; }
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) { --e; }
  return s.substr(b, e - b);
}

// Replace whole identifiers only ("NoneType" but not "MyNoneTypeX").
std::string replaceIdentifier(const std::string& text, const std::string& from, const std::string& to) {
  std::string out;
  std::size_t i = 0;
  while (i < text.size()) {
    const auto hit = text.find(from, i);
    if (hit == std::string::npos) break;
    const bool leftOk = hit == 0 || !isIdentChar(text[hit - 1]);
    const std::size_t end = hit + from.size();
    const bool rightOk = end >= text.size() || !isIdentChar(text[end]);
    out.append(text, i, hit - i);
    out.append(leftOk && rightOk ? to : from);
    i = end;
  }
  out.append(text, i, std::string::npos);
  return out;
}

}  // namespace

std::string NormalizeType(const std::string& type) {
  std::string t = trim(type);
  if (t.empty() || t == "unknown" || t.find("deferred(") != std::string::npos) return sema::types::kAny;
  static const std::array<std::pair<const char*, const char*>, 3> kAliases{{
      {"NoneType", "None"},
      {"TextIOWrapper", "TextIO"},
      {"generator", "Generator"},
  }};
  for (const auto& [from, to] : kAliases) { t = replaceIdentifier(t, from, to); }
  return t;
}

}  // namespace pyinfer::annotate
