/**
 * @file
 * @brief TypeDescriptor helpers: placeholders, top-level splitting, element types.
 */
#include "sema/TypeDescriptor.h"
#include "sema/Unify.h"

#include <string>
#include <vector>

namespace pyinfer::sema {

namespace {
constexpr const char* kDeferredPrefix = "deferred(";
constexpr std::size_t kDeferredPrefixLen = 9;

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) { ++b; }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) { --e; }
    return s.substr(b, e - b);
}
} // namespace

bool IsAny(const TypeDescriptor& t) { return t.empty() || t == types::kAny; }

bool IsNumeric(const TypeDescriptor& t) { return t == types::kInt || t == types::kFloat; }

TypeDescriptor MakeDeferred(const std::string& name) { return std::string(kDeferredPrefix) + name + ")"; }

bool IsDeferred(const TypeDescriptor& t) {
    return t.size() > kDeferredPrefixLen + 1 && t.compare(0, kDeferredPrefixLen, kDeferredPrefix) == 0 &&
           t.back() == ')';
}

std::string DeferredTarget(const TypeDescriptor& t) {
    if (!IsDeferred(t)) { return {}; }
    return t.substr(kDeferredPrefixLen, t.size() - kDeferredPrefixLen - 1);
}

std::vector<std::string> SplitTopLevel(const std::string& text, const std::string& sep) {
    std::vector<std::string> out;
    if (sep.empty()) { out.push_back(trim(text)); return out; }
    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '[' || c == '(' || c == '{') { ++depth; continue; }
        if (c == ']' || c == ')' || c == '}') { if (depth > 0) { --depth; } continue; }
        if (depth == 0 && text.compare(i, sep.size(), sep) == 0) {
            out.push_back(trim(text.substr(start, i - start)));
            i += sep.size() - 1;
            start = i + 1;
        }
    }
    out.push_back(trim(text.substr(start)));
    return out;
}

bool SplitGeneric(const TypeDescriptor& t, std::string& head, std::vector<TypeDescriptor>& args) {
    const auto open = t.find('[');
    if (open == std::string::npos || t.empty() || t.back() != ']') { return false; }
    // "list[int] | None" is a union, not a parametrized head
    if (UnionMembers(t).size() > 1) { return false; }
    head = t.substr(0, open);
    args = SplitTopLevel(t.substr(open + 1, t.size() - open - 2), ",");
    return true;
}

std::string BaseName(const TypeDescriptor& t) {
    std::string head;
    std::vector<TypeDescriptor> args;
    if (SplitGeneric(t, head, args)) { return head; }
    return t;
}

std::vector<TypeDescriptor> UnionMembers(const TypeDescriptor& t) { return SplitTopLevel(t, types::kUnionSep); }

std::string JoinTypes(const std::vector<TypeDescriptor>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) { out += sep; }
        out += parts[i];
    }
    return out;
}

TypeDescriptor ElementType(const TypeDescriptor& t) {
    if (t == types::kStr) { return types::kStr; }
    if (t == types::kBytes || t == types::kRange) { return types::kInt; }
    std::string head;
    std::vector<TypeDescriptor> args;
    if (!SplitGeneric(t, head, args) || args.empty()) { return types::kAny; }
    if (head == types::kList || head == types::kSet || head == "frozenset" || head == "iterator" ||
        head == types::kDict) {
        return args.front();
    }
    if (head == types::kTuple) {
        if (args.size() == 2 && args[1] == "...") { return args.front(); }
        return Unify(args);
    }
    return types::kAny;
}

} // namespace pyinfer::sema
