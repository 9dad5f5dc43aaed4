/**
 * @file
 * @brief projectAttribute / projectSubscript: fixed per-base-type projection tables.
 */
#include "sema/detail/exptyper/AccessHandlers.h"
#include "sema/detail/exptyper/BuiltinTables.h"
#include "sema/Unify.h"
#include "ast/IntLiteral.h"
#include "ast/Unary.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pyinfer::sema::detail {

namespace {
// Decimal integer literal spelling, underscores allowed.
std::optional<long long> decimalValue(const std::string& spelling) {
    long long v = 0;
    bool any = false;
    for (const char c : spelling) {
        if (c == '_') continue;
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + (c - '0');
        any = true;
        if (v > 1000000) return std::nullopt;
    }
    if (!any) return std::nullopt;
    return v;
}

std::optional<long long> literalIndex(const ast::Expr& index) {
    if (index.kind == ast::NodeKind::IntLiteral) {
        return decimalValue(static_cast<const ast::IntLiteral&>(index).value);
    }
    if (index.kind == ast::NodeKind::UnaryExpr) {
        const auto& u = static_cast<const ast::Unary&>(index);
        if (u.op == ast::UnaryOperator::Neg && u.operand && u.operand->kind == ast::NodeKind::IntLiteral) {
            const auto v = decimalValue(static_cast<const ast::IntLiteral&>(*u.operand).value);
            if (v) return -*v;
        }
    }
    return std::nullopt;
}
} // namespace

TypeDescriptor projectAttribute(const TypeDescriptor& base, const std::string& module, const std::string& attr) {
    if (!module.empty()) {
        const auto& table = moduleAttributeTable();
        const auto it = table.find(module + "." + attr);
        return it == table.end() ? TypeDescriptor{types::kAny} : it->second;
    }
    if (attr == "real" || attr == "imag") {
        if (base == types::kInt) return types::kInt;
        if (base == types::kFloat || base == types::kComplex) return types::kFloat;
    }
    if ((attr == "numerator" || attr == "denominator") && base == types::kInt) return types::kInt;
    return types::kAny;
}

TypeDescriptor projectSubscript(const TypeDescriptor& base, const ast::Expr& index) {
    const bool isSlice = index.kind == ast::NodeKind::Slice;
    if (base == types::kStr) return types::kStr;
    if (base == types::kBytes) return isSlice ? types::kBytes : types::kInt;

    std::string head;
    std::vector<TypeDescriptor> args;
    const bool generic = SplitGeneric(base, head, args);
    const std::string container = generic ? head : base;

    if (container == types::kList) {
        if (isSlice) return base;
        return generic && !args.empty() ? args.front() : TypeDescriptor{types::kAny};
    }
    if (container == types::kDict) {
        if (isSlice || !generic || args.size() != 2) return types::kAny;
        return args[1];
    }
    if (container == types::kTuple) {
        if (isSlice) return generic ? base : TypeDescriptor{types::kTuple};
        if (!generic || args.empty()) return types::kAny;
        if (args.size() == 2 && args[1] == "...") return args.front();
        if (const auto idx = literalIndex(index)) {
            const auto n = static_cast<long long>(args.size());
            const long long pos = *idx < 0 ? *idx + n : *idx;
            if (pos >= 0 && pos < n) return args[static_cast<std::size_t>(pos)];
            return types::kAny;
        }
        return Unify(args);
    }
    return types::kAny;
}

} // namespace pyinfer::sema::detail
