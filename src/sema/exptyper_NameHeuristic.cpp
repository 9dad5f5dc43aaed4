/**
 * @file
 * @brief NameHeuristic: guess a type from how an identifier is spelled.
 */
#include "sema/TypeInference.h"
#include "sema/detail/exptyper/BuiltinTables.h"
#include "pyinfer/support/unicode.h"

#include <string>

namespace pyinfer::sema {

TypeDescriptor NameHeuristic(const std::string& identifier) {
    const std::string folded = support::FoldCase(identifier);
    for (const auto& [pattern, type] : detail::namePatternTable()) {
        if (folded.find(pattern) != std::string::npos) return type;
    }
    // Plural names usually hold collections
    if (identifier.size() > 1 && identifier.back() == 's') return types::kList;
    return types::kAny;
}

} // namespace pyinfer::sema
