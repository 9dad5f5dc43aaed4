/***
 * Name: pyinfer::sema::InferenceLimits
 * Purpose: Bounds that keep container inference and unions small.
 */
#pragma once

#include <cstddef>

namespace pyinfer::sema {
    struct InferenceLimits {
        // Elements inspected per container literal
        static constexpr std::size_t kSampleLimit = 10;
        // Longest tuple reported position by position
        static constexpr std::size_t kExactTupleArity = 8;
        // Most alternatives a union may carry before collapsing to Any
        static constexpr std::size_t kUnionArity = 3;
    };
} // namespace pyinfer::sema
