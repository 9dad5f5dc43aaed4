/***
 * Name: pyinfer::sema::Unify / UnionOf / SampleIndices
 * Purpose: Merge several descriptors into one summary descriptor.
 * Theory of Operation:
 *   Members of incoming unions are flattened and de-duplicated in first-seen
 *   order. Any among the inputs makes the result Any.
 *   Unify (containers, conditional expressions):
 *     - one distinct member -> that member
 *     - int together with float -> float
 *     - a numeric member together with str -> Any
 *     - otherwise a union of at most kUnionArity members, else Any
 *   UnionOf (function returns) skips the numeric rules and only caps arity.
 *   SampleIndices picks at most kSampleLimit positions with an even stride
 *   that always contains the first and the last position.
 */
#pragma once

#include <cstddef>
#include <vector>
#include "sema/TypeDescriptor.h"

namespace pyinfer::sema {

    TypeDescriptor Unify(const std::vector<TypeDescriptor>& types);

    TypeDescriptor UnionOf(const std::vector<TypeDescriptor>& types);

    std::vector<std::size_t> SampleIndices(std::size_t count);

} // namespace pyinfer::sema
