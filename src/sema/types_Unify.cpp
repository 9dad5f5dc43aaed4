/**
 * @file
 * @brief Unify/UnionOf/SampleIndices: bounded merging of inferred descriptors.
 */
#include "sema/Unify.h"
#include "sema/InferenceLimits.h"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace pyinfer::sema {

namespace {
// Flattened, de-duplicated members in first-seen order; false when Any was seen.
bool collectMembers(const std::vector<TypeDescriptor>& types, std::vector<TypeDescriptor>& out) {
    for (const auto& t : types) {
        for (auto& member : UnionMembers(t)) {
            if (IsAny(member)) { return false; }
            if (std::find(out.begin(), out.end(), member) == out.end()) { out.push_back(std::move(member)); }
        }
    }
    return true;
}

TypeDescriptor capped(const std::vector<TypeDescriptor>& members) {
    if (members.empty() || members.size() > InferenceLimits::kUnionArity) { return types::kAny; }
    return JoinTypes(members, types::kUnionSep);
}
} // namespace

TypeDescriptor Unify(const std::vector<TypeDescriptor>& types) {
    std::vector<TypeDescriptor> members;
    if (!collectMembers(types, members)) { return types::kAny; }
    if (members.size() == 1) { return members.front(); }

    const auto has = [&](const char* name) { return std::find(members.begin(), members.end(), name) != members.end(); };
    const bool hasInt = has(types::kInt);
    const bool hasFloat = has(types::kFloat);
    if ((hasInt || hasFloat) && has(types::kStr)) { return types::kAny; }
    if (hasInt && hasFloat) {
        // int widens into float at the position of the first numeric member
        std::vector<TypeDescriptor> widened;
        bool placed = false;
        for (const auto& m : members) {
            if (IsNumeric(m)) {
                if (!placed) { widened.emplace_back(types::kFloat); placed = true; }
                continue;
            }
            widened.push_back(m);
        }
        members.swap(widened);
        if (members.size() == 1) { return members.front(); }
    }
    return capped(members);
}

TypeDescriptor UnionOf(const std::vector<TypeDescriptor>& types) {
    std::vector<TypeDescriptor> members;
    if (!collectMembers(types, members)) { return types::kAny; }
    return capped(members);
}

std::vector<std::size_t> SampleIndices(const std::size_t count) {
    std::vector<std::size_t> out;
    if (count <= InferenceLimits::kSampleLimit) {
        for (std::size_t i = 0; i < count; ++i) { out.push_back(i); }
        return out;
    }
    const std::size_t slots = InferenceLimits::kSampleLimit - 1;
    for (std::size_t i = 0; i <= slots; ++i) { out.push_back(i * (count - 1) / slots); }
    return out;
}

} // namespace pyinfer::sema
