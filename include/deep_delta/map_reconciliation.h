// map_reconciliation.h - Key/value map -> Dict* operations
//
// Keys are looked up with the containers' own comparator or hasher, so maps
// keyed case-insensitively reconcile case-insensitively. Removals are emitted
// first (left iteration order), then sets and nested updates in right
// iteration order.
//
// ValueOps has the same shape as the ElementOps of list_reconciliation.h.

#pragma once

#include <deep_delta/comparer_context.h>
#include <deep_delta/delta_document.h>
#include <deep_delta/list_reconciliation.h>

#include <any>
#include <utility>

namespace deep_delta {

template <typename ValueOps, typename Map>
void reconcile_map(const Map& left, const Map& right, int member_index, ComparerContext& ctx,
                   DeltaWriter& writer) {
    for (const auto& entry : left) {
        if (right.find(entry.first) == right.end()) {
            writer.write_dict_remove(member_index, std::any(entry.first));
        }
    }

    for (const auto& entry : right) {
        const auto& rv = entry.second;
        auto it = left.find(entry.first);
        if (it == left.end()) {
            writer.write_dict_set(member_index, std::any(entry.first), ValueOps::payload(rv));
            continue;
        }
        const auto& lv = it->second;
        if (ValueOps::equal(lv, rv, ctx)) {
            continue;
        }
        if (ValueOps::can_nest(lv, rv, ctx)) {
            DeltaDocument nested;
            ValueOps::compute_nested(lv, rv, ctx, nested);
            if (!nested.empty()) {
                writer.write_dict_nested(member_index, std::any(entry.first), std::move(nested),
                                         detail::nested_fallback<ValueOps>(rv, ctx));
                continue;
            }
        }
        writer.write_dict_set(member_index, std::any(entry.first), ValueOps::payload(rv));
    }
}

/// Same key set (per the containers' comparator) and deep-equal values
template <typename ValueOps, typename Map>
[[nodiscard]] bool are_equal_maps(const Map& left, const Map& right, ComparerContext& ctx) {
    if (left.size() != right.size()) {
        return false;
    }
    for (const auto& entry : left) {
        auto it = right.find(entry.first);
        if (it == right.end() || !ValueOps::equal(entry.second, it->second, ctx)) {
            return false;
        }
    }
    return true;
}

} // namespace deep_delta
