// list_reconciliation.h - Ordered sequence -> Seq* operations
//
// Policy:
//   1. Trim the common prefix and suffix; unchanged elements are never touched.
//   2. When the right window is longer and the whole left window reappears in
//      it at some offset k (largest k wins), the change is pure insertion: add
//      the k elements before it and the remaining ones after it, ascending.
//   3. Otherwise compare the middle window positionally up to the shorter
//      length and emit SeqNestedAt (same runtime type, diff-capable) or
//      SeqReplaceAt for each differing position.
//   4. Remove the excess tail of the left window in descending index order, or
//      add the new tail of the right window in ascending index order.
// Applying the ops in emission order to `left` yields `right`.
//
// ElementOps provides, for the element type E:
//   static bool equal(const E&, const E&, ComparerContext&);
//   static bool can_nest(const E&, const E&, const ComparerContext&);
//   static void compute_nested(const E&, const E&, ComparerContext&, DeltaDocument&);
//   static std::any payload(const E&);

#pragma once

#include <deep_delta/comparer_context.h>
#include <deep_delta/delta_document.h>

#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <any>
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace deep_delta {

namespace detail {

template <typename ElementOps, typename E>
std::any nested_fallback(const E& right, const ComparerContext& ctx) {
    return ctx.options().embed_nested_fallback ? ElementOps::payload(right) : std::any{};
}

/// SeqNestedAt when the pair can be patched in place, SeqReplaceAt otherwise
template <typename ElementOps, typename E>
void write_changed_element(const E& l, const E& r, std::size_t pos, int member_index, ComparerContext& ctx,
                           DeltaWriter& writer) {
    if (ElementOps::can_nest(l, r, ctx)) {
        DeltaDocument nested;
        ElementOps::compute_nested(l, r, ctx, nested);
        if (!nested.empty()) {
            writer.write_seq_nested_at(member_index, static_cast<int>(pos), std::move(nested),
                                       nested_fallback<ElementOps>(r, ctx));
            return;
        }
    }
    writer.write_seq_replace_at(member_index, static_cast<int>(pos), ElementOps::payload(r));
}

} // namespace detail

/// Window bounds found by prefix/suffix trimming
struct ListWindow {
    std::size_t prefix = 0;
    std::size_t suffix = 0;
    std::size_t left_count = 0;  // remaining left elements
    std::size_t right_count = 0; // remaining right elements

    [[nodiscard]] bool unchanged() const noexcept { return left_count == 0 && right_count == 0; }
};

template <typename ElementOps, typename List>
[[nodiscard]] ListWindow trim_list(const List& left, const List& right, ComparerContext& ctx) {
    const std::size_t na      = left.size();
    const std::size_t nb      = right.size();
    const std::size_t shorter = std::min(na, nb);

    ListWindow window;
    while (window.prefix < shorter && ElementOps::equal(left[window.prefix], right[window.prefix], ctx)) {
        ++window.prefix;
    }
    while (window.suffix < shorter - window.prefix &&
           ElementOps::equal(left[na - 1 - window.suffix], right[nb - 1 - window.suffix], ctx)) {
        ++window.suffix;
    }
    window.left_count  = na - window.prefix - window.suffix;
    window.right_count = nb - window.prefix - window.suffix;
    return window;
}

/// Largest offset k at which the left window reappears unchanged inside the
/// longer right window, or nullopt when the change is not pure insertion
template <typename ElementOps, typename List>
[[nodiscard]] std::optional<std::size_t> find_insert_alignment(const List& left, const List& right,
                                                               const ListWindow& window, ComparerContext& ctx) {
    if (window.left_count == 0 || window.right_count <= window.left_count) {
        return std::nullopt;
    }
    const std::size_t budget = window.right_count - window.left_count;
    for (std::size_t k = budget + 1; k-- > 0;) {
        bool match = true;
        for (std::size_t i = 0; i < window.left_count && match; ++i) {
            match = ElementOps::equal(left[window.prefix + i], right[window.prefix + k + i], ctx);
        }
        if (match) {
            return k;
        }
    }
    return std::nullopt;
}

template <typename ElementOps, typename List>
void reconcile_list(const List& left, const List& right, int member_index, ComparerContext& ctx,
                    DeltaWriter& writer) {
    const ListWindow window = trim_list<ElementOps>(left, right, ctx);
    if (window.unchanged()) {
        return;
    }

    if (auto offset = find_insert_alignment<ElementOps>(left, right, window, ctx)) {
        const std::size_t budget = window.right_count - window.left_count;
        for (std::size_t i = 0; i < budget; ++i) {
            const std::size_t pos = window.prefix + (i < *offset ? i : window.left_count + i);
            writer.write_seq_add_at(member_index, static_cast<int>(pos), ElementOps::payload(right[pos]));
        }
        return;
    }

    const std::size_t common = std::min(window.left_count, window.right_count);
    for (std::size_t i = 0; i < common; ++i) {
        const std::size_t pos = window.prefix + i;
        if (!ElementOps::equal(left[pos], right[pos], ctx)) {
            detail::write_changed_element<ElementOps>(left[pos], right[pos], pos, member_index, ctx, writer);
        }
    }

    if (window.left_count > window.right_count) {
        for (std::size_t i = window.left_count; i-- > window.right_count;) {
            writer.write_seq_remove_at(member_index, static_cast<int>(window.prefix + i));
        }
    } else {
        for (std::size_t i = window.left_count; i < window.right_count; ++i) {
            const std::size_t pos = window.prefix + i;
            writer.write_seq_add_at(member_index, static_cast<int>(pos), ElementOps::payload(right[pos]));
        }
    }
}

/// Order-insensitive sequences whose elements carry a key. Elements are
/// matched by key, duplicates in order of appearance, and reordering alone
/// emits nothing:
///   1. left elements without a partner are removed, descending;
///   2. matched pairs that differ are patched at their index after the removals;
///   3. right elements without a partner are appended, ascending.
/// The patched list holds the same elements as `right`, not necessarily in
/// the same order. Keys must be hashable with boost::hash.
template <typename ElementOps, typename List, typename KeyOf>
void reconcile_keyed_list(const List& left, const List& right, int member_index, const KeyOf& key_of,
                          ComparerContext& ctx, DeltaWriter& writer) {
    using element_type = typename List::value_type;
    using key_type     = std::decay_t<std::invoke_result_t<const KeyOf&, const element_type&>>;
    constexpr std::size_t unmatched = static_cast<std::size_t>(-1);

    std::unordered_map<key_type, std::deque<std::size_t>, boost::hash<key_type>> by_key;
    for (std::size_t j = 0; j < right.size(); ++j) {
        by_key[std::invoke(key_of, right[j])].push_back(j);
    }

    std::vector<std::size_t> partner(left.size(), unmatched);
    std::vector<bool> claimed(right.size(), false);
    for (std::size_t i = 0; i < left.size(); ++i) {
        auto it = by_key.find(std::invoke(key_of, left[i]));
        if (it == by_key.end() || it->second.empty()) {
            continue;
        }
        partner[i] = it->second.front();
        claimed[partner[i]] = true;
        it->second.pop_front();
    }

    for (std::size_t i = left.size(); i-- > 0;) {
        if (partner[i] == unmatched) {
            writer.write_seq_remove_at(member_index, static_cast<int>(i));
        }
    }

    std::size_t kept = 0;
    for (std::size_t i = 0; i < left.size(); ++i) {
        if (partner[i] == unmatched) {
            continue;
        }
        const std::size_t pos = kept++;
        if (!ElementOps::equal(left[i], right[partner[i]], ctx)) {
            detail::write_changed_element<ElementOps>(left[i], right[partner[i]], pos, member_index, ctx, writer);
        }
    }

    for (std::size_t j = 0; j < right.size(); ++j) {
        if (!claimed[j]) {
            writer.write_seq_add_at(member_index, static_cast<int>(kept++), ElementOps::payload(right[j]));
        }
    }
}

/// Multiset equality for order-insensitive sequences (O(n^2) matching)
template <typename ElementOps, typename List>
[[nodiscard]] bool are_equal_unordered(const List& left, const List& right, ComparerContext& ctx) {
    if (left.size() != right.size()) {
        return false;
    }
    std::vector<bool> matched(right.size(), false);
    for (std::size_t i = 0; i < left.size(); ++i) {
        bool found = false;
        for (std::size_t j = 0; j < right.size(); ++j) {
            if (!matched[j] && ElementOps::equal(left[i], right[j], ctx)) {
                matched[j] = true;
                found      = true;
                break;
            }
        }
        if (!found) {
            return false;
        }
    }
    return true;
}

} // namespace deep_delta
