// node_ops.h - Category dispatch for equality, diff, delta and apply
//
// NodeOps<V> selects the operations for a member or element type V from its
// category (see concepts.h). Every ops struct exposes:
//
//   structural       member changes can be expressed below whole-value level
//   nestable         elements / map values can carry a nested document
//   equal            deep equality under the context's options
//   can_nest         both sides can be patched with a nested document
//                    (registered types are looked up in the context's registry)
//   compute_nested   write the nested document for (a -> b)
//   payload          wrap a value as an op payload
//   repopulate       in-place replacement for get-only members
//
// Structural categories add delta_member / diff_member / apply_member, and
// nestable categories add accepts / apply_nested.
//
// Objects (registered class types and shared_ptr targets) are dispatched
// through a type registry by runtime type: the ComparerContext's registry on
// the compare side, the registry passed to apply_delta on the apply side.

#pragma once

#include <deep_delta/comparer_context.h>
#include <deep_delta/concepts.h>
#include <deep_delta/delta_document.h>
#include <deep_delta/diff.h>
#include <deep_delta/dynamic_comparer.h>
#include <deep_delta/errors.h>
#include <deep_delta/list_reconciliation.h>
#include <deep_delta/logging.h>
#include <deep_delta/map_reconciliation.h>
#include <deep_delta/member_policy.h>
#include <deep_delta/scalar_equality.h>
#include <deep_delta/type_registry.h>

#include <any>
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace deep_delta {

template <typename V> struct LeafOps;
template <typename V> struct ScalarOps;
template <typename V> struct OptionalOps;
template <typename V> struct FixedArrayOps;
template <typename V> struct SequenceOps;
template <typename V> struct MapOps;
template <typename V> struct ObjectOps;
template <typename V> struct ReferenceOps;
struct DynamicOps;

namespace detail {

template <typename V>
auto select_node_ops() {
    if constexpr (DynamicType<V>) {
        return std::type_identity<DynamicOps>{};
    } else if constexpr (ScalarType<V>) {
        return std::type_identity<ScalarOps<V>>{};
    } else if constexpr (OptionalType<V>) {
        return std::type_identity<OptionalOps<V>>{};
    } else if constexpr (FixedArrayType<V>) {
        return std::type_identity<FixedArrayOps<V>>{};
    } else if constexpr (SequenceType<V>) {
        return std::type_identity<SequenceOps<V>>{};
    } else if constexpr (MapType<V>) {
        return std::type_identity<MapOps<V>>{};
    } else if constexpr (ReferenceType<V>) {
        return std::type_identity<ReferenceOps<V>>{};
    } else {
        static_assert(ObjectType<V>, "deep_delta: unsupported member type");
        return std::type_identity<ObjectOps<V>>{};
    }
}

} // namespace detail

template <typename V>
using NodeOps = typename decltype(detail::select_node_ops<V>())::type;

// ============================================================
// Helpers
// ============================================================

namespace detail {

template <typename T>
const T& payload_as(const std::any& payload, std::string_view where) {
    if (auto* value = std::any_cast<T>(&payload)) {
        return *value;
    }
    throw delta_type_mismatch(std::string(where) + ": payload does not hold " + typeid(T).name());
}

/// allow_end: the index may equal the size (insertion / append)
inline void check_index(int index, std::size_t size, bool allow_end) {
    if (index < 0) {
        throw delta_index_out_of_range(index, size);
    }
    const auto pos = static_cast<std::size_t>(index);
    if (pos > size || (!allow_end && pos == size)) {
        throw delta_index_out_of_range(index, size);
    }
}

template <typename X>
const std::type_info& runtime_type(const X& obj) noexcept {
    if constexpr (std::is_polymorphic_v<X>) {
        return typeid(obj);
    } else {
        return typeid(X);
    }
}

template <typename X>
const void* most_derived(const X* ptr) noexcept {
    if constexpr (std::is_polymorphic_v<X>) {
        return dynamic_cast<const void*>(ptr);
    } else {
        return static_cast<const void*>(ptr);
    }
}

template <typename X>
void* most_derived(X* ptr) noexcept {
    if constexpr (std::is_polymorphic_v<X>) {
        return dynamic_cast<void*>(ptr);
    } else {
        return static_cast<void*>(ptr);
    }
}

/// Registry entry for an object seen through a pointer of static type X:
/// the runtime type first, then X itself.
struct ResolvedOps {
    std::shared_ptr<const TypeOps> ops;
    bool exact = true; // ops are for the runtime type (address the most-derived object)

    explicit operator bool() const noexcept { return ops != nullptr; }
};

template <typename X>
ResolvedOps resolve_ops(const X& obj, const TypeRegistry& registry) {
    const std::type_info& type = runtime_type(obj);
    if (auto ops = registry.find(type)) {
        return {std::move(ops), true};
    }
    if (type != typeid(X)) {
        if (auto ops = registry.find(typeid(X))) {
            return {std::move(ops), false};
        }
    }
    return {};
}

template <typename X>
const void* address_for(const X* ptr, const ResolvedOps& resolved) noexcept {
    return resolved.exact ? most_derived(ptr) : static_cast<const void*>(ptr);
}

template <typename X>
void* address_for(X* ptr, const ResolvedOps& resolved) noexcept {
    return resolved.exact ? most_derived(ptr) : static_cast<void*>(ptr);
}

/// Applies a nested op (NestedMember / SeqNestedAt / DictNested) to a value.
/// A document that no longer fits the target falls back to the op's
/// replacement payload; without one the mismatch is propagated.
template <typename V>
void apply_nested_op(V& target, const DeltaOp& op, std::string_view where, const TypeRegistry& registry) {
    if constexpr (NodeOps<V>::nestable) {
        const DeltaDocument* doc = op.nested_doc();
        if (doc && NodeOps<V>::accepts(target, *doc, registry)) {
            NodeOps<V>::apply_nested(target, *doc, registry);
            return;
        }
    }
    if (auto* fallback = op.value_if<V>()) {
        log_apply_warning(where, "nested document does not fit the target, applying replacement payload");
        target = *fallback;
        return;
    }
    throw delta_type_mismatch(std::string(where) + ": nested document does not fit the target");
}

[[noreturn]] inline void throw_inapplicable(DeltaKind kind, int member_index, std::string_view category) {
    throw delta_type_mismatch("apply_delta: " + std::string(to_string(kind)) + " cannot be applied to " +
                              std::string(category) + " member " + std::to_string(member_index));
}

} // namespace detail

// ============================================================
// Leaf categories: whole-value replacement only
// ============================================================

template <typename V>
struct LeafOps {
    static constexpr bool structural = false;
    static constexpr bool nestable   = false;

    static bool can_nest(const V&, const V&, const ComparerContext&) noexcept { return false; }
    static void compute_nested(const V&, const V&, ComparerContext&, DeltaDocument&) {}
    static std::any payload(const V& value) { return std::any(value); }
    static void repopulate(V& target, const V& source) { target = source; }
};

template <typename V>
struct ScalarOps : LeafOps<V> {
    static bool equal(const V& a, const V& b, ComparerContext& ctx) {
        return are_equal_scalar(a, b, ctx.options());
    }
};

template <typename V>
struct OptionalOps : LeafOps<V> {
    using element_type = typename V::value_type;

    static bool equal(const V& a, const V& b, ComparerContext& ctx) {
        if (a.has_value() != b.has_value()) {
            return false;
        }
        return !a.has_value() || NodeOps<element_type>::equal(*a, *b, ctx);
    }
};

template <typename V>
struct FixedArrayOps : LeafOps<V> {
    using element_type = typename V::value_type;

    static bool equal(const V& a, const V& b, ComparerContext& ctx) {
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!NodeOps<element_type>::equal(a[i], b[i], ctx)) {
                return false;
            }
        }
        return true;
    }
};

// ============================================================
// Ordered sequences
// ============================================================

template <typename V>
struct SequenceOps {
    using element_type = typename V::value_type;
    using element_ops  = NodeOps<element_type>;

    static constexpr bool structural = true;
    static constexpr bool nestable   = false;

    static bool equal(const V& a, const V& b, ComparerContext& ctx) {
        if (&a == &b) {
            return true;
        }
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!element_ops::equal(a[i], b[i], ctx)) {
                return false;
            }
        }
        return true;
    }

    static bool can_nest(const V&, const V&, const ComparerContext&) noexcept { return false; }
    static void compute_nested(const V&, const V&, ComparerContext&, DeltaDocument&) {}
    static std::any payload(const V& value) { return std::any(value); }

    static void repopulate(V& target, const V& source) {
        target.clear();
        target.insert(target.end(), source.begin(), source.end());
    }

    static void delta_member(const V& a, const V& b, int member_index, ComparerContext& ctx,
                             DeltaWriter& writer) {
        reconcile_list<element_ops>(a, b, member_index, ctx, writer);
    }

    static void diff_member(const V& a, const V& b, int member_index, ComparerContext& ctx,
                            std::vector<MemberChange>& out) {
        DeltaDocument ops;
        DeltaWriter writer(ops);
        reconcile_list<element_ops>(a, b, member_index, ctx, writer);
        if (!ops.empty()) {
            out.push_back(MemberChange::collection_ops(member_index, std::move(ops)));
        }
    }

    static void apply_member(V& target, const DeltaOp& op, const TypeRegistry& registry) {
        switch (op.kind) {
        case DeltaKind::SeqReplaceAt:
            detail::check_index(op.index, target.size(), false);
            target[static_cast<std::size_t>(op.index)] =
                detail::payload_as<element_type>(op.value, "SeqReplaceAt");
            break;
        case DeltaKind::SeqAddAt:
            detail::check_index(op.index, target.size(), true);
            target.insert(target.begin() + op.index, detail::payload_as<element_type>(op.value, "SeqAddAt"));
            break;
        case DeltaKind::SeqRemoveAt:
            detail::check_index(op.index, target.size(), false);
            target.erase(target.begin() + op.index);
            break;
        case DeltaKind::SeqNestedAt:
            detail::check_index(op.index, target.size(), false);
            if constexpr (std::is_same_v<element_type, bool>) {
                bool element = target[static_cast<std::size_t>(op.index)];
                detail::apply_nested_op<bool>(element, op, "SeqNestedAt", registry);
                target[static_cast<std::size_t>(op.index)] = element;
            } else {
                detail::apply_nested_op<element_type>(target[static_cast<std::size_t>(op.index)], op,
                                                      "SeqNestedAt", registry);
            }
            break;
        default:
            detail::throw_inapplicable(op.kind, op.member_index, "sequence");
        }
    }
};

// ============================================================
// Key/value maps
// ============================================================

template <typename V>
struct MapOps {
    using key_type    = typename V::key_type;
    using mapped_type = typename V::mapped_type;
    using value_ops   = NodeOps<mapped_type>;

    static constexpr bool structural = true;
    static constexpr bool nestable   = false;

    static bool equal(const V& a, const V& b, ComparerContext& ctx) {
        return &a == &b || are_equal_maps<value_ops>(a, b, ctx);
    }

    static bool can_nest(const V&, const V&, const ComparerContext&) noexcept { return false; }
    static void compute_nested(const V&, const V&, ComparerContext&, DeltaDocument&) {}
    static std::any payload(const V& value) { return std::any(value); }

    static void repopulate(V& target, const V& source) {
        target.clear();
        target.insert(source.begin(), source.end());
    }

    static void delta_member(const V& a, const V& b, int member_index, ComparerContext& ctx,
                             DeltaWriter& writer) {
        reconcile_map<value_ops>(a, b, member_index, ctx, writer);
    }

    static void diff_member(const V& a, const V& b, int member_index, ComparerContext& ctx,
                            std::vector<MemberChange>& out) {
        DeltaDocument ops;
        DeltaWriter writer(ops);
        reconcile_map<value_ops>(a, b, member_index, ctx, writer);
        if (!ops.empty()) {
            out.push_back(MemberChange::collection_ops(member_index, std::move(ops)));
        }
    }

    static void apply_member(V& target, const DeltaOp& op, const TypeRegistry& registry) {
        switch (op.kind) {
        case DeltaKind::DictSet: {
            const auto& key   = detail::payload_as<key_type>(op.key, "DictSet");
            const auto& value = detail::payload_as<mapped_type>(op.value, "DictSet");
            auto it = target.find(key);
            if (it != target.end()) {
                it->second = value; // keeps the stored key
            } else {
                target.emplace(key, value);
            }
            break;
        }
        case DeltaKind::DictRemove: {
            auto it = target.find(detail::payload_as<key_type>(op.key, "DictRemove"));
            if (it != target.end()) {
                target.erase(it);
            }
            break;
        }
        case DeltaKind::DictNested: {
            auto it = target.find(detail::payload_as<key_type>(op.key, "DictNested"));
            if (it == target.end()) {
                detail::log_member_skip("apply_delta", op.member_index,
                                        "DictNested key not present, ignored");
                break;
            }
            detail::apply_nested_op<mapped_type>(it->second, op, "DictNested", registry);
            break;
        }
        default:
            detail::throw_inapplicable(op.kind, op.member_index, "map");
        }
    }
};

// ============================================================
// Nested objects held by value
// ============================================================

template <typename V>
struct ObjectOps {
    static constexpr bool structural = true;
    static constexpr bool nestable   = true;

    static std::shared_ptr<const TypeOps> find_ops(const TypeRegistry& registry) {
        return registry.find(typeid(V));
    }

    static bool equal(const V& a, const V& b, ComparerContext& ctx) {
        if (&a == &b) {
            return true;
        }
        if (auto ops = find_ops(ctx.registry())) {
            return ops->equals(&a, &b, ctx);
        }
        if constexpr (std::equality_comparable<V>) {
            return a == b;
        } else {
            throw type_not_registered(typeid(V).name());
        }
    }

    static bool can_nest(const V&, const V&, const ComparerContext& ctx) {
        return find_ops(ctx.registry()) != nullptr;
    }

    static void compute_nested(const V& a, const V& b, ComparerContext& ctx, DeltaDocument& out) {
        auto ops = ctx.registry().require(typeid(V));
        out.set_target_type(typeid(V));
        DeltaWriter writer(out);
        ops->compute_delta(&a, &b, ctx, writer);
    }

    static bool accepts(const V&, const DeltaDocument& doc, const TypeRegistry& registry) {
        return find_ops(registry) != nullptr && (!doc.target_type() || *doc.target_type() == typeid(V));
    }

    static void apply_nested(V& target, const DeltaDocument& doc, const TypeRegistry& registry) {
        registry.require(typeid(V))->apply_delta(&target, doc, registry);
    }

    static std::any payload(const V& value) { return std::any(value); }
    static void repopulate(V& target, const V& source) { target = source; }

    static void delta_member(const V& a, const V& b, int member_index, ComparerContext& ctx,
                             DeltaWriter& writer) {
        if (can_nest(a, b, ctx)) {
            DeltaDocument nested;
            compute_nested(a, b, ctx, nested);
            if (!nested.empty()) {
                writer.write_nested_member(member_index, std::move(nested),
                                           ctx.options().embed_nested_fallback ? payload(b) : std::any{});
            }
        } else if (!equal(a, b, ctx)) {
            writer.write_set_member(member_index, payload(b));
        }
    }

    static void diff_member(const V& a, const V& b, int member_index, ComparerContext& ctx,
                            std::vector<MemberChange>& out) {
        if (auto ops = find_ops(ctx.registry())) {
            Diff nested = ops->diff(&a, &b, ctx);
            if (!nested.empty()) {
                out.push_back(MemberChange::nested_diff(member_index, std::move(nested)));
            }
        } else if (!equal(a, b, ctx)) {
            out.push_back(MemberChange::set(member_index, payload(b)));
        }
    }

    static void apply_member(V& target, const DeltaOp& op, const TypeRegistry& registry) {
        if (op.kind != DeltaKind::NestedMember) {
            detail::throw_inapplicable(op.kind, op.member_index, "object");
        }
        detail::apply_nested_op<V>(target, op, "NestedMember", registry);
    }

    // Root operations (top-level compute_delta / apply_delta / get_diff)

    static Diff root_diff(const V& a, const V& b, ComparerContext& ctx) {
        if (&a == &b) {
            return {};
        }
        if (auto ops = find_ops(ctx.registry())) {
            return ops->diff(&a, &b, ctx);
        }
        return equal(a, b, ctx) ? Diff{} : Diff::replacement(payload(b));
    }

    static DeltaDocument root_delta(const V& a, const V& b, ComparerContext& ctx) {
        DeltaDocument doc(typeid(V));
        if (&a == &b) {
            return doc;
        }
        if (auto ops = find_ops(ctx.registry())) {
            DeltaWriter writer(doc);
            ops->compute_delta(&a, &b, ctx, writer);
        } else if (!equal(a, b, ctx)) {
            DeltaWriter(doc).write_replace_object(payload(b));
        }
        return doc;
    }

    static void root_apply(V& target, const DeltaDocument& doc, const TypeRegistry& registry) {
        if (auto ops = find_ops(registry)) {
            ops->apply_delta(&target, doc, registry);
            return;
        }
        if (const DeltaOp* replace = doc.find_replace_object()) {
            target = detail::payload_as<V>(replace->value, "ReplaceObject");
            return;
        }
        if (!doc.empty()) {
            throw type_not_registered(typeid(V).name());
        }
    }
};

// ============================================================
// Nullable, possibly polymorphic references
// ============================================================

template <typename V>
struct ReferenceOps {
    using pointee_type = typename V::element_type;

    static constexpr bool structural = true;
    static constexpr bool nestable   = true;

    static bool same_runtime_type(const V& a, const V& b) {
        return detail::runtime_type(*a) == detail::runtime_type(*b);
    }

    static bool equal(const V& a, const V& b, ComparerContext& ctx) {
        if (a.get() == b.get()) {
            return true;
        }
        if (!a || !b || !same_runtime_type(a, b)) {
            return false;
        }
        if (auto resolved = detail::resolve_ops(*a, ctx.registry())) {
            return resolved.ops->equals(detail::address_for(a.get(), resolved),
                                        detail::address_for(b.get(), resolved), ctx);
        }
        if constexpr (std::equality_comparable<pointee_type>) {
            return *a == *b;
        } else {
            throw type_not_registered(detail::runtime_type(*a).name());
        }
    }

    static bool can_nest(const V& a, const V& b, const ComparerContext& ctx) {
        return a && b && same_runtime_type(a, b) && static_cast<bool>(detail::resolve_ops(*a, ctx.registry()));
    }

    static void compute_nested(const V& a, const V& b, ComparerContext& ctx, DeltaDocument& out) {
        auto resolved = detail::resolve_ops(*a, ctx.registry());
        if (!resolved) {
            throw type_not_registered(detail::runtime_type(*a).name());
        }
        out.set_target_type(resolved.ops->type);
        DeltaWriter writer(out);
        resolved.ops->compute_delta(detail::address_for(a.get(), resolved),
                                    detail::address_for(b.get(), resolved), ctx, writer);
    }

    static bool accepts(const V& target, const DeltaDocument& doc, const TypeRegistry& registry) {
        if (!target) {
            return false;
        }
        auto resolved = detail::resolve_ops(*target, registry);
        return resolved && (!doc.target_type() || *doc.target_type() == resolved.ops->type);
    }

    static void apply_nested(V& target, const DeltaDocument& doc, const TypeRegistry& registry) {
        auto resolved = detail::resolve_ops(*target, registry);
        if (!resolved) {
            throw type_not_registered(detail::runtime_type(*target).name());
        }
        resolved.ops->apply_delta(detail::address_for(target.get(), resolved), doc, registry);
    }

    static std::any payload(const V& value) { return std::any(value); }
    static void repopulate(V& target, const V& source) { target = source; }

    static void delta_member(const V& a, const V& b, int member_index, ComparerContext& ctx,
                             DeltaWriter& writer) {
        if (a.get() == b.get()) {
            return;
        }
        if (can_nest(a, b, ctx)) {
            DeltaDocument nested;
            compute_nested(a, b, ctx, nested);
            if (!nested.empty()) {
                writer.write_nested_member(member_index, std::move(nested),
                                           ctx.options().embed_nested_fallback ? payload(b) : std::any{});
            }
        } else if (!equal(a, b, ctx)) {
            writer.write_set_member(member_index, payload(b));
        }
    }

    static void diff_member(const V& a, const V& b, int member_index, ComparerContext& ctx,
                            std::vector<MemberChange>& out) {
        if (a.get() == b.get()) {
            return;
        }
        if (can_nest(a, b, ctx)) {
            auto resolved = detail::resolve_ops(*a, ctx.registry());
            Diff nested = resolved.ops->diff(detail::address_for(a.get(), resolved),
                                             detail::address_for(b.get(), resolved), ctx);
            if (!nested.empty()) {
                out.push_back(MemberChange::nested_diff(member_index, std::move(nested)));
            }
        } else if (!equal(a, b, ctx)) {
            out.push_back(MemberChange::set(member_index, payload(b)));
        }
    }

    static void apply_member(V& target, const DeltaOp& op, const TypeRegistry& registry) {
        if (op.kind != DeltaKind::NestedMember) {
            detail::throw_inapplicable(op.kind, op.member_index, "reference");
        }
        detail::apply_nested_op<V>(target, op, "NestedMember", registry);
    }

    // Root operations

    static Diff root_diff(const V& a, const V& b, ComparerContext& ctx) {
        if (a.get() == b.get()) {
            return {};
        }
        if (!a || !b || !same_runtime_type(a, b)) {
            return Diff::replacement(payload(b));
        }
        if (auto resolved = detail::resolve_ops(*a, ctx.registry())) {
            return resolved.ops->diff(detail::address_for(a.get(), resolved),
                                      detail::address_for(b.get(), resolved), ctx);
        }
        return equal(a, b, ctx) ? Diff{} : Diff::replacement(payload(b));
    }

    static DeltaDocument root_delta(const V& a, const V& b, ComparerContext& ctx) {
        DeltaDocument doc;
        if (a.get() == b.get()) {
            return doc;
        }
        if (!a || !b || !same_runtime_type(a, b)) {
            DeltaWriter(doc).write_replace_object(payload(b));
            return doc;
        }
        if (can_nest(a, b, ctx)) {
            compute_nested(a, b, ctx, doc);
        } else if (!equal(a, b, ctx)) {
            DeltaWriter(doc).write_replace_object(payload(b));
        }
        return doc;
    }

    static void root_apply(V& target, const DeltaDocument& doc, const TypeRegistry& registry) {
        if (const DeltaOp* replace = doc.find_replace_object()) {
            target = detail::payload_as<V>(replace->value, "ReplaceObject");
            return;
        }
        if (doc.empty()) {
            return;
        }
        if (!accepts(target, doc, registry)) {
            throw delta_type_mismatch("apply_delta: document does not fit the target object");
        }
        apply_nested(target, doc, registry);
    }
};

// ============================================================
// Dynamic values
// ============================================================

struct DynamicOps {
    static constexpr bool structural = true;
    static constexpr bool nestable   = true;

    static bool equal(const Value& a, const Value& b, ComparerContext& ctx) {
        return are_equal_dynamic(a, b, ctx);
    }

    static bool can_nest(const Value& a, const Value& b, const ComparerContext&) noexcept {
        return dynamic_reconcilable(a, b);
    }

    static void compute_nested(const Value& a, const Value& b, ComparerContext& ctx, DeltaDocument& out) {
        DeltaWriter writer(out);
        compute_dynamic_delta(a, b, 0, ctx, writer);
    }

    static bool accepts(const Value&, const DeltaDocument& doc, const TypeRegistry&) noexcept {
        return !doc.target_type();
    }

    static void apply_nested(Value& target, const DeltaDocument& doc, const TypeRegistry&) {
        apply_dynamic_delta(target, doc);
    }

    static std::any payload(const Value& value) { return std::any(value); }
    static void repopulate(Value& target, const Value& source) { target = source; }

    static void delta_member(const Value& a, const Value& b, int member_index, ComparerContext& ctx,
                             DeltaWriter& writer) {
        compute_dynamic_delta(a, b, member_index, ctx, writer);
    }

    static void diff_member(const Value& a, const Value& b, int member_index, ComparerContext& ctx,
                            std::vector<MemberChange>& out) {
        if (are_equal_dynamic(a, b, ctx)) {
            return;
        }
        if (dynamic_reconcilable(a, b)) {
            DeltaDocument ops;
            DeltaWriter writer(ops);
            compute_dynamic_delta(a, b, member_index, ctx, writer);
            out.push_back(MemberChange::collection_ops(member_index, std::move(ops)));
        } else {
            out.push_back(MemberChange::set(member_index, payload(b)));
        }
    }

    static void apply_member(Value& target, const DeltaOp& op, const TypeRegistry&) { apply_dynamic_op(target, op); }
};

// ============================================================
// Member-level operations under a MemberPolicy
// ============================================================

/// Registration-time additions to a MemberPolicy that depend on the member type
template <typename V>
struct MemberOverrides {
    /// Replaces deep equality; a member with a comparer changes as a whole value
    MemberComparer<V> comparer;

    /// Order-insensitive sequences: matches elements by key (SchemaBuilder::keyed_member)
    std::function<void(const V&, const V&, int, ComparerContext&, DeltaWriter&)> keyed_delta;
};

template <typename V>
[[nodiscard]] bool member_equal(const V& a, const V& b, const MemberPolicy& policy, ComparerContext& ctx,
                                const MemberOverrides<V>& overrides = {}) {
    if (policy.compare == CompareKind::Skip) {
        return true;
    }
    if (overrides.comparer) {
        return overrides.comparer(a, b);
    }
    if constexpr (ReferenceType<V>) {
        if (policy.compare == CompareKind::Reference) {
            return a.get() == b.get();
        }
    }
    if constexpr (SequenceType<V>) {
        if (policy.order_insensitive) {
            return are_equal_unordered<NodeOps<typename V::value_type>>(a, b, ctx);
        }
    }
    return NodeOps<V>::equal(a, b, ctx);
}

namespace detail {

template <typename V>
bool keyed_sequence(const MemberPolicy& policy, const MemberOverrides<V>& overrides) noexcept {
    return policy.compare == CompareKind::Deep && policy.order_insensitive && !overrides.comparer &&
           static_cast<bool>(overrides.keyed_delta);
}

} // namespace detail

template <typename V>
void delta_member(const V& a, const V& b, int member_index, const MemberPolicy& policy,
                  ComparerContext& ctx, DeltaWriter& writer, const MemberOverrides<V>& overrides = {}) {
    if (policy.compare == CompareKind::Skip) {
        return;
    }
    if (detail::keyed_sequence(policy, overrides)) {
        if (!member_equal(a, b, policy, ctx)) {
            overrides.keyed_delta(a, b, member_index, ctx, writer);
        }
        return;
    }
    if constexpr (NodeOps<V>::structural) {
        if (policy.structural() && !overrides.comparer) {
            NodeOps<V>::delta_member(a, b, member_index, ctx, writer);
            return;
        }
    }
    if (!member_equal(a, b, policy, ctx, overrides)) {
        writer.write_set_member(member_index, NodeOps<V>::payload(b));
    }
}

/// Dirty-path emission. Unless validate_dirty_on_emit is set, a dirty member
/// that changes as a whole value is written without comparing it.
template <typename V>
void delta_dirty_member(const V& a, const V& b, int member_index, const MemberPolicy& policy,
                        ComparerContext& ctx, DeltaWriter& writer, const MemberOverrides<V>& overrides = {}) {
    if (!ctx.options().validate_dirty_on_emit && policy.compare != CompareKind::Skip &&
        !detail::keyed_sequence(policy, overrides)) {
        bool whole_value = !policy.structural() || static_cast<bool>(overrides.comparer);
        if constexpr (!NodeOps<V>::structural) {
            whole_value = true;
        }
        if (whole_value) {
            writer.write_set_member(member_index, NodeOps<V>::payload(b));
            return;
        }
    }
    delta_member(a, b, member_index, policy, ctx, writer, overrides);
}

template <typename V>
void diff_member(const V& a, const V& b, int member_index, const MemberPolicy& policy,
                 ComparerContext& ctx, std::vector<MemberChange>& out, const MemberOverrides<V>& overrides = {}) {
    if (policy.compare == CompareKind::Skip) {
        return;
    }
    if (detail::keyed_sequence(policy, overrides)) {
        if (member_equal(a, b, policy, ctx)) {
            return;
        }
        DeltaDocument ops;
        DeltaWriter writer(ops);
        overrides.keyed_delta(a, b, member_index, ctx, writer);
        if (!ops.empty()) {
            out.push_back(MemberChange::collection_ops(member_index, std::move(ops)));
        }
        return;
    }
    if constexpr (NodeOps<V>::structural) {
        if (policy.structural() && !overrides.comparer) {
            NodeOps<V>::diff_member(a, b, member_index, ctx, out);
            return;
        }
    }
    if (!member_equal(a, b, policy, ctx, overrides)) {
        out.push_back(MemberChange::set(member_index, NodeOps<V>::payload(b)));
    }
}

template <typename V>
void apply_member(V& target, const DeltaOp& op, const MemberPolicy& policy, const TypeRegistry& registry) {
    if (policy.compare == CompareKind::Skip) {
        detail::log_member_skip("apply_delta", op.member_index, "is skip-marked, op ignored");
        return;
    }
    if (op.kind == DeltaKind::SetMember) {
        const V& value = detail::payload_as<V>(op.value, "SetMember");
        if (policy.assignable) {
            target = value;
        } else {
            NodeOps<V>::repopulate(target, value);
        }
        return;
    }
    if constexpr (NodeOps<V>::structural) {
        NodeOps<V>::apply_member(target, op, registry);
    } else {
        detail::throw_inapplicable(op.kind, op.member_index, "scalar");
    }
}

// ============================================================
// Top-level API
// ============================================================

template <typename T>
concept RootType = ObjectType<T> || ReferenceType<T>;

template <typename T>
[[nodiscard]] bool are_equal(const T& a, const T& b, ComparerContext& ctx) {
    return NodeOps<T>::equal(a, b, ctx);
}

template <typename T>
[[nodiscard]] bool are_equal(const T& a, const T& b, const ComparisonOptions& options = {}) {
    ComparerContext ctx(options);
    return are_equal(a, b, ctx);
}

template <RootType T>
[[nodiscard]] Diff get_diff(const T& a, const T& b, ComparerContext& ctx) {
    return NodeOps<T>::root_diff(a, b, ctx);
}

template <RootType T>
[[nodiscard]] Diff get_diff(const T& a, const T& b, const ComparisonOptions& options = {}) {
    ComparerContext ctx(options);
    return get_diff(a, b, ctx);
}

/// Note: draining dirty bits clears them on `b`
template <RootType T>
[[nodiscard]] DeltaDocument compute_delta(const T& a, const T& b, ComparerContext& ctx) {
    return NodeOps<T>::root_delta(a, b, ctx);
}

template <RootType T>
[[nodiscard]] DeltaDocument compute_delta(const T& a, const T& b, const ComparisonOptions& options = {}) {
    ComparerContext ctx(options);
    return compute_delta(a, b, ctx);
}

/// Registered types inside `target` are resolved through `registry`.
/// @throws delta_index_out_of_range for bad sequence indices
/// @throws delta_type_mismatch for type confusion without a replacement payload
template <RootType T>
void apply_delta(T& target, const DeltaDocument& doc, const TypeRegistry& registry = default_registry()) {
    NodeOps<T>::root_apply(target, doc, registry);
}

} // namespace deep_delta
