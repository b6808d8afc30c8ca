// dynamic_comparer.cpp - Comparison, reconciliation and patching of Value trees

#include <deep_delta/dynamic_comparer.h>
#include <deep_delta/errors.h>
#include <deep_delta/list_reconciliation.h>
#include <deep_delta/logging.h>
#include <deep_delta/node_ops.h>
#include <deep_delta/scalar_equality.h>
#include <deep_delta/type_registry.h>

#include <immer/algorithm.hpp>

#include <string>

namespace deep_delta {

namespace {

bool same_node(const ValueBox& a, const ValueBox& b) noexcept
{
    return &a.get() == &b.get();
}

bool numeric_equal(const Value& a, const Value& b, const ComparisonOptions& options) noexcept
{
    auto* ia = a.get_if<int64_t>();
    auto* ib = b.get_if<int64_t>();
    if (ia && ib) {
        return *ia == *ib;
    }
    const double da = ia ? static_cast<double>(*ia) : *a.get_if<double>();
    const double db = ib ? static_cast<double>(*ib) : *b.get_if<double>();
    return are_equal_double(da, db, options);
}

bool object_refs_equal(const ObjectRef& a, const ObjectRef& b, ComparerContext& ctx)
{
    if (a.ptr == b.ptr) {
        return true;
    }
    if (!a.ptr || !b.ptr || a.type != b.type) {
        return false;
    }
    if (auto ops = ctx.registry().find(a.type)) {
        return ops->equals(a.ptr.get(), b.ptr.get(), ctx);
    }
    return false; // unregistered objects compare by identity
}

bool maps_equal(const ValueMap& a, const ValueMap& b, ComparerContext& ctx)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& [key, box] : a) {
        const ValueBox* other = b.find(key);
        if (!other) {
            return false;
        }
        if (!same_node(box, *other) && !are_equal_dynamic(*box, **other, ctx)) {
            return false;
        }
    }
    return true;
}

bool vectors_equal(const ValueVector& a, const ValueVector& b, ComparerContext& ctx)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!same_node(a[i], b[i]) && !are_equal_dynamic(*a[i], *b[i], ctx)) {
            return false;
        }
    }
    return true;
}

/// Element ops over boxed values, for reconcile_list
struct BoxedValueOps {
    static bool equal(const ValueBox& a, const ValueBox& b, ComparerContext& ctx)
    {
        return same_node(a, b) || are_equal_dynamic(*a, *b, ctx);
    }

    static bool can_nest(const ValueBox& a, const ValueBox& b, const ComparerContext&) noexcept
    {
        return dynamic_reconcilable(*a, *b);
    }

    static void compute_nested(const ValueBox& a, const ValueBox& b, ComparerContext& ctx, DeltaDocument& out)
    {
        DeltaWriter writer(out);
        compute_dynamic_delta(*a, *b, 0, ctx, writer);
    }

    static std::any payload(const ValueBox& box) { return std::any(box.get()); }
};

void reconcile_value_maps(const ValueMap& left, const ValueMap& right, int member_index,
                          ComparerContext& ctx, DeltaWriter& writer)
{
    const bool embed = ctx.options().embed_nested_fallback;
    auto differ = immer::make_differ(
        // added
        [&](const ValueMap::value_type& added) {
            writer.write_dict_set(member_index, std::any(added.first), std::any(added.second.get()));
        },
        // removed
        [&](const ValueMap::value_type& removed) {
            writer.write_dict_remove(member_index, std::any(removed.first));
        },
        // retained key
        [&](const ValueMap::value_type& old_kv, const ValueMap::value_type& new_kv) {
            if (BoxedValueOps::equal(old_kv.second, new_kv.second, ctx)) {
                return;
            }
            if (BoxedValueOps::can_nest(old_kv.second, new_kv.second, ctx)) {
                DeltaDocument nested;
                BoxedValueOps::compute_nested(old_kv.second, new_kv.second, ctx, nested);
                if (!nested.empty()) {
                    writer.write_dict_nested(member_index, std::any(new_kv.first), std::move(nested),
                                             embed ? std::any(new_kv.second.get()) : std::any{});
                    return;
                }
            }
            writer.write_dict_set(member_index, std::any(new_kv.first), std::any(new_kv.second.get()));
        });

    immer::diff(left, right, differ);
}

/// Every op of the document fits the shape of the value
bool document_fits(const Value& target, const DeltaDocument& doc) noexcept
{
    for (const auto& op : doc) {
        if (is_dictionary_kind(op.kind) && !target.is_map()) {
            return false;
        }
        if (is_sequence_kind(op.kind) && !target.is_vector()) {
            return false;
        }
    }
    return true;
}

void apply_nested_value(Value& child, const DeltaOp& op, std::string_view where)
{
    const DeltaDocument* doc = op.nested_doc();
    if (doc && document_fits(child, *doc)) {
        apply_dynamic_delta(child, *doc);
        return;
    }
    if (auto* fallback = op.value_if<Value>()) {
        detail::log_apply_warning(where, "nested document does not fit the value, applying replacement payload");
        child = *fallback;
        return;
    }
    throw delta_type_mismatch(std::string(where) + ": nested document does not fit the dynamic value");
}

const ValueMap& require_map(Value& target, const DeltaOp& op)
{
    if (target.is_null()) {
        target = Value{ValueMap{}};
    }
    if (auto* m = target.get_if<ValueMap>()) {
        return *m;
    }
    detail::throw_inapplicable(op.kind, op.member_index, "non-map dynamic");
}

const ValueVector& require_vector(Value& target, const DeltaOp& op)
{
    if (target.is_null()) {
        target = Value{ValueVector{}};
    }
    if (auto* v = target.get_if<ValueVector>()) {
        return *v;
    }
    detail::throw_inapplicable(op.kind, op.member_index, "non-vector dynamic");
}

} // namespace

bool are_equal_dynamic(const Value& a, const Value& b, ComparerContext& ctx)
{
    if (&a == &b) {
        return true;
    }
    if (a.is_numeric() && b.is_numeric()) {
        return numeric_equal(a, b, ctx.options());
    }
    if (a.data.index() != b.data.index()) {
        return false;
    }
    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const T& rhs = std::get<T>(b.data);
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return are_equal_strings(lhs, rhs, ctx.options());
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return maps_equal(lhs, rhs, ctx);
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return vectors_equal(lhs, rhs, ctx);
        } else if constexpr (std::is_same_v<T, ObjectRef>) {
            return object_refs_equal(lhs, rhs, ctx);
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

bool dynamic_reconcilable(const Value& a, const Value& b) noexcept
{
    return (a.is_map() && b.is_map()) || (a.is_vector() && b.is_vector());
}

void compute_dynamic_delta(const Value& a, const Value& b, int member_index,
                           ComparerContext& ctx, DeltaWriter& writer)
{
    if (are_equal_dynamic(a, b, ctx)) {
        return;
    }
    if (a.is_map() && b.is_map()) {
        reconcile_value_maps(*a.get_if<ValueMap>(), *b.get_if<ValueMap>(), member_index, ctx, writer);
    } else if (a.is_vector() && b.is_vector()) {
        reconcile_list<BoxedValueOps>(*a.get_if<ValueVector>(), *b.get_if<ValueVector>(), member_index, ctx,
                                      writer);
    } else {
        writer.write_set_member(member_index, std::any(b));
    }
}

void apply_dynamic_op(Value& target, const DeltaOp& op)
{
    switch (op.kind) {
    case DeltaKind::ReplaceObject:
        target = op.value.has_value() ? detail::payload_as<Value>(op.value, "ReplaceObject") : Value{};
        break;
    case DeltaKind::SetMember:
        target = detail::payload_as<Value>(op.value, "SetMember");
        break;
    case DeltaKind::NestedMember:
        apply_nested_value(target, op, "NestedMember");
        break;
    case DeltaKind::DictSet: {
        const auto& key = detail::payload_as<std::string>(op.key, "DictSet");
        const ValueMap& map = require_map(target, op);
        target = Value{map.set(key, ValueBox{detail::payload_as<Value>(op.value, "DictSet")})};
        break;
    }
    case DeltaKind::DictRemove: {
        const auto& key = detail::payload_as<std::string>(op.key, "DictRemove");
        if (auto* map = target.get_if<ValueMap>(); map && map->count(key) != 0) {
            target = Value{map->erase(key)};
        }
        break;
    }
    case DeltaKind::DictNested: {
        const auto& key = detail::payload_as<std::string>(op.key, "DictNested");
        auto* map = target.get_if<ValueMap>();
        const ValueBox* found = map ? map->find(key) : nullptr;
        if (!found) {
            detail::log_key_warning("apply_dynamic_op", key, "not present, DictNested ignored");
            break;
        }
        Value child = found->get();
        apply_nested_value(child, op, "DictNested");
        target = Value{map->set(key, ValueBox{std::move(child)})};
        break;
    }
    case DeltaKind::SeqReplaceAt: {
        const ValueVector& vec = require_vector(target, op);
        detail::check_index(op.index, vec.size(), false);
        target = Value{vec.set(static_cast<std::size_t>(op.index),
                               ValueBox{detail::payload_as<Value>(op.value, "SeqReplaceAt")})};
        break;
    }
    case DeltaKind::SeqAddAt: {
        const ValueVector& vec = require_vector(target, op);
        detail::check_index(op.index, vec.size(), true);
        target = Value{vec.insert(static_cast<std::size_t>(op.index),
                                  ValueBox{detail::payload_as<Value>(op.value, "SeqAddAt")})};
        break;
    }
    case DeltaKind::SeqRemoveAt: {
        const ValueVector& vec = require_vector(target, op);
        detail::check_index(op.index, vec.size(), false);
        target = Value{vec.erase(static_cast<std::size_t>(op.index))};
        break;
    }
    case DeltaKind::SeqNestedAt: {
        const ValueVector& vec = require_vector(target, op);
        detail::check_index(op.index, vec.size(), false);
        Value child = vec[static_cast<std::size_t>(op.index)].get();
        apply_nested_value(child, op, "SeqNestedAt");
        target = Value{vec.set(static_cast<std::size_t>(op.index), ValueBox{std::move(child)})};
        break;
    }
    default:
        detail::log_member_skip("apply_dynamic_op", op.member_index, "carries an unknown op kind, ignored");
        break;
    }
}

void apply_dynamic_delta(Value& target, const DeltaDocument& doc)
{
    if (const DeltaOp* replace = doc.find_replace_object()) {
        apply_dynamic_op(target, *replace);
        return;
    }
    for (const auto& op : doc) {
        apply_dynamic_op(target, op);
    }
}

} // namespace deep_delta
