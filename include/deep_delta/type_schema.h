// type_schema.h - Per-type member schemas and their registration
//
// A schema lists a type's members (pointer-to-data-member plus MemberPolicy)
// and implements the object-level equality, diff, delta and apply walks on
// top of the member-level operations of node_ops.h.
//
// Usage:
// @code
//   describe_type<Order>("Order")
//       .member("Id", &Order::id)
//       .member("Items", &Order::items)
//       .member("Notes", &Order::notes, shallow_member)
//       .member("Total", &Order::total, {}, [](double a, double b) { return std::abs(a - b) < 1e-6; })
//       .keyed_member("Parcels", &Order::parcels, &Parcel::tracking_id)
//       .finish();
// @endcode
//
// Members are walked in stable index order. For DeltaTracked types, a
// member's dirty bit is its declaration ordinal.

#pragma once

#include <deep_delta/comparer_context.h>
#include <deep_delta/delta_document.h>
#include <deep_delta/diff.h>
#include <deep_delta/dirty_bits.h>
#include <deep_delta/errors.h>
#include <deep_delta/list_reconciliation.h>
#include <deep_delta/logging.h>
#include <deep_delta/member_policy.h>
#include <deep_delta/node_ops.h>
#include <deep_delta/stable_index.h>
#include <deep_delta/type_registry.h>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace deep_delta {

template <typename T>
class SchemaBuilder;

template <typename T>
concept DirtyTrackable = std::derived_from<T, DeltaTracked>;

// ============================================================
// MemberDescriptor - type-erased access to one member of T
// ============================================================

template <typename T>
class MemberDescriptor {
public:
    MemberDescriptor(std::string name, MemberPolicy policy)
        : name_(std::move(name)), policy_(policy) {}
    virtual ~MemberDescriptor() = default;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const MemberPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] int stable_index() const noexcept { return stable_index_; }
    [[nodiscard]] std::size_t ordinal() const noexcept { return ordinal_; }

    virtual bool equals(const T& left, const T& right, ComparerContext& ctx) const = 0;
    virtual void diff(const T& left, const T& right, ComparerContext& ctx,
                      std::vector<MemberChange>& out) const = 0;
    virtual void compute_delta(const T& left, const T& right, ComparerContext& ctx,
                               DeltaWriter& writer) const = 0;
    virtual void compute_dirty_delta(const T& left, const T& right, ComparerContext& ctx,
                                     DeltaWriter& writer) const = 0;
    virtual void apply(T& target, const DeltaOp& op, const TypeRegistry& registry) const = 0;

private:
    friend class SchemaBuilder<T>;

    std::string name_;
    MemberPolicy policy_;
    int stable_index_     = 0;
    std::size_t ordinal_  = 0;
};

template <typename T, typename M>
class FieldMember final : public MemberDescriptor<T> {
public:
    FieldMember(std::string name, M T::*field, MemberPolicy policy, MemberOverrides<M> overrides = {})
        : MemberDescriptor<T>(std::move(name), policy), field_(field), overrides_(std::move(overrides)) {}

    bool equals(const T& left, const T& right, ComparerContext& ctx) const override {
        return member_equal<M>(left.*field_, right.*field_, this->policy(), ctx, overrides_);
    }

    void diff(const T& left, const T& right, ComparerContext& ctx,
              std::vector<MemberChange>& out) const override {
        diff_member<M>(left.*field_, right.*field_, this->stable_index(), this->policy(), ctx, out, overrides_);
    }

    void compute_delta(const T& left, const T& right, ComparerContext& ctx,
                       DeltaWriter& writer) const override {
        delta_member<M>(left.*field_, right.*field_, this->stable_index(), this->policy(), ctx, writer,
                        overrides_);
    }

    void compute_dirty_delta(const T& left, const T& right, ComparerContext& ctx,
                             DeltaWriter& writer) const override {
        delta_dirty_member<M>(left.*field_, right.*field_, this->stable_index(), this->policy(), ctx, writer,
                              overrides_);
    }

    void apply(T& target, const DeltaOp& op, const TypeRegistry& registry) const override {
        apply_member<M>(target.*field_, op, this->policy(), registry);
    }

private:
    M T::*field_;
    MemberOverrides<M> overrides_;
};

// ============================================================
// ObjectSchema - object-level walks
// ============================================================

template <typename T>
class ObjectSchema {
public:
    using member_ptr = std::unique_ptr<MemberDescriptor<T>>;

    ObjectSchema(std::string name, std::vector<member_ptr> members,
                 std::shared_ptr<const StableIndexTable> indices)
        : name_(std::move(name)), members_(std::move(members)), indices_(std::move(indices)) {
        for (std::size_t ordinal : indices_->walk_order()) {
            walk_.push_back(members_[ordinal].get());
        }
        for (const auto& member : members_) {
            by_index_.emplace(member->stable_index(), member.get());
        }
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::shared_ptr<const StableIndexTable>& indices() const noexcept { return indices_; }
    [[nodiscard]] std::size_t member_count() const noexcept { return members_.size(); }

    [[nodiscard]] const MemberDescriptor<T>* find_member(int stable_index) const {
        auto it = by_index_.find(stable_index);
        return it == by_index_.end() ? nullptr : it->second;
    }

    [[nodiscard]] bool equals(const T& left, const T& right, ComparerContext& ctx) const {
        if (&left == &right) {
            return true;
        }
        VisitGuard guard(ctx, &left, &right);
        if (!guard.first_visit()) {
            return true;
        }
        return std::all_of(walk_.begin(), walk_.end(), [&](const MemberDescriptor<T>* member) {
            return member->equals(left, right, ctx);
        });
    }

    [[nodiscard]] Diff diff(const T& left, const T& right, ComparerContext& ctx) const {
        if (&left == &right) {
            return {};
        }
        VisitGuard guard(ctx, &left, &right);
        if (!guard.first_visit()) {
            return {};
        }
        std::vector<MemberChange> changes;
        for (const auto* member : walk_) {
            member->diff(left, right, ctx, changes);
        }
        return Diff::members(std::move(changes));
    }

    void compute_delta(const T& left, const T& right, ComparerContext& ctx, DeltaWriter& writer) const {
        if (&left == &right) {
            return;
        }
        VisitGuard guard(ctx, &left, &right);
        if (!guard.first_visit()) {
            return;
        }
        if constexpr (DirtyTrackable<T>) {
            if (ctx.options().use_dirty_tracking && right.has_any_dirty()) {
                compute_dirty_delta(left, right, ctx, writer);
                return;
            }
        }
        for (const auto* member : walk_) {
            member->compute_delta(left, right, ctx, writer);
        }
    }

    void apply_delta(T& target, const DeltaDocument& doc, const TypeRegistry& registry) const {
        if (const DeltaOp* replace = doc.find_replace_object()) {
            target = detail::payload_as<T>(replace->value, "ReplaceObject");
            if constexpr (DirtyTrackable<T>) {
                target.clear_dirty();
            }
            return;
        }
        for (const auto& op : doc) {
            if (!is_known_kind(op.kind)) {
                detail::log_member_skip("apply_delta", op.member_index, "carries an unknown op kind, ignored");
                continue;
            }
            const auto* member = find_member(op.member_index);
            if (!member) {
                detail::log_member_skip("apply_delta", op.member_index, "is not a member of " + name_);
                continue;
            }
            member->apply(target, op, registry);
            if constexpr (DirtyTrackable<T>) {
                target.dirty_bits().clear(member->ordinal());
            }
        }
    }

private:
    /// Emits ops for exactly the dirty members, lowest bit first
    void compute_dirty_delta(const T& left, const T& right, ComparerContext& ctx, DeltaWriter& writer) const
        requires DirtyTrackable<T>
    {
        DirtyBits& bits = right.dirty_bits();
        while (auto bit = bits.try_pop_next()) {
            if (*bit >= members_.size()) {
                continue;
            }
            members_[*bit]->compute_dirty_delta(left, right, ctx, writer);
        }
    }

    std::string name_;
    std::vector<member_ptr> members_; // declaration order
    std::vector<const MemberDescriptor<T>*> walk_;
    std::unordered_map<int, const MemberDescriptor<T>*> by_index_;
    std::shared_ptr<const StableIndexTable> indices_;
};

// ============================================================
// SchemaBuilder
// ============================================================

template <typename T>
class SchemaBuilder {
public:
    explicit SchemaBuilder(std::string type_name) : name_(std::move(type_name)) {}

    /// Members of public bases may be listed with their base-class pointer
    template <typename M, typename C>
        requires std::derived_from<T, C> && MemberValue<M>
    SchemaBuilder& member(std::string name, M C::*field, MemberPolicy policy = {}) {
        members_.push_back(std::make_unique<FieldMember<T, M>>(std::move(name),
                                                               static_cast<M T::*>(field), policy));
        return *this;
    }

    /// Member compared with its own equality instead of the deep comparison
    template <typename M, typename C>
        requires std::derived_from<T, C> && MemberValue<M>
    SchemaBuilder& member(std::string name, M C::*field, MemberPolicy policy,
                          std::type_identity_t<MemberComparer<M>> comparer) {
        MemberOverrides<M> overrides;
        overrides.comparer = std::move(comparer);
        members_.push_back(std::make_unique<FieldMember<T, M>>(std::move(name), static_cast<M T::*>(field),
                                                               policy, std::move(overrides)));
        return *this;
    }

    /// Order-insensitive sequence whose elements are matched by `key_of`
    /// (a callable or pointer to member of the element type)
    template <typename M, typename C, typename KeyOf>
        requires std::derived_from<T, C> && SequenceType<M> &&
                 std::invocable<const KeyOf&, const typename M::value_type&>
    SchemaBuilder& keyed_member(std::string name, M C::*field, KeyOf key_of,
                                MemberPolicy policy = unordered_member) {
        policy.order_insensitive = true;
        MemberOverrides<M> overrides;
        overrides.keyed_delta = [key_of = std::move(key_of)](const M& a, const M& b, int member_index,
                                                             ComparerContext& ctx, DeltaWriter& writer) {
            reconcile_keyed_list<NodeOps<typename M::value_type>>(a, b, member_index, key_of, ctx, writer);
        };
        members_.push_back(std::make_unique<FieldMember<T, M>>(std::move(name), static_cast<M T::*>(field),
                                                               policy, std::move(overrides)));
        return *this;
    }

    SchemaBuilder& index_mode(StableIndexMode mode) {
        mode_ = mode;
        return *this;
    }

    SchemaBuilder& hash_seed(std::uint32_t seed) {
        seed_ = seed;
        return *this;
    }

    /// Resolves stable indices. The builder is consumed.
    /// @throws std::invalid_argument on duplicate names or index collisions
    [[nodiscard]] std::shared_ptr<const ObjectSchema<T>> build() {
        std::vector<std::string> names;
        names.reserve(members_.size());
        for (const auto& member : members_) {
            names.push_back(member->name());
        }
        auto indices = std::make_shared<const StableIndexTable>(
            StableIndexTable::build(name_, names, mode_, seed_));
        for (std::size_t ordinal = 0; ordinal < members_.size(); ++ordinal) {
            members_[ordinal]->ordinal_      = ordinal;
            members_[ordinal]->stable_index_ = indices->at(ordinal);
        }
        return std::make_shared<const ObjectSchema<T>>(name_, std::move(members_), std::move(indices));
    }

    /// Builds the schema and installs it in the registry
    std::shared_ptr<const ObjectSchema<T>> finish(TypeRegistry& registry = default_registry()) {
        auto schema = build();
        registry.add(make_type_ops(schema));
        return schema;
    }

    [[nodiscard]] static TypeOps make_type_ops(std::shared_ptr<const ObjectSchema<T>> schema) {
        TypeOps ops;
        ops.type          = typeid(T);
        ops.name          = schema->name();
        ops.indices       = schema->indices();
        ops.dirty_tracked = DirtyTrackable<T>;
        ops.equals = [schema](const void* l, const void* r, ComparerContext& ctx) {
            return schema->equals(*static_cast<const T*>(l), *static_cast<const T*>(r), ctx);
        };
        ops.diff = [schema](const void* l, const void* r, ComparerContext& ctx) {
            return schema->diff(*static_cast<const T*>(l), *static_cast<const T*>(r), ctx);
        };
        ops.compute_delta = [schema](const void* l, const void* r, ComparerContext& ctx, DeltaWriter& writer) {
            schema->compute_delta(*static_cast<const T*>(l), *static_cast<const T*>(r), ctx, writer);
        };
        ops.apply_delta = [schema](void* target, const DeltaDocument& doc, const TypeRegistry& registry) {
            schema->apply_delta(*static_cast<T*>(target), doc, registry);
        };
        return ops;
    }

private:
    std::string name_;
    std::vector<std::unique_ptr<MemberDescriptor<T>>> members_;
    StableIndexMode mode_ = StableIndexMode::Ordinal;
    std::uint32_t seed_   = DEEP_DELTA_STABLE_HASH_SEED;
};

template <typename T>
[[nodiscard]] SchemaBuilder<T> describe_type(std::string type_name) {
    return SchemaBuilder<T>(std::move(type_name));
}

} // namespace deep_delta
