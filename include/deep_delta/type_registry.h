// type_registry.h - Runtime-type dispatch table
//
// Maps a runtime type to the closures that compare, diff and patch it. The
// engine resolves polymorphic members (shared_ptr<Base> holding a Derived)
// and dynamic object refs through this table; it never switches on concrete
// types itself. Entries are usually installed by SchemaBuilder<T>::finish().

#pragma once

#include <deep_delta/api.h>
#include <deep_delta/comparer_context.h>
#include <deep_delta/delta_document.h>
#include <deep_delta/diff.h>
#include <deep_delta/stable_index.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

namespace deep_delta {

class TypeRegistry;

/// Type-erased operations for one registered type.
/// Pointers always address an object of exactly `type`.
struct TypeOps {
    std::type_index type = typeid(void);
    std::string name;

    std::function<bool(const void*, const void*, ComparerContext&)> equals;
    std::function<Diff(const void*, const void*, ComparerContext&)> diff;
    std::function<void(const void*, const void*, ComparerContext&, DeltaWriter&)> compute_delta;
    /// The registry resolves nested objects of the patched value
    std::function<void(void*, const DeltaDocument&, const TypeRegistry&)> apply_delta;

    std::shared_ptr<const StableIndexTable> indices;
    bool dirty_tracked = false;
};

class DEEP_DELTA_API TypeRegistry {
public:
    TypeRegistry() = default;
    TypeRegistry(const TypeRegistry&)            = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    /// Replaces an earlier entry for the same type
    void add(TypeOps ops);

    [[nodiscard]] std::shared_ptr<const TypeOps> find(std::type_index type) const;

    /// @throws type_not_registered
    [[nodiscard]] std::shared_ptr<const TypeOps> require(std::type_index type) const;

    [[nodiscard]] bool contains(std::type_index type) const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::shared_ptr<const TypeOps>> entries_;
};

/// Process-wide registry used by default
[[nodiscard]] DEEP_DELTA_API TypeRegistry& default_registry();

} // namespace deep_delta
