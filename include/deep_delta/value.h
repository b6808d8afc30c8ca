// value.h - Dynamic value type for untyped ("object"-typed) members
//
// Members whose shape is not described by a schema hold a Value. It is an
// immutable tree built from immer containers; the dynamic comparer
// (dynamic_comparer.h) compares, reconciles and patches it.

#pragma once

#include <deep_delta/deep_delta_config.h>
#include <deep_delta/api.h>
#include <deep_delta/logging.h>

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>

namespace deep_delta {

struct Value;

using ValueBox    = immer::box<Value>;
using ValueMap    = immer::map<std::string, ValueBox>;
using ValueVector = immer::flex_vector<ValueBox>;

/// Reference to a schema-described object stored inside a dynamic tree.
/// Two refs are == when they point at the same object; deep comparison of the
/// pointees goes through the type registry.
struct ObjectRef {
    std::type_index type = typeid(void);
    std::shared_ptr<void> ptr;

    bool operator==(const ObjectRef& other) const noexcept { return ptr == other.ptr; }
    bool operator!=(const ObjectRef& other) const noexcept { return !(*this == other); }
};

struct DEEP_DELTA_API Value
{
    std::variant<std::monostate,
                 bool,
                 int64_t,
                 double,
                 std::string,
                 ValueMap,
                 ValueVector,
                 ObjectRef>
        data;

    Value() noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}

    template <std::integral I>
        requires(!std::same_as<I, bool>)
    Value(I v) noexcept : data(static_cast<int64_t>(v)) {}

    template <std::floating_point F>
    Value(F v) noexcept : data(static_cast<double>(v)) {}

    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueMap v) : data(std::move(v)) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(ObjectRef v) : data(std::move(v)) {}

    static Value map(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value vector(std::initializer_list<Value> init) {
        auto t = ValueVector{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    /// Wrap a registered object; the ref records the object's runtime type
    template <typename T>
    static Value object(std::shared_ptr<T> ptr) {
        if (!ptr) {
            return Value{};
        }
        if constexpr (std::is_polymorphic_v<T>) {
            const std::type_info& type = typeid(*ptr);
            void* most_derived = dynamic_cast<void*>(const_cast<std::remove_const_t<T>*>(ptr.get()));
            return Value{ObjectRef{type, std::shared_ptr<void>(ptr, most_derived)}};
        } else {
            return Value{ObjectRef{typeid(T),
                                   std::const_pointer_cast<void>(
                                       std::static_pointer_cast<const void>(ptr))}};
        }
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&data);
    }

    template <typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(data);
    }

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<ValueMap>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<ValueVector>(); }
    [[nodiscard]] bool is_numeric() const noexcept { return is<int64_t>() || is<double>(); }

    /// Null when the key is missing or this is not a map
    [[nodiscard]] Value at(const std::string& key) const {
        if (auto* m = get_if<ValueMap>()) {
            if (auto* found = m->find(key)) {
                return found->get();
            }
        }
        detail::log_key_warning("Value::at", key, "not found or type mismatch");
        return Value{};
    }

    [[nodiscard]] Value at(std::size_t index) const {
        if (auto* v = get_if<ValueVector>()) {
            if (index < v->size()) {
                return (*v)[index].get();
            }
        }
        detail::log_apply_warning("Value::at", "index out of range or type mismatch");
        return Value{};
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        auto* m = get_if<ValueMap>();
        return m && m->count(key) != 0;
    }

    /// Map or vector element count, 0 for scalars
    [[nodiscard]] std::size_t size() const noexcept {
        if (auto* m = get_if<ValueMap>()) {
            return m->size();
        }
        if (auto* v = get_if<ValueVector>()) {
            return v->size();
        }
        return 0;
    }

    /// Structural update; a null value becomes an empty map first
    [[nodiscard]] Value set(const std::string& key, Value value) const {
        if (auto* m = get_if<ValueMap>()) {
            return Value{m->set(key, ValueBox{std::move(value)})};
        }
        if (is_null()) {
            return Value{ValueMap{}.set(key, ValueBox{std::move(value)})};
        }
        detail::log_key_warning("Value::set", key, "target is not a map");
        return *this;
    }

    [[nodiscard]] Value set(std::size_t index, Value value) const {
        if (auto* v = get_if<ValueVector>()) {
            if (index < v->size()) {
                return Value{v->set(index, ValueBox{std::move(value)})};
            }
        }
        detail::log_apply_warning("Value::set", "index out of range or type mismatch");
        return *this;
    }

    [[nodiscard]] Value push_back(Value value) const {
        if (auto* v = get_if<ValueVector>()) {
            return Value{v->push_back(ValueBox{std::move(value)})};
        }
        if (is_null()) {
            return Value{ValueVector{}.push_back(ValueBox{std::move(value)})};
        }
        detail::log_apply_warning("Value::push_back", "target is not a vector");
        return *this;
    }
};

/// Exact structural equality (no tolerance, refs by identity).
/// Use are_equal_dynamic() for option-aware deep comparison.
inline bool operator==(const Value& a, const Value& b) { return a.data == b.data; }
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// ============================================================
// Utility functions
// ============================================================

[[nodiscard]] DEEP_DELTA_API std::string value_to_string(const Value& val);

DEEP_DELTA_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

} // namespace deep_delta
