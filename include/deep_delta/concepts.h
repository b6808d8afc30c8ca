// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 concepts classifying member types into engine categories.
///
/// Every member type falls into exactly one category:
///   DynamicType    - deep_delta::Value
///   ScalarType     - arithmetic, enum, std::string
///   OptionalType   - std::optional<X> (nullable scalar)
///   FixedArrayType - std::array<E, N> (whole-value replacement only)
///   SequenceType   - std::vector<E>
///   MapType        - std::map / std::unordered_map
///   ReferenceType  - std::shared_ptr<X> (nullable, polymorphic)
///   ObjectType     - any other class type (registry or operator==)

#pragma once

#include <deep_delta/value.h>

#include <array>
#include <concepts>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace deep_delta {

namespace detail {

template <typename T>
struct is_std_vector : std::false_type {};
template <typename E, typename A>
struct is_std_vector<std::vector<E, A>> : std::true_type {};

template <typename T>
struct is_std_array : std::false_type {};
template <typename E, std::size_t N>
struct is_std_array<std::array<E, N>> : std::true_type {};

template <typename T>
struct is_map_like : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map_like<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_map_like<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T>
struct is_shared_ptr : std::false_type {};
template <typename X>
struct is_shared_ptr<std::shared_ptr<X>> : std::true_type {};

template <typename T>
struct is_optional : std::false_type {};
template <typename X>
struct is_optional<std::optional<X>> : std::true_type {};

} // namespace detail

template <typename T>
concept DynamicType = std::same_as<T, Value>;

template <typename T>
concept ScalarType = std::is_arithmetic_v<T> || std::is_enum_v<T> || std::same_as<T, std::string>;

template <typename T>
concept OptionalType = detail::is_optional<T>::value;

template <typename T>
concept FixedArrayType = detail::is_std_array<T>::value;

template <typename T>
concept SequenceType = detail::is_std_vector<T>::value;

template <typename T>
concept MapType = detail::is_map_like<T>::value;

template <typename T>
concept ReferenceType = detail::is_shared_ptr<T>::value;

template <typename T>
concept ObjectType = std::is_class_v<T> && !DynamicType<T> && !ScalarType<T> && !OptionalType<T> &&
                     !FixedArrayType<T> && !SequenceType<T> && !MapType<T> && !ReferenceType<T>;

/// Payloads travel as std::any, which requires copyable values
template <typename T>
concept MemberValue = std::copy_constructible<T> &&
                      (DynamicType<T> || ScalarType<T> || OptionalType<T> || FixedArrayType<T> ||
                       SequenceType<T> || MapType<T> || ReferenceType<T> || ObjectType<T>);

} // namespace deep_delta
