// scalar_equality.h - Scalar comparison under ComparisonOptions
//
// Also provides ASCII case-insensitive hash/equal/less functors for maps
// keyed case-insensitively; map reconciliation honors the container's own
// comparator, so these are the "custom key comparers".

#pragma once

#include <deep_delta/api.h>
#include <deep_delta/comparison_options.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>

namespace deep_delta {

[[nodiscard]] DEEP_DELTA_API bool are_equal_strings(std::string_view a, std::string_view b,
                                                    const ComparisonOptions& options) noexcept;

[[nodiscard]] DEEP_DELTA_API bool are_equal_double(double a, double b,
                                                   const ComparisonOptions& options) noexcept;

[[nodiscard]] DEEP_DELTA_API bool are_equal_float(float a, float b,
                                                  const ComparisonOptions& options) noexcept;

template <typename T>
[[nodiscard]] bool are_equal_scalar(const T& a, const T& b, const ComparisonOptions& options) {
    if constexpr (std::is_same_v<T, std::string>) {
        return are_equal_strings(a, b, options);
    } else if constexpr (std::is_same_v<T, double>) {
        return are_equal_double(a, b, options);
    } else if constexpr (std::is_same_v<T, float>) {
        return are_equal_float(a, b, options);
    } else {
        return a == b;
    }
}

struct DEEP_DELTA_API CaseInsensitiveHash {
    using is_transparent = void;
    [[nodiscard]] std::size_t operator()(std::string_view s) const noexcept;
};

struct DEEP_DELTA_API CaseInsensitiveEqual {
    using is_transparent = void;
    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept;
};

struct DEEP_DELTA_API CaseInsensitiveLess {
    using is_transparent = void;
    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept;
};

} // namespace deep_delta
