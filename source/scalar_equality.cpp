// scalar_equality.cpp - String and floating-point comparison

#include <deep_delta/scalar_equality.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace deep_delta {

namespace {

constexpr char fold(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool equal_ignore_case(std::string_view a, std::string_view b) noexcept
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) { return fold(x) == fold(y); });
}

template <typename F>
bool floating_equal(F a, F b, F epsilon, bool treat_nan_equal) noexcept
{
    if (std::isnan(a) || std::isnan(b)) {
        return treat_nan_equal && std::isnan(a) && std::isnan(b);
    }
    if (a == b) {
        return true; // also covers equal infinities
    }
    return epsilon > F{0} && std::fabs(a - b) <= epsilon;
}

} // namespace

bool are_equal_strings(std::string_view a, std::string_view b, const ComparisonOptions& options) noexcept
{
    if (options.string_comparison == StringComparison::OrdinalIgnoreCase) {
        return equal_ignore_case(a, b);
    }
    return a == b;
}

bool are_equal_double(double a, double b, const ComparisonOptions& options) noexcept
{
    return floating_equal(a, b, options.double_epsilon, options.treat_nan_equal);
}

bool are_equal_float(float a, float b, const ComparisonOptions& options) noexcept
{
    return floating_equal(a, b, options.float_epsilon, options.treat_nan_equal);
}

std::size_t CaseInsensitiveHash::operator()(std::string_view s) const noexcept
{
    // FNV-1a over the folded bytes
    std::uint64_t hash = 14695981039346656037ull;
    for (char c : s) {
        hash ^= static_cast<unsigned char>(fold(c));
        hash *= 1099511628211ull;
    }
    return static_cast<std::size_t>(hash);
}

bool CaseInsensitiveEqual::operator()(std::string_view a, std::string_view b) const noexcept
{
    return equal_ignore_case(a, b);
}

bool CaseInsensitiveLess::operator()(std::string_view a, std::string_view b) const noexcept
{
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                        [](char x, char y) { return fold(x) < fold(y); });
}

} // namespace deep_delta
