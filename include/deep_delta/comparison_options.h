// comparison_options.h - Options carried by a ComparerContext

#pragma once

namespace deep_delta {

enum class StringComparison {
    Ordinal,          // byte-wise
    OrdinalIgnoreCase // ASCII case folding
};

struct ComparisonOptions {
    StringComparison string_comparison = StringComparison::Ordinal;

    /// NaN compares equal to NaN
    bool treat_nan_equal = true;

    /// Absolute tolerance; 0 means exact
    double double_epsilon = 0.0;
    float float_epsilon   = 0.0f;

    /// Nested ops also carry the right-hand value, used by the applier as the
    /// replacement payload when the target's runtime type no longer matches.
    bool embed_nested_fallback = false;

    /// Dirty-tracked instances with pending bits emit only their dirty members
    bool use_dirty_tracking = true;

    /// Dirty members are compared before they are emitted, so a member that was
    /// marked but not changed emits nothing. When false, dirty whole-value members
    /// are written as SetMember without comparison.
    bool validate_dirty_on_emit = true;
};

} // namespace deep_delta
