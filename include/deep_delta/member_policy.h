// member_policy.h - Per-member comparison policy resolved at registration

#pragma once

#include <functional>

namespace deep_delta {

enum class CompareKind {
    Deep,      // structural recursion
    Shallow,   // deep equality, but a change replaces the whole member
    Reference, // shared_ptr members compare by identity; others behave as Shallow
    Skip       // never compared, diffed, emitted or applied
};

struct MemberPolicy {
    CompareKind compare = CompareKind::Deep;

    /// Sequences only: equality ignores element order. Changes replace the whole
    /// member unless the member was registered with a key (keyed_member).
    bool order_insensitive = false;

    /// false for get-only members: SetMember clears and repopulates containers in place
    bool assignable = true;

    [[nodiscard]] bool structural() const noexcept {
        return compare == CompareKind::Deep && !order_insensitive;
    }
};

/// Per-member equality, e.g. a tolerance for one floating-point member.
/// A member with a comparer is reported as one SetMember when it changes.
template <typename V>
using MemberComparer = std::function<bool(const V&, const V&)>;

inline constexpr MemberPolicy shallow_member{CompareKind::Shallow};
inline constexpr MemberPolicy reference_member{CompareKind::Reference};
inline constexpr MemberPolicy skip_member{CompareKind::Skip};
inline constexpr MemberPolicy unordered_member{CompareKind::Deep, true};
inline constexpr MemberPolicy get_only_member{CompareKind::Deep, false, false};

} // namespace deep_delta
