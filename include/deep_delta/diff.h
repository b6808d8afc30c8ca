// diff.h - Change tree produced by get_diff()
//
// A Diff is either empty, a whole-value replacement (one side absent or the
// runtime types differ), or an ordered list of MemberChange entries in stable
// index order. Nested diffs are boxed, so a Diff is an immutable value.

#pragma once

#include <deep_delta/deep_delta_config.h>
#include <deep_delta/api.h>
#include <deep_delta/delta_document.h>

#include <immer/box.hpp>
#include <immer/vector.hpp>

#include <any>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace deep_delta {

enum class MemberChangeKind {
    Set,           // payload: new value (std::any)
    Nested,        // payload: nested Diff
    CollectionOps  // payload: DeltaDocument scoped to the member
};

class Diff;
using DiffBox = immer::box<Diff>;

struct DEEP_DELTA_API MemberChange {
    using Payload = std::variant<std::any, DiffBox, DeltaDocumentBox>;

    int member_index = 0;
    MemberChangeKind kind = MemberChangeKind::Set;
    Payload payload;

    [[nodiscard]] const std::any* value() const noexcept { return std::get_if<std::any>(&payload); }

    [[nodiscard]] const Diff* nested() const noexcept {
        auto* box = std::get_if<DiffBox>(&payload);
        return box ? &box->get() : nullptr;
    }

    [[nodiscard]] const DeltaDocument* ops() const noexcept {
        auto* box = std::get_if<DeltaDocumentBox>(&payload);
        return box ? &box->get() : nullptr;
    }

    static MemberChange set(int member_index, std::any value) {
        return MemberChange{member_index, MemberChangeKind::Set,
                            Payload{std::in_place_type<std::any>, std::move(value)}};
    }
    static MemberChange nested_diff(int member_index, Diff diff);
    static MemberChange collection_ops(int member_index, DeltaDocument ops) {
        return MemberChange{member_index, MemberChangeKind::CollectionOps,
                            Payload{std::in_place_type<DeltaDocumentBox>, std::move(ops)}};
    }
};

class DEEP_DELTA_API Diff {
public:
    /// Empty diff: no changes
    Diff() = default;

    [[nodiscard]] static Diff replacement(std::any new_value);

    /// An empty change list yields an empty diff
    [[nodiscard]] static Diff members(std::vector<MemberChange> changes);

    [[nodiscard]] bool empty() const noexcept { return !replacement_ && changes_.empty(); }
    [[nodiscard]] bool has_changes() const noexcept { return !empty(); }
    [[nodiscard]] bool is_replacement() const noexcept { return replacement_; }

    /// Replacement payload; holds an empty shared_ptr when the new side is absent
    [[nodiscard]] const std::any& new_value() const noexcept { return new_value_; }

    template <typename T>
    [[nodiscard]] const T* new_value_as() const noexcept {
        return std::any_cast<T>(&new_value_);
    }

    [[nodiscard]] const immer::vector<MemberChange>& member_changes() const noexcept { return changes_; }
    [[nodiscard]] std::size_t size() const noexcept { return changes_.size(); }

    [[nodiscard]] const MemberChange* find(int member_index) const noexcept;

private:
    immer::vector<MemberChange> changes_;
    std::any new_value_;
    bool replacement_ = false;
};

inline MemberChange MemberChange::nested_diff(int member_index, Diff diff) {
    return MemberChange{member_index, MemberChangeKind::Nested,
                        Payload{std::in_place_type<DiffBox>, std::move(diff)}};
}

[[nodiscard]] DEEP_DELTA_API std::string diff_to_string(const Diff& diff, std::size_t depth = 0);

DEEP_DELTA_API void print_diff(const Diff& diff);

} // namespace deep_delta
