// diff.cpp - Change tree construction and printing

#include <deep_delta/diff.h>

#include <iostream>

namespace deep_delta {

Diff Diff::replacement(std::any new_value)
{
    Diff diff;
    diff.replacement_ = true;
    diff.new_value_   = std::move(new_value);
    return diff;
}

Diff Diff::members(std::vector<MemberChange> changes)
{
    Diff diff;
    auto t = immer::vector<MemberChange>{}.transient();
    for (auto& change : changes) {
        t.push_back(std::move(change));
    }
    diff.changes_ = t.persistent();
    return diff;
}

const MemberChange* Diff::find(int member_index) const noexcept
{
    for (const auto& change : changes_) {
        if (change.member_index == member_index) {
            return &change;
        }
    }
    return nullptr;
}

std::string diff_to_string(const Diff& diff, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    if (diff.is_replacement()) {
        return indent + "Replace " + payload_to_string(diff.new_value()) + "\n";
    }
    std::string result;
    for (const auto& change : diff.member_changes()) {
        result += indent + "[" + std::to_string(change.member_index) + "] ";
        switch (change.kind) {
        case MemberChangeKind::Set:
            result += "Set " + payload_to_string(*change.value()) + "\n";
            break;
        case MemberChangeKind::Nested:
            result += "Nested\n" + diff_to_string(*change.nested(), depth + 1);
            break;
        case MemberChangeKind::CollectionOps:
            result += "CollectionOps\n" + delta_to_string(*change.ops(), depth + 1);
            break;
        }
    }
    return result;
}

void print_diff(const Diff& diff)
{
    if (diff.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    std::cout << diff_to_string(diff, 1);
}

} // namespace deep_delta
