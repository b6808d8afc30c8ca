// stable_index.h - Durable integer addresses for members
//
// Both the diff engine and the delta writer address members through the
// same table, so a Set in a diff and a SetMember op name the same member.
//   Ordinal: declaration order 0..n-1 (stable while members are not reordered)
//   Hashed:  seeded FNV-1a of "Owner.member", masked to 31 bits (stable without
//            a fixed table; collisions inside one type are rejected)

#pragma once

#include <deep_delta/deep_delta_config.h>
#include <deep_delta/api.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace deep_delta {

enum class StableIndexMode { Ordinal, Hashed };

[[nodiscard]] DEEP_DELTA_API int stable_member_hash(std::string_view owner_type,
                                                    std::string_view member,
                                                    std::uint32_t seed = DEEP_DELTA_STABLE_HASH_SEED) noexcept;

class DEEP_DELTA_API StableIndexTable {
public:
    StableIndexTable() = default;

    /// @throws std::invalid_argument on duplicate member names or hash collisions
    [[nodiscard]] static StableIndexTable build(std::string_view owner_type,
                                                const std::vector<std::string>& member_names,
                                                StableIndexMode mode = StableIndexMode::Ordinal,
                                                std::uint32_t seed = DEEP_DELTA_STABLE_HASH_SEED);

    [[nodiscard]] std::optional<int> index_of(std::string_view member) const;

    /// Declaration ordinal of the member with this stable index
    [[nodiscard]] std::optional<std::size_t> ordinal_of(int index) const;

    /// Stable index of the member declared at this ordinal
    [[nodiscard]] int at(std::size_t ordinal) const { return indices_.at(ordinal); }

    [[nodiscard]] const std::string& name_at(std::size_t ordinal) const { return names_.at(ordinal); }

    /// Ordinals sorted by ascending stable index: the member walk order
    [[nodiscard]] const std::vector<std::size_t>& walk_order() const noexcept { return walk_order_; }

    [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }
    [[nodiscard]] StableIndexMode mode() const noexcept { return mode_; }

private:
    std::vector<std::string> names_;
    std::vector<int> indices_;
    std::vector<std::size_t> walk_order_;
    std::unordered_map<std::string, std::size_t> ordinal_by_name_;
    std::unordered_map<int, std::size_t> ordinal_by_index_;
    StableIndexMode mode_ = StableIndexMode::Ordinal;
};

} // namespace deep_delta
