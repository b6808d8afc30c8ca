// stable_index.cpp - Ordinal and hashed member addressing

#include <deep_delta/stable_index.h>

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace deep_delta {

int stable_member_hash(std::string_view owner_type, std::string_view member, std::uint32_t seed) noexcept
{
    // FNV-1a (32-bit) over "owner.member", offset basis mixed with the seed
    std::uint32_t hash = 2166136261u ^ seed;
    auto feed = [&hash](std::string_view text) {
        for (char c : text) {
            hash ^= static_cast<unsigned char>(c);
            hash *= 16777619u;
        }
    };
    feed(owner_type);
    feed(".");
    feed(member);
    return static_cast<int>(hash & 0x7fffffffu);
}

StableIndexTable StableIndexTable::build(std::string_view owner_type,
                                         const std::vector<std::string>& member_names,
                                         StableIndexMode mode,
                                         std::uint32_t seed)
{
    StableIndexTable table;
    table.mode_  = mode;
    table.names_ = member_names;
    table.indices_.reserve(member_names.size());

    for (std::size_t ordinal = 0; ordinal < member_names.size(); ++ordinal) {
        const std::string& name = member_names[ordinal];
        if (!table.ordinal_by_name_.emplace(name, ordinal).second) {
            throw std::invalid_argument("deep_delta: duplicate member '" + name + "' in type '" +
                                        std::string(owner_type) + "'");
        }
        const int index = mode == StableIndexMode::Hashed ? stable_member_hash(owner_type, name, seed)
                                                          : static_cast<int>(ordinal);
        if (!table.ordinal_by_index_.emplace(index, ordinal).second) {
            throw std::invalid_argument("deep_delta: stable index collision for member '" + name +
                                        "' in type '" + std::string(owner_type) + "'");
        }
        table.indices_.push_back(index);
    }

    table.walk_order_.resize(member_names.size());
    std::iota(table.walk_order_.begin(), table.walk_order_.end(), std::size_t{0});
    std::sort(table.walk_order_.begin(), table.walk_order_.end(),
              [&table](std::size_t a, std::size_t b) { return table.indices_[a] < table.indices_[b]; });
    return table;
}

std::optional<int> StableIndexTable::index_of(std::string_view member) const
{
    auto it = ordinal_by_name_.find(std::string(member));
    if (it == ordinal_by_name_.end()) {
        return std::nullopt;
    }
    return indices_[it->second];
}

std::optional<std::size_t> StableIndexTable::ordinal_of(int index) const
{
    auto it = ordinal_by_index_.find(index);
    if (it == ordinal_by_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace deep_delta
