// test_stable_index.cpp - Tests for stable member indices

#include "test_models.h"

#include <catch2/catch_all.hpp>

#include <stdexcept>

using namespace deep_delta;
using namespace test_models;

TEST_CASE("Ordinal tables number members in declaration order", "[stable_index]") {
    auto table = StableIndexTable::build("Order", {"Id", "Notes", "Items"});

    REQUIRE(table.size() == 3);
    REQUIRE(table.mode() == StableIndexMode::Ordinal);
    REQUIRE(table.index_of("Id") == 0);
    REQUIRE(table.index_of("Items") == 2);
    REQUIRE_FALSE(table.index_of("Missing").has_value());
    REQUIRE(table.ordinal_of(1) == 1u);
    REQUIRE(table.name_at(1) == "Notes");
    REQUIRE(table.walk_order() == std::vector<std::size_t>{0, 1, 2});
}

TEST_CASE("Hashed tables are deterministic", "[stable_index]") {
    auto table = StableIndexTable::build("Order", {"Id", "Notes", "Items"}, StableIndexMode::Hashed);
    auto again = StableIndexTable::build("Order", {"Id", "Notes", "Items"}, StableIndexMode::Hashed);

    for (std::size_t ordinal = 0; ordinal < table.size(); ++ordinal) {
        REQUIRE(table.at(ordinal) == again.at(ordinal));
        REQUIRE(table.at(ordinal) >= 0);
        REQUIRE(table.at(ordinal) == stable_member_hash("Order", table.name_at(ordinal)));
        REQUIRE(table.ordinal_of(table.at(ordinal)) == ordinal);
    }

    SECTION("walk order follows ascending index") {
        const auto& order = table.walk_order();
        for (std::size_t i = 1; i < order.size(); ++i) {
            REQUIRE(table.at(order[i - 1]) < table.at(order[i]));
        }
    }

    SECTION("index depends on the owner type") {
        REQUIRE(stable_member_hash("Order", "Id") != stable_member_hash("Invoice", "Id"));
    }

    SECTION("seed changes the index") {
        REQUIRE(stable_member_hash("Order", "Id", 1u) == stable_member_hash("Order", "Id", 1u));
        REQUIRE(stable_member_hash("Order", "Id", 1u) != stable_member_hash("Order", "Id", 2u));
    }
}

TEST_CASE("Duplicate member names are rejected", "[stable_index]") {
    REQUIRE_THROWS_AS(StableIndexTable::build("Order", {"Id", "Id"}), std::invalid_argument);
    REQUIRE_THROWS_AS(StableIndexTable::build("Order", {"Id", "Id"}, StableIndexMode::Hashed),
                      std::invalid_argument);
}

TEST_CASE("Diff and delta agree on hashed indices", "[stable_index][registry]") {
    register_test_models();

    Versioned a{1, "one"};
    Versioned b{1, "two"};
    const int beta = stable_member_hash("Versioned", "Beta");

    DeltaDocument doc = compute_delta(a, b);
    REQUIRE(doc.size() == 1);
    REQUIRE(doc[0].member_index == beta);

    Diff diff = get_diff(a, b);
    REQUIRE(diff.size() == 1);
    REQUIRE(diff.member_changes()[0].member_index == beta);

    auto ops = default_registry().find(typeid(Versioned));
    REQUIRE(ops != nullptr);
    REQUIRE(ops->indices->index_of("Beta") == beta);

    Versioned target = a;
    apply_delta(target, doc);
    REQUIRE(target.beta == "two");
}
