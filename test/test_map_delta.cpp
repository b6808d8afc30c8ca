// test_map_delta.cpp - Tests for map reconciliation (Dict* ops)

#include "test_models.h"

#include <catch2/catch_all.hpp>

using namespace deep_delta;
using namespace test_models;

TEST_CASE("Map entries added, removed and changed", "[map][delta]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();
    b.tags.erase("priority");
    b.tags["region"] = 8;
    b.tags["express"] = 1;

    DeltaDocument doc = compute_delta(a, b);
    REQUIRE(doc.size() == 3);

    // removals first
    REQUIRE(doc[0].kind == DeltaKind::DictRemove);
    REQUIRE(*doc[0].key_if<std::string>() == "priority");

    // then right-hand iteration order
    REQUIRE(doc[1].kind == DeltaKind::DictSet);
    REQUIRE(*doc[1].key_if<std::string>() == "express");
    REQUIRE(*doc[1].value_if<int>() == 1);
    REQUIRE(doc[2].kind == DeltaKind::DictSet);
    REQUIRE(*doc[2].key_if<std::string>() == "region");
    REQUIRE(*doc[2].value_if<int>() == 8);

    apply_delta(a, doc);
    REQUIRE(a.tags == b.tags);
}

TEST_CASE("Unchanged maps emit nothing", "[map][delta]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();
    REQUIRE(compute_delta(a, b).ops_for_member(order_member::tags).empty());
}

TEST_CASE("Changed registered values are nested", "[map][delta]") {
    register_test_models();

    Order a = make_order();
    a.lines = {{"l1", {"X", 1, 1.0}}, {"l2", {"Y", 2, 2.0}}};
    Order b = a;
    b.lines["l2"].qty = 5;

    DeltaDocument doc = compute_delta(a, b);
    REQUIRE(doc.size() == 1);
    REQUIRE(doc[0].kind == DeltaKind::DictNested);
    REQUIRE(*doc[0].key_if<std::string>() == "l2");
    REQUIRE(doc[0].nested_doc()->size() == 1);

    apply_delta(a, doc);
    REQUIRE(a.lines["l2"].qty == 5);
    REQUIRE(are_equal(a, b));
}

TEST_CASE("Case-insensitive keys keep their stored casing", "[map][case]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();
    b.labels = {{"WHO", "bob"}};

    DeltaDocument doc = compute_delta(a, b);
    REQUIRE(doc.size() == 1);
    REQUIRE(doc[0].member_index == order_member::labels);
    REQUIRE(doc[0].kind == DeltaKind::DictSet);
    REQUIRE(*doc[0].key_if<std::string>() == "WHO");

    Order target = a;
    apply_delta(target, doc);
    REQUIRE(target.labels.size() == 1);
    REQUIRE(target.labels.begin()->first == "who");
    REQUIRE(target.labels.begin()->second == "bob");
}

TEST_CASE("Case-only key rename is not a change", "[map][case]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();
    b.labels = {{"WHO", "alice"}};

    REQUIRE(compute_delta(a, b).empty());
}
