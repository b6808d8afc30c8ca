// test_diff.cpp - Tests for get_diff() change trees

#include "test_models.h"

#include <catch2/catch_all.hpp>

using namespace deep_delta;
using namespace test_models;

TEST_CASE("Equal objects produce an empty diff", "[diff]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();

    Diff diff = get_diff(a, b);
    REQUIRE(diff.empty());
    REQUIRE_FALSE(diff.has_changes());
    REQUIRE(diff.size() == 0);
}

TEST_CASE("Scalar member change is a Set entry", "[diff]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();
    b.id    = 43;
    b.notes = "second";

    Diff diff = get_diff(a, b);
    REQUIRE(diff.has_changes());
    REQUIRE_FALSE(diff.is_replacement());
    REQUIRE(diff.size() == 2);

    const MemberChange& first = diff.member_changes()[0];
    REQUIRE(first.member_index == order_member::id);
    REQUIRE(first.kind == MemberChangeKind::Set);
    REQUIRE(std::any_cast<int>(*first.value()) == 43);

    const MemberChange* notes = diff.find(order_member::notes);
    REQUIRE(notes != nullptr);
    REQUIRE(std::any_cast<std::string>(*notes->value()) == "second");
}

TEST_CASE("Changes are listed in stable index order", "[diff]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();
    b.coupon = "SAVE10";
    b.id     = 1;
    b.dims   = {3, 2, 1};

    Diff diff = get_diff(a, b);
    REQUIRE(diff.size() == 3);
    REQUIRE(diff.member_changes()[0].member_index == order_member::id);
    REQUIRE(diff.member_changes()[1].member_index == order_member::dims);
    REQUIRE(diff.member_changes()[2].member_index == order_member::coupon);
}

TEST_CASE("Collection members report their ops", "[diff][collection]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();
    b.items[1].qty = 2;
    b.tags.erase("region");

    Diff diff = get_diff(a, b);
    REQUIRE(diff.size() == 2);

    const MemberChange* items = diff.find(order_member::items);
    REQUIRE(items != nullptr);
    REQUIRE(items->kind == MemberChangeKind::CollectionOps);
    REQUIRE(items->ops()->size() == 1);
    REQUIRE((*items->ops())[0].kind == DeltaKind::SeqNestedAt);
    REQUIRE((*items->ops())[0].index == 1);

    const MemberChange* tags = diff.find(order_member::tags);
    REQUIRE(tags != nullptr);
    REQUIRE(tags->ops()->count(DeltaKind::DictRemove) == 1);
}

TEST_CASE("Nested objects report a nested diff", "[diff][nested]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();
    a.customer = std::make_shared<Customer>(Customer{"Ann", nullptr});
    b.customer = std::make_shared<Customer>(Customer{"Anne", nullptr});

    Diff diff = get_diff(a, b);
    REQUIRE(diff.size() == 1);

    const MemberChange* customer = diff.find(order_member::customer);
    REQUIRE(customer != nullptr);
    REQUIRE(customer->kind == MemberChangeKind::Nested);
    const Diff* nested = customer->nested();
    REQUIRE(nested != nullptr);
    REQUIRE(nested->size() == 1);
    REQUIRE(nested->member_changes()[0].member_index == customer_member::name);
}

TEST_CASE("Reference appearing or disappearing is a Set entry", "[diff][nested]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();
    b.customer = std::make_shared<Customer>(Customer{"Ann", nullptr});

    Diff diff = get_diff(a, b);
    const MemberChange* customer = diff.find(order_member::customer);
    REQUIRE(customer != nullptr);
    REQUIRE(customer->kind == MemberChangeKind::Set);

    auto* payload = std::any_cast<std::shared_ptr<Customer>>(customer->value());
    REQUIRE(payload != nullptr);
    REQUIRE(payload->get() == b.customer.get());
}

TEST_CASE("Policies shape the diff", "[diff][policy]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();

    SECTION("skip members never appear") {
        b.cache = "stale";
        REQUIRE(get_diff(a, b).empty());
    }

    SECTION("shallow members are replaced as a whole") {
        b.snapshot = {{"S", 1, 1.0}};
        Diff diff = get_diff(a, b);
        const MemberChange* snapshot = diff.find(order_member::snapshot);
        REQUIRE(snapshot != nullptr);
        REQUIRE(snapshot->kind == MemberChangeKind::Set);
    }

    SECTION("order-insensitive members are replaced as a whole") {
        b.categories = {"new"};
        Diff diff = get_diff(a, b);
        const MemberChange* categories = diff.find(order_member::categories);
        REQUIRE(categories != nullptr);
        REQUIRE(categories->kind == MemberChangeKind::Set);
    }
}

TEST_CASE("Root references produce replacement diffs", "[diff][reference]") {
    register_test_models();

    auto circle = make_circle("c", 1.0);

    SECTION("null to instance") {
        std::shared_ptr<Shape> empty;
        Diff diff = get_diff(empty, circle);
        REQUIRE(diff.is_replacement());
        REQUIRE(diff.new_value_as<std::shared_ptr<Shape>>()->get() == circle.get());
    }

    SECTION("instance to null") {
        std::shared_ptr<Shape> empty;
        Diff diff = get_diff(circle, empty);
        REQUIRE(diff.is_replacement());
        REQUIRE(*diff.new_value_as<std::shared_ptr<Shape>>() == nullptr);
    }

    SECTION("runtime type change") {
        auto rect = make_shape<Rect>("c");
        Diff diff = get_diff(circle, rect);
        REQUIRE(diff.is_replacement());
    }

    SECTION("same runtime type diffs members") {
        Diff diff = get_diff(circle, make_circle("c", 2.0));
        REQUIRE_FALSE(diff.is_replacement());
        REQUIRE(diff.size() == 1);
    }
}

TEST_CASE("Diff rendering", "[diff][debug]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();
    b.id = 7;

    const std::string text = diff_to_string(get_diff(a, b));
    REQUIRE_FALSE(text.empty());
    REQUIRE(text.find('7') != std::string::npos);
}
