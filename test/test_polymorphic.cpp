// test_polymorphic.cpp - Tests for runtime-type dispatch through the registry

#include "test_models.h"

#include <catch2/catch_all.hpp>

using namespace deep_delta;
using namespace test_models;

TEST_CASE("Runtime type selects the schema", "[polymorphic]") {
    register_test_models();

    Canvas a;
    Canvas b;
    a.focus = make_circle("c", 1.0);
    b.focus = make_circle("c", 2.0);

    DeltaDocument doc = compute_delta(a, b);
    REQUIRE(doc.size() == 1);
    REQUIRE(doc[0].kind == DeltaKind::NestedMember);

    const DeltaDocument* nested = doc[0].nested_doc();
    REQUIRE(nested->target_type() == std::type_index(typeid(Circle)));
    REQUIRE(nested->size() == 1);
    REQUIRE(*(*nested)[0].value_if<double>() == 2.0);

    Shape* before = a.focus.get();
    apply_delta(a, doc);
    REQUIRE(a.focus.get() == before);
    REQUIRE(static_cast<Circle*>(a.focus.get())->radius == 2.0);
}

TEST_CASE("Runtime type change replaces the reference", "[polymorphic]") {
    register_test_models();

    Canvas a;
    Canvas b;
    a.focus = make_circle("s", 1.0);
    b.focus = make_shape<Rect>("s");

    DeltaDocument doc = compute_delta(a, b);
    REQUIRE(doc.size() == 1);
    REQUIRE(doc[0].kind == DeltaKind::SetMember);

    apply_delta(a, doc);
    REQUIRE(dynamic_cast<Rect*>(a.focus.get()) != nullptr);
    REQUIRE(are_equal(a, b));
}

TEST_CASE("Sequences of polymorphic elements", "[polymorphic][list]") {
    register_test_models();

    Canvas a;
    a.shapes = {make_circle("one", 1.0), make_shape<Rect>("two"), make_circle("three", 3.0)};
    Canvas b;
    b.shapes = {make_circle("one", 1.0), make_circle("two", 2.0), make_circle("three", 4.0)};

    DeltaDocument doc = compute_delta(a, b);
    REQUIRE(doc.size() == 2);
    REQUIRE(doc[0].kind == DeltaKind::SeqReplaceAt);
    REQUIRE(doc[0].index == 1);
    REQUIRE(doc[1].kind == DeltaKind::SeqNestedAt);
    REQUIRE(doc[1].index == 2);

    apply_delta(a, doc);
    REQUIRE(are_equal(a, b));
}

TEST_CASE("Unregistered subtypes fall back to the declared type", "[polymorphic][fallback]") {
    register_test_models();

    Canvas a;
    Canvas b;
    a.focus = make_shape<Triangle>("old");
    b.focus = make_shape<Triangle>("new");
    static_cast<Triangle*>(b.focus.get())->sides = 4;

    REQUIRE_FALSE(are_equal(a, b));

    DeltaDocument doc = compute_delta(a, b);
    REQUIRE(doc.size() == 1);
    REQUIRE(doc[0].nested_doc()->target_type() == std::type_index(typeid(Shape)));

    // Triangle::sides is not part of the Shape schema
    apply_delta(a, doc);
    REQUIRE(a.focus->name == "new");
    REQUIRE(static_cast<Triangle*>(a.focus.get())->sides == 3);
}

TEST_CASE("Stale nested documents", "[polymorphic][mismatch]") {
    register_test_models();

    Canvas a;
    Canvas b;
    a.focus = make_circle("c", 1.0);
    b.focus = make_circle("c", 2.0);

    Canvas target;
    target.focus = make_shape<Rect>("r");

    SECTION("without a replacement payload the mismatch is reported") {
        DeltaDocument doc = compute_delta(a, b);
        REQUIRE_THROWS_AS(apply_delta(target, doc), delta_type_mismatch);
    }

    SECTION("with a replacement payload the value is replaced") {
        ComparisonOptions options;
        options.embed_nested_fallback = true;
        DeltaDocument doc = compute_delta(a, b, options);
        REQUIRE(doc[0].value.has_value());

        apply_delta(target, doc);
        REQUIRE(target.focus.get() == b.focus.get());
    }
}

TEST_CASE("Root documents check the runtime type", "[polymorphic][root]") {
    register_test_models();

    std::shared_ptr<Shape> a = make_circle("c", 1.0);
    std::shared_ptr<Shape> b = make_circle("c", 2.0);
    DeltaDocument doc = compute_delta(a, b);

    std::shared_ptr<Shape> rect = make_shape<Rect>("r");
    REQUIRE_THROWS_AS(apply_delta(rect, doc), delta_type_mismatch);

    apply_delta(a, doc);
    REQUIRE(are_equal(a, b));
}
