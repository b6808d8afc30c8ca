// test_comparer_context.cpp - Tests for cycle bookkeeping (enter/exit, VisitGuard)

#include <catch2/catch_all.hpp>
#include <deep_delta/comparer_context.h>

#include <stdexcept>

using namespace deep_delta;

TEST_CASE("ComparerContext enter and exit", "[context]") {
    ComparerContext ctx;
    int a = 0;
    int b = 0;

    SECTION("first enter succeeds, re-entry is refused") {
        REQUIRE(ctx.enter(&a, &b));
        REQUIRE(ctx.in_flight() == 1);
        REQUIRE_FALSE(ctx.enter(&a, &b));
        REQUIRE(ctx.in_flight() == 1);
    }

    SECTION("pairs are ordered") {
        REQUIRE(ctx.enter(&a, &b));
        REQUIRE(ctx.enter(&b, &a));
        REQUIRE(ctx.in_flight() == 2);
    }

    SECTION("exit makes the pair enterable again") {
        REQUIRE(ctx.enter(&a, &b));
        ctx.exit(&a, &b);
        REQUIRE(ctx.in_flight() == 0);
        REQUIRE(ctx.enter(&a, &b));
    }

    SECTION("exit of an unknown pair is harmless") {
        ctx.exit(&a, &b);
        REQUIRE(ctx.in_flight() == 0);
    }
}

TEST_CASE("ComparerContext carries options", "[context]") {
    ComparisonOptions options;
    options.double_epsilon    = 0.5;
    options.string_comparison = StringComparison::OrdinalIgnoreCase;

    ComparerContext ctx(options);
    REQUIRE(ctx.is_tracking());
    REQUIRE(ctx.options().double_epsilon == 0.5);
    REQUIRE(ctx.options().string_comparison == StringComparison::OrdinalIgnoreCase);
}

TEST_CASE("ComparerContext without tracking", "[context]") {
    auto ctx = ComparerContext::no_tracking();
    int a = 0;
    int b = 0;

    REQUIRE_FALSE(ctx.is_tracking());
    REQUIRE(ctx.enter(&a, &b));
    REQUIRE(ctx.enter(&a, &b));
    REQUIRE(ctx.in_flight() == 0);
}

TEST_CASE("VisitGuard releases the pair", "[context][guard]") {
    ComparerContext ctx;
    int a = 0;
    int b = 0;

    SECTION("on scope exit") {
        {
            VisitGuard guard(ctx, &a, &b);
            REQUIRE(guard.first_visit());
            VisitGuard inner(ctx, &a, &b);
            REQUIRE_FALSE(inner.first_visit());
            REQUIRE(ctx.in_flight() == 1);
        }
        REQUIRE(ctx.in_flight() == 0);
    }

    SECTION("when an exception unwinds") {
        REQUIRE_THROWS_AS(
            [&] {
                VisitGuard guard(ctx, &a, &b);
                throw std::runtime_error("boom");
            }(),
            std::runtime_error);
        REQUIRE(ctx.in_flight() == 0);
    }
}
