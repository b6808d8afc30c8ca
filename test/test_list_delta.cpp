// test_list_delta.cpp - Tests for sequence reconciliation (Seq* ops)

#include "test_models.h"

#include <catch2/catch_all.hpp>

#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

using namespace deep_delta;
using namespace test_models;

namespace {

struct Bag {
    std::vector<int> values;
    std::vector<bool> flags;
};

void register_bag() {
    static std::once_flag once;
    std::call_once(once, [] {
        describe_type<Bag>("Bag").member("Values", &Bag::values).member("Flags", &Bag::flags).finish();
    });
}

struct Shipment {
    std::vector<Item> parcels; // matched by sku, order does not matter
};

void register_shipment() {
    register_test_models();
    static std::once_flag once;
    std::call_once(once, [] {
        describe_type<Shipment>("Shipment").keyed_member("Parcels", &Shipment::parcels, &Item::sku).finish();
    });
}

/// Deterministic pseudo-random source for property checks
class Lcg {
public:
    explicit Lcg(std::uint32_t seed) : state_(seed) {}

    int next(int bound) {
        state_ = state_ * 1664525u + 1013904223u;
        return static_cast<int>((state_ >> 8) % static_cast<std::uint32_t>(bound));
    }

private:
    std::uint32_t state_;
};

std::vector<int> random_list(Lcg& rng) {
    std::vector<int> result(static_cast<std::size_t>(rng.next(8)));
    for (auto& value : result) {
        value = rng.next(4);
    }
    return result;
}

/// Removes descending, adds ascending, every index valid at apply time
void check_ordering(const DeltaDocument& doc, std::size_t left_size) {
    std::size_t size = left_size;
    int last_remove  = -1;
    int last_add     = -1;
    for (const auto& op : doc) {
        REQUIRE(op.index >= 0);
        switch (op.kind) {
        case DeltaKind::SeqRemoveAt:
            if (last_remove >= 0) {
                REQUIRE(op.index < last_remove);
            }
            last_remove = op.index;
            REQUIRE(static_cast<std::size_t>(op.index) < size);
            --size;
            break;
        case DeltaKind::SeqAddAt:
            if (last_add >= 0) {
                REQUIRE(op.index > last_add);
            }
            last_add = op.index;
            REQUIRE(static_cast<std::size_t>(op.index) <= size);
            ++size;
            break;
        default:
            REQUIRE(static_cast<std::size_t>(op.index) < size);
            break;
        }
    }
    REQUIRE((last_remove < 0 || last_add < 0));
}

/// Applies the delta of (left -> right) to a copy of left
void check_round_trip(std::vector<int> left, std::vector<int> right) {
    Bag a{std::move(left), {}};
    Bag b{std::move(right), {}};

    DeltaDocument doc = compute_delta(a, b);
    check_ordering(doc, a.values.size());

    Bag target = a;
    apply_delta(target, doc);
    REQUIRE(target.values == b.values);

    if (a.values == b.values) {
        REQUIRE(doc.empty());
    }
}

} // namespace

// ============================================================
// Window trimming
// ============================================================

TEST_CASE("Prefix and suffix trimming", "[list][trim]") {
    ComparerContext ctx;
    using Ops = NodeOps<int>;

    SECTION("identical lists") {
        std::vector<int> a{1, 2, 3};
        ListWindow window = trim_list<Ops>(a, a, ctx);
        REQUIRE(window.unchanged());
        REQUIRE(window.prefix == 3);
    }

    SECTION("middle change") {
        std::vector<int> a{1, 2, 3, 4};
        std::vector<int> b{1, 9, 9, 9, 4};
        ListWindow window = trim_list<Ops>(a, b, ctx);
        REQUIRE(window.prefix == 1);
        REQUIRE(window.suffix == 1);
        REQUIRE(window.left_count == 2);
        REQUIRE(window.right_count == 3);
    }

    SECTION("prefix and suffix never overlap") {
        std::vector<int> a{1, 1};
        std::vector<int> b{1, 1, 1};
        ListWindow window = trim_list<Ops>(a, b, ctx);
        REQUIRE(window.prefix + window.suffix == 2);
        REQUIRE(window.left_count == 0);
        REQUIRE(window.right_count == 1);
    }
}

// ============================================================
// Emitted ops
// ============================================================

TEST_CASE("Scalar lists", "[list][delta]") {
    register_bag();

    Bag a{{1, 2, 3}, {}};
    Bag b = a;

    SECTION("unchanged list emits nothing") {
        REQUIRE(compute_delta(a, b).empty());
    }

    SECTION("append at the end") {
        b.values.push_back(4);
        b.values.push_back(5);
        DeltaDocument doc = compute_delta(a, b);
        REQUIRE(doc.size() == 2);
        REQUIRE(doc[0].kind == DeltaKind::SeqAddAt);
        REQUIRE(doc[0].index == 3);
        REQUIRE(doc[1].index == 4);
        REQUIRE(*doc[1].value_if<int>() == 5);
    }

    SECTION("changed element is replaced") {
        b.values[1] = 20;
        DeltaDocument doc = compute_delta(a, b);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc[0].kind == DeltaKind::SeqReplaceAt);
        REQUIRE(doc[0].index == 1);
        REQUIRE(*doc[0].value_if<int>() == 20);
    }

    SECTION("truncation removes from the back") {
        b.values = {1};
        DeltaDocument doc = compute_delta(a, b);
        REQUIRE(doc.size() == 2);
        REQUIRE(doc[0].kind == DeltaKind::SeqRemoveAt);
        REQUIRE(doc[0].index == 2);
        REQUIRE(doc[1].index == 1);
    }

    SECTION("bool lists") {
        a.flags = {true, false, true};
        b.flags = {true, true, true, false};
        DeltaDocument doc = compute_delta(a, b);
        apply_delta(a, doc);
        REQUIRE(a.flags == b.flags);
    }
}

TEST_CASE("Changed element of a registered type is patched in place", "[list][delta]") {
    register_test_models();

    Order a = make_order();
    Order b = make_order();
    b.items[1].qty = 2;

    DeltaDocument doc = compute_delta(a, b);
    REQUIRE(doc.size() == 1);

    const DeltaOp& op = doc[0];
    REQUIRE(op.member_index == order_member::items);
    REQUIRE(op.kind == DeltaKind::SeqNestedAt);
    REQUIRE(op.index == 1);

    const DeltaDocument* nested = op.nested_doc();
    REQUIRE(nested != nullptr);
    REQUIRE(nested->size() == 1);
    REQUIRE((*nested)[0].kind == DeltaKind::SetMember);
    REQUIRE((*nested)[0].member_index == item_member::qty);
    REQUIRE(*(*nested)[0].value_if<int>() == 2);

    apply_delta(a, doc);
    REQUIRE(are_equal(a, b));
}

TEST_CASE("Removing the first and last elements", "[list][delta]") {
    register_test_models();

    Order a = make_order();
    a.items.push_back({"W", 4, 0.5});
    Order b = a;
    b.items.erase(b.items.begin());
    b.items.pop_back();

    DeltaDocument doc = compute_delta(a, b);
    REQUIRE(doc.count(DeltaKind::SeqRemoveAt) >= 2);
    check_ordering(doc, a.items.size());

    apply_delta(a, doc);
    REQUIRE(a.items.size() == 2);
    REQUIRE(a.items[0].sku == "Y");
    REQUIRE(a.items[1].sku == "Z");
    REQUIRE(are_equal(a, b));
}

TEST_CASE("Inserting in the middle", "[list][delta]") {
    register_bag();

    Bag a{{1, 2, 3}, {}};
    Bag b{{1, 7, 8, 2, 3}, {}};

    DeltaDocument doc = compute_delta(a, b);
    check_ordering(doc, a.values.size());
    apply_delta(a, doc);
    REQUIRE(a.values == b.values);
}

TEST_CASE("Insertions on both sides of the kept elements", "[list][delta]") {
    register_bag();

    SECTION("one before and one after") {
        Bag a{{1, 2}, {}};
        Bag b{{7, 1, 2, 8}, {}};

        DeltaDocument doc = compute_delta(a, b);
        REQUIRE(doc.size() == 2);
        REQUIRE(doc.count(DeltaKind::SeqAddAt) == 2);
        REQUIRE(doc[0].index == 0);
        REQUIRE(*doc[0].value_if<int>() == 7);
        REQUIRE(doc[1].index == 3);
        REQUIRE(*doc[1].value_if<int>() == 8);

        apply_delta(a, doc);
        REQUIRE(a.values == b.values);
    }

    SECTION("repeated runs align at the largest offset") {
        Bag a{{1, 2}, {}};
        Bag b{{9, 1, 2, 1, 2, 8}, {}};

        DeltaDocument doc = compute_delta(a, b);
        REQUIRE(doc.size() == 4);
        REQUIRE(doc.count(DeltaKind::SeqAddAt) == 4);
        REQUIRE(doc[2].index == 2);
        REQUIRE(doc[3].index == 5);
        check_ordering(doc, a.values.size());
        apply_delta(a, doc);
        REQUIRE(a.values == b.values);
    }

    SECTION("no alignment falls back to positional ops") {
        Bag a{{1, 2}, {}};
        Bag b{{7, 3, 1, 8}, {}};

        DeltaDocument doc = compute_delta(a, b);
        REQUIRE(doc.count(DeltaKind::SeqReplaceAt) == 2);
        REQUIRE(doc.count(DeltaKind::SeqAddAt) == 2);
        apply_delta(a, doc);
        REQUIRE(a.values == b.values);
    }
}

TEST_CASE("Applying list ops reproduces the right-hand list", "[list][property]") {
    register_bag();

    check_round_trip({1, 2}, {0, 1, 2, 3});
    check_round_trip({1, 2}, {9, 1, 2, 1, 2, 8});
    check_round_trip({3, 3}, {3, 1, 3, 3});

    Lcg rng(20240917u);
    for (int round = 0; round < 500; ++round) {
        std::vector<int> left  = random_list(rng);
        std::vector<int> right = random_list(rng);
        check_round_trip(std::move(left), std::move(right));
    }
}

// ============================================================
// Keyed, order-insensitive lists
// ============================================================

TEST_CASE("Keyed lists match elements by key", "[list][keyed]") {
    register_shipment();

    Shipment a{{{"X", 1, 1.0}, {"Y", 2, 2.0}, {"Z", 3, 3.0}}};

    SECTION("reordering alone emits nothing") {
        Shipment b{{{"Z", 3, 3.0}, {"X", 1, 1.0}, {"Y", 2, 2.0}}};
        REQUIRE(are_equal(a, b));
        REQUIRE(compute_delta(a, b).empty());
    }

    SECTION("changed element is patched where it sits") {
        Shipment b{{{"Z", 3, 3.0}, {"Y", 5, 2.0}, {"X", 1, 1.0}}};

        DeltaDocument doc = compute_delta(a, b);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc[0].kind == DeltaKind::SeqNestedAt);
        REQUIRE(doc[0].index == 1);
        REQUIRE((*doc[0].nested_doc())[0].member_index == item_member::qty);
    }

    SECTION("removals, updates and additions") {
        Shipment b{{{"W", 9, 9.0}, {"Z", 4, 3.0}, {"X", 1, 1.0}}};

        DeltaDocument doc = compute_delta(a, b);
        REQUIRE(doc.size() == 3);
        REQUIRE(doc[0].kind == DeltaKind::SeqRemoveAt);
        REQUIRE(doc[0].index == 1);
        REQUIRE(doc[1].kind == DeltaKind::SeqNestedAt);
        REQUIRE(doc[1].index == 1);
        REQUIRE(doc[2].kind == DeltaKind::SeqAddAt);
        REQUIRE(doc[2].index == 2);
        REQUIRE(doc[2].value_if<Item>()->sku == "W");

        apply_delta(a, doc);
        REQUIRE(are_equal(a, b));
        REQUIRE(a.parcels[1].qty == 4);
    }

    SECTION("duplicate keys pair up in order") {
        Shipment left{{{"X", 1, 1.0}, {"X", 2, 1.0}}};
        Shipment right{{{"X", 1, 1.0}}};

        DeltaDocument doc = compute_delta(left, right);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc[0].kind == DeltaKind::SeqRemoveAt);
        REQUIRE(doc[0].index == 1);
    }

    SECTION("get_diff reports the keyed ops") {
        Shipment b{{{"X", 1, 1.0}, {"Y", 2, 2.0}}};
        Diff diff = get_diff(a, b);
        REQUIRE(diff.size() == 1);
        REQUIRE(diff.member_changes()[0].kind == MemberChangeKind::CollectionOps);
        REQUIRE(diff.member_changes()[0].ops()->size() == 1);
    }
}
