// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file main.cpp
/// @brief Replicates edits of an order graph to a replica through deltas
///
/// This example shows:
/// - Registering types with describe_type()
/// - Computing a delta from a "before" and "after" snapshot
/// - Applying the delta to a replica and verifying convergence
/// - get_diff() for inspection
/// - Dirty-tracked types emitting only their changed members

#include <deep_delta/deep_delta.h>

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace deep_delta;

// ============================================================================
// Model
// ============================================================================

struct Line {
    std::string sku;
    int qty = 0;
};

struct Buyer {
    std::string name;
    std::string email;
};

struct PurchaseOrder {
    int id = 0;
    std::vector<Line> lines;
    std::map<std::string, std::string> attributes;
    std::shared_ptr<Buyer> buyer;
    Value metadata;
};

class Counter : public DeltaTracked {
public:
    Counter() : DeltaTracked(2) {}

    void set_hits(int hits) {
        hits_ = hits;
        mark_dirty(0);
    }

    void set_label(std::string label) {
        label_ = std::move(label);
        mark_dirty(1);
    }

    int hits() const { return hits_; }

    static void describe() {
        describe_type<Counter>("Counter").member("Hits", &Counter::hits_).member("Label", &Counter::label_).finish();
    }

private:
    int hits_ = 0;
    std::string label_;
};

void register_types() {
    describe_type<Line>("Line").member("Sku", &Line::sku).member("Qty", &Line::qty).finish();
    describe_type<Buyer>("Buyer").member("Name", &Buyer::name).member("Email", &Buyer::email).finish();
    describe_type<PurchaseOrder>("PurchaseOrder")
        .member("Id", &PurchaseOrder::id)
        .member("Lines", &PurchaseOrder::lines)
        .member("Attributes", &PurchaseOrder::attributes)
        .member("Buyer", &PurchaseOrder::buyer)
        .member("Metadata", &PurchaseOrder::metadata)
        .finish();
    Counter::describe();
}

// ============================================================================
// Demos
// ============================================================================

void demo_replication() {
    std::cout << "\n=== Replication ===\n";

    PurchaseOrder before;
    before.id         = 1001;
    before.lines      = {{"apple", 3}, {"pear", 1}, {"plum", 2}};
    before.attributes = {{"channel", "web"}, {"gift", "no"}};
    before.buyer      = std::make_shared<Buyer>(Buyer{"Ann", "ann@example.com"});
    before.metadata   = Value::map({{"source", "checkout"}, {"retries", 0}});

    PurchaseOrder replica = before;
    replica.buyer         = std::make_shared<Buyer>(*before.buyer);

    PurchaseOrder after = before;
    after.buyer         = std::make_shared<Buyer>(*before.buyer);
    after.lines[1].qty  = 4;
    after.lines.pop_back();
    after.attributes.erase("gift");
    after.attributes["coupon"] = "SPRING";
    after.buyer->email         = "ann@example.org";
    after.metadata             = after.metadata.set("retries", 1);

    DeltaDocument delta = compute_delta(before, after);
    std::cout << "Delta (" << delta.size() << " ops):\n";
    print_delta(delta);

    apply_delta(replica, delta);
    std::cout << "Replica converged: " << std::boolalpha << are_equal(replica, after) << "\n";
}

void demo_diff() {
    std::cout << "\n=== Diff ===\n";

    PurchaseOrder a;
    a.id    = 1;
    a.lines = {{"apple", 1}};
    PurchaseOrder b = a;
    b.id            = 2;
    b.lines[0].sku  = "APPLE";

    std::cout << "Ordinal:\n";
    print_diff(get_diff(a, b));

    ComparisonOptions options;
    options.string_comparison = StringComparison::OrdinalIgnoreCase;
    std::cout << "Ignoring case:\n";
    print_diff(get_diff(a, b, options));
}

void demo_dirty_tracking() {
    std::cout << "\n=== Dirty tracking ===\n";

    Counter base;
    Counter edited = base;
    edited.set_hits(5);

    DeltaDocument delta = compute_delta(base, edited);
    print_delta(delta);

    apply_delta(base, delta);
    std::cout << "hits=" << base.hits() << " dirty=" << std::boolalpha << base.has_any_dirty() << "\n";
}

int main() {
    std::cout << "deep_delta order sync example\n";
    register_types();

    try {
        demo_replication();
        demo_diff();
        demo_dirty_tracking();
    } catch (const delta_error& e) {
        std::cerr << "delta error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
