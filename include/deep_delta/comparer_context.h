// comparer_context.h - Cycle bookkeeping for one top-level comparison
//
// Every recursive descent into an object brackets its member walk with
// enter()/exit(). A pair that is already in flight higher on the stack is
// treated as equal / unchanged, which breaks cycles. Use VisitGuard so that
// exit() runs on every path, including exceptions.
//
// A context is not safe for concurrent reuse. Create one per call or per thread.
//
// The context also names the TypeRegistry that registered types are resolved
// through (default_registry() unless another one is given).

#pragma once

#include <deep_delta/api.h>
#include <deep_delta/comparison_options.h>

#include <cstddef>
#include <unordered_set>

namespace deep_delta {

class TypeRegistry;

class DEEP_DELTA_API ComparerContext {
public:
    ComparerContext();
    explicit ComparerContext(ComparisonOptions options);
    ComparerContext(ComparisonOptions options, const TypeRegistry& registry);

    /// Context that skips cycle bookkeeping (acyclic graphs only)
    [[nodiscard]] static ComparerContext no_tracking(ComparisonOptions options = {});

    /// false if (left, right) is already being visited, true otherwise
    /// (the pair is then registered until the matching exit())
    [[nodiscard]] bool enter(const void* left, const void* right);
    void exit(const void* left, const void* right);

    [[nodiscard]] const ComparisonOptions& options() const noexcept { return options_; }
    [[nodiscard]] bool is_tracking() const noexcept { return tracking_; }
    [[nodiscard]] const TypeRegistry& registry() const noexcept { return *registry_; }

    /// Number of pairs currently in flight
    [[nodiscard]] std::size_t in_flight() const noexcept { return visited_.size(); }

private:
    struct RefPair {
        const void* left;
        const void* right;

        bool operator==(const RefPair& other) const noexcept {
            return left == other.left && right == other.right;
        }
    };

    struct RefPairHash {
        std::size_t operator()(const RefPair& pair) const noexcept;
    };

    std::unordered_set<RefPair, RefPairHash> visited_;
    ComparisonOptions options_;
    const TypeRegistry* registry_;
    bool tracking_ = true;
};

/// RAII enter/exit bracket
class VisitGuard {
public:
    VisitGuard(ComparerContext& ctx, const void* left, const void* right)
        : ctx_(ctx), left_(left), right_(right), entered_(ctx.enter(left, right)) {}

    ~VisitGuard() {
        if (entered_) {
            ctx_.exit(left_, right_);
        }
    }

    VisitGuard(const VisitGuard&)            = delete;
    VisitGuard& operator=(const VisitGuard&) = delete;

    /// false when the pair was already in flight (cycle re-entry)
    [[nodiscard]] bool first_visit() const noexcept { return entered_; }

private:
    ComparerContext& ctx_;
    const void* left_;
    const void* right_;
    bool entered_;
};

} // namespace deep_delta
