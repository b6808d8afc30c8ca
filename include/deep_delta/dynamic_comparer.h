// dynamic_comparer.h - Comparison, reconciliation and patching of Value trees
//
// Used for untyped members where no schema applies. int64 and double share
// one numeric domain; ObjectRef pairs of the same registered type go through
// the type registry (cycle-safe through the same ComparerContext).
//
// Delta ops for a dynamic member carry the member's index. Documents nested
// inside a dynamic tree (DictNested / SeqNestedAt) address the sub-value itself
// with member index 0.

#pragma once

#include <deep_delta/api.h>
#include <deep_delta/comparer_context.h>
#include <deep_delta/delta_document.h>
#include <deep_delta/value.h>

namespace deep_delta {

[[nodiscard]] DEEP_DELTA_API bool are_equal_dynamic(const Value& a, const Value& b, ComparerContext& ctx);

/// Maps and vectors on both sides can be reconciled structurally
[[nodiscard]] DEEP_DELTA_API bool dynamic_reconcilable(const Value& a, const Value& b) noexcept;

/// Emits nothing when equal; Dict*/Seq* ops for reconcilable pairs; otherwise
/// one SetMember carrying the right-hand Value
DEEP_DELTA_API void compute_dynamic_delta(const Value& a, const Value& b, int member_index,
                                          ComparerContext& ctx, DeltaWriter& writer);

/// Applies one Set/Dict/Seq op to a dynamic value
/// @throws delta_index_out_of_range for bad sequence indices
/// @throws delta_type_mismatch when the op does not fit the value's shape
DEEP_DELTA_API void apply_dynamic_op(Value& target, const DeltaOp& op);

/// Applies a document whose ops address `target` itself (member index ignored)
DEEP_DELTA_API void apply_dynamic_delta(Value& target, const DeltaDocument& doc);

} // namespace deep_delta
