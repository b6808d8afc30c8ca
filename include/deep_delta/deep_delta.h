// deep_delta.h - Umbrella header
//
//   are_equal(a, b)          cycle-safe deep equality
//   get_diff(a, b)           change tree (Diff)
//   compute_delta(a, b)      replayable patch (DeltaDocument)
//   apply_delta(target, doc) replay a patch in place

#pragma once

#include <deep_delta/deep_delta_config.h>
#include <deep_delta/api.h>
#include <deep_delta/comparer_context.h>
#include <deep_delta/comparison_options.h>
#include <deep_delta/concepts.h>
#include <deep_delta/delta_document.h>
#include <deep_delta/diff.h>
#include <deep_delta/dirty_bits.h>
#include <deep_delta/dynamic_comparer.h>
#include <deep_delta/errors.h>
#include <deep_delta/member_policy.h>
#include <deep_delta/node_ops.h>
#include <deep_delta/stable_index.h>
#include <deep_delta/type_registry.h>
#include <deep_delta/type_schema.h>
#include <deep_delta/value.h>
