// delta_document.h - Operation log that transforms one instance into another
//
// A DeltaDocument is an ordered, append-only sequence of DeltaOp records
// addressed by stable member index (and, for collections, element index or
// map key). Nested documents are owned by their parent op through an
// immer::box, so documents are cheap to copy and immutable once handed out.

#pragma once

#include <deep_delta/deep_delta_config.h>
#include <deep_delta/api.h>

#include <immer/box.hpp>

#include <any>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace deep_delta {

enum class DeltaKind : int {
    ReplaceObject = 0,
    SetMember     = 1,
    NestedMember  = 2,
    SeqReplaceAt  = 10,
    SeqAddAt      = 11,
    SeqRemoveAt   = 12,
    SeqNestedAt   = 13,
    DictSet       = 20,
    DictRemove    = 21,
    DictNested    = 22,
};

/// Member index reserved for whole-object replacement
inline constexpr int replace_object_member = -1;

[[nodiscard]] DEEP_DELTA_API bool is_known_kind(DeltaKind kind) noexcept;
[[nodiscard]] DEEP_DELTA_API bool is_sequence_kind(DeltaKind kind) noexcept;
[[nodiscard]] DEEP_DELTA_API bool is_dictionary_kind(DeltaKind kind) noexcept;
[[nodiscard]] DEEP_DELTA_API std::string_view to_string(DeltaKind kind) noexcept;

class DeltaDocument;
using DeltaDocumentBox = immer::box<DeltaDocument>;

struct DEEP_DELTA_API DeltaOp {
    int member_index = replace_object_member;
    DeltaKind kind   = DeltaKind::ReplaceObject;
    int index        = -1;   // sequence ops: position in the target at apply time
    std::any key;            // dictionary ops
    std::any value;          // new payload; fallback replacement for nested ops
    std::optional<DeltaDocumentBox> nested;

    [[nodiscard]] const DeltaDocument* nested_doc() const noexcept;

    template <typename T>
    [[nodiscard]] const T* value_if() const noexcept {
        return std::any_cast<T>(&value);
    }

    template <typename K>
    [[nodiscard]] const K* key_if() const noexcept {
        return std::any_cast<K>(&key);
    }
};

class DEEP_DELTA_API DeltaDocument {
public:
    using const_iterator = std::vector<DeltaOp>::const_iterator;

    DeltaDocument() = default;
    explicit DeltaDocument(std::type_index target_type) : target_type_(target_type) {}

    [[nodiscard]] bool empty() const noexcept { return ops_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return ops_.size(); }

    [[nodiscard]] const_iterator begin() const noexcept { return ops_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return ops_.end(); }
    [[nodiscard]] const DeltaOp& operator[](std::size_t i) const { return ops_.at(i); }
    [[nodiscard]] const std::vector<DeltaOp>& operations() const noexcept { return ops_; }

    /// The ReplaceObject op, if any; it supersedes every other op
    [[nodiscard]] const DeltaOp* find_replace_object() const noexcept;

    [[nodiscard]] std::vector<const DeltaOp*> ops_for_member(int member_index) const;
    [[nodiscard]] std::size_t count(DeltaKind kind) const noexcept;

    /// Runtime type of the object this document patches, when known
    [[nodiscard]] const std::optional<std::type_index>& target_type() const noexcept {
        return target_type_;
    }
    void set_target_type(std::type_index type) { target_type_ = type; }

    void append(DeltaOp op) { ops_.push_back(std::move(op)); }

private:
    std::vector<DeltaOp> ops_;
    std::optional<std::type_index> target_type_;
};

inline const DeltaDocument* DeltaOp::nested_doc() const noexcept {
    return nested ? &nested->get() : nullptr;
}

// ============================================================
// DeltaWriter - appends well-formed ops to a document
//
// Nested writes take a finished child document and drop it when empty, so a
// nested op is only present when it changes something.
// ============================================================

class DEEP_DELTA_API DeltaWriter {
public:
    explicit DeltaWriter(DeltaDocument& doc) noexcept : doc_(&doc) {}

    [[nodiscard]] DeltaDocument& document() noexcept { return *doc_; }

    void write_replace_object(std::any new_value);
    void write_set_member(int member_index, std::any value);
    void write_nested_member(int member_index, DeltaDocument nested, std::any fallback = {});

    void write_seq_replace_at(int member_index, int index, std::any value);
    void write_seq_add_at(int member_index, int index, std::any value);
    void write_seq_remove_at(int member_index, int index);
    void write_seq_nested_at(int member_index, int index, DeltaDocument nested, std::any fallback = {});

    void write_dict_set(int member_index, std::any key, std::any value);
    void write_dict_remove(int member_index, std::any key);
    void write_dict_nested(int member_index, std::any key, DeltaDocument nested, std::any fallback = {});

private:
    DeltaDocument* doc_;
};

// ============================================================
// Debug output
// ============================================================

/// Keys and values of common scalar types and Value are rendered; others print as <type>
[[nodiscard]] DEEP_DELTA_API std::string payload_to_string(const std::any& payload);

[[nodiscard]] DEEP_DELTA_API std::string delta_to_string(const DeltaDocument& doc, std::size_t depth = 0);

DEEP_DELTA_API void print_delta(const DeltaDocument& doc);

} // namespace deep_delta
