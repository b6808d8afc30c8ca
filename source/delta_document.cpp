// delta_document.cpp - Delta document model, writer and debug output

#include <deep_delta/delta_document.h>
#include <deep_delta/value.h>

#include <algorithm>
#include <cstdint>
#include <iostream>

namespace deep_delta {

bool is_known_kind(DeltaKind kind) noexcept
{
    switch (kind) {
    case DeltaKind::ReplaceObject:
    case DeltaKind::SetMember:
    case DeltaKind::NestedMember:
    case DeltaKind::SeqReplaceAt:
    case DeltaKind::SeqAddAt:
    case DeltaKind::SeqRemoveAt:
    case DeltaKind::SeqNestedAt:
    case DeltaKind::DictSet:
    case DeltaKind::DictRemove:
    case DeltaKind::DictNested:
        return true;
    }
    return false;
}

bool is_sequence_kind(DeltaKind kind) noexcept
{
    return kind == DeltaKind::SeqReplaceAt || kind == DeltaKind::SeqAddAt ||
           kind == DeltaKind::SeqRemoveAt || kind == DeltaKind::SeqNestedAt;
}

bool is_dictionary_kind(DeltaKind kind) noexcept
{
    return kind == DeltaKind::DictSet || kind == DeltaKind::DictRemove || kind == DeltaKind::DictNested;
}

std::string_view to_string(DeltaKind kind) noexcept
{
    switch (kind) {
    case DeltaKind::ReplaceObject: return "ReplaceObject";
    case DeltaKind::SetMember:     return "SetMember";
    case DeltaKind::NestedMember:  return "NestedMember";
    case DeltaKind::SeqReplaceAt:  return "SeqReplaceAt";
    case DeltaKind::SeqAddAt:      return "SeqAddAt";
    case DeltaKind::SeqRemoveAt:   return "SeqRemoveAt";
    case DeltaKind::SeqNestedAt:   return "SeqNestedAt";
    case DeltaKind::DictSet:       return "DictSet";
    case DeltaKind::DictRemove:    return "DictRemove";
    case DeltaKind::DictNested:    return "DictNested";
    }
    return "Unknown";
}

// ============================================================
// DeltaDocument
// ============================================================

const DeltaOp* DeltaDocument::find_replace_object() const noexcept
{
    auto it = std::find_if(ops_.begin(), ops_.end(),
                           [](const DeltaOp& op) { return op.kind == DeltaKind::ReplaceObject; });
    return it == ops_.end() ? nullptr : &*it;
}

std::vector<const DeltaOp*> DeltaDocument::ops_for_member(int member_index) const
{
    std::vector<const DeltaOp*> result;
    for (const auto& op : ops_) {
        if (op.member_index == member_index) {
            result.push_back(&op);
        }
    }
    return result;
}

std::size_t DeltaDocument::count(DeltaKind kind) const noexcept
{
    return static_cast<std::size_t>(
        std::count_if(ops_.begin(), ops_.end(), [kind](const DeltaOp& op) { return op.kind == kind; }));
}

// ============================================================
// DeltaWriter
// ============================================================

void DeltaWriter::write_replace_object(std::any new_value)
{
    DeltaOp op;
    op.member_index = replace_object_member;
    op.kind         = DeltaKind::ReplaceObject;
    op.value        = std::move(new_value);
    doc_->append(std::move(op));
}

void DeltaWriter::write_set_member(int member_index, std::any value)
{
    DeltaOp op;
    op.member_index = member_index;
    op.kind         = DeltaKind::SetMember;
    op.value        = std::move(value);
    doc_->append(std::move(op));
}

void DeltaWriter::write_nested_member(int member_index, DeltaDocument nested, std::any fallback)
{
    if (nested.empty()) {
        return;
    }
    DeltaOp op;
    op.member_index = member_index;
    op.kind         = DeltaKind::NestedMember;
    op.value        = std::move(fallback);
    op.nested       = DeltaDocumentBox{std::move(nested)};
    doc_->append(std::move(op));
}

void DeltaWriter::write_seq_replace_at(int member_index, int index, std::any value)
{
    DeltaOp op;
    op.member_index = member_index;
    op.kind         = DeltaKind::SeqReplaceAt;
    op.index        = index;
    op.value        = std::move(value);
    doc_->append(std::move(op));
}

void DeltaWriter::write_seq_add_at(int member_index, int index, std::any value)
{
    DeltaOp op;
    op.member_index = member_index;
    op.kind         = DeltaKind::SeqAddAt;
    op.index        = index;
    op.value        = std::move(value);
    doc_->append(std::move(op));
}

void DeltaWriter::write_seq_remove_at(int member_index, int index)
{
    DeltaOp op;
    op.member_index = member_index;
    op.kind         = DeltaKind::SeqRemoveAt;
    op.index        = index;
    doc_->append(std::move(op));
}

void DeltaWriter::write_seq_nested_at(int member_index, int index, DeltaDocument nested, std::any fallback)
{
    if (nested.empty()) {
        return;
    }
    DeltaOp op;
    op.member_index = member_index;
    op.kind         = DeltaKind::SeqNestedAt;
    op.index        = index;
    op.value        = std::move(fallback);
    op.nested       = DeltaDocumentBox{std::move(nested)};
    doc_->append(std::move(op));
}

void DeltaWriter::write_dict_set(int member_index, std::any key, std::any value)
{
    DeltaOp op;
    op.member_index = member_index;
    op.kind         = DeltaKind::DictSet;
    op.key          = std::move(key);
    op.value        = std::move(value);
    doc_->append(std::move(op));
}

void DeltaWriter::write_dict_remove(int member_index, std::any key)
{
    DeltaOp op;
    op.member_index = member_index;
    op.kind         = DeltaKind::DictRemove;
    op.key          = std::move(key);
    doc_->append(std::move(op));
}

void DeltaWriter::write_dict_nested(int member_index, std::any key, DeltaDocument nested, std::any fallback)
{
    if (nested.empty()) {
        return;
    }
    DeltaOp op;
    op.member_index = member_index;
    op.kind         = DeltaKind::DictNested;
    op.key          = std::move(key);
    op.value        = std::move(fallback);
    op.nested       = DeltaDocumentBox{std::move(nested)};
    doc_->append(std::move(op));
}

// ============================================================
// Debug output
// ============================================================

std::string payload_to_string(const std::any& payload)
{
    if (!payload.has_value()) {
        return "-";
    }
    if (auto* s = std::any_cast<std::string>(&payload)) {
        return "\"" + *s + "\"";
    }
    if (auto* i = std::any_cast<int>(&payload)) {
        return std::to_string(*i);
    }
    if (auto* l = std::any_cast<std::int64_t>(&payload)) {
        return std::to_string(*l);
    }
    if (auto* d = std::any_cast<double>(&payload)) {
        return std::to_string(*d);
    }
    if (auto* b = std::any_cast<bool>(&payload)) {
        return *b ? "true" : "false";
    }
    if (auto* v = std::any_cast<Value>(&payload)) {
        return value_to_string(*v);
    }
    return std::string("<") + payload.type().name() + ">";
}

std::string delta_to_string(const DeltaDocument& doc, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    std::string result;
    for (const auto& op : doc) {
        result += indent + std::string(to_string(op.kind)) + " member=" + std::to_string(op.member_index);
        if (is_sequence_kind(op.kind)) {
            result += " index=" + std::to_string(op.index);
        }
        if (op.key.has_value()) {
            result += " key=" + payload_to_string(op.key);
        }
        if (op.value.has_value()) {
            result += " value=" + payload_to_string(op.value);
        }
        result += "\n";
        if (const DeltaDocument* nested = op.nested_doc()) {
            result += delta_to_string(*nested, depth + 1);
        }
    }
    return result;
}

void print_delta(const DeltaDocument& doc)
{
    if (doc.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    std::cout << delta_to_string(doc, 1);
}

} // namespace deep_delta
