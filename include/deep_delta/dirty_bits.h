// dirty_bits.h - Word-packed per-member dirty flags
//
// One bit per member ordinal. Word 0 is stored inline; types with more than
// 64 members get extra words. In thread-safe mode every read-modify-write is
// a compare-exchange loop, so concurrent mark() calls never lose a bit and
// try_pop_next() atomically clears the bit it returns.

#pragma once

#include <deep_delta/api.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace deep_delta {

class DEEP_DELTA_API DirtyBits {
public:
    static constexpr std::size_t bits_per_word = 64;

    explicit DirtyBits(std::size_t bit_count = bits_per_word, bool thread_safe = false);

    /// Copies take a snapshot of the current bits
    DirtyBits(const DirtyBits& other);
    DirtyBits& operator=(const DirtyBits& other);

    /// Grow to hold at least bit_count bits. Not safe against concurrent mark().
    void ensure_capacity(std::size_t bit_count);

    /// Non-thread-safe mode grows on demand; thread-safe mode throws
    /// std::out_of_range for bits beyond capacity()
    void mark(std::size_t bit);
    void clear(std::size_t bit) noexcept;

    [[nodiscard]] bool test(std::size_t bit) const noexcept;
    [[nodiscard]] bool any() const noexcept;
    [[nodiscard]] std::size_t count() const noexcept;

    /// Lowest set bit, cleared atomically; nullopt when clean
    [[nodiscard]] std::optional<std::size_t> try_pop_next() noexcept;

    void clear_all() noexcept;

    [[nodiscard]] std::size_t capacity() const noexcept { return (1 + extra_words_) * bits_per_word; }
    [[nodiscard]] bool thread_safe() const noexcept { return thread_safe_; }

private:
    [[nodiscard]] std::atomic<std::uint64_t>* word(std::size_t w) noexcept;
    [[nodiscard]] const std::atomic<std::uint64_t>* word(std::size_t w) const noexcept;
    [[nodiscard]] std::size_t word_count() const noexcept { return 1 + extra_words_; }

    std::atomic<std::uint64_t> word0_{0};
    std::unique_ptr<std::atomic<std::uint64_t>[]> extra_;
    std::size_t extra_words_ = 0;
    bool thread_safe_;
};

/// Base class for dirty-tracked types.
///
/// A member's bit is its declaration ordinal in the type's SchemaBuilder.
/// Setters call mark_dirty(); compute_delta() drains the right-hand side's
/// bits and apply_delta() clears the target's bit for each applied member.
class DEEP_DELTA_API DeltaTracked {
public:
    DeltaTracked(std::size_t member_count = DirtyBits::bits_per_word, bool thread_safe = false)
        : dirty_(member_count, thread_safe) {}

    void mark_dirty(std::size_t ordinal) const { dirty_.mark(ordinal); }
    [[nodiscard]] bool is_dirty(std::size_t ordinal) const noexcept { return dirty_.test(ordinal); }
    [[nodiscard]] bool has_any_dirty() const noexcept { return dirty_.any(); }
    void clear_dirty() const noexcept { dirty_.clear_all(); }

    [[nodiscard]] DirtyBits& dirty_bits() const noexcept { return dirty_; }

protected:
    ~DeltaTracked() = default;
    DeltaTracked(const DeltaTracked&)            = default;
    DeltaTracked& operator=(const DeltaTracked&) = default;

private:
    mutable DirtyBits dirty_;
};

} // namespace deep_delta
