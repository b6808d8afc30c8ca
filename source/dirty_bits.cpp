// dirty_bits.cpp - Atomic dirty bitset

#include <deep_delta/dirty_bits.h>

#include <bit>
#include <stdexcept>
#include <string>

namespace deep_delta {

namespace {

constexpr std::size_t words_for(std::size_t bit_count) noexcept
{
    return bit_count == 0 ? 1 : (bit_count + DirtyBits::bits_per_word - 1) / DirtyBits::bits_per_word;
}

constexpr std::uint64_t mask_of(std::size_t bit) noexcept
{
    return std::uint64_t{1} << (bit % DirtyBits::bits_per_word);
}

} // namespace

DirtyBits::DirtyBits(std::size_t bit_count, bool thread_safe)
    : thread_safe_(thread_safe)
{
    ensure_capacity(bit_count);
}

DirtyBits::DirtyBits(const DirtyBits& other)
    : thread_safe_(other.thread_safe_)
{
    ensure_capacity(other.capacity());
    for (std::size_t w = 0; w < word_count(); ++w) {
        word(w)->store(other.word(w)->load(std::memory_order_acquire), std::memory_order_relaxed);
    }
}

DirtyBits& DirtyBits::operator=(const DirtyBits& other)
{
    if (this == &other) {
        return *this;
    }
    ensure_capacity(other.capacity());
    for (std::size_t w = 0; w < word_count(); ++w) {
        const std::uint64_t bits = w < other.word_count() ? other.word(w)->load(std::memory_order_acquire) : 0;
        word(w)->store(bits, std::memory_order_release);
    }
    return *this;
}

std::atomic<std::uint64_t>* DirtyBits::word(std::size_t w) noexcept
{
    return w == 0 ? &word0_ : &extra_[w - 1];
}

const std::atomic<std::uint64_t>* DirtyBits::word(std::size_t w) const noexcept
{
    return w == 0 ? &word0_ : &extra_[w - 1];
}

void DirtyBits::ensure_capacity(std::size_t bit_count)
{
    const std::size_t needed = words_for(bit_count) - 1;
    if (needed <= extra_words_) {
        return;
    }
    auto grown = std::make_unique<std::atomic<std::uint64_t>[]>(needed);
    for (std::size_t i = 0; i < needed; ++i) {
        const std::uint64_t bits = i < extra_words_ ? extra_[i].load(std::memory_order_acquire) : 0;
        grown[i].store(bits, std::memory_order_relaxed);
    }
    extra_       = std::move(grown);
    extra_words_ = needed;
}

void DirtyBits::mark(std::size_t bit)
{
    if (bit >= capacity()) {
        if (thread_safe_) {
            throw std::out_of_range("DirtyBits::mark: bit " + std::to_string(bit) +
                                    " beyond fixed capacity " + std::to_string(capacity()));
        }
        ensure_capacity(bit + 1);
    }
    auto* w = word(bit / bits_per_word);
    const std::uint64_t mask = mask_of(bit);
    if (!thread_safe_) {
        w->store(w->load(std::memory_order_relaxed) | mask, std::memory_order_relaxed);
        return;
    }
    std::uint64_t current = w->load(std::memory_order_relaxed);
    while (!w->compare_exchange_weak(current, current | mask,
                                     std::memory_order_acq_rel, std::memory_order_relaxed)) {
    }
}

void DirtyBits::clear(std::size_t bit) noexcept
{
    if (bit >= capacity()) {
        return;
    }
    auto* w = word(bit / bits_per_word);
    const std::uint64_t mask = ~mask_of(bit);
    if (!thread_safe_) {
        w->store(w->load(std::memory_order_relaxed) & mask, std::memory_order_relaxed);
        return;
    }
    std::uint64_t current = w->load(std::memory_order_relaxed);
    while (!w->compare_exchange_weak(current, current & mask,
                                     std::memory_order_acq_rel, std::memory_order_relaxed)) {
    }
}

bool DirtyBits::test(std::size_t bit) const noexcept
{
    if (bit >= capacity()) {
        return false;
    }
    return (word(bit / bits_per_word)->load(std::memory_order_acquire) & mask_of(bit)) != 0;
}

bool DirtyBits::any() const noexcept
{
    for (std::size_t w = 0; w < word_count(); ++w) {
        if (word(w)->load(std::memory_order_acquire) != 0) {
            return true;
        }
    }
    return false;
}

std::size_t DirtyBits::count() const noexcept
{
    std::size_t total = 0;
    for (std::size_t w = 0; w < word_count(); ++w) {
        total += static_cast<std::size_t>(std::popcount(word(w)->load(std::memory_order_acquire)));
    }
    return total;
}

std::optional<std::size_t> DirtyBits::try_pop_next() noexcept
{
    for (std::size_t w = 0; w < word_count(); ++w) {
        auto* slot = word(w);
        std::uint64_t current = slot->load(std::memory_order_acquire);
        while (current != 0) {
            const auto bit = static_cast<std::size_t>(std::countr_zero(current));
            const std::uint64_t cleared = current & ~(std::uint64_t{1} << bit);
            if (!thread_safe_) {
                slot->store(cleared, std::memory_order_relaxed);
                return w * bits_per_word + bit;
            }
            if (slot->compare_exchange_weak(current, cleared,
                                            std::memory_order_acq_rel, std::memory_order_acquire)) {
                return w * bits_per_word + bit;
            }
        }
    }
    return std::nullopt;
}

void DirtyBits::clear_all() noexcept
{
    for (std::size_t w = 0; w < word_count(); ++w) {
        word(w)->store(0, std::memory_order_release);
    }
}

} // namespace deep_delta
