/**
 * @file element_set.hpp
 */
#pragma once
#include "posetrank/common/common.hpp"
#include "posetrank/common/poset_enums.hpp"

namespace posetrank
{

/**
 * @brief A set of element indices over a fixed universe 0..n-1.
 *
 * @details
 * `ElementSet` is the key type used to memoise computations over the subset
 * lattice of a partial order. Membership is stored as a bitset: the first 64
 * elements live in a single inline word, and universes larger than 64 spill
 * into additional words. Two sets compare equal only if they have the same
 * universe size and the same members, which makes the representation a
 * canonical key for hashing.
 *
 * @par Index validation
 * `insert()`, `erase()` and `contains()` throw `PosetError` with
 * `InvalidElementIndex` when the index is outside the universe.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads are safe if no concurrent writes occur.
 */
class ElementSet
{
public:
    ElementSet() = default;

    /**
     * @brief Construct an empty set over the universe 0..universe_size-1.
     */
    explicit ElementSet(size_t universe_size);

    /**
     * @brief Construct the set containing every element of the universe.
     */
    static ElementSet full(size_t universe_size);

    size_t universe_size() const noexcept
    {
        return m_universe_size;
    }

    void insert(ElementIdx element);
    void erase(ElementIdx element);
    bool contains(ElementIdx element) const;

    /**
     * @brief Number of members.
     */
    size_t count() const noexcept;

    bool empty() const noexcept;

    /**
     * @brief Check whether this set shares at least one member with another.
     * @note Both sets must have the same universe; members outside the
     *       smaller universe are ignored.
     */
    bool intersects(const ElementSet& other) const noexcept;

    /**
     * @brief Members in increasing index order.
     */
    std::vector<ElementIdx> members() const;

    /**
     * @brief Invoke `f(ElementIdx)` for every member in increasing order.
     */
    template <typename F>
    void for_each(F&& f) const
    {
        for (size_t w = 0; w < word_count(); ++w)
        {
            uint64_t bits = word(w);
            for (size_t b = 0; bits != 0; ++b, bits >>= 1)
            {
                if (bits & 1u)
                {
                    f(static_cast<ElementIdx>(w * 64 + b));
                }
            }
        }
    }

    size_t hash() const noexcept;

    bool operator==(const ElementSet& other) const noexcept;
    bool operator!=(const ElementSet& other) const noexcept
    {
        return !(*this == other);
    }

private:
    size_t word_count() const noexcept
    {
        return m_universe_size == 0 ? 0 : 1 + m_high_words.size();
    }

    uint64_t word(size_t w) const noexcept
    {
        return w == 0 ? m_low_word : m_high_words[w - 1];
    }

    uint64_t& word(size_t w) noexcept
    {
        return w == 0 ? m_low_word : m_high_words[w - 1];
    }

    void validate_index(ElementIdx element) const;

    size_t m_universe_size = 0;

    /// Members 0..63.
    uint64_t m_low_word = 0;

    /// Members 64 and above, 64 per word. Empty when the universe fits in
    /// the low word.
    std::vector<uint64_t> m_high_words;
};

/**
 * @brief Hash functor so `ElementSet` can key unordered containers.
 */
struct ElementSetHash
{
    size_t operator()(const ElementSet& set) const noexcept
    {
        return set.hash();
    }
};

} // namespace posetrank
