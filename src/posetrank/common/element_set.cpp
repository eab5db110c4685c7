/**
 * @file element_set.cpp
 */
#include "posetrank/common/element_set.hpp"
#include "posetrank/common/poset_exceptions.hpp"

#include <bitset>

namespace posetrank
{

ElementSet::ElementSet(size_t universe_size)
    : m_universe_size(universe_size)
{
    if (universe_size > 64)
    {
        m_high_words.assign((universe_size - 64 + 63) / 64, 0);
    }
}

ElementSet ElementSet::full(size_t universe_size)
{
    ElementSet result(universe_size);
    for (ElementIdx e = 0; e < universe_size; ++e)
    {
        result.insert(e);
    }
    return result;
}

void ElementSet::validate_index(ElementIdx element) const
{
    if (element >= m_universe_size)
    {
        throw PosetError(
            PosetErrorCode::InvalidElementIndex,
            "Element index " + std::to_string(element) + " is outside the universe of size " +
                std::to_string(m_universe_size));
    }
}

void ElementSet::insert(ElementIdx element)
{
    validate_index(element);
    word(element / 64) |= (uint64_t{1} << (element % 64));
}

void ElementSet::erase(ElementIdx element)
{
    validate_index(element);
    word(element / 64) &= ~(uint64_t{1} << (element % 64));
}

bool ElementSet::contains(ElementIdx element) const
{
    validate_index(element);
    return (word(element / 64) >> (element % 64)) & 1u;
}

size_t ElementSet::count() const noexcept
{
    size_t total = 0;
    for (size_t w = 0; w < word_count(); ++w)
    {
        total += std::bitset<64>(word(w)).count();
    }
    return total;
}

bool ElementSet::empty() const noexcept
{
    for (size_t w = 0; w < word_count(); ++w)
    {
        if (word(w) != 0)
        {
            return false;
        }
    }
    return true;
}

bool ElementSet::intersects(const ElementSet& other) const noexcept
{
    size_t words = std::min(word_count(), other.word_count());
    for (size_t w = 0; w < words; ++w)
    {
        if ((word(w) & other.word(w)) != 0)
        {
            return true;
        }
    }
    return false;
}

std::vector<ElementIdx> ElementSet::members() const
{
    std::vector<ElementIdx> result;
    result.reserve(count());
    for_each([&result](ElementIdx e) { result.push_back(e); });
    return result;
}

size_t ElementSet::hash() const noexcept
{
    // FNV-1a style mixing over the words, seeded with the universe size.
    uint64_t h = 1469598103934665603ull ^ static_cast<uint64_t>(m_universe_size);
    for (size_t w = 0; w < word_count(); ++w)
    {
        h ^= word(w);
        h *= 1099511628211ull;
        h ^= (h >> 29);
    }
    return static_cast<size_t>(h);
}

bool ElementSet::operator==(const ElementSet& other) const noexcept
{
    return m_universe_size == other.m_universe_size && m_low_word == other.m_low_word &&
           m_high_words == other.m_high_words;
}

} // namespace posetrank
