/**
 * @file partial_order.cpp
 */
#include "posetrank/common/partial_order.hpp"

#include <queue>

namespace posetrank
{

namespace
{

std::string format_elements(const std::vector<ElementIdx>& elements)
{
    std::string result;
    for (size_t k = 0; k < elements.size(); ++k)
    {
        if (k > 0)
        {
            result += ", ";
        }
        result += std::to_string(elements[k]);
    }
    return result;
}

PartialOrder::Matrix identity_matrix(size_t n)
{
    PartialOrder::Matrix leq(n, std::vector<bool>(n, false));
    for (size_t i = 0; i < n; ++i)
    {
        leq[i][i] = true;
    }
    return leq;
}

void validate_pairs(size_t n, const std::vector<RelationPair>& pairs)
{
    for (const auto& [lower, upper] : pairs)
    {
        if (lower >= n || upper >= n)
        {
            throw PosetError(
                PosetErrorCode::InvalidElementIndex,
                "Relation (" + std::to_string(lower) + ", " + std::to_string(upper) +
                    ") names an element outside 0.." + std::to_string(n == 0 ? 0 : n - 1));
        }
    }
}

} // namespace

// ============================================================================
// Validation
// ============================================================================

RelationDiagnostics PartialOrder::diagnose(const Matrix& leq, const PartialOrderOptions& options)
{
    RelationDiagnostics diagnostics;
    const size_t n = leq.size();

    // Phase 1: shape. Nothing else can be checked safely on a ragged matrix.
    std::vector<ElementIdx> bad_rows;
    for (size_t i = 0; i < n; ++i)
    {
        if (leq[i].size() != n)
        {
            bad_rows.push_back(i);
        }
    }
    if (!bad_rows.empty())
    {
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Error;
        item.category = DiagnosticCategory::NotSquare;
        item.message = "Relation matrix is not square: expected " + std::to_string(n) +
                       " entries in rows " + format_elements(bad_rows);
        item.involved_elements = std::move(bad_rows);
        diagnostics.m_errors.push_back(std::move(item));
        return diagnostics;
    }

    // Phase 2: reflexivity
    std::vector<ElementIdx> irreflexive;
    for (size_t i = 0; i < n; ++i)
    {
        if (!leq[i][i])
        {
            irreflexive.push_back(i);
        }
    }
    if (!irreflexive.empty())
    {
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Error;
        item.category = DiagnosticCategory::NotReflexive;
        item.message = "Relation is not reflexive for elements " + format_elements(irreflexive);
        item.involved_elements = std::move(irreflexive);
        diagnostics.m_errors.push_back(std::move(item));
    }

    // Phase 3: cycle detection on the strict relation using Kahn's algorithm
    std::vector<size_t> in_degree(n, 0);
    for (size_t i = 0; i < n; ++i)
    {
        for (size_t j = 0; j < n; ++j)
        {
            if (i != j && leq[i][j])
            {
                ++in_degree[j];
            }
        }
    }

    std::queue<ElementIdx> ready;
    for (size_t i = 0; i < n; ++i)
    {
        if (in_degree[i] == 0)
        {
            ready.push(i);
        }
    }

    size_t processed = 0;
    while (!ready.empty())
    {
        ElementIdx i = ready.front();
        ready.pop();
        ++processed;

        for (size_t j = 0; j < n; ++j)
        {
            if (i != j && leq[i][j])
            {
                --in_degree[j];
                if (in_degree[j] == 0)
                {
                    ready.push(j);
                }
            }
        }
    }

    if (processed < n)
    {
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Error;
        item.category = DiagnosticCategory::Cycle;

        // Elements left with remaining in-degree lie on or after a cycle
        for (size_t i = 0; i < n; ++i)
        {
            if (in_degree[i] > 0)
            {
                item.involved_elements.push_back(i);
            }
        }
        item.message = "Strict relation contains a cycle among elements " +
                       format_elements(item.involved_elements);
        diagnostics.m_errors.push_back(std::move(item));
    }

    // Phase 4: transitivity (warning only)
    if (options.check_transitivity && diagnostics.m_errors.empty())
    {
        for (size_t i = 0; i < n; ++i)
        {
            for (size_t j = 0; j < n; ++j)
            {
                if (i == j || !leq[i][j])
                {
                    continue;
                }
                for (size_t k = 0; k < n; ++k)
                {
                    if (k == j || k == i || !leq[j][k] || leq[i][k])
                    {
                        continue;
                    }
                    if (diagnostics.m_warnings.size() >= options.max_transitivity_reports)
                    {
                        ++diagnostics.m_suppressed_warnings;
                        continue;
                    }
                    DiagnosticItem item;
                    item.severity = DiagnosticSeverity::Warning;
                    item.category = DiagnosticCategory::NotTransitive;
                    item.message = "Relation is not transitive: " + std::to_string(i) +
                                   " <= " + std::to_string(j) + " and " + std::to_string(j) +
                                   " <= " + std::to_string(k) + " but not " +
                                   std::to_string(i) + " <= " + std::to_string(k);
                    item.involved_elements = {i, j, k};
                    diagnostics.m_warnings.push_back(std::move(item));
                }
            }
        }
    }

    return diagnostics;
}

// ============================================================================
// Construction
// ============================================================================

PartialOrder::PartialOrder(Matrix leq, PartialOrderOptions options)
    : m_size(leq.size())
    , m_leq(std::move(leq))
    , m_diagnostics(diagnose(m_leq, options))
{
    if (m_diagnostics.has_errors())
    {
        throw MalformedRelationError(m_diagnostics.errors().front().message);
    }

    m_below.assign(m_size, ElementSet(m_size));
    m_above.assign(m_size, ElementSet(m_size));
    for (size_t i = 0; i < m_size; ++i)
    {
        for (size_t j = 0; j < m_size; ++j)
        {
            if (i != j && m_leq[i][j])
            {
                m_above[i].insert(j);
                m_below[j].insert(i);
            }
        }
    }

    for (size_t i = 0; i < m_size; ++i)
    {
        for (size_t j = i + 1; j < m_size; ++j)
        {
            if (m_leq[i][j] || m_leq[j][i])
            {
                ++m_comparable_pairs;
            }
        }
    }
}

PartialOrder PartialOrder::from_relations(size_t n,
                                          const std::vector<RelationPair>& pairs,
                                          PartialOrderOptions options)
{
    validate_pairs(n, pairs);
    Matrix leq = identity_matrix(n);
    for (const auto& [lower, upper] : pairs)
    {
        leq[lower][upper] = true;
    }
    return PartialOrder(std::move(leq), options);
}

PartialOrder PartialOrder::transitive_closure_of(size_t n,
                                                 const std::vector<RelationPair>& pairs,
                                                 PartialOrderOptions options)
{
    validate_pairs(n, pairs);
    Matrix leq = identity_matrix(n);
    for (const auto& [lower, upper] : pairs)
    {
        leq[lower][upper] = true;
    }

    // Warshall's algorithm
    for (size_t k = 0; k < n; ++k)
    {
        for (size_t i = 0; i < n; ++i)
        {
            if (!leq[i][k])
            {
                continue;
            }
            for (size_t j = 0; j < n; ++j)
            {
                if (leq[k][j])
                {
                    leq[i][j] = true;
                }
            }
        }
    }
    return PartialOrder(std::move(leq), options);
}

// ============================================================================
// Queries
// ============================================================================

void PartialOrder::validate_index(ElementIdx i) const
{
    if (i >= m_size)
    {
        throw PosetError(
            PosetErrorCode::InvalidElementIndex,
            "Element index " + std::to_string(i) + " does not exist (size " +
                std::to_string(m_size) + ")");
    }
}

bool PartialOrder::leq(ElementIdx i, ElementIdx j) const
{
    validate_index(i);
    validate_index(j);
    return m_leq[i][j];
}

bool PartialOrder::less(ElementIdx i, ElementIdx j) const
{
    validate_index(i);
    validate_index(j);
    return i != j && m_leq[i][j];
}

Comparability PartialOrder::comparability(ElementIdx i, ElementIdx j) const
{
    validate_index(i);
    validate_index(j);
    if (i == j)
    {
        return Comparability::Equal;
    }
    if (m_leq[i][j])
    {
        return Comparability::LessEqual;
    }
    if (m_leq[j][i])
    {
        return Comparability::GreaterEqual;
    }
    return Comparability::Incomparable;
}

double PartialOrder::comparable_fraction() const
{
    if (m_size < 2)
    {
        throw DegenerateInputError(
            "Comparable fraction needs at least 2 elements, got " + std::to_string(m_size));
    }
    const double pair_count = static_cast<double>(m_size) * static_cast<double>(m_size - 1) / 2.0;
    return static_cast<double>(m_comparable_pairs) / pair_count;
}

const ElementSet& PartialOrder::strictly_below(ElementIdx i) const
{
    validate_index(i);
    return m_below[i];
}

const ElementSet& PartialOrder::strictly_above(ElementIdx i) const
{
    validate_index(i);
    return m_above[i];
}

ElementSet PartialOrder::closure_from(ElementIdx i, const std::vector<ElementSet>& adjacency) const
{
    validate_index(i);

    // Iterative DFS
    ElementSet visited(m_size);
    std::vector<ElementIdx> stack;
    stack.push_back(i);

    while (!stack.empty())
    {
        ElementIdx current = stack.back();
        stack.pop_back();

        if (visited.contains(current))
        {
            continue;
        }
        visited.insert(current);

        adjacency[current].for_each([&](ElementIdx next) {
            if (!visited.contains(next))
            {
                stack.push_back(next);
            }
        });
    }

    return visited;
}

ElementSet PartialOrder::down_closure(ElementIdx i) const
{
    return closure_from(i, m_below);
}

ElementSet PartialOrder::up_closure(ElementIdx i) const
{
    return closure_from(i, m_above);
}

std::vector<RelationPair> PartialOrder::cover_relations() const
{
    std::vector<RelationPair> result;
    for (size_t i = 0; i < m_size; ++i)
    {
        m_above[i].for_each([&](ElementIdx j) {
            // i < j is a cover unless some k satisfies i < k < j
            if (!m_above[i].intersects(m_below[j]))
            {
                result.emplace_back(i, j);
            }
        });
    }
    return result;
}

} // namespace posetrank
