#pragma once
/*
===============================================================================
EXPRESSIONS — Summation helpers for LinearExpr
===============================================================================

OVERVIEW
--------
Mirrors the mathematical notation used to state the purchase model:

    sum_{p in P} price[p] * buy[p]     ->  sum(P, [&](std::size_t p) { return price[p] * buy(p); })
    sum_{p in block} buy[p]            ->  sum(buy)

Any iterable index domain works: range(0, n), a std::vector of positions
such as Catalog::inCategory(), or a std::views pipeline.

===============================================================================
*/

#include <cstddef>
#include <functional>
#include <ranges>
#include <utility>

#include "linear_model.h"
#include "model_tables.h"

namespace grocery {

    /// @brief Half-open index domain [first, last)
    inline auto range(std::size_t first, std::size_t last) {
        return std::views::iota(first, last < first ? first : last);
    }

    /**
     * @brief Sums func(i) over an index domain
     *
     * @tparam Range Iterable yielding indices
     * @tparam Func  Callable returning Var, LinearExpr or double
     * @complexity O(n) in the size of the domain
     */
    template<typename Range, typename Func>
    LinearExpr sum(const Range& rng, Func&& func) {
        LinearExpr expr;
        for (const auto& idx : rng) {
            expr += LinearExpr(std::invoke(func, idx));
        }
        return expr;
    }

    /// @brief Sums every column of a block with coefficient 1
    inline LinearExpr sum(const VariableBlock& block) {
        LinearExpr expr;
        for (Var v : block)
            expr += LinearExpr(v);
        return expr;
    }

    /// @brief Sums the block columns at the given positions
    template<typename Range>
    LinearExpr sum(const Range& rng, const VariableBlock& block) {
        return sum(rng, [&](std::size_t i) { return block.at(i); });
    }

} // namespace grocery
