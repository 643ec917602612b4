#pragma once
/*
===============================================================================
MODEL TABLES — Enum-keyed registries of variable and constraint groups
===============================================================================

OVERVIEW
--------
A builder creates columns and rows in groups ("one buy variable per package",
"one floor per nutrient"). VariableBlock and ConstraintBlock remember the
members of one group in creation order; VariableTable and ConstraintTable file
those groups under enum keys declared with DECLARE_ENUM_WITH_COUNT, so a group
is looked up by name rather than by a magic offset.

USAGE EXAMPLES
--------------
    DECLARE_ENUM_WITH_COUNT(PlanVars, Buy, HasCategory);

    VariableTable<PlanVars> vars;
    VariableBlock buy;
    for (...) buy.push_back(model.addVar(...));
    vars.set(PlanVars::Buy, std::move(buy));

    Var x3 = vars.var(PlanVars::Buy, 3);

EXCEPTION SAFETY
----------------
• Positional access throws std::out_of_range with the offending index

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <utility>
#include <vector>

#include "enum_utils.h"
#include "linear_model.h"

namespace grocery {

    /**
     * @class VariableBlock
     * @brief Ordered group of columns created together
     */
    class VariableBlock {
    public:
        void push_back(Var v) { vars_.push_back(v); }

        /// @throws std::out_of_range if i >= size()
        Var at(std::size_t i) const {
            if (i >= vars_.size()) {
                throw std::out_of_range(
                    std::format("VariableBlock::at: index {} >= {}", i, vars_.size()));
            }
            return vars_[i];
        }

        Var operator()(std::size_t i) const { return at(i); }

        std::size_t size() const noexcept { return vars_.size(); }
        bool empty() const noexcept { return vars_.empty(); }

        auto begin() const noexcept { return vars_.begin(); }
        auto end() const noexcept { return vars_.end(); }

    private:
        std::vector<Var> vars_;
    };

    /**
     * @class ConstraintBlock
     * @brief Ordered group of row positions created together
     */
    class ConstraintBlock {
    public:
        void push_back(std::size_t row) { rows_.push_back(row); }

        /// @throws std::out_of_range if i >= size()
        std::size_t at(std::size_t i) const {
            if (i >= rows_.size()) {
                throw std::out_of_range(
                    std::format("ConstraintBlock::at: index {} >= {}", i, rows_.size()));
            }
            return rows_[i];
        }

        std::size_t size() const noexcept { return rows_.size(); }
        bool empty() const noexcept { return rows_.empty(); }

        auto begin() const noexcept { return rows_.begin(); }
        auto end() const noexcept { return rows_.end(); }

    private:
        std::vector<std::size_t> rows_;
    };

    namespace table_detail {

        template<typename EnumT>
        std::size_t checkedKey(EnumT key, const char* where) {
            const std::size_t idx = enum_index(key);
            if (idx >= enum_size_v<EnumT>) {
                throw std::out_of_range(std::format("{}: key {} >= {}", where, idx, enum_size_v<EnumT>));
            }
            return idx;
        }

    } // namespace table_detail

    /**
     * @class VariableTable
     * @brief One VariableBlock per enumerator of EnumT
     */
    template<typename EnumT>
    class VariableTable {
    public:
        void set(EnumT key, VariableBlock block) {
            table_[table_detail::checkedKey(key, "VariableTable::set")] = std::move(block);
        }

        const VariableBlock& get(EnumT key) const {
            return table_[table_detail::checkedKey(key, "VariableTable::get")];
        }

        const VariableBlock& operator()(EnumT key) const { return get(key); }

        /// @throws std::out_of_range if key or i is out of range
        Var var(EnumT key, std::size_t i) const { return get(key).at(i); }

        bool isEmpty(EnumT key) const { return get(key).empty(); }

    private:
        std::array<VariableBlock, enum_size_v<EnumT>> table_{};
    };

    /**
     * @class ConstraintTable
     * @brief One ConstraintBlock per enumerator of EnumT
     */
    template<typename EnumT>
    class ConstraintTable {
    public:
        void set(EnumT key, ConstraintBlock block) {
            table_[table_detail::checkedKey(key, "ConstraintTable::set")] = std::move(block);
        }

        const ConstraintBlock& get(EnumT key) const {
            return table_[table_detail::checkedKey(key, "ConstraintTable::get")];
        }

        const ConstraintBlock& operator()(EnumT key) const { return get(key); }

        bool isEmpty(EnumT key) const { return get(key).empty(); }

    private:
        std::array<ConstraintBlock, enum_size_v<EnumT>> table_{};
    };

} // namespace grocery
