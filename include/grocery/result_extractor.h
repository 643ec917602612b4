#pragma once
/*
===============================================================================
RESULT EXTRACTOR — Solved column values to a store-grouped purchase plan
===============================================================================

OVERVIEW
--------
After an Optimal solve, every buy column holds the number of packages to
purchase. extractPlan() reads those values in catalog order and builds a
PurchasePlan:

    value <= tolerance        package skipped (numerically zero)
    value >  tolerance        rounded to the nearest integer; skipped again
                              if it rounds to 0
    line cost   = price  * quantity
    line weight = weight * quantity

Lines keep catalog order. Store groups are sorted lexicographically by store
name and carry their own cost, package and weight subtotals; the plan-level
totals are the sums over lines.

FAILURE POLICY
--------------
• A buy column past the end of the value vector, or a buy block whose size
  differs from the catalog, means the model and catalog are out of step:
  InternalInconsistency. Nothing else can fail here.

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <format>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "catalog.h"
#include "errors.h"
#include "model_tables.h"

namespace grocery {

    /// @brief Default threshold below which a solved quantity counts as zero
    inline constexpr double kDefaultExtractionTolerance = 1e-6;

    /**
     * @struct PlanLine
     * @brief One package to buy
     */
    struct PlanLine {
        std::string store;
        std::string food;
        std::string packageDescription;
        double unitWeightLb = 0.0;
        double unitPrice = 0.0;
        int quantity = 0;
        double totalWeightLb = 0.0;
        double totalCost = 0.0;
    };

    struct StoreSummary {
        std::string store;
        std::vector<std::size_t> lines;   ///< positions into PurchasePlan::lines
        double cost = 0.0;
        int packages = 0;
        double weightLb = 0.0;
    };

    /**
     * @struct PurchasePlan
     * @brief Line items plus plan-level and per-store rollups
     */
    struct PurchasePlan {
        std::vector<PlanLine> lines;
        std::vector<StoreSummary> stores;   ///< sorted by store name
        double totalCost = 0.0;
        int totalPackages = 0;
        double totalWeightLb = 0.0;

        bool empty() const noexcept { return lines.empty(); }
        std::size_t numStores() const noexcept { return stores.size(); }

        /// @brief Group for a store, or nullptr if nothing is bought there
        const StoreSummary* forStore(std::string_view store) const {
            for (const auto& s : stores) {
                if (s.store == store)
                    return &s;
            }
            return nullptr;
        }
    };

    /**
     * @brief Builds the purchase plan from solved buy columns
     *
     * @param catalog   Catalog the model was built from
     * @param buy       Buy column per package, in catalog order
     * @param values    Solved value per model column
     * @param tolerance Values at or below this are treated as zero
     *
     * @throws InternalInconsistency if buy and catalog or values disagree
     */
    inline PurchasePlan extractPlan(
        const Catalog& catalog,
        const VariableBlock& buy,
        std::span<const double> values,
        double tolerance = kDefaultExtractionTolerance)
    {
        if (buy.size() != catalog.size()) {
            throw InternalInconsistency(std::format(
                "extractPlan: {} buy columns for {} catalog packages", buy.size(), catalog.size()));
        }

        PurchasePlan plan;
        std::map<std::string, StoreSummary> byStore;

        for (std::size_t i = 0; i < catalog.size(); ++i) {
            const Var v = buy.at(i);
            if (v.index >= values.size()) {
                throw InternalInconsistency(std::format(
                    "extractPlan: no solved value for column {} (package '{}')",
                    v.index, catalog.at(i).packageDescription));
            }

            const double x = values[v.index];
            if (!(x > tolerance))
                continue;

            const int qty = static_cast<int>(std::llround(x));
            if (qty <= 0)
                continue;

            const FoodPackage& p = catalog.at(i);
            PlanLine line;
            line.store = p.store;
            line.food = p.food;
            line.packageDescription = p.packageDescription;
            line.unitWeightLb = p.weightLb;
            line.unitPrice = p.price;
            line.quantity = qty;
            line.totalWeightLb = p.weightLb * qty;
            line.totalCost = p.price * qty;

            StoreSummary& group = byStore[p.store];
            group.store = p.store;
            group.lines.push_back(plan.lines.size());
            group.cost += line.totalCost;
            group.packages += qty;
            group.weightLb += line.totalWeightLb;

            plan.totalCost += line.totalCost;
            plan.totalPackages += qty;
            plan.totalWeightLb += line.totalWeightLb;

            plan.lines.push_back(std::move(line));
        }

        plan.stores.reserve(byStore.size());
        for (auto& [store, group] : byStore)
            plan.stores.push_back(std::move(group));

        return plan;
    }

} // namespace grocery
