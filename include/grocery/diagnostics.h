#pragma once
/*
===============================================================================
DIAGNOSTICS — Model statistics, solution quality and nutrient coverage
===============================================================================

Overview
--------
Analysis helpers that work on the backend-neutral types, so they run the same
whichever Solver produced the values:

    * Model statistics (columns by type, rows, non-zeros)
    * Solution quality (row, bound and integrality violations)
    * Nutrient coverage of a plan against the weekly floors

Design Philosophy
-----------------
1. Free functions returning lightweight result structs
2. Read-only: nothing here modifies a model, catalog or plan
3. Optional include: the planner only needs computeStatistics()

Typical Usage
-------------
    auto stats = computeStatistics(model);
    std::cout << modelSummary(stats) << "\n";   // "12 vars (3 bin, 9 int), 7 constrs"

    auto cov = computeCoverage(catalog, requirement, result.plan);
    if (!cov.satisfied()) { ... }

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <format>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "catalog.h"
#include "household.h"
#include "linear_model.h"
#include "nutrient.h"
#include "result_extractor.h"

namespace grocery {

    // =============================================================================
    // MODEL STATISTICS
    // =============================================================================

    /**
     * @brief Snapshot of model size and composition
     */
    struct ModelStatistics {
        int numVars = 0;        ///< Total number of columns
        int numConstrs = 0;     ///< Total number of rows
        int numBinary = 0;      ///< Binary columns
        int numInteger = 0;     ///< General integer columns (binaries excluded)
        int numContinuous = 0;  ///< Continuous columns
        int numNonZeros = 0;    ///< Non-zero coefficients over all rows
    };

    inline ModelStatistics computeStatistics(const LinearModel& model) {
        ModelStatistics stats;
        stats.numVars = static_cast<int>(model.numVars());
        stats.numConstrs = static_cast<int>(model.numConstrs());

        for (const auto& v : model.vars()) {
            switch (v.type) {
                case VarType::Binary:     ++stats.numBinary; break;
                case VarType::Integer:    ++stats.numInteger; break;
                case VarType::Continuous: ++stats.numContinuous; break;
            }
        }

        for (const auto& c : model.constraints()) {
            for (const auto& t : c.expr.terms()) {
                if (t.coef != 0.0)
                    ++stats.numNonZeros;
            }
        }
        return stats;
    }

    /**
     * @brief Brief summary string of model statistics
     * @return Summary like "100 vars (50 bin, 10 int), 200 constrs"
     */
    inline std::string modelSummary(const ModelStatistics& stats) {
        std::string result = std::to_string(stats.numVars) + " vars";

        if (stats.numBinary > 0 || stats.numInteger > 0) {
            result += " (";
            if (stats.numBinary > 0) {
                result += std::to_string(stats.numBinary) + " bin";
                if (stats.numInteger > 0) result += ", ";
            }
            if (stats.numInteger > 0) {
                result += std::to_string(stats.numInteger) + " int";
            }
            result += ")";
        }

        result += ", " + std::to_string(stats.numConstrs) + " constrs";
        return result;
    }

    inline std::string modelSummary(const LinearModel& model) {
        return modelSummary(computeStatistics(model));
    }

    // =============================================================================
    // SOLUTION QUALITY
    // =============================================================================

    /**
     * @brief Violation metrics of a column assignment
     */
    struct SolutionQuality {
        double maxConstrViolation = 0.0;  ///< Largest row violation
        double sumConstrViolation = 0.0;  ///< Sum of row violations
        double maxBoundViolation = 0.0;   ///< Largest column bound violation
        double maxIntViolation = 0.0;     ///< Largest distance to an integer (integer/binary columns)
    };

    /**
     * @brief Measures how well values satisfy the model
     * @throws std::invalid_argument if values.size() != model.numVars()
     */
    inline SolutionQuality computeSolutionQuality(const LinearModel& model, std::span<const double> values) {
        if (values.size() != model.numVars()) {
            throw std::invalid_argument(std::format(
                "computeSolutionQuality: {} values for {} columns", values.size(), model.numVars()));
        }

        SolutionQuality quality;
        for (const auto& c : model.constraints()) {
            const double v = c.violation(values);
            quality.sumConstrViolation += v;
            if (v > quality.maxConstrViolation)
                quality.maxConstrViolation = v;
        }

        for (std::size_t i = 0; i < values.size(); ++i) {
            const VariableDef& def = model.vars()[i];
            const double x = values[i];

            double boundVio = 0.0;
            if (x < def.lb) boundVio = def.lb - x;
            else if (x > def.ub) boundVio = x - def.ub;
            if (boundVio > quality.maxBoundViolation)
                quality.maxBoundViolation = boundVio;

            if (def.type != VarType::Continuous) {
                const double intVio = std::abs(x - std::round(x));
                if (intVio > quality.maxIntViolation)
                    quality.maxIntViolation = intVio;
            }
        }
        return quality;
    }

    // =============================================================================
    // NUTRIENT COVERAGE
    // =============================================================================

    /**
     * @brief Per-nutrient supply against the weekly floors
     *
     * @details total = purchased + stocked; a floor is met when
     *          total >= required - tolerance.
     */
    struct NutrientCoverage {
        NutrientVector purchased{};
        NutrientVector stocked{};
        NutrientVector total{};
        NutrientVector required{};

        /// @brief Shortfall (required - total), 0 when covered
        double shortfall(Nutrient n) const noexcept {
            const double gap = required[n] - total[n];
            return gap > 0.0 ? gap : 0.0;
        }

        bool satisfied(double tolerance = 1e-6) const noexcept {
            bool ok = true;
            forEachEnum<Nutrient>([&](Nutrient n) {
                if (total[n] < required[n] - tolerance)
                    ok = false;
            });
            return ok;
        }
    };

    /**
     * @brief Coverage for one purchase quantity per catalog package
     * @throws std::invalid_argument if quantities.size() != catalog.size()
     */
    inline NutrientCoverage computeCoverage(
        const Catalog& catalog,
        const AggregateRequirement& requirement,
        std::span<const double> quantities)
    {
        if (quantities.size() != catalog.size()) {
            throw std::invalid_argument(std::format(
                "computeCoverage: {} quantities for {} packages", quantities.size(), catalog.size()));
        }

        NutrientCoverage cov;
        for (std::size_t i = 0; i < catalog.size(); ++i)
            cov.purchased += scaled(catalog.at(i).nutrients, quantities[i]);

        cov.stocked = catalog.stockContribution();
        cov.total = cov.purchased;
        cov.total += cov.stocked;
        cov.required = requirement.weekly;
        return cov;
    }

    /**
     * @brief Coverage of an extracted plan
     * @throws InternalInconsistency if a plan line names an unknown package
     */
    inline NutrientCoverage computeCoverage(
        const Catalog& catalog,
        const AggregateRequirement& requirement,
        const PurchasePlan& plan)
    {
        std::vector<double> quantities(catalog.size(), 0.0);
        for (const auto& line : plan.lines) {
            auto pos = catalog.indexOf(line.packageDescription);
            if (!pos) {
                throw InternalInconsistency(std::format(
                    "computeCoverage: plan package '{}' is not in the catalog", line.packageDescription));
            }
            quantities[*pos] += line.quantity;
        }
        return computeCoverage(catalog, requirement, quantities);
    }

} // namespace grocery
