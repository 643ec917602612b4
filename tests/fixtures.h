#pragma once
/*
===============================================================================
FIXTURES — Shared test data and a scripted Solver
===============================================================================

• nutrients()          NutrientVector from four literals
• standardRequirements reference table covering both groups, ages 1-120
• smallTables()        two stores, three categories, no stock
• ScriptedSolver       grocery::Solver that returns a canned status and
                       computes column values from a callback; counts calls

===============================================================================
*/

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <grocery/catalog.h>
#include <grocery/household.h>
#include <grocery/linear_model.h>
#include <grocery/solver.h>

namespace fixtures {

    using namespace grocery;

    inline NutrientVector nutrients(double kcal, double protein, double carbs, double fat) {
        NutrientVector v{};
        v[Nutrient::Calories] = kcal;
        v[Nutrient::Protein] = protein;
        v[Nutrient::Carbohydrate] = carbs;
        v[Nutrient::Fat] = fat;
        return v;
    }

    inline std::vector<NutrientRequirementRow> standardRequirements() {
        return {
            { "Male",    1,  18, nutrients(1800, 40, 130, 55) },
            { "Male",   19, 120, nutrients(2400, 56, 130, 70) },
            { "Female",  1,  18, nutrients(1600, 38, 130, 50) },
            { "Female", 19, 120, nutrients(2000, 46, 130, 60) },
        };
    }

    /**
     * Packages, in cost order:
     *   0 "Rice (5 lb)"        Grains   StoreB  6.00  max 5
     *   1 "Bread (1.5 lb)"     Grains   StoreA  3.00  max 4
     *   2 "Beans (2 lb)"       Protein  StoreA  3.50  max 6
     *   3 "Apples (3 lb)"      Fruit    StoreB  4.50  max 3
     */
    inline CatalogTables smallTables() {
        CatalogTables t;
        t.cost = {
            { "Rice",   "Rice (5 lb)",    "StoreB", 6.00, 5.0 },
            { "Bread",  "Bread (1.5 lb)", "StoreA", 3.00, 1.5 },
            { "Beans",  "Beans (2 lb)",   "StoreA", 3.50, 2.0 },
            { "Apples", "Apples (3 lb)",  "StoreB", 4.50, 3.0 },
        };
        t.nutrition = {
            { "Rice",   nutrients(8000, 150, 1750, 15), "Grains",  5 },
            { "Bread",  nutrients(1700,  90,  300, 25), "Grains",  4 },
            { "Beans",  nutrients(3000, 200,  550, 10), "Protein", 6 },
            { "Apples", nutrients( 700,   4,  190,  2), "Fruit",   3 },
        };
        return t;
    }

    /**
     * @class ScriptedSolver
     * @brief Deterministic stand-in for a MILP backend
     */
    class ScriptedSolver : public Solver {
    public:
        using ValueFn = std::function<std::vector<double>(const LinearModel&)>;

        explicit ScriptedSolver(SolveStatus status, ValueFn values = {}, double objective = 0.0)
            : status_(status), values_(std::move(values)), objective_(objective)
        {
        }

        SolveResult solve(const LinearModel& model) const override {
            ++calls_;
            lastNumVars_ = model.numVars();

            SolveResult r;
            r.status = status_;
            r.backendStatus = std::string("scripted:") + std::string(toString(status_));
            r.params["param:TimeLimit"] = 5.0;
            if (status_ == SolveStatus::Optimal) {
                r.values = values_ ? values_(model) : std::vector<double>(model.numVars(), 0.0);
                r.objective = objective_;
            }
            return r;
        }

        std::string name() const override { return "scripted"; }

        int calls() const noexcept { return calls_; }
        std::size_t lastNumVars() const noexcept { return lastNumVars_; }

    private:
        SolveStatus status_;
        ValueFn values_;
        double objective_;
        mutable int calls_ = 0;
        mutable std::size_t lastNumVars_ = 0;
    };

} // namespace fixtures
