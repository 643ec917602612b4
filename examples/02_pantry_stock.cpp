/*
================================================================================
EXAMPLE 02: PANTRY STOCK - Stock on hand and unreachable floors
================================================================================
PROBLEM TYPE: Mixed-Integer Linear Programming (MILP)

PROBLEM DESCRIPTION
-------------------
The same single-person household is planned three times:

    1. Empty pantry                    -> buys enough to reach every floor
    2. Pantry already holds staples    -> stock counts toward the floors,
                                          so the bill goes down
    3. Only oil and spinach on sale    -> no purchase can reach the protein
                                          floor; the plan reports Infeasible
                                          with no partial shopping list

Stock enters the nutrient rows as a constant:

    sum_p n[p] * buy[p] + sum_p n[p] * stock_lb[p] >= 7 * daily[n]

FEATURES DEMONSTRATED
---------------------
- StockRow / Catalog::stockedItems()   pantry snapshot
- UnknownStockEntry warnings           stock rows that match no package
- Non-optimal status propagation       empty plan, status attached
- DiversityMode::AtLeastOneItem        one bought or stocked item per basket

================================================================================
*/

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <grocery/grocery.h>

using namespace grocery;

namespace {

    NutrientVector nutrients(double kcal, double protein, double carbs, double fat) {
        NutrientVector v{};
        v[Nutrient::Calories] = kcal;
        v[Nutrient::Protein] = protein;
        v[Nutrient::Carbohydrate] = carbs;
        v[Nutrient::Fat] = fat;
        return v;
    }

    PlanRequest baseRequest() {
        PlanRequest r;
        r.household.add(30, Gender::Female);
        r.requirements = {
            { "female", 19, 50, nutrients(2000, 46, 130, 60) },
            { "male",   19, 50, nutrients(2400, 56, 130, 70) },
        };
        r.tables.cost = {
            { "Pasta",   "Spaghetti (2 lb)",     "CornerShop", 2.49, 2.0 },
            { "Lentils", "Red Lentils (2 lb)",   "CornerShop", 3.29, 2.0 },
            { "Tuna",    "Canned Tuna (4 pk)",   "CornerShop", 5.96, 1.0 },
            { "Oil",     "Canola Oil (48 oz)",   "CornerShop", 4.19, 3.0 },
            { "Spinach", "Frozen Spinach (1 lb)", "CornerShop", 1.79, 1.0 },
        };
        r.tables.nutrition = {
            { "Pasta",   nutrients(3200, 112, 640, 16),  "Grains",     6 },
            { "Lentils", nutrients(3000, 220, 500, 10),  "Protein",    4 },
            { "Tuna",    nutrients(480,  104,   0,  4),  "Protein",    4 },
            { "Oil",     nutrients(11000,  0,   0, 1250), "Fats",      2 },
            { "Spinach", nutrients(100,   13,  16,  1),  "Vegetables", 3 },
        };
        return r;
    }

    void report(const std::string& title, const PlanResult& result) {
        std::cout << title << "\n";
        std::cout << std::string(title.size(), '-') << "\n";
        std::cout << "Status: " << toString(result.status) << " (" << result.backendStatus << ")\n";

        for (const auto& w : result.warnings)
            std::cout << "Warning [" << toString(w.kind) << "]: " << w.message << "\n";

        if (!result.isOptimal()) {
            std::cout << "No shopping list. Loosen the inputs (more packages, higher\n"
                      << "Max_quantity, a different household) and plan again.\n\n";
            return;
        }

        std::cout << std::fixed << std::setprecision(2);
        for (const auto& line : result.plan.lines) {
            std::cout << "  " << std::setw(3) << line.quantity << " x "
                      << std::left << std::setw(24) << line.packageDescription << std::right
                      << " $" << line.totalCost << "\n";
        }
        if (result.plan.empty())
            std::cout << "  (nothing to buy)\n";
        std::cout << "Weekly cost: $" << result.plan.totalCost << "\n\n";
    }

} // namespace

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 02: Pantry Stock - Stock on Hand and Infeasibility\n";
    std::cout << "================================================================\n\n";

    try {
        SolverOptions solverOptions;
        solverOptions.preset = Preset::Quiet;
        GurobiSolver solver(solverOptions);

        PlannerOptions plannerOptions;
        plannerOptions.diversity = DiversityMode::AtLeastOneItem;
        WeeklyPlanner planner(solver, plannerOptions);

        // 1. Empty pantry
        PlanRequest empty = baseRequest();
        report("1. EMPTY PANTRY", planner.plan(empty));

        // 2. Staples already on the shelf
        PlanRequest stocked = baseRequest();
        stocked.tables.stock = {
            { "Spaghetti (2 lb)",   2.0 },
            { "Canola Oil (48 oz)", 1.0 },
            { "Basmati Rice (10 lb)", 4.0 },   // not sold here: reported, ignored
        };

        CatalogJoin pantry = joinCatalog(stocked.tables);
        std::cout << "Items in stock: " << pantry.catalog.stockedItems() << "\n";
        report("2. STOCKED PANTRY", planner.plan(stocked));

        // 3. Protein floor out of reach: 3 lb of spinach is all the protein on sale
        PlanRequest noProtein = baseRequest();
        std::erase_if(noProtein.tables.cost, [](const CostRow& r) {
            return r.food == "Lentils" || r.food == "Tuna" || r.food == "Pasta";
        });
        report("3. PROTEIN OUT OF REACH", planner.plan(noProtein));

    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error [" << toString(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const SolverError& e) {
        std::cerr << "Solver error " << e.code() << ": " << e.what() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "================================================================\n";
    return 0;
}
