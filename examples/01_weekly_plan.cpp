/*
================================================================================
EXAMPLE 01: WEEKLY PLAN - Household to per-store shopping list
================================================================================
PROBLEM TYPE: Mixed-Integer Linear Programming (MILP)

PROBLEM DESCRIPTION
-------------------
A family of four shops at two stores. Each package has a price, a weight, a
per-package nutrient content, a food-basket category and a weekly purchase
cap. Find the cheapest set of whole packages that covers the household's
weekly calorie, protein, carbohydrate and fat floors, with at least one item
from every food basket.

MATHEMATICAL MODEL
------------------
Sets:
    P    Packages
    C    Food-basket categories
    N    Nutrients {Calories, Protein, Carbohydrate, Fat}

Variables:
    buy[p] in {0, ..., max_quantity[p]}
    has[c] in {0, 1}

Objective:
    min  sum_p price[p] * buy[p]

Constraints:
    NutrientFloor[n]:     sum_p n[p] * buy[p] + stock[n] >= 7 * daily[n]
    CategoryPresence[c]:  sum_{p in c} buy[p] + stocked[c] >= has[c]
    CategoryRequired[c]:  has[c] == 1

FEATURES DEMONSTRATED
---------------------
- PlanRequest / WeeklyPlanner       end-to-end request
- SolverOptions with a log sink     Gurobi log lines without console output
- PurchasePlan::stores              per-store grouping with subtotals
- computeCoverage()                 nutrient check of the extracted plan

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

    std::vector<NutrientRequirementRow> requirementRows() {
        return {
            { "Male",    1,   3, nutrients(1000, 13, 130, 30) },
            { "Male",    4,  13, nutrients(1600, 25, 130, 50) },
            { "Male",   14,  50, nutrients(2400, 56, 130, 70) },
            { "Male",   51, 120, nutrients(2200, 56, 130, 65) },
            { "Female",  1,   3, nutrients(1000, 13, 130, 30) },
            { "Female",  4,  13, nutrients(1500, 22, 130, 45) },
            { "Female", 14,  50, nutrients(2000, 46, 130, 60) },
            { "Female", 51, 120, nutrients(1800, 46, 130, 55) },
        };
    }

    CatalogTables catalogTables() {
        CatalogTables t;
        t.cost = {
            { "Rice",          "Long Grain Rice (5 lb)",        "FreshMart", 6.49, 5.0 },
            { "Oats",          "Rolled Oats (2.6 lb)",          "FreshMart", 4.29, 2.6 },
            { "Bread",         "Whole Wheat Bread (1.5 lb)",    "ValueFoods", 2.99, 1.5 },
            { "Chicken",       "Chicken Breast, Boneless (3 lb)", "ValueFoods", 11.97, 3.0 },
            { "Eggs",          "Large Eggs (18 ct)",            "FreshMart", 4.79, 2.25 },
            { "Beans",         "Black Beans (2 lb)",            "ValueFoods", 3.18, 2.0 },
            { "Milk",          "Whole Milk (1 gal)",            "FreshMart", 3.89, 8.6 },
            { "Yogurt",        "Greek Yogurt (2 lb)",           "ValueFoods", 5.49, 2.0 },
            { "Apples",        "Gala Apples (3 lb)",            "FreshMart", 4.47, 3.0 },
            { "Bananas",       "Bananas (2.5 lb)",              "ValueFoods", 1.45, 2.5 },
            { "Carrots",       "Carrots (2 lb)",                "FreshMart", 1.98, 2.0 },
            { "Broccoli",      "Broccoli Crowns (1 lb)",        "ValueFoods", 1.89, 1.0 },
            { "Peanut Butter", "Peanut Butter (2.5 lb)",        "ValueFoods", 5.28, 2.5 },
            { "Olive Oil",     "Olive Oil (1 L)",               "FreshMart", 8.99, 2.0 },
        };
        t.nutrition = {
            { "Rice",          nutrients(8200, 160, 1800, 14),  "Grains",             6 },
            { "Oats",          nutrients(4500, 160,  800, 80),  "Grains",             4 },
            { "Bread",         nutrients(1700,  90,  300, 25),  "Grains",             5 },
            { "Chicken",       nutrients(1630, 310,    0, 35),  "Protein",            4 },
            { "Eggs",          nutrients(1300, 113,    7, 90),  "Protein",            4 },
            { "Beans",         nutrients(3100, 200,  560, 10),  "Protein",            5 },
            { "Milk",          nutrients(2400, 128,  192, 128), "Dairy",              4 },
            { "Yogurt",        nutrients( 530,  90,   35,  3),  "Dairy",              4 },
            { "Apples",        nutrients(700,    4,  190,  2),  "Fruits",             5 },
            { "Bananas",       nutrients(1000,  12,  260,  4),  "Fruits",             5 },
            { "Carrots",       nutrients(370,    8,   87,  2),  "Vegetables",         5 },
            { "Broccoli",      nutrients(154,   13,   30,  2),  "Vegetables",         5 },
            { "Peanut Butter", nutrients(6700, 280,  230, 570), "Fats, Nuts & Seeds", 2 },
            { "Olive Oil",     nutrients(8000,   0,    0, 900), "Fats, Nuts & Seeds", 2 },
        };
        t.stock = {
            { "Long Grain Rice (5 lb)", 0.0 },
            { "Olive Oil (1 L)",        0.0 },
        };
        return t;
    }

} // namespace

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Weekly Plan - Household to Shopping List\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // REQUEST
        // ====================================================================
        PlanRequest request;
        request.household.add(42, Gender::Male);
        request.household.add(39, Gender::Female);
        request.household.add(12, Gender::Female);
        request.household.add(8, parseGender("MALE"));
        request.tables = catalogTables();
        request.requirements = requirementRows();

        std::cout << "HOUSEHOLD\n";
        std::cout << "---------\n";
        for (std::size_t i = 0; i < request.household.size(); ++i)
            std::cout << "  " << describeMember(i, request.household.members()[i]) << "\n";
        std::cout << "\n";

        // ====================================================================
        // SOLVE
        // ====================================================================
        std::vector<std::string> solverLog;

        SolverOptions solverOptions;
        solverOptions.preset = Preset::Fast;
        solverOptions.logSink = [&solverLog](const std::string& line) { solverLog.push_back(line); };

        GurobiSolver solver(solverOptions);
        WeeklyPlanner planner(solver);

        std::cout << "SOLVING...\n";
        std::cout << "----------\n";
        PlanResult result = planner.plan(request);

        std::cout << "Status: " << toString(result.status)
                  << " (" << result.backendStatus << ")\n";
        std::cout << modelSummary(result.stats) << "\n";
        std::cout << "Solver log lines captured: " << solverLog.size() << "\n";

        for (const auto& w : result.warnings)
            std::cout << "Warning [" << toString(w.kind) << "]: " << w.message << "\n";
        std::cout << "\n";

        std::cout << std::fixed << std::setprecision(1);
        std::cout << "Weekly Requirement:\n";
        forEachEnum<Nutrient>([&](Nutrient n) {
            std::cout << std::setw(15) << toString(n)
                      << std::setw(12) << result.requirement.weeklyFloor(n)
                      << " " << unitOf(n) << "\n";
        });
        std::cout << "\n";

        if (!result.isOptimal()) {
            std::cout << "No plan: the solver did not reach an optimal solution.\n";
            return 0;
        }

        // ====================================================================
        // DISPLAY RESULTS
        // ====================================================================
        std::cout << std::setprecision(2);
        std::cout << "SHOPPING LIST\n";
        std::cout << "-------------\n";
        for (const auto& store : result.plan.stores) {
            std::cout << store.store << "  (" << store.packages << " packages, $"
                      << store.cost << ", " << store.weightLb << " lb)\n";
            for (std::size_t pos : store.lines) {
                const PlanLine& line = result.plan.lines[pos];
                std::cout << "  " << std::setw(4) << line.quantity << " x "
                          << std::left << std::setw(34) << line.packageDescription << std::right
                          << std::setw(9) << line.totalCost << "\n";
            }
        }
        std::cout << std::string(52, '-') << "\n";
        std::cout << "Total: $" << result.plan.totalCost << " for "
                  << result.plan.totalPackages << " packages ("
                  << result.plan.totalWeightLb << " lb) across "
                  << result.plan.numStores() << " stores\n\n";

        // Nutrient check of the extracted plan
        CatalogJoin joined = joinCatalog(request.tables);
        NutrientCoverage coverage = computeCoverage(joined.catalog, result.requirement, result.plan);

        std::cout << "Nutrient Coverage:\n";
        std::cout << std::setw(15) << "Nutrient" << std::setw(12) << "Supplied"
                  << std::setw(12) << "Required" << "\n";
        std::cout << std::string(39, '-') << "\n";
        forEachEnum<Nutrient>([&](Nutrient n) {
            std::cout << std::setw(15) << toString(n)
                      << std::setw(12) << coverage.total[n]
                      << std::setw(12) << coverage.required[n] << "\n";
        });
        std::cout << "All floors met: " << (coverage.satisfied() ? "yes" : "no") << "\n";

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

    std::cout << "\n================================================================\n";
    return 0;
}
