/*
===============================================================================
TEST GUROBI SOLVER — Status mapping, parameters and end-to-end scenarios
===============================================================================

OVERVIEW
--------
Runs the real backend. Section A needs only the Gurobi headers; the rest
solves small planner models and therefore needs a working licence.

TEST ORGANIZATION
-----------------
• Section A: Status translation
• Section B: Parameters, presets and log sink
• Section C: Planner scenarios (infeasible, exact fill, stock cover)
• Section D: Solution properties and idempotence
• Section E: Backend errors

CALLBACK BEHAVIOR NOTES
-----------------------
• Message callbacks fire only while OutputFlag=1; the translator turns it on
  whenever a log sink is attached and keeps LogToConsole off
• Small problems may finish in presolve, so progress callbacks are not
  asserted on

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• gurobi_solver.h - System under test
• planner.h, diagnostics.h - Scenario driver and coverage checks

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <grocery/diagnostics.h>
#include <grocery/gurobi_solver.h>
#include <grocery/planner.h>

#include <string>
#include <vector>

#include "fixtures.h"

using namespace grocery;

namespace {

    /// @brief One package, one category, one requirement row for adult males
    PlanRequest singlePackage(NutrientVector perUnit, double price, int maxQuantity,
                              NutrientVector dailyFloor) {
        PlanRequest r;
        r.household.add(25, Gender::Male);
        r.tables.cost = { { "Ration", "Ration (1 lb)", "StoreA", price, 1.0 } };
        r.tables.nutrition = { { "Ration", perUnit, "Staples", maxQuantity } };
        r.requirements = { { "Male", 19, 64, dailyFloor } };
        return r;
    }

    /// @brief Two adults over the sample tables; fat floors fit the lean catalog
    PlanRequest familyRequest() {
        PlanRequest r;
        r.household.add(40, Gender::Male);
        r.household.add(38, Gender::Female);
        r.tables = fixtures::smallTables();
        r.requirements = {
            { "Male",   19, 120, fixtures::nutrients(2000, 50, 130, 5) },
            { "Female", 19, 120, fixtures::nutrients(1800, 46, 130, 4) },
        };
        return r;
    }

    /// @brief min x + y  s.t.  x + 2y >= 3, x,y integer in [0, 5]
    LinearModel tinyMip() {
        LinearModel m("tiny");
        Var x = m.addVar(0, 5, VarType::Integer, "x");
        Var y = m.addVar(0, 5, VarType::Integer, "y");
        m.addConstr(LinearExpr(x) + 2.0 * y >= 3.0, "cover");
        m.minimize(LinearExpr(x) + y);
        return m;
    }

} // namespace

// ============================================================================
// SECTION A: STATUS TRANSLATION
// ============================================================================

TEST_CASE("A1: toSolveStatus::MapsGurobiCodes", "[gurobi][status]")
{
    REQUIRE(toSolveStatus(GRB_OPTIMAL) == SolveStatus::Optimal);
    REQUIRE(toSolveStatus(GRB_INFEASIBLE) == SolveStatus::Infeasible);
    REQUIRE(toSolveStatus(GRB_INF_OR_UNBD) == SolveStatus::Infeasible);
    REQUIRE(toSolveStatus(GRB_UNBOUNDED) == SolveStatus::Unbounded);

    for (int code : { GRB_LOADED, GRB_INPROGRESS, GRB_TIME_LIMIT, GRB_NODE_LIMIT,
                      GRB_ITERATION_LIMIT, GRB_SOLUTION_LIMIT, GRB_INTERRUPTED,
                      GRB_CUTOFF, GRB_USER_OBJ_LIMIT }) {
        REQUIRE(toSolveStatus(code) == SolveStatus::NotSolved);
    }

    REQUIRE(toSolveStatus(GRB_NUMERIC) == SolveStatus::Undefined);
    REQUIRE(toSolveStatus(GRB_SUBOPTIMAL) == SolveStatus::Undefined);
    REQUIRE(toSolveStatus(999) == SolveStatus::Undefined);
}

TEST_CASE("A2: gurobiStatusString::NativeNames", "[gurobi][status]")
{
    REQUIRE(gurobiStatusString(GRB_OPTIMAL) == "OPTIMAL");
    REQUIRE(gurobiStatusString(GRB_TIME_LIMIT) == "TIME_LIMIT");
    REQUIRE(gurobiStatusString(GRB_INF_OR_UNBD) == "INF_OR_UNBD");
    REQUIRE(gurobiStatusString(999) == "UNKNOWN(999)");
}

TEST_CASE("A3: Translation::TypesSensesBounds", "[gurobi][translate]")
{
    REQUIRE(toGurobiType(VarType::Integer) == GRB_INTEGER);
    REQUIRE(toGurobiType(VarType::Binary) == GRB_BINARY);
    REQUIRE(toGurobiSense(Sense::GreaterEqual) == GRB_GREATER_EQUAL);
    REQUIRE(toGurobiSense(Sense::Equal) == GRB_EQUAL);
    REQUIRE(toGurobiBound(kInfinity) == GRB_INFINITY);
    REQUIRE(toGurobiBound(7.0) == 7.0);
}

// ============================================================================
// SECTION B: PARAMETERS, PRESETS AND LOG SINK
// ============================================================================

TEST_CASE("B1: GurobiSolver::SolvesTinyMip", "[gurobi][solve]")
{
    GurobiSolver solver;
    SolveResult r = solver.solve(tinyMip());

    REQUIRE(r.isOptimal());
    REQUIRE(r.backendStatus == "OPTIMAL");
    REQUIRE(r.objective == Catch::Approx(2.0));
    REQUIRE(r.values.size() == 2);
    REQUIRE(solver.name() == "gurobi");
}

TEST_CASE("B2: GurobiSolver::PresetThenOverrides", "[gurobi][params]")
{
    SolverOptions opts;
    opts.preset = Preset::Fast;
    opts.timeLimit = 5.0;

    GurobiSolver solver(opts);
    SolveResult r = solver.solve(tinyMip());

    REQUIRE(r.params.at("param:Preset").get<std::string>() == "Fast");
    REQUIRE(r.params.at("param:TimeLimit").get<double>() == Catch::Approx(5.0));
    REQUIRE(r.params.at("param:MIPGap").get<double>() == Catch::Approx(0.05));
    REQUIRE(r.params.at("param:Threads").get<int>() == 0);
    REQUIRE(r.params.at("param:OutputFlag").get<int>() == 0);
    REQUIRE(r.params.at("param:LogToConsole").get<int>() == 0);
}

TEST_CASE("B3: GurobiSolver::DebugPresetDisablesPresolve", "[gurobi][params]")
{
    SolverOptions opts;
    opts.preset = Preset::Debug;

    SolveResult r = GurobiSolver(opts).solve(tinyMip());
    REQUIRE(r.params.at("param:Presolve").get<int>() == 0);
    REQUIRE(r.params.at("param:OutputFlag").get<int>() == 1);
    REQUIRE(r.params.at("param:LogToConsole").get<int>() == 1);
}

TEST_CASE("B4: GurobiSolver::LogSinkReceivesLines", "[gurobi][logging]")
{
    std::vector<std::string> lines;

    SolverOptions opts;
    opts.logSink = [&](const std::string& line) { lines.push_back(line); };

    SolveResult r = GurobiSolver(opts).solve(tinyMip());

    REQUIRE(r.isOptimal());
    REQUIRE_FALSE(lines.empty());
    for (const auto& line : lines) {
        REQUIRE_FALSE(line.empty());
        REQUIRE(line.back() != '\n');
    }
    REQUIRE(r.params.at("param:OutputFlag").get<int>() == 1);
    REQUIRE(r.params.at("param:LogToConsole").get<int>() == 0);
}

// ============================================================================
// SECTION C: PLANNER SCENARIOS
// ============================================================================

TEST_CASE("C1: Scenario::ProteinFloorUnreachableIsInfeasible", "[gurobi][scenario]")
{
    GurobiSolver solver;
    WeeklyPlanner planner(solver);

    PlanResult r = planner.plan(singlePackage(
        fixtures::nutrients(2000, 0, 0, 0), 10.0, 10,
        fixtures::nutrients(2000, 50, 0, 0)));

    REQUIRE(r.status == SolveStatus::Infeasible);
    REQUIRE(r.plan.empty());
    REQUIRE(r.plan.totalCost == 0.0);
}

TEST_CASE("C2: Scenario::SevenUnitsAtFive", "[gurobi][scenario]")
{
    GurobiSolver solver;
    WeeklyPlanner planner(solver);

    // One unit carries exactly one day's floor, so a week needs seven
    NutrientVector perUnit = fixtures::nutrients(2000, 50, 250, 70);
    PlanResult r = planner.plan(singlePackage(perUnit, 5.0, 10, perUnit));

    REQUIRE(r.isOptimal());
    REQUIRE(r.objective == Catch::Approx(35.0));
    REQUIRE(r.plan.lines.size() == 1);
    REQUIRE(r.plan.lines[0].quantity == 7);
    REQUIRE(r.plan.totalCost == Catch::Approx(35.0));
    REQUIRE(r.plan.totalPackages == 7);
}

TEST_CASE("C3: Scenario::StockCoversEverything", "[gurobi][scenario][stock]")
{
    GurobiSolver solver;
    WeeklyPlanner planner(solver);

    NutrientVector perUnit = fixtures::nutrients(2000, 50, 250, 70);
    PlanRequest req = singlePackage(perUnit, 5.0, 10, perUnit);
    req.tables.stock = { { "Ration (1 lb)", 7.0 } };

    PlanResult r = planner.plan(req);

    REQUIRE(r.isOptimal());
    REQUIRE(r.objective == Catch::Approx(0.0));
    REQUIRE(r.plan.empty());
}

TEST_CASE("C4: Scenario::DiversityForcesEveryCategory", "[gurobi][scenario][diversity]")
{
    GurobiSolver solver;

    for (DiversityMode mode : { DiversityMode::RequireIndicator, DiversityMode::AtLeastOneItem }) {
        PlannerOptions options;
        options.diversity = mode;
        WeeklyPlanner planner(solver, options);

        PlanResult r = planner.plan(familyRequest());
        REQUIRE(r.isOptimal());

        CatalogJoin j = joinCatalog(fixtures::smallTables());
        for (const std::string& category : j.catalog.categories()) {
            int bought = 0;
            for (const PlanLine& line : r.plan.lines) {
                const FoodPackage* p = j.catalog.find(line.packageDescription);
                REQUIRE(p != nullptr);
                if (p->category == category)
                    bought += line.quantity;
            }
            REQUIRE(bought >= 1);
        }
    }
}

// ============================================================================
// SECTION D: SOLUTION PROPERTIES AND IDEMPOTENCE
// ============================================================================

TEST_CASE("D1: Properties::BoundsAndFloorsHold", "[gurobi][properties]")
{
    GurobiSolver solver;
    WeeklyPlanner planner(solver);

    PlanRequest req = familyRequest();
    PlanResult r = planner.plan(req);
    REQUIRE(r.isOptimal());

    CatalogJoin j = joinCatalog(req.tables);
    for (const PlanLine& line : r.plan.lines) {
        const FoodPackage* p = j.catalog.find(line.packageDescription);
        REQUIRE(p != nullptr);
        REQUIRE(line.quantity >= 0);
        REQUIRE(line.quantity <= p->maxQuantity);
    }

    NutrientCoverage cov = computeCoverage(j.catalog, r.requirement, r.plan);
    REQUIRE(cov.satisfied());
    REQUIRE(r.plan.totalCost == Catch::Approx(r.objective));

    double cost = 0.0;
    int packages = 0;
    for (const auto& s : r.plan.stores) {
        cost += s.cost;
        packages += s.packages;
    }
    REQUIRE(cost == Catch::Approx(r.plan.totalCost));
    REQUIRE(packages == r.plan.totalPackages);
}

TEST_CASE("D2: Properties::RepeatedRunsAgree", "[gurobi][properties][determinism]")
{
    GurobiSolver solver;
    WeeklyPlanner planner(solver);

    PlanResult first = planner.plan(familyRequest());
    PlanResult second = planner.plan(familyRequest());

    REQUIRE(first.isOptimal());
    REQUIRE(second.isOptimal());
    REQUIRE(first.objective == Catch::Approx(second.objective));
    REQUIRE(first.plan.lines.size() == second.plan.lines.size());
    for (std::size_t i = 0; i < first.plan.lines.size(); ++i) {
        REQUIRE(first.plan.lines[i].packageDescription == second.plan.lines[i].packageDescription);
        REQUIRE(first.plan.lines[i].quantity == second.plan.lines[i].quantity);
    }
}

// ============================================================================
// SECTION E: BACKEND ERRORS
// ============================================================================

TEST_CASE("E1: GurobiSolver::RejectedParameterIsSolverError", "[gurobi][errors]")
{
    SolverOptions opts;
    opts.mipGap = -1.0;   // below MIPGap's lower limit

    GurobiSolver solver(opts);
    try {
        (void)solver.solve(tinyMip());
        FAIL("expected SolverError");
    }
    catch (const SolverError& e) {
        REQUIRE(e.code() != 0);
        REQUIRE(std::string(e.what()).starts_with("GurobiSolver: "));
    }
}
