/*
===============================================================================
TEST LINEAR MODEL — Expressions, rows, columns, tables and sums
===============================================================================

TEST ORGANIZATION
-----------------
• Section A: LinearExpr arithmetic and evaluation
• Section B: Constraint normalisation
• Section C: LinearModel columns and rows
• Section D: VariableTable / ConstraintTable
• Section E: sum() helpers

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• linear_model.h, model_tables.h, expressions.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <grocery/expressions.h>
#include <grocery/linear_model.h>
#include <grocery/model_tables.h>

#include <cstddef>
#include <stdexcept>
#include <vector>

using namespace grocery;

DECLARE_ENUM_WITH_COUNT(TestVars, X, Y);
DECLARE_ENUM_WITH_COUNT(TestCons, Cap);

// ============================================================================
// SECTION A: LINEAREXPR ARITHMETIC AND EVALUATION
// ============================================================================

TEST_CASE("A1: LinearExpr::BuildAndEvaluate", "[linear_model][expr]")
{
    Var x{ 0 };
    Var y{ 1 };

    LinearExpr e = 2.0 * x + y * 3.0 + LinearExpr(4.0);
    REQUIRE(e.size() == 2);
    REQUIRE(e.constant() == Catch::Approx(4.0));

    std::vector<double> values{ 1.5, 2.0 };
    REQUIRE(e.evaluate(values) == Catch::Approx(2.0 * 1.5 + 3.0 * 2.0 + 4.0));
}

TEST_CASE("A2: LinearExpr::SubtractAndScale", "[linear_model][expr]")
{
    Var x{ 0 };
    LinearExpr e = 3.0 * (LinearExpr(x) - LinearExpr(1.0));

    std::vector<double> values{ 5.0 };
    REQUIRE(e.evaluate(values) == Catch::Approx(12.0));
    REQUIRE(e.constant() == Catch::Approx(-3.0));
}

TEST_CASE("A3: LinearExpr::EvaluateChecksColumns", "[linear_model][expr][errors]")
{
    LinearExpr e(Var{ 3 });
    std::vector<double> values{ 1.0 };
    REQUIRE_THROWS_AS(e.evaluate(values), std::out_of_range);
}

// ============================================================================
// SECTION B: CONSTRAINT NORMALISATION
// ============================================================================

TEST_CASE("B1: LinearConstraint::ConstantsMoveRight", "[linear_model][constraint]")
{
    Var x{ 0 };
    Var y{ 1 };

    LinearConstraint c = (2.0 * x + LinearExpr(10.0)) >= (LinearExpr(y) + LinearExpr(4.0));

    REQUIRE(c.sense == Sense::GreaterEqual);
    REQUIRE(c.rhs == Catch::Approx(-6.0));
    REQUIRE(c.expr.constant() == 0.0);
    REQUIRE(c.expr.size() == 2);
    REQUIRE(c.expr.terms()[1].coef == Catch::Approx(-1.0));
}

TEST_CASE("B2: ConstraintDef::Violation", "[linear_model][constraint]")
{
    LinearModel m;
    Var x = m.addVar(0, 10, VarType::Continuous, "x");
    m.addConstr(LinearExpr(x) >= 4.0, "ge");
    m.addConstr(LinearExpr(x) <= 2.0, "le");
    m.addConstr(LinearExpr(x) == 3.0, "eq");

    std::vector<double> values{ 3.0 };
    REQUIRE(m.constraints()[0].violation(values) == Catch::Approx(1.0));
    REQUIRE(m.constraints()[1].violation(values) == Catch::Approx(1.0));
    REQUIRE(m.constraints()[2].violation(values) == 0.0);
}

// ============================================================================
// SECTION C: LINEARMODEL COLUMNS AND ROWS
// ============================================================================

TEST_CASE("C1: LinearModel::InsertionOrder", "[linear_model][model]")
{
    LinearModel m("test");
    Var a = m.addVar(0, 5, VarType::Integer, "a");
    Var b = m.addVar(0, 1, VarType::Binary, "b");

    REQUIRE(a.index == 0);
    REQUIRE(b.index == 1);
    REQUIRE(m.numVars() == 2);
    REQUIRE(m.var(b).name == "b");
    REQUIRE(m.var(a).ub == Catch::Approx(5.0));

    REQUIRE(m.addConstr(LinearExpr(a) >= b, "r0") == 0);
    REQUIRE(m.addConstr(LinearExpr(a) <= 4.0, "r1") == 1);
    REQUIRE(m.constraints()[1].name == "r1");

    m.minimize(2.0 * a);
    REQUIRE(m.objectiveSense() == ObjectiveSense::Minimize);
    m.maximize(LinearExpr(b));
    REQUIRE(m.objectiveSense() == ObjectiveSense::Maximize);
    REQUIRE(m.objective().size() == 1);
}

TEST_CASE("C2: LinearModel::RejectsBadColumns", "[linear_model][model][errors]")
{
    LinearModel m;
    REQUIRE_THROWS_AS(m.addVar(3, 1, VarType::Integer, "inverted"), std::invalid_argument);
    REQUIRE_THROWS_AS(m.addVar(0, 2, VarType::Binary, "wide"), std::invalid_argument);
    REQUIRE_NOTHROW(m.addVar(0, kInfinity, VarType::Continuous, "free"));
}

TEST_CASE("C3: LinearModel::RejectsUnknownColumnInRow", "[linear_model][model][errors]")
{
    LinearModel m;
    m.addVar(0, 1, VarType::Binary, "only");
    REQUIRE_THROWS_AS(m.addConstr(LinearExpr(Var{ 5 }) >= 1.0, "bad"), std::out_of_range);
    REQUIRE(m.numConstrs() == 0);
}

// ============================================================================
// SECTION D: VARIABLETABLE / CONSTRAINTTABLE
// ============================================================================

TEST_CASE("D1: VariableTable::BlocksByKey", "[linear_model][tables]")
{
    LinearModel m;
    VariableBlock xs;
    for (int i = 0; i < 3; ++i)
        xs.push_back(m.addVar(0, 1, VarType::Binary, "x"));

    VariableTable<TestVars> vars;
    vars.set(TestVars::X, std::move(xs));

    REQUIRE(vars.get(TestVars::X).size() == 3);
    REQUIRE(vars.var(TestVars::X, 2).index == 2);
    REQUIRE(vars.isEmpty(TestVars::Y));
    REQUIRE_THROWS_AS(vars.var(TestVars::X, 3), std::out_of_range);
    REQUIRE_THROWS_AS(vars.get(TestVars::COUNT), std::out_of_range);
}

TEST_CASE("D2: ConstraintTable::RowPositions", "[linear_model][tables]")
{
    ConstraintBlock rows;
    rows.push_back(4);
    rows.push_back(7);

    ConstraintTable<TestCons> cons;
    cons.set(TestCons::Cap, std::move(rows));

    REQUIRE(cons(TestCons::Cap).size() == 2);
    REQUIRE(cons(TestCons::Cap).at(1) == 7);
    REQUIRE_THROWS_AS(cons(TestCons::Cap).at(2), std::out_of_range);
}

// ============================================================================
// SECTION E: SUM HELPERS
// ============================================================================

TEST_CASE("E1: Sum::LambdaOverRange", "[linear_model][sum]")
{
    LinearModel m;
    VariableBlock x;
    for (int i = 0; i < 4; ++i)
        x.push_back(m.addVar(0, 10, VarType::Integer, "x"));

    LinearExpr e = sum(range(0, 4), [&](std::size_t i) { return static_cast<double>(i + 1) * x(i); });

    std::vector<double> values{ 1, 1, 1, 1 };
    REQUIRE(e.evaluate(values) == Catch::Approx(1 + 2 + 3 + 4));
}

TEST_CASE("E2: Sum::BlockAndSubset", "[linear_model][sum]")
{
    LinearModel m;
    VariableBlock x;
    for (int i = 0; i < 4; ++i)
        x.push_back(m.addVar(0, 10, VarType::Integer, "x"));

    std::vector<double> values{ 1, 2, 3, 4 };
    REQUIRE(sum(x).evaluate(values) == Catch::Approx(10));

    std::vector<std::size_t> subset{ 1, 3 };
    REQUIRE(sum(subset, x).evaluate(values) == Catch::Approx(6));

    REQUIRE(sum(range(2, 2), x).size() == 0);
}
