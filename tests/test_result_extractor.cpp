/*
===============================================================================
TEST RESULT EXTRACTOR — Solved values to store-grouped purchase plan
===============================================================================

TEST ORGANIZATION
-----------------
• Section A: Tolerance and rounding
• Section B: Line items and rollups
• Section C: Store grouping
• Section D: Inconsistency detection

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• result_extractor.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <grocery/result_extractor.h>

#include <cstddef>
#include <vector>

#include "fixtures.h"

using namespace grocery;

namespace {

    /// @brief Buy columns 0..n-1, as PlanModelBuilder lays them out
    VariableBlock buyBlock(std::size_t n) {
        VariableBlock b;
        for (std::size_t i = 0; i < n; ++i)
            b.push_back(Var{ i });
        return b;
    }

} // namespace

// ============================================================================
// SECTION A: TOLERANCE AND ROUNDING
// ============================================================================

TEST_CASE("A1: extractPlan::NearZeroValuesSkipped", "[extractor][tolerance]")
{
    CatalogJoin j = joinCatalog(fixtures::smallTables());
    std::vector<double> values{ 1e-9, 0.0, -1e-7, 2.0 };

    PurchasePlan plan = extractPlan(j.catalog, buyBlock(4), values);
    REQUIRE(plan.lines.size() == 1);
    REQUIRE(plan.lines[0].packageDescription == "Apples (3 lb)");
}

TEST_CASE("A2: extractPlan::RoundsToNearestInteger", "[extractor][rounding]")
{
    CatalogJoin j = joinCatalog(fixtures::smallTables());
    std::vector<double> values{ 2.9999997, 1.0000004, 0.0, 0.0 };

    PurchasePlan plan = extractPlan(j.catalog, buyBlock(4), values);
    REQUIRE(plan.lines.size() == 2);
    REQUIRE(plan.lines[0].quantity == 3);
    REQUIRE(plan.lines[1].quantity == 1);
}

TEST_CASE("A3: extractPlan::AboveToleranceButRoundsToZero", "[extractor][rounding][edge]")
{
    CatalogJoin j = joinCatalog(fixtures::smallTables());
    std::vector<double> values{ 0.3, 0.0, 0.0, 0.0 };

    PurchasePlan plan = extractPlan(j.catalog, buyBlock(4), values);
    REQUIRE(plan.empty());
    REQUIRE(plan.totalPackages == 0);
}

// ============================================================================
// SECTION B: LINE ITEMS AND ROLLUPS
// ============================================================================

TEST_CASE("B1: extractPlan::LineTotals", "[extractor][lines]")
{
    CatalogJoin j = joinCatalog(fixtures::smallTables());
    std::vector<double> values{ 0.0, 0.0, 4.0, 0.0 };

    PurchasePlan plan = extractPlan(j.catalog, buyBlock(4), values);
    REQUIRE(plan.lines.size() == 1);

    const PlanLine& beans = plan.lines[0];
    REQUIRE(beans.store == "StoreA");
    REQUIRE(beans.food == "Beans");
    REQUIRE(beans.unitPrice == Catch::Approx(3.50));
    REQUIRE(beans.unitWeightLb == Catch::Approx(2.0));
    REQUIRE(beans.quantity == 4);
    REQUIRE(beans.totalCost == Catch::Approx(14.0));
    REQUIRE(beans.totalWeightLb == Catch::Approx(8.0));
}

TEST_CASE("B2: extractPlan::PlanTotalsAreLineSums", "[extractor][rollup]")
{
    CatalogJoin j = joinCatalog(fixtures::smallTables());
    std::vector<double> values{ 1.0, 2.0, 3.0, 1.0 };

    PurchasePlan plan = extractPlan(j.catalog, buyBlock(4), values);

    double cost = 0.0;
    double weight = 0.0;
    int packages = 0;
    for (const auto& line : plan.lines) {
        cost += line.totalCost;
        weight += line.totalWeightLb;
        packages += line.quantity;
    }
    REQUIRE(plan.totalCost == Catch::Approx(cost));
    REQUIRE(plan.totalCost == Catch::Approx(6.0 + 6.0 + 10.5 + 4.5));
    REQUIRE(plan.totalWeightLb == Catch::Approx(weight));
    REQUIRE(plan.totalPackages == packages);
    REQUIRE(plan.totalPackages == 7);
}

// ============================================================================
// SECTION C: STORE GROUPING
// ============================================================================

TEST_CASE("C1: extractPlan::StoresSortedWithSubtotals", "[extractor][stores]")
{
    CatalogJoin j = joinCatalog(fixtures::smallTables());
    std::vector<double> values{ 1.0, 2.0, 3.0, 1.0 };

    PurchasePlan plan = extractPlan(j.catalog, buyBlock(4), values);

    REQUIRE(plan.numStores() == 2);
    REQUIRE(plan.stores[0].store == "StoreA");
    REQUIRE(plan.stores[1].store == "StoreB");

    const StoreSummary* a = plan.forStore("StoreA");
    REQUIRE(a != nullptr);
    REQUIRE(a->packages == 5);
    REQUIRE(a->cost == Catch::Approx(6.0 + 10.5));
    REQUIRE(a->lines == std::vector<std::size_t>{ 1, 2 });

    double cost = 0.0;
    int packages = 0;
    for (const auto& s : plan.stores) {
        cost += s.cost;
        packages += s.packages;
    }
    REQUIRE(cost == Catch::Approx(plan.totalCost));
    REQUIRE(packages == plan.totalPackages);

    REQUIRE(plan.forStore("StoreZ") == nullptr);
}

// ============================================================================
// SECTION D: INCONSISTENCY DETECTION
// ============================================================================

TEST_CASE("D1: extractPlan::MismatchedBlockIsInternalInconsistency", "[extractor][errors]")
{
    CatalogJoin j = joinCatalog(fixtures::smallTables());
    std::vector<double> values{ 1.0, 1.0, 1.0 };

    REQUIRE_THROWS_AS(extractPlan(j.catalog, buyBlock(3), values), InternalInconsistency);
    REQUIRE_THROWS_AS(extractPlan(j.catalog, buyBlock(4), values), InternalInconsistency);
}
