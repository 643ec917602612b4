#pragma once
/*
===============================================================================
PLANNER — One weekly optimisation request, end to end
===============================================================================

OVERVIEW
--------
WeeklyPlanner wires the pipeline together:

    household ─► resolveRequirements ─┐
                                      ├─► PlanModelBuilder ─► Solver ─► extractPlan
    tables    ─► joinCatalog ─────────┘

Each plan() call is self-contained. The inputs are copied into request-local
snapshots (RequirementTable, Catalog), a fresh LinearModel is built, solved
once and discarded. Nothing survives between calls, so one planner may serve
several threads as long as its Solver does.

PROPAGATION POLICY
------------------
• Empty household                     ConfigurationError(EmptyHousehold),
                                      thrown before any table is looked at
• Bad tables                          ConfigurationError (see catalog.h,
                                      household.h)
• Dropped rows, unmatched members     PlanResult::warnings; request proceeds
• Non-Optimal status                  PlanResult::status with an empty plan;
                                      never retried or relaxed
• Model / catalog mismatch            InternalInconsistency
• Backend failure                     SolverError (from Solver::solve)

USAGE EXAMPLES
--------------
    GurobiSolver solver;
    WeeklyPlanner planner(solver);

    PlanRequest req;
    req.household.add(34, Gender::Female);
    req.tables = loadTables();
    req.requirements = loadRequirementRows();

    PlanResult r = planner.plan(req);
    if (r.isOptimal())
        for (const auto& s : r.plan.stores) { ... }

===============================================================================
*/

#include <format>
#include <string>
#include <utility>
#include <vector>

#include "catalog.h"
#include "diagnostics.h"
#include "errors.h"
#include "household.h"
#include "model_builder.h"
#include "result_extractor.h"
#include "solver.h"

namespace grocery {

    /**
     * @struct PlannerOptions
     * @brief Modelling choices; solver parameters belong to the Solver
     */
    struct PlannerOptions {
        DiversityMode diversity = DiversityMode::RequireIndicator;
        double tolerance = kDefaultExtractionTolerance;   ///< extraction threshold
    };

    /**
     * @struct PlanRequest
     * @brief Everything one optimisation needs, as parsed tables
     */
    struct PlanRequest {
        Household household;
        CatalogTables tables;
        std::vector<NutrientRequirementRow> requirements;
    };

    /**
     * @struct PlanResult
     * @brief Outcome of one request
     */
    struct PlanResult {
        SolveStatus status = SolveStatus::NotSolved;
        std::string backendStatus;
        double objective = 0.0;           ///< total cost when Optimal
        PurchasePlan plan;                ///< empty unless Optimal
        AggregateRequirement requirement;
        WarningList warnings;
        ModelStatistics stats;
        DataStore params;                 ///< solver parameters applied
        double runtime = 0.0;
        double nodeCount = 0.0;

        bool isOptimal() const noexcept { return status == SolveStatus::Optimal; }
    };

    /**
     * @class WeeklyPlanner
     * @brief Runs requirement resolution, catalog join, build, solve, extract
     *
     * @details Holds a reference to the solver, which must outlive the planner.
     */
    class WeeklyPlanner {
    public:
        explicit WeeklyPlanner(const Solver& solver, PlannerOptions options = {})
            : solver_(solver), options_(options)
        {
        }

        const PlannerOptions& options() const noexcept { return options_; }

        /**
         * @brief Plans one week from raw tables
         * @throws ConfigurationError, InternalInconsistency, SolverError
         */
        PlanResult plan(const PlanRequest& request) const {
            requireMembers(request.household);
            RequirementTable table(request.requirements);
            CatalogJoin joined = joinCatalog(request.tables);
            return plan(request.household, table, std::move(joined));
        }

        /**
         * @brief Plans one week from already validated inputs
         * @throws ConfigurationError(EmptyHousehold), InternalInconsistency, SolverError
         */
        PlanResult plan(const Household& household, const RequirementTable& table, CatalogJoin joined) const {
            requireMembers(household);

            RequirementResolution resolved = resolveRequirements(household, table);

            PlanResult result;
            result.requirement = resolved.requirement;
            result.warnings = std::move(joined.warnings);
            result.warnings.insert(result.warnings.end(),
                resolved.warnings.begin(), resolved.warnings.end());

            const Catalog& catalog = joined.catalog;
            PlanModelBuilder builder(catalog, result.requirement, options_.diversity);
            const LinearModel& model = builder.build();
            result.stats = computeStatistics(model);

            SolveResult solved = solver_.solve(model);
            result.status = solved.status;
            result.backendStatus = std::move(solved.backendStatus);
            result.params = std::move(solved.params);
            result.runtime = solved.runtime;
            result.nodeCount = solved.nodeCount;

            if (!solved.isOptimal())
                return result;

            if (solved.values.size() != model.numVars()) {
                throw InternalInconsistency(std::format(
                    "WeeklyPlanner: solver returned {} values for {} columns",
                    solved.values.size(), model.numVars()));
            }

            result.objective = solved.objective;
            result.plan = extractPlan(catalog, builder.variables()(PlanVars::Buy),
                solved.values, options_.tolerance);
            return result;
        }

    private:
        static void requireMembers(const Household& household) {
            if (household.empty()) {
                throw ConfigurationError(ConfigurationError::Kind::EmptyHousehold, "household",
                    "WeeklyPlanner: household has no members; nothing to plan");
            }
        }

        const Solver& solver_;
        PlannerOptions options_;
    };

} // namespace grocery
