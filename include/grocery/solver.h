#pragma once
/*
===============================================================================
SOLVER — Backend-agnostic MILP solving interface
===============================================================================

OVERVIEW
--------
The planner treats the MILP solver as a black box with simplex +
branch-and-bound semantics. Solver is the seam: it receives a finished
LinearModel and returns a status and, when optimal, one value per column.
GurobiSolver (gurobi_solver.h) is the production implementation; tests plug
in scripted fakes.

KEY COMPONENTS
--------------
• SolveStatus      Optimal | Infeasible | Unbounded | NotSolved | Undefined
• Preset           named parameter bundles (Fast, Accurate, Quiet, Debug)
• SolverOptions    time limit, MIP gap, threads, verbosity, log sinks
• Progress         snapshot of branch-and-bound progress
• SolveResult      status, objective, column values, run statistics
• Solver           abstract interface: solve(const LinearModel&)

CONTRACT
--------
• solve() never modifies the model and never re-solves: one call, one run.
• A non-Optimal status is returned as is. No relaxation, no retry.
• values is filled (one entry per column, in column order) only when the
  status is Optimal; otherwise it is empty.
• Failures of the backend itself are thrown as SolverError.

===============================================================================
*/

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "data_store.h"
#include "linear_model.h"

namespace grocery {

    enum class SolveStatus { Optimal, Infeasible, Unbounded, NotSolved, Undefined };

    inline std::string_view toString(SolveStatus s) {
        switch (s) {
            case SolveStatus::Optimal:    return "Optimal";
            case SolveStatus::Infeasible: return "Infeasible";
            case SolveStatus::Unbounded:  return "Unbounded";
            case SolveStatus::NotSolved:  return "Not Solved";
            case SolveStatus::Undefined:  return "Undefined";
        }
        return "Undefined";
    }

    /// @brief Predefined parameter configurations
    enum class Preset {
        Fast,       ///< 60 s limit, 5% gap, automatic threads
        Accurate,   ///< 1 h limit, 0.01% gap
        Quiet,      ///< no solver output
        Debug       ///< solver output on, presolve off
    };

    inline std::string_view toString(Preset p) {
        switch (p) {
            case Preset::Fast:     return "Fast";
            case Preset::Accurate: return "Accurate";
            case Preset::Quiet:    return "Quiet";
            case Preset::Debug:    return "Debug";
        }
        return "Unknown";
    }

    /**
     * @struct Progress
     * @brief Branch-and-bound progress reported while a MIP solve runs
     */
    struct Progress {
        double runtime = 0.0;       ///< seconds since solve start
        double nodeCount = 0.0;     ///< explored nodes
        double incumbent = kInfinity;
        double bound = -kInfinity;
        int solutionCount = 0;

        /// @brief Relative gap |incumbent - bound| / |incumbent|, infinity without incumbent
        double gap() const noexcept {
            if (solutionCount == 0 || incumbent == kInfinity)
                return kInfinity;
            const double denom = incumbent < 0 ? -incumbent : incumbent;
            const double diff = incumbent > bound ? incumbent - bound : bound - incumbent;
            return denom > 1e-10 ? diff / denom : diff;
        }
    };

    using LogSink = std::function<void(const std::string&)>;
    using ProgressSink = std::function<void(const Progress&)>;

    /**
     * @struct SolverOptions
     * @brief Solve parameters; unset fields keep the backend defaults
     *
     * @details A preset is applied first, explicit fields afterwards, so
     *          {preset = Fast, timeLimit = 10} runs Fast with a 10 s limit.
     */
    struct SolverOptions {
        std::optional<Preset> preset;
        std::optional<double> timeLimit;   ///< seconds
        std::optional<double> mipGap;      ///< relative, e.g. 0.01 = 1%
        std::optional<int> threads;        ///< 0 = automatic
        bool verbose = false;              ///< backend console output
        LogSink logSink;                   ///< receives backend log lines
        ProgressSink progressSink;         ///< receives MIP progress snapshots
    };

    /**
     * @struct SolveResult
     * @brief Outcome of one solve() call
     */
    struct SolveResult {
        SolveStatus status = SolveStatus::NotSolved;
        std::string backendStatus;          ///< backend's own status name
        double objective = 0.0;             ///< meaningful when Optimal
        std::vector<double> values;         ///< one per column when Optimal
        double runtime = 0.0;
        double nodeCount = 0.0;
        double mipGap = 0.0;
        DataStore params;                   ///< "param:<Name>" for every applied parameter

        bool isOptimal() const noexcept { return status == SolveStatus::Optimal; }
    };

    /**
     * @class Solver
     * @brief Abstract MILP backend
     *
     * @details Implementations must be usable from several threads as long as
     *          each call receives its own model; they hold no per-solve state
     *          between calls.
     */
    class Solver {
    public:
        virtual ~Solver() = default;

        /// @throws SolverError if the backend cannot run
        virtual SolveResult solve(const LinearModel& model) const = 0;

        /// @brief Short backend identifier for logs, e.g. "gurobi"
        virtual std::string name() const = 0;
    };

} // namespace grocery
