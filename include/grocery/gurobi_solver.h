#pragma once
/*
===============================================================================
GUROBI SOLVER — Solver implementation on the Gurobi C++ API
===============================================================================

Overview
--------
Two layers:

    GurobiModelBuilder   template-method base that owns GRBEnv / GRBModel,
                         exposes named parameter setters with presets, and
                         post-solve accessors (status(), objVal(), ...)
    GurobiSolver         grocery::Solver that translates a LinearModel into a
                         fresh GurobiModelBuilder per solve() call

The builder workflow mirrors the way every model is assembled:

    initialize()                      lazy: env (deferred start) + model
    optimize() {
        addVariables();
        addConstraints();
        addParameters();
        addObjective();
        beforeOptimize();
        model.optimize();
        afterOptimize();
    }

Key Features
------------
1. Lazy initialization:
       - The constructor performs no solver calls; configureEnvironment() runs
         exactly once, before env.start().
2. Parameter tracking:
       - timeLimit(), mipGapLimit(), threads(), quiet(), verbose(), presolve()
         set the Gurobi parameter and record "param:<Name>" in store().
3. Status translation:
       - toSolveStatus() folds Gurobi's status codes into SolveStatus;
         gurobiStatusString() keeps the native name for diagnostics.
4. One model per request:
       - GurobiSolver::solve() builds, optimises and discards its own GRBModel,
         so concurrent requests never share solver state.

Status Mapping
--------------
    GRB_OPTIMAL                                   -> Optimal
    GRB_INFEASIBLE, GRB_INF_OR_UNBD               -> Infeasible
    GRB_UNBOUNDED                                 -> Unbounded
    GRB_LOADED, GRB_INPROGRESS, *_LIMIT,
    GRB_INTERRUPTED, GRB_CUTOFF, GRB_USER_OBJ_LIMIT -> NotSolved
    GRB_NUMERIC, GRB_SUBOPTIMAL, anything else    -> Undefined

Planner models bound every column, so INF_OR_UNBD can only mean infeasible.

Typical Usage
-------------
    SolverOptions opts;
    opts.preset = Preset::Fast;
    opts.logSink = [](const std::string& line) { std::clog << line << "\n"; };

    GurobiSolver solver(opts);
    SolveResult r = solver.solve(model);

===============================================================================
*/

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

#include "callbacks.h"
#include "data_store.h"
#include "errors.h"
#include "linear_model.h"
#include "solver.h"

namespace grocery {

    // =============================================================================
    // STATUS TRANSLATION
    // =============================================================================

    /**
     * @brief Gurobi status code as its native name
     * @example gurobiStatusString(GRB_TIME_LIMIT) == "TIME_LIMIT"
     */
    inline std::string gurobiStatusString(int status) {
        switch (status) {
            case GRB_LOADED:          return "LOADED";
            case GRB_OPTIMAL:         return "OPTIMAL";
            case GRB_INFEASIBLE:      return "INFEASIBLE";
            case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
            case GRB_UNBOUNDED:       return "UNBOUNDED";
            case GRB_CUTOFF:          return "CUTOFF";
            case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
            case GRB_NODE_LIMIT:      return "NODE_LIMIT";
            case GRB_TIME_LIMIT:      return "TIME_LIMIT";
            case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
            case GRB_INTERRUPTED:     return "INTERRUPTED";
            case GRB_NUMERIC:         return "NUMERIC";
            case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
            case GRB_INPROGRESS:      return "INPROGRESS";
            case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
            default:                  return "UNKNOWN(" + std::to_string(status) + ")";
        }
    }

    inline SolveStatus toSolveStatus(int status) {
        switch (status) {
            case GRB_OPTIMAL:
                return SolveStatus::Optimal;
            case GRB_INFEASIBLE:
            case GRB_INF_OR_UNBD:
                return SolveStatus::Infeasible;
            case GRB_UNBOUNDED:
                return SolveStatus::Unbounded;
            case GRB_LOADED:
            case GRB_INPROGRESS:
            case GRB_CUTOFF:
            case GRB_ITERATION_LIMIT:
            case GRB_NODE_LIMIT:
            case GRB_TIME_LIMIT:
            case GRB_SOLUTION_LIMIT:
            case GRB_INTERRUPTED:
            case GRB_USER_OBJ_LIMIT:
                return SolveStatus::NotSolved;
            default:
                return SolveStatus::Undefined;
        }
    }

    inline char toGurobiType(VarType t) {
        switch (t) {
            case VarType::Continuous: return GRB_CONTINUOUS;
            case VarType::Integer:    return GRB_INTEGER;
            case VarType::Binary:     return GRB_BINARY;
        }
        return GRB_CONTINUOUS;
    }

    inline char toGurobiSense(Sense s) {
        switch (s) {
            case Sense::LessEqual:    return GRB_LESS_EQUAL;
            case Sense::GreaterEqual: return GRB_GREATER_EQUAL;
            case Sense::Equal:        return GRB_EQUAL;
        }
        return GRB_EQUAL;
    }

    /// @brief Maps +-infinity onto GRB_INFINITY, Gurobi's own sentinel
    inline double toGurobiBound(double b) {
        if (b >= GRB_INFINITY) return GRB_INFINITY;
        if (b <= -GRB_INFINITY) return -GRB_INFINITY;
        return b;
    }

    // =============================================================================
    // MODEL BUILDER (template method over GRBModel)
    // =============================================================================

    /**
     * @class GurobiModelBuilder
     * @brief Owns a Gurobi environment and model and drives the build workflow
     *
     * @details Derived classes override the hooks; optimize() runs them in a
     *          fixed order. Parameter setters must be called once the model
     *          exists, i.e. from addParameters() or later.
     */
    class GurobiModelBuilder {
    private:
        std::unique_ptr<GRBEnv>   env_;
        std::unique_ptr<GRBModel> model_;
        bool initialized_ = false;

    protected:
        DataStore store_;

    public:
        GurobiModelBuilder() = default;
        virtual ~GurobiModelBuilder() = default;

        GurobiModelBuilder(const GurobiModelBuilder&) = delete;
        GurobiModelBuilder& operator=(const GurobiModelBuilder&) = delete;

        /**
         * @brief Create environment and model once
         *
         * Steps:
         *     - GRBEnv(true): defer licence check
         *     - configureEnvironment(env)
         *     - env.start()
         *     - GRBModel(env)
         */
        void initialize()
        {
            if (initialized_)
                return;

            env_ = std::make_unique<GRBEnv>(true);
            configureEnvironment(*env_);
            env_->start();
            model_ = std::make_unique<GRBModel>(*env_);

            initialized_ = true;
        }

        GRBModel& model()
        {
            if (!initialized_)
                initialize();
            return *model_;
        }

        const GRBModel& model() const { return *model_; }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

        // -------------------------------------------------------------------------
        // Parameter configuration (tracked in store())
        // -------------------------------------------------------------------------

        void timeLimit(double seconds) {
            model().set(GRB_DoubleParam_TimeLimit, seconds);
            store_["param:TimeLimit"] = seconds;
        }

        void mipGapLimit(double gap) {
            model().set(GRB_DoubleParam_MIPGap, gap);
            store_["param:MIPGap"] = gap;
        }

        void threads(int n) {
            model().set(GRB_IntParam_Threads, n);
            store_["param:Threads"] = n;
        }

        void quiet() {
            model().set(GRB_IntParam_OutputFlag, 0);
            store_["param:OutputFlag"] = 0;
        }

        void verbose() {
            model().set(GRB_IntParam_OutputFlag, 1);
            store_["param:OutputFlag"] = 1;
        }

        /// @param level -1=auto, 0=off, 1=conservative, 2=aggressive
        void presolve(int level) {
            model().set(GRB_IntParam_Presolve, level);
            store_["param:Presolve"] = level;
        }

        /**
         * @brief Apply a predefined parameter configuration
         *
         *   - Fast:     TimeLimit=60, MIPGap=5%, Threads=0 (auto)
         *   - Accurate: TimeLimit=3600, MIPGap=0.01%
         *   - Quiet:    OutputFlag=0
         *   - Debug:    OutputFlag=1, Presolve=0
         */
        void applyPreset(Preset p) {
            switch (p) {
                case Preset::Fast:
                    timeLimit(60.0);
                    mipGapLimit(0.05);
                    threads(0);
                    break;
                case Preset::Accurate:
                    timeLimit(3600.0);
                    mipGapLimit(0.0001);
                    break;
                case Preset::Quiet:
                    quiet();
                    break;
                case Preset::Debug:
                    verbose();
                    presolve(0);
                    break;
            }
            store_["param:Preset"] = std::string(toString(p));
        }

        // -------------------------------------------------------------------------
        // Solution diagnostics (valid after optimize())
        // -------------------------------------------------------------------------

        int status() const { return model().get(GRB_IntAttr_Status); }
        bool isOptimal() const { return status() == GRB_OPTIMAL; }
        bool isMIP() const { return model().get(GRB_IntAttr_IsMIP) != 0; }
        double objVal() const { return model().get(GRB_DoubleAttr_ObjVal); }
        double runtime() const { return model().get(GRB_DoubleAttr_Runtime); }
        int solutionCount() const { return model().get(GRB_IntAttr_SolCount); }

        /// @note MIP only; 0 for continuous models
        double mipGap() const { return isMIP() ? model().get(GRB_DoubleAttr_MIPGap) : 0.0; }

        /// @note MIP only; 0 for continuous models
        double nodeCount() const { return isMIP() ? model().get(GRB_DoubleAttr_NodeCount) : 0.0; }

        // -------------------------------------------------------------------------
        // Template-method hooks
        // -------------------------------------------------------------------------

        virtual void configureEnvironment(GRBEnv& env) { env.set(GRB_IntParam_OutputFlag, 0); }
        virtual void addVariables() {}
        virtual void addConstraints() {}
        virtual void addParameters() {}
        virtual void addObjective() {}
        virtual void beforeOptimize() {}
        virtual void afterOptimize() {}

        /**
         * @brief Build and optimise using the hook sequence
         * @return The underlying model, solved
         */
        GRBModel& optimize()
        {
            initialize();

            addVariables();
            addConstraints();
            addParameters();
            addObjective();

            beforeOptimize();
            model().optimize();
            afterOptimize();

            return model();
        }
    };

    // =============================================================================
    // LINEAR MODEL TRANSLATION
    // =============================================================================

    /**
     * @class LinearModelTranslator
     * @brief GurobiModelBuilder that mirrors one LinearModel column for column
     *
     * @details Columns and rows are added in LinearModel order and keep their
     *          names, so LP exports and IIS reports read like the planner's
     *          own model.
     */
    class LinearModelTranslator : public GurobiModelBuilder {
    public:
        LinearModelTranslator(const LinearModel& source, const SolverOptions& options)
            : source_(source), options_(options),
            monitor_(options.logSink, options.progressSink)
        {
        }

        const std::vector<GRBVar>& columns() const noexcept { return columns_; }

        /// @brief Column values in LinearModel order; requires a solution
        std::vector<double> columnValues() const {
            std::vector<double> values;
            values.reserve(columns_.size());
            for (const GRBVar& v : columns_)
                values.push_back(v.get(GRB_DoubleAttr_X));
            return values;
        }

    protected:
        void configureEnvironment(GRBEnv& env) override {
            env.set(GRB_IntParam_OutputFlag, 0);
            env.set(GRB_StringParam_LogFile, "");
        }

        void addVariables() override {
            auto& m = model();
            columns_.reserve(source_.numVars());
            for (const VariableDef& def : source_.vars()) {
                columns_.push_back(m.addVar(toGurobiBound(def.lb), toGurobiBound(def.ub),
                    0.0, toGurobiType(def.type), def.name));
            }
        }

        void addConstraints() override {
            auto& m = model();
            for (const ConstraintDef& c : source_.constraints()) {
                m.addConstr(toExpr(c.expr), toGurobiSense(c.sense), c.rhs, c.name);
            }
        }

        void addParameters() override {
            if (options_.preset)
                applyPreset(*options_.preset);
            if (options_.timeLimit)
                timeLimit(*options_.timeLimit);
            if (options_.mipGap)
                mipGapLimit(*options_.mipGap);
            if (options_.threads)
                threads(*options_.threads);

            if (options_.verbose || options_.preset == Preset::Debug)
                verbose();
            else if (monitor_.active() && options_.logSink)
                verbose();   // message callbacks need output enabled
            else
                quiet();

            // Console echo only when explicitly verbose; the sink gets the lines otherwise.
            const bool console = options_.verbose || options_.preset == Preset::Debug;
            model().set(GRB_IntParam_LogToConsole, console ? 1 : 0);
            store_["param:LogToConsole"] = console ? 1 : 0;
        }

        void addObjective() override {
            model().setObjective(toExpr(source_.objective()),
                source_.objectiveSense() == ObjectiveSense::Minimize ? GRB_MINIMIZE : GRB_MAXIMIZE);
        }

        void beforeOptimize() override {
            if (monitor_.active())
                model().setCallback(&monitor_);
        }

    private:
        GRBLinExpr toExpr(const LinearExpr& e) const {
            GRBLinExpr expr = e.constant();
            for (const Term& t : e.terms())
                expr += t.coef * columns_.at(t.var.index);
            return expr;
        }

        const LinearModel& source_;
        const SolverOptions& options_;
        SolveMonitor monitor_;
        std::vector<GRBVar> columns_;
    };

    // =============================================================================
    // SOLVER
    // =============================================================================

    /**
     * @class GurobiSolver
     * @brief grocery::Solver backed by Gurobi branch-and-bound
     */
    class GurobiSolver : public Solver {
    public:
        GurobiSolver() = default;

        explicit GurobiSolver(SolverOptions options)
            : options_(std::move(options))
        {
        }

        const SolverOptions& options() const noexcept { return options_; }

        std::string name() const override { return "gurobi"; }

        /**
         * @brief Translate, optimise once and collect the result
         * @throws SolverError wrapping any GRBException (licence, API, callback)
         */
        SolveResult solve(const LinearModel& model) const override {
            try {
                LinearModelTranslator builder(model, options_);
                builder.optimize();

                SolveResult result;
                const int code = builder.status();
                result.status = toSolveStatus(code);
                result.backendStatus = gurobiStatusString(code);
                result.runtime = builder.runtime();
                result.nodeCount = builder.nodeCount();
                result.params = builder.store();

                if (result.status == SolveStatus::Optimal) {
                    result.objective = builder.objVal();
                    result.mipGap = builder.mipGap();
                    result.values = builder.columnValues();
                }
                return result;
            }
            catch (GRBException& e) {
                throw SolverError(e.getErrorCode(),
                    "GurobiSolver: " + e.getMessage());
            }
        }

    private:
        SolverOptions options_;
    };

} // namespace grocery
