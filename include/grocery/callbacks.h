#pragma once
/*
===============================================================================
CALLBACKS — Gurobi solve monitor feeding the planner's log and progress sinks
===============================================================================

Overview
--------
The planner library never prints. While Gurobi runs, SolveMonitor receives
the solver's callback events and forwards them:

    GRB_CB_MESSAGE  -> SolverOptions::logSink(line)      (trailing '\n' removed)
    GRB_CB_MIP      -> SolverOptions::progressSink(Progress)

A monitor is only installed when at least one sink is set, so a plain solve
pays nothing for it.

Exception Safety
----------------
• A sink that throws aborts the optimisation: the exception is converted to a
  GRBException(GRB_ERROR_CALLBACK), which Gurobi propagates out of optimize()
  and GurobiSolver reports as SolverError.

Thread Safety
-------------
• Gurobi invokes callbacks from its own threads; sinks must synchronise any
  shared state they touch.

===============================================================================
*/

#include <exception>
#include <string>
#include <utility>

#include "gurobi_c++.h"
#include "solver.h"

namespace grocery {

    /**
     * @class SolveMonitor
     * @brief GRBCallback that dispatches to LogSink / ProgressSink
     */
    class SolveMonitor : public GRBCallback {
    public:
        SolveMonitor(LogSink logSink, ProgressSink progressSink)
            : logSink_(std::move(logSink)), progressSink_(std::move(progressSink))
        {
        }

        bool active() const noexcept {
            return static_cast<bool>(logSink_) || static_cast<bool>(progressSink_);
        }

    protected:
        void callback() override {
            try {
                switch (where) {
                    case GRB_CB_MESSAGE:
                        if (logSink_)
                            onMessage(getStringInfo(GRB_CB_MSG_STRING));
                        break;
                    case GRB_CB_MIP:
                        if (progressSink_)
                            progressSink_(progress());
                        break;
                    default:
                        break;
                }
            }
            catch (GRBException&) {
                throw;
            }
            catch (std::exception& e) {
                throw GRBException(e.what(), GRB_ERROR_CALLBACK);
            }
        }

    private:
        void onMessage(std::string line) {
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
                line.pop_back();
            if (line.empty())
                return;
            logSink_(line);
        }

        /// @brief Progress snapshot; only valid where == GRB_CB_MIP
        Progress progress() {
            Progress p;
            p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
            p.incumbent = getDoubleInfo(GRB_CB_MIP_OBJBST);
            p.bound = getDoubleInfo(GRB_CB_MIP_OBJBND);
            p.nodeCount = getDoubleInfo(GRB_CB_MIP_NODCNT);
            p.solutionCount = getIntInfo(GRB_CB_MIP_SOLCNT);
            if (p.solutionCount == 0)
                p.incumbent = kInfinity;
            return p;
        }

        LogSink logSink_;
        ProgressSink progressSink_;
    };

} // namespace grocery
