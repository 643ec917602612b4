#pragma once
/*
===============================================================================
GROCERY — Umbrella header for the weekly grocery planner
===============================================================================

Includes the whole public interface, the Gurobi backend included:

    household.h         roster, requirement table, weekly floors
    catalog.h           cost / nutrition / stock join
    linear_model.h      backend-neutral MILP
    model_builder.h     weekly purchase model
    solver.h            Solver interface and options
    gurobi_solver.h     Gurobi implementation
    result_extractor.h  purchase plan by store
    diagnostics.h       statistics, solution quality, coverage
    planner.h           end-to-end request

Code that must build without Gurobi includes planner.h instead.

LICENSE
-------
See LICENSE file in repository root.

===============================================================================
*/

#include "enum_utils.h"
#include "naming.h"
#include "data_store.h"
#include "errors.h"
#include "nutrient.h"
#include "household.h"
#include "catalog.h"
#include "linear_model.h"
#include "model_tables.h"
#include "expressions.h"
#include "model_builder.h"
#include "solver.h"
#include "callbacks.h"
#include "gurobi_solver.h"
#include "result_extractor.h"
#include "diagnostics.h"
#include "planner.h"
