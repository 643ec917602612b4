#pragma once
/*
===============================================================================
LINEAR MODEL — Backend-neutral mixed-integer linear program
===============================================================================

OVERVIEW
--------
The model builder describes the weekly purchase MILP with the types in this
header instead of a particular solver's API. A Solver implementation (see
solver.h, gurobi_solver.h) translates a LinearModel into its native form, so
the builder never changes when the backend does.

KEY COMPONENTS
--------------
• VarType, Sense, ObjectiveSense    variable domains and row senses
• Var                               handle to a model column (position)
• LinearExpr                        sum of coef * var plus a constant
• LinearConstraint                  expr (<=|>=|==) rhs, built by operators
• LinearModel                       ordered columns, rows and one objective

CONCEPTUAL MODEL
----------------
    Var x = model.addVar(0, 10, VarType::Integer, "buy_0_Rice");
    Var y = model.addVar(0, 1,  VarType::Binary,  "has_0_Grains");

    model.addConstr(2.5 * x + 40.0 >= 120.0, "kcal_floor");
    model.addConstr(LinearExpr(x) >= y, "presence");
    model.setObjective(1.99 * x, ObjectiveSense::Minimize);

Constants on the left-hand side are kept in the expression; backends fold
them into the right-hand side (or accept them natively).

DESIGN NOTES
------------
• Column and row order equals insertion order. Identical build sequences
  therefore give structurally identical models.
• Expressions keep terms in insertion order and never merge duplicates;
  backends sum repeated columns, which is the standard LP convention.
• Var handles are plain positions and are only meaningful for the model that
  created them.

THREAD SAFETY
-------------
• A LinearModel is an ordinary value; distinct requests use distinct models.

===============================================================================
*/

#include <cstddef>
#include <format>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace grocery {

    enum class VarType { Continuous, Integer, Binary };
    enum class Sense { LessEqual, GreaterEqual, Equal };
    enum class ObjectiveSense { Minimize, Maximize };

    inline constexpr double kInfinity = std::numeric_limits<double>::infinity();

    /**
     * @struct Var
     * @brief Handle to a column of a LinearModel
     */
    struct Var {
        std::size_t index = 0;

        friend bool operator==(const Var&, const Var&) = default;
    };

    struct Term {
        Var var;
        double coef = 0.0;
    };

    /**
     * @class LinearExpr
     * @brief Linear combination of columns plus a constant
     */
    class LinearExpr {
    public:
        LinearExpr() = default;
        LinearExpr(double constant) : constant_(constant) {}
        LinearExpr(Var v) { terms_.push_back(Term{ v, 1.0 }); }
        LinearExpr(Var v, double coef) { terms_.push_back(Term{ v, coef }); }

        LinearExpr& operator+=(const LinearExpr& rhs) {
            terms_.insert(terms_.end(), rhs.terms_.begin(), rhs.terms_.end());
            constant_ += rhs.constant_;
            return *this;
        }

        LinearExpr& operator-=(const LinearExpr& rhs) {
            for (const auto& t : rhs.terms_)
                terms_.push_back(Term{ t.var, -t.coef });
            constant_ -= rhs.constant_;
            return *this;
        }

        LinearExpr& operator*=(double factor) {
            for (auto& t : terms_)
                t.coef *= factor;
            constant_ *= factor;
            return *this;
        }

        const std::vector<Term>& terms() const noexcept { return terms_; }
        double constant() const noexcept { return constant_; }
        std::size_t size() const noexcept { return terms_.size(); }

        /**
         * @brief Value of the expression for a full column assignment
         * @throws std::out_of_range if a term refers past values.size()
         */
        double evaluate(std::span<const double> values) const {
            double total = constant_;
            for (const auto& t : terms_) {
                if (t.var.index >= values.size()) {
                    throw std::out_of_range(
                        std::format("LinearExpr::evaluate: column {} >= {}", t.var.index, values.size()));
                }
                total += t.coef * values[t.var.index];
            }
            return total;
        }

    private:
        std::vector<Term> terms_;
        double constant_ = 0.0;
    };

    inline LinearExpr operator*(double coef, Var v) { return LinearExpr(v, coef); }
    inline LinearExpr operator*(Var v, double coef) { return LinearExpr(v, coef); }
    inline LinearExpr operator*(double coef, LinearExpr e) { e *= coef; return e; }

    inline LinearExpr operator+(LinearExpr lhs, const LinearExpr& rhs) { lhs += rhs; return lhs; }
    inline LinearExpr operator-(LinearExpr lhs, const LinearExpr& rhs) { lhs -= rhs; return lhs; }

    /**
     * @struct LinearConstraint
     * @brief Unnamed row produced by comparing two expressions
     *
     * @details Normalised so that all columns are on the left:
     *          (lhs - rhs) sense 0 is stored as expr sense rhs, with the
     *          right-hand constant moved across.
     */
    struct LinearConstraint {
        LinearExpr expr;
        Sense sense = Sense::GreaterEqual;
        double rhs = 0.0;
    };

    namespace model_detail {

        inline LinearConstraint compare(LinearExpr lhs, const LinearExpr& rhs, Sense sense) {
            lhs -= rhs;
            LinearConstraint c;
            c.rhs = -lhs.constant();
            lhs -= LinearExpr(lhs.constant());
            c.expr = std::move(lhs);
            c.sense = sense;
            return c;
        }

    } // namespace model_detail

    inline LinearConstraint operator>=(const LinearExpr& lhs, const LinearExpr& rhs) {
        return model_detail::compare(lhs, rhs, Sense::GreaterEqual);
    }

    inline LinearConstraint operator<=(const LinearExpr& lhs, const LinearExpr& rhs) {
        return model_detail::compare(lhs, rhs, Sense::LessEqual);
    }

    inline LinearConstraint operator==(const LinearExpr& lhs, const LinearExpr& rhs) {
        return model_detail::compare(lhs, rhs, Sense::Equal);
    }

    struct VariableDef {
        std::string name;
        VarType type = VarType::Continuous;
        double lb = 0.0;
        double ub = kInfinity;
    };

    struct ConstraintDef {
        std::string name;
        LinearExpr expr;
        Sense sense = Sense::GreaterEqual;
        double rhs = 0.0;

        /// @brief Signed violation for a column assignment; 0 when satisfied
        double violation(std::span<const double> values) const {
            const double lhs = expr.evaluate(values);
            switch (sense) {
                case Sense::LessEqual:    return lhs > rhs ? lhs - rhs : 0.0;
                case Sense::GreaterEqual: return lhs < rhs ? rhs - lhs : 0.0;
                case Sense::Equal:        return lhs > rhs ? lhs - rhs : rhs - lhs;
            }
            return 0.0;
        }
    };

    /**
     * @class LinearModel
     * @brief Ordered set of columns and rows with a single linear objective
     */
    class LinearModel {
    public:
        explicit LinearModel(std::string name = "model")
            : name_(std::move(name))
        {
        }

        /**
         * @brief Append a column
         * @throws std::invalid_argument if lb > ub, or binary bounds leave [0, 1]
         */
        Var addVar(double lb, double ub, VarType type, std::string name) {
            if (lb > ub) {
                throw std::invalid_argument(
                    std::format("LinearModel::addVar: lb {} > ub {} for '{}'", lb, ub, name));
            }
            if (type == VarType::Binary && (lb < 0.0 || ub > 1.0)) {
                throw std::invalid_argument(
                    std::format("LinearModel::addVar: binary '{}' must lie in [0, 1]", name));
            }
            vars_.push_back(VariableDef{ std::move(name), type, lb, ub });
            return Var{ vars_.size() - 1 };
        }

        /**
         * @brief Append a row
         * @return Row position
         * @throws std::out_of_range if the row refers to an unknown column
         */
        std::size_t addConstr(LinearConstraint c, std::string name) {
            for (const auto& t : c.expr.terms()) {
                if (t.var.index >= vars_.size()) {
                    throw std::out_of_range(
                        std::format("LinearModel::addConstr: column {} >= {} in '{}'",
                            t.var.index, vars_.size(), name));
                }
            }
            constrs_.push_back(ConstraintDef{ std::move(name), std::move(c.expr), c.sense, c.rhs });
            return constrs_.size() - 1;
        }

        void setObjective(LinearExpr expr, ObjectiveSense sense) {
            objective_ = std::move(expr);
            objectiveSense_ = sense;
        }

        void minimize(LinearExpr expr) { setObjective(std::move(expr), ObjectiveSense::Minimize); }
        void maximize(LinearExpr expr) { setObjective(std::move(expr), ObjectiveSense::Maximize); }

        const std::string& name() const noexcept { return name_; }
        const std::vector<VariableDef>& vars() const noexcept { return vars_; }
        const std::vector<ConstraintDef>& constraints() const noexcept { return constrs_; }
        const LinearExpr& objective() const noexcept { return objective_; }
        ObjectiveSense objectiveSense() const noexcept { return objectiveSense_; }

        std::size_t numVars() const noexcept { return vars_.size(); }
        std::size_t numConstrs() const noexcept { return constrs_.size(); }

        const VariableDef& var(Var v) const { return vars_.at(v.index); }

    private:
        std::string name_;
        std::vector<VariableDef> vars_;
        std::vector<ConstraintDef> constrs_;
        LinearExpr objective_;
        ObjectiveSense objectiveSense_ = ObjectiveSense::Minimize;
    };

} // namespace grocery
