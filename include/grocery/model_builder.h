#pragma once
/*
===============================================================================
MODEL BUILDER — Weekly purchase MILP from catalog and aggregate requirement
===============================================================================

Overview
--------
PlanModelBuilder turns one joined Catalog and one AggregateRequirement into a
backend-neutral LinearModel:

    buy[p]   integer, 0 <= buy[p] <= max_quantity(p)     one per package
    has[c]   binary                                      one per category

    minimize   sum_p price(p) * buy[p]

    nutrient floor (per nutrient n):
        sum_p n(p) * buy[p] + sum_p n(p) * stock_lb(p) >= weekly_floor(n)

    category presence (per category c):
        sum_{p in c} buy[p] + stocked(c) >= has[c]

    diversity rows (per category c, depending on DiversityMode):
        IndicatorOnly      nothing more
        RequireIndicator   has[c] == 1
        AtLeastOneItem     sum_{p in c} buy[p] + stocked(c) >= 1
                           (no has[c] columns, no presence rows)

stocked(c) counts the packages of c with stock > 0. The binary domain of
has[c] already encodes has[c] <= 1, so no separate cap row is emitted.

It follows the template-method workflow:

    build() {
        initialize();
        addVariables();
        addConstraints();
        addObjective();
        return model;
    }

Determinism
-----------
Columns are created in catalog order, then categories in first-appearance
order; rows follow nutrient enum order, then category order. Identical
inputs therefore give structurally identical models.

Typical Usage
-------------
    PlanModelBuilder builder(catalog, requirement, DiversityMode::RequireIndicator);
    const LinearModel& model = builder.build();
    Var firstBuy = builder.variables().var(PlanVars::Buy, 0);

===============================================================================
*/

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "catalog.h"
#include "enum_utils.h"
#include "expressions.h"
#include "household.h"
#include "linear_model.h"
#include "model_tables.h"
#include "naming.h"
#include "nutrient.h"

namespace grocery {

    DECLARE_ENUM_WITH_COUNT(PlanVars, Buy, HasCategory);
    DECLARE_ENUM_WITH_COUNT(PlanCons, NutrientFloor, CategoryPresence, CategoryRequired);

    /// @brief How strongly each food-basket category must be represented
    enum class DiversityMode {
        IndicatorOnly,      ///< presence row only; has[c] may stay 0
        RequireIndicator,   ///< presence row plus has[c] == 1
        AtLeastOneItem      ///< one bought or stocked item per category, no indicator
    };

    inline std::string_view toString(DiversityMode m) {
        switch (m) {
            case DiversityMode::IndicatorOnly:    return "IndicatorOnly";
            case DiversityMode::RequireIndicator: return "RequireIndicator";
            case DiversityMode::AtLeastOneItem:   return "AtLeastOneItem";
        }
        return "Unknown";
    }

    /**
     * @class PlanModelBuilder
     * @brief Builds the weekly purchase MILP for one request
     *
     * @details The builder keeps references to its inputs; both must outlive
     *          it. build() runs once; later calls return the same model.
     */
    class PlanModelBuilder {
    public:
        using VarTable = VariableTable<PlanVars>;
        using ConTable = ConstraintTable<PlanCons>;

        PlanModelBuilder(const Catalog& catalog,
            const AggregateRequirement& requirement,
            DiversityMode diversity = DiversityMode::RequireIndicator)
            : catalog_(catalog), requirement_(requirement), diversity_(diversity),
            model_("weekly_grocery_plan")
        {
        }

        virtual ~PlanModelBuilder() = default;

        PlanModelBuilder(const PlanModelBuilder&) = delete;
        PlanModelBuilder& operator=(const PlanModelBuilder&) = delete;

        /// @brief Runs the build hooks once and returns the finished model
        const LinearModel& build() {
            if (built_)
                return model_;

            initialize();
            addVariables();
            addConstraints();
            addObjective();

            built_ = true;
            return model_;
        }

        const LinearModel& model() const noexcept { return model_; }
        const VarTable& variables() const noexcept { return vars_; }
        const ConTable& constraints() const noexcept { return cons_; }

        const Catalog& catalog() const noexcept { return catalog_; }
        const AggregateRequirement& requirement() const noexcept { return requirement_; }
        DiversityMode diversity() const noexcept { return diversity_; }

        /// @brief Categories in the order their rows and columns were created
        const std::vector<std::string>& categories() const noexcept { return categories_; }

    protected:
        virtual void initialize() {
            categories_ = catalog_.categories();
            members_.clear();
            stocked_.clear();
            for (const auto& c : categories_) {
                std::vector<std::size_t> positions = catalog_.inCategory(c);
                int count = 0;
                for (std::size_t p : positions) {
                    if (catalog_.at(p).inStock())
                        ++count;
                }
                members_.push_back(std::move(positions));
                stocked_.push_back(count);
            }
        }

        virtual void addVariables() {
            VariableBlock buy;
            for (std::size_t p = 0; p < catalog_.size(); ++p) {
                const FoodPackage& pkg = catalog_.at(p);
                buy.push_back(model_.addVar(0.0, static_cast<double>(pkg.maxQuantity),
                    VarType::Integer, name::index("buy", p, pkg.packageDescription)));
            }
            vars_.set(PlanVars::Buy, std::move(buy));

            VariableBlock has;
            if (diversity_ != DiversityMode::AtLeastOneItem) {
                for (std::size_t c = 0; c < categories_.size(); ++c) {
                    has.push_back(model_.addVar(0.0, 1.0, VarType::Binary,
                        name::index("has", c, categories_[c])));
                }
            }
            vars_.set(PlanVars::HasCategory, std::move(has));
        }

        virtual void addConstraints() {
            addNutrientFloors();
            addDiversity();
        }

        virtual void addObjective() {
            const VariableBlock& buy = vars_(PlanVars::Buy);
            model_.minimize(sum(range(0, catalog_.size()),
                [&](std::size_t p) { return catalog_.at(p).price * buy(p); }));
        }

        void addNutrientFloors() {
            const VariableBlock& buy = vars_(PlanVars::Buy);
            const NutrientVector onHand = catalog_.stockContribution();

            ConstraintBlock rows;
            forEachEnum<Nutrient>([&](Nutrient n) {
                LinearExpr lhs = sum(range(0, catalog_.size()),
                    [&](std::size_t p) { return catalog_.at(p).nutrients[n] * buy(p); });
                lhs += LinearExpr(onHand[n]);

                rows.push_back(model_.addConstr(lhs >= requirement_.weeklyFloor(n),
                    name::index("nutrient_floor", enum_index(n), toString(n))));
            });
            cons_.set(PlanCons::NutrientFloor, std::move(rows));
        }

        void addDiversity() {
            const VariableBlock& buy = vars_(PlanVars::Buy);
            const VariableBlock& has = vars_(PlanVars::HasCategory);

            ConstraintBlock presence;
            ConstraintBlock required;

            for (std::size_t c = 0; c < categories_.size(); ++c) {
                LinearExpr covered = sum(members_[c], buy);
                covered += LinearExpr(static_cast<double>(stocked_[c]));

                switch (diversity_) {
                    case DiversityMode::IndicatorOnly:
                    case DiversityMode::RequireIndicator:
                        presence.push_back(model_.addConstr(covered >= has(c),
                            name::index("presence", c, categories_[c])));
                        if (diversity_ == DiversityMode::RequireIndicator) {
                            required.push_back(model_.addConstr(LinearExpr(has(c)) == 1.0,
                                name::index("required", c, categories_[c])));
                        }
                        break;
                    case DiversityMode::AtLeastOneItem:
                        required.push_back(model_.addConstr(covered >= 1.0,
                            name::index("required", c, categories_[c])));
                        break;
                }
            }

            cons_.set(PlanCons::CategoryPresence, std::move(presence));
            cons_.set(PlanCons::CategoryRequired, std::move(required));
        }

        const Catalog& catalog_;
        const AggregateRequirement& requirement_;
        DiversityMode diversity_;

        LinearModel model_;
        VarTable vars_;
        ConTable cons_;

        std::vector<std::string> categories_;
        std::vector<std::vector<std::size_t>> members_;   ///< package positions per category
        std::vector<int> stocked_;                        ///< stocked packages per category

    private:
        bool built_ = false;
    };

} // namespace grocery
