#pragma once
/*
===============================================================================
CATALOG — Joins cost, nutrition and stock tables into one package record set
===============================================================================

OVERVIEW
--------
The planner consumes three parsed tables:

    cost       {Food, Package Description, Store, price, lb}
    nutrition  {Food, kcal, Protein, Carbs, Fat, Food Basket, Max_quantity}
    stock      {Package Description, Quantity_in_Stock_lb}

joinCatalog() merges them into a Catalog of FoodPackage records, one per
package description, in cost-table order:

    cost  ⋈ nutrition   on Food                 (inner join)
    ...   ⟕ stock       on Package Description  (left join, missing -> 0 lb)

The package description is the sole key the model builder and result
extractor use to name and look up decision variables, so it must be unique.

FAILURE POLICY
--------------
• Empty cost or nutrition table            -> ConfigurationError(MissingTable)
• Duplicate package description (cost)     -> ConfigurationError(DuplicatePackage)
• Duplicate Food (nutrition)               -> ConfigurationError(DuplicateFood)
• Duplicate package description (stock)    -> ConfigurationError(DuplicateStockEntry)
• Negative price / nutrient / max quantity,
  non-positive weight, negative stock      -> ConfigurationError(InvalidRecord)
• Cost row whose Food has no nutrition row -> DroppedCostRow warning
• Stock row naming no joined package       -> UnknownStockEntry warning

USAGE EXAMPLES
--------------
    CatalogTables tables{ costRows, nutritionRows, stockRows };
    CatalogJoin joined = joinCatalog(tables);

    for (const FoodPackage& p : joined.catalog.packages()) { ... }
    for (const auto& w : joined.warnings) { log(w.message); }

THREAD SAFETY
-------------
• A Catalog is an immutable snapshot once constructed; concurrent const
  access from several planning requests is safe.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "errors.h"
#include "nutrient.h"

namespace grocery {

    // ========================================================================
    // INPUT ROWS
    // ========================================================================

    struct CostRow {
        std::string food;
        std::string packageDescription;
        std::string store;
        double price = 0.0;      ///< currency per package, >= 0
        double weightLb = 0.0;   ///< pounds per package, > 0
    };

    struct NutritionRow {
        std::string food;
        NutrientVector perPackage{};  ///< kcal, g protein, g carbohydrate, g fat
        std::string category;         ///< Food Basket label
        int maxQuantity = 0;          ///< purchasable packages per week, >= 0
    };

    struct StockRow {
        std::string packageDescription;
        double quantityLb = 0.0;      ///< >= 0
    };

    /// @brief The three input tables of one planning request
    struct CatalogTables {
        std::vector<CostRow> cost;
        std::vector<NutritionRow> nutrition;
        std::vector<StockRow> stock;
    };

    // ========================================================================
    // JOINED RECORD
    // ========================================================================

    /**
     * @struct FoodPackage
     * @brief One purchasable package with its nutrition and current stock
     */
    struct FoodPackage {
        std::string food;
        std::string packageDescription;
        std::string store;
        double price = 0.0;
        double weightLb = 0.0;
        NutrientVector nutrients{};
        std::string category;
        int maxQuantity = 0;
        double stockLb = 0.0;

        bool inStock() const noexcept { return stockLb > 0.0; }
    };

    /**
     * @class Catalog
     * @brief Ordered, key-unique set of FoodPackage records
     *
     * @details Order is significant: the model builder creates one decision
     *          variable per package in this order, which keeps models and
     *          solver behaviour reproducible for identical inputs.
     */
    class Catalog {
    public:
        Catalog() = default;

        /// @throws ConfigurationError(DuplicatePackage) on a repeated description
        explicit Catalog(std::vector<FoodPackage> packages)
            : packages_(std::move(packages))
        {
            index_.reserve(packages_.size());
            for (std::size_t i = 0; i < packages_.size(); ++i) {
                const FoodPackage& p = packages_[i];
                if (!index_.emplace(p.packageDescription, i).second) {
                    throw ConfigurationError(ConfigurationError::Kind::DuplicatePackage,
                        p.packageDescription,
                        std::format("Catalog: duplicate package description '{}'",
                            p.packageDescription));
                }
                if (std::find(categories_.begin(), categories_.end(), p.category) == categories_.end())
                    categories_.push_back(p.category);
            }
        }

        std::span<const FoodPackage> packages() const noexcept { return packages_; }
        std::size_t size() const noexcept { return packages_.size(); }
        bool empty() const noexcept { return packages_.empty(); }

        /// @throws std::out_of_range if i >= size()
        const FoodPackage& at(std::size_t i) const { return packages_.at(i); }

        const FoodPackage* find(std::string_view description) const {
            auto pos = indexOf(description);
            return pos ? &packages_[*pos] : nullptr;
        }

        std::optional<std::size_t> indexOf(std::string_view description) const {
            auto it = index_.find(std::string(description));
            if (it == index_.end())
                return std::nullopt;
            return it->second;
        }

        /// @brief Distinct Food Basket labels, in order of first appearance
        const std::vector<std::string>& categories() const noexcept { return categories_; }

        /// @brief Package positions belonging to a category, in catalog order
        std::vector<std::size_t> inCategory(std::string_view category) const {
            std::vector<std::size_t> out;
            for (std::size_t i = 0; i < packages_.size(); ++i) {
                if (packages_[i].category == category)
                    out.push_back(i);
            }
            return out;
        }

        /// @brief Number of packages with a strictly positive stock level
        std::size_t stockedItems() const {
            return static_cast<std::size_t>(std::count_if(packages_.begin(), packages_.end(),
                [](const FoodPackage& p) { return p.inStock(); }));
        }

        /// @brief Nutrients already on hand: sum of nutrients * stock_lb
        NutrientVector stockContribution() const {
            NutrientVector total{};
            for (const auto& p : packages_)
                total += scaled(p.nutrients, p.stockLb);
            return total;
        }

    private:
        std::vector<FoodPackage> packages_;
        std::unordered_map<std::string, std::size_t> index_;
        std::vector<std::string> categories_;
    };

    struct CatalogJoin {
        Catalog catalog;
        WarningList warnings;
    };

    // ========================================================================
    // JOIN
    // ========================================================================

    namespace catalog_detail {

        inline void invalid(const std::string& key, const std::string& message) {
            throw ConfigurationError(ConfigurationError::Kind::InvalidRecord, key, message);
        }

        inline void validate(const CostRow& r) {
            if (!std::isfinite(r.price) || r.price < 0.0)
                invalid(r.packageDescription,
                    std::format("joinCatalog: price must be finite and >= 0 for '{}'", r.packageDescription));
            if (!std::isfinite(r.weightLb) || !(r.weightLb > 0.0))
                invalid(r.packageDescription,
                    std::format("joinCatalog: package weight must be positive for '{}'", r.packageDescription));
        }

        inline void validate(const NutritionRow& r) {
            if (r.maxQuantity < 0)
                invalid(r.food, std::format("joinCatalog: negative Max_quantity for '{}'", r.food));
            forEachEnum<Nutrient>([&](Nutrient n) {
                if (!std::isfinite(r.perPackage[n]) || r.perPackage[n] < 0.0)
                    invalid(r.food, std::format("joinCatalog: {} must be finite and >= 0 for '{}'", toString(n), r.food));
            });
        }

        inline void validate(const StockRow& r) {
            if (!std::isfinite(r.quantityLb) || r.quantityLb < 0.0)
                invalid(r.packageDescription,
                    std::format("joinCatalog: stock must be finite and >= 0 for '{}'", r.packageDescription));
        }

    } // namespace catalog_detail

    /**
     * @brief Joins cost, nutrition and stock rows into a Catalog
     *
     * @param cost      Cost table; must be non-empty with unique descriptions
     * @param nutrition Nutrition table; must be non-empty with unique Food
     * @param stock     Stock table; may be empty (all packages at 0 lb)
     * @return Joined catalog plus data-quality warnings
     *
     * @throws ConfigurationError as listed in the header overview
     * @complexity O(|cost| + |nutrition| + |stock|) expected
     */
    inline CatalogJoin joinCatalog(
        std::span<const CostRow> cost,
        std::span<const NutritionRow> nutrition,
        std::span<const StockRow> stock)
    {
        using Kind = ConfigurationError::Kind;

        if (cost.empty())
            throw ConfigurationError(Kind::MissingTable, "cost", "joinCatalog: cost table is empty");
        if (nutrition.empty())
            throw ConfigurationError(Kind::MissingTable, "nutrition", "joinCatalog: nutrition table is empty");

        // Keys first, so a duplicate is reported before anything else.
        std::unordered_map<std::string_view, std::size_t> seen;
        for (const auto& row : cost) {
            if (!seen.emplace(row.packageDescription, 0).second) {
                throw ConfigurationError(Kind::DuplicatePackage, row.packageDescription,
                    std::format("joinCatalog: duplicate package description '{}' in cost table",
                        row.packageDescription));
            }
            catalog_detail::validate(row);
        }

        std::unordered_map<std::string_view, const NutritionRow*> byFood;
        for (const auto& row : nutrition) {
            catalog_detail::validate(row);
            if (!byFood.emplace(row.food, &row).second) {
                throw ConfigurationError(Kind::DuplicateFood, row.food,
                    std::format("joinCatalog: duplicate Food '{}' in nutrition table", row.food));
            }
        }

        std::unordered_map<std::string_view, double> stockByPackage;
        for (const auto& row : stock) {
            catalog_detail::validate(row);
            if (!stockByPackage.emplace(row.packageDescription, row.quantityLb).second) {
                throw ConfigurationError(Kind::DuplicateStockEntry, row.packageDescription,
                    std::format("joinCatalog: duplicate stock entry for '{}'", row.packageDescription));
            }
        }

        CatalogJoin result;
        std::vector<FoodPackage> packages;
        packages.reserve(cost.size());

        for (const auto& c : cost) {
            auto n = byFood.find(c.food);
            if (n == byFood.end()) {
                result.warnings.push_back(DataQualityWarning{
                    DataQualityWarning::Kind::DroppedCostRow,
                    c.packageDescription,
                    std::format("cost row '{}' dropped: no nutrition row for food '{}'",
                        c.packageDescription, c.food) });
                continue;
            }

            FoodPackage p;
            p.food = c.food;
            p.packageDescription = c.packageDescription;
            p.store = c.store;
            p.price = c.price;
            p.weightLb = c.weightLb;
            p.nutrients = n->second->perPackage;
            p.category = n->second->category;
            p.maxQuantity = n->second->maxQuantity;

            auto s = stockByPackage.find(c.packageDescription);
            if (s != stockByPackage.end()) {
                p.stockLb = s->second;
                stockByPackage.erase(s);
            }

            packages.push_back(std::move(p));
        }

        // Whatever is left matched no joined package; report in input order.
        for (const auto& row : stock) {
            if (stockByPackage.contains(row.packageDescription)) {
                result.warnings.push_back(DataQualityWarning{
                    DataQualityWarning::Kind::UnknownStockEntry,
                    row.packageDescription,
                    std::format("stock entry '{}' matches no catalog package; ignored",
                        row.packageDescription) });
            }
        }

        result.catalog = Catalog(std::move(packages));
        return result;
    }

    inline CatalogJoin joinCatalog(const CatalogTables& tables) {
        return joinCatalog(tables.cost, tables.nutrition, tables.stock);
    }

} // namespace grocery
