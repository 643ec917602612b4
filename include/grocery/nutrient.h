#pragma once
/*
===============================================================================
NUTRIENT — The nutrient axis shared by requirements, catalog and coverage
===============================================================================

The planner tracks four macronutrient floors. NutrientVector holds one amount
per nutrient; kilocalories for Calories, grams for the others.

===============================================================================
*/

#include <string_view>

#include "enum_utils.h"

namespace grocery {

    DECLARE_ENUM_WITH_COUNT(Nutrient, Calories, Protein, Carbohydrate, Fat);

    using NutrientVector = EnumArray<Nutrient, double>;

    /// @brief Requirements are stated per day and planned per week
    inline constexpr int kDaysPerWeek = 7;

    inline std::string_view toString(Nutrient n) {
        switch (n) {
            case Nutrient::Calories:     return "Calories";
            case Nutrient::Protein:      return "Protein";
            case Nutrient::Carbohydrate: return "Carbohydrate";
            case Nutrient::Fat:          return "Fat";
            case Nutrient::COUNT:        break;
        }
        return "Unknown";
    }

    /// @brief Unit label used when printing amounts
    inline std::string_view unitOf(Nutrient n) {
        return n == Nutrient::Calories ? "kcal" : "g";
    }

    inline NutrientVector scaled(const NutrientVector& v, double factor) {
        NutrientVector out{};
        forEachEnum<Nutrient>([&](Nutrient n) { out[n] = v[n] * factor; });
        return out;
    }

    inline NutrientVector& operator+=(NutrientVector& lhs, const NutrientVector& rhs) {
        forEachEnum<Nutrient>([&](Nutrient n) { lhs[n] += rhs[n]; });
        return lhs;
    }

} // namespace grocery
