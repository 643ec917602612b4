#pragma once
/*
===============================================================================
NAMING — Solver-safe symbolic names for planner variables and constraints
===============================================================================

OVERVIEW
--------
Catalog keys (package descriptions, food-basket labels) are free text such as
"Chicken Breast, Boneless (3 lb)" or "Fats, Nuts & Seeds". Solver backends and
LP/MPS exports want plain identifiers. This header turns free text into such
identifiers and composes them with decision-kind prefixes and positions.

CONVENTIONS
-----------
• sanitize():  ' ' -> '_', ',' '(' ')' dropped, '&' -> "and"
               other characters outside [A-Za-z0-9_.-] -> '_'
• index():     base_3 or base_3_label            (identifier style)
               labels are cut to kMaxLabelLength characters, which
               keeps names under Gurobi's 255-character limit

Sanitising is not injective ("a b" and "a_b" collide), so every generated
model name carries the position index as well as the sanitised label.

USAGE EXAMPLES
--------------
    name::sanitize("Fats, Nuts & Seeds");     // "Fats_Nuts_and_Seeds"
    name::index("buy", 4, "Rice (5 lb)");     // "buy_4_Rice_5_lb"

THREAD SAFETY
-------------
• Pure functions; no shared state

===============================================================================
*/

#include <concepts>
#include <cstddef>
#include <format>
#include <string>
#include <string_view>

namespace grocery::name {

    /// @brief Longest sanitised label index() appends
    inline constexpr std::size_t kMaxLabelLength = 200;

    namespace naming_detail {

        inline bool is_identifier_char(char c) noexcept {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
        }

    } // namespace naming_detail

    /**
     * @brief Converts free text into a solver-safe identifier fragment
     *
     * @param text Arbitrary label (package description, category, ...)
     * @return Sanitised fragment; runs of '_' are collapsed and leading or
     *         trailing '_' removed. Empty input yields an empty string.
     */
    inline std::string sanitize(std::string_view text) {
        std::string out;
        out.reserve(text.size() + 4);

        auto push_underscore = [&out] {
            if (!out.empty() && out.back() != '_')
                out.push_back('_');
        };

        for (char c : text) {
            switch (c) {
                case ',':
                case '(':
                case ')':
                    break;
                case '&':
                    out.append("and");
                    break;
                case ' ':
                    push_underscore();
                    break;
                default:
                    if (naming_detail::is_identifier_char(c)) {
                        if (c == '_')
                            push_underscore();
                        else
                            out.push_back(c);
                    }
                    else {
                        push_underscore();
                    }
                    break;
            }
        }

        while (!out.empty() && out.back() == '_')
            out.pop_back();

        return out;
    }

    /// @brief "base_i"
    template<std::integral I>
    inline std::string index(std::string_view base, I i) {
        return std::format("{}_{}", base, static_cast<long long>(i));
    }

    /// @brief "base_i_<sanitised label>", or "base_i" when the label sanitises to nothing
    template<std::integral I>
    inline std::string index(std::string_view base, I i, std::string_view label) {
        std::string clean = sanitize(label);
        if (clean.size() > kMaxLabelLength) {
            clean.resize(kMaxLabelLength);
            while (!clean.empty() && clean.back() == '_')
                clean.pop_back();
        }
        if (clean.empty())
            return index(base, i);
        return std::format("{}_{}_{}", base, static_cast<long long>(i), clean);
    }

} // namespace grocery::name
