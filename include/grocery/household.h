#pragma once
/*
===============================================================================
HOUSEHOLD — Roster, requirement table and aggregate nutrient floors
===============================================================================

OVERVIEW
--------
Maps a household roster to the weekly nutrient floors the purchase plan must
cover. Each member is matched against a reference table of daily minimums keyed
by gender group and inclusive age range; the matched rows are summed and the
daily total is scaled by seven.

KEY COMPONENTS
--------------
• Gender, parseGender()        case-insensitive "male" / "female"
• HouseholdMember              {age >= 1, gender}; immutable once created
• Household                    request-scoped roster (add / remove / clear)
• NutrientRequirementRow       {group, min_age, max_age, daily minimums}
• RequirementTable             validated, range-indexed lookup
• AggregateRequirement         daily sum and weekly floor per nutrient
• resolveRequirements()        roster + table -> AggregateRequirement

MATCHING RULES
--------------
• A row matches when its group equals the member's gender (case-insensitive)
  and min_age <= age <= max_age.
• Overlapping ranges inside one group are rejected when the table is built,
  so at most one row can ever match.
• A member with no matching row contributes nothing and is reported as an
  UnmatchedMember warning; this never fails the request.
• An empty roster yields an all-zero requirement. Callers must not attempt to
  optimise in that case (WeeklyPlanner throws EmptyHousehold).

===============================================================================
*/

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <format>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "errors.h"
#include "nutrient.h"

namespace grocery {

    // ========================================================================
    // MEMBERS
    // ========================================================================

    enum class Gender { Male, Female };

    inline std::string_view toString(Gender g) {
        return g == Gender::Male ? "male" : "female";
    }

    namespace household_detail {

        inline std::string lowerCase(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

    } // namespace household_detail

    /**
     * @brief Parses a gender label, ignoring case
     * @throws ConfigurationError(InvalidRecord) for anything but male/female
     */
    inline Gender parseGender(std::string_view label) {
        const std::string key = household_detail::lowerCase(label);
        if (key == "male")
            return Gender::Male;
        if (key == "female")
            return Gender::Female;
        throw ConfigurationError(ConfigurationError::Kind::InvalidRecord, std::string(label),
            std::format("parseGender: unknown gender label '{}'", label));
    }

    /**
     * @class HouseholdMember
     * @brief One person in the household; immutable after construction
     */
    class HouseholdMember {
    public:
        /// @throws ConfigurationError(InvalidRecord) if age < 1
        HouseholdMember(int age, Gender gender)
            : age_(age), gender_(gender)
        {
            if (age < 1) {
                throw ConfigurationError(ConfigurationError::Kind::InvalidRecord,
                    std::to_string(age),
                    std::format("HouseholdMember: age must be a positive integer, got {}", age));
            }
        }

        int age() const noexcept { return age_; }
        Gender gender() const noexcept { return gender_; }

        friend bool operator==(const HouseholdMember&, const HouseholdMember&) = default;

    private:
        int age_;
        Gender gender_;
    };

    /**
     * @class Household
     * @brief Ordered roster of members for one planning request
     *
     * @details Members are never edited in place; remove and add instead.
     */
    class Household {
    public:
        Household() = default;

        explicit Household(std::vector<HouseholdMember> members)
            : members_(std::move(members))
        {
        }

        void add(HouseholdMember member) { members_.push_back(member); }

        void add(int age, Gender gender) { members_.emplace_back(age, gender); }

        /// @throws std::out_of_range if index >= size()
        void remove(std::size_t index) {
            if (index >= members_.size()) {
                throw std::out_of_range(
                    std::format("Household::remove: index {} >= {}", index, members_.size()));
            }
            members_.erase(members_.begin() + static_cast<std::ptrdiff_t>(index));
        }

        void clear() noexcept { members_.clear(); }

        std::span<const HouseholdMember> members() const noexcept { return members_; }
        std::size_t size() const noexcept { return members_.size(); }
        bool empty() const noexcept { return members_.empty(); }

    private:
        std::vector<HouseholdMember> members_;
    };

    // ========================================================================
    // REQUIREMENT TABLE
    // ========================================================================

    /**
     * @struct NutrientRequirementRow
     * @brief Daily minimums for one gender group and inclusive age range
     */
    struct NutrientRequirementRow {
        std::string group;              ///< Age_Sex_Group, e.g. "Male"
        int minAge = 0;
        int maxAge = 0;
        NutrientVector dailyMinimum{};  ///< kcal, g protein, g carbohydrate, g fat
    };

    /**
     * @class RequirementTable
     * @brief Validated reference table with range-indexed member lookup
     *
     * @details Rows are sorted by (lower-cased group, min_age). Because ranges
     *          within a group never overlap, the candidate for an age is the
     *          last row whose min_age <= age; a binary search finds it.
     */
    class RequirementTable {
    public:
        /**
         * @throws ConfigurationError(MissingTable) if rows is empty
         * @throws ConfigurationError(InvalidRecord) if min_age > max_age,
         *         min_age < 0, or any daily minimum is negative
         * @throws ConfigurationError(OverlappingRequirementRanges) if two rows
         *         of the same group share an age
         */
        explicit RequirementTable(std::vector<NutrientRequirementRow> rows) {
            if (rows.empty()) {
                throw ConfigurationError(ConfigurationError::Kind::MissingTable,
                    "requirements", "RequirementTable: requirement table is empty");
            }

            entries_.reserve(rows.size());
            for (auto& row : rows) {
                validate(row);
                std::string key = household_detail::lowerCase(row.group);
                entries_.push_back(Entry{ std::move(key), std::move(row) });
            }

            std::sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) {
                return std::tie(a.key, a.row.minAge) < std::tie(b.key, b.row.minAge);
            });

            for (std::size_t i = 1; i < entries_.size(); ++i) {
                const Entry& prev = entries_[i - 1];
                const Entry& next = entries_[i];
                if (prev.key == next.key && next.row.minAge <= prev.row.maxAge) {
                    throw ConfigurationError(ConfigurationError::Kind::OverlappingRequirementRanges,
                        next.row.group,
                        std::format("RequirementTable: group '{}' has overlapping ranges [{}, {}] and [{}, {}]",
                            next.row.group, prev.row.minAge, prev.row.maxAge,
                            next.row.minAge, next.row.maxAge));
                }
            }
        }

        /**
         * @brief Row matching the member, or nullptr if none does
         * @complexity O(log n)
         */
        const NutrientRequirementRow* match(const HouseholdMember& member) const {
            const std::string key(toString(member.gender()));
            const int age = member.age();

            auto it = std::upper_bound(entries_.begin(), entries_.end(), std::tie(key, age),
                [](const auto& probe, const Entry& e) {
                    return probe < std::tie(e.key, e.row.minAge);
                });

            if (it == entries_.begin())
                return nullptr;
            --it;
            if (it->key != key || age > it->row.maxAge)
                return nullptr;
            return &it->row;
        }

        std::size_t size() const noexcept { return entries_.size(); }

    private:
        struct Entry {
            std::string key;
            NutrientRequirementRow row;
        };

        static void validate(const NutrientRequirementRow& row) {
            if (row.minAge < 0 || row.minAge > row.maxAge) {
                throw ConfigurationError(ConfigurationError::Kind::InvalidRecord, row.group,
                    std::format("RequirementTable: invalid age range [{}, {}] for group '{}'",
                        row.minAge, row.maxAge, row.group));
            }
            forEachEnum<Nutrient>([&](Nutrient n) {
                if (!std::isfinite(row.dailyMinimum[n]) || row.dailyMinimum[n] < 0.0) {
                    throw ConfigurationError(ConfigurationError::Kind::InvalidRecord, row.group,
                        std::format("RequirementTable: {} minimum must be finite and >= 0 for group '{}'",
                            toString(n), row.group));
                }
            });
        }

        std::vector<Entry> entries_;
    };

    // ========================================================================
    // AGGREGATION
    // ========================================================================

    /**
     * @struct AggregateRequirement
     * @brief Household-wide nutrient floors; recomputed for every request
     */
    struct AggregateRequirement {
        NutrientVector daily{};   ///< sum of matched daily minimums
        NutrientVector weekly{};  ///< daily * kDaysPerWeek
        int matchedMembers = 0;
        int unmatchedMembers = 0;

        double weeklyFloor(Nutrient n) const noexcept { return weekly[n]; }
        double dailyFloor(Nutrient n) const noexcept { return daily[n]; }
    };

    struct RequirementResolution {
        AggregateRequirement requirement;
        WarningList warnings;
    };

    inline std::string describeMember(std::size_t position, const HouseholdMember& m) {
        return std::format("member #{} (age {}, {})", position + 1, m.age(), toString(m.gender()));
    }

    /**
     * @brief Sums matched daily minimums and scales them to a week
     *
     * @param members Household roster, in input order
     * @param table   Validated requirement table
     * @return Aggregate floors plus one UnmatchedMember warning per member
     *         with no matching row
     */
    inline RequirementResolution resolveRequirements(
        std::span<const HouseholdMember> members,
        const RequirementTable& table)
    {
        RequirementResolution result;
        AggregateRequirement& req = result.requirement;

        for (std::size_t i = 0; i < members.size(); ++i) {
            const HouseholdMember& m = members[i];
            const NutrientRequirementRow* row = table.match(m);

            if (!row) {
                ++req.unmatchedMembers;
                result.warnings.push_back(DataQualityWarning{
                    DataQualityWarning::Kind::UnmatchedMember,
                    describeMember(i, m),
                    std::format("no requirement row for {} aged {}; contributes nothing",
                        toString(m.gender()), m.age()) });
                continue;
            }

            ++req.matchedMembers;
            req.daily += row->dailyMinimum;
        }

        req.weekly = scaled(req.daily, static_cast<double>(kDaysPerWeek));
        return result;
    }

    inline RequirementResolution resolveRequirements(
        const Household& household,
        const RequirementTable& table)
    {
        return resolveRequirements(household.members(), table);
    }

} // namespace grocery
