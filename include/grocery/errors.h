#pragma once
/*
===============================================================================
ERRORS — Exception types and data-quality warnings for the planner
===============================================================================

OVERVIEW
--------
Four kinds of trouble can occur while producing a weekly purchase plan:

    ConfigurationError     fatal, thrown before any model is built
                           (empty household, missing table, duplicate key,
                           invalid record, ambiguous requirement table)
    DataQualityWarning     recovered; collected into the result and the
                           request proceeds (dropped cost row, unmatched
                           member, stock entry for an unknown package)
    SolverOutcome          not an error at all: a non-Optimal SolveStatus
                           carried in PlanResult (see solver.h)
    InternalInconsistency  fatal defect; the model's variable index and the
                           catalog disagree

SolverError additionally reports a failure of the backend itself (licence,
environment, API misuse) as opposed to an outcome of the optimisation.

ConfigurationError and InternalInconsistency abort the request: no partial
plan is ever returned alongside them.

===============================================================================
*/

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace grocery {

    /**
     * @class ConfigurationError
     * @brief Invalid or incomplete planner input
     *
     * @details kind() identifies the failure, key() names the offending record
     *          (package description, food name, group label, ...) when there
     *          is one.
     */
    class ConfigurationError : public std::invalid_argument {
    public:
        enum class Kind {
            EmptyHousehold,
            MissingTable,
            DuplicatePackage,
            DuplicateFood,
            DuplicateStockEntry,
            InvalidRecord,
            OverlappingRequirementRanges
        };

        ConfigurationError(Kind kind, std::string key, const std::string& message)
            : std::invalid_argument(message), kind_(kind), key_(std::move(key))
        {
        }

        Kind kind() const noexcept { return kind_; }
        const std::string& key() const noexcept { return key_; }

    private:
        Kind kind_;
        std::string key_;
    };

    inline std::string_view toString(ConfigurationError::Kind kind) {
        switch (kind) {
            case ConfigurationError::Kind::EmptyHousehold:               return "EmptyHousehold";
            case ConfigurationError::Kind::MissingTable:                 return "MissingTable";
            case ConfigurationError::Kind::DuplicatePackage:             return "DuplicatePackage";
            case ConfigurationError::Kind::DuplicateFood:                return "DuplicateFood";
            case ConfigurationError::Kind::DuplicateStockEntry:          return "DuplicateStockEntry";
            case ConfigurationError::Kind::InvalidRecord:                return "InvalidRecord";
            case ConfigurationError::Kind::OverlappingRequirementRanges: return "OverlappingRequirementRanges";
        }
        return "Unknown";
    }

    /// @brief Model index and catalog disagree; always a programming defect
    class InternalInconsistency : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    /**
     * @class SolverError
     * @brief The MILP backend failed to run (not an optimisation outcome)
     *
     * @details code() carries the backend's native error code, 0 if none.
     */
    class SolverError : public std::runtime_error {
    public:
        SolverError(int code, const std::string& message)
            : std::runtime_error(message), code_(code)
        {
        }

        int code() const noexcept { return code_; }

    private:
        int code_;
    };

    /**
     * @struct DataQualityWarning
     * @brief A recoverable input problem reported alongside the result
     */
    struct DataQualityWarning {
        enum class Kind {
            DroppedCostRow,     ///< cost row whose Food has no nutrition row
            UnmatchedMember,    ///< member with no requirement row
            UnknownStockEntry   ///< stock row naming no catalog package
        };

        Kind kind;
        std::string subject;    ///< package description, food or member label
        std::string message;
    };

    using WarningList = std::vector<DataQualityWarning>;

    inline std::string_view toString(DataQualityWarning::Kind kind) {
        switch (kind) {
            case DataQualityWarning::Kind::DroppedCostRow:    return "DroppedCostRow";
            case DataQualityWarning::Kind::UnmatchedMember:   return "UnmatchedMember";
            case DataQualityWarning::Kind::UnknownStockEntry: return "UnknownStockEntry";
        }
        return "Unknown";
    }

} // namespace grocery
