#pragma once
/*
===============================================================================
DATA STORE — Typed key/value record of solver parameters and run metadata
===============================================================================

OVERVIEW
--------
A string-keyed map of type-erased values. The solver backend records every
parameter it applies here ("param:TimeLimit", "param:MIPGap", ...) and the
planner attaches the store to each PlanResult, so a caller can see exactly how
a plan was produced without knowing backend-specific parameter macros.

KEY COMPONENTS
--------------
• Value:     std::any wrapper with is<T>(), get<T>(), try_get<T>(), get_or<T>()
• DataStore: std::unordered_map<std::string, Value>

USAGE EXAMPLES
--------------
    DataStore params;
    params["param:TimeLimit"] = 30.0;
    params["param:Preset"] = std::string("Fast");

    double limit = params["param:TimeLimit"].get_or(0.0);
    if (auto preset = params["param:Preset"].try_get<std::string>()) { ... }

EXCEPTION SAFETY
----------------
• get<T>(): throws std::bad_any_cast on type mismatch
• try_get<T>(), get_or<T>(): never throw on mismatch

===============================================================================
*/

#include <any>
#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace grocery {

    /**
     * @class Value
     * @brief Type-erased value with checked access
     *
     * @note Exact type match only: a stored int is not readable as double.
     */
    class Value
    {
        std::any storage_;

    public:
        Value() = default;

        template <typename T>
            requires (!std::same_as<std::remove_cvref_t<T>, Value>)
        Value(T&& v)
            : storage_(std::forward<T>(v))
        {
        }

        template <typename T>
            requires (!std::same_as<std::remove_cvref_t<T>, Value>)
        Value& operator=(T&& v)
        {
            storage_ = std::forward<T>(v);
            return *this;
        }

        bool has_value() const noexcept { return storage_.has_value(); }

        const std::type_info& type() const noexcept { return storage_.type(); }

        template <typename T>
        bool is() const noexcept
        {
            return storage_.type() == typeid(T);
        }

        /// @throws std::bad_any_cast if the stored type is not T
        template <typename T>
        const T& get() const
        {
            return std::any_cast<const T&>(storage_);
        }

        /// @throws std::bad_any_cast if the stored type is not T
        template <typename T>
        T& get()
        {
            return std::any_cast<T&>(storage_);
        }

        template <typename T>
        std::optional<std::reference_wrapper<const T>> try_get() const noexcept
        {
            if (!is<T>())
                return std::nullopt;
            return std::cref(*std::any_cast<T>(&storage_));
        }

        template <typename T>
        T get_or(const T& fallback) const
        {
            if (is<T>())
                return get<T>();
            return fallback;
        }

        void reset() noexcept { storage_.reset(); }
    };

    /// @brief String-keyed Value map; keys are case-sensitive
    using DataStore = std::unordered_map<std::string, Value>;

} // namespace grocery
