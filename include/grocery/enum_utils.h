#pragma once
/*
===============================================================================
ENUM UTILS — Compile-time enumeration helpers for the grocery planner
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations with a trailing COUNT sentinel and a
matching size constant, plus a small fixed-size container indexed directly by
enumerator. The planner uses these for the nutrient axis (calories, protein,
carbohydrate, fat) and for the variable / constraint registries of the model
builder.

KEY COMPONENTS
--------------
• DECLARE_ENUM_WITH_COUNT: enum class + <Name>_COUNT constant
• enum_size<E>: uniform size trait
• EnumArray<E, T>: std::array wrapper indexed by enumerators
• forEachEnum<E>(fn): visits every user enumerator in declaration order

USAGE EXAMPLES
--------------
    DECLARE_ENUM_WITH_COUNT(Nutrient, Calories, Protein, Carbohydrate, Fat);

    EnumArray<Nutrient, double> floor{};
    floor[Nutrient::Protein] = 350.0;

    forEachEnum<Nutrient>([&](Nutrient n) { total += floor[n]; });

THREAD SAFETY
-------------
• Everything here is either compile-time or a plain value type

===============================================================================
*/

#include <array>
#include <cstddef>

/**
 * @macro DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with an automatic COUNT sentinel
 *
 * @details Expands to
 *     enum class Name { ..., COUNT };
 *     static constexpr std::size_t Name_COUNT = <number of enumerators>;
 *
 * @warning Do not define COUNT yourself; enumerators must be sequential from 0.
 */
#define DECLARE_ENUM_WITH_COUNT(Name, ...)                                \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace grocery {

    /// @brief Number of user enumerators (COUNT excluded)
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    template<typename Enum>
    inline constexpr std::size_t enum_size_v = enum_size<Enum>::value;

    /// @brief Position of an enumerator, usable as an array index
    template<typename Enum>
    constexpr std::size_t enum_index(Enum value) noexcept {
        return static_cast<std::size_t>(value);
    }

    /// @brief True when value names a user enumerator (not COUNT)
    template<typename Enum>
    constexpr bool is_valid_enum_value(Enum value) noexcept {
        return enum_index(value) < enum_size_v<Enum>;
    }

    /**
     * @brief Calls fn(e) for every user enumerator, in declaration order
     *
     * @example
     *     forEachEnum<Nutrient>([](Nutrient n) { ... });
     */
    template<typename Enum, typename Fn>
    constexpr void forEachEnum(Fn&& fn) {
        for (std::size_t i = 0; i < enum_size_v<Enum>; ++i) {
            fn(static_cast<Enum>(i));
        }
    }

    /**
     * @class EnumArray
     * @brief Fixed-size array with one slot per enumerator
     *
     * @tparam Enum Enumeration declared with DECLARE_ENUM_WITH_COUNT
     * @tparam T    Element type
     *
     * @details Aggregate type; value-initialise with {} to zero numeric slots.
     *          Indexing takes the enumerator itself, so a Nutrient-indexed
     *          array cannot be read with a plain integer by accident.
     */
    template<typename Enum, typename T>
    struct EnumArray {
        std::array<T, enum_size_v<Enum>> data{};

        constexpr T& operator[](Enum key) noexcept { return data[enum_index(key)]; }
        constexpr const T& operator[](Enum key) const noexcept { return data[enum_index(key)]; }

        constexpr auto begin() noexcept { return data.begin(); }
        constexpr auto end() noexcept { return data.end(); }
        constexpr auto begin() const noexcept { return data.begin(); }
        constexpr auto end() const noexcept { return data.end(); }

        static constexpr std::size_t size() noexcept { return enum_size_v<Enum>; }

        friend constexpr bool operator==(const EnumArray&, const EnumArray&) = default;
    };

} // namespace grocery
