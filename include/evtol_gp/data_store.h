#pragma once
/*
===============================================================================
DATA STORE — Type-erased key/value holder for study inputs and solver settings
===============================================================================

OVERVIEW
--------
Study parameters can be supplied as a loose key/value map (for instance when
a driver program reads them from a command line or a file) instead of being
written into the parameter structs directly. The solver adapter also echoes
every parameter it sets into a DataStore so a run can report how it was
configured.

    DataStore inputs;
    inputs["N"] = 12.0;
    inputs["reserve"] = std::string("Uber");

    VehicleParameters v = VehicleParameters::fromStore(inputs);   // config.h

    SolverAdapter solver;
    solver.timeLimit(30.0);
    solver.store()["param:TimeLimit"].get<double>();               // 30

KEY COMPONENTS
--------------
• Value      — std::any wrapper with typed access
• DataStore  — std::unordered_map<std::string, Value>

EXCEPTION SAFETY
----------------
• get<T>() throws std::bad_any_cast on a type mismatch
• try_get<T>(), get_or<T>() and is<T>() never throw

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

namespace evtol {

    /**
     * @class Value
     * @brief Type-erased value with exact-type access
     *
     * @note Matching is exact: a stored `int` is not readable as `double`.
     *
     * @example
     *     Value v = 0.3444;
     *     double wf = v.get<double>();
     *     int n = v.get_or<int>(1);        // 1, stored type is double
     */
    class Value {
        std::any storage_;

    public:
        Value() = default;

        template <typename T>
            requires (!std::same_as<std::remove_cvref_t<T>, Value>)
        Value(T&& v) : storage_(std::forward<T>(v)) {}

        template <typename T>
            requires (!std::same_as<std::remove_cvref_t<T>, Value>)
        Value& operator=(T&& v) {
            storage_ = std::forward<T>(v);
            return *this;
        }

        [[nodiscard]] bool has_value() const noexcept { return storage_.has_value(); }
        [[nodiscard]] const std::type_info& type() const noexcept { return storage_.type(); }

        template <typename T>
        [[nodiscard]] bool is() const noexcept { return storage_.type() == typeid(T); }

        /// @brief Reference to the stored value if it is a T, else nullopt
        template <typename T>
        [[nodiscard]] std::optional<std::reference_wrapper<const T>> try_get() const noexcept {
            if (!is<T>()) return std::nullopt;
            return std::cref(*std::any_cast<T>(&storage_));
        }

        /// @throws std::bad_any_cast if the stored type is not T
        template <typename T>
        [[nodiscard]] T& get() { return std::any_cast<T&>(storage_); }

        template <typename T>
        [[nodiscard]] const T& get() const { return std::any_cast<const T&>(storage_); }

        /// @brief Stored value if it is a T, else @p fallback
        template <typename T>
        [[nodiscard]] T get_or(const T& fallback) const {
            return is<T>() ? get<T>() : fallback;
        }

        void reset() noexcept { storage_.reset(); }
    };

    /// @brief String-keyed map of Values; keys are case-sensitive
    using DataStore = std::unordered_map<std::string, Value>;

} // namespace evtol
