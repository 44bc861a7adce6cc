#pragma once
/*
===============================================================================
CONFIG — Validated study-level inputs
===============================================================================

OVERVIEW
--------
Every model receives its inputs as explicit arguments; nothing is read from
global state. The inputs of the on-demand study are grouped in plain structs
whose defaults reproduce the representative tilt-rotor study:

    VehicleParameters          rotor count, L/D, efficiencies, structural
                               fraction, battery and rotor-aero parameters
    MissionParameters          sizing mission: range, speeds, passengers,
                               hover time, reserve policy
    CostParameters             cost rates of the typical mission
    TypicalMissionParameters   typical mission: range, speed, passengers,
                               hover time, costs
    StudyParameters            all of the above plus the hover disk loading

Each struct has validate() and fromStore(). validate() throws
ConfigurationError naming the offending field. fromStore() starts from the
defaults and overrides every key present in a DataStore:

    DataStore in;
    in["N"] = 8.0;                                       // plain number
    in["C_m"] = Quantity(300.0, "Wh/kg");                // or a Quantity
    in["sizing.reserve"] = std::string("Uber");
    StudyParameters p = StudyParameters::fromStore(in);

A plain number is taken in the field's default unit. A value of any other
type, or a Quantity of the wrong dimension, is a ConfigurationError.

===============================================================================
*/

#include <cmath>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include "data_store.h"
#include "errors.h"
#include "mission.h"
#include "quantity.h"
#include "units.h"

namespace evtol {

    namespace config_detail {

        inline const Value* lookup(const DataStore& store, const std::string& key) {
            auto it = store.find(key);
            if (it == store.end() || !it->second.has_value()) return nullptr;
            return &it->second;
        }

        [[noreturn]] inline void wrongType(const std::string& key, const Value& v, std::string_view expected) {
            throw ConfigurationError(std::format(
                "config: '{}' holds a value of type '{}', expected {}", key, v.type().name(), expected));
        }

        inline double number(const DataStore& store, const std::string& key, double fallback) {
            const Value* v = lookup(store, key);
            if (!v) return fallback;
            if (auto d = v->try_get<double>()) return d->get();
            if (auto i = v->try_get<int>()) return static_cast<double>(i->get());
            wrongType(key, *v, "a number");
        }

        inline Quantity quantity(const DataStore& store, const std::string& key, const Quantity& fallback) {
            const Value* v = lookup(store, key);
            if (!v) return fallback;
            if (auto q = v->try_get<Quantity>()) {
                if (!q->get().unit().compatible(fallback.unit())) {
                    throw ConfigurationError(std::format(
                        "config: '{}' is in '{}', expected a quantity compatible with '{}'",
                        key, q->get().unit().symbol(), fallback.unit().symbol()));
                }
                return q->get();
            }
            if (auto d = v->try_get<double>()) return Quantity(d->get(), fallback.unit());
            if (auto i = v->try_get<int>()) return Quantity(static_cast<double>(i->get()), fallback.unit());
            wrongType(key, *v, "a Quantity or a number");
        }

        inline ReservePolicy reserve(const DataStore& store, const std::string& key, ReservePolicy fallback) {
            const Value* v = lookup(store, key);
            if (!v) return fallback;
            if (auto p = v->try_get<ReservePolicy>()) return p->get();
            if (auto s = v->try_get<std::string>()) return parseReservePolicy(s->get());
            if (auto c = v->try_get<const char*>()) return parseReservePolicy(c->get());
            wrongType(key, *v, "a ReservePolicy or a string");
        }

        inline void requirePositive(std::string_view owner, std::string_view field, double value) {
            if (!(value > 0.0) || !std::isfinite(value)) {
                throw ConfigurationError(std::format(
                    "{}::validate: {} = {} must be positive and finite", owner, field, value));
            }
        }

        inline void requireFraction(std::string_view owner, std::string_view field, double value) {
            if (!(value > 0.0 && value <= 1.0)) {
                throw ConfigurationError(std::format(
                    "{}::validate: {} = {} must be in (0, 1]", owner, field, value));
            }
        }

        inline void requireAtLeastOne(std::string_view owner, std::string_view field, double value) {
            if (!(value >= 1.0) || !std::isfinite(value)) {
                throw ConfigurationError(std::format(
                    "{}::validate: {} = {} must be at least 1", owner, field, value));
            }
        }

        inline void requireQuantity(std::string_view owner, std::string_view field, const Quantity& q,
                                    std::string_view unit)
        {
            if (!q.unit().compatible(Unit::parse(unit))) {
                throw ConfigurationError(std::format(
                    "{}::validate: {} is in '{}', expected '{}'", owner, field, q.unit().symbol(), unit));
            }
            if (!q.bound()) {
                throw ConfigurationError(std::format("{}::validate: {} is unbound", owner, field));
            }
            requirePositive(owner, field, q.value());
        }

        /// Hover altitude: a bound length at or above sea level
        inline void requireAltitude(std::string_view owner, const Quantity& q) {
            if (!q.unit().compatible(Unit::parse("ft"))) {
                throw ConfigurationError(std::format(
                    "{}::validate: hover_altitude is in '{}', expected a length", owner, q.unit().symbol()));
            }
            if (!q.bound()) {
                throw ConfigurationError(std::format("{}::validate: hover_altitude is unbound", owner));
            }
            if (!(q.value() >= 0.0) || !std::isfinite(q.value())) {
                throw ConfigurationError(std::format(
                    "{}::validate: hover_altitude = {} must be finite and not below sea level", owner, q.str()));
            }
        }

    } // namespace config_detail

    // ============================================================================
    // VEHICLE
    // ============================================================================

    struct VehicleParameters {
        double N = 12;                              ///< Number of rotors
        double s = 0.1;                             ///< Rotor solidity
        double L_D = 14.0;                          ///< Cruise lift-to-drag ratio
        double eta_cruise = 0.85;                   ///< Cruise propulsive efficiency
        double eta_electric = 0.95;                 ///< Electrical system efficiency
        double weight_fraction = 0.3444;            ///< Structural mass fraction
        Quantity C_m{400.0, "Wh/kg"};               ///< Battery energy density
        Quantity P_m{3000.0, "W/kg"};               ///< Battery power density
        double usable_energy_fraction = 0.8;
        double n = 1.0;                             ///< Peukert discharge exponent
        double N_crew = 1;
        Quantity W_oneCrew{190.0, "lbf"};

        // rotor aerodynamics, per operating condition
        double MT_max = 0.9;
        double CL_mean_max = 1.0;
        double SPL_max = 100.0;                     ///< dB
        double ki = 1.1;
        double Cd0 = 0.01;

        void validate() const {
            using namespace config_detail;
            constexpr std::string_view me = "VehicleParameters";
            requireAtLeastOne(me, "N", N);
            requirePositive(me, "s", s);
            requirePositive(me, "L_D", L_D);
            requireFraction(me, "eta_cruise", eta_cruise);
            requireFraction(me, "eta_electric", eta_electric);
            requireFraction(me, "usable_energy_fraction", usable_energy_fraction);
            if (!(weight_fraction > 0.0 && weight_fraction < 1.0)) {
                throw ConfigurationError(std::format(
                    "VehicleParameters::validate: weight_fraction = {} must be in (0, 1)", weight_fraction));
            }
            requireQuantity(me, "C_m", C_m, "Wh/kg");
            requireQuantity(me, "P_m", P_m, "W/kg");
            requirePositive(me, "n", n);
            requirePositive(me, "N_crew", N_crew);
            requireQuantity(me, "W_oneCrew", W_oneCrew, "lbf");
            requirePositive(me, "MT_max", MT_max);
            requirePositive(me, "CL_mean_max", CL_mean_max);
            requirePositive(me, "SPL_max", SPL_max);
            requirePositive(me, "ki", ki);
            requirePositive(me, "Cd0", Cd0);
        }

        static VehicleParameters fromStore(const DataStore& store, const std::string& prefix = "") {
            using namespace config_detail;
            VehicleParameters p;
            p.N = number(store, prefix + "N", p.N);
            p.s = number(store, prefix + "s", p.s);
            p.L_D = number(store, prefix + "L_D", p.L_D);
            p.eta_cruise = number(store, prefix + "eta_cruise", p.eta_cruise);
            p.eta_electric = number(store, prefix + "eta_electric", p.eta_electric);
            p.weight_fraction = number(store, prefix + "weight_fraction", p.weight_fraction);
            p.C_m = quantity(store, prefix + "C_m", p.C_m);
            p.P_m = quantity(store, prefix + "P_m", p.P_m);
            p.usable_energy_fraction = number(store, prefix + "usable_energy_fraction", p.usable_energy_fraction);
            p.n = number(store, prefix + "n", p.n);
            p.N_crew = number(store, prefix + "N_crew", p.N_crew);
            p.W_oneCrew = quantity(store, prefix + "W_oneCrew", p.W_oneCrew);
            p.MT_max = number(store, prefix + "MT_max", p.MT_max);
            p.CL_mean_max = number(store, prefix + "CL_mean_max", p.CL_mean_max);
            p.SPL_max = number(store, prefix + "SPL_max", p.SPL_max);
            p.ki = number(store, prefix + "ki", p.ki);
            p.Cd0 = number(store, prefix + "Cd0", p.Cd0);
            p.validate();
            return p;
        }
    };

    // ============================================================================
    // SIZING MISSION
    // ============================================================================

    struct MissionParameters {
        Quantity mission_range{200.0, "nautical_mile"};
        Quantity V_cruise{200.0, "mph"};
        Quantity V_loiter{100.0, "mph"};
        double N_passengers = 1;
        Quantity W_onePassenger{200.0, "lbf"};
        Quantity time_in_hover{120.0, "s"};
        Quantity hover_altitude{0.0, "ft"};
        ReservePolicy reserve = ReservePolicy::FixedDuration;
        Quantity loiter_time{45.0, "minutes"};          ///< FixedDuration reserve
        Quantity divert_distance{2.0, "nautical_mile"}; ///< FixedDistance reserve

        void validate() const {
            using namespace config_detail;
            constexpr std::string_view me = "MissionParameters";
            requireQuantity(me, "mission_range", mission_range, "nautical_mile");
            requireQuantity(me, "V_cruise", V_cruise, "mph");
            requireQuantity(me, "V_loiter", V_loiter, "mph");
            requirePositive(me, "N_passengers", N_passengers);
            requireQuantity(me, "W_onePassenger", W_onePassenger, "lbf");
            requireQuantity(me, "time_in_hover", time_in_hover, "s");
            requireAltitude(me, hover_altitude);
            if (!is_valid_enum_value(reserve)) {
                throw ConfigurationError("MissionParameters::validate: invalid reserve policy");
            }
            requireQuantity(me, "loiter_time", loiter_time, "minutes");
            requireQuantity(me, "divert_distance", divert_distance, "nautical_mile");
        }

        static MissionParameters fromStore(const DataStore& store, const std::string& prefix = "sizing.") {
            using namespace config_detail;
            MissionParameters p;
            p.mission_range = quantity(store, prefix + "mission_range", p.mission_range);
            p.V_cruise = quantity(store, prefix + "V_cruise", p.V_cruise);
            p.V_loiter = quantity(store, prefix + "V_loiter", p.V_loiter);
            p.N_passengers = number(store, prefix + "N_passengers", p.N_passengers);
            p.W_onePassenger = quantity(store, prefix + "W_onePassenger", p.W_onePassenger);
            p.time_in_hover = quantity(store, prefix + "time_in_hover", p.time_in_hover);
            p.hover_altitude = quantity(store, prefix + "hover_altitude", p.hover_altitude);
            p.reserve = reserve(store, prefix + "reserve", p.reserve);
            p.loiter_time = quantity(store, prefix + "loiter_time", p.loiter_time);
            p.divert_distance = quantity(store, prefix + "divert_distance", p.divert_distance);
            p.validate();
            return p;
        }
    };

    // ============================================================================
    // TYPICAL MISSION
    // ============================================================================

    struct CostParameters {
        Quantity cost_per_weight{112.0, "lbf**-1"};     ///< Purchase price per unit MTOW
        Quantity cost_per_energy{0.12, "kWh**-1"};
        Quantity pilot_salary{40.0, "hr**-1"};
        Quantity mechanic_salary{30.0, "hr**-1"};
        Quantity vehicle_life{10.0, "years"};
        Quantity overhaul_time{2.0, "hours"};
        double N_mechanics = 2;
        Quantity time_between_overhauls{50.0, "hours"};

        void validate() const {
            using namespace config_detail;
            constexpr std::string_view me = "CostParameters";
            requireQuantity(me, "cost_per_weight", cost_per_weight, "lbf**-1");
            requireQuantity(me, "cost_per_energy", cost_per_energy, "kWh**-1");
            requireQuantity(me, "pilot_salary", pilot_salary, "hr**-1");
            requireQuantity(me, "mechanic_salary", mechanic_salary, "hr**-1");
            requireQuantity(me, "vehicle_life", vehicle_life, "years");
            requireQuantity(me, "overhaul_time", overhaul_time, "hours");
            requirePositive(me, "N_mechanics", N_mechanics);
            requireQuantity(me, "time_between_overhauls", time_between_overhauls, "hours");
        }

        static CostParameters fromStore(const DataStore& store, const std::string& prefix = "typical.") {
            using namespace config_detail;
            CostParameters p;
            p.cost_per_weight = quantity(store, prefix + "cost_per_weight", p.cost_per_weight);
            p.cost_per_energy = quantity(store, prefix + "cost_per_energy", p.cost_per_energy);
            p.pilot_salary = quantity(store, prefix + "pilot_salary", p.pilot_salary);
            p.mechanic_salary = quantity(store, prefix + "mechanic_salary", p.mechanic_salary);
            p.vehicle_life = quantity(store, prefix + "vehicle_life", p.vehicle_life);
            p.overhaul_time = quantity(store, prefix + "overhaul_time", p.overhaul_time);
            p.N_mechanics = number(store, prefix + "N_mechanics", p.N_mechanics);
            p.time_between_overhauls = quantity(store, prefix + "time_between_overhauls", p.time_between_overhauls);
            p.validate();
            return p;
        }
    };

    struct TypicalMissionParameters {
        Quantity mission_range{100.0, "nautical_mile"};
        Quantity V_cruise{200.0, "mph"};
        double N_passengers = 1;
        Quantity W_onePassenger{200.0, "lbf"};
        Quantity time_in_hover{30.0, "s"};
        Quantity hover_altitude{0.0, "ft"};
        CostParameters costs;

        void validate() const {
            using namespace config_detail;
            constexpr std::string_view me = "TypicalMissionParameters";
            requireQuantity(me, "mission_range", mission_range, "nautical_mile");
            requireQuantity(me, "V_cruise", V_cruise, "mph");
            requirePositive(me, "N_passengers", N_passengers);
            requireQuantity(me, "W_onePassenger", W_onePassenger, "lbf");
            requireQuantity(me, "time_in_hover", time_in_hover, "s");
            requireAltitude(me, hover_altitude);
            costs.validate();
        }

        static TypicalMissionParameters fromStore(const DataStore& store, const std::string& prefix = "typical.") {
            using namespace config_detail;
            TypicalMissionParameters p;
            p.mission_range = quantity(store, prefix + "mission_range", p.mission_range);
            p.V_cruise = quantity(store, prefix + "V_cruise", p.V_cruise);
            p.N_passengers = number(store, prefix + "N_passengers", p.N_passengers);
            p.W_onePassenger = quantity(store, prefix + "W_onePassenger", p.W_onePassenger);
            p.time_in_hover = quantity(store, prefix + "time_in_hover", p.time_in_hover);
            p.hover_altitude = quantity(store, prefix + "hover_altitude", p.hover_altitude);
            p.costs = CostParameters::fromStore(store, prefix);
            p.validate();
            return p;
        }
    };

    // ============================================================================
    // STUDY
    // ============================================================================

    struct StudyParameters {
        VehicleParameters vehicle;
        MissionParameters sizing;
        TypicalMissionParameters typical;

        /// Disk loading pinned on every sizing-mission hover; none leaves it free
        std::optional<Quantity> hover_disk_loading = Quantity(16.3, "lbf/ft^2");

        void validate() const {
            vehicle.validate();
            sizing.validate();
            typical.validate();
            if (hover_disk_loading) {
                config_detail::requireQuantity("StudyParameters", "hover_disk_loading", *hover_disk_loading,
                    "lbf/ft^2");
            }
        }

        /**
         * @brief Defaults overridden by @p store
         *
         * @details Vehicle keys are unprefixed ("N", "C_m"), sizing-mission keys
         *          start with "sizing.", typical-mission and cost keys with
         *          "typical.". "hover_disk_loading" sets the disk loading.
         */
        static StudyParameters fromStore(const DataStore& store) {
            StudyParameters p;
            p.vehicle = VehicleParameters::fromStore(store);
            p.sizing = MissionParameters::fromStore(store);
            p.typical = TypicalMissionParameters::fromStore(store);
            if (config_detail::lookup(store, "hover_disk_loading")) {
                p.hover_disk_loading = config_detail::quantity(store, "hover_disk_loading", *p.hover_disk_loading);
            }
            p.validate();
            return p;
        }
    };

} // namespace evtol
