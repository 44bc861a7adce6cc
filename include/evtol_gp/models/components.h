#pragma once
/*
===============================================================================
COMPONENTS — Leaf models of an electric rotorcraft
===============================================================================

OVERVIEW
--------
Design models own the persistent Variables of a subsystem (rotor geometry,
battery capacity, ...). Performance models are built once per operating
condition, own the condition-specific Variables (thrust, power, energy,
time) and reach the design Variables through a registered reference:

    design                      performance (one per flight segment)
    ------                      ------------------------------------
    Rotors          <- ref --   RotorsAero
    Battery         <- ref --   BatteryPerformance
    PowerSystem     <- ref --   PowerSystemPerformance
    FlightState     <- ref --   RotorsAero

    Crew, Passengers, Structure have no performance model.

Each type satisfies Constrainable: a `type_name` and a const setup().

ROTOR AERODYNAMICS
------------------
    T = N T_1,  P = N P_1
    T_1 = 1/2 rho VT^2 A CT,   P_1 = 1/2 rho VT^3 A CP
    CPi = 1/2 CT^1.5,   CPp = 1/4 s Cd0,   CP >= ki CPi + CPp,   FOM = CPi / CP
    VT = R omega = MT a,   MT <= MT_max
    CL_mean = 3 CT / s <= CL_mean_max
    p_ratio = k3 T omega / (rho x) (N s)^-1/2 <= 10^(SPL_max / 20)

===============================================================================
*/

#include <cmath>
#include <format>
#include <numbers>
#include <string_view>

#include "../atmosphere.h"
#include "../constraints.h"
#include "../errors.h"
#include "../expressions.h"
#include "../model.h"
#include "../quantity.h"
#include "../variables.h"

namespace evtol::models {

    // ============================================================================
    // ROTORS
    // ============================================================================

    struct Rotors {
        static constexpr std::string_view type_name = "Rotors";

        double count = 1;
        double solidity = 0.1;

        void setup(NodeBuilder& b) const {
            auto R = b.var("R", "ft", "Propeller radius");
            auto D = b.var("D", "ft", "Propeller diameter");
            auto A = b.var("A", "ft^2", "Area of 1 rotor disk");
            auto A_total = b.var("A_{total}", "ft^2", "Combined area of all rotor disks");
            auto N = b.var("N", count, "-", "Number of rotors");
            b.var("s", solidity, "-", "Propeller solidity");
            b.var("W", 0.0, "lbf", "Rotor weight");

            b.add(A == std::numbers::pi * pow(R, 2));
            b.add(D == 2.0 * R);
            b.add(A_total == N * A);
        }
    };

    /// @brief Limits and coefficients of the rotor performance model
    struct RotorAeroParameters {
        double MT_max = 0.9;
        double CL_mean_max = 1.0;
        double SPL_max = 100.0;     // dB
        double ki = 1.1;
        double Cd0 = 0.01;
    };

    /**
     * @brief Rotor performance at one operating condition
     *
     * @details Borrows R, A, A_{total}, N and s from @p rotors and rho, a
     *          from @p state.
     */
    struct RotorsAero {
        static constexpr std::string_view type_name = "RotorsAero";

        const ModelNode& rotors;
        const ModelNode& state;
        RotorAeroParameters params;

        void setup(NodeBuilder& b) const {
            b.reference(rotors);
            b.reference(state);

            auto T = b.var("T", "lbf", "Total thrust");
            auto T_perRotor = b.var("T_perRotor", "lbf", "Thrust per rotor");
            auto T_A = b.var("T/A", "lbf/ft**2", "Disk loading");
            auto P = b.var("P", "kW", "Total power");
            auto P_perRotor = b.var("P_perRotor", "kW", "Power per rotor");
            auto VT = b.var("VT", "ft/s", "Propeller tip speed");
            auto omega = b.var("omega", "rpm", "Propeller angular velocity");
            auto MT = b.var("MT", "-", "Propeller tip Mach number");
            auto MT_max = b.var("MT_max", params.MT_max, "-", "Maximum allowed tip Mach number");

            auto CT = b.var("CT", "-", "Thrust coefficient");
            auto CP = b.var("CP", "-", "Power coefficient");
            auto CPi = b.var("CPi", "-", "Induced (ideal) power coefficient");
            auto CPp = b.var("CPp", "-", "Profile power coefficient");
            auto CL_mean = b.var("CL_mean", "-", "Mean lift coefficient");
            auto CL_mean_max = b.var("CL_mean_max", params.CL_mean_max, "-", "Maximum allowed mean lift coefficient");
            auto FOM = b.var("FOM", "-", "Figure of merit");

            auto ki = b.var("ki", params.ki, "-", "Induced power factor");
            auto Cd0 = b.var("Cd0", params.Cd0, "-", "Blade two-dimensional zero-lift drag coefficient");

            auto p_ratio = b.var("p_{ratio}", "-", "Sound pressure ratio (p/p_{ref})");
            auto p_ratio_max = b.var("p_{ratio_max}", std::pow(10.0, params.SPL_max / 20.0), "-",
                "Max allowed sound pressure ratio");
            auto x = b.var("x", 500.0, "ft", "Distance from source at which to calculate sound");
            auto k3 = b.var("k3", 6.804e-3, "s**3/ft**3", "Sound-pressure constant");

            Variable R = b.resolve("R");
            Variable A = b.resolve("A");
            Variable A_total = b.resolve("A_{total}");
            Variable N = b.resolve("N");
            Variable s = b.resolve("s");
            Variable rho = b.resolve("rho");
            Variable a = b.resolve("a");

            b.add(T == N * T_perRotor);
            b.add(P == N * P_perRotor);
            b.add(T_perRotor == 0.5 * rho * pow(VT, 2) * A * CT);
            b.add(P_perRotor == 0.5 * rho * pow(VT, 3) * A * CP);
            b.add(T_A == T / A_total);

            b.add(CPi == 0.5 * pow(CT, 1.5));
            b.add(CPp == 0.25 * s * Cd0);
            b.add(CP >= ki * CPi + CPp);
            b.add(FOM == CPi / CP);

            // tip speed: upper limit from compressibility
            b.add(VT == R * omega);
            b.add(VT == MT * a);
            b.add(MT <= MT_max);

            // mean lift coefficient: lower limit on tip speed
            b.add(CL_mean == 3.0 * CT / s);
            b.add(CL_mean <= CL_mean_max);

            b.add(p_ratio == k3 * T * omega / (rho * x) * pow(N * s, -0.5));
            b.add(p_ratio <= p_ratio_max, "noise");
        }
    };

    // ============================================================================
    // BATTERY
    // ============================================================================

    /**
     * @brief Battery pack sized by mass
     * @note g is free here and must be tied to a fixed value by the owner.
     */
    struct Battery {
        static constexpr std::string_view type_name = "Battery";

        Quantity C_m{350.0, "Wh/kg"};
        Quantity P_m{3000.0, "W/kg"};
        double usable_energy_fraction = 0.8;
        double n = 1.0;

        void setup(NodeBuilder& b) const {
            auto g = b.var("g", "m/s**2", "Gravitational acceleration");
            auto C = b.var("C", "kWh", "Battery capacity");
            auto C_eff = b.var("C_{eff}", "kWh", "Effective battery capacity");
            auto f = b.var("usable_energy_fraction", usable_energy_fraction, "-",
                "Fraction of the battery energy that can be used without damage");
            auto W = b.var("W", "lbf", "Battery weight");
            auto m = b.var("m", "kg", "Battery mass");
            auto Cm = b.var("C_m", C_m, "Wh/kg", "Battery energy density");
            auto Pm = b.var("P_m", P_m, "W/kg", "Battery power density");
            auto P_max = b.var("P_{max}", "kW", "Battery maximum power");
            b.var("n", n, "-", "Peukert discharge exponent");

            b.add(C == m * Cm);
            b.add(W == m * g);
            b.add(C_eff == f * C);
            b.add(P_max == Pm * m);
        }
    };

    /// @brief Energy drawn from @p battery over one segment (Peukert)
    struct BatteryPerformance {
        static constexpr std::string_view type_name = "BatteryPerformance";

        const ModelNode& battery;

        void setup(NodeBuilder& b) const {
            b.reference(battery);

            auto E = b.var("E", "kWh", "Electrical energy used during segment");
            auto P = b.var("P", "kW", "Power draw during segment");
            auto t = b.var("t", "s", "Time over which battery is providing power");
            auto Rt = b.var("Rt", 1.0, "hr", "Battery hour rating");

            double n = *b.resolve("n").value();
            Variable P_max = b.resolve("P_{max}");

            b.add(E == P * Rt * pow(t / Rt, 1.0 / n));
            b.add(P <= P_max);
        }
    };

    // ============================================================================
    // PAYLOAD, STRUCTURE, POWER SYSTEM
    // ============================================================================

    struct Crew {
        static constexpr std::string_view type_name = "Crew";

        double N_crew = 1;
        Quantity W_oneCrew{190.0, "lbf"};

        void setup(NodeBuilder& b) const {
            auto W_one = b.var("W_{oneCrew}", W_oneCrew, "lbf", "Weight of 1 crew member");
            auto N = b.var("N_{crew}", N_crew, "-", "Number of crew members");
            auto W = b.var("W", "lbf", "Total weight");

            b.add(W == N * W_one);
        }
    };

    struct Passengers {
        static constexpr std::string_view type_name = "Passengers";

        double N_passengers = 1;
        Quantity W_onePassenger{200.0, "lbf"};

        void setup(NodeBuilder& b) const {
            auto W_one = b.var("W_{onePassenger}", W_onePassenger, "lbf", "Weight of 1 passenger");
            auto N = b.var("N_{passengers}", N_passengers, "-", "Number of passengers");
            auto W = b.var("W", "lbf", "Total weight");

            b.add(W == N * W_one);
        }
    };

    /// @brief Structural weight as a fixed fraction of the takeoff weight
    struct Structure {
        static constexpr std::string_view type_name = "Structure";

        Variable MTOW;
        double weight_fraction;

        void setup(NodeBuilder& b) const {
            auto W = b.var("W", "lbf", "Structural weight");
            auto wf = b.var("weight_fraction", weight_fraction, "-", "Structural weight fraction");

            b.add(W == wf * MTOW);
        }
    };

    struct PowerSystem {
        static constexpr std::string_view type_name = "PowerSystem";

        double eta = 0.9;

        void setup(NodeBuilder& b) const {
            b.var("W", 0.0, "lbf", "Electrical power system weight");
            b.var("eta", eta, "-", "Electrical power system efficiency");
        }
    };

    struct PowerSystemPerformance {
        static constexpr std::string_view type_name = "PowerSystemPerformance";

        const ModelNode& powerSystem;

        void setup(NodeBuilder& b) const {
            b.reference(powerSystem);

            auto P_in = b.var("P_{in}", "kW", "Input power (from the battery)");
            auto P_out = b.var("P_{out}", "kW", "Output power (to the motor or motors)");
            Variable eta = b.resolve("eta");

            b.add(P_out == eta * P_in);
        }
    };

    // ============================================================================
    // FLIGHT STATE
    // ============================================================================

    /**
     * @brief Air properties at one altitude, fixed from the standard atmosphere
     * @throws DomainError, UnitMismatchError from atmosphere()
     * @throws DomainError if @p altitude is below sea level; h is a GP Variable
     *         and cannot hold a negative value
     */
    struct FlightState {
        static constexpr std::string_view type_name = "FlightState";

        Quantity altitude{0.0, "ft"};

        void setup(NodeBuilder& b) const {
            AtmosphereState air = atmosphere(altitude);
            if (altitude.in("ft") < 0.0) {
                throw DomainError(std::format(
                    "FlightState::setup: altitude {} is below sea level", altitude.str()));
            }
            b.var("h", altitude, "ft", "Altitude");
            b.var("rho", air.density, "kg/m^3", "Air density");
            b.var("a", air.speed_of_sound, "ft/s", "Speed of sound");
        }
    };

} // namespace evtol::models
