#pragma once
/*
===============================================================================
SEGMENTS — Flight segments of an on-demand mission
===============================================================================

OVERVIEW
--------
A segment is a performance-level model: it owns the segment's energy E and
time t (read by the mission energy chain), builds one performance model
per vehicle component it loads, and stitches those to its own Variables
with equality constraints.

    Hover         RotorsAero + BatteryPerformance + PowerSystemPerformance
                  T = W_{mission}, P_{rotors} = P_{out}, P_{battery} = P_{in}
    LevelFlight   BatteryPerformance + PowerSystemPerformance
                  segment_range = V t,  eta_cruise P_{cruise} = T V,
                  T = D,  W_{mission} = L/D D

Both hold the vehicle node and the mission weight Variable by reference to
the caller's objects; the segment must be built while those are alive.

===============================================================================
*/

#include <string_view>

#include "../model.h"
#include "../quantity.h"
#include "../variables.h"
#include "components.h"

namespace evtol::models {

    /**
     * @brief Hover for a fixed time at @p state with thrust equal to the mission weight
     *
     * @details The disk loading T/A is a free Variable of the segment so a
     *          study can pin it with a substitution.
     */
    struct Hover {
        static constexpr std::string_view type_name = "Hover";

        const ModelNode& aircraft;
        const ModelNode& state;
        Variable W_mission;
        Quantity time{120.0, "s"};
        RotorAeroParameters aero;

        void setup(NodeBuilder& b) const {
            b.reference(aircraft);

            auto E = b.var("E", "kWh", "Electrical energy used during hover segment");
            auto P_battery = b.var("P_{battery}", "kW", "Power drawn (from batteries) during hover segment");
            auto P_rotors = b.var("P_{rotors}", "kW", "Power used (by lifting rotors) during hover segment");
            auto T = b.var("T", "lbf", "Total thrust (from rotors) during hover segment");
            auto T_A = b.var("T/A", "lbf/ft**2", "Disk loading during hover segment");
            auto t = b.var("t", time, "s", "Time in hover segment");

            const ModelNode& rotorPerf = b.child(RotorsAero{ aircraft.child("Rotors"), state, aero });
            const ModelNode& batteryPerf = b.child(BatteryPerformance{ aircraft.child("Battery") });
            const ModelNode& powerPerf = b.child(PowerSystemPerformance{ aircraft.child("PowerSystem") });

            b.add(P_rotors == rotorPerf.topvar("P"));
            b.add(T == rotorPerf.topvar("T"));
            b.add(T_A == rotorPerf.topvar("T/A"));

            b.add(P_battery == powerPerf.topvar("P_{in}"));
            b.add(P_rotors == powerPerf.topvar("P_{out}"));

            b.add(E == batteryPerf.topvar("E"));
            b.add(P_battery == batteryPerf.topvar("P"));
            b.add(t == batteryPerf.topvar("t"));

            b.add(T == W_mission, "lift");
        }
    };

    /// @brief Steady level flight at speed @p V
    struct LevelFlight {
        static constexpr std::string_view type_name = "LevelFlight";

        const ModelNode& aircraft;
        Variable W_mission;
        Quantity V{200.0, "mph"};

        void setup(NodeBuilder& b) const {
            b.reference(aircraft);

            auto E = b.var("E", "kWh", "Electrical energy used during level-flight segment");
            auto P_battery = b.var("P_{battery}", "kW", "Power drawn (from batteries) during segment");
            auto P_cruise = b.var("P_{cruise}", "kW", "Power used (by propulsion system) during cruise segment");
            auto T = b.var("T", "lbf", "Thrust during level-flight segment");
            auto D = b.var("D", "lbf", "Drag during level-flight segment");
            auto t = b.var("t", "s", "Time in level-flight segment");
            auto range = b.var("segment_range", "nautical_mile", "Distance travelled during segment");
            auto speed = b.var("V", V, "mph", "Velocity during segment");

            Variable L_D = b.resolve("L_D");
            Variable eta = b.resolve("eta_cruise");

            const ModelNode& batteryPerf = b.child(BatteryPerformance{ aircraft.child("Battery") });
            const ModelNode& powerPerf = b.child(PowerSystemPerformance{ aircraft.child("PowerSystem") });

            b.add(P_battery == powerPerf.topvar("P_{in}"));
            b.add(P_cruise == powerPerf.topvar("P_{out}"));

            b.add(E == batteryPerf.topvar("E"));
            b.add(P_battery == batteryPerf.topvar("P"));
            b.add(t == batteryPerf.topvar("t"));

            b.add(range == speed * t);
            b.add(eta * P_cruise == T * speed);
            b.add(T == D);
            b.add(W_mission == L_D * D, "lift");
        }
    };

} // namespace evtol::models
