#pragma once
/*
===============================================================================
VEHICLE — On-demand electric rotorcraft design model
===============================================================================

OVERVIEW
--------
OnDemandAircraft owns the Variables shared by every mission flown with the
vehicle (MTOW, empty weight, effective capacity, L/D, cruise efficiency) and
builds its components as children:

    OnDemandAircraft
    ├── Rotors
    ├── Battery
    ├── Crew
    ├── Structure         W = weight_fraction * MTOW
    └── PowerSystem

Weight build-up: W_{noPassengers} >= sum of the component weights. The
vehicle also ties the battery's free g and C_{eff} to its own.

Segments borrow from the vehicle through a reference and reach the
components through child("Rotors"), child("Battery"), child("PowerSystem").

===============================================================================
*/

#include <string_view>
#include <vector>

#include "../config.h"
#include "../expressions.h"
#include "../model.h"
#include "components.h"

namespace evtol::models {

    /// @brief Rotor performance limits taken from the vehicle parameters
    inline RotorAeroParameters rotorAero(const VehicleParameters& p) {
        return RotorAeroParameters{ p.MT_max, p.CL_mean_max, p.SPL_max, p.ki, p.Cd0 };
    }

    struct OnDemandAircraft {
        static constexpr std::string_view type_name = "OnDemandAircraft";

        VehicleParameters params;

        void setup(NodeBuilder& b) const {
            auto MTOW = b.var("MTOW", "lbf", "Aircraft maximum takeoff weight");
            auto W_noPassengers = b.var("W_{noPassengers}", "lbf", "Weight without passengers");
            auto C_eff = b.var("C_{eff}", "kWh", "Effective battery capacity");
            auto g = b.var("g", 9.807, "m/s**2", "Gravitational acceleration");
            b.var("L_D", params.L_D, "-", "Cruise L/D ratio");
            b.var("eta_cruise", params.eta_cruise, "-", "Cruise propulsive efficiency");

            const ModelNode& rotors = b.child(Rotors{ params.N, params.s });
            const ModelNode& battery = b.child(Battery{
                params.C_m, params.P_m, params.usable_energy_fraction, params.n });
            const ModelNode& crew = b.child(Crew{ params.N_crew, params.W_oneCrew });
            const ModelNode& structure = b.child(Structure{ MTOW, params.weight_fraction });
            const ModelNode& powerSystem = b.child(PowerSystem{ params.eta_electric });

            b.add(g == battery.topvar("g"));
            b.add(C_eff == battery.topvar("C_{eff}"));

            std::vector<Variable> weights{
                rotors.topvar("W"), battery.topvar("W"), crew.topvar("W"),
                structure.topvar("W"), powerSystem.topvar("W") };
            b.add(W_noPassengers >= sum(weights), "weight");
        }
    };

} // namespace evtol::models
