#pragma once
/*
===============================================================================
MISSIONS — On-demand sizing and typical missions
===============================================================================

OVERVIEW
--------
A mission borrows the vehicle's design Variables through a reference, owns
its mission weight and payload, and builds its segments in flight order.
Segment paths are instance-numbered by type:

    OnDemandSizingMission               OnDemandTypicalMission
    ├── Passengers                      ├── Passengers
    ├── FlightState                     ├── FlightState
    ├── Hover          takeoff          ├── Hover          takeoff
    ├── LevelFlight    cruise           ├── LevelFlight    cruise
    ├── Hover[1]       landing          └── Hover[1]       landing
    ├── Hover[2]       takeoff
    ├── LevelFlight[1] reserve
    └── Hover[3]       landing

MISSION CONSTRAINTS
-------------------
    W_{mission} >= W_{noPassengers} + W_passengers,   MTOW >= W_{mission}
    mission_range = cruise segment_range
    sizing:   C_{eff} >= sum E               (energy chain over all segments)
              one reserve constraint on the reserve segment
              p_{ratio} = takeoff rotor p_{ratio}
    typical:  E_{mission} >= sum E,   t_{mission} >= sum t
              cost_per_trip >= c_vehicle + c_energy + c_pilot + c_maintenance
              cost_per_trip = cost_per_trip_per_passenger N_{passengers}

===============================================================================
*/

#include <array>
#include <string_view>

#include "../config.h"
#include "../lookup.h"
#include "../mission.h"
#include "../model.h"
#include "components.h"
#include "segments.h"
#include "vehicle.h"

namespace evtol::models {

    // ============================================================================
    // SIZING MISSION
    // ============================================================================

    /**
     * @brief Mission that sizes the battery: two flights plus a reserve
     *
     * @details @p aircraft must be a built OnDemandAircraft and outlive the build.
     */
    struct OnDemandSizingMission {
        static constexpr std::string_view type_name = "OnDemandSizingMission";

        const ModelNode& aircraft;
        MissionParameters params;
        VehicleParameters vehicle;

        void setup(NodeBuilder& b) const {
            b.reference(aircraft);

            auto W = b.var("W_{mission}", "lbf", "Weight of the aircraft during the mission");
            auto range = b.var("mission_range", params.mission_range, "nautical_mile", "Mission range");
            auto p_ratio = b.var("p_{ratio}", "-", "Sound pressure ratio in hover");

            const ModelNode& passengers = b.child(Passengers{ params.N_passengers, params.W_onePassenger });
            const ModelNode& state = b.child(FlightState{ params.hover_altitude });

            RotorAeroParameters aero = rotorAero(vehicle);
            const ModelNode& takeoff = b.child(Hover{ aircraft, state, W, params.time_in_hover, aero });
            const ModelNode& cruise = b.child(LevelFlight{ aircraft, W, params.V_cruise });
            const ModelNode& landing = b.child(Hover{ aircraft, state, W, params.time_in_hover, aero });
            const ModelNode& reserveTakeoff = b.child(Hover{ aircraft, state, W, params.time_in_hover, aero });
            const ModelNode& reserve = b.child(LevelFlight{ aircraft, W, params.V_loiter });
            const ModelNode& reserveLanding = b.child(Hover{ aircraft, state, W, params.time_in_hover, aero });

            Variable W_noPassengers = b.resolve("W_{noPassengers}");
            Variable MTOW = b.resolve("MTOW");
            Variable C_eff = b.resolve("C_{eff}");

            b.add(W >= W_noPassengers + passengers.topvar("W"));
            b.add(MTOW >= W, "MTOW");

            reserveConstraint(b, params.reserve, reserve, params.loiter_time, params.divert_distance);

            b.add(range == cruise.topvar("segment_range"));

            std::array<MissionSegment, 6> segments{
                MissionSegment::from(takeoff), MissionSegment::from(cruise), MissionSegment::from(landing),
                MissionSegment::from(reserveTakeoff), MissionSegment::from(reserve),
                MissionSegment::from(reserveLanding) };
            b.add(chain(C_eff, segments), "energy");

            b.add(p_ratio == find(takeoff, "p_{ratio}"));
        }
    };

    // ============================================================================
    // TYPICAL MISSION
    // ============================================================================

    /**
     * @brief Revenue mission: one flight, costed per trip
     *
     * @details All cost Variables are dimensionless currency.
     */
    struct OnDemandTypicalMission {
        static constexpr std::string_view type_name = "OnDemandTypicalMission";

        const ModelNode& aircraft;
        TypicalMissionParameters params;
        VehicleParameters vehicle;

        void setup(NodeBuilder& b) const {
            b.reference(aircraft);
            const CostParameters& costs = params.costs;

            auto W = b.var("W_{mission}", "lbf", "Weight of the aircraft during the mission");
            auto range = b.var("mission_range", params.mission_range, "nautical_mile", "Mission range");
            auto p_ratio = b.var("p_{ratio}", "-", "Sound pressure ratio in hover");
            auto t_mission = b.var("t_{mission}", "minutes", "Time to complete mission");
            auto E_mission = b.var("E_{mission}", "kWh", "Electrical energy used during mission");

            auto cost_per_trip = b.var("cost_per_trip", "-", "Cost (in dollars) for one trip");
            auto cptpp = b.var("cost_per_trip_per_passenger", "-", "Cost (in dollars) for one trip, per passenger");
            auto c_vehicle = b.var("c_{vehicle}", "-", "Vehicle acquisition cost per trip");
            auto c_energy = b.var("c_{energy}", "-", "Energy cost per trip");
            auto c_pilot = b.var("c_{pilot}", "-", "Pilot cost per trip");
            auto c_maintenance = b.var("c_{maintenance}", "-", "Maintenance cost per trip");

            auto purchase_price = b.var("purchase_price", "-", "Purchase price of the vehicle");
            auto cost_per_weight = b.var("cost_per_weight", costs.cost_per_weight, "lbf**-1",
                "Cost per unit empty weight of the vehicle");
            auto vehicle_life = b.var("vehicle_life", costs.vehicle_life, "years", "Vehicle lifetime");
            auto cost_per_energy = b.var("cost_per_energy", costs.cost_per_energy, "kWh**-1",
                "Price of electricity");
            auto pilot_salary = b.var("pilot_salary", costs.pilot_salary, "hr**-1", "Pilot salary");
            auto mechanic_salary = b.var("mechanic_salary", costs.mechanic_salary, "hr**-1", "Mechanic salary");
            auto overhaul_cost = b.var("overhaul_cost", "-", "Cost of one overhaul");
            auto overhaul_time = b.var("overhaul_time", costs.overhaul_time, "hours", "Time per overhaul");
            auto N_mechanics = b.var("N_{mechanics}", costs.N_mechanics, "-", "Mechanics per overhaul");
            auto time_between_overhauls = b.var("time_between_overhauls", costs.time_between_overhauls, "hours",
                "Flight time between overhauls");

            const ModelNode& passengers = b.child(Passengers{ params.N_passengers, params.W_onePassenger });
            const ModelNode& state = b.child(FlightState{ params.hover_altitude });

            RotorAeroParameters aero = rotorAero(vehicle);
            const ModelNode& takeoff = b.child(Hover{ aircraft, state, W, params.time_in_hover, aero });
            const ModelNode& cruise = b.child(LevelFlight{ aircraft, W, params.V_cruise });
            const ModelNode& landing = b.child(Hover{ aircraft, state, W, params.time_in_hover, aero });

            Variable W_noPassengers = b.resolve("W_{noPassengers}");
            Variable MTOW = b.resolve("MTOW");

            b.add(W >= W_noPassengers + passengers.topvar("W"));
            b.add(MTOW >= W, "MTOW");
            b.add(range == cruise.topvar("segment_range"));
            b.add(p_ratio == find(takeoff, "p_{ratio}"));

            std::array<MissionSegment, 3> segments{
                MissionSegment::from(takeoff), MissionSegment::from(cruise), MissionSegment::from(landing) };
            b.add(chain(E_mission, segments), "energy");
            b.add(accumulate(t_mission, segmentTimes(segments)), "time");

            // cost per trip
            b.add(cost_per_trip == cptpp * passengers.topvar("N_{passengers}"));
            b.add(cost_per_trip >= c_vehicle + c_energy + c_pilot + c_maintenance, "cost");

            b.add(c_vehicle == purchase_price * t_mission / vehicle_life);
            b.add(purchase_price == cost_per_weight * MTOW);
            b.add(c_energy == E_mission * cost_per_energy);
            b.add(c_pilot == pilot_salary * t_mission);
            b.add(c_maintenance == overhaul_cost * t_mission / time_between_overhauls);
            b.add(overhaul_cost == N_mechanics * overhaul_time * mechanic_salary);
        }
    };

} // namespace evtol::models
