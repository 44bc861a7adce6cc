/*
================================================================================
EXAMPLE 02: TWO-SEGMENT MISSION - Takeoff and cruise with a reserve
================================================================================
DIFFICULTY: Intermediate
PROBLEM TYPE: Geometric Program (GP)

PROBLEM DESCRIPTION
-------------------
An on-demand air taxi carries one passenger 30 nautical miles: a two-minute
hover at takeoff followed by cruise at 150 mph. A reserve segment is flown
at 100 mph under one of two policies:

    FAA   (FixedDuration)  loiter for 20 minutes
    Uber  (FixedDistance)  divert 15 nautical miles

The battery must hold the energy of all three segments. Find the lightest
vehicle (minimum takeoff weight) under each policy.

MATHEMATICAL MODEL
------------------
Vehicle (OnDemandAircraft):
    W_noPassengers >= W_rotors + W_battery + W_crew + W_structure + W_power
    W_structure = 0.3444 MTOW

Mission (ShuttleMission):
    W_mission >= W_noPassengers + W_passengers
    MTOW >= W_mission
    mission_range = cruise range
    reserve:  t_loiter = t_reserve        (FAA)
              R_divert = range_reserve    (Uber)
    C_eff >= E_takeoff + E_cruise + E_reserve

Objective:
    min  MTOW

LIBRARY FEATURES DEMONSTRATED
-----------------------------
- MissionSegment::from() + chain()      Energy budget over built segments
- reserveConstraint()                   Policy-selected reserve
- parseReservePolicy()                  FAA / Uber spellings
- find()                                Symbol search in a subtree
- Infeasible / Solution                 Inspecting a SolveResult

Usage: 02_two_segment_mission [FAA|Uber]
    With no argument both policies are solved.

================================================================================
*/

#include <iostream>
#include <iomanip>
#include <array>
#include <vector>
#include <cmath>
#include <evtol_gp/gp.h>

using namespace evtol;
using namespace evtol::models;

// ============================================================================
// MISSION MODEL
// ============================================================================
struct ShuttleMission {
    static constexpr std::string_view type_name = "ShuttleMission";

    const ModelNode& aircraft;
    ReservePolicy policy;

    void setup(NodeBuilder& b) const {
        b.reference(aircraft);

        auto W = b.var("W_{mission}", "lbf", "Weight of the aircraft during the mission");
        auto range = b.var("mission_range", 30.0, "nautical_mile", "Mission range");

        const ModelNode& passengers = b.child(Passengers{ 1, Quantity(200.0, "lbf") });
        const ModelNode& state = b.child(FlightState{ Quantity(0.0, "ft") });

        const ModelNode& takeoff = b.child(Hover{ aircraft, state, W, Quantity(2.0, "minutes") });
        const ModelNode& cruise = b.child(LevelFlight{ aircraft, W, Quantity(150.0, "mph") });
        const ModelNode& reserve = b.child(LevelFlight{ aircraft, W, Quantity(100.0, "mph") });

        b.add(W >= b.resolve("W_{noPassengers}") + passengers.topvar("W"));
        b.add(b.resolve("MTOW") >= W, "MTOW");
        b.add(range == cruise.topvar("segment_range"));

        reserveConstraint(b, policy, reserve, Quantity(20.0, "minutes"), Quantity(15.0, "nautical_mile"));

        std::array<MissionSegment, 3> segments{
            MissionSegment::from(takeoff), MissionSegment::from(cruise), MissionSegment::from(reserve) };
        b.add(chain(b.resolve("C_{eff}"), segments), "energy");
    }
};

// ============================================================================
// SOLVE ONE POLICY
// ============================================================================
static bool solvePolicy(ReservePolicy policy) {
    std::cout << "RESERVE POLICY: " << reservePolicyName(policy) << "\n";
    std::cout << "----------------------------------------\n";

    VehicleParameters params;
    params.N = 8;

    ModelNode vehicle = build(OnDemandAircraft{ params });
    ModelNode mission = build(ShuttleMission{ vehicle, policy });

    Variable MTOW = vehicle.topvar("MTOW");
    Variable W_battery = vehicle.child("Battery").topvar("W");
    Variable C_eff = vehicle.topvar("C_{eff}");
    Variable p_ratio = find(mission.child("Hover"), "p_{ratio}");

    std::vector<MissionSegment> segments;
    for (const auto& node : mission.children()) {
        if (node.type() == "Hover" || node.type() == "LevelFlight") {
            segments.push_back(MissionSegment::from(node));
        }
    }

    SubstitutionTable substitutions;
    substitutions.set(mission.child("Hover").topvar("T/A"), Quantity(16.3, "lbf/ft^2"));

    FlatSystem system = Composer::flatten(compose("ShuttleStudy", { std::move(vehicle), std::move(mission) }));

    SolverAdapter solver;
    solver.quiet();
    SolveResult result = solver.solve(system, minimize(MTOW), substitutions);

    if (const auto* inf = std::get_if<Infeasible>(&result)) {
        std::cout << "  Status: " << inf->status << "\n";
        for (const auto& label : inf->iis) {
            std::cout << "    conflicting: " << label << "\n";
        }
        return false;
    }
    const Solution& s = std::get<Solution>(result);

    std::cout << std::fixed << std::setprecision(1);
    std::cout << "  MTOW:             " << std::setw(10) << s.value(MTOW).in("lbf") << " lbf\n";
    std::cout << "  Battery weight:   " << std::setw(10) << s.value(W_battery).in("lbf") << " lbf\n";
    std::cout << "  Usable capacity:  " << std::setw(10) << s.value(C_eff).in("kWh") << " kWh\n";
    std::cout << "  Takeoff SPL:      " << std::setw(10) << 20.0 * std::log10(s.value(p_ratio).in("-")) << " dB\n";

    std::cout << "\n  " << std::left << std::setw(16) << "Segment" << std::right
              << std::setw(12) << "Energy (kWh)" << std::setw(14) << "Time (min)" << "\n";
    for (const auto& seg : segments) {
        std::cout << "  " << std::left << std::setw(16) << seg.name << std::right
                  << std::setw(12) << std::setprecision(2) << s.value(seg.energy).in("kWh")
                  << std::setw(14) << s.value(seg.time).in("minutes") << "\n";
    }
    std::cout << "\n";
    return true;
}

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main(int argc, char** argv) {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 02: Two-Segment Mission with Reserve\n";
    std::cout << "================================================================\n\n";

    try {
        std::vector<ReservePolicy> policies;
        if (argc > 1) {
            policies.push_back(parseReservePolicy(argv[1]));
        } else {
            policies = { ReservePolicy::FixedDuration, ReservePolicy::FixedDistance };
        }

        bool ok = true;
        for (ReservePolicy p : policies) {
            ok = solvePolicy(p) && ok;
        }
        if (!ok) return 1;

    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "================================================================\n";
    return 0;
}
