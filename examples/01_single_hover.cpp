/*
================================================================================
EXAMPLE 01: SINGLE HOVER - Sizing a battery for one hover segment
================================================================================
DIFFICULTY: Beginner
PROBLEM TYPE: Geometric Program (GP)

PROBLEM DESCRIPTION
-------------------
A four-rotor demonstrator weighing 1500 lbf must hover for 90 seconds at sea
level. The rotor disk loading is fixed at 16.3 lbf/ft^2. Find the lightest
battery that supplies the hover energy and power, and the rotor operating
point (tip speed, thrust coefficient, noise) that goes with it.

MATHEMATICAL MODEL
------------------
Design (Demonstrator):
    Rotors:     A = pi R^2,  A_total = N A
    Battery:    C = m C_m,  C_eff = f C,  P_max = P_m m,  W = m g

Performance (HoverFlight/Hover):
    T = W_mission,  T / A_total = 16.3 lbf/ft^2       (substituted)
    rotor momentum / blade-element relations           (RotorsAero)
    E = P t,  P <= P_max                               (BatteryPerformance)
    P_rotors = eta P_battery                           (PowerSystemPerformance)

Mission:
    C_eff >= E

Objective:
    min  m

LIBRARY FEATURES DEMONSTRATED
-----------------------------
- Writing a composite model (type_name + setup)
- NodeBuilder::child / reference        Design and performance models
- compose() + Composer::flatten()       One problem from several trees
- SubstitutionTable                     Pinning a Variable without rebuilding
- SolverAdapter::solve()                Log-space solve through Gurobi
- Solution::value() + Quantity::in()    Reading results in any unit
- modelSummary(), computeSolutionQuality()

================================================================================
*/

#include <iostream>
#include <iomanip>
#include <cmath>
#include <evtol_gp/gp.h>

using namespace evtol;
using namespace evtol::models;

// ============================================================================
// DEMONSTRATOR VEHICLE
// ============================================================================
struct Demonstrator {
    static constexpr std::string_view type_name = "Demonstrator";

    void setup(NodeBuilder& b) const {
        auto g = b.var("g", 9.807, "m/s**2", "Gravitational acceleration");

        b.child(Rotors{ 4, 0.1 });
        const ModelNode& battery = b.child(Battery{ Quantity(300.0, "Wh/kg"), Quantity(3000.0, "W/kg"), 0.8, 1.0 });
        b.child(PowerSystem{ 0.95 });

        b.add(g == battery.topvar("g"));
    }
};

// ============================================================================
// HOVER FLIGHT
// ============================================================================
struct HoverFlight {
    static constexpr std::string_view type_name = "HoverFlight";

    const ModelNode& vehicle;

    void setup(NodeBuilder& b) const {
        b.reference(vehicle.child("Battery"));

        auto W = b.var("W_{mission}", 1500.0, "lbf", "Vehicle weight");
        const ModelNode& state = b.child(FlightState{ Quantity(0.0, "ft") });
        const ModelNode& hover = b.child(Hover{ vehicle, state, W, Quantity(90.0, "s") });

        b.add(b.resolve("C_{eff}") >= hover.topvar("E"), "energy");
    }
};

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Single Hover Battery Sizing\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // BUILD
        // ====================================================================
        ModelNode vehicle = build(Demonstrator{});
        ModelNode flight = build(HoverFlight{ vehicle });

        const ModelNode& battery = vehicle.child("Battery");
        const ModelNode& rotors = vehicle.child("Rotors");
        const ModelNode& hover = flight.child("Hover");
        const ModelNode& aero = hover.child("RotorsAero");

        // Variables are copied out before the trees are moved into the study
        Variable m = battery.topvar("m");
        Variable C = battery.topvar("C");
        Variable R = rotors.topvar("R");
        Variable E = hover.topvar("E");
        Variable P = hover.topvar("P_{battery}");
        Variable VT = aero.topvar("VT");
        Variable omega = aero.topvar("omega");
        Variable CT = aero.topvar("CT");
        Variable FOM = aero.topvar("FOM");
        Variable p_ratio = aero.topvar("p_{ratio}");

        SubstitutionTable substitutions;
        substitutions.set(hover.topvar("T/A"), Quantity(16.3, "lbf/ft^2"));

        FlatSystem system = Composer::flatten(compose("HoverStudy", { std::move(vehicle), std::move(flight) }));

        std::cout << "PROBLEM\n";
        std::cout << "-------\n";
        std::cout << modelSummary(applySubstitutions(system, substitutions)) << "\n\n";

        // ====================================================================
        // SOLVE
        // ====================================================================
        std::cout << "SOLVING...\n";
        std::cout << "----------\n";

        SolverAdapter solver;
        solver.quiet();
        SolveResult result = solver.solve(system, minimize(m), substitutions);

        if (const auto* inf = std::get_if<Infeasible>(&result)) {
            std::cout << "Status: " << inf->status << "\n";
            return 1;
        }
        const Solution& s = std::get<Solution>(result);
        std::cout << "Status: " << s.status << "\n";
        std::cout << "Runtime: " << s.runtime << " seconds\n";

        // ====================================================================
        // DISPLAY RESULTS
        // ====================================================================
        std::cout << std::fixed << std::setprecision(2);

        std::cout << "\nBATTERY\n";
        std::cout << "-------\n";
        std::cout << "  Mass:            " << std::setw(10) << s.value(m).in("kg") << " kg\n";
        std::cout << "  Capacity:        " << std::setw(10) << s.value(C).in("kWh") << " kWh\n";
        std::cout << "  Hover energy:    " << std::setw(10) << s.value(E).in("kWh") << " kWh\n";
        std::cout << "  Hover power:     " << std::setw(10) << s.value(P).in("kW") << " kW\n";

        std::cout << "\nROTORS\n";
        std::cout << "------\n";
        std::cout << "  Radius:          " << std::setw(10) << s.value(R).in("ft") << " ft\n";
        std::cout << "  Tip speed:       " << std::setw(10) << s.value(VT).in("ft/s") << " ft/s\n";
        std::cout << "  Rotational speed:" << std::setw(10) << s.value(omega).in("rpm") << " rpm\n";
        std::cout << "  Thrust coeff.:   " << std::setw(10) << std::setprecision(4) << s.value(CT).in("-") << "\n";
        std::cout << "  Figure of merit: " << std::setw(10) << s.value(FOM).in("-") << "\n";
        std::cout << std::setprecision(1);
        std::cout << "  SPL at 500 ft:   " << std::setw(10) << 20.0 * std::log10(s.value(p_ratio).in("-")) << " dB\n";

        SolutionQuality q = computeSolutionQuality(applySubstitutions(system, substitutions), s);
        std::cout << "\nLargest relative constraint violation: " << std::scientific << q.maxRelativeViolation
                  << " (" << q.worstConstraint << ")\n";

    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
