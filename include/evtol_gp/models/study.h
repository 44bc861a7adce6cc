#pragma once
/*
===============================================================================
STUDY — Vehicle plus sizing and typical missions as one problem
===============================================================================

OVERVIEW
--------
buildStudy() builds the vehicle once and flies both missions with it, so
the two missions share one set of design Variables:

    OnDemandStudy
    ├── OnDemandAircraft
    ├── OnDemandSizingMission     (references OnDemandAircraft)
    └── OnDemandTypicalMission    (references OnDemandAircraft)

The hover disk loading of every sizing-mission Hover is pinned through the
substitution table rather than fixed in the model, and the objective is the
typical-mission cost per trip.

USAGE
-----
    StudyParameters params;                 // representative defaults
    Study study = buildStudy(params);

    SolverAdapter solver;
    solver.quiet();
    SolveResult r = solveStudy(study, solver);
    if (const auto* s = std::get_if<Solution>(&r)) {
        std::cout << StudyReport::from(study, *s).str();
    }

===============================================================================
*/

#include <cmath>
#include <format>
#include <string>

#include "../composer.h"
#include "../config.h"
#include "../log_space.h"
#include "../logging.h"
#include "../mission.h"
#include "../model.h"
#include "../solution.h"
#include "../solver_adapter.h"
#include "../substitutions.h"
#include "missions.h"
#include "vehicle.h"

namespace evtol::models {

    /**
     * @struct Study
     * @brief Composed problem ready to solve
     */
    struct Study {
        ModelNode root;
        FlatSystem system;
        SubstitutionTable substitutions;
        Objective objective;
        StudyParameters params;
    };

    /**
     * @brief Build the composed study problem
     * @throws ConfigurationError if @p params is invalid
     */
    inline Study buildStudy(const StudyParameters& params) {
        params.validate();

        ModelNode vehicle = build(OnDemandAircraft{ params.vehicle });
        ModelNode sizing = build(OnDemandSizingMission{ vehicle, params.sizing, params.vehicle });
        ModelNode typical = build(OnDemandTypicalMission{ vehicle, params.typical, params.vehicle });

        SubstitutionTable substitutions;
        if (params.hover_disk_loading) {
            for (const auto& segment : sizing.children()) {
                if (segment.type() == "Hover") {
                    substitutions.set(segment.topvar("T/A"), *params.hover_disk_loading);
                }
            }
        }

        Objective objective = minimize(typical.topvar("cost_per_trip"));

        ModelNode root = compose("OnDemandStudy", { std::move(vehicle), std::move(sizing), std::move(typical) });
        FlatSystem system = Composer::flatten(root);

        logger()->info("study: {} nodes, {} substitutions, reserve {}", root.subtreeSize(), substitutions.size(),
            reservePolicyName(params.sizing.reserve));

        return Study{ std::move(root), std::move(system), std::move(substitutions), std::move(objective), params };
    }

    inline SolveResult solveStudy(const Study& study, SolverAdapter& solver) {
        return solver.solve(study.system, study.objective, study.substitutions);
    }

    // ============================================================================
    // REPORT
    // ============================================================================

    /**
     * @struct StudyReport
     * @brief Headline numbers of a solved study
     */
    struct StudyReport {
        Quantity MTOW;
        Quantity W_battery;
        Quantity W_sizing;
        Quantity W_typical;
        double SPL_sizing = 0.0;        ///< dB, 20 log10(p_ratio)
        double SPL_typical = 0.0;
        Quantity t_mission;
        double cost_per_trip = 0.0;
        double cost_per_trip_per_passenger = 0.0;
        double purchase_price = 0.0;
        double overhaul_cost = 0.0;
        double c_vehicle = 0.0;
        double c_energy = 0.0;
        double c_pilot = 0.0;
        double c_maintenance = 0.0;
        std::string reserve;

        /**
         * @throws UnresolvedVariableError if @p solution does not belong to @p study
         */
        static StudyReport from(const Study& study, const Solution& solution) {
            const ModelNode& aircraft = study.root.child("OnDemandAircraft");
            const ModelNode& sizing = study.root.child("OnDemandSizingMission");
            const ModelNode& typical = study.root.child("OnDemandTypicalMission");

            auto plain = [&](const ModelNode& node, std::string_view symbol) {
                return solution.value(node.topvar(symbol)).in("-");
            };

            StudyReport r;
            r.MTOW = solution.value(aircraft.topvar("MTOW")).to("lbf");
            r.W_battery = solution.value(aircraft.child("Battery").topvar("W")).to("lbf");
            r.W_sizing = solution.value(sizing.topvar("W_{mission}")).to("lbf");
            r.W_typical = solution.value(typical.topvar("W_{mission}")).to("lbf");
            r.SPL_sizing = 20.0 * std::log10(plain(sizing, "p_{ratio}"));
            r.SPL_typical = 20.0 * std::log10(plain(typical, "p_{ratio}"));
            r.t_mission = solution.value(typical.topvar("t_{mission}")).to("minutes");
            r.cost_per_trip = plain(typical, "cost_per_trip");
            r.cost_per_trip_per_passenger = plain(typical, "cost_per_trip_per_passenger");
            r.purchase_price = plain(typical, "purchase_price");
            r.overhaul_cost = plain(typical, "overhaul_cost");
            r.c_vehicle = plain(typical, "c_{vehicle}");
            r.c_energy = plain(typical, "c_{energy}");
            r.c_pilot = plain(typical, "c_{pilot}");
            r.c_maintenance = plain(typical, "c_{maintenance}");

            switch (study.params.sizing.reserve) {
                case ReservePolicy::FixedDuration:
                    r.reserve = std::format("{} loiter", study.params.sizing.loiter_time.to("minutes").str());
                    break;
                case ReservePolicy::FixedDistance:
                    r.reserve = std::format("{} diversion",
                        study.params.sizing.divert_distance.to("nautical_mile").str());
                    break;
                case ReservePolicy::COUNT:
                    break;
            }
            return r;
        }

        [[nodiscard]] std::string str() const {
            std::string out;
            out += std::format("MTOW                      {:10.1f} lbf\n", MTOW.in("lbf"));
            out += std::format("Battery weight            {:10.1f} lbf\n", W_battery.in("lbf"));
            out += std::format("Sizing mission weight     {:10.1f} lbf\n", W_sizing.in("lbf"));
            out += std::format("Typical mission weight    {:10.1f} lbf\n", W_typical.in("lbf"));
            out += std::format("Sizing mission SPL        {:10.1f} dB\n", SPL_sizing);
            out += std::format("Typical mission SPL       {:10.1f} dB\n", SPL_typical);
            out += std::format("Typical mission time      {:10.2f} minutes\n", t_mission.in("minutes"));
            out += std::format("Cost per trip             {:10.2f}\n", cost_per_trip);
            out += std::format("Cost per trip, passenger  {:10.2f}\n", cost_per_trip_per_passenger);
            out += std::format("  vehicle                 {:10.2f}\n", c_vehicle);
            out += std::format("  energy                  {:10.2f}\n", c_energy);
            out += std::format("  pilot                   {:10.2f}\n", c_pilot);
            out += std::format("  maintenance             {:10.2f}\n", c_maintenance);
            out += std::format("Purchase price            {:10.0f}\n", purchase_price);
            out += std::format("Overhaul cost             {:10.2f}\n", overhaul_cost);
            out += std::format("Reserve                   {}\n", reserve);
            return out;
        }
    };

} // namespace evtol::models
