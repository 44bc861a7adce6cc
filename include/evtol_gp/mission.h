#pragma once
/*
===============================================================================
MISSION — Segment chaining, accumulation and the reserve requirement
===============================================================================

OVERVIEW
--------
A mission is an ordered sequence of flight segments (takeoff, cruise,
landing, reserve, ...). Each built segment node exposes its own energy and
time Variables. Missions tie them to mission-level budgets:

    chain(C_eff, segments)          C_eff >= E_0 + E_1 + ... + E_n
    accumulate(t_mission, times)    t_mission >= t_0 + t_1 + ... + t_n

The order of segments is kept for reporting only; the sums are
order-independent.

RESERVE POLICY
--------------
Every mission selects exactly one reserve requirement at build time:

    FixedDuration  ("FAA",  "duration", "fixed_duration")
        t_{loiter} == t of the reserve segment       (45 min by default)
    FixedDistance  ("Uber", "distance", "fixed_distance")
        R_{divert} == segment_range of the reserve    (2 nmi by default)

Any other spelling is a ConfigurationError; there is no default policy.

===============================================================================
*/

#include <format>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "constraints.h"
#include "enum_utils.h"
#include "errors.h"
#include "expressions.h"
#include "model.h"
#include "quantity.h"
#include "variables.h"

namespace evtol {

    // ============================================================================
    // MISSION SEGMENT
    // ============================================================================

    /**
     * @struct MissionSegment
     * @brief Energy and time Variables of one built segment node
     */
    struct MissionSegment {
        std::string name;
        Variable energy;
        Variable time;
        ModelPath path;

        /**
         * @brief Extract the segment Variables of a built node
         * @throws UnresolvedVariableError if the node lacks either symbol
         */
        static MissionSegment from(const ModelNode& node, std::string_view energySymbol = "E",
                                   std::string_view timeSymbol = "t")
        {
            return MissionSegment{
                node.path().empty() ? node.type() : node.path().leaf(),
                node.topvar(energySymbol),
                node.topvar(timeSymbol),
                node.path() };
        }
    };

    /**
     * @brief Mission energy budget: @p total >= sum of the segments' energy
     * @throws std::invalid_argument if @p segments is empty
     * @throws UnitMismatchError if an energy Variable is not compatible with @p total
     */
    inline Constraint chain(const Variable& total, std::span<const MissionSegment> segments) {
        if (segments.empty()) {
            throw std::invalid_argument(std::format("chain: no segments for '{}'", total.name()));
        }
        std::vector<Variable> energies;
        energies.reserve(segments.size());
        for (const auto& s : segments) energies.push_back(s.energy);
        return total >= sum(energies);
    }

    /**
     * @brief Generic sum bound: @p total >= sum of @p parts
     * @throws std::invalid_argument if @p parts is empty
     */
    inline Constraint accumulate(const Variable& total, std::span<const Variable> parts) {
        if (parts.empty()) {
            throw std::invalid_argument(std::format("accumulate: nothing to accumulate into '{}'", total.name()));
        }
        return total >= sum(parts);
    }

    /// @brief Time Variables of @p segments, in order
    inline std::vector<Variable> segmentTimes(std::span<const MissionSegment> segments) {
        std::vector<Variable> out;
        for (const auto& s : segments) out.push_back(s.time);
        return out;
    }

    // ============================================================================
    // RESERVE POLICY
    // ============================================================================

    DECLARE_ENUM_WITH_COUNT(ReservePolicy, FixedDuration, FixedDistance);

    inline constexpr EnumArray<ReservePolicy, std::string_view> kReservePolicyNames = {
        "FixedDuration", "FixedDistance"
    };

    inline std::string_view reservePolicyName(ReservePolicy p) {
        return enum_name(p, kReservePolicyNames);
    }

    /**
     * @brief Parse a reserve-policy selector
     * @throws ConfigurationError for anything but the accepted spellings
     */
    inline ReservePolicy parseReservePolicy(std::string_view text) {
        if (auto p = enum_parse<ReservePolicy>(text, kReservePolicyNames)) return *p;
        if (text == "FAA" || text == "duration" || text == "fixed_duration") return ReservePolicy::FixedDuration;
        if (text == "Uber" || text == "distance" || text == "fixed_distance") return ReservePolicy::FixedDistance;
        throw ConfigurationError(std::format(
            "parseReservePolicy: unknown reserve policy '{}' (expected FAA/duration or Uber/distance)", text));
    }

    /**
     * @brief Declare the reserve Variable on @p b and add the one reserve constraint
     *
     * @param b        Mission builder
     * @param policy   Selected policy
     * @param reserve  Built reserve (loiter) segment
     * @param duration Required loiter time (FixedDuration)
     * @param distance Required diversion distance (FixedDistance)
     * @return The constraint that was added
     */
    inline Constraint reserveConstraint(NodeBuilder& b, ReservePolicy policy, const ModelNode& reserve,
                                        const Quantity& duration, const Quantity& distance)
    {
        switch (policy) {
            case ReservePolicy::FixedDuration: {
                Variable t_loiter = b.var("t_{loiter}", duration, "minutes", "Loiter time");
                Constraint c = t_loiter == reserve.topvar("t");
                b.add(c, "reserve");
                return c;
            }
            case ReservePolicy::FixedDistance: {
                Variable R_divert = b.var("R_{divert}", distance, "nautical_mile", "Diversion distance");
                Constraint c = R_divert == reserve.topvar("segment_range");
                b.add(c, "reserve");
                return c;
            }
            case ReservePolicy::COUNT:
                break;
        }
        throw ConfigurationError(std::format(
            "reserveConstraint: invalid reserve policy value {}", static_cast<int>(policy)));
    }

} // namespace evtol
