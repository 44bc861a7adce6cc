#pragma once
/*
===============================================================================
ATMOSPHERE — 1976 standard atmosphere up to 86 km
===============================================================================

OVERVIEW
--------
Pure function of geometric altitude. Seven layers, each with a base
altitude, base temperature, base pressure and temperature lapse rate:

    gradient layer (L != 0):  T = T0 + L (h - h0),  p = p0 (T0 / T)^(g0 / (R L))
    isothermal layer (L = 0): T = T0,               p = p0 exp(-g0 (h - h0) / (R T0))

    rho = p / (R T),   a = sqrt(gamma R T),   mu = Sutherland(T)

The troposphere gradient is continued below sea level down to -610 m.

USAGE
-----
    AtmosphereState s = atmosphere(Quantity(0.0, "ft"));
    s.density.in("kg/m^3");          // 1.225
    s.speed_of_sound.in("ft/s");     // 1116.4

EXCEPTION SAFETY
----------------
• A non-length altitude throws UnitMismatchError
• An unbound, non-finite or out-of-range altitude throws DomainError

===============================================================================
*/

#include <array>
#include <cmath>
#include <format>

#include "errors.h"
#include "quantity.h"
#include "units.h"

namespace evtol {

    inline constexpr double kMinAltitude_m = -610.0;
    inline constexpr double kMaxAltitude_m = 86000.0;

    /// @brief Atmospheric properties at one altitude
    struct AtmosphereState {
        double temperature_K;
        Quantity pressure;          // Pa
        Quantity density;           // kg/m^3
        Quantity speed_of_sound;    // m/s
        Quantity viscosity;         // Pa*s, Sutherland
    };

    namespace atmosphere_detail {

        inline constexpr double kR = 287.05287;     // J/(kg*K)
        inline constexpr double kGamma = 1.4;
        inline constexpr double kG0 = 9.80665;      // m/s^2

        struct Layer {
            double base_altitude;       // m
            double base_temperature;    // K
            double base_pressure;       // Pa
            double lapse_rate;          // K/m
        };

        inline constexpr std::array<Layer, 7> kLayers = {{
            {     0.0, 288.15, 101325.0,  -0.0065 },
            { 11000.0, 216.65,  22632.1,   0.0    },
            { 20000.0, 216.65,   5474.89,  0.001  },
            { 32000.0, 228.65,    868.019, 0.0028 },
            { 47000.0, 270.65,    110.906, 0.0    },
            { 51000.0, 270.65,     66.9389,-0.0028 },
            { 71000.0, 214.65,      3.9564,-0.002  },
        }};

        inline double sutherland(double T) {
            constexpr double C1 = 1.458e-6;     // kg/(m*s*sqrt(K))
            constexpr double S = 110.4;         // K
            return C1 * std::sqrt(T) * T / (T + S);
        }

        inline const Layer& layerAt(double h) {
            std::size_t idx = 0;
            for (std::size_t i = 0; i + 1 < kLayers.size(); ++i) {
                if (h >= kLayers[i + 1].base_altitude) idx = i + 1;
                else break;
            }
            return kLayers[idx];
        }

    } // namespace atmosphere_detail

    /**
     * @brief Standard-atmosphere state at @p altitude
     *
     * @throws UnitMismatchError if @p altitude is not a length
     * @throws DomainError outside [-610 m, 86 km] or for an unbound value
     */
    inline AtmosphereState atmosphere(const Quantity& altitude) {
        using namespace atmosphere_detail;

        static const Unit metre = Unit::parse("m");
        if (!altitude.unit().compatible(metre)) {
            throw UnitMismatchError(std::format(
                "atmosphere: altitude unit '{}' is not a length", altitude.unit().symbol()));
        }
        if (!altitude.bound()) {
            throw DomainError("atmosphere: altitude is unbound");
        }
        double h = altitude.in(metre);
        if (!std::isfinite(h) || h < kMinAltitude_m || h > kMaxAltitude_m) {
            throw DomainError(std::format(
                "atmosphere: altitude {} m is outside [{}, {}] m", h, kMinAltitude_m, kMaxAltitude_m));
        }

        const Layer& layer = layerAt(h);
        const double L = layer.lapse_rate;
        const double T0 = layer.base_temperature;
        const double P0 = layer.base_pressure;
        const double h0 = layer.base_altitude;

        double T;
        double P;
        if (std::abs(L) > 1e-12) {
            T = T0 + L * (h - h0);
            P = P0 * std::pow(T0 / T, kG0 / (kR * L));
        }
        else {
            T = T0;
            P = P0 * std::exp(-kG0 * (h - h0) / (kR * T0));
        }

        return AtmosphereState{
            T,
            Quantity(P, "Pa"),
            Quantity(P / (kR * T), "kg/m^3"),
            Quantity(std::sqrt(kGamma * kR * T), "m/s"),
            Quantity(sutherland(T), "Pa*s") };
    }

} // namespace evtol
