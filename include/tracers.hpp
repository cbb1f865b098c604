/*
  File: include/tracers.hpp

  Initial tracer profiles and the linear equation of state they are
  consistent with.

  The ocean solver is run with a linear equation of state

      rho = densityRef - alpha * (T - Tref) + beta * (S - Sref)

  The case prescribes a linearly stratified density and uniform
  salinity S = S0; the temperature follows by inverting the EOS at that
  salinity:

      T = Tref - (rho - densityRef - beta * (S - Sref)) / alpha
*/
#pragma once

#include "vertical_grid.hpp"

namespace itide {

/*
  TracerParams

  rho(z) = rho0 + rhoz * z, with z = zMid (negative below the surface),
  so rhoz < 0 gives density increasing with depth.
*/
struct TracerParams {
    double S0   = 35.0;      ///< uniform salinity (PSU)
    double rho0 = 1000.0;    ///< density at z = 0 (kg/m^3)
    double rhoz = -2.0e-4;   ///< d rho / dz (kg/m^3 per m)
};

struct LinearEos {
    double alpha      = 0.2;     ///< thermal expansion (kg/m^3/degC)
    double beta       = 0.8;     ///< haline contraction (kg/m^3/PSU)
    double Tref       = 10.0;    ///< degC
    double Sref       = 35.0;    ///< PSU
    double densityRef = 1000.0;  ///< kg/m^3

    double density(double T, double S) const
    {
        return densityRef - alpha * (T - Tref) + beta * (S - Sref);
    }

    // Inverse in T at fixed S: density(temperature(rho, S), S) == rho
    double temperature(double rho, double S) const
    {
        return Tref - (rho - densityRef - beta * (S - Sref)) / alpha;
    }
};

/*
  initialize_tracers(col, tracers, eos)

  For every active level k <= col.maxLevel:
    salinity[k]    = S0
    density[k]     = rho0 + rhoz * zMid[k]
    temperature[k] = eos.temperature(density[k], S0)
  Inactive levels keep FILL_3D.
*/
void initialize_tracers(CellColumn& col, const TracerParams& tracers,
                        const LinearEos& eos);

} // namespace itide
