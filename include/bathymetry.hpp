/*
  File: include/bathymetry.hpp

  Synthetic seafloor and free-surface shape of the internal-tide case.

  The seafloor is a Gaussian ridge rising from a flat abyssal plain,
  centred on the middle of the domain (Marsaleix et al. 2008, p. 81):

      bottomDepth(x) = baseDepth - height * exp(-((x - xMid) / halfWidth)^2)

  The free surface is a linear ramp, 0 at x = 0 and 1 at x = sshRampLength:

      ssh(x) = x / sshRampLength

  Lengths are in metres.
*/
#pragma once

#include "mesh_io.hpp"

#include <vector>

namespace itide {

struct RidgeParams {
    double baseDepth     = 5000.0;   ///< depth far from the ridge
    double height        = 1000.0;   ///< ridge crest height above baseDepth
    double halfWidth     = 150.0e3;  ///< e-folding half-width
    double sshRampLength = 4800.0e3; ///< x at which ssh reaches 1
};

double ridge_bottom_depth(double x, double xMid, const RidgeParams& p);
double ramp_ssh(double x, const RidgeParams& p);

/*
  Bathymetry

  Per-cell fields produced by generate_bathymetry(). bottomDepthObserved
  is written alongside bottomDepth and is identical to it for an
  analytic seafloor.
*/
struct Bathymetry {
    double xMid = 0.0;
    std::vector<double> bottomDepth;
    std::vector<double> bottomDepthObserved;
    std::vector<double> ssh;
};

/*
  generate_bathymetry(mesh, params)

  xMid is the midpoint of min/max xCell of the (already normalized) mesh.
*/
Bathymetry generate_bathymetry(const PlanarMesh& mesh, const RidgeParams& params);

} // namespace itide
