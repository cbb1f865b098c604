#include "bathymetry.hpp"
#include "mesh_utils.hpp"

#include <cmath>

namespace itide {

double ridge_bottom_depth(double x, double xMid, const RidgeParams& p)
{
    const double s = (x - xMid) / p.halfWidth;
    return p.baseDepth - p.height * std::exp(-s * s);
}

double ramp_ssh(double x, const RidgeParams& p)
{
    return x / p.sshRampLength;
}

Bathymetry generate_bathymetry(const PlanarMesh& mesh, const RidgeParams& params)
{
    Bathymetry b;
    b.xMid = x_extent(mesh).mid();

    b.bottomDepth.resize(mesh.nCells);
    b.ssh.resize(mesh.nCells);
    for (std::size_t c = 0; c < mesh.nCells; ++c) {
        b.bottomDepth[c] = ridge_bottom_depth(mesh.xCell[c], b.xMid, params);
        b.ssh[c]         = ramp_ssh(mesh.xCell[c], params);
    }
    b.bottomDepthObserved = b.bottomDepth;

    return b;
}

} // namespace itide
