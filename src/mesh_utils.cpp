/*─────────────────────────────────────────────────────────────
  mesh_utils.cpp  –  coordinate shift + extent helpers
  Strategy: one offset per axis taken from the edge coordinates and
            applied to all three element types.
─────────────────────────────────────────────────────────────*/
#include "mesh_utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace itide {

/* small helper: subtract a constant from every entry */
static void shift(std::vector<double>& v, double offset)
{
    for (double& c : v)
        c -= offset;
}

CoordinateOffset normalize_coordinates(PlanarMesh& mesh)
{
    CoordinateOffset off;
    if (mesh.xEdge.empty() || mesh.yEdge.empty())
        return off;

    off.x = *std::min_element(mesh.xEdge.begin(), mesh.xEdge.end());
    off.y = *std::min_element(mesh.yEdge.begin(), mesh.yEdge.end());

    // x - x is exactly zero in IEEE arithmetic, so the minimum edge lands on 0.
    shift(mesh.xCell,   off.x);
    shift(mesh.xEdge,   off.x);
    shift(mesh.xVertex, off.x);
    shift(mesh.yCell,   off.y);
    shift(mesh.yEdge,   off.y);
    shift(mesh.yVertex, off.y);

    return off;
}

Extent x_extent(const PlanarMesh& mesh)
{
    if (mesh.xCell.empty())
        throw std::invalid_argument("Mesh has no cells");

    auto mm = std::minmax_element(mesh.xCell.begin(), mesh.xCell.end());
    return Extent{*mm.first, *mm.second};
}

} // namespace itide
