/*─────────────────────────────────────────────────────────────
  File: src/vertical_grid.cpp

  Reference z-level grid and per-cell partial-bottom-cell columns.

  The column is assembled bottom-up:

        level 0     ref + ssh        <- free surface lives here only
        level 1     ref
        ...         ref
        maxLevel    partial          <- truncated at the seafloor
        below       FILL_3D

  zMid is integrated upward from the partial cell using the thicknesses
  actually stored, so zMid[0] == ssh - layerThickness[0]/2.
─────────────────────────────────────────────────────────────*/
#include "vertical_grid.hpp"

#include <sstream>
#include <stdexcept>

namespace itide {

/*=====================================================================
  build_reference_column
=====================================================================*/
ReferenceColumn build_reference_column(double maxDepth, int nVertLevels)
{
    if (nVertLevels < 2)
        throw std::invalid_argument("nVertLevels must be at least 2, got " +
                                    std::to_string(nVertLevels));
    if (!(maxDepth > 0.0))
        throw std::invalid_argument("maxDepth must be positive");

    const auto n = static_cast<std::size_t>(nVertLevels);

    ReferenceColumn ref;
    ref.layerThickness.assign(n, maxDepth / nVertLevels);   // equally spaced
    ref.bottomDepth.assign(n, FILL_1D);
    ref.zMid.assign(n, FILL_1D);
    ref.movementWeights.assign(n, 0.0);

    ref.bottomDepth[0] = ref.layerThickness[0];
    ref.zMid[0]        = -0.5 * ref.layerThickness[0];
    for (std::size_t k = 1; k < n; ++k) {
        ref.bottomDepth[k] = ref.bottomDepth[k - 1] + ref.layerThickness[k];
        ref.zMid[k]        = -ref.bottomDepth[k - 1] - 0.5 * ref.layerThickness[k];
    }

    // z-level: ssh in top layer only
    ref.movementWeights[0] = 1.0;

    return ref;
}

/*=====================================================================
  find_max_level
=====================================================================*/
int find_max_level(const ReferenceColumn& ref, double bottomDepth)
{
    for (int k = ref.n_levels() - 1; k > 0; --k) {
        if (bottomDepth > ref.bottomDepth[static_cast<std::size_t>(k - 1)])
            return k;
    }
    return -1;
}

/*=====================================================================
  build_column
=====================================================================*/
CellColumn build_column(const ReferenceColumn& ref, double bottomDepth, double ssh)
{
    const int maxLevel = find_max_level(ref, bottomDepth);
    if (maxLevel < 0) {
        std::ostringstream oss;
        oss << "bottomDepth " << bottomDepth
            << " is not below the first reference layer (bottom at "
            << ref.bottomDepth[0] << "); no level can hold the seafloor";
        throw std::domain_error(oss.str());
    }

    const auto n = static_cast<std::size_t>(ref.n_levels());
    const auto kb = static_cast<std::size_t>(maxLevel);

    CellColumn col;
    col.bottomDepth = bottomDepth;
    col.ssh         = ssh;
    col.maxLevel    = maxLevel;
    col.layerThickness.assign(n, FILL_3D);
    col.zMid.assign(n, FILL_3D);
    col.density.assign(n, FILL_3D);
    col.temperature.assign(n, FILL_3D);
    col.salinity.assign(n, FILL_3D);

    std::vector<double>& h = col.layerThickness;
    std::vector<double>& z = col.zMid;

    /* Partial bottom cell */
    h[kb] = bottomDepth - ref.bottomDepth[kb - 1];
    z[kb] = -bottomDepth + 0.5 * h[kb];

    /* Full interior cells, integrated upward */
    for (std::size_t k = kb - 1; k >= 1; --k) {
        h[k] = ref.layerThickness[k];
        z[k] = z[k + 1] + 0.5 * (h[k + 1] + h[k]);
    }

    /* Top cell carries the free-surface displacement */
    h[0] = ref.layerThickness[0] + ssh;
    z[0] = z[1] + 0.5 * (h[1] + h[0]);

    col.restingThickness = h;
    col.restingThickness[0] = ref.layerThickness[0];

    return col;
}

} // namespace itide
