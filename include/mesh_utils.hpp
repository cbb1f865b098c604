/*
  File: include/mesh_utils.hpp

  In-memory edits applied to a loaded PlanarMesh before the vertical
  grid is built.

    - normalize_coordinates:
        Shifts every x coordinate by min(xEdge) and every y coordinate by
        min(yEdge) so the lower-left edge sits at the origin.

        Called in:
          - pipeline.cpp right after the mesh is read.

    - x_extent:
        Minimum and maximum of xCell; the bathymetry ridge is centred on
        their midpoint.
*/
#pragma once

#include "mesh_io.hpp"

namespace itide {

struct CoordinateOffset {
    double x = 0.0;
    double y = 0.0;
};

/*
  normalize_coordinates(mesh)

  Effects:
    - x{Cell,Edge,Vertex} -= min(xEdge)
    - y{Cell,Edge,Vertex} -= min(yEdge)
    - afterwards min(xEdge) == 0 and min(yEdge) == 0 exactly
    - a mesh without edges is left untouched (offset 0,0)

  Returns:
    - the offsets that were subtracted
*/
CoordinateOffset normalize_coordinates(PlanarMesh& mesh);

struct Extent {
    double min = 0.0;
    double max = 0.0;
    double mid() const { return 0.5 * (min + max); }
};

/*
  x_extent(mesh)

  Throws std::invalid_argument for a mesh without cells.
*/
Extent x_extent(const PlanarMesh& mesh);

} // namespace itide
