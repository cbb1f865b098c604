/*
  File: include/initial_state.hpp

  InitialState: every array written to the initial-condition file, and
  the routine that computes them from a normalized mesh.

  Layout:
    - per-level arrays live in `ref` (ReferenceColumn)
    - per-cell arrays live in `bathymetry` and `maxLevelCell`
    - per-(cell, level) arrays are flattened with cell_level_index()
      (Time has length 1 and is not stored)
    - fEdge / normalVelocity are (nEdges, nVertLevels), fVertex is
      (nVertices, nVertLevels), all zero

  maxLevelCell holds the 0-based deepest active level; the writer adds 1.
*/
#pragma once

#include "bathymetry.hpp"
#include "case_config.hpp"
#include "mesh_io.hpp"
#include "vertical_grid.hpp"

#include <cstddef>
#include <vector>

namespace itide {

class Logger;

struct InitialState
{
    std::size_t nCells      = 0;
    std::size_t nEdges      = 0;
    std::size_t nVertices   = 0;
    std::size_t nVertLevels = 0;

    ReferenceColumn ref;
    Bathymetry      bathymetry;
    std::vector<int> maxLevelCell;

    // (Time=1, nCells, nVertLevels)
    std::vector<double> temperature;
    std::vector<double> salinity;
    std::vector<double> zMid;
    std::vector<double> layerThickness;
    std::vector<double> restingThickness;
    std::vector<double> density;
    std::vector<double> surfaceStress;
    std::vector<double> atmosphericPressure;
    std::vector<double> boundaryLayerDepth;

    // Coriolis placeholders
    std::vector<double> fCell;     ///< (nCells, nVertLevels)
    std::vector<double> fEdge;     ///< (nEdges, nVertLevels)
    std::vector<double> fVertex;   ///< (nVertices, nVertLevels)

    std::vector<double> normalVelocity;  ///< (Time=1, nEdges, nVertLevels)

    /*
      column(c): copy of cell c's per-level values as a CellColumn
      (convenience for inspection and tests).
    */
    CellColumn column(std::size_t c) const;
};

/*
  resolve_thread_count(threads, work_items)

  threads <= 0 selects std::thread::hardware_concurrency(); the result
  is clamped to [1, work_items] (at least 1).
*/
int resolve_thread_count(int threads, std::size_t work_items);

/*
  build_initial_state(mesh, cfg, threads, log)

  Builds the reference column, the bathymetry, and then every cell
  column with tracers. Cells are split into contiguous chunks across
  `threads` workers; each worker writes only its own cells' slices, so
  the result does not depend on the thread count.

  Errors:
    - std::invalid_argument from an invalid cfg
    - std::domain_error naming the first failing cell when a seafloor
      cannot be represented on the reference grid
*/
InitialState build_initial_state(const PlanarMesh& mesh, const CaseConfig& cfg,
                                 int threads, Logger& log);

} // namespace itide
