/*
  File: include/vertical_grid.hpp

  z-level vertical coordinate with partial bottom cells.

  This header defines:
    - itide::ReferenceColumn: the uniform reference grid shared by all cells
    - itide::CellColumn: the adjusted column of one horizontal cell
    - build_reference_column(): uniform layers down to maxDepth
    - build_column(): per-cell partial-bottom-cell construction

  Conventions used throughout:
    - level 0 is the surface layer; index increases downward
    - depths (bottomDepth) are positive down, zMid is negative (z up)
    - maxLevel is a 0-based level index; the writer stores maxLevel + 1
    - only level 0 responds to the free surface (movement weight 1 at
      level 0, 0 below): restingThickness is layerThickness with the ssh
      removed from level 0

  Usage:
    - initial_state.cpp builds one ReferenceColumn and calls
      build_column() for every cell, possibly from several threads.
      build_column() touches no shared state.
*/
#pragma once

#include "common.hpp"

#include <vector>

namespace itide {

/*-------------------------------------------------------------
  ReferenceColumn

  Invariants (established by build_reference_column):
    - bottomDepth[k] = bottomDepth[k-1] + layerThickness[k]
    - zMid[0] = -layerThickness[0]/2,
      zMid[k] = -bottomDepth[k-1] - layerThickness[k]/2
    - movementWeights = {1, 0, 0, ...}
-------------------------------------------------------------*/
struct ReferenceColumn
{
    std::vector<double> layerThickness;
    std::vector<double> bottomDepth;
    std::vector<double> zMid;
    std::vector<double> movementWeights;

    int n_levels() const { return static_cast<int>(layerThickness.size()); }
};

/*
  build_reference_column(maxDepth, nVertLevels)

  Errors:
    - std::invalid_argument if nVertLevels < 2 or maxDepth <= 0
      (the column construction reads level 1 unconditionally)
*/
ReferenceColumn build_reference_column(double maxDepth, int nVertLevels);

/*-------------------------------------------------------------
  CellColumn

  Per-level arrays have n_levels() entries. Levels below maxLevel hold
  FILL_3D in every per-level array.

  Invariant:
    sum(layerThickness[0..maxLevel]) == bottomDepth + ssh
-------------------------------------------------------------*/
struct CellColumn
{
    double bottomDepth = 0.0;
    double ssh         = 0.0;
    int    maxLevel    = 0;

    std::vector<double> layerThickness;
    std::vector<double> restingThickness;
    std::vector<double> zMid;

    // filled by initialize_tracers() (tracers.hpp)
    std::vector<double> density;
    std::vector<double> temperature;
    std::vector<double> salinity;

    bool is_active(int k) const { return k <= maxLevel; }
};

/*
  find_max_level(ref, bottomDepth)

  Scans k = n-1 .. 1 and returns the first (deepest) k with
  bottomDepth > ref.bottomDepth[k-1], i.e. the level that holds the
  seafloor. Returns -1 when the seafloor lies at or above the bottom of
  the first layer.
*/
int find_max_level(const ReferenceColumn& ref, double bottomDepth);

/*
  build_column(ref, bottomDepth, ssh)

  1. maxLevel = find_max_level(); the partial bottom cell absorbs
       bottomDepth - ref.bottomDepth[maxLevel-1]
  2. levels maxLevel-1 .. 1 take the reference thickness; zMid is
     accumulated upward from the level below
  3. level 0 takes ref.layerThickness[0] + ssh
  4. restingThickness = layerThickness with level 0 reset to the
     reference thickness

  Errors:
    - std::domain_error if the seafloor is not deeper than the first
      reference layer (no level can hold it)
*/
CellColumn build_column(const ReferenceColumn& ref, double bottomDepth, double ssh);

} // namespace itide
