/*─────────────────────────────────────────────────────────────
  File: include/common.hpp
  Types & helpers shared across itide modules

  This header defines:
  - Fill (sentinel) values used for entries that were never computed
  - Flat indexing for (cell, level) arrays
  - A netCDF error-handling macro that converts C-style status codes
    into C++ exceptions

  Design intent:
  - No heavy dependencies
  - No ownership of large data

  Keeping these primitives here prevents cyclic dependencies between
  the mesh, vertical-grid and writer modules.
─────────────────────────────────────────────────────────────*/
#pragma once

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

namespace itide {

/*----------- FILL_3D ------------------*/
/*
  Sentinel stored in every (Time, nCells, nVertLevels) tracer-shaped array
  before the column builder touches it.

  Entries below the deepest active level keep this value in the output,
  which lets the solver and post-processing tell them apart from data.
*/
constexpr double FILL_3D = -9.0;

/*----------- FILL_1D ------------------*/
/*
  Sentinel for per-level and per-cell 1-D arrays prior to computation.
  Every 1-D array is fully assigned by the pipeline, so NaN surviving to
  the writer means a stage was skipped.
*/
constexpr double FILL_1D = std::numeric_limits<double>::quiet_NaN();

/*----------- cell_level_index ------------------*/
/*
  Linear index into a flattened (nCells, nVertLevels) array.

  Layout:
    - cell-major, level fastest (matches the netCDF dimension order
      Time x nCells x nVertLevels with Time of length 1)
*/
inline std::size_t cell_level_index(std::size_t cell, std::size_t level,
                                    std::size_t n_levels)
{
    return cell * n_levels + level;
}

/*----------- NC_CALL -----------------------*/
/*
  Macro wrapper for netCDF C API calls.

  Behavior:
    - Evaluates a netCDF function call
    - If the return value is not NC_NOERR:
        * Throws std::runtime_error with the provided message followed
          by the library's nc_strerror() text

  Example:
    NC_CALL(nc_open(path.c_str(), NC_NOWRITE, &ncid), "netCDF: cannot open " + path);

  Requirements:
    - This macro expects nc_strerror() to be available (from netcdf.h).
*/
#define NC_CALL(expr, msg)                                          \
    do {                                                            \
        if (int _ncstat = (expr)) {                                 \
            throw std::runtime_error(std::string(msg) + ": " +      \
                                     nc_strerror(_ncstat));         \
        }                                                           \
    } while (0)

} // namespace itide
