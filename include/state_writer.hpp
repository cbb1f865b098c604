/*
  File: include/state_writer.hpp

  Writes the initial-condition netCDF file.

  Output contents:
    - every dimension, global attribute and variable of the input mesh,
      except the variables regenerated below (data copied verbatim, except
      xCell/yCell/xEdge/yEdge/xVertex/yVertex which receive the
      normalized coordinates)
    - Time (unlimited, length 1) and nVertLevels dimensions when the
      input does not already define them
    - the generated fields listed by generated_field_names()

  Format:
    - classic 64-bit offset (NC_64BIT_OFFSET), existing files clobbered

  Fill values:
    - a double field that still contains NaN is written with the NaNs
      replaced by NC_FILL_DOUBLE and a matching _FillValue attribute;
      fields without NaN carry no _FillValue
    - maxLevelCell is written as int32, 1-based
*/
#pragma once

#include "initial_state.hpp"
#include "mesh_io.hpp"

#include <string>
#include <vector>

namespace itide {

class Logger;

/*
  generated_field_names()

  Names of every variable this tool writes itself, in output order.
  Input variables with these names are not copied.
*/
const std::vector<std::string>& generated_field_names();

struct WriteSummary {
    std::size_t copiedVariables    = 0;   ///< passed through from the input
    std::size_t generatedVariables = 0;
    std::size_t filledVariables    = 0;   ///< written with a _FillValue
};

/*
  write_initial_state(path, source, mesh, state, log)

  Parameters:
    path   : output file (created/clobbered)
    source : open input mesh; read for pass-through content
    mesh   : normalized mesh (coordinates written in place of the input's)
    state  : computed fields

  Throws:
    - std::runtime_error on any netCDF failure, or if the input defines
      nVertLevels with a different length than the state
*/
WriteSummary write_initial_state(const std::string& path, const MeshFile& source,
                                 const PlanarMesh& mesh, const InitialState& state,
                                 Logger& log);

} // namespace itide
