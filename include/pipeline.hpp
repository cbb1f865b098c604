/*
  File: include/pipeline.hpp

  End-to-end run of the initial-state generator:

      load mesh -> normalize coordinates -> reference column ->
      bathymetry -> columns + tracers -> write

  Used by itide_main.cpp and by the end-to-end tests, which call
  run_pipeline() directly on a synthetic mesh file.
*/
#pragma once

#include "case_config.hpp"
#include "mesh_utils.hpp"

#include <string>

namespace itide {

class Logger;

struct RunOptions {
    std::string inputPath  = "base_mesh.nc";
    std::string outputPath = "initial_state.nc";
    CaseConfig  config;
    int         threads    = 0;    ///< 0 -> hardware concurrency
};

struct RunSummary {
    std::size_t nCells    = 0;
    std::size_t nEdges    = 0;
    std::size_t nVertices = 0;
    CoordinateOffset offset;
    double xMid          = 0.0;
    int    minMaxLevel   = 0;   ///< shallowest column, 0-based
    int    maxMaxLevel   = 0;   ///< deepest column, 0-based
    double totalSeconds  = 0.0;
};

/*
  run_pipeline(opts, log)

  Throws whatever the stages throw (std::runtime_error for I/O,
  std::invalid_argument for configuration, std::domain_error for an
  unrepresentable seafloor). Nothing is written unless every stage
  before the writer succeeded.
*/
RunSummary run_pipeline(const RunOptions& opts, Logger& log);

} // namespace itide
