//─────────────────────────────────────────────────────────────
// File: src/pipeline.cpp
//
// Orchestration of one initial-state run. Geometry, vertical grid,
// tracers and netCDF output live in their own modules; this file only
// sequences them and reports progress.
//─────────────────────────────────────────────────────────────
#include "pipeline.hpp"
#include "initial_state.hpp"
#include "logger.hpp"
#include "mesh_io.hpp"
#include "state_writer.hpp"

#include <algorithm>
#include <sstream>

namespace itide {

RunSummary run_pipeline(const RunOptions& opts, Logger& log)
{
    StageTimer total(log, "generate internal tide initial state");
    RunSummary summary;

    opts.config.validate();
    log.info("Case     : " + describe(opts.config));

    /*---------------------------------------------------------
      Mesh
    ---------------------------------------------------------*/
    MeshFile source;
    PlanarMesh mesh;
    {
        StageTimer t(log, "obtain dimensions and mesh variables");
        source.open(opts.inputPath);
        mesh = source.read_planar_mesh();
        log.info("Mesh     : nCells=" + std::to_string(mesh.nCells) +
                 " nEdges=" + std::to_string(mesh.nEdges) +
                 " nVertices=" + std::to_string(mesh.nVertices));

        summary.offset = normalize_coordinates(mesh);
        std::ostringstream oss;
        oss << "Shifted coordinates by (" << -summary.offset.x << ", "
            << -summary.offset.y << ") so the first edge is at the origin";
        log.info(oss.str());
    }

    /*---------------------------------------------------------
      Vertical grid, bathymetry, tracers
    ---------------------------------------------------------*/
    InitialState state;
    {
        StageTimer t(log, "create and initialize variables");
        state = build_initial_state(mesh, opts.config, opts.threads, log);

        std::ostringstream oss;
        oss << "Ridge centred at x = " << state.bathymetry.xMid;
        log.info(oss.str());
    }

    if (!state.maxLevelCell.empty()) {
        auto mm = std::minmax_element(state.maxLevelCell.begin(), state.maxLevelCell.end());
        summary.minMaxLevel = *mm.first;
        summary.maxMaxLevel = *mm.second;
        log.info("Active levels per column: " + std::to_string(summary.minMaxLevel + 1) +
                 " .. " + std::to_string(summary.maxMaxLevel + 1));
    }

    /*---------------------------------------------------------
      Output
    ---------------------------------------------------------*/
    {
        StageTimer t(log, "finalize and write file");
        write_initial_state(opts.outputPath, source, mesh, state, log);
        source.close();
    }

    summary.nCells    = mesh.nCells;
    summary.nEdges    = mesh.nEdges;
    summary.nVertices = mesh.nVertices;
    summary.xMid      = state.bathymetry.xMid;
    summary.totalSeconds = total.seconds();
    total.finish();
    return summary;
}

} // namespace itide
