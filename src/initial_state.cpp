//─────────────────────────────────────────────────────────────
// File: src/initial_state.cpp
//
// Assembly of the full initial state from a normalized mesh.
//
// Stages performed here, in order:
//   - reference column (uniform z-levels)
//   - analytic bathymetry + ssh
//   - per-cell column construction and tracer initialization
//   - zero placeholders (forcing, boundary layer, Coriolis, velocity)
//
// The per-cell stage is the only one with real cost; cells are
// independent and are distributed over worker threads.
//─────────────────────────────────────────────────────────────
#include "initial_state.hpp"
#include "logger.hpp"
#include "tracers.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <stdexcept>
#include <thread>

namespace itide {

int resolve_thread_count(int threads, std::size_t work_items)
{
    int thread_count = threads;
    if (thread_count <= 0)
        thread_count = static_cast<int>(std::thread::hardware_concurrency());
    if (thread_count < 1)
        thread_count = 1;
    if (work_items > 0 && static_cast<std::size_t>(thread_count) > work_items)
        thread_count = static_cast<int>(work_items);
    return thread_count;
}

CellColumn InitialState::column(std::size_t c) const
{
    const std::size_t begin = cell_level_index(c, 0, nVertLevels);
    const std::size_t end   = begin + nVertLevels;

    CellColumn col;
    col.bottomDepth = bathymetry.bottomDepth[c];
    col.ssh         = bathymetry.ssh[c];
    col.maxLevel    = maxLevelCell[c];
    col.layerThickness.assign(layerThickness.begin() + begin, layerThickness.begin() + end);
    col.restingThickness.assign(restingThickness.begin() + begin, restingThickness.begin() + end);
    col.zMid.assign(zMid.begin() + begin, zMid.begin() + end);
    col.density.assign(density.begin() + begin, density.begin() + end);
    col.temperature.assign(temperature.begin() + begin, temperature.begin() + end);
    col.salinity.assign(salinity.begin() + begin, salinity.begin() + end);
    return col;
}

namespace {

/* copy one column's per-level values into the flattened arrays */
void store_column(InitialState& st, std::size_t c, const CellColumn& col)
{
    const std::size_t base = cell_level_index(c, 0, st.nVertLevels);
    std::copy(col.layerThickness.begin(),   col.layerThickness.end(),   st.layerThickness.begin() + base);
    std::copy(col.restingThickness.begin(), col.restingThickness.end(), st.restingThickness.begin() + base);
    std::copy(col.zMid.begin(),             col.zMid.end(),             st.zMid.begin() + base);
    std::copy(col.density.begin(),          col.density.end(),          st.density.begin() + base);
    std::copy(col.temperature.begin(),      col.temperature.end(),      st.temperature.begin() + base);
    std::copy(col.salinity.begin(),         col.salinity.end(),         st.salinity.begin() + base);
    st.maxLevelCell[c] = col.maxLevel;
}

} // anonymous namespace

/*=====================================================================
  build_initial_state
=====================================================================*/
InitialState build_initial_state(const PlanarMesh& mesh, const CaseConfig& cfg,
                                 int threads, Logger& log)
{
    cfg.validate();

    InitialState st;
    st.nCells      = mesh.nCells;
    st.nEdges      = mesh.nEdges;
    st.nVertices   = mesh.nVertices;
    st.nVertLevels = static_cast<std::size_t>(cfg.nVertLevels);

    st.ref        = build_reference_column(cfg.maxDepth, cfg.nVertLevels);
    st.bathymetry = generate_bathymetry(mesh, cfg.ridge);

    const std::size_t n3d = st.nCells * st.nVertLevels;
    st.temperature.assign(n3d, FILL_3D);
    st.salinity.assign(n3d, FILL_3D);
    st.zMid.assign(n3d, FILL_3D);
    st.layerThickness.assign(n3d, FILL_3D);
    st.restingThickness.assign(n3d, FILL_3D);
    st.density.assign(n3d, FILL_3D);
    st.maxLevelCell.assign(st.nCells, 0);

    /*-------------------------------------------------------------
      Per-cell columns. Each worker handles [begin, end) and writes
      only the slices of those cells. The first failure of each worker
      is kept and rethrown after all workers joined.
    -------------------------------------------------------------*/
    auto process_cells = [&](std::size_t begin, std::size_t end,
                             std::exception_ptr& failure) {
        try {
            for (std::size_t c = begin; c < end; ++c) {
                CellColumn col;
                try {
                    col = build_column(st.ref, st.bathymetry.bottomDepth[c],
                                       st.bathymetry.ssh[c]);
                } catch (const std::domain_error& ex) {
                    throw std::domain_error("cell " + std::to_string(c) + ": " + ex.what());
                }
                initialize_tracers(col, cfg.tracers, cfg.eos);
                store_column(st, c, col);
            }
        } catch (...) {
            failure = std::current_exception();
        }
    };

    const int thread_count = resolve_thread_count(threads, st.nCells);
    std::vector<std::exception_ptr> failures(static_cast<std::size_t>(thread_count));

    if (thread_count == 1 || st.nCells == 0) {
        process_cells(0, st.nCells, failures[0]);
    } else {
        std::vector<std::thread> workers;
        workers.reserve(static_cast<std::size_t>(thread_count));

        std::size_t chunk = (st.nCells + static_cast<std::size_t>(thread_count) - 1) /
                            static_cast<std::size_t>(thread_count);

        for (int t = 0; t < thread_count; ++t) {
            std::size_t begin = static_cast<std::size_t>(t) * chunk;
            if (begin >= st.nCells)
                break;
            std::size_t end = std::min(st.nCells, begin + chunk);
            workers.emplace_back(process_cells, begin, end,
                                 std::ref(failures[static_cast<std::size_t>(t)]));
        }
        for (auto& worker : workers)
            worker.join();
    }
    log.info("Columns built for " + std::to_string(st.nCells) + " cell(s) on " +
             std::to_string(thread_count) + " thread(s)");

    // Chunks are in cell order, so this reports the lowest failing cell.
    for (const auto& f : failures)
        if (f) std::rethrow_exception(f);

    /*-------------------------------------------------------------
      Zero-valued fields
    -------------------------------------------------------------*/
    st.surfaceStress.assign(n3d, 0.0);
    st.atmosphericPressure.assign(n3d, 0.0);
    st.boundaryLayerDepth.assign(n3d, 0.0);

    st.fCell.assign(st.nCells * st.nVertLevels, 0.0);
    st.fEdge.assign(st.nEdges * st.nVertLevels, 0.0);
    st.fVertex.assign(st.nVertices * st.nVertLevels, 0.0);
    st.normalVelocity.assign(st.nEdges * st.nVertLevels, 0.0);

    return st;
}

} // namespace itide
