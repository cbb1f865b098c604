/*
  File: include/mesh_io.hpp

  netCDF planar-mesh wrapper used by the pipeline and the state writer.

  This header defines:
    - itide::PlanarMesh: element counts and horizontal coordinates of an
      unstructured planar mesh (cells, edges, vertices)
    - itide::MeshFile: RAII-style opener/closer for the input netCDF file

  Usage:
    - pipeline.cpp:
        MeshFile::open(...) on the input path
        MeshFile::read_planar_mesh() to load sizes + coordinates
    - state_writer.cpp:
        MeshFile::file_id() to copy the remaining input dimensions,
        variables and global attributes into the output file

  Sizes / types:
    - netCDF file handles are int.
    - Element counts are std::size_t (netCDF reports dimension lengths as size_t).
    - Coordinates are read as double regardless of their on-disk type.
*/
#pragma once

#include "common.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace itide {

/*-------------------------------------------------------------
  PlanarMesh – horizontal geometry of the input mesh
-------------------------------------------------------------*/
struct PlanarMesh
{
    std::size_t nCells    = 0;
    std::size_t nEdges    = 0;
    std::size_t nVertices = 0;

    std::vector<double> xCell,   yCell;     ///< length nCells
    std::vector<double> xEdge,   yEdge;     ///< length nEdges
    std::vector<double> xVertex, yVertex;   ///< length nVertices
};

/*-------------------------------------------------------------
  MeshFile – opens an input netCDF mesh read-only
-------------------------------------------------------------*/
class MeshFile
{
public:
    MeshFile() = default;
    ~MeshFile();    ///< ensures nc_close

    MeshFile(const MeshFile&) = delete;
    MeshFile& operator=(const MeshFile&) = delete;

    /*
      open(path):
        - Closes any previously opened file, then nc_open(NC_NOWRITE).

      Errors:
        - Throws std::runtime_error (via NC_CALL) if the file cannot be opened.
    */
    void open(const std::string& path);

    /*
      close():
        - If open, calls nc_close and marks the handle invalid.
        - Safe to call multiple times.
    */
    void close();

    /*
      dim_length(name):
        - Length of a named dimension.
        - Throws std::runtime_error if the dimension is missing.
    */
    std::size_t dim_length(const std::string& name) const;

    bool has_dim(const std::string& name) const;
    bool has_var(const std::string& name) const;

    /*
      read_var(name, expected):
        - Reads a whole 1-D variable converted to double.
        - Throws if the variable is missing or its length differs from
          expected.
    */
    std::vector<double> read_var(const std::string& name, std::size_t expected) const;

    /*
      read_planar_mesh():
        - Reads nCells/nEdges/nVertices and the six coordinate arrays
          (xCell, yCell, xEdge, yEdge, xVertex, yVertex).
        - Any missing dimension or variable aborts the run with
          std::runtime_error naming the field.
    */
    PlanarMesh read_planar_mesh() const;

    int file_id() const { return ncid_; }
    bool is_open() const { return isOpen_; }
    const std::string& path() const { return path_; }

private:
    void require_open() const;

    int         ncid_   = -1;
    bool        isOpen_ = false;
    std::string path_;
};

} // namespace itide
