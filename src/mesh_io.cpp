/*─────────────────────────────────────────────────────────────
  File: src/mesh_io.cpp

  netCDF mesh input.

  This file implements:
    - MeshFile::open / MeshFile::close
    - Dimension / variable queries on the open file
    - read_planar_mesh(): the fields the initial-state pipeline
      consumes from an MPAS-style planar base mesh

  Scope and assumptions:
    - Only the six horizontal coordinate arrays and the three element
      counts are interpreted here; everything else in the file is
      passed through untouched by state_writer.cpp.
    - Mesh topology is not validated.
─────────────────────────────────────────────────────────────*/
#include "mesh_io.hpp"

#include <netcdf.h>

namespace itide {

/*=====================================================================
  MeshFile::open
=====================================================================*/
void MeshFile::open(const std::string& path)
{
    if (isOpen_) close();

    NC_CALL(nc_open(path.c_str(), NC_NOWRITE, &ncid_),
        "netCDF: cannot open mesh file " + path);

    path_   = path;
    isOpen_ = true;
}

/*=====================================================================
  MeshFile::close

  Safe to call multiple times; only acts when a file is open.
=====================================================================*/
void MeshFile::close()
{
    if (!isOpen_)
        return;
    isOpen_ = false;
    NC_CALL(nc_close(ncid_), "netCDF: nc_close failed for " + path_);
    ncid_ = -1;
}

/*=====================================================================
  MeshFile destructor

  Destructors must not throw, so a failing nc_close here is ignored
  (the file was opened read-only; nothing can be lost).
=====================================================================*/
MeshFile::~MeshFile()
{
    if (isOpen_)
        nc_close(ncid_);
}

void MeshFile::require_open() const
{
    if (!isOpen_)
        throw std::runtime_error("MeshFile: no mesh file is open");
}

bool MeshFile::has_dim(const std::string& name) const
{
    require_open();
    int dimid = -1;
    return nc_inq_dimid(ncid_, name.c_str(), &dimid) == NC_NOERR;
}

bool MeshFile::has_var(const std::string& name) const
{
    require_open();
    int varid = -1;
    return nc_inq_varid(ncid_, name.c_str(), &varid) == NC_NOERR;
}

std::size_t MeshFile::dim_length(const std::string& name) const
{
    require_open();
    int dimid = -1;
    NC_CALL(nc_inq_dimid(ncid_, name.c_str(), &dimid),
        "netCDF: dimension '" + name + "' not found in " + path_);

    std::size_t len = 0;
    NC_CALL(nc_inq_dimlen(ncid_, dimid, &len),
        "netCDF: nc_inq_dimlen failed for '" + name + "'");
    return len;
}

/*=====================================================================
  MeshFile::read_var

  Reads a 1-D variable of any numeric on-disk type as double
  (nc_get_var_double performs the conversion).
=====================================================================*/
std::vector<double> MeshFile::read_var(const std::string& name,
                                       std::size_t expected) const
{
    require_open();
    int varid = -1;
    NC_CALL(nc_inq_varid(ncid_, name.c_str(), &varid),
        "netCDF: variable '" + name + "' not found in " + path_);

    int ndims = 0;
    NC_CALL(nc_inq_varndims(ncid_, varid, &ndims),
        "netCDF: nc_inq_varndims failed for '" + name + "'");
    if (ndims != 1)
        throw std::runtime_error("Mesh variable '" + name + "' must be 1-D, has " +
                                 std::to_string(ndims) + " dimension(s)");

    int dimid = -1;
    NC_CALL(nc_inq_vardimid(ncid_, varid, &dimid),
        "netCDF: nc_inq_vardimid failed for '" + name + "'");
    std::size_t len = 0;
    NC_CALL(nc_inq_dimlen(ncid_, dimid, &len),
        "netCDF: nc_inq_dimlen failed for '" + name + "'");
    if (len != expected)
        throw std::runtime_error("Mesh variable '" + name + "' has length " +
                                 std::to_string(len) + ", expected " +
                                 std::to_string(expected));

    std::vector<double> values(len);
    if (len > 0)
        NC_CALL(nc_get_var_double(ncid_, varid, values.data()),
            "netCDF: cannot read variable '" + name + "'");
    return values;
}

/*=====================================================================
  MeshFile::read_planar_mesh
=====================================================================*/
PlanarMesh MeshFile::read_planar_mesh() const
{
    PlanarMesh mesh;
    mesh.nCells    = dim_length("nCells");
    mesh.nEdges    = dim_length("nEdges");
    mesh.nVertices = dim_length("nVertices");

    mesh.xCell   = read_var("xCell",   mesh.nCells);
    mesh.yCell   = read_var("yCell",   mesh.nCells);
    mesh.xEdge   = read_var("xEdge",   mesh.nEdges);
    mesh.yEdge   = read_var("yEdge",   mesh.nEdges);
    mesh.xVertex = read_var("xVertex", mesh.nVertices);
    mesh.yVertex = read_var("yVertex", mesh.nVertices);

    return mesh;
}

} // namespace itide
