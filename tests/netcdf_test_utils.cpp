/**
 * @file netcdf_test_utils.cpp
 * @brief Implementation of the test mesh writer and readers
 */

#include "netcdf_test_utils.hpp"
#include "common.hpp"

#include <atomic>
#include <fstream>
#include <iterator>
#include <random>

#include <netcdf.h>

namespace itide_test {

namespace {

struct NcHandle {
    int id = -1;
    ~NcHandle() { if (id >= 0) nc_close(id); }
};

int def_1d(int nc, const char* name, nc_type type, int dim)
{
    int var = -1;
    NC_CALL(nc_def_var(nc, name, type, 1, &dim, &var), std::string("def ") + name);
    return var;
}

} // anonymous namespace

void write_planar_mesh(const std::string& path, const TestMeshLayout& s)
{
    const std::size_t nx = static_cast<std::size_t>(s.nx);
    const std::size_t ny = static_cast<std::size_t>(s.ny);

    std::vector<double> xCell, yCell, xEdge, yEdge, xVertex, yVertex, areaCell;
    std::vector<int> indexToCellID;

    for (std::size_t j = 0; j < ny; ++j)
        for (std::size_t i = 0; i < nx; ++i) {
            xCell.push_back(s.x0 + (static_cast<double>(i) + 0.5) * s.dc);
            yCell.push_back(s.y0 + (static_cast<double>(j) + 0.5) * s.dc);
            areaCell.push_back(s.dc * s.dc);
            indexToCellID.push_back(static_cast<int>(xCell.size()));
        }

    // vertical sides, then horizontal sides
    for (std::size_t j = 0; j < ny; ++j)
        for (std::size_t i = 0; i <= nx; ++i) {
            xEdge.push_back(s.x0 + static_cast<double>(i) * s.dc);
            yEdge.push_back(s.y0 + (static_cast<double>(j) + 0.5) * s.dc);
        }
    for (std::size_t j = 0; j <= ny; ++j)
        for (std::size_t i = 0; i < nx; ++i) {
            xEdge.push_back(s.x0 + (static_cast<double>(i) + 0.5) * s.dc);
            yEdge.push_back(s.y0 + static_cast<double>(j) * s.dc);
        }

    for (std::size_t j = 0; j <= ny; ++j)
        for (std::size_t i = 0; i <= nx; ++i) {
            xVertex.push_back(s.x0 + static_cast<double>(i) * s.dc);
            yVertex.push_back(s.y0 + static_cast<double>(j) * s.dc);
        }

    NcHandle nc;
    NC_CALL(nc_create(path.c_str(), NC_CLOBBER, &nc.id), "create " + path);

    const std::string title = "synthetic planar test mesh";
    NC_CALL(nc_put_att_text(nc.id, NC_GLOBAL, "title", title.size(), title.c_str()), "title");
    const char on_a_sphere[] = "NO";
    NC_CALL(nc_put_att_text(nc.id, NC_GLOBAL, "on_a_sphere", 2, on_a_sphere), "on_a_sphere");

    int dCells = -1, dEdges = -1, dVerts = -1;
    NC_CALL(nc_def_dim(nc.id, "nCells", xCell.size(), &dCells), "nCells");
    NC_CALL(nc_def_dim(nc.id, "nEdges", xEdge.size(), &dEdges), "nEdges");
    NC_CALL(nc_def_dim(nc.id, "nVertices", xVertex.size(), &dVerts), "nVertices");

    int vxc = def_1d(nc.id, "xCell", NC_DOUBLE, dCells);
    int vyc = def_1d(nc.id, "yCell", NC_DOUBLE, dCells);
    int vxe = def_1d(nc.id, "xEdge", NC_DOUBLE, dEdges);
    int vye = def_1d(nc.id, "yEdge", NC_DOUBLE, dEdges);
    int vxv = def_1d(nc.id, "xVertex", NC_DOUBLE, dVerts);
    int vyv = s.withYVertex ? def_1d(nc.id, "yVertex", NC_DOUBLE, dVerts) : -1;
    int var = def_1d(nc.id, "areaCell", NC_DOUBLE, dCells);
    int vid = def_1d(nc.id, "indexToCellID", NC_INT, dCells);

    const char units[] = "m";
    NC_CALL(nc_put_att_text(nc.id, vxc, "units", 1, units), "units");

    NC_CALL(nc_enddef(nc.id), "enddef");

    NC_CALL(nc_put_var_double(nc.id, vxc, xCell.data()), "xCell");
    NC_CALL(nc_put_var_double(nc.id, vyc, yCell.data()), "yCell");
    NC_CALL(nc_put_var_double(nc.id, vxe, xEdge.data()), "xEdge");
    NC_CALL(nc_put_var_double(nc.id, vye, yEdge.data()), "yEdge");
    NC_CALL(nc_put_var_double(nc.id, vxv, xVertex.data()), "xVertex");
    if (vyv >= 0)
        NC_CALL(nc_put_var_double(nc.id, vyv, yVertex.data()), "yVertex");
    NC_CALL(nc_put_var_double(nc.id, var, areaCell.data()), "areaCell");
    NC_CALL(nc_put_var_int(nc.id, vid, indexToCellID.data()), "indexToCellID");

    const int id = nc.id;
    nc.id = -1;
    NC_CALL(nc_close(id), "close " + path);
}

std::size_t dim_length(const std::string& path, const std::string& dim)
{
    NcHandle nc;
    NC_CALL(nc_open(path.c_str(), NC_NOWRITE, &nc.id), "open " + path);
    int d = -1;
    NC_CALL(nc_inq_dimid(nc.id, dim.c_str(), &d), "dim " + dim);
    std::size_t len = 0;
    NC_CALL(nc_inq_dimlen(nc.id, d, &len), "dimlen " + dim);
    return len;
}

bool has_variable(const std::string& path, const std::string& var)
{
    NcHandle nc;
    NC_CALL(nc_open(path.c_str(), NC_NOWRITE, &nc.id), "open " + path);
    int v = -1;
    return nc_inq_varid(nc.id, var.c_str(), &v) == NC_NOERR;
}

bool has_attribute(const std::string& path, const std::string& var, const std::string& att)
{
    NcHandle nc;
    NC_CALL(nc_open(path.c_str(), NC_NOWRITE, &nc.id), "open " + path);
    int v = -1;
    NC_CALL(nc_inq_varid(nc.id, var.c_str(), &v), "var " + var);
    int attnum = -1;
    return nc_inq_attid(nc.id, v, att.c_str(), &attnum) == NC_NOERR;
}

std::string global_text_attribute(const std::string& path, const std::string& att)
{
    NcHandle nc;
    NC_CALL(nc_open(path.c_str(), NC_NOWRITE, &nc.id), "open " + path);
    std::size_t len = 0;
    NC_CALL(nc_inq_attlen(nc.id, NC_GLOBAL, att.c_str(), &len), "attlen " + att);
    std::string text(len, '\0');
    if (len > 0)
        NC_CALL(nc_get_att_text(nc.id, NC_GLOBAL, att.c_str(), &text[0]), "att " + att);
    return text;
}

namespace {

std::size_t var_size(int nc, int v)
{
    int ndims = 0;
    NC_CALL(nc_inq_varndims(nc, v, &ndims), "ndims");
    std::vector<int> dims(static_cast<std::size_t>(ndims));
    if (ndims > 0)
        NC_CALL(nc_inq_vardimid(nc, v, dims.data()), "dimids");
    std::size_t n = 1;
    for (int d : dims) {
        std::size_t len = 0;
        NC_CALL(nc_inq_dimlen(nc, d, &len), "dimlen");
        n *= len;
    }
    return n;
}

} // anonymous namespace

std::vector<double> read_doubles(const std::string& path, const std::string& var)
{
    NcHandle nc;
    NC_CALL(nc_open(path.c_str(), NC_NOWRITE, &nc.id), "open " + path);
    int v = -1;
    NC_CALL(nc_inq_varid(nc.id, var.c_str(), &v), "var " + var);
    std::vector<double> out(var_size(nc.id, v));
    if (!out.empty())
        NC_CALL(nc_get_var_double(nc.id, v, out.data()), "read " + var);
    return out;
}

std::vector<int> read_ints(const std::string& path, const std::string& var)
{
    NcHandle nc;
    NC_CALL(nc_open(path.c_str(), NC_NOWRITE, &nc.id), "open " + path);
    int v = -1;
    NC_CALL(nc_inq_varid(nc.id, var.c_str(), &v), "var " + var);
    std::vector<int> out(var_size(nc.id, v));
    if (!out.empty())
        NC_CALL(nc_get_var_int(nc.id, v, out.data()), "read " + var);
    return out;
}

std::vector<char> file_bytes(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(in),
                             std::istreambuf_iterator<char>());
}

TempDir::TempDir()
{
    static std::atomic<int> counter{0};
    std::random_device rd;
    dir_ = std::filesystem::temp_directory_path() /
           ("itide_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(dir_);
}

TempDir::~TempDir()
{
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
}

} // namespace itide_test
