/*─────────────────────────────────────────────────────────────
  File: src/state_writer.cpp

  netCDF writer for the initial-condition file.

  Write sequence (single define phase, then data phase):

    1. create output (NC_CLOBBER | NC_64BIT_OFFSET)
    2. copy global attributes
    3. copy input dimensions; add Time / nVertLevels if missing
    4. define pass-through variables (same type, dims, attributes)
    5. define generated variables
    6. nc_enddef
    7. copy pass-through data (normalized coordinates substituted)
    8. write generated data
    9. nc_close

  Pass-through data is moved as raw bytes of the variable's external
  type (nc_get_vara / nc_put_vara), so no numeric conversion occurs.
─────────────────────────────────────────────────────────────*/
#include "state_writer.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_map>
#include <unordered_set>

#include <netcdf.h>

namespace itide {

namespace {

/*=====================================================================
  OutputFile

  Owns the output ncid. close() reports failures; the destructor only
  runs on the error path and must not throw.
=====================================================================*/
class OutputFile {
public:
    explicit OutputFile(const std::string& path) : path_(path)
    {
        NC_CALL(nc_create(path.c_str(), NC_CLOBBER | NC_64BIT_OFFSET, &ncid_),
            "netCDF: cannot create output file " + path);
        open_ = true;
    }
    ~OutputFile() { if (open_) nc_close(ncid_); }

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    void close()
    {
        if (!open_) return;
        open_ = false;
        NC_CALL(nc_close(ncid_), "netCDF: nc_close failed for " + path_);
    }

    int id() const { return ncid_; }

private:
    std::string path_;
    int  ncid_ = -1;
    bool open_ = false;
};

/*---------------------------------------------------------
  One generated output variable
---------------------------------------------------------*/
struct FieldDef {
    std::string name;
    std::vector<std::string> dims;
    const std::vector<double>* data  = nullptr;
    std::vector<int>           idata;            // maxLevelCell only
    int  varid = -1;
    bool fill  = false;
};

/*---------------------------------------------------------
  One variable copied from the input
---------------------------------------------------------*/
struct CopyPlan {
    int inVar  = -1;
    int outVar = -1;
    std::string name;
    std::vector<std::size_t> shape;               // input dimension lengths
    const std::vector<double>* replacement = nullptr;
};

bool has_nan(const std::vector<double>& v)
{
    return std::any_of(v.begin(), v.end(), [](double x) { return std::isnan(x); });
}

std::vector<FieldDef> make_field_defs(const InitialState& st)
{
    const std::vector<std::string> levels = {"nVertLevels"};
    const std::vector<std::string> cells  = {"nCells"};
    const std::vector<std::string> cell3d = {"Time", "nCells", "nVertLevels"};

    std::vector<FieldDef> defs;

    FieldDef mlc;
    mlc.name = "maxLevelCell";
    mlc.dims = cells;
    mlc.idata.reserve(st.maxLevelCell.size());
    for (int k : st.maxLevelCell)
        mlc.idata.push_back(k + 1);             // 1-based for the solver
    defs.push_back(std::move(mlc));

    auto add = [&](const char* name, const std::vector<std::string>& dims,
                   const std::vector<double>& data) {
        FieldDef f;
        f.name = name;
        f.dims = dims;
        f.data = &data;
        defs.push_back(std::move(f));
    };

    add("refLayerThickness",        levels, st.ref.layerThickness);
    add("refBottomDepth",           levels, st.ref.bottomDepth);
    add("refZMid",                  levels, st.ref.zMid);
    add("vertCoordMovementWeights", levels, st.ref.movementWeights);

    add("ssh",                 cells, st.bathymetry.ssh);
    add("bottomDepth",         cells, st.bathymetry.bottomDepth);
    add("bottomDepthObserved", cells, st.bathymetry.bottomDepthObserved);

    add("temperature",         cell3d, st.temperature);
    add("salinity",            cell3d, st.salinity);
    add("zMid",                cell3d, st.zMid);
    add("layerThickness",      cell3d, st.layerThickness);
    add("restingThickness",    cell3d, st.restingThickness);
    add("density",             cell3d, st.density);
    add("surfaceStress",       cell3d, st.surfaceStress);
    add("atmosphericPressure", cell3d, st.atmosphericPressure);
    add("boundaryLayerDepth",  cell3d, st.boundaryLayerDepth);

    add("fCell",   {"nCells",    "nVertLevels"}, st.fCell);
    add("fEdge",   {"nEdges",    "nVertLevels"}, st.fEdge);
    add("fVertex", {"nVertices", "nVertLevels"}, st.fVertex);

    add("normalVelocity", {"Time", "nEdges", "nVertLevels"}, st.normalVelocity);

    return defs;
}

std::size_t product(const std::vector<std::size_t>& shape)
{
    std::size_t n = 1;
    for (std::size_t s : shape) n *= s;
    return n;
}

} // anonymous namespace

const std::vector<std::string>& generated_field_names()
{
    static const std::vector<std::string> names = {
        "maxLevelCell",
        "refLayerThickness", "refBottomDepth", "refZMid", "vertCoordMovementWeights",
        "ssh", "bottomDepth", "bottomDepthObserved",
        "temperature", "salinity", "zMid", "layerThickness", "restingThickness",
        "density", "surfaceStress", "atmosphericPressure", "boundaryLayerDepth",
        "fCell", "fEdge", "fVertex",
        "normalVelocity"
    };
    return names;
}

/*=====================================================================
  write_initial_state
=====================================================================*/
WriteSummary write_initial_state(const std::string& path, const MeshFile& source,
                                 const PlanarMesh& mesh, const InitialState& st,
                                 Logger& log)
{
    if (!source.is_open())
        throw std::runtime_error("write_initial_state: input mesh is not open");

    const int in = source.file_id();
    WriteSummary summary;

    OutputFile outFile(path);
    const int out = outFile.id();

    /*---------------------------------------------------------
      Global attributes
    ---------------------------------------------------------*/
    int nGlobalAtts = 0;
    NC_CALL(nc_inq_natts(in, &nGlobalAtts), "netCDF: nc_inq_natts failed");
    for (int a = 0; a < nGlobalAtts; ++a) {
        char attname[NC_MAX_NAME + 1] = "";
        NC_CALL(nc_inq_attname(in, NC_GLOBAL, a, attname), "netCDF: nc_inq_attname failed");
        NC_CALL(nc_copy_att(in, NC_GLOBAL, attname, out, NC_GLOBAL),
            std::string("netCDF: cannot copy global attribute ") + attname);
    }

    /*---------------------------------------------------------
      Dimensions
    ---------------------------------------------------------*/
    int nInDims = 0;
    NC_CALL(nc_inq_dimids(in, &nInDims, nullptr, 0), "netCDF: nc_inq_dimids failed");
    std::vector<int> inDimIds(static_cast<std::size_t>(nInDims));
    if (nInDims > 0)
        NC_CALL(nc_inq_dimids(in, &nInDims, inDimIds.data(), 0), "netCDF: nc_inq_dimids failed");

    int inUnlimited = -1;
    NC_CALL(nc_inq_unlimdim(in, &inUnlimited), "netCDF: nc_inq_unlimdim failed");

    std::map<int, int> dimMap;                         // input dimid -> output dimid
    std::unordered_map<int, std::size_t> inDimLen;     // input dimid -> length
    std::unordered_map<std::string, int> outDims;      // name -> output dimid

    for (int d : inDimIds) {
        char dname[NC_MAX_NAME + 1] = "";
        std::size_t len = 0;
        NC_CALL(nc_inq_dim(in, d, dname, &len), "netCDF: nc_inq_dim failed");

        if (std::string(dname) == "nVertLevels" && len != st.nVertLevels)
            throw std::runtime_error("Input mesh defines nVertLevels = " +
                                     std::to_string(len) + " but " +
                                     std::to_string(st.nVertLevels) + " were requested");

        int od = -1;
        NC_CALL(nc_def_dim(out, dname, d == inUnlimited ? NC_UNLIMITED : len, &od),
            std::string("netCDF: cannot define dimension ") + dname);
        dimMap[d]      = od;
        inDimLen[d]    = len;
        outDims[dname] = od;
    }

    if (outDims.find("Time") == outDims.end()) {
        int od = -1;
        NC_CALL(nc_def_dim(out, "Time", NC_UNLIMITED, &od),
            "netCDF: cannot define dimension Time");
        outDims["Time"] = od;
    }
    if (outDims.find("nVertLevels") == outDims.end()) {
        int od = -1;
        NC_CALL(nc_def_dim(out, "nVertLevels", st.nVertLevels, &od),
            "netCDF: cannot define dimension nVertLevels");
        outDims["nVertLevels"] = od;
    }

    /*---------------------------------------------------------
      Pass-through variables
    ---------------------------------------------------------*/
    const std::unordered_set<std::string> generated(generated_field_names().begin(),
                                                    generated_field_names().end());
    const std::map<std::string, const std::vector<double>*> normalized = {
        {"xCell", &mesh.xCell},     {"yCell", &mesh.yCell},
        {"xEdge", &mesh.xEdge},     {"yEdge", &mesh.yEdge},
        {"xVertex", &mesh.xVertex}, {"yVertex", &mesh.yVertex}
    };

    int nInVars = 0;
    NC_CALL(nc_inq_varids(in, &nInVars, nullptr), "netCDF: nc_inq_varids failed");
    std::vector<int> inVarIds(static_cast<std::size_t>(nInVars));
    if (nInVars > 0)
        NC_CALL(nc_inq_varids(in, &nInVars, inVarIds.data()), "netCDF: nc_inq_varids failed");

    std::vector<CopyPlan> copies;
    for (int v : inVarIds) {
        char vname[NC_MAX_NAME + 1] = "";
        nc_type xtype = NC_NAT;
        int ndims = 0, natts = 0;
        int vdims[NC_MAX_VAR_DIMS];
        NC_CALL(nc_inq_var(in, v, vname, &xtype, &ndims, vdims, &natts),
            "netCDF: nc_inq_var failed");

        if (generated.count(vname)) {
            log.info(std::string("Replacing input variable ") + vname);
            continue;
        }

        CopyPlan cs;
        cs.inVar = v;
        cs.name  = vname;
        std::vector<int> odims(static_cast<std::size_t>(ndims));
        for (int i = 0; i < ndims; ++i) {
            odims[static_cast<std::size_t>(i)] = dimMap.at(vdims[i]);
            cs.shape.push_back(inDimLen.at(vdims[i]));
        }

        NC_CALL(nc_def_var(out, vname, xtype, ndims, ndims ? odims.data() : nullptr, &cs.outVar),
            std::string("netCDF: cannot define variable ") + vname);

        for (int a = 0; a < natts; ++a) {
            char attname[NC_MAX_NAME + 1] = "";
            NC_CALL(nc_inq_attname(in, v, a, attname), "netCDF: nc_inq_attname failed");
            NC_CALL(nc_copy_att(in, v, attname, out, cs.outVar),
                std::string("netCDF: cannot copy attribute ") + vname + ":" + attname);
        }

        auto it = normalized.find(cs.name);
        if (it != normalized.end())
            cs.replacement = it->second;

        copies.push_back(std::move(cs));
    }

    /*---------------------------------------------------------
      Generated variables
    ---------------------------------------------------------*/
    std::vector<FieldDef> fields = make_field_defs(st);
    for (auto& f : fields) {
        std::vector<int> dimids;
        for (const auto& dn : f.dims)
            dimids.push_back(outDims.at(dn));

        const nc_type xtype = f.data ? NC_DOUBLE : NC_INT;
        NC_CALL(nc_def_var(out, f.name.c_str(), xtype, static_cast<int>(dimids.size()),
                           dimids.data(), &f.varid),
            "netCDF: cannot define variable " + f.name);

        if (f.data && has_nan(*f.data)) {
            const double fv = NC_FILL_DOUBLE;
            NC_CALL(nc_put_att_double(out, f.varid, "_FillValue", NC_DOUBLE, 1, &fv),
                "netCDF: cannot set _FillValue on " + f.name);
            f.fill = true;
            ++summary.filledVariables;
        }
    }

    NC_CALL(nc_enddef(out), "netCDF: nc_enddef failed");

    /*---------------------------------------------------------
      Pass-through data
    ---------------------------------------------------------*/
    for (const auto& cs : copies) {
        const std::size_t count = product(cs.shape);
        if (count == 0)
            continue;

        if (cs.replacement) {
            if (cs.replacement->size() != count)
                throw std::runtime_error("Normalized coordinate " + cs.name +
                                         " does not match its input length");
            std::vector<std::size_t> start(cs.shape.size(), 0);
            NC_CALL(nc_put_vara_double(out, cs.outVar, start.data(), cs.shape.data(),
                                       cs.replacement->data()),
                "netCDF: cannot write variable " + cs.name);
            ++summary.copiedVariables;
            continue;
        }

        nc_type xtype = NC_NAT;
        NC_CALL(nc_inq_vartype(in, cs.inVar, &xtype), "netCDF: nc_inq_vartype failed");
        std::size_t typeSize = 0;
        NC_CALL(nc_inq_type(in, xtype, nullptr, &typeSize), "netCDF: nc_inq_type failed");

        std::vector<unsigned char> buf(count * typeSize);
        if (cs.shape.empty()) {
            NC_CALL(nc_get_var(in, cs.inVar, buf.data()),
                "netCDF: cannot read variable " + cs.name);
            NC_CALL(nc_put_var(out, cs.outVar, buf.data()),
                "netCDF: cannot write variable " + cs.name);
        } else {
            std::vector<std::size_t> start(cs.shape.size(), 0);
            NC_CALL(nc_get_vara(in, cs.inVar, start.data(), cs.shape.data(), buf.data()),
                "netCDF: cannot read variable " + cs.name);
            NC_CALL(nc_put_vara(out, cs.outVar, start.data(), cs.shape.data(), buf.data()),
                "netCDF: cannot write variable " + cs.name);
        }
        ++summary.copiedVariables;
    }

    /*---------------------------------------------------------
      Generated data
    ---------------------------------------------------------*/
    const std::unordered_map<std::string, std::size_t> lengths = {
        {"Time",        1},
        {"nCells",      st.nCells},
        {"nEdges",      st.nEdges},
        {"nVertices",   st.nVertices},
        {"nVertLevels", st.nVertLevels}
    };

    for (const auto& f : fields) {
        std::vector<std::size_t> start(f.dims.size(), 0);
        std::vector<std::size_t> shape;
        for (const auto& dn : f.dims)
            shape.push_back(lengths.at(dn));

        if (product(shape) > 0) {
            if (!f.data) {
                NC_CALL(nc_put_vara_int(out, f.varid, start.data(), shape.data(),
                                        f.idata.data()),
                    "netCDF: cannot write variable " + f.name);
            } else if (f.fill) {
                std::vector<double> filled(*f.data);
                std::replace_if(filled.begin(), filled.end(),
                                [](double x) { return std::isnan(x); }, NC_FILL_DOUBLE);
                NC_CALL(nc_put_vara_double(out, f.varid, start.data(), shape.data(),
                                           filled.data()),
                    "netCDF: cannot write variable " + f.name);
            } else {
                NC_CALL(nc_put_vara_double(out, f.varid, start.data(), shape.data(),
                                           f.data->data()),
                    "netCDF: cannot write variable " + f.name);
            }
        }
        ++summary.generatedVariables;
    }

    outFile.close();

    log.info("Wrote " + path + ": " + std::to_string(summary.generatedVariables) +
             " generated + " + std::to_string(summary.copiedVariables) +
             " variable(s) from " + source.path());
    if (summary.filledVariables > 0)
        log.warn(std::to_string(summary.filledVariables) +
                 " variable(s) contained NaN and were written with _FillValue");

    return summary;
}

} // namespace itide
