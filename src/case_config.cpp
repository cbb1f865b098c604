/*─────────────────────────────────────────────────────────────
// File: src/case_config.cpp
// Case parameter parsing and validation
//─────────────────────────────────────────────────────────────
//
// Responsibilities:
//   - Parse line-oriented "<key> <value>" case files.
//   - Match keys case- and punctuation-insensitively.
//   - Reject unknown keys and malformed numbers with the offending
//     file/line in the message.
//   - Validate the combined configuration before any work starts.
//
// Example file:
//
//       # shallower, coarser variant
//       max_depth         4000
//       ridge_base_depth  4000
//       nVertLevels       40
//       ridge_height      800
//
// Later lines override earlier ones; the CLI -L flag is applied by the
// caller after the file.
───────────────────────────────────────────────────────────────*/
#include "case_config.hpp"

#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace itide {

/*=====================================================================
  trim
=====================================================================*/
std::string trim(const std::string& s)
{
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(start, end - start);
}

/*=====================================================================
  normalize_token

  Normalization rules:
    - Keep only alphanumeric characters
    - Convert to lowercase
=====================================================================*/
std::string normalize_token(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)))
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

namespace {

double parse_real(const std::string& key, const std::string& value)
{
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Value for '" + key + "' is not a number: " + value);
    }
    if (used != value.size() || !std::isfinite(v))
        throw std::invalid_argument("Value for '" + key + "' is not a number: " + value);
    return v;
}

} // anonymous namespace

/*=====================================================================
  parse_int_value
=====================================================================*/
int parse_int_value(const std::string& key, const std::string& value)
{
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Value for '" + key + "' is not an integer: " + value);
    }
    if (used != value.size())
        throw std::invalid_argument("Value for '" + key + "' is not an integer: " + value);
    return v;
}

/*=====================================================================
  set_case_value
=====================================================================*/
void set_case_value(CaseConfig& cfg, const std::string& key, const std::string& value)
{
    const std::string k = normalize_token(key);

    if      (k == "maxdepth")        cfg.maxDepth            = parse_real(key, value);
    else if (k == "nvertlevels")     cfg.nVertLevels         = parse_int_value(key, value);
    else if (k == "ridgebasedepth")  cfg.ridge.baseDepth     = parse_real(key, value);
    else if (k == "ridgeheight")     cfg.ridge.height        = parse_real(key, value);
    else if (k == "ridgehalfwidth")  cfg.ridge.halfWidth     = parse_real(key, value);
    else if (k == "sshramplength")   cfg.ridge.sshRampLength = parse_real(key, value);
    else if (k == "salinity" || k == "s0")
                                     cfg.tracers.S0          = parse_real(key, value);
    else if (k == "rho0")            cfg.tracers.rho0        = parse_real(key, value);
    else if (k == "rhoz")            cfg.tracers.rhoz        = parse_real(key, value);
    else if (k == "eosalpha")        cfg.eos.alpha           = parse_real(key, value);
    else if (k == "eosbeta")         cfg.eos.beta            = parse_real(key, value);
    else if (k == "eostref")         cfg.eos.Tref            = parse_real(key, value);
    else if (k == "eossref")         cfg.eos.Sref            = parse_real(key, value);
    else if (k == "eosdensityref")   cfg.eos.densityRef      = parse_real(key, value);
    else
        throw std::invalid_argument("Unknown case parameter '" + key + "'");
}

/*=====================================================================
  parse_case_file
=====================================================================*/
CaseConfig parse_case_file(const std::string& path, CaseConfig base)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Could not open case file: " + path);

    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;

        /* Strip comments and ignore blank lines */
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);
        line = trim(line);
        if (line.empty())
            continue;

        std::istringstream iss(line);
        std::vector<std::string> tokens;
        std::string tok;
        while (iss >> tok)
            tokens.push_back(tok);

        const std::string where = path + ":" + std::to_string(lineno);
        if (tokens.size() != 2)
            throw std::runtime_error(where + ": expected '<key> <value>', got \"" +
                                     line + '"');

        try {
            set_case_value(base, tokens[0], tokens[1]);
        } catch (const std::invalid_argument& ex) {
            throw std::runtime_error(where + ": " + ex.what());
        }
    }

    return base;
}

/*=====================================================================
  CaseConfig::validate
=====================================================================*/
void CaseConfig::validate() const
{
    if (nVertLevels < 2)
        throw std::invalid_argument("nVertLevels must be at least 2, got " +
                                    std::to_string(nVertLevels));
    if (!(maxDepth > 0.0))
        throw std::invalid_argument("max_depth must be positive");
    // deeper plains would stretch the last layer past its reference thickness
    if (ridge.baseDepth > maxDepth) {
        std::ostringstream oss;
        oss << "ridge_base_depth (" << ridge.baseDepth
            << ") must not exceed max_depth (" << maxDepth << ")";
        throw std::invalid_argument(oss.str());
    }
    if (!(ridge.halfWidth > 0.0))
        throw std::invalid_argument("ridge_half_width must be positive");
    if (ridge.sshRampLength == 0.0)
        throw std::invalid_argument("ssh_ramp_length must be non-zero");
    if (eos.alpha == 0.0)
        throw std::invalid_argument("eos_alpha must be non-zero");
}

std::string describe(const CaseConfig& cfg)
{
    std::ostringstream oss;
    oss << "maxDepth=" << cfg.maxDepth
        << " nVertLevels=" << cfg.nVertLevels
        << " ridge(base=" << cfg.ridge.baseDepth
        << " height=" << cfg.ridge.height
        << " halfWidth=" << cfg.ridge.halfWidth << ")"
        << " sshRamp=" << cfg.ridge.sshRampLength
        << " S0=" << cfg.tracers.S0
        << " rho0=" << cfg.tracers.rho0
        << " rhoz=" << cfg.tracers.rhoz
        << " eos(alpha=" << cfg.eos.alpha
        << " beta=" << cfg.eos.beta
        << " Tref=" << cfg.eos.Tref
        << " Sref=" << cfg.eos.Sref
        << " rhoRef=" << cfg.eos.densityRef << ")";
    return oss.str();
}

} // namespace itide
