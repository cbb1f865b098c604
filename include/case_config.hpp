/*
  File: include/case_config.hpp

  Case parameters of the internal-tide initial state and the text
  parser that overrides them.

  This header is included by:
    - src/case_config.cpp  (parsing + validation)
    - src/pipeline.cpp     (consumes CaseConfig)
    - src/itide_main.cpp   (--config, -L)

  Case file format (line oriented):
      # comment
      <key> <value>
  Keys are compared after normalize_token(), so "max_depth", "maxDepth"
  and "MAX-DEPTH" are the same key.

  Recognized keys (default):
      max_depth          5000      reference column depth (m)
      n_vert_levels      50        number of vertical levels
      ridge_base_depth   5000      RidgeParams::baseDepth
      ridge_height       1000      RidgeParams::height
      ridge_half_width   150e3     RidgeParams::halfWidth
      ssh_ramp_length    4800e3    RidgeParams::sshRampLength
      salinity           35        TracerParams::S0
      rho0               1000      TracerParams::rho0
      rhoz               -2e-4     TracerParams::rhoz
      eos_alpha          0.2       LinearEos::alpha
      eos_beta           0.8       LinearEos::beta
      eos_tref           10        LinearEos::Tref
      eos_sref           35        LinearEos::Sref
      eos_density_ref    1000      LinearEos::densityRef
*/
#pragma once

#include "bathymetry.hpp"
#include "tracers.hpp"

#include <string>

namespace itide {

struct CaseConfig {
    double maxDepth    = 5000.0;
    int    nVertLevels = 50;

    RidgeParams  ridge;
    TracerParams tracers;
    LinearEos    eos;

    /*
      validate()

      Throws std::invalid_argument on:
        - nVertLevels < 2
        - maxDepth <= 0
        - ridge base depth > maxDepth
        - ridge half-width <= 0, ssh ramp length == 0
        - eos alpha == 0 (temperature would not be defined)
    */
    void validate() const;
};

/*------------------------------------------------------------------------------
  Text parsing helpers
------------------------------------------------------------------------------*/

/*
  trim(s)

  Removes leading and trailing ASCII whitespace using std::isspace.
*/
std::string trim(const std::string& s);

/*
  normalize_token(s)

  Lowercases and keeps only alphanumeric characters.
*/
std::string normalize_token(const std::string& s);

/*
  parse_int_value(key, value)

  Whole-string integer parse; "4x", "12.5" and "" throw
  std::invalid_argument naming key. Also used by the CLI for -L and
  --threads.
*/
int parse_int_value(const std::string& key, const std::string& value);

/*
  set_case_value(cfg, key, value)

  Assigns one recognized key. Throws std::invalid_argument for an
  unknown key or a value that is not a complete number (an integer for
  n_vert_levels).
*/
void set_case_value(CaseConfig& cfg, const std::string& key, const std::string& value);

/*
  parse_case_file(path, base)

  Applies every "<key> <value>" line of the file on top of base and
  returns the result. Errors carry the file name and line number.

  Throws:
    - std::runtime_error if the file cannot be opened, a line does not
      have exactly two tokens, or set_case_value rejects it
*/
CaseConfig parse_case_file(const std::string& path, CaseConfig base = CaseConfig{});

/*
  describe(cfg)

  One-line summary used for logging the effective configuration.
*/
std::string describe(const CaseConfig& cfg);

} // namespace itide
