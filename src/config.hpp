#pragma once
#include "scbfa_types.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace scbfa {

struct Paths {
  std::string counts;            // genes x cells, .mtx or dense
  std::string cell_covariates;   // N x P, optional
  std::string gene_covariates;   // G x Q, optional
  std::string out_prefix;        // <prefix>.<name>.csv
};

enum class Method { Bfa, BinaryPca };

struct RunConfig {
  Method          method{Method::Bfa};
  BfaConfig       bfa;
  BinaryPcaConfig pca;
  DetectionFilter filter;
};

// Right-hand side of an override read as a YAML scalar; flow collections
// stay plain strings.
YAML::Node parse_scalar_to_yaml(const std::string& v);

// "section.key=value": creates missing sections, never replaces one.
void apply_override(YAML::Node& root, const std::string& kv);

// Missing sections keep the struct defaults. Throws std::invalid_argument
// on unknown enum values.
RunConfig load_run_config(const YAML::Node& y);

// Relative paths are taken against yaml_dir.
Paths load_paths(const YAML::Node& y, const std::string& yaml_dir = "");

const char* to_string(Method m);

} // namespace scbfa
