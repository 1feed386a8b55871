#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace scbfa {

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static std::string resolve_path(const std::string& p, const std::string& yaml_dir) {
  if (p.empty() || yaml_dir.empty()) return p;
  const std::filesystem::path path(p);
  return path.is_absolute() ? p : (std::filesystem::path(yaml_dir) / path).string();
}

YAML::Node parse_scalar_to_yaml(const std::string& v) {
  if (v.empty()) return YAML::Node(v);
  const YAML::Node n = YAML::Load(v);
  return (n.IsScalar() || n.IsNull()) ? n : YAML::Node(v);
}

void apply_override(YAML::Node& root, const std::string& kv) {
  const auto eq = kv.find('=');
  if (eq == std::string::npos || eq == 0) {
    throw std::invalid_argument("Override must look like section.key=value: " + kv);
  }
  const std::string key = kv.substr(0, eq);
  const YAML::Node value = parse_scalar_to_yaml(kv.substr(eq + 1));

  std::vector<std::string> parts;
  std::istringstream in(key);
  for (std::string part; std::getline(in, part, '.');) parts.push_back(part);
  if (key.back() == '.') parts.emplace_back();
  for (const auto& part : parts) {
    if (part.empty()) throw std::invalid_argument("Override key '" + key + "' has an empty component");
  }

  // reset() rebinds the handle; operator= would overwrite the parent
  YAML::Node node = root;
  for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
    const std::string& k = parts[i];
    if (!node[k] || node[k].IsNull()) {
      node[k] = YAML::Node(YAML::NodeType::Map);
    } else if (!node[k].IsMap()) {
      throw std::invalid_argument("Override '" + key + "': '" + k + "' is not a section");
    }
    node.reset(node[k]);
  }
  const YAML::Node old = node[parts.back()];
  if (old && old.IsMap()) {
    throw std::invalid_argument("Override '" + key + "' would replace a whole section; "
                                "set one of its keys instead");
  }
  node[parts.back()] = value;
}

const char* to_string(Method m) {
  switch (m) {
    case Method::Bfa:       return "bfa";
    case Method::BinaryPca: return "binary_pca";
  }
  return "unknown";
}

static void load_bfa(const YAML::Node& b, BfaConfig& c) {
  if (!b) return;
  auto get = [&](const char* k) { return b[k]; };
  if (get("num_factors"))  c.num_factors  = get("num_factors").as<int>();
  if (get("maxiter"))      c.maxiter      = get("maxiter").as<int>();
  if (get("tol"))          c.tol          = get("tol").as<double>();
  if (get("noise_tol"))    c.noise_tol    = get("noise_tol").as<double>();
  if (get("l2_penalty"))   c.l2_penalty   = get("l2_penalty").as<double>();
  if (get("weight_eps"))   c.weight_eps   = get("weight_eps").as<double>();
  if (get("init_clip"))    c.init_clip    = get("init_clip").as<double>();
  if (get("init_scale"))   c.init_scale   = get("init_scale").as<double>();
  if (get("seed"))         c.seed         = get("seed").as<std::uint64_t>();
  if (get("ridge"))        c.ridge        = get("ridge").as<double>();
  if (get("ridge_cap"))    c.ridge_cap    = get("ridge_cap").as<double>();
  if (get("rcond_min"))    c.rcond_min    = get("rcond_min").as<double>();
  if (get("max_halvings")) c.max_halvings = get("max_halvings").as<int>();
  if (get("verbose"))      c.verbose      = get("verbose").as<bool>();
  if (get("init")) {
    const auto s = get("init").as<std::string>();
    if      (lower(s) == "svd")    c.init = InitMethod::Svd;
    else if (lower(s) == "random") c.init = InitMethod::Random;
    else throw std::invalid_argument("bfa.init must be 'svd' or 'random', got '" + s + "'");
  }
}

static void load_pca(const YAML::Node& p, BinaryPcaConfig& c) {
  if (!p) return;
  if (p["num_components"]) c.num_components = p["num_components"].as<int>();
  if (p["variance_floor"]) c.variance_floor = p["variance_floor"].as<double>();
  if (p["verbose"])        c.verbose        = p["verbose"].as<bool>();
}

static void load_filter(const YAML::Node& f, DetectionFilter& c) {
  if (!f) return;
  auto count = [&](const char* k) {
    const long v = f[k].as<long>();
    if (v < 0) throw std::invalid_argument(std::string("filter.") + k + " must be >= 0");
    return static_cast<arma::uword>(v);
  };
  if (f["min_cells_per_gene"]) c.min_cells_per_gene = count("min_cells_per_gene");
  if (f["min_genes_per_cell"]) c.min_genes_per_cell = count("min_genes_per_cell");
}

RunConfig load_run_config(const YAML::Node& y) {
  RunConfig c;
  const auto m = y["model"];
  if (m && m["method"]) {
    const auto s = m["method"].as<std::string>();
    if      (lower(s) == "bfa")        c.method = Method::Bfa;
    else if (lower(s) == "binary_pca") c.method = Method::BinaryPca;
    else throw std::invalid_argument("model.method must be 'bfa' or 'binary_pca', got '" + s + "'");
  }
  // model.num_factors applies to both methods unless a section sets its own
  if (m && m["num_factors"]) {
    c.bfa.num_factors = m["num_factors"].as<int>();
    c.pca.num_components = c.bfa.num_factors;
  }
  if (m && m["verbose"]) {
    c.bfa.verbose = c.pca.verbose = m["verbose"].as<bool>();
  }
  load_bfa(y["bfa"], c.bfa);
  load_pca(y["pca"], c.pca);
  load_filter(y["filter"], c.filter);
  return c;
}

Paths load_paths(const YAML::Node& y, const std::string& yaml_dir) {
  const auto r = y["paths"];
  if (!r || !r.IsMap()) {
    throw std::invalid_argument(
      "Could not find a 'paths' map in the YAML root. "
      "Avoid '-o paths=...'; use '-o paths.counts=...'");
  }
  auto as_str = [&](const char* k) -> std::string {
    auto n = r[k];
    return (n && !n.IsNull()) ? n.as<std::string>() : std::string();
  };

  Paths p;
  p.counts          = resolve_path(as_str("counts"), yaml_dir);
  p.cell_covariates = resolve_path(as_str("cell_covariates"), yaml_dir);
  p.gene_covariates = resolve_path(as_str("gene_covariates"), yaml_dir);
  p.out_prefix      = resolve_path(as_str("out_prefix"), yaml_dir);

  if (p.counts.empty())     throw std::invalid_argument("paths.counts is required");
  if (p.out_prefix.empty()) throw std::invalid_argument("paths.out_prefix is required");
  return p;
}

} // namespace scbfa
