// main.cpp
// ------------------------------------------------------------------
// CLI driver: counts -> detection matrix -> filter -> BFA or Binary PCA
// -> CSV outputs.
//
// Usage:
//   scbfa -c config.yaml
//   scbfa -c config.yaml -o model.method=binary_pca -o bfa.num_factors=5
// ------------------------------------------------------------------

#include "bfa_engine.hpp"
#include "binary_pca.hpp"
#include "config.hpp"
#include "detection_matrix.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "matrix_io.hpp"

#include <yaml-cpp/yaml.h>
#include <cxxopts.hpp>
#include <armadillo>

#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using scbfa::Paths;
using scbfa::RunConfig;

// Prepends a ones column unless some column is already constant and nonzero.
static arma::mat with_intercept(const arma::mat& C) {
  if (C.is_empty()) return C;
  for (arma::uword j = 0; j < C.n_cols; ++j) {
    const arma::vec c = C.col(j);
    if (c(0) != 0.0 && arma::all(c == c(0))) return C;
  }
  return arma::join_horiz(arma::ones<arma::mat>(C.n_rows, 1), C);
}

static arma::mat load_detection(const std::string& path) {
  if (scbfa::is_matrix_market(path)) {
    return scbfa::DetectionMatrixBuilder::build(scbfa::load_matrix_market(path));
  }
  return scbfa::DetectionMatrixBuilder::build(scbfa::load_dense(path, "counts"));
}

static void write_outputs(const scbfa::BfaResult& r, const std::string& prefix) {
  scbfa::write_csv(r.Z,     prefix + ".Z.csv");
  scbfa::write_csv(r.A,     prefix + ".A.csv");
  scbfa::write_csv(r.beta,  prefix + ".beta.csv");
  scbfa::write_csv(r.gamma, prefix + ".gamma.csv");
  scbfa::write_column(arma::vec(r.loglik_trace),    prefix + ".loglik.txt");
  scbfa::write_column(arma::vec(r.objective_trace), prefix + ".objective.txt");
}

static void write_outputs(const scbfa::BinaryPcaResult& r, const std::string& prefix) {
  scbfa::write_csv(r.x,        prefix + ".x.csv");
  scbfa::write_csv(r.loadings, prefix + ".loadings.csv");
  scbfa::write_csv(arma::join_horiz(arma::join_horiz(r.sdev, r.explained_variance),
                                    r.explained_variance_ratio),
                   prefix + ".explained_variance.csv");
  scbfa::write_column(r.center, prefix + ".center.csv");
}

static int run(const RunConfig& cfg, const Paths& paths) {
  static const char* kTag = "scbfa";

  const arma::mat raw = load_detection(paths.counts);
  {
    std::ostringstream oss;
    oss << "counts " << paths.counts << ": G=" << raw.n_rows << " N=" << raw.n_cols
        << " detected=" << arma::accu(raw);
    scbfa::log_line(kTag, oss.str());
  }

  const scbfa::FilteredDetection fd = scbfa::filter_detection(raw, cfg.filter);
  {
    std::ostringstream oss;
    oss << "after filter: G=" << fd.detection.n_rows << " N=" << fd.detection.n_cols;
    scbfa::log_line(kTag, oss.str());
  }

  arma::mat X, W;
  if (!paths.cell_covariates.empty()) {
    const arma::mat C = scbfa::load_dense(paths.cell_covariates, "cell covariates");
    if (C.n_rows != raw.n_cols) {
      throw scbfa::DimensionError("cell covariates have " + std::to_string(C.n_rows) +
                                  " rows, counts have " + std::to_string(raw.n_cols) + " cells");
    }
    X = with_intercept(C.rows(fd.kept_cells));
  }
  if (!paths.gene_covariates.empty()) {
    const arma::mat C = scbfa::load_dense(paths.gene_covariates, "gene covariates");
    if (C.n_rows != raw.n_rows) {
      throw scbfa::DimensionError("gene covariates have " + std::to_string(C.n_rows) +
                                  " rows, counts have " + std::to_string(raw.n_rows) + " genes");
    }
    W = with_intercept(C.rows(fd.kept_genes));
  }

  scbfa::ensure_parent_dir(paths.out_prefix + ".touch");
  scbfa::write_indices(fd.kept_genes, paths.out_prefix + ".kept_genes.txt");
  scbfa::write_indices(fd.kept_cells, paths.out_prefix + ".kept_cells.txt");

  if (cfg.method == scbfa::Method::Bfa) {
    if (!W.is_empty() || !X.is_empty()) {
      scbfa::log_line(kTag, "covariates: P=" + std::to_string(X.is_empty() ? 1 : X.n_cols) +
                            " Q=" + std::to_string(W.is_empty() ? 1 : W.n_cols));
    }
    const scbfa::BfaResult r = scbfa::BfaEngine(cfg.bfa).fit(fd.detection, X, W);
    write_outputs(r, paths.out_prefix);
    std::cout << "== BFA completed ==\n"
              << "iterations: " << r.iterations
              << "  stop: " << scbfa::to_string(r.stop_reason)
              << "  converged: " << (r.converged ? "yes" : "no") << "\n"
              << "loglik: " << (r.loglik_trace.empty() ? 0.0 : r.loglik_trace.back())
              << "  penalized: "
              << (r.objective_trace.empty() ? 0.0 : r.objective_trace.back()) << "\n";
  } else {
    if (!W.is_empty()) {
      scbfa::log_warn(kTag, "gene covariates are ignored by binary_pca");
    }
    const scbfa::BinaryPcaResult r = scbfa::BinaryPcaEngine(cfg.pca).fit(fd.detection, X);
    write_outputs(r, paths.out_prefix);
    std::cout << "== Binary PCA completed ==\n"
              << "variance explained: " << arma::accu(r.explained_variance_ratio) << "\n";
  }
  std::cout << "Outputs: " << paths.out_prefix << ".*\n";
  return 0;
}

// ------------------ main ------------------
int main(int argc, char** argv) {
  cxxopts::Options opts("scbfa", "Binary factor analysis of single-cell detection patterns");
  opts.add_options()
    ("c,config",   "YAML config path", cxxopts::value<std::string>())
    ("o,override", "YAML dot-override, e.g., bfa.num_factors=5",
                   cxxopts::value<std::vector<std::string>>())
    ("h,help",     "Show help");

  RunConfig cfg;
  Paths paths;
  try {
    auto res = opts.parse(argc, argv);
    if (res.count("help")) {
      std::cout << opts.help() << "\n";
      return 0;
    }
    if (!res.count("config")) {
      std::cerr << opts.help() << "\n";
      return 2;
    }

    const std::string cfg_path = res["config"].as<std::string>();
    YAML::Node y = YAML::LoadFile(cfg_path);
    if (res.count("override")) {
      for (const auto& kv : res["override"].as<std::vector<std::string>>()) {
        scbfa::apply_override(y, kv);
      }
    }

    cfg = scbfa::load_run_config(y);
    paths = scbfa::load_paths(y, std::filesystem::path(cfg_path).parent_path().string());
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }

  std::cerr << "[scbfa] method=" << scbfa::to_string(cfg.method) << "\n";
  try {
    return run(cfg, paths);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
